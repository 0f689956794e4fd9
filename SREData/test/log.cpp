/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <boost/test/unit_test.hpp>
#include <sred/utilities/log.hpp>
#include <sret/toplevelfixture.hpp>

#include <string>

using namespace boost::unit_test_framework;
using namespace sre::data;
using std::string;

namespace {

// Registers a buffer logger for the lifetime of a test case
class BufferLoggerFixture {
public:
    BufferLoggerFixture() : logger(QuantLib::ext::make_shared<BufferLogger>()) {
        Log::instance().registerLogger(logger);
        Log::instance().switchOn();
        Log::instance().setMask(255);
    }
    ~BufferLoggerFixture() { Log::instance().removeLogger(BufferLogger::name); }

    QuantLib::ext::shared_ptr<BufferLogger> logger;
};

bool contains(const string& s, const string& sub) { return s.find(sub) != string::npos; }

} // namespace

BOOST_FIXTURE_TEST_SUITE(SREDataTestSuite, sre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(LogTest)

BOOST_AUTO_TEST_CASE(testLogLevels) {
    BOOST_TEST_MESSAGE("Testing log messages and their level headers...");
    BufferLoggerFixture f;

    ALOG("alert message");
    WLOG("warning message " << 42);
    TLOG("data message");

    BOOST_REQUIRE(f.logger->hasNext());
    string msg = f.logger->next();
    BOOST_CHECK(contains(msg, "ALERT"));
    BOOST_CHECK(contains(msg, "alert message"));
    BOOST_CHECK(contains(msg, "log.cpp"));
    BOOST_REQUIRE(f.logger->hasNext());
    msg = f.logger->next();
    BOOST_CHECK(contains(msg, "WARNING"));
    BOOST_CHECK(contains(msg, "warning message 42"));
    BOOST_REQUIRE(f.logger->hasNext());
    BOOST_CHECK(contains(f.logger->next(), "data message"));
    BOOST_CHECK(!f.logger->hasNext());
    BOOST_CHECK_THROW(f.logger->next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testLogMask) {
    BOOST_TEST_MESSAGE("Testing that the log mask filters messages...");
    BufferLoggerFixture f;
    Log::instance().setMask(SRE_ALERT | SRE_ERROR);

    LOG("notice message");
    DLOG("debug message");
    ELOG("error message");

    BOOST_REQUIRE(f.logger->hasNext());
    BOOST_CHECK(contains(f.logger->next(), "error message"));
    BOOST_CHECK(!f.logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testLogSwitchedOff) {
    BOOST_TEST_MESSAGE("Testing that a disabled log drops messages...");
    BufferLoggerFixture f;
    Log::instance().switchOff();
    ALOG("alert message");
    BOOST_CHECK(!f.logger->hasNext());
    Log::instance().switchOn();
    ALOG("alert message");
    BOOST_CHECK(f.logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testBufferLoggerMinLevel) {
    BOOST_TEST_MESSAGE("Testing the buffer logger minimum level...");
    Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>(SRE_WARNING));
    Log::instance().switchOn();
    Log::instance().setMask(255);

    LOG("notice message");
    WLOG("warning message");

    auto logger = QuantLib::ext::dynamic_pointer_cast<BufferLogger>(Log::instance().logger(BufferLogger::name));
    BOOST_REQUIRE(logger);
    BOOST_REQUIRE(logger->hasNext());
    BOOST_CHECK(contains(logger->next(), "warning message"));
    BOOST_CHECK(!logger->hasNext());
    Log::instance().removeLogger(BufferLogger::name);
}

BOOST_AUTO_TEST_CASE(testLoggerRegistry) {
    BOOST_TEST_MESSAGE("Testing logger registration...");
    BufferLoggerFixture f;
    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>()), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().registerLogger(QuantLib::ext::shared_ptr<Logger>()), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().logger("NoSuchLogger"), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().removeLogger("NoSuchLogger"), QuantLib::Error);
    BOOST_CHECK_EQUAL(levelString(SRE_DEBUG), "DEBUG");
    BOOST_CHECK_EQUAL(levelString(3), "UNKNOWN");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
