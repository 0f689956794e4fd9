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
#include <sred/report/csvreport.hpp>
#include <sred/report/inmemoryreport.hpp>
#include <sret/datapaths.hpp>
#include <sret/fileutilities.hpp>
#include <sret/toplevelfixture.hpp>

#include <ql/utilities/null.hpp>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace sre::data;
using sre::test::readLines;
using std::string;
using std::vector;

BOOST_FIXTURE_TEST_SUITE(SREDataTestSuite, sre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ReportTest)

BOOST_AUTO_TEST_CASE(testInMemoryReport) {
    BOOST_TEST_MESSAGE("Testing in memory report...");
    InMemoryReport report;
    report.addColumn("Curve", string()).addColumn("Index", Size()).addColumn("Sensitivity", double(), 4);
    report.next().add("EUR").add(Size(0)).add(-95.1);
    report.next().add("USD").add(Size(1)).add(-180.9);
    report.end();

    BOOST_CHECK_EQUAL(report.columns(), 3);
    BOOST_CHECK_EQUAL(report.rows(), 2);
    BOOST_CHECK_EQUAL(report.header(2), "Sensitivity");
    BOOST_CHECK(report.hasHeader("Index"));
    BOOST_CHECK(!report.hasHeader("Time"));
    BOOST_CHECK_EQUAL(report.columnPrecision(2), 4);
    BOOST_CHECK_EQUAL(boost::get<string>(report.data(0, 1)), "USD");
    BOOST_CHECK_EQUAL(boost::get<Size>(report.data(1, 1)), 1);
    BOOST_CHECK_EQUAL(boost::get<Real>(report.data(2, 0)), -95.1);
    BOOST_CHECK_EQUAL(report.data(2).size(), 2);
    BOOST_CHECK_THROW(report.data(3, 0), QuantLib::Error);
    BOOST_CHECK_THROW(report.data(0, 2), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testInMemoryReportChecks) {
    BOOST_TEST_MESSAGE("Testing in memory report type and row checks...");
    InMemoryReport report;
    report.addColumn("Curve", string()).addColumn("Time", double(), 6);
    report.next();
    // wrong type
    BOOST_CHECK_THROW(report.add(1.0), QuantLib::Error);
    report.add("EUR");
    // incomplete row
    BOOST_CHECK_THROW(report.next(), QuantLib::Error);
    BOOST_CHECK_THROW(report.end(), QuantLib::Error);
    report.add(1.0);
    // too many values
    BOOST_CHECK_THROW(report.add(2.0), QuantLib::Error);
    BOOST_CHECK_NO_THROW(report.end());
}

BOOST_AUTO_TEST_CASE(testCsvReport) {
    BOOST_TEST_MESSAGE("Testing csv file report...");
    string fileName = TEST_OUTPUT_FILE("report.csv");
    CSVFileReport report(fileName);
    report.addColumn("Curve", string()).addColumn("Index", Size()).addColumn("Sensitivity", double(), 2);
    report.next().add("EUR").add(Size(0)).add(-95.126);
    report.next().add("USD").add(Size(1)).add(Null<Real>());
    report.end();

    vector<string> lines = readLines(fileName);
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[0], "#Curve,Index,Sensitivity");
    BOOST_CHECK_EQUAL(lines[1], "EUR,0,-95.13");
    BOOST_CHECK_EQUAL(lines[2], "USD,1,#N/A");

    // the report is closed
    BOOST_CHECK_THROW(report.next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testCsvReportOptions) {
    BOOST_TEST_MESSAGE("Testing csv file report separator, quote and null string options...");
    string fileName = TEST_OUTPUT_FILE("report_options.csv");
    CSVFileReport report(fileName, ';', false, '"', "NA");
    report.addColumn("Curve", string()).addColumn("Time", double(), 1);
    report.next().add("EUR").add(Null<Real>());
    report.end();

    vector<string> lines = readLines(fileName);
    BOOST_REQUIRE_EQUAL(lines.size(), 2);
    BOOST_CHECK_EQUAL(lines[0], "Curve;Time");
    BOOST_CHECK_EQUAL(lines[1], "\"EUR\";NA");
}

BOOST_AUTO_TEST_CASE(testCsvReportUsage) {
    BOOST_TEST_MESSAGE("Testing csv file report usage errors...");
    string fileName = TEST_OUTPUT_FILE("report_usage.csv");
    CSVFileReport report(fileName);
    report.addColumn("Curve", string()).addColumn("Time", double(), 2);
    // data before the first next()
    BOOST_CHECK_THROW(report.add("EUR"), QuantLib::Error);
    report.next().add("EUR");
    // wrong type
    BOOST_CHECK_THROW(report.add(string("1.0")), QuantLib::Error);
    report.add(-0.001);
    BOOST_CHECK_THROW(report.addColumn("Sensitivity", double(), 2), QuantLib::Error);
    report.end();

    vector<string> lines = readLines(fileName);
    BOOST_REQUIRE_EQUAL(lines.size(), 2);
    BOOST_CHECK_EQUAL(lines[1], "EUR,0.00");
}

BOOST_AUTO_TEST_CASE(testInMemoryReportToFile) {
    BOOST_TEST_MESSAGE("Testing in memory report written to a csv file...");
    InMemoryReport report;
    report.addColumn("Time", double(), 3).addColumn("Sensitivity", double(), 3);
    report.next().add(0.5).add(-1.0);
    report.next().add(1.0).add(-2.0004);
    report.end();

    string fileName = TEST_OUTPUT_FILE("inmemory.csv");
    report.toFile(fileName);
    vector<string> lines = readLines(fileName);
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[0], "#Time,Sensitivity");
    BOOST_CHECK_EQUAL(lines[1], "0.500,-1.000");
    BOOST_CHECK_EQUAL(lines[2], "1.000,-2.000");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
