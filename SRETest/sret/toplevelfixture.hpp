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

/*! \file sret/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <ql/settings.hpp>
#include <sred/utilities/log.hpp>

using QuantLib::SavedSettings;

namespace sre {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    SavedSettings savedSettings;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : logMask_(sre::data::Log::instance().mask()), logEnabled_(sre::data::Log::instance().enabled()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Restore the log switch and mask, test cases may change them
        sre::data::Log::instance().setMask(logMask_);
        if (logEnabled_)
            sre::data::Log::instance().switchOn();
        else
            sre::data::Log::instance().switchOff();
    }

private:
    unsigned logMask_;
    bool logEnabled_;
};
} // namespace test
} // namespace sre
