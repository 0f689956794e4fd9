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

/*! \file sret/fileutilities.hpp
    \brief File utilities for use in unit tests
*/

#pragma once

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace sre {
namespace test {

// Use to remove the output directory when a test case exits
// Returns true if the operation completed without errors, otherwise false
inline bool clearOutput(const boost::filesystem::path& outputPath) {

    // If output path does not exist, nothing to do
    if (!boost::filesystem::exists(outputPath))
        return true;

    // If the output path exists, attempt to remove it
    try {
        boost::filesystem::remove_all(outputPath);
        return true;
    } catch (const boost::filesystem::filesystem_error& err) {
        BOOST_TEST_MESSAGE("The attempt to remove the output path, " << outputPath << ", failed with error "
                                                                     << err.what());
        return false;
    }
}

// Returns the lines of a text file, empty if the file can not be opened
inline std::vector<std::string> readLines(const std::string& fileName) {
    std::vector<std::string> lines;
    std::ifstream is(fileName.c_str());
    std::string line;
    while (std::getline(is, line))
        lines.push_back(line);
    return lines;
}

} // namespace test
} // namespace sre
