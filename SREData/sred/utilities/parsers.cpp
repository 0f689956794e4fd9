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

#include <sred/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <ql/errors.hpp>

#include <map>

using namespace QuantLib;
using std::string;

namespace sre {
namespace data {

Real parseReal(const string& s) {
    try {
        return boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseReal(\"" << s << "\")");
    }
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\")");
    }
}

bool parseBool(const string& s) {
    static std::map<string, bool> b = {{"Y", true},      {"YES", true},   {"TRUE", true},   {"True", true},
                                       {"true", true},   {"1", true},     {"N", false},     {"NO", false},
                                       {"FALSE", false}, {"False", false}, {"false", false}, {"0", false}};

    auto it = b.find(boost::trim_copy(s));
    if (it != b.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to bool");
    }
}

} // namespace data
} // namespace sre
