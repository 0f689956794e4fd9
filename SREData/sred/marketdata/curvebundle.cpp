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

#include <sred/marketdata/curvebundle.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;
using std::string;

namespace sre {
namespace data {

CurveBundle::CurveBundle(const std::map<string, Handle<YieldTermStructure>>& curves) {
    for (auto const& c : curves)
        addCurve(c.first, c.second);
}

void CurveBundle::addCurve(const string& name, const Handle<YieldTermStructure>& curve) {
    QL_REQUIRE(!name.empty(), "CurveBundle: curve name must not be empty");
    QL_REQUIRE(!curve.empty(), "CurveBundle: curve " << name << " is empty");
    QL_REQUIRE(curves_.find(name) == curves_.end(), "CurveBundle: curve " << name << " already exists");
    curves_[name] = curve;
}

const Handle<YieldTermStructure>& CurveBundle::curve(const string& name) const {
    auto it = curves_.find(name);
    QL_REQUIRE(it != curves_.end(), "CurveBundle: no curve with name " << name);
    return it->second;
}

std::vector<string> CurveBundle::curveNames() const {
    std::vector<string> names;
    for (auto const& c : curves_)
        names.push_back(c.first);
    return names;
}

} // namespace data
} // namespace sre
