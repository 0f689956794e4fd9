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

#include <srea/engine/curvesensitivitytransform.hpp>

#include <cmath>

using sre::data::CurveSensitivityMap;
using sre::data::SensitivityLadder;
using QuantLib::Real;

namespace sre {
namespace analytics {

CurveSensitivityMap applyZSpreadDiscounting(const CurveSensitivityMap& sensitivities, Real zSpread, Real factor) {
    CurveSensitivityMap result;
    for (auto const& kv : sensitivities) {
        SensitivityLadder& ladder = result[kv.first];
        ladder.reserve(kv.second.size());
        for (auto const& p : kv.second)
            ladder.push_back(std::make_pair(p.first, factor * p.second * std::exp(-zSpread * p.first)));
    }
    return result;
}

} // namespace analytics
} // namespace sre
