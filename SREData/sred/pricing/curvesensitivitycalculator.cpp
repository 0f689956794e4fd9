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

#include <sred/pricing/curvesensitivitycalculator.hpp>

using namespace QuantLib;

namespace sre {
namespace data {

CurveSensitivityMap DiscountingCurveSensitivityCalculator::sensitivities(const Annuity& annuity,
                                                                         const CurveBundle& curves) const {
    CurveSensitivityMap result;
    for (auto const& p : annuity.payments()) {
        const Handle<YieldTermStructure>& curve = curves.curve(p->fundingCurveName());
        Time t = p->paymentTime();
        result[p->fundingCurveName()].push_back(std::make_pair(t, -t * p->amount() * curve->discount(t, true)));
    }
    return result;
}

} // namespace data
} // namespace sre
