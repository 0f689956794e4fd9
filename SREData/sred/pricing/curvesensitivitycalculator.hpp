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

/*! \file sred/pricing/curvesensitivitycalculator.hpp
    \brief present value sensitivities of an annuity per curve
    \ingroup pricing
*/

#pragma once

#include <sred/instruments/annuity.hpp>
#include <sred/marketdata/curvebundle.hpp>

#include <ql/types.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace sre {
namespace data {

//! Ordered (time, sensitivity) pairs of one curve
typedef std::vector<std::pair<QuantLib::Time, QuantLib::Real>> SensitivityLadder;

//! Sensitivity ladders by curve name
typedef std::map<std::string, SensitivityLadder> CurveSensitivityMap;

//! Interface for the curve sensitivities of an annuity
/*! Each call returns a freshly built map that the caller may modify.
    \ingroup pricing
*/
class CurveSensitivityCalculator {
public:
    virtual ~CurveSensitivityCalculator() {}
    virtual CurveSensitivityMap sensitivities(const Annuity& annuity, const CurveBundle& curves) const = 0;
};

//! Sensitivities to the continuously compounded zero rate at each payment time
/*! For a payment with amount A at time t discounted on curve c the pair (t, -t A P_c(0,t)) is appended to the ladder
    of c, ladders follow the payment order.
    \ingroup pricing
*/
class DiscountingCurveSensitivityCalculator : public CurveSensitivityCalculator {
public:
    CurveSensitivityMap sensitivities(const Annuity& annuity, const CurveBundle& curves) const override;
};

} // namespace data
} // namespace sre
