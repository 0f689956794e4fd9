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

/*! \file sred/pricing/presentvaluecalculator.hpp
    \brief present value of a single payment
    \ingroup pricing
*/

#pragma once

#include <sred/instruments/payment.hpp>
#include <sred/marketdata/curvebundle.hpp>

#include <ql/types.hpp>

namespace sre {
namespace data {

//! Interface for the present value of a payment
/*! Implementations must be deterministic and free of side effects for a given payment and curve bundle.
    \ingroup pricing
*/
class PresentValueCalculator {
public:
    virtual ~PresentValueCalculator() {}
    virtual QuantLib::Real presentValue(const Payment& payment, const CurveBundle& curves) const = 0;
};

//! Discounts the payment amount on its funding curve
/*! \ingroup pricing
 */
class DiscountingPresentValueCalculator : public PresentValueCalculator {
public:
    QuantLib::Real presentValue(const Payment& payment, const CurveBundle& curves) const override;
};

} // namespace data
} // namespace sre
