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

#include <sred/instruments/payment.hpp>

#include <ql/errors.hpp>

#include <cmath>

using namespace QuantLib;

namespace sre {
namespace data {

Payment::Payment(Time paymentTime, const std::string& fundingCurveName)
    : paymentTime_(paymentTime), fundingCurveName_(fundingCurveName) {
    QL_REQUIRE(std::isfinite(paymentTime_), "Payment: payment time must be finite");
    QL_REQUIRE(paymentTime_ >= 0.0, "Payment: payment time (" << paymentTime_ << ") must not be negative");
    QL_REQUIRE(!fundingCurveName_.empty(), "Payment: funding curve name must not be empty");
}

PaymentFixed::PaymentFixed(Time paymentTime, Real amount, const std::string& fundingCurveName)
    : Payment(paymentTime, fundingCurveName), amount_(amount) {
    QL_REQUIRE(std::isfinite(amount_), "PaymentFixed: amount must be finite");
}

CouponFixed::CouponFixed(Time paymentTime, const std::string& fundingCurveName, Real paymentYearFraction,
                         Real notional, Rate fixedRate)
    : Payment(paymentTime, fundingCurveName), paymentYearFraction_(paymentYearFraction), notional_(notional),
      fixedRate_(fixedRate) {
    QL_REQUIRE(paymentYearFraction_ >= 0.0,
               "CouponFixed: payment year fraction (" << paymentYearFraction_ << ") must not be negative");
    QL_REQUIRE(std::isfinite(amount()), "CouponFixed: amount must be finite");
}

} // namespace data
} // namespace sre
