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

/*! \file sred/instruments/payment.hpp
    \brief fixed payments of an annuity
    \ingroup instruments
*/

#pragma once

#include <ql/types.hpp>

#include <string>

namespace sre {
namespace data {

//! A single scheduled payment
/*! The payment time is a year fraction measured from the valuation date. The funding curve name identifies the
    curve of a CurveBundle the payment is discounted on. Payments are immutable.

    \ingroup instruments
*/
class Payment {
public:
    Payment(QuantLib::Time paymentTime, const std::string& fundingCurveName);
    virtual ~Payment() {}

    QuantLib::Time paymentTime() const { return paymentTime_; }
    const std::string& fundingCurveName() const { return fundingCurveName_; }

    //! The undiscounted amount paid at the payment time
    virtual QuantLib::Real amount() const = 0;

private:
    QuantLib::Time paymentTime_;
    std::string fundingCurveName_;
};

//! A fixed cash amount
/*! \ingroup instruments
 */
class PaymentFixed : public Payment {
public:
    PaymentFixed(QuantLib::Time paymentTime, QuantLib::Real amount, const std::string& fundingCurveName);
    QuantLib::Real amount() const override { return amount_; }

private:
    QuantLib::Real amount_;
};

//! A fixed rate coupon
/*! The amount is notional * fixedRate * paymentYearFraction.
    \ingroup instruments
 */
class CouponFixed : public Payment {
public:
    CouponFixed(QuantLib::Time paymentTime, const std::string& fundingCurveName, QuantLib::Real paymentYearFraction,
                QuantLib::Real notional, QuantLib::Rate fixedRate);

    QuantLib::Real amount() const override { return notional_ * fixedRate_ * paymentYearFraction_; }

    QuantLib::Real paymentYearFraction() const { return paymentYearFraction_; }
    QuantLib::Real notional() const { return notional_; }
    QuantLib::Rate fixedRate() const { return fixedRate_; }

private:
    QuantLib::Real paymentYearFraction_;
    QuantLib::Real notional_;
    QuantLib::Rate fixedRate_;
};

} // namespace data
} // namespace sre
