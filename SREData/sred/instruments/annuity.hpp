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

/*! \file sred/instruments/annuity.hpp
    \brief ordered sequence of payments
    \ingroup instruments
*/

#pragma once

#include <sred/instruments/payment.hpp>

#include <ql/shared_ptr.hpp>

#include <vector>

namespace sre {
namespace data {

//! An ordered, non-empty collection of payments
/*! The order of the payments is the coupon date order and is preserved by everything that reads the annuity.
    \ingroup instruments
*/
class Annuity {
public:
    explicit Annuity(const std::vector<QuantLib::ext::shared_ptr<Payment>>& payments);

    QuantLib::Size numberOfPayments() const { return payments_.size(); }
    const QuantLib::ext::shared_ptr<Payment>& nthPayment(QuantLib::Size n) const;
    const std::vector<QuantLib::ext::shared_ptr<Payment>>& payments() const { return payments_; }

    //! Payment times in payment order
    std::vector<QuantLib::Time> paymentTimes() const;

private:
    std::vector<QuantLib::ext::shared_ptr<Payment>> payments_;
};

} // namespace data
} // namespace sre
