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

#include <sred/instruments/annuity.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace sre {
namespace data {

Annuity::Annuity(const std::vector<QuantLib::ext::shared_ptr<Payment>>& payments) : payments_(payments) {
    QL_REQUIRE(!payments_.empty(), "Annuity: at least one payment required");
    for (Size i = 0; i < payments_.size(); ++i)
        QL_REQUIRE(payments_[i], "Annuity: payment #" << i << " is null");
}

const QuantLib::ext::shared_ptr<Payment>& Annuity::nthPayment(Size n) const {
    QL_REQUIRE(n < payments_.size(), "Annuity: payment index " << n << " out of range, annuity has "
                                                               << payments_.size() << " payments");
    return payments_[n];
}

std::vector<Time> Annuity::paymentTimes() const {
    std::vector<Time> times;
    times.reserve(payments_.size());
    for (auto const& p : payments_)
        times.push_back(p->paymentTime());
    return times;
}

} // namespace data
} // namespace sre
