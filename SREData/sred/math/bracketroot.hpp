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

/*! \file sred/math/bracketroot.hpp
    \brief bracketing of a one dimensional root
    \ingroup math
*/

#pragma once

#include <sred/utilities/errors.hpp>
#include <sred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <cmath>
#include <utility>

namespace sre {
namespace data {

//! Finds an interval on which a function changes sign
/*! Starting from an initial interval, the end point with the smaller absolute function value is pushed outwards
    by a fixed ratio of the interval length until the function values at the two end points have opposite signs
    (or one of them is zero).

    Optional lower and upper limits restrict the search domain, an end point that reaches its limit is pinned
    there and only the other end point is moved from then on.

    The class holds no state besides its parameters, so one instance can be shared across threads.

    \ingroup math
*/
class BracketRoot {
public:
    /*! \param expansionRatio  the interval is enlarged by this multiple of its length in each step
        \param maxSteps        the maximum number of expansion steps before giving up
    */
    explicit BracketRoot(QuantLib::Real expansionRatio = 1.6, QuantLib::Size maxSteps = 50)
        : expansionRatio_(expansionRatio), maxSteps_(maxSteps) {
        QL_REQUIRE(expansionRatio_ > 0.0, "BracketRoot: expansion ratio (" << expansionRatio_
                                                                           << ") must be positive");
    }

    /*! Returns an interval (a, b) with f(a) and f(b) of opposite sign or with f(a) * f(b) = 0.
        Throws RootNotBracketed if no such interval is found within the step limit.

        \param f      the function, a callable Real -> Real
        \param xLower lower end of the initial interval
        \param xUpper upper end of the initial interval
        \param minX   optional lower limit of the search domain
        \param maxX   optional upper limit of the search domain
    */
    template <class F>
    std::pair<QuantLib::Real, QuantLib::Real>
    getBracketedPoints(const F& f, QuantLib::Real xLower, QuantLib::Real xUpper,
                       QuantLib::Real minX = QuantLib::Null<QuantLib::Real>(),
                       QuantLib::Real maxX = QuantLib::Null<QuantLib::Real>()) const;

    QuantLib::Real expansionRatio() const { return expansionRatio_; }
    QuantLib::Size maxSteps() const { return maxSteps_; }

private:
    static bool bracketed(QuantLib::Real f1, QuantLib::Real f2) {
        return (f1 <= 0.0 && f2 >= 0.0) || (f1 >= 0.0 && f2 <= 0.0);
    }

    QuantLib::Real expansionRatio_;
    QuantLib::Size maxSteps_;
};

template <class F>
std::pair<QuantLib::Real, QuantLib::Real> BracketRoot::getBracketedPoints(const F& f, QuantLib::Real xLower,
                                                                          QuantLib::Real xUpper, QuantLib::Real minX,
                                                                          QuantLib::Real maxX) const {
    using QuantLib::Null;
    using QuantLib::Real;

    QL_REQUIRE(xLower < xUpper, "BracketRoot: lower end (" << xLower << ") must be below upper end (" << xUpper
                                                           << ")");
    QL_REQUIRE(minX == Null<Real>() || xLower >= minX,
               "BracketRoot: lower end (" << xLower << ") is below the lower limit (" << minX << ")");
    QL_REQUIRE(maxX == Null<Real>() || xUpper <= maxX,
               "BracketRoot: upper end (" << xUpper << ") is above the upper limit (" << maxX << ")");

    Real x1 = xLower, x2 = xUpper;
    Real f1 = f(x1), f2 = f(x2);
    bool lowerPinned = minX != Null<Real>() && x1 <= minX;
    bool upperPinned = maxX != Null<Real>() && x2 >= maxX;

    for (QuantLib::Size step = 0;; ++step) {
        TLOG("BracketRoot step " << step << ": f(" << x1 << ") = " << f1 << ", f(" << x2 << ") = " << f2);
        if (bracketed(f1, f2))
            return std::make_pair(x1, x2);
        if (step == maxSteps_ || (lowerPinned && upperPinned))
            break;
        // move the end point that is closer to a root, unless it already sits on its limit
        bool moveLower = upperPinned || (!lowerPinned && std::fabs(f1) < std::fabs(f2));
        if (moveLower) {
            x1 += expansionRatio_ * (x1 - x2);
            if (minX != Null<Real>() && x1 <= minX) {
                x1 = minX;
                lowerPinned = true;
            }
            f1 = f(x1);
        } else {
            x2 += expansionRatio_ * (x2 - x1);
            if (maxX != Null<Real>() && x2 >= maxX) {
                x2 = maxX;
                upperPinned = true;
            }
            f2 = f(x2);
        }
    }

    SRE_FAIL(RootNotBracketed, "BracketRoot: failed to bracket a root starting from [" << xLower << ", " << xUpper
                                                                                       << "], last interval [" << x1
                                                                                       << ", " << x2 << "] with f = ["
                                                                                       << f1 << ", " << f2 << "]");
}

} // namespace data
} // namespace sre
