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

/*! \file sred/math/brentsinglerootfinder.hpp
    \brief Brent root finder on a bracketing interval
    \ingroup math
*/

#pragma once

#include <sred/utilities/errors.hpp>
#include <sred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/math/solvers1d/brent.hpp>
#include <ql/types.hpp>

namespace sre {
namespace data {

//! Root finder refining a bracket with QuantLib's Brent solver
/*! The interval passed to getRoot() must bracket a root, otherwise RootNotBracketed is thrown. If the solver does
    not reach the requested accuracy within the evaluation budget RootFinderDidNotConverge is thrown. Exceptions
    raised by the function itself are passed through unchanged.

    The solver is created per call, so instances can be shared across threads.

    \ingroup math
*/
class BrentSingleRootFinder {
public:
    /*! \param accuracy        absolute accuracy on the root
        \param maxEvaluations  maximum number of function evaluations
    */
    explicit BrentSingleRootFinder(QuantLib::Real accuracy = 1.0e-12, QuantLib::Size maxEvaluations = 100)
        : accuracy_(accuracy), maxEvaluations_(maxEvaluations) {
        QL_REQUIRE(accuracy_ > 0.0, "BrentSingleRootFinder: accuracy (" << accuracy_ << ") must be positive");
        QL_REQUIRE(maxEvaluations_ > 0, "BrentSingleRootFinder: max evaluations must be positive");
    }

    template <class F> QuantLib::Real getRoot(const F& f, QuantLib::Real xLower, QuantLib::Real xUpper) const;

    QuantLib::Real accuracy() const { return accuracy_; }
    QuantLib::Size maxEvaluations() const { return maxEvaluations_; }

private:
    QuantLib::Real accuracy_;
    QuantLib::Size maxEvaluations_;
};

template <class F>
QuantLib::Real BrentSingleRootFinder::getRoot(const F& f, QuantLib::Real xLower, QuantLib::Real xUpper) const {
    using QuantLib::Real;

    QL_REQUIRE(xLower < xUpper, "BrentSingleRootFinder: lower end (" << xLower << ") must be below upper end ("
                                                                     << xUpper << ")");

    Real fLower = f(xLower), fUpper = f(xUpper);
    SRE_REQUIRE((fLower <= 0.0 && fUpper >= 0.0) || (fLower >= 0.0 && fUpper <= 0.0), RootNotBracketed,
                "BrentSingleRootFinder: [" << xLower << ", " << xUpper << "] does not bracket a root, f = [" << fLower
                                           << ", " << fUpper << "]");

    // only failures of the solver itself are reported as non-convergence
    bool functionFailed = false;
    auto g = [&f, &functionFailed](Real x) -> Real {
        try {
            return f(x);
        } catch (...) {
            functionFailed = true;
            throw;
        }
    };

    QuantLib::Brent brent;
    brent.setMaxEvaluations(maxEvaluations_);
    try {
        Real root = brent.solve(g, accuracy_, 0.5 * (xLower + xUpper), xLower, xUpper);
        TLOG("BrentSingleRootFinder: root " << root << " found in [" << xLower << ", " << xUpper << "]");
        return root;
    } catch (const QuantLib::Error& e) {
        if (functionFailed)
            throw;
        SRE_FAIL(RootFinderDidNotConverge, "BrentSingleRootFinder: no root within accuracy "
                                               << accuracy_ << " found in [" << xLower << ", " << xUpper << "] using "
                                               << maxEvaluations_ << " evaluations: " << e.what());
    }
}

} // namespace data
} // namespace sre
