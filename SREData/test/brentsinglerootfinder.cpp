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

#include <boost/test/unit_test.hpp>
#include <sred/math/brentsinglerootfinder.hpp>
#include <sred/utilities/errors.hpp>
#include <sret/toplevelfixture.hpp>

#include <cmath>
#include <stdexcept>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace sre::data;

BOOST_FIXTURE_TEST_SUITE(SREDataTestSuite, sre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(BrentSingleRootFinderTest)

BOOST_AUTO_TEST_CASE(testSquareRoot) {
    BOOST_TEST_MESSAGE("Testing Brent root finder on x^2 - 2...");
    BrentSingleRootFinder rootFinder(1.0e-12, 100);
    Real root = rootFinder.getRoot([](Real x) { return x * x - 2.0; }, 0.0, 2.0);
    BOOST_CHECK_SMALL(root - std::sqrt(2.0), 1.0e-11);
}

BOOST_AUTO_TEST_CASE(testDecreasingFunction) {
    BOOST_TEST_MESSAGE("Testing Brent root finder on a decreasing exponential sum...");
    BrentSingleRootFinder rootFinder;
    auto f = [](Real z) { return 100.0 * std::exp(-z) + 100.0 * std::exp(-2.0 * z) - 150.0; };
    Real root = rootFinder.getRoot(f, 0.0, 1.2);
    BOOST_CHECK_SMALL(f(root), 1.0e-9);
}

BOOST_AUTO_TEST_CASE(testRootAtEndPoint) {
    BOOST_TEST_MESSAGE("Testing Brent root finder with a root at the lower end...");
    BrentSingleRootFinder rootFinder;
    Real root = rootFinder.getRoot([](Real x) { return x; }, 0.0, 1.2);
    BOOST_CHECK_SMALL(root, 1.0e-12);
}

BOOST_AUTO_TEST_CASE(testNotBracketed) {
    BOOST_TEST_MESSAGE("Testing Brent root finder on an interval without sign change...");
    BrentSingleRootFinder rootFinder;
    BOOST_CHECK_THROW(rootFinder.getRoot([](Real x) { return x * x - 2.0; }, 2.0, 3.0), RootNotBracketed);
}

BOOST_AUTO_TEST_CASE(testEvaluationBudgetExhausted) {
    BOOST_TEST_MESSAGE("Testing Brent root finder with an exhausted evaluation budget...");
    BrentSingleRootFinder rootFinder(1.0e-12, 1);
    BOOST_CHECK_THROW(rootFinder.getRoot([](Real x) { return x * x - 2.0; }, 0.0, 2.0), RootFinderDidNotConverge);
}

BOOST_AUTO_TEST_CASE(testFunctionErrorsArePassedThrough) {
    BOOST_TEST_MESSAGE("Testing that errors raised by the function are not reported as non-convergence...");
    BrentSingleRootFinder rootFinder;
    auto throwsInside = [](Real x) -> Real {
        if (x > 0.5 && x < 1.5)
            QL_FAIL("function failure at " << x);
        return x - 1.0;
    };
    try {
        rootFinder.getRoot(throwsInside, 0.0, 2.0);
        BOOST_FAIL("expected an exception");
    } catch (const RootFinderDidNotConverge&) {
        BOOST_FAIL("function error reported as non-convergence");
    } catch (const QuantLib::Error& e) {
        BOOST_CHECK(std::string(e.what()).find("function failure") != std::string::npos);
    }

    auto throwsStd = [](Real x) -> Real {
        if (x > 0.5 && x < 1.5)
            throw std::runtime_error("runtime failure");
        return x - 1.0;
    };
    BOOST_CHECK_THROW(rootFinder.getRoot(throwsStd, 0.0, 2.0), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(testInvalidParameters) {
    BOOST_TEST_MESSAGE("Testing Brent root finder parameter checks...");
    BOOST_CHECK_THROW(BrentSingleRootFinder(0.0, 100), QuantLib::Error);
    BOOST_CHECK_THROW(BrentSingleRootFinder(1.0e-12, 0), QuantLib::Error);
    BrentSingleRootFinder rootFinder;
    BOOST_CHECK_THROW(rootFinder.getRoot([](Real x) { return x; }, 1.0, -1.0), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
