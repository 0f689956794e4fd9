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
#include <sred/pricing/curvesensitivitycalculator.hpp>
#include <sred/pricing/presentvaluecalculator.hpp>
#include <sret/toplevelfixture.hpp>

#include <ql/settings.hpp>
#include <ql/termstructures/yield/flatforward.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

#include <cmath>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace sre::data;
using std::vector;

namespace {

Handle<YieldTermStructure> flatCurve(Rate rate) {
    return Handle<YieldTermStructure>(ext::make_shared<FlatForward>(Settings::instance().evaluationDate(), rate,
                                                                    Actual365Fixed(), Continuous, Annual));
}

CurveBundle bundle(Rate eurRate, Rate usdRate) {
    CurveBundle curves;
    curves.addCurve("EUR", flatCurve(eurRate));
    curves.addCurve("USD", flatCurve(usdRate));
    return curves;
}

Annuity mixedAnnuity() {
    vector<ext::shared_ptr<Payment>> payments;
    payments.push_back(ext::make_shared<CouponFixed>(0.5, "EUR", 0.5, 1000.0, 0.04));
    payments.push_back(ext::make_shared<PaymentFixed>(1.0, 50.0, "USD"));
    payments.push_back(ext::make_shared<CouponFixed>(1.0, "EUR", 0.5, 1000.0, 0.04));
    payments.push_back(ext::make_shared<PaymentFixed>(1.0, 1000.0, "EUR"));
    payments.push_back(ext::make_shared<PaymentFixed>(2.5, 75.0, "USD"));
    return Annuity(payments);
}

Real annuityValue(const Annuity& annuity, const CurveBundle& curves) {
    DiscountingPresentValueCalculator calculator;
    Real value = 0.0;
    for (auto const& p : annuity.payments())
        value += calculator.presentValue(*p, curves);
    return value;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(SREDataTestSuite, sre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(DiscountingCalculatorsTest)

BOOST_AUTO_TEST_CASE(testPresentValue) {
    BOOST_TEST_MESSAGE("Testing discounting present value of single payments...");
    Settings::instance().evaluationDate() = Date(3, February, 2016);
    CurveBundle curves = bundle(0.02, 0.05);
    DiscountingPresentValueCalculator calculator;

    BOOST_CHECK_CLOSE(calculator.presentValue(PaymentFixed(2.0, 100.0, "EUR"), curves), 100.0 * std::exp(-0.04),
                      1e-10);
    BOOST_CHECK_CLOSE(calculator.presentValue(CouponFixed(1.0, "USD", 1.0, 1000.0, 0.03), curves),
                      30.0 * std::exp(-0.05), 1e-10);
    BOOST_CHECK_EQUAL(calculator.presentValue(PaymentFixed(0.0, 100.0, "EUR"), curves), 100.0);
    BOOST_CHECK_THROW(calculator.presentValue(PaymentFixed(1.0, 100.0, "GBP"), curves), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testSensitivityLadders) {
    BOOST_TEST_MESSAGE("Testing discounting curve sensitivity ladders...");
    Settings::instance().evaluationDate() = Date(3, February, 2016);
    CurveBundle curves = bundle(0.02, 0.05);
    Annuity annuity = mixedAnnuity();

    DiscountingCurveSensitivityCalculator calculator;
    CurveSensitivityMap sensitivities = calculator.sensitivities(annuity, curves);

    BOOST_REQUIRE_EQUAL(sensitivities.size(), 2);
    const SensitivityLadder& eur = sensitivities.at("EUR");
    const SensitivityLadder& usd = sensitivities.at("USD");

    // one point per payment, in payment order, times are not aggregated
    BOOST_REQUIRE_EQUAL(eur.size(), 3);
    BOOST_REQUIRE_EQUAL(usd.size(), 2);
    BOOST_CHECK_EQUAL(eur[0].first, 0.5);
    BOOST_CHECK_EQUAL(eur[1].first, 1.0);
    BOOST_CHECK_EQUAL(eur[2].first, 1.0);
    BOOST_CHECK_EQUAL(usd[0].first, 1.0);
    BOOST_CHECK_EQUAL(usd[1].first, 2.5);

    BOOST_CHECK_CLOSE(eur[0].second, -0.5 * 20.0 * std::exp(-0.01), 1e-10);
    BOOST_CHECK_CLOSE(eur[2].second, -1.0 * 1000.0 * std::exp(-0.02), 1e-10);
    BOOST_CHECK_CLOSE(usd[1].second, -2.5 * 75.0 * std::exp(-0.125), 1e-10);
}

BOOST_AUTO_TEST_CASE(testSensitivitiesAgainstFiniteDifferences) {
    BOOST_TEST_MESSAGE("Testing curve sensitivities against a parallel shift of the flat rate...");
    Settings::instance().evaluationDate() = Date(3, February, 2016);
    Annuity annuity = mixedAnnuity();
    Real h = 1.0e-6;

    CurveSensitivityMap sensitivities =
        DiscountingCurveSensitivityCalculator().sensitivities(annuity, bundle(0.02, 0.05));

    Real eurDelta = 0.0;
    for (auto const& p : sensitivities.at("EUR"))
        eurDelta += p.second;
    Real eurFd = (annuityValue(annuity, bundle(0.02 + h, 0.05)) - annuityValue(annuity, bundle(0.02 - h, 0.05))) /
                 (2.0 * h);
    BOOST_CHECK_CLOSE(eurDelta, eurFd, 1e-5);

    Real usdDelta = 0.0;
    for (auto const& p : sensitivities.at("USD"))
        usdDelta += p.second;
    Real usdFd = (annuityValue(annuity, bundle(0.02, 0.05 + h)) - annuityValue(annuity, bundle(0.02, 0.05 - h))) /
                 (2.0 * h);
    BOOST_CHECK_CLOSE(usdDelta, usdFd, 1e-5);
}

BOOST_AUTO_TEST_CASE(testFreshMapPerCall) {
    BOOST_TEST_MESSAGE("Testing that each call returns an independent map...");
    Settings::instance().evaluationDate() = Date(3, February, 2016);
    CurveBundle curves = bundle(0.02, 0.05);
    Annuity annuity = mixedAnnuity();
    DiscountingCurveSensitivityCalculator calculator;

    CurveSensitivityMap first = calculator.sensitivities(annuity, curves);
    first["EUR"][0].second = 0.0;
    first.erase("USD");
    CurveSensitivityMap second = calculator.sensitivities(annuity, curves);
    BOOST_CHECK_EQUAL(second.size(), 2);
    BOOST_CHECK(second["EUR"][0].second != 0.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
