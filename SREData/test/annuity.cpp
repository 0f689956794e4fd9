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
#include <sred/instruments/annuity.hpp>
#include <sred/instruments/payment.hpp>
#include <sret/toplevelfixture.hpp>

#include <limits>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace sre::data;
using std::vector;

BOOST_FIXTURE_TEST_SUITE(SREDataTestSuite, sre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(AnnuityTest)

BOOST_AUTO_TEST_CASE(testPaymentAmounts) {
    BOOST_TEST_MESSAGE("Testing fixed payment and fixed coupon amounts...");

    PaymentFixed payment(1.5, 250.0, "EUR-EONIA");
    BOOST_CHECK_EQUAL(payment.paymentTime(), 1.5);
    BOOST_CHECK_EQUAL(payment.amount(), 250.0);
    BOOST_CHECK_EQUAL(payment.fundingCurveName(), "EUR-EONIA");

    CouponFixed coupon(2.0, "EUR-EONIA", 0.5, 1000000.0, 0.04);
    BOOST_CHECK_CLOSE(coupon.amount(), 20000.0, 1e-12);
    BOOST_CHECK_EQUAL(coupon.paymentYearFraction(), 0.5);
    BOOST_CHECK_EQUAL(coupon.notional(), 1000000.0);
    BOOST_CHECK_EQUAL(coupon.fixedRate(), 0.04);
}

BOOST_AUTO_TEST_CASE(testInvalidPayments) {
    BOOST_TEST_MESSAGE("Testing payment input checks...");
    BOOST_CHECK_THROW(PaymentFixed(-0.1, 100.0, "EUR"), QuantLib::Error);
    BOOST_CHECK_THROW(PaymentFixed(std::numeric_limits<Real>::infinity(), 100.0, "EUR"), QuantLib::Error);
    BOOST_CHECK_THROW(PaymentFixed(1.0, 100.0, ""), QuantLib::Error);
    BOOST_CHECK_THROW(PaymentFixed(1.0, std::numeric_limits<Real>::quiet_NaN(), "EUR"), QuantLib::Error);
    BOOST_CHECK_THROW(CouponFixed(1.0, "EUR", -0.5, 100.0, 0.01), QuantLib::Error);
    // payments at the valuation date are allowed
    BOOST_CHECK_NO_THROW(PaymentFixed(0.0, 100.0, "EUR"));
}

BOOST_AUTO_TEST_CASE(testAnnuityKeepsPaymentOrder) {
    BOOST_TEST_MESSAGE("Testing that the annuity preserves the payment order...");

    vector<ext::shared_ptr<Payment>> payments;
    payments.push_back(ext::make_shared<PaymentFixed>(0.5, 10.0, "EUR"));
    payments.push_back(ext::make_shared<CouponFixed>(1.0, "USD", 0.5, 100.0, 0.05));
    payments.push_back(ext::make_shared<PaymentFixed>(1.5, 110.0, "EUR"));
    Annuity annuity(payments);

    BOOST_REQUIRE_EQUAL(annuity.numberOfPayments(), 3);
    vector<Time> times = annuity.paymentTimes();
    BOOST_REQUIRE_EQUAL(times.size(), 3);
    BOOST_CHECK_EQUAL(times[0], 0.5);
    BOOST_CHECK_EQUAL(times[1], 1.0);
    BOOST_CHECK_EQUAL(times[2], 1.5);
    BOOST_CHECK_EQUAL(annuity.nthPayment(1)->fundingCurveName(), "USD");
    BOOST_CHECK_CLOSE(annuity.nthPayment(1)->amount(), 2.5, 1e-12);
    BOOST_CHECK_EQUAL(annuity.nthPayment(2)->amount(), 110.0);
    BOOST_CHECK_THROW(annuity.nthPayment(3), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testInvalidAnnuity) {
    BOOST_TEST_MESSAGE("Testing annuity input checks...");
    vector<ext::shared_ptr<Payment>> payments;
    BOOST_CHECK_THROW(Annuity annuity(payments), QuantLib::Error);
    payments.push_back(ext::make_shared<PaymentFixed>(1.0, 10.0, "EUR"));
    payments.push_back(ext::shared_ptr<Payment>());
    BOOST_CHECK_THROW(Annuity annuity(payments), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
