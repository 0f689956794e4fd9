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

#include <srea/engine/curvesensitivitytransform.hpp>
#include <srea/engine/zspreadcalculator.hpp>

#include <sred/math/bracketroot.hpp>
#include <sred/math/brentsinglerootfinder.hpp>
#include <sred/utilities/errors.hpp>
#include <sred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <cmath>
#include <iomanip>

using namespace QuantLib;
using namespace sre::data;
using std::string;
using std::vector;

namespace sre {
namespace analytics {

namespace {

Real spreadPrice(const vector<Real>& pvs, const vector<Time>& times, Real zSpread) {
    Real price = 0.0;
    for (Size i = 0; i < pvs.size(); ++i)
        price += pvs[i] * std::exp(-zSpread * times[i]);
    return price;
}

Real spreadPriceDerivative(const vector<Real>& pvs, const vector<Time>& times, Real zSpread) {
    Real dPdz = 0.0;
    for (Size i = 0; i < pvs.size(); ++i)
        dPdz -= times[i] * pvs[i] * std::exp(-zSpread * times[i]);
    return dPdz;
}

} // namespace

ZSpreadCalculator::ZSpreadCalculator(const ZSpreadSolverConfig& config,
                                     const ext::shared_ptr<PresentValueCalculator>& presentValueCalculator,
                                     const ext::shared_ptr<CurveSensitivityCalculator>& sensitivityCalculator)
    : config_(config), presentValueCalculator_(presentValueCalculator),
      sensitivityCalculator_(sensitivityCalculator) {
    QL_REQUIRE(presentValueCalculator_, "ZSpreadCalculator: no present value calculator given");
    QL_REQUIRE(sensitivityCalculator_, "ZSpreadCalculator: no curve sensitivity calculator given");
}

void ZSpreadCalculator::checkInputs(const ext::shared_ptr<Annuity>& annuity,
                                    const ext::shared_ptr<CurveBundle>& curves, const string& method) const {
    SRE_REQUIRE(annuity, InvalidArgument, "ZSpreadCalculator::" << method << "(): annuity is null");
    SRE_REQUIRE(curves, InvalidArgument, "ZSpreadCalculator::" << method << "(): curve bundle is null");
}

vector<Real> ZSpreadCalculator::presentValues(const Annuity& annuity, const CurveBundle& curves) const {
    vector<Real> pvs;
    pvs.reserve(annuity.numberOfPayments());
    for (auto const& p : annuity.payments())
        pvs.push_back(presentValueCalculator_->presentValue(*p, curves));
    return pvs;
}

Real ZSpreadCalculator::price(const ext::shared_ptr<Annuity>& annuity, const ext::shared_ptr<CurveBundle>& curves,
                              Real zSpread) const {
    checkInputs(annuity, curves, "price");
    return spreadPrice(presentValues(*annuity, *curves), annuity->paymentTimes(), zSpread);
}

Real ZSpreadCalculator::solveZSpread(const ext::shared_ptr<Annuity>& annuity,
                                     const ext::shared_ptr<CurveBundle>& curves, Real targetPrice) const {
    checkInputs(annuity, curves, "solveZSpread");

    // the payment values do not depend on the spread
    const vector<Real> pvs = presentValues(*annuity, *curves);
    const vector<Time> times = annuity->paymentTimes();

    DLOG("solveZSpread: " << annuity->numberOfPayments() << " payments, target price " << std::setprecision(12)
                          << targetPrice << ", zero spread price " << spreadPrice(pvs, times, 0.0));

    // for z -> infinity the price tends to the value of the payments at time zero without reaching it, an exact
    // zero of the objective there is an underflow artefact and not a root
    Real limitPrice = 0.0;
    for (Size i = 0; i < pvs.size(); ++i) {
        if (times[i] == 0.0)
            limitPrice += pvs[i];
    }
    SRE_REQUIRE(targetPrice != limitPrice, RootNotBracketed,
                "ZSpreadCalculator::solveZSpread(): target price " << targetPrice
                                                                   << " is the limit of the price for infinite spread");

    auto f = [&pvs, &times, targetPrice](Real z) { return spreadPrice(pvs, times, z) - targetPrice; };

    BracketRoot bracketRoot(config_.bracketExpansionRatio(), config_.maxBracketingSteps());
    std::pair<Real, Real> bracket =
        bracketRoot.getBracketedPoints(f, config_.initialBracket().first, config_.initialBracket().second,
                                       config_.lowerBound(), config_.upperBound());
    DLOG("solveZSpread: root bracketed in [" << bracket.first << ", " << bracket.second << "]");

    BrentSingleRootFinder rootFinder(config_.accuracy(), config_.maxEvaluations());
    Real zSpread = rootFinder.getRoot(f, bracket.first, bracket.second);

    LOG("solveZSpread: z-spread " << std::setprecision(12) << zSpread << " for target price " << targetPrice);
    return zSpread;
}

Real ZSpreadCalculator::priceSensitivityToZSpread(const ext::shared_ptr<Annuity>& annuity,
                                                  const ext::shared_ptr<CurveBundle>& curves, Real zSpread) const {
    checkInputs(annuity, curves, "priceSensitivityToZSpread");
    return spreadPriceDerivative(presentValues(*annuity, *curves), annuity->paymentTimes(), zSpread);
}

CurveSensitivityMap ZSpreadCalculator::priceSensitivityToCurve(const ext::shared_ptr<Annuity>& annuity,
                                                               const ext::shared_ptr<CurveBundle>& curves,
                                                               Real zSpread) const {
    checkInputs(annuity, curves, "priceSensitivityToCurve");
    CurveSensitivityMap sensitivities = sensitivityCalculator_->sensitivities(*annuity, *curves);
    if (zSpread == 0.0)
        return sensitivities;
    return applyZSpreadDiscounting(sensitivities, zSpread);
}

CurveSensitivityMap ZSpreadCalculator::zSpreadSensitivityToCurve(const ext::shared_ptr<Annuity>& annuity,
                                                                 const ext::shared_ptr<CurveBundle>& curves,
                                                                 Real zSpread) const {
    checkInputs(annuity, curves, "zSpreadSensitivityToCurve");
    Real dPdz = spreadPriceDerivative(presentValues(*annuity, *curves), annuity->paymentTimes(), zSpread);
    SRE_REQUIRE(dPdz != 0.0, DegenerateSensitivity,
                "ZSpreadCalculator::zSpreadSensitivityToCurve(): price sensitivity to z-spread is zero at z-spread "
                    << zSpread);
    DLOG("zSpreadSensitivityToCurve: dP/dz = " << dPdz << " at z-spread " << zSpread);
    return applyZSpreadDiscounting(sensitivityCalculator_->sensitivities(*annuity, *curves), zSpread, -1.0 / dPdz);
}

} // namespace analytics
} // namespace sre
