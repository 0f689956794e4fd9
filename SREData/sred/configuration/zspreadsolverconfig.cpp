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

#include <sred/configuration/zspreadsolverconfig.hpp>
#include <sred/utilities/parsers.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;
using std::make_pair;
using std::pair;

namespace sre {
namespace data {

ZSpreadSolverConfig::ZSpreadSolverConfig()
    : initialBracket_(make_pair(0.0, 1.2)), lowerBound_(0.0), upperBound_(Null<Real>()),
      bracketExpansionRatio_(1.6), maxBracketingSteps_(50), accuracy_(1.0e-12), maxEvaluations_(100) {}

ZSpreadSolverConfig::ZSpreadSolverConfig(const pair<Real, Real>& initialBracket, Real lowerBound, Real upperBound,
                                         Real bracketExpansionRatio, Size maxBracketingSteps, Real accuracy,
                                         Size maxEvaluations)
    : initialBracket_(initialBracket), lowerBound_(lowerBound), upperBound_(upperBound),
      bracketExpansionRatio_(bracketExpansionRatio), maxBracketingSteps_(maxBracketingSteps), accuracy_(accuracy),
      maxEvaluations_(maxEvaluations) {
    check();
}

void ZSpreadSolverConfig::fromXML(XMLNode* node) {

    XMLUtils::checkNode(node, "ZSpreadSolverConfig");

    // Everything is optional, missing values keep the defaults
    ZSpreadSolverConfig defaults;

    initialBracket_ = defaults.initialBracket_;
    if (XMLNode* bracketNode = XMLUtils::getChildNode(node, "InitialBracket")) {
        Real lower = XMLUtils::getChildValueAsDouble(bracketNode, "Lower", true);
        Real upper = XMLUtils::getChildValueAsDouble(bracketNode, "Upper", true);
        initialBracket_ = make_pair(lower, upper);
    }

    lowerBound_ = defaults.lowerBound_;
    if (XMLNode* n = XMLUtils::getChildNode(node, "LowerBound")) {
        std::string value = XMLUtils::getNodeValue(n);
        lowerBound_ = value.empty() ? Null<Real>() : parseReal(value);
    }

    upperBound_ = defaults.upperBound_;
    if (XMLNode* n = XMLUtils::getChildNode(node, "UpperBound")) {
        std::string value = XMLUtils::getNodeValue(n);
        upperBound_ = value.empty() ? Null<Real>() : parseReal(value);
    }

    bracketExpansionRatio_ =
        XMLUtils::getChildValueAsDouble(node, "BracketExpansionRatio", false, defaults.bracketExpansionRatio_);

    int steps = XMLUtils::getChildValueAsInt(node, "MaxBracketingSteps", false,
                                             static_cast<int>(defaults.maxBracketingSteps_));
    QL_REQUIRE(steps >= 0, "MaxBracketingSteps (" << steps << ") should not be negative.");
    maxBracketingSteps_ = static_cast<Size>(steps);

    accuracy_ = XMLUtils::getChildValueAsDouble(node, "Accuracy", false, defaults.accuracy_);

    int evaluations =
        XMLUtils::getChildValueAsInt(node, "MaxEvaluations", false, static_cast<int>(defaults.maxEvaluations_));
    QL_REQUIRE(evaluations > 0, "MaxEvaluations (" << evaluations << ") should be positive.");
    maxEvaluations_ = static_cast<Size>(evaluations);

    check();
}

XMLNode* ZSpreadSolverConfig::toXML(XMLDocument& doc) const {

    XMLNode* node = doc.allocNode("ZSpreadSolverConfig");

    XMLNode* bracketNode = XMLUtils::addChild(node, "InitialBracket");
    XMLUtils::addChild(bracketNode, "Lower", initialBracket_.first);
    XMLUtils::addChild(bracketNode, "Upper", initialBracket_.second);

    // an empty node switches the default lower bound off
    if (lowerBound_ != Null<Real>())
        XMLUtils::addChild(node, "LowerBound", lowerBound_);
    else
        XMLUtils::addChild(node, "LowerBound", std::string());

    if (upperBound_ != Null<Real>())
        XMLUtils::addChild(node, "UpperBound", upperBound_);

    XMLUtils::addChild(node, "BracketExpansionRatio", bracketExpansionRatio_);
    XMLUtils::addChild(node, "MaxBracketingSteps", static_cast<int>(maxBracketingSteps_));
    XMLUtils::addChild(node, "Accuracy", accuracy_);
    XMLUtils::addChild(node, "MaxEvaluations", static_cast<int>(maxEvaluations_));

    return node;
}

void ZSpreadSolverConfig::check() const {

    const Real& lower = initialBracket_.first;
    const Real& upper = initialBracket_.second;
    QL_REQUIRE(lower < upper, "InitialBracket Lower (" << lower << ") should be less than Upper (" << upper << ").");

    if (lowerBound_ != Null<Real>()) {
        QL_REQUIRE(lowerBound_ <= lower, "When given, LowerBound (" << lowerBound_
                                                                    << ") should not exceed the initial bracket's Lower ("
                                                                    << lower << ").");
    }

    if (upperBound_ != Null<Real>()) {
        QL_REQUIRE(upperBound_ >= upper, "When given, UpperBound (" << upperBound_
                                                                    << ") should not be below the initial bracket's Upper ("
                                                                    << upper << ").");
    }

    QL_REQUIRE(bracketExpansionRatio_ > 0, "BracketExpansionRatio (" << bracketExpansionRatio_
                                                                     << ") should be positive.");
    QL_REQUIRE(accuracy_ > 0, "Accuracy (" << accuracy_ << ") should be positive.");
    QL_REQUIRE(maxEvaluations_ > 0, "MaxEvaluations (" << maxEvaluations_ << ") should be positive.");
}

} // namespace data
} // namespace sre
