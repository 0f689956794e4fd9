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

#include <srea/app/parameters.hpp>

#include <sred/utilities/log.hpp>
#include <sred/utilities/parsers.hpp>

#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <iomanip>
#include <set>

using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;
using QuantLib::ext::dynamic_pointer_cast;
using QuantLib::ext::make_shared;
using QuantLib::ext::shared_ptr;
using std::vector;

namespace sre {
namespace analytics {

namespace {

// an absent or empty node means "not given"
Real optionalReal(XMLNode* node, const string& name) {
    string value = XMLUtils::getChildValue(node, name, false);
    return value.empty() ? Null<Real>() : parseReal(value);
}

} // namespace

ZSpreadParameters::ZSpreadParameters() { clear(); }

void ZSpreadParameters::clear() {
    outputPath_ = ".";
    logFile_ = "log.txt";
    logMask_ = 31;
    curves_.clear();
    payments_.clear();
    marketPrice_ = Null<Real>();
    zSpread_ = Null<Real>();
    solverConfig_ = ZSpreadSolverConfig();
}

void ZSpreadParameters::fromFile(const string& fileName) {
    LOG("load z-spread input from " << fileName);
    clear();
    XMLDocument doc(fileName);
    fromXML(doc.getFirstNode("ZSpreadInput"));
    LOG("load z-spread input from " << fileName << " done.");
}

void ZSpreadParameters::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "ZSpreadInput");
    clear();

    if (XMLNode* setupNode = XMLUtils::getChildNode(node, "Setup")) {
        outputPath_ = XMLUtils::getChildValue(setupNode, "OutputPath", false, outputPath_);
        logFile_ = XMLUtils::getChildValue(setupNode, "LogFile", false, logFile_);
        int mask = XMLUtils::getChildValueAsInt(setupNode, "LogMask", false, static_cast<int>(logMask_));
        QL_REQUIRE(mask >= 0, "LogMask (" << mask << ") should not be negative.");
        logMask_ = static_cast<Size>(mask);
    }

    XMLNode* curvesNode = XMLUtils::getChildNode(node, "Curves");
    QL_REQUIRE(curvesNode, "node Curves not found in z-spread input");
    std::set<string> curveNames;
    for (XMLNode* curveNode : XMLUtils::getChildrenNodes(curvesNode, "Curve")) {
        string name = XMLUtils::getChildValue(curveNode, "Name", true);
        Real rate = XMLUtils::getChildValueAsDouble(curveNode, "FlatRate", true);
        QL_REQUIRE(curveNames.insert(name).second, "duplicate curve " << name << " in z-spread input");
        curves_.push_back(std::make_pair(name, rate));
    }
    QL_REQUIRE(!curves_.empty(), "no curves given in z-spread input");

    XMLNode* annuityNode = XMLUtils::getChildNode(node, "Annuity");
    QL_REQUIRE(annuityNode, "node Annuity not found in z-spread input");
    for (XMLNode* paymentNode : XMLUtils::getChildrenNodes(annuityNode)) {
        string type = XMLUtils::getNodeName(paymentNode);
        Real time = XMLUtils::getChildValueAsDouble(paymentNode, "Time", true);
        string curve = XMLUtils::getChildValue(paymentNode, "Curve", true);
        if (type == "Payment") {
            Real amount = XMLUtils::getChildValueAsDouble(paymentNode, "Amount", true);
            payments_.push_back(make_shared<PaymentFixed>(time, amount, curve));
        } else if (type == "Coupon") {
            Real yearFraction = XMLUtils::getChildValueAsDouble(paymentNode, "YearFraction", true);
            Real notional = XMLUtils::getChildValueAsDouble(paymentNode, "Notional", true);
            Real rate = XMLUtils::getChildValueAsDouble(paymentNode, "Rate", true);
            payments_.push_back(make_shared<CouponFixed>(time, curve, yearFraction, notional, rate));
        } else {
            QL_FAIL("unknown payment type " << type << " in Annuity, expected Payment or Coupon");
        }
        QL_REQUIRE(curveNames.count(curve) > 0, "payment at time " << time << " refers to unknown curve " << curve);
    }
    QL_REQUIRE(!payments_.empty(), "no payments given in Annuity");

    marketPrice_ = optionalReal(node, "MarketPrice");
    zSpread_ = optionalReal(node, "ZSpread");
    QL_REQUIRE(marketPrice_ != Null<Real>() || zSpread_ != Null<Real>(),
               "either MarketPrice or ZSpread must be given in z-spread input");

    if (XMLNode* solverNode = XMLUtils::getChildNode(node, "ZSpreadSolverConfig"))
        solverConfig_.fromXML(solverNode);
}

XMLNode* ZSpreadParameters::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("ZSpreadInput");

    XMLNode* setupNode = XMLUtils::addChild(node, "Setup");
    XMLUtils::addChild(setupNode, "OutputPath", outputPath_);
    XMLUtils::addChild(setupNode, "LogFile", logFile_);
    XMLUtils::addChild(setupNode, "LogMask", static_cast<int>(logMask_));

    XMLNode* curvesNode = XMLUtils::addChild(node, "Curves");
    for (auto const& c : curves_) {
        XMLNode* curveNode = XMLUtils::addChild(curvesNode, "Curve");
        XMLUtils::addChild(curveNode, "Name", c.first);
        XMLUtils::addChild(curveNode, "FlatRate", c.second);
    }

    XMLNode* annuityNode = XMLUtils::addChild(node, "Annuity");
    for (auto const& p : payments_) {
        if (auto cpn = dynamic_pointer_cast<CouponFixed>(p)) {
            XMLNode* cpnNode = XMLUtils::addChild(annuityNode, "Coupon");
            XMLUtils::addChild(cpnNode, "Time", cpn->paymentTime());
            XMLUtils::addChild(cpnNode, "Curve", cpn->fundingCurveName());
            XMLUtils::addChild(cpnNode, "YearFraction", cpn->paymentYearFraction());
            XMLUtils::addChild(cpnNode, "Notional", cpn->notional());
            XMLUtils::addChild(cpnNode, "Rate", cpn->fixedRate());
        } else if (auto fixed = dynamic_pointer_cast<PaymentFixed>(p)) {
            XMLNode* paymentNode = XMLUtils::addChild(annuityNode, "Payment");
            XMLUtils::addChild(paymentNode, "Time", fixed->paymentTime());
            XMLUtils::addChild(paymentNode, "Amount", fixed->amount());
            XMLUtils::addChild(paymentNode, "Curve", fixed->fundingCurveName());
        } else {
            QL_FAIL("ZSpreadParameters::toXML(): payment type not supported");
        }
    }

    if (marketPrice_ != Null<Real>())
        XMLUtils::addChild(node, "MarketPrice", marketPrice_);
    if (zSpread_ != Null<Real>())
        XMLUtils::addChild(node, "ZSpread", zSpread_);

    XMLUtils::appendNode(node, solverConfig_.toXML(doc));
    return node;
}

void ZSpreadParameters::log() const {
    LOG("ZSpreadParameters, setup:");
    LOG("OutputPath = " << outputPath_);
    LOG("LogFile    = " << logFile_);
    LOG("LogMask    = " << logMask_);
    for (auto const& c : curves_)
        LOG("Curve " << c.first << ", flat rate " << std::setprecision(10) << c.second);
    LOG("Annuity with " << payments_.size() << " payments");
    for (Size i = 0; i < payments_.size(); ++i)
        DLOG("Payment " << i << ": time " << payments_[i]->paymentTime() << ", amount " << payments_[i]->amount()
                        << ", curve " << payments_[i]->fundingCurveName());
    if (marketPrice_ != Null<Real>())
        LOG("MarketPrice = " << std::setprecision(12) << marketPrice_);
    if (zSpread_ != Null<Real>())
        LOG("ZSpread     = " << std::setprecision(12) << zSpread_);
}

} // namespace analytics
} // namespace sre
