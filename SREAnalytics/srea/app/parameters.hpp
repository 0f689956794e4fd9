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

/*! \file srea/app/parameters.hpp
    \brief Z-spread application setup, market and instrument input
    \ingroup app
*/

#pragma once

#include <sred/configuration/zspreadsolverconfig.hpp>
#include <sred/instruments/payment.hpp>
#include <sred/utilities/xmlutils.hpp>

#include <ql/shared_ptr.hpp>
#include <ql/types.hpp>

#include <string>
#include <utility>
#include <vector>

namespace sre {
namespace analytics {
using namespace sre::data;
using std::string;

//! Provides the input data used in ZSpreadApp
/*! Reads the root node \c ZSpreadInput:
    <pre>
    <ZSpreadInput>
      <Setup>
        <OutputPath>Output</OutputPath>
        <LogFile>log.txt</LogFile>
        <LogMask>31</LogMask>
      </Setup>
      <Curves>
        <Curve><Name>EUR-EONIA</Name><FlatRate>0.02</FlatRate></Curve>
      </Curves>
      <Annuity>
        <Payment><Time>1.0</Time><Amount>100.0</Amount><Curve>EUR-EONIA</Curve></Payment>
        <Coupon><Time>2.0</Time><Curve>EUR-EONIA</Curve><YearFraction>1.0</YearFraction>
                <Notional>1000.0</Notional><Rate>0.05</Rate></Coupon>
      </Annuity>
      <MarketPrice>180.0</MarketPrice>
      <ZSpread/>
      <ZSpreadSolverConfig>...</ZSpreadSolverConfig>
    </ZSpreadInput>
    </pre>
    At least one of MarketPrice and ZSpread must be given. If ZSpread is given no spread is implied and the
    sensitivities are computed at the given spread.

    \ingroup app
*/
class ZSpreadParameters : public XMLSerializable {
public:
    ZSpreadParameters();

    void clear();
    void fromFile(const string& fileName);
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;

    //! \name Inspectors
    //@{
    const string& outputPath() const { return outputPath_; }
    const string& logFile() const { return logFile_; }
    QuantLib::Size logMask() const { return logMask_; }
    //! (curve name, flat continuously compounded zero rate) in input order
    const std::vector<std::pair<string, QuantLib::Real>>& curves() const { return curves_; }
    const std::vector<QuantLib::ext::shared_ptr<Payment>>& payments() const { return payments_; }
    //! Null<Real>() if not given
    QuantLib::Real marketPrice() const { return marketPrice_; }
    //! Null<Real>() if not given
    QuantLib::Real zSpread() const { return zSpread_; }
    const ZSpreadSolverConfig& solverConfig() const { return solverConfig_; }
    //@}

    void log() const;

private:
    string outputPath_;
    string logFile_;
    QuantLib::Size logMask_;
    std::vector<std::pair<string, QuantLib::Real>> curves_;
    std::vector<QuantLib::ext::shared_ptr<Payment>> payments_;
    QuantLib::Real marketPrice_;
    QuantLib::Real zSpread_;
    ZSpreadSolverConfig solverConfig_;
};

} // namespace analytics
} // namespace sre
