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

/*! \file srea/app/reportwriter.hpp
  \brief A Class to write z-spread results to reports
  \ingroup app
 */

#pragma once

#include <sred/pricing/curvesensitivitycalculator.hpp>
#include <sred/report/report.hpp>

#include <ql/types.hpp>

#include <string>

namespace sre {
namespace analytics {

//! Write z-spread results to reports
/*! \ingroup app
 */
class ReportWriter {
public:
    ReportWriter() {}
    virtual ~ReportWriter() {}

    //! One row with the market price, the z-spread, the model price at that spread and its spread sensitivity
    virtual void writeZSpread(sre::data::Report& report, QuantLib::Real marketPrice, QuantLib::Real zSpread,
                              QuantLib::Real modelPrice, QuantLib::Real priceSensitivityToZSpread);

    //! One row per ladder point, curves in name order and ladder points in ladder order
    virtual void writeCurveSensitivities(sre::data::Report& report,
                                         const sre::data::CurveSensitivityMap& sensitivities);
};

} // namespace analytics
} // namespace sre
