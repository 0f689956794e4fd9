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

/*! \file srea/app/zspreadapp.hpp
  \brief Z-spread application
  \ingroup app
 */

#pragma once

#include <srea/app/parameters.hpp>

#include <sred/instruments/annuity.hpp>
#include <sred/marketdata/curvebundle.hpp>
#include <sred/report/inmemoryreport.hpp>

#include <boost/timer/timer.hpp>

#include <map>
#include <set>
#include <string>

namespace sre {
namespace analytics {

//! Orchestrates a z-spread run, input loading, solving and reporting
/*! The reports are kept in memory and written as csv files to the output path:
    - \c zspread: market price, z-spread, model price and price sensitivity to the z-spread
    - \c price_curve_sensitivity: price sensitivities to the curves at the z-spread
    - \c zspread_curve_sensitivity: z-spread sensitivities to the curves

    \ingroup app
 */
class ZSpreadApp {
public:
    ZSpreadApp(const QuantLib::ext::shared_ptr<ZSpreadParameters>& params, bool console = false)
        : params_(params), console_(console) {}

    //! Destructor, removes the loggers set up by run()
    virtual ~ZSpreadApp();

    //! Loads the market and the annuity, computes the z-spread and its sensitivities and writes the reports
    virtual void run();

    std::set<std::string> getReportNames() const;
    QuantLib::ext::shared_ptr<sre::data::InMemoryReport> getReport(const std::string& reportName) const;

    //! time for executing run() in seconds
    QuantLib::Real getRunTime() const;

    std::string version() const;

protected:
    //! Flat continuously compounded Act/365F curves
    virtual QuantLib::ext::shared_ptr<sre::data::CurveBundle> buildCurves() const;
    virtual QuantLib::ext::shared_ptr<sre::data::Annuity> buildAnnuity() const;

    //! set up logging
    void setupLog(const std::string& path, const std::string& file, QuantLib::Size mask);
    //! remove logs
    void closeLog();

    QuantLib::ext::shared_ptr<ZSpreadParameters> params_;
    bool console_;
    std::map<std::string, QuantLib::ext::shared_ptr<sre::data::InMemoryReport>> reports_;
    boost::timer::cpu_timer runTimer_;
};

} // namespace analytics
} // namespace sre
