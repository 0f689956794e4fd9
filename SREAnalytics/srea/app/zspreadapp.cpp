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

#include <srea/app/reportwriter.hpp>
#include <srea/app/zspreadapp.hpp>
#include <srea/engine/zspreadcalculator.hpp>

#include <sred/utilities/log.hpp>
#include <sred/version.hpp>

#include <ql/errors.hpp>
#include <ql/settings.hpp>
#include <ql/termstructures/yield/flatforward.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>
#include <ql/utilities/null.hpp>

#include <boost/filesystem.hpp>

#include <iomanip>
#include <iostream>

using namespace QuantLib;
using namespace sre::data;
using std::string;

namespace sre {
namespace analytics {

namespace {

// console progress output, padded so that the status lines up
void consoleStart(bool console, const string& text) {
    if (console)
        std::cout << std::setw(40) << std::left << text << std::flush;
}

void consoleEnd(bool console, const string& text) {
    if (console)
        std::cout << text << std::endl;
}

} // namespace

ZSpreadApp::~ZSpreadApp() {
    // Close logs
    closeLog();
}

void ZSpreadApp::run() {

    QL_REQUIRE(params_, "ZSpreadApp: no parameters given");

    runTimer_.start();
    reports_.clear();

    setupLog(params_->outputPath(), params_->logFile(), params_->logMask());
    LOG("ZSpreadApp starting, version " << version());
    params_->log();

    try {
        consoleStart(console_, "Market and annuity... ");
        ext::shared_ptr<CurveBundle> curves = buildCurves();
        ext::shared_ptr<Annuity> annuity = buildAnnuity();
        consoleEnd(console_, "OK");

        ZSpreadCalculator calculator(params_->solverConfig());

        Real zSpread = params_->zSpread();
        if (zSpread == Null<Real>()) {
            consoleStart(console_, "Z-spread... ");
            zSpread = calculator.solveZSpread(annuity, curves, params_->marketPrice());
            consoleEnd(console_, "OK");
        } else {
            LOG("z-spread " << zSpread << " given, no spread is implied");
        }

        consoleStart(console_, "Sensitivities... ");
        Real modelPrice = calculator.price(annuity, curves, zSpread);
        Real dPdz = calculator.priceSensitivityToZSpread(annuity, curves, zSpread);
        CurveSensitivityMap priceSensitivities = calculator.priceSensitivityToCurve(annuity, curves, zSpread);
        CurveSensitivityMap zSpreadSensitivities = calculator.zSpreadSensitivityToCurve(annuity, curves, zSpread);
        consoleEnd(console_, "OK");

        consoleStart(console_, "Write reports... ");
        ReportWriter writer;
        auto zSpreadReport = ext::make_shared<InMemoryReport>();
        writer.writeZSpread(*zSpreadReport, params_->marketPrice(), zSpread, modelPrice, dPdz);
        reports_["zspread"] = zSpreadReport;

        auto priceReport = ext::make_shared<InMemoryReport>();
        writer.writeCurveSensitivities(*priceReport, priceSensitivities);
        reports_["price_curve_sensitivity"] = priceReport;

        auto zSpreadSensiReport = ext::make_shared<InMemoryReport>();
        writer.writeCurveSensitivities(*zSpreadSensiReport, zSpreadSensitivities);
        reports_["zspread_curve_sensitivity"] = zSpreadSensiReport;

        boost::filesystem::path outputPath(params_->outputPath());
        for (auto const& r : reports_)
            r.second->toFile((outputPath / (r.first + ".csv")).string());
        consoleEnd(console_, "OK");

    } catch (const std::exception& e) {
        ALOG("Error: " << e.what());
        consoleEnd(console_, "FAILED");
        runTimer_.stop();
        throw;
    }

    runTimer_.stop();
    LOG("ZSpreadApp finished in " << getRunTime() << " seconds");
    if (console_)
        std::cout << "run time: " << std::setprecision(2) << std::fixed << getRunTime() << " sec" << std::endl;
}

std::set<string> ZSpreadApp::getReportNames() const {
    std::set<string> names;
    for (auto const& r : reports_)
        names.insert(r.first);
    return names;
}

ext::shared_ptr<InMemoryReport> ZSpreadApp::getReport(const string& reportName) const {
    auto it = reports_.find(reportName);
    QL_REQUIRE(it != reports_.end(), "report " << reportName << " not found");
    return it->second;
}

Real ZSpreadApp::getRunTime() const {
    // wall time is in nanoseconds
    return static_cast<Real>(runTimer_.elapsed().wall) * 1.0e-9;
}

string ZSpreadApp::version() const { return string(SRE_VERSION); }

ext::shared_ptr<CurveBundle> ZSpreadApp::buildCurves() const {
    Date asof = Settings::instance().evaluationDate();
    auto curves = ext::make_shared<CurveBundle>();
    for (auto const& c : params_->curves()) {
        Handle<YieldTermStructure> curve(
            ext::make_shared<FlatForward>(asof, c.second, Actual365Fixed(), Continuous, Annual));
        curves->addCurve(c.first, curve);
        DLOG("built flat curve " << c.first << " at " << c.second << " as of " << asof);
    }
    return curves;
}

ext::shared_ptr<Annuity> ZSpreadApp::buildAnnuity() const { return ext::make_shared<Annuity>(params_->payments()); }

void ZSpreadApp::setupLog(const string& path, const string& file, Size mask) {
    closeLog();

    boost::filesystem::path p{path};
    if (!boost::filesystem::exists(p)) {
        boost::filesystem::create_directories(p);
    }
    QL_REQUIRE(boost::filesystem::is_directory(p), "output path '" << path << "' is not a directory.");

    Log::instance().registerLogger(ext::make_shared<FileLogger>((p / file).string()));
    Log::instance().setMask(static_cast<unsigned>(mask));
    Log::instance().switchOn();
}

void ZSpreadApp::closeLog() { Log::instance().removeAllLoggers(); }

} // namespace analytics
} // namespace sre
