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

#include <sred/utilities/log.hpp>

using sre::data::CurveSensitivityMap;
using sre::data::Report;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

namespace sre {
namespace analytics {

void ReportWriter::writeZSpread(Report& report, Real marketPrice, Real zSpread, Real modelPrice,
                                Real priceSensitivityToZSpread) {
    LOG("Writing z-spread report");
    report.addColumn("MarketPrice", double(), 6)
        .addColumn("ZSpread", double(), 10)
        .addColumn("ModelPrice", double(), 6)
        .addColumn("PriceSensitivityToZSpread", double(), 6);
    report.next().add(marketPrice).add(zSpread).add(modelPrice).add(priceSensitivityToZSpread);
    report.end();
    LOG("z-spread report written");
}

void ReportWriter::writeCurveSensitivities(Report& report, const CurveSensitivityMap& sensitivities) {
    LOG("Writing curve sensitivity report");
    report.addColumn("Curve", string())
        .addColumn("Index", Size())
        .addColumn("Time", double(), 6)
        .addColumn("Sensitivity", double(), 10);
    Size rows = 0;
    for (auto const& kv : sensitivities) {
        for (Size i = 0; i < kv.second.size(); ++i) {
            report.next().add(kv.first).add(i).add(kv.second[i].first).add(kv.second[i].second);
            ++rows;
        }
    }
    report.end();
    LOG("curve sensitivity report written with " << rows << " rows");
}

} // namespace analytics
} // namespace sre
