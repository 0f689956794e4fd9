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

/*! \file sred/marketdata/curvebundle.hpp
    \brief named collection of yield curves
    \ingroup marketdata
*/

#pragma once

#include <ql/handle.hpp>
#include <ql/termstructures/yieldtermstructure.hpp>

#include <map>
#include <string>
#include <vector>

namespace sre {
namespace data {

//! A collection of yield curves indexed by a unique name
/*! \ingroup marketdata
 */
class CurveBundle {
public:
    CurveBundle() {}
    explicit CurveBundle(const std::map<std::string, QuantLib::Handle<QuantLib::YieldTermStructure>>& curves);

    //! Add a curve, it is an error to add a name twice or an empty handle
    void addCurve(const std::string& name, const QuantLib::Handle<QuantLib::YieldTermStructure>& curve);

    //! Returns the curve with the given name, throws if there is none
    const QuantLib::Handle<QuantLib::YieldTermStructure>& curve(const std::string& name) const;
    bool hasCurve(const std::string& name) const { return curves_.find(name) != curves_.end(); }

    std::vector<std::string> curveNames() const;
    QuantLib::Size size() const { return curves_.size(); }

private:
    std::map<std::string, QuantLib::Handle<QuantLib::YieldTermStructure>> curves_;
};

} // namespace data
} // namespace sre
