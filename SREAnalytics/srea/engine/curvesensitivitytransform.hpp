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

/*! \file srea/engine/curvesensitivitytransform.hpp
    \brief z-spread adjustment of curve sensitivity ladders
    \ingroup engine
*/

#pragma once

#include <sred/pricing/curvesensitivitycalculator.hpp>

#include <ql/types.hpp>

namespace sre {
namespace analytics {

/*! Returns a new map in which every ladder point (t, s) of \p sensitivities is replaced by
    (t, factor * s * exp(-zSpread * t)).

    Curve names, ladder lengths, ladder order and times are those of the input, the input is not modified.

    \ingroup engine
*/
sre::data::CurveSensitivityMap applyZSpreadDiscounting(const sre::data::CurveSensitivityMap& sensitivities,
                                                       QuantLib::Real zSpread, QuantLib::Real factor = 1.0);

} // namespace analytics
} // namespace sre
