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

/*! \file srea/engine/zspreadcalculator.hpp
    \brief z-spread solver and z-spread sensitivities of an annuity
    \ingroup engine
*/

#pragma once

#include <sred/configuration/zspreadsolverconfig.hpp>
#include <sred/instruments/annuity.hpp>
#include <sred/marketdata/curvebundle.hpp>
#include <sred/pricing/curvesensitivitycalculator.hpp>
#include <sred/pricing/presentvaluecalculator.hpp>

#include <ql/shared_ptr.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

namespace sre {
namespace analytics {

//! Z-spread calculator
/*! The z-spread z is the continuously compounded spread that, added to the discount curves of all payments,
    reprices an annuity to a given market price,

    \f[
      P(z) = \sum_i PV_i \exp(-z t_i)
    \f]

    where \f$ PV_i \f$ is the present value of payment i and \f$ t_i \f$ its payment time.

    The calculator holds only its configuration and the two pricing collaborators, every method works on its
    arguments alone and may be called concurrently. Null annuities or curve bundles are rejected with
    sre::data::InvalidArgument.

    \ingroup engine
*/
class ZSpreadCalculator {
public:
    ZSpreadCalculator(const sre::data::ZSpreadSolverConfig& config = sre::data::ZSpreadSolverConfig(),
                      const QuantLib::ext::shared_ptr<sre::data::PresentValueCalculator>& presentValueCalculator =
                          QuantLib::ext::make_shared<sre::data::DiscountingPresentValueCalculator>(),
                      const QuantLib::ext::shared_ptr<sre::data::CurveSensitivityCalculator>& sensitivityCalculator =
                          QuantLib::ext::make_shared<sre::data::DiscountingCurveSensitivityCalculator>());

    //! Price of the annuity with all payments discounted with the additional spread
    QuantLib::Real price(const QuantLib::ext::shared_ptr<sre::data::Annuity>& annuity,
                         const QuantLib::ext::shared_ptr<sre::data::CurveBundle>& curves,
                         QuantLib::Real zSpread) const;

    //! Spread that reprices the annuity to the target price
    /*! Throws sre::data::RootNotBracketed if there is no such spread in the configured domain and
        sre::data::RootFinderDidNotConverge if the refinement runs out of evaluations.
    */
    QuantLib::Real solveZSpread(const QuantLib::ext::shared_ptr<sre::data::Annuity>& annuity,
                                const QuantLib::ext::shared_ptr<sre::data::CurveBundle>& curves,
                                QuantLib::Real targetPrice) const;

    //! Derivative of price() with respect to the spread
    QuantLib::Real priceSensitivityToZSpread(const QuantLib::ext::shared_ptr<sre::data::Annuity>& annuity,
                                             const QuantLib::ext::shared_ptr<sre::data::CurveBundle>& curves,
                                             QuantLib::Real zSpread) const;

    //! Curve sensitivities of price() at the given spread
    sre::data::CurveSensitivityMap
    priceSensitivityToCurve(const QuantLib::ext::shared_ptr<sre::data::Annuity>& annuity,
                            const QuantLib::ext::shared_ptr<sre::data::CurveBundle>& curves,
                            QuantLib::Real zSpread) const;

    //! Curve sensitivities of the spread, holding the price fixed
    /*! By the implicit function theorem dz/dr = -(dP/dr) / (dP/dz). Throws sre::data::DegenerateSensitivity if
        dP/dz vanishes.
    */
    sre::data::CurveSensitivityMap
    zSpreadSensitivityToCurve(const QuantLib::ext::shared_ptr<sre::data::Annuity>& annuity,
                              const QuantLib::ext::shared_ptr<sre::data::CurveBundle>& curves,
                              QuantLib::Real zSpread) const;

    const sre::data::ZSpreadSolverConfig& config() const { return config_; }

private:
    void checkInputs(const QuantLib::ext::shared_ptr<sre::data::Annuity>& annuity,
                     const QuantLib::ext::shared_ptr<sre::data::CurveBundle>& curves,
                     const std::string& method) const;
    std::vector<QuantLib::Real> presentValues(const sre::data::Annuity& annuity,
                                              const sre::data::CurveBundle& curves) const;

    sre::data::ZSpreadSolverConfig config_;
    QuantLib::ext::shared_ptr<sre::data::PresentValueCalculator> presentValueCalculator_;
    QuantLib::ext::shared_ptr<sre::data::CurveSensitivityCalculator> sensitivityCalculator_;
};

} // namespace analytics
} // namespace sre
