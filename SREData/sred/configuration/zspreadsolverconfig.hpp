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

/*! \file sred/configuration/zspreadsolverconfig.hpp
    \brief Class for holding the z-spread solver configuration
    \ingroup configuration
*/

#pragma once

#include <sred/utilities/xmlutils.hpp>

#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <utility>

namespace sre {
namespace data {

/*! Serializable configuration of the bracket-then-refine z-spread solver

    The bracketing starts from the initial bracket and never leaves [LowerBound, UpperBound], an unset bound is
    not enforced. The default configuration searches non-negative spreads starting from [0.0, 1.2]. In XML an empty
    LowerBound element removes the default lower bound.

    \ingroup configuration
*/
class ZSpreadSolverConfig : public XMLSerializable {
public:
    //! Default constructor with the standard settings
    ZSpreadSolverConfig();

    ZSpreadSolverConfig(const std::pair<QuantLib::Real, QuantLib::Real>& initialBracket,
                        QuantLib::Real lowerBound, QuantLib::Real upperBound, QuantLib::Real bracketExpansionRatio,
                        QuantLib::Size maxBracketingSteps, QuantLib::Real accuracy, QuantLib::Size maxEvaluations);

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! \name Inspectors
    //@{
    const std::pair<QuantLib::Real, QuantLib::Real>& initialBracket() const { return initialBracket_; }
    QuantLib::Real lowerBound() const { return lowerBound_; }
    QuantLib::Real upperBound() const { return upperBound_; }
    QuantLib::Real bracketExpansionRatio() const { return bracketExpansionRatio_; }
    QuantLib::Size maxBracketingSteps() const { return maxBracketingSteps_; }
    QuantLib::Real accuracy() const { return accuracy_; }
    QuantLib::Size maxEvaluations() const { return maxEvaluations_; }
    //@}

private:
    std::pair<QuantLib::Real, QuantLib::Real> initialBracket_;
    QuantLib::Real lowerBound_;
    QuantLib::Real upperBound_;
    QuantLib::Real bracketExpansionRatio_;
    QuantLib::Size maxBracketingSteps_;
    QuantLib::Real accuracy_;
    QuantLib::Size maxEvaluations_;

    //! Basic checks
    void check() const;
};

} // namespace data
} // namespace sre
