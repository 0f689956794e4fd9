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

/*! \file sred/utilities/parsers.hpp
    \brief string utilities for parsing numbers and flags
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <string>

namespace sre {
namespace data {

//! Convert text to Real
/*!
  \ingroup utilities
*/
QuantLib::Real parseReal(const std::string& s);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
*/
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to bool
/*!
  \ingroup utilities
*/
bool parseBool(const std::string& s);

} // namespace data
} // namespace sre
