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

/*! \file sred/utilities/errors.hpp
    \brief Typed errors raised by the z-spread library
    \ingroup utilities
*/

#pragma once

#include <ql/errors.hpp>

#include <sstream>
#include <string>

namespace sre {
namespace data {

/*! Raised when a mandatory input (annuity, curve bundle) is missing.
    \ingroup utilities
*/
class InvalidArgument : public QuantLib::Error {
public:
    InvalidArgument(const std::string& file, long line, const std::string& functionName,
                    const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

/*! Raised when no sign change of the target function is found within the admissible domain.
    \ingroup utilities
*/
class RootNotBracketed : public QuantLib::Error {
public:
    RootNotBracketed(const std::string& file, long line, const std::string& functionName,
                     const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

/*! Raised when a root finder exhausts its evaluation budget.
    \ingroup utilities
*/
class RootFinderDidNotConverge : public QuantLib::Error {
public:
    RootFinderDidNotConverge(const std::string& file, long line, const std::string& functionName,
                             const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

/*! Raised when the price sensitivity to the z-spread is zero and would be used as a divisor.
    \ingroup utilities
*/
class DegenerateSensitivity : public QuantLib::Error {
public:
    DegenerateSensitivity(const std::string& file, long line, const std::string& functionName,
                          const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

} // namespace data
} // namespace sre

//! Throw an error of the given type, the message is streamed as in QL_FAIL
#define SRE_FAIL(ErrorType, message)                                                                                   \
    do {                                                                                                               \
        std::ostringstream _sre_msg_stream;                                                                            \
        _sre_msg_stream << message;                                                                                    \
        throw ErrorType(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _sre_msg_stream.str());                                \
    } while (false)

//! Throw an error of the given type if the condition is not met
#define SRE_REQUIRE(condition, ErrorType, message)                                                                     \
    if (!(condition)) {                                                                                                \
        SRE_FAIL(ErrorType, message);                                                                                  \
    } else
