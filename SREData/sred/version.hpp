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

/*! \file sred/version.hpp
    \brief Version
*/

#ifndef sre_version_hpp
#define sre_version_hpp

// We use boost filesystem 3 and boost::shared_mutex
#include <boost/version.hpp>
#if BOOST_VERSION < 106300
#error using an old version of Boost, please update.
#endif

// We require QuantLib 1.27 or higher for QuantLib::ext::shared_ptr
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x012700f0
#error using an old version of QuantLib, please update.
#endif

//! Version string
#define SRE_VERSION "1.0.0"

//! Version number
#define SRE_VERSION_NUM 1000000

#endif
