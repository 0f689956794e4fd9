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

/*! \file sred/report/csvreport.hpp
    \brief CSV Report class
    \ingroup report
*/

#pragma once

#include <sred/report/report.hpp>

#include <cstdio>
#include <vector>

namespace sre {
namespace data {

/*! CSV Report class

    Rows are written to the file as they are completed. Real columns are rounded to the column precision and
    printed in fixed notation, \c QuantLib::Null and non-finite values are printed as the null string.

    \ingroup report
*/
class CSVFileReport : public Report {
public:
    /*! Create a report with the given filename, will throw if it cannot open the file.
        \param filename         name of the csv file that is created
        \param sep              separator character for the csv file. It defaults to a comma.
        \param commentCharacter if \c true, the header row starts with the \c # character.
        \param quoteChar        character to use to quote strings. If not provided, strings are not quoted.
        \param nullString       string used to represent \c QuantLib::Null values or infinite values.
    */
    CSVFileReport(const string& filename, const char sep = ',', const bool commentCharacter = true,
                  char quoteChar = '\0', const std::string& nullString = "#N/A");
    ~CSVFileReport();

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    void end() override;
    void flush() override;

    const std::string& filename() const { return filename_; }

private:
    void checkIsOpen(const std::string& op) const;
    //! Formats a value for column i
    std::string format(const ReportType& rt, Size i) const;
    void write(const std::string& s);
    void close();

    std::string filename_;
    char sep_;
    bool commentCharacter_;
    char quoteChar_;
    std::string nullString_;

    std::vector<ReportType> columnTypes_;
    std::vector<Size> columnPrecision_;
    Size i_ = 0;
    Size rows_ = 0;
    FILE* fp_ = nullptr;
    bool finalized_ = false;
};

} // namespace data
} // namespace sre
