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

#include <sred/report/csvreport.hpp>
#include <sred/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>
#include <ql/math/rounding.hpp>
#include <ql/utilities/null.hpp>

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

#include <cmath>
#include <iomanip>
#include <sstream>

using std::string;

namespace sre {
namespace data {

namespace {

// Turns a report value into its csv cell text
class CellFormatter : public boost::static_visitor<string> {
public:
    CellFormatter(Size precision, char quoteChar, const string& nullString)
        : precision_(precision), quoteChar_(quoteChar), nullString_(nullString) {}

    string operator()(const Size i) const {
        if (i == QuantLib::Null<Size>())
            return nullString_;
        return std::to_string(i);
    }

    string operator()(const Real d) const {
        if (d == QuantLib::Null<Real>() || !std::isfinite(d))
            return nullString_;
        Real r = QuantLib::Rounding(static_cast<QuantLib::Integer>(precision_), QuantLib::Rounding::Closest)(d);
        // no "-0.000"
        if (QuantLib::close_enough(r, 0.0))
            r = 0.0;
        std::ostringstream os;
        os << std::fixed << std::setprecision(static_cast<int>(precision_)) << r;
        return os.str();
    }

    string operator()(const string& s) const {
        if (quoteChar_ == '\0')
            return s;
        bool quoted = s.size() > 1 && s.front() == quoteChar_ && s.back() == quoteChar_;
        return quoted ? s : quoteChar_ + s + quoteChar_;
    }

private:
    Size precision_;
    char quoteChar_;
    const string& nullString_;
};

} // namespace

CSVFileReport::CSVFileReport(const string& filename, const char sep, const bool commentCharacter, char quoteChar,
                             const string& nullString)
    : filename_(filename), sep_(sep), commentCharacter_(commentCharacter), quoteChar_(quoteChar),
      nullString_(nullString) {
    LOG("Opening CSV file report '" << filename_ << "'");
    fp_ = std::fopen(filename_.c_str(), "w");
    QL_REQUIRE(fp_, "Error opening file '" << filename_ << "'");
}

CSVFileReport::~CSVFileReport() {
    if (!finalized_) {
        WLOG("CSV file report '" << filename_ << "' was not finalized, call end() on the report instance.");
        close();
    }
}

void CSVFileReport::flush() {
    checkIsOpen("flush()");
    std::fflush(fp_);
}

Report& CSVFileReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    checkIsOpen("addColumn(" + name + ")");
    QL_REQUIRE(rows_ == 0, "Cannot add column " << name << " to CSV file report '" << filename_
                                                << "' after the first row");
    if (columnTypes_.empty()) {
        if (commentCharacter_)
            write("#");
    } else {
        write(string(1, sep_));
    }
    write(name);
    columnTypes_.push_back(rt);
    columnPrecision_.push_back(precision);
    i_ = columnTypes_.size();
    return *this;
}

Report& CSVFileReport::next() {
    checkIsOpen("next()");
    QL_REQUIRE(i_ == columnTypes_.size(), "Cannot go to next line, only " << i_ << " entries filled");
    write("\n");
    i_ = 0;
    ++rows_;
    return *this;
}

Report& CSVFileReport::add(const ReportType& rt) {
    checkIsOpen("add()");
    QL_REQUIRE(rows_ > 0, "Call next() before adding data to CSV file report '" << filename_ << "'");
    QL_REQUIRE(i_ < columnTypes_.size(), "No column to add [" << rt << "] to.");
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(), "Cannot add value " << rt << " of type " << rt.which()
                                                                           << " to column " << i_ << " of type "
                                                                           << columnTypes_[i_].which());
    if (i_ != 0)
        write(string(1, sep_));
    write(format(rt, i_));
    ++i_;
    return *this;
}

void CSVFileReport::end() {
    checkIsOpen("end()");
    write("\n");
    close();
    finalized_ = true;
    QL_REQUIRE(i_ == columnTypes_.size() || i_ == 0, "csv report is finalized with incomplete row, got data for "
                                                         << i_ << " columns out of " << columnTypes_.size());
    LOG("CSV file report '" << filename_ << "' closed, " << rows_ << " rows written.");
}

string CSVFileReport::format(const ReportType& rt, Size i) const {
    return boost::apply_visitor(CellFormatter(columnPrecision_[i], quoteChar_, nullString_), rt);
}

void CSVFileReport::write(const string& s) {
    if (std::fputs(s.c_str(), fp_) < 0)
        QL_FAIL("Error writing to CSV file report '" << filename_ << "'");
}

void CSVFileReport::close() {
    if (!fp_)
        return;
    if (int rc = std::fclose(fp_))
        ALOG("CSV file report '" << filename_ << "' can not be closed (return code " << rc << ")");
    fp_ = nullptr;
}

void CSVFileReport::checkIsOpen(const std::string& op) const {
    QL_REQUIRE(!finalized_ && fp_,
               "CSV file report '" << filename_ << "' is already finalized, can not process operation " << op);
}

} // namespace data
} // namespace sre
