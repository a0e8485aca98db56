#pragma once

#include <string>
#include "data_source_memory.hpp"

namespace trade_sim {

/**
 * Loads daily bars from CSV files into memory.
 *
 * Expected header (any column order, extra columns ignored):
 *   symbol,date,open,high,low,close,volume[,amount][,pct_change][,name]
 * Dates are "YYYY-MM-DD". Rows that fail to parse are skipped with a warning.
 */
class CsvDataSource : public InMemoryDataSource {
public:
    // Returns the number of bars loaded from the file; throws
    // std::runtime_error if the file cannot be opened or lacks a required column.
    size_t load_file(const std::string& path);

    // Loads every *.csv file in the directory, sorted by file name.
    size_t load_directory(const std::string& dir);

    size_t skipped_rows() const { return skipped_rows_; }

private:
    size_t skipped_rows_{0};
};

} // namespace trade_sim
