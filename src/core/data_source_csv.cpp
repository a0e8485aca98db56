#include "data_source_csv.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace trade_sim {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::string token;
    std::istringstream ss(line);
    while (std::getline(ss, token, ',')) {
        token.erase(std::remove(token.begin(), token.end(), '\r'), token.end());
        // trim surrounding whitespace and quotes
        auto first = token.find_first_not_of(" \t\"");
        auto last = token.find_last_not_of(" \t\"");
        out.push_back(first == std::string::npos ? std::string{} : token.substr(first, last - first + 1));
    }
    if (!line.empty() && line.back() == ',') out.emplace_back();
    return out;
}

std::optional<double> parse_optional_double(const std::vector<std::string>& row,
                                            const std::unordered_map<std::string, size_t>& cols,
                                            const std::string& name) {
    auto it = cols.find(name);
    if (it == cols.end() || it->second >= row.size() || row[it->second].empty()) {
        return std::nullopt;
    }
    double v = std::stod(row[it->second]);
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

} // namespace

size_t CsvDataSource::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open CSV file " + path);
    }
    std::string line;
    if (!std::getline(f, line)) {
        spdlog::warn("CsvDataSource: {} is empty", path);
        return 0;
    }
    auto header = split_csv_line(line);
    std::unordered_map<std::string, size_t> cols;
    for (size_t i = 0; i < header.size(); ++i) cols[header[i]] = i;
    for (const char* required : {"symbol", "date", "open", "high", "low", "close", "volume"}) {
        if (cols.find(required) == cols.end()) {
            throw std::runtime_error("CSV file " + path + " lacks column " + required);
        }
    }

    size_t loaded = 0;
    size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto row = split_csv_line(line);
        if (row.size() < header.size()) {
            spdlog::warn("CsvDataSource: {}:{} has {} fields, expected {}", path, line_no, row.size(), header.size());
            ++skipped_rows_;
            continue;
        }
        try {
            MarketBar bar;
            bar.symbol = row[cols["symbol"]];
            auto date = utils::parse_date(row[cols["date"]]);
            if (bar.symbol.empty() || !date) {
                throw std::invalid_argument("bad symbol or date");
            }
            bar.date = *date;
            bar.open = std::stod(row[cols["open"]]);
            bar.high = std::stod(row[cols["high"]]);
            bar.low = std::stod(row[cols["low"]]);
            bar.close = std::stod(row[cols["close"]]);
            double volume = std::stod(row[cols["volume"]]);
            bar.amount = parse_optional_double(row, cols, "amount");
            bar.pct_change = parse_optional_double(row, cols, "pct_change");
            for (double v : {bar.open, bar.high, bar.low, bar.close, volume}) {
                if (!std::isfinite(v)) {
                    throw std::invalid_argument("non-finite price or volume");
                }
            }
            if (bar.close <= 0.0) {
                throw std::invalid_argument("non-positive close");
            }
            bar.volume = static_cast<int64_t>(volume);
            add_bar(bar);
            auto name_it = cols.find("name");
            if (name_it != cols.end() && !row[name_it->second].empty()) {
                set_instrument_name(bar.symbol, row[name_it->second]);
            }
            ++loaded;
        } catch (const std::exception& e) {
            spdlog::warn("CsvDataSource: skipping {}:{} ({})", path, line_no, e.what());
            ++skipped_rows_;
        }
    }
    spdlog::info("CsvDataSource: loaded {} bars from {}", loaded, path);
    return loaded;
}

size_t CsvDataSource::load_directory(const std::string& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".csv") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    size_t total = 0;
    for (const auto& p : files) {
        total += load_file(p.string());
    }
    if (files.empty()) {
        spdlog::warn("CsvDataSource: no CSV files found in {}", dir);
    }
    return total;
}

} // namespace trade_sim
