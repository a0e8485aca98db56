#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

namespace trade_sim {

/**
 * Append-only JSON-lines log of a run (fills, rejections, day closes).
 * Rolls over to "<path>.N" once a file reaches max_bytes.
 */
class RunJournal {
public:
    explicit RunJournal(const std::string& path, size_t max_bytes = 50 * 1024 * 1024)
        : base_path_(path), max_bytes_(max_bytes) {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        open_stream(base_path_);
    }

    void append(const nlohmann::json& j) {
        if (!stream_.is_open()) return;
        std::string line = j.dump();
        stream_ << line << "\n";
        stream_.flush();
        current_size_ += line.size() + 1;
        ++entries_;
        if (current_size_ >= max_bytes_) {
            rotate();
        }
    }

    bool is_open() const { return stream_.is_open(); }
    size_t entries() const { return entries_; }

private:
    void open_stream(const std::string& p) {
        stream_.open(p, std::ios::out | std::ios::trunc);
        current_size_ = 0;
    }

    void rotate() {
        stream_.close();
        ++roll_idx_;
        open_stream(base_path_ + "." + std::to_string(roll_idx_));
    }

    std::string base_path_;
    size_t max_bytes_;
    size_t current_size_{0};
    size_t roll_idx_{0};
    size_t entries_{0};
    std::ofstream stream_;
};

} // namespace trade_sim
