/*
RESULT LOG
- one csv row per scoring attempt: request id, attempt, verdict, separation, ranking
- file is opened lazily on the first row (no empty csv for runs that never rank)
- controller thread only
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include "../scoring/ScoreAggregator.hpp"

class ResultLog_C {
public:
    explicit ResultLog_C(std::filesystem::path csvPath);

    // false if the file could not be opened (row is dropped, already logged)
    bool append(std::uint64_t requestId, std::size_t attempt, const ScoreResult_S& scored);

    std::size_t get_rows_written() const { return rows_written_; }
    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream csv_;
    bool csv_opened_ = false;
    std::size_t rows_written_ = 0;

    bool ensure_csv_open();
};
