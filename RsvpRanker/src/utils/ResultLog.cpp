#include "ResultLog.hpp"
#include <utility>
#include "Logger.hpp"

ResultLog_C::ResultLog_C(std::filesystem::path csvPath) : path_(std::move(csvPath)) {
}

bool ResultLog_C::ensure_csv_open() {
    if (csv_opened_) return true;
    csv_.open(path_.string(), std::ios::out | std::ios::trunc);
    if (!csv_.is_open()) {
        LOG_ERR("failed to open " << path_.string());
        return false;
    }
    csv_ << "request_id,attempt,verdict,separation,used_samples,dropped_samples,ranked_ids,confidences\n";
    csv_opened_ = true;
    LOG_ALWAYS("opened " << path_.string());
    return true;
}

bool ResultLog_C::append(std::uint64_t requestId, std::size_t attempt, const ScoreResult_S& scored) {
    if (!ensure_csv_open()) return false;

    csv_ << requestId
         << "," << attempt
         << "," << (scored.verdict == ScoreVerdict_Accepted ? "accepted" : "rejected")
         << "," << scored.separation
         << "," << scored.usedSamples
         << "," << scored.droppedSamples
         << ",";
    // ';' inside the list fields so the row stays 8 columns
    for (std::size_t i = 0; i < scored.ranked.optionIds.size(); ++i) {
        if (i) csv_ << ";";
        csv_ << scored.ranked.optionIds[i];
    }
    csv_ << ",";
    for (std::size_t i = 0; i < scored.ranked.confidences.size(); ++i) {
        if (i) csv_ << ";";
        csv_ << scored.ranked.confidences[i];
    }
    csv_ << "\n";
    csv_.flush();
    rows_written_++;
    return true;
}
