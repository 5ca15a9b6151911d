#pragma once
#include <cstddef>
#include <vector>
#include "../utils/Types.h"

// THIS TURNS ONE BLOCK OF PER-FLASH SAMPLES INTO A RANKING
// (1) group samples per option through order[flashIndex - 1]
// (2) rank options by the mean of their two strongest responses
// (3) confidence = z(option mean) * share of "hit" flashes, z against the whole block
// (4) accept only if the top confidence stands MIN_SEPARATION stds away from the rest
//     -> otherwise the caller replays the same trial

// per-option bucket, rebuilt on every scoring pass
struct OptionResult_S {
    OptionIdx_T idx = 0;
    int optionId = 0;
    std::size_t expectedCount = 0; // repeat count from the plan
    std::vector<double> signalValues;
    std::vector<double> rankPositions;

    double average_signal() const;
    double stdev_signal() const;
    double average_rank_position() const;
    double stdev_rank_position() const;
    double avg_best_two() const; // -inf when no samples, so empty options sort last
};

struct ScoreResult_S {
    ScoreVerdict_E verdict = ScoreVerdict_Rejected;
    RankedResult_S ranked{};       // filled on both verdicts (logged on rejection)
    double separation = 0.0;       // |best - mean(rest)| / std(rest)
    double overallMedian = 0.0;
    double overallStd = 0.0;
    std::size_t usedSamples = 0;
    std::size_t droppedSamples = 0; // flash index outside the order
};

class ScoreAggregator_C {
public:
    // optionIds[idx] is the id reported for option idx
    static ScoreResult_S score(const PresentationOrder_T& order, const RepeatPlan_T& repeatPlan,
                               const std::vector<int>& optionIds,
                               const std::vector<FlashSample_S>& samples);

    static std::vector<OptionResult_S> group_by_option(const PresentationOrder_T& order,
                                                       const RepeatPlan_T& repeatPlan,
                                                       const std::vector<int>& optionIds,
                                                       const std::vector<FlashSample_S>& samples,
                                                       std::size_t* dropped = nullptr);
};

// ========================= STATS HELPERS =====================
namespace stats {
    double mean(const std::vector<double>& v);
    double pstdev(const std::vector<double>& v); // population std (divide by n)
    double median(std::vector<double> v);
}
