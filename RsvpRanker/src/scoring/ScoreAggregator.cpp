#include "ScoreAggregator.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include "../utils/Logger.hpp"

// ========================= STATS HELPERS =====================
double stats::mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double stats::pstdev(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const double m = mean(v);
    double ss = 0.0;
    for (double x : v) {
        ss += (x - m) * (x - m);
    }
    return std::sqrt(ss / static_cast<double>(v.size()));
}

double stats::median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    const std::size_t n = v.size();
    const std::size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double med = v[mid];
    if ((n % 2) == 0) {
        std::nth_element(v.begin(), v.begin() + (mid - 1), v.end());
        med = 0.5 * (med + v[mid - 1]);
    }
    return med;
}

// ========================= OPTION RESULT =====================
double OptionResult_S::average_signal() const { return stats::mean(signalValues); }
double OptionResult_S::stdev_signal() const { return stats::pstdev(signalValues); }
double OptionResult_S::average_rank_position() const { return stats::mean(rankPositions); }
double OptionResult_S::stdev_rank_position() const { return stats::pstdev(rankPositions); }

double OptionResult_S::avg_best_two() const {
    if (signalValues.empty()) return -std::numeric_limits<double>::infinity();
    if (signalValues.size() == 1) return signalValues.front();
    std::vector<double> top2(2);
    std::partial_sort_copy(signalValues.begin(), signalValues.end(), top2.begin(), top2.end(),
                           std::greater<double>());
    return 0.5 * (top2[0] + top2[1]);
}

// ========================= AGGREGATOR ================================
std::vector<OptionResult_S> ScoreAggregator_C::group_by_option(const PresentationOrder_T& order,
                                                               const RepeatPlan_T& repeatPlan,
                                                               const std::vector<int>& optionIds,
                                                               const std::vector<FlashSample_S>& samples,
                                                               std::size_t* dropped) {
    if (optionIds.size() != repeatPlan.size()) {
        throw std::invalid_argument("ScoreAggregator: option ids do not match repeat plan");
    }
    std::vector<OptionResult_S> results(repeatPlan.size());
    for (OptionIdx_T idx = 0; idx < results.size(); ++idx) {
        results[idx].idx = idx;
        results[idx].optionId = optionIds[idx];
        results[idx].expectedCount = repeatPlan[idx];
    }

    std::size_t numDropped = 0;
    for (const auto& s : samples) {
        if (s.flashIndex == 0 || s.flashIndex > order.size() || order[s.flashIndex - 1] >= results.size()) {
            numDropped++;
            continue;
        }
        OptionResult_S& r = results[order[s.flashIndex - 1]];
        r.signalValues.push_back(s.signalValue);
        r.rankPositions.push_back(s.rankPosition);
    }
    if (dropped) *dropped = numDropped;
    return results;
}

ScoreResult_S ScoreAggregator_C::score(const PresentationOrder_T& order, const RepeatPlan_T& repeatPlan,
                                       const std::vector<int>& optionIds,
                                       const std::vector<FlashSample_S>& samples) {
    ScoreResult_S out{};
    std::vector<OptionResult_S> options = group_by_option(order, repeatPlan, optionIds, samples, &out.droppedSamples);
    if (out.droppedSamples > 0) {
        LOG_WARN("SA: dropped " << out.droppedSamples << " samples with out-of-range flash index");
    }

    std::vector<double> allValues;
    allValues.reserve(samples.size());
    for (const auto& r : options) {
        allValues.insert(allValues.end(), r.signalValues.begin(), r.signalValues.end());
    }
    out.usedSamples = allValues.size();
    if (allValues.empty()) {
        LOG_WARN("SA: no samples in block -> rejected");
        return out;
    }

    // candidate ranking
    std::stable_sort(options.begin(), options.end(), [](const OptionResult_S& a, const OptionResult_S& b) {
        return a.avg_best_two() > b.avg_best_two();
    });
    for (const auto& r : options) {
        out.ranked.optionIds.push_back(r.optionId);
    }

    out.overallMedian = stats::median(allValues);
    out.overallStd = stats::pstdev(allValues);
    if (out.overallStd <= 0.0) {
        // flat signal: nothing tells the options apart
        out.ranked.confidences.assign(options.size(), 0.0);
        LOG_ALWAYS("SA: overall std is 0 -> rejected");
        return out;
    }

    const double med = out.overallMedian;
    const double sd = out.overallStd;
    auto z = [med, sd](double v) { return (med - v) / sd; };

    for (const auto& r : options) {
        double confidence = 0.0;
        if (!r.signalValues.empty() && r.expectedCount > 0) {
            std::size_t numCorrect = 0;
            for (double v : r.signalValues) {
                if (std::fabs(z(v)) > Z_CORRECT_THRESHOLD) numCorrect++;
            }
            const double percentageCorrect = static_cast<double>(numCorrect) / static_cast<double>(r.expectedCount);
            confidence = z(r.average_signal()) * percentageCorrect;
        }
        out.ranked.confidences.push_back(confidence);
        LOG_DBG("SA: option id=" << r.optionId << " n=" << r.signalValues.size() << "/" << r.expectedCount
                << " mean=" << r.average_signal() << " sd=" << r.stdev_signal() << " best2=" << r.avg_best_two()
                << " rank_pos=" << r.average_rank_position() << "+-" << r.stdev_rank_position()
                << " conf=" << confidence);
    }

    if (out.ranked.confidences.size() == 1) {
        // nothing to separate from
        out.separation = std::numeric_limits<double>::infinity();
        out.verdict = ScoreVerdict_Accepted;
        return out;
    }

    const double best = out.ranked.confidences.front();
    const std::vector<double> rest(out.ranked.confidences.begin() + 1, out.ranked.confidences.end());
    const double restMean = stats::mean(rest);
    const double restStd = stats::pstdev(rest);
    const double gap = std::fabs(best - restMean);
    if (restStd > 0.0) {
        out.separation = gap / restStd;
    } else {
        out.separation = (gap > 0.0) ? std::numeric_limits<double>::infinity() : 0.0;
    }

    out.verdict = (out.separation >= MIN_SEPARATION) ? ScoreVerdict_Accepted : ScoreVerdict_Rejected;

    std::ostringstream oss;
    for (std::size_t i = 0; i < out.ranked.optionIds.size(); ++i) {
        if (i) oss << ",";
        oss << out.ranked.optionIds[i] << ":" << out.ranked.confidences[i];
    }
    LOG_ALWAYS("SA: [" << oss.str() << "] best=" << best << " rest_mean=" << restMean
               << " rest_std=" << restStd << " separation=" << out.separation
               << (out.verdict == ScoreVerdict_Accepted ? " -> accepted" : " -> rejected"));
    return out;
}
