/*
TRIAL CONTROLLER : owns at most ONE live Trial
- new request -> validate, refuse while a trial is in flight (busy), build sequence + Trial, arm timer
- timer fire -> Trial::advance() -> re-arm with the returned wait (0 = stop)
- trial COMPLETED -> score the block: accepted = report + release, rejected = reset the same Trial and replay
  (capped by maxRetries, then "not converged")
- abort -> report aborted + release
Single-threaded: only the thread that polls it may call into it.
*/

#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <utility>
#include "../utils/Types.h"
#include "../utils/SWTimer.hpp"
#include "Trial.hpp"
#include "IStimulusRenderer.h"
#include "../acq/ISignalCollector.h"
#include "../acq/SyntheticSampleSource.h"
#include "../scoring/ScoreAggregator.hpp"

class TrialController_C {
public:
    using OutcomeCallback_T = std::function<void(const RankOutcome_S&)>;
    // every scoring pass, accepted or not (attempt is 1-based)
    using AttemptCallback_T = std::function<void(std::uint64_t requestId, std::size_t attempt, const ScoreResult_S&)>;

    struct controllerConfigs_S {
        std::size_t maxRetries = DEFAULT_MAX_RETRIES;
        unsigned int seed = 0; // 0 = seed from std::random_device
    };

    // collector == nullptr -> samples come from synth (simulation mode)
    TrialController_C(IStimulusRenderer_S* renderer, ISignalCollector_S* collector,
                      SyntheticSampleSource_C* synth, const controllerConfigs_S& configs);

    static RequestStatus_E validate_request(const RankRequest_S& request);

    RequestStatus_E submit_request(const RankRequest_S& request, std::uint64_t requestId);
    bool poll();            // fires the trial if its timer expired; true if it did
    void on_timer_fired();  // one timer tick (also used by tests to skip real time)
    void abort();           // cancel the live trial, if any

    void set_outcome_callback(OutcomeCallback_T cb) { onOutcome_ = std::move(cb); }
    void set_attempt_callback(AttemptCallback_T cb) { onAttempt_ = std::move(cb); }

    bool is_busy() const { return trial_ != nullptr; }
    bool is_simulated() const { return collector_ == nullptr; }
    const Trial_C* get_trial() const { return trial_.get(); }
    ms_T get_pending_wait() const { return timer_.period(); }
    bool is_timer_armed() const { return timer_.is_armed(); }
    std::size_t get_attempts() const { return attempts_; }
    std::uint64_t get_request_id() const { return requestId_; } // meaningful while busy

private:
    IStimulusRenderer_S* renderer_{ nullptr };
    ISignalCollector_S* collector_{ nullptr };
    SyntheticSampleSource_C* synth_{ nullptr };
    controllerConfigs_S configs_{};
    std::mt19937 rng_;

    std::unique_ptr<Trial_C> trial_;
    SW_Timer_C timer_;
    std::uint64_t requestId_ = 0;
    std::size_t attempts_ = 0;

    OutcomeCallback_T onOutcome_;
    AttemptCallback_T onAttempt_;

    void handle_completed();
    std::vector<FlashSample_S> collect_block_samples();
    void finish(RankStatus_E status, const RankedResult_S& result);
};
