#include "TrialController.hpp"
#include <set>
#include <utility>
#include "SequenceBuilder.hpp"
#include "../utils/Logger.hpp"

TrialController_C::TrialController_C(IStimulusRenderer_S* renderer, ISignalCollector_S* collector,
                                     SyntheticSampleSource_C* synth, const controllerConfigs_S& configs)
    : renderer_(renderer), collector_(collector), synth_(synth), configs_(configs),
      rng_(configs.seed != 0 ? configs.seed : std::random_device{}()) {
    if (renderer_) renderer_->show_idle(is_simulated());
}

RequestStatus_E TrialController_C::validate_request(const RankRequest_S& request) {
    if (request.options.empty() || request.options.size() > MAX_OPTIONS_PER_REQUEST) {
        return RequestStatus_Malformed;
    }
    if (request.minRepeat > MAX_REPEAT_LIMIT || request.maxRepeat > MAX_REPEAT_LIMIT) {
        return RequestStatus_Malformed;
    }
    if (request.timing.preview_ms <= ms_T{ 0 } || request.timing.flash_ms <= ms_T{ 0 }) {
        // a 0 wait would disarm the timer and stall the trial
        return RequestStatus_Malformed;
    }
    std::set<int> ids;
    for (const auto& opt : request.options) {
        if (!ids.insert(opt.id).second) {
            return RequestStatus_Malformed; // duplicate id -> ranking would be ambiguous
        }
    }
    return RequestStatus_Accepted;
}

RequestStatus_E TrialController_C::submit_request(const RankRequest_S& request, std::uint64_t requestId) {
    if (trial_ && !trial_->is_terminal()) {
        LOG_ALWAYS("TC: request " << requestId << " refused, trial " << requestId_ << " in flight");
        return RequestStatus_Busy;
    }
    if (validate_request(request) == RequestStatus_Malformed) {
        LOG_WARN("TC: request " << requestId << " malformed (" << request.options.size() << " options)");
        return RequestStatus_Malformed;
    }

    // clean slate like a fresh start
    trial_.reset();
    timer_.disarm();
    if (collector_ && collector_->in_block()) {
        collector_->end_collection_block();
    }

    SequencePlan_S plan = SequenceBuilder_C::build(request.options.size(), request.minRepeat,
                                                   request.maxRepeat, rng_);
    LOG_ALWAYS("TC: request " << requestId << " accepted: " << request.options.size()
               << " options, " << plan.order.size() << " flashes");

    trial_ = std::make_unique<Trial_C>(request.options, std::move(plan), request.timing, renderer_, collector_);
    requestId_ = requestId;
    attempts_ = 0;

    timer_.arm(trial_->advance()); // INIT -> PREVIEW
    return RequestStatus_Accepted;
}

bool TrialController_C::poll() {
    if (!timer_.check_timer_expired()) {
        return false;
    }
    on_timer_fired();
    return true;
}

void TrialController_C::on_timer_fired() {
    if (!trial_) {
        timer_.disarm();
        return;
    }
    const ms_T wait = trial_->advance();
    if (trial_->get_state() == TrialState_Completed) {
        timer_.disarm();
        handle_completed();
        return;
    }
    timer_.arm(wait);
}

void TrialController_C::abort() {
    if (!trial_) {
        LOG_DBG("TC: abort with no live trial ignored");
        return;
    }
    trial_->abort();
    finish(RankStatus_Aborted, RankedResult_S{});
    if (renderer_) renderer_->show_idle(is_simulated());
}

std::vector<FlashSample_S> TrialController_C::collect_block_samples() {
    if (collector_) {
        return collector_->get_block_samples();
    }
    if (synth_) {
        return synth_->random_block(trial_->get_order(), trial_->get_repeat_plan());
    }
    LOG_WARN("TC: no signal collector and no synthetic source, scoring an empty block");
    return {};
}

void TrialController_C::handle_completed() {
    attempts_++;
    const std::vector<FlashSample_S> samples = collect_block_samples();

    std::vector<int> optionIds;
    optionIds.reserve(trial_->get_options().size());
    for (const auto& opt : trial_->get_options()) {
        optionIds.push_back(opt.id);
    }

    const ScoreResult_S scored = ScoreAggregator_C::score(trial_->get_order(), trial_->get_repeat_plan(),
                                                          optionIds, samples);
    if (onAttempt_) onAttempt_(requestId_, attempts_, scored);

    if (scored.verdict == ScoreVerdict_Accepted) {
        LOG_ALWAYS("TC: request " << requestId_ << " ranked after " << attempts_ << " attempt(s), best id="
                   << scored.ranked.optionIds.front());
        if (renderer_) {
            for (const auto& opt : trial_->get_options()) {
                if (opt.id == scored.ranked.optionIds.front()) {
                    renderer_->show_result(opt, scored.ranked.confidences.front());
                    break;
                }
            }
        }
        finish(RankStatus_Succeeded, scored.ranked);
        return;
    }

    // attempts_ counts the first run too
    if (attempts_ > configs_.maxRetries) {
        LOG_WARN("TC: request " << requestId_ << " did not converge after " << attempts_ << " attempts");
        finish(RankStatus_NotConverged, RankedResult_S{});
        if (renderer_) renderer_->show_idle(is_simulated());
        return;
    }

    LOG_ALWAYS("TC: trial insufficient, rescheduling (retry " << attempts_ << "/" << configs_.maxRetries << ")");
    // same order, fresh samples: the collector drops the old block when RUNNING starts again
    timer_.arm(trial_->reset());
}

void TrialController_C::finish(RankStatus_E status, const RankedResult_S& result) {
    timer_.disarm();
    RankOutcome_S outcome{};
    outcome.requestId = requestId_;
    outcome.status = status;
    outcome.result = result;
    outcome.attempts = attempts_;

    // release before reporting so the callback sees an idle controller
    trial_.reset();
    attempts_ = 0;

    LOG_ALWAYS("TC: request " << outcome.requestId << " " << RankStatusToStr(status));
    if (onOutcome_) onOutcome_(outcome);
}
