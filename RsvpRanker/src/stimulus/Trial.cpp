#include "Trial.hpp"
#include <stdexcept>
#include <utility>
#include "../utils/Logger.hpp"

namespace {

struct state_transition {
    TrialState_E from;
    TrialEvent_E event;
    TrialState_E to;
};

const state_transition state_transition_table[] = {
    // from                   event                           to
    {TrialState_Init,      TrialEvent_Tick,              TrialState_Preview},
    {TrialState_Preview,   TrialEvent_Tick,              TrialState_Running},
    {TrialState_Running,   TrialEvent_Tick,              TrialState_Running},
    {TrialState_Running,   TrialEvent_SequenceExhausted, TrialState_Completed},

    {TrialState_Completed, TrialEvent_Reset,             TrialState_Init},
    {TrialState_Init,      TrialEvent_Reset,             TrialState_Init},

    {TrialState_Init,      TrialEvent_Abort,             TrialState_Aborted},
    {TrialState_Preview,   TrialEvent_Abort,             TrialState_Aborted},
    {TrialState_Running,   TrialEvent_Abort,             TrialState_Aborted},
};

} // namespace

Trial_C::Trial_C(std::vector<Option_S> options, SequencePlan_S plan, TrialTiming_S timing,
                 IStimulusRenderer_S* renderer, ISignalCollector_S* collector)
    : options_(std::move(options)), plan_(std::move(plan)), timing_(timing),
      renderer_(renderer), collector_(collector) {
    if (plan_.order.empty()) {
        throw std::invalid_argument("Trial: empty presentation order");
    }
    if (plan_.repeatPlan.size() != options_.size()) {
        throw std::invalid_argument("Trial: repeat plan does not match option count");
    }
    for (OptionIdx_T idx : plan_.order) {
        if (idx >= options_.size()) {
            throw std::invalid_argument("Trial: order references unknown option");
        }
    }
}

ms_T Trial_C::advance() {
    TrialEvent_E ev = TrialEvent_Tick;
    if (state_ == TrialState_Running && cursor_ + 1 >= plan_.order.size()) {
        ev = TrialEvent_SequenceExhausted;
    }
    // COMPLETED/ABORTED have no tick entry -> 0
    return processEvent(ev).value_or(ms_T{ 0 });
}

ms_T Trial_C::reset() {
    std::optional<ms_T> wait = processEvent(TrialEvent_Reset);
    if (!wait.has_value()) {
        LOG_WARN("Trial: reset refused in state " << TrialStateToStr(state_));
        return ms_T{ 0 };
    }
    resetCount_++;
    return *wait;
}

void Trial_C::abort() {
    if (is_terminal()) return;
    processEvent(TrialEvent_Abort);
}

std::optional<ms_T> Trial_C::processEvent(TrialEvent_E ev) {
    for (const auto& t : state_transition_table) {
        if (state_ == t.from && ev == t.event) {
            // match found
            onStateExit(state_, ev);
            prevState_ = state_;
            state_ = t.to;
            if (prevState_ != state_) {
                LOG_DBG("Trial: " << TrialStateToStr(prevState_) << " -> " << TrialStateToStr(state_));
            }
            return onStateEnter(prevState_, state_);
        }
    }
    return std::nullopt;
}

void Trial_C::onStateExit(TrialState_E state, TrialEvent_E ev) {
    switch (state) {
        case TrialState_Running:
            // leaving the flash phase for good (not RUNNING -> RUNNING)
            if (ev == TrialEvent_SequenceExhausted || ev == TrialEvent_Abort) {
                if (collector_ && collector_->in_block()) {
                    collector_->end_collection_block();
                }
            }
            break;
        default:
            break;
    }
}

ms_T Trial_C::onStateEnter(TrialState_E prevState, TrialState_E newState) {
    switch (newState) {
        case TrialState_Preview: {
            if (renderer_) renderer_->show_preview(options_);
            return timing_.preview_ms;
        }

        case TrialState_Running: {
            if (prevState == TrialState_Preview) {
                cursor_ = 0;
                flashIndex_ = 0;
                // fresh block: drops samples of a rejected attempt
                if (collector_) collector_->begin_collection_block();
            } else {
                cursor_++;
            }
            return emit_flash();
        }

        case TrialState_Completed: {
            cursor_++; // one past the end
            LOG_ALWAYS("Trial: completed after " << flashIndex_ << " flashes");
            return ms_T{ 0 };
        }

        case TrialState_Init: {
            // structural data (options, order, repeat plan) stays as is
            cursor_ = 0;
            flashIndex_ = 0;
            return timing_.preview_ms;
        }

        case TrialState_Aborted: {
            LOG_ALWAYS("Trial: aborted from " << TrialStateToStr(prevState)
                       << " at flash " << flashIndex_ << "/" << plan_.order.size());
            return ms_T{ 0 };
        }

        default:
            return ms_T{ 0 };
    }
}

ms_T Trial_C::emit_flash() {
    flashIndex_++;
    const Option_S& option = options_[plan_.order[cursor_]];
    // mark before the flash is up so the next score lands on this index
    if (collector_) collector_->begin_flash(flashIndex_);
    if (renderer_) renderer_->show_flash(flashIndex_, option);
    LOG_DBG("Trial: flash " << flashIndex_ << " option id=" << option.id);
    return timing_.flash_ms;
}
