/*
TRIAL : one presentation run (STATE MACHINE - INIT -> PREVIEW -> RUNNING -> COMPLETED/ABORTED)
- owns the option list + the order built by SequenceBuilder (never rebuilt on retry)
- advance() is the only way forward; it returns how long the current screen should stay up
  (0 = nothing more to show, caller stops its timer)
- marks every flash on the signal collector before returning so samples line up with flash indices
*/

#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "../utils/Types.h"
#include "IStimulusRenderer.h"
#include "../acq/ISignalCollector.h"

class Trial_C {
public:
	// renderer/collector may be null (headless runs, synthetic samples)
	// throws std::invalid_argument if the plan doesn't fit the option list
	Trial_C(std::vector<Option_S> options, SequencePlan_S plan, TrialTiming_S timing,
	        IStimulusRenderer_S* renderer, ISignalCollector_S* collector);

	// one timer tick: INIT->PREVIEW->RUNNING...->COMPLETED
	ms_T advance();
	// COMPLETED/INIT -> INIT, same order; returns preview wait (0 if refused)
	ms_T reset();
	// any non-terminal state -> ABORTED; no-op otherwise
	void abort();

	TrialState_E get_state() const { return state_; }
	bool is_terminal() const { return state_ == TrialState_Completed || state_ == TrialState_Aborted; }
	const PresentationOrder_T& get_order() const { return plan_.order; }
	const RepeatPlan_T& get_repeat_plan() const { return plan_.repeatPlan; }
	const std::vector<Option_S>& get_options() const { return options_; }
	const TrialTiming_S& get_timing() const { return timing_; }
	std::size_t get_cursor() const { return cursor_; }
	std::size_t get_flash_index() const { return flashIndex_; } // last flash shown, 0 if none yet
	std::size_t get_reset_count() const { return resetCount_; }

private:
	std::vector<Option_S> options_;
	SequencePlan_S plan_;
	TrialTiming_S timing_;
	IStimulusRenderer_S* renderer_{ nullptr };
	ISignalCollector_S* collector_{ nullptr };

	TrialState_E state_ = TrialState_Init;
	TrialState_E prevState_ = TrialState_Init;
	std::size_t cursor_ = 0;
	std::size_t flashIndex_ = 0;
	std::size_t resetCount_ = 0;

	std::optional<ms_T> processEvent(TrialEvent_E ev); // nullopt = no transition for (state, ev)
	ms_T onStateEnter(TrialState_E prevState, TrialState_E newState);
	void onStateExit(TrialState_E state, TrialEvent_E ev);
	ms_T emit_flash();
}; // Trial_C
