/*
==============================================================================
	File: Types.h
	Desc: Common type definitions between modules.
	This header is used by:
  - SequenceBuilder / Trial (stimulus): presentation order + trial states.
  - Signal collectors (acq): per-flash samples handed to scoring.
  - ScoreAggregator (scoring): ranked result + verdict.
  - TrialController / HttpServer: request + outcome types.

==============================================================================
*/

#pragma once
#include <cstdint>
#include <vector>
#include <cstddef>
#include <string>
#include <chrono>

// _T for type
// Use steady clock for time measurements (monotonic, not affected by system clock changes)
using clock_T = std::chrono::steady_clock;
using ms_T = std::chrono::milliseconds;
using time_point_T = std::chrono::time_point<clock_T>;

/* START CONFIGS */

// PRESENTATION POLICY
inline constexpr int PRESENTATION_FREQUENCY_HZ = 4; // flashes per second
inline constexpr int DEFAULT_FLASH_MS = (1000 + PRESENTATION_FREQUENCY_HZ / 2) / PRESENTATION_FREQUENCY_HZ; // 250ms @ 4Hz
inline constexpr int DEFAULT_PREVIEW_MS = 5000; // grid of all options before the first flash
inline constexpr std::size_t DEFAULT_MIN_REPEAT = 3;
inline constexpr std::size_t DEFAULT_MAX_REPEAT = 7;
inline constexpr std::size_t MAX_REPEAT_LIMIT = 50;          // per option, caps a request's block length
inline constexpr std::size_t MAX_OPTIONS_PER_REQUEST = 256;

// SCORING POLICY
inline constexpr double Z_CORRECT_THRESHOLD = 0.5;  // |z| above this counts a flash as a "hit"
inline constexpr double MIN_SEPARATION = 2.0;       // best vs rest, in std of the rest
inline constexpr std::size_t DEFAULT_MAX_RETRIES = 5; // rejected trials replayed before giving up

// RUNTIME
inline constexpr int DEFAULT_HTTP_PORT = 7777;
inline constexpr int CONTROLLER_POLL_MS = 2;

/* END CONFIGS */

/* START ENUMS */

enum TrialState_E {
	TrialState_Init,
	TrialState_Preview,
	TrialState_Running,
	TrialState_Completed,
	TrialState_Aborted,
}; // TrialState_E

enum TrialEvent_E {
	TrialEvent_Tick,             // timer fired, sequence not exhausted
	TrialEvent_SequenceExhausted, // timer fired on the last flash
	TrialEvent_Reset,
	TrialEvent_Abort,
	TrialEvent_None,
}; // TrialEvent_E

enum ScoreVerdict_E {
	ScoreVerdict_Accepted,
	ScoreVerdict_Rejected,
}; // ScoreVerdict_E

// answer to a new ranking request (immediate)
enum RequestStatus_E {
	RequestStatus_Accepted,
	RequestStatus_Busy,
	RequestStatus_Malformed,
}; // RequestStatus_E

// terminal outcome of an accepted request
enum RankStatus_E {
	RankStatus_None,
	RankStatus_Succeeded,
	RankStatus_Aborted,
	RankStatus_NotConverged,
	RankStatus_Declined, // picked up from the request slot but refused by the controller
}; // RankStatus_E

// what the display surface should currently show
enum DisplayMode_E {
	DisplayMode_Idle,
	DisplayMode_Preview,
	DisplayMode_Flash,
	DisplayMode_Result,
}; // DisplayMode_E

/* END ENUMS */

/* START HELPERS */

inline const char* TrialStateToStr(TrialState_E s) {
	switch (s) {
		case TrialState_Init:      return "INIT";
		case TrialState_Preview:   return "PREVIEW";
		case TrialState_Running:   return "RUNNING";
		case TrialState_Completed: return "COMPLETED";
		case TrialState_Aborted:   return "ABORTED";
		default:                   return "?";
	}
}

inline const char* RankStatusToStr(RankStatus_E s) {
	switch (s) {
		case RankStatus_Succeeded:    return "succeeded";
		case RankStatus_Aborted:      return "aborted";
		case RankStatus_NotConverged: return "not_converged";
		case RankStatus_Declined:     return "declined";
		case RankStatus_None:
		default:                      return "none";
	}
}

/* END HELPERS */

/* START STRUCTS */

// index into the option list of the current trial (NOT the option id)
using OptionIdx_T = std::size_t;
// repeatPlan[idx] = number of flashes of option idx
using RepeatPlan_T = std::vector<std::size_t>;
using PresentationOrder_T = std::vector<OptionIdx_T>;

/*
* Option_S: one candidate being ranked. stimulus is opaque to the core
* (image path / url the display surface knows how to draw).
*/
struct Option_S {
	int id = 0;
	std::string stimulus;
}; // Option_S

struct TrialTiming_S {
	ms_T preview_ms{ DEFAULT_PREVIEW_MS };
	ms_T flash_ms{ DEFAULT_FLASH_MS };
}; // TrialTiming_S

struct SequencePlan_S {
	PresentationOrder_T order;
	RepeatPlan_T repeatPlan;
}; // SequencePlan_S

/*
* FlashSample_S: one classifier observation attributed to exactly one flash.
* flashIndex is 1-based and matches emission order inside the RUNNING phase.
*/
struct FlashSample_S {
	std::size_t flashIndex = 0;
	double signalValue = 0.0;
	double rankPosition = 0.0;
}; // FlashSample_S

struct RankedResult_S {
	std::vector<int> optionIds;    // best first
	std::vector<double> confidences; // aligned with optionIds
}; // RankedResult_S

struct RankRequest_S {
	std::vector<Option_S> options;
	TrialTiming_S timing{};
	std::size_t minRepeat = DEFAULT_MIN_REPEAT;
	std::size_t maxRepeat = DEFAULT_MAX_REPEAT;
}; // RankRequest_S

struct RankOutcome_S {
	std::uint64_t requestId = 0;
	RankStatus_E status = RankStatus_None;
	RankedResult_S result{}; // only filled on RankStatus_Succeeded
	std::size_t attempts = 0; // scoring passes run for this request
}; // RankOutcome_S

/* END STRUCTS */
