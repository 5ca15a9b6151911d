#pragma once
#include <chrono>

/*
* One-shot software timer polled by the controller loop.
* arm(0ms) disarms, so a Trial's "wait 0" can be fed straight in.
*/
class SW_Timer_C {

public:
	using clock_t = std::chrono::steady_clock;
	using dur_t = std::chrono::milliseconds;
	using timepoint_t = clock_t::time_point;

	void arm(dur_t timer_dur) {
		if (timer_dur <= dur_t{ 0 }) {
			disarm();
			return;
		}
		armed_at_ = clock_t::now();
		until_ = armed_at_ + timer_dur;
		period_ = timer_dur;
		armed_ = true;
	}

	// stop & return elapsed time in ms
	dur_t disarm() {
		auto elapsed = elapsed_ms();
		armed_ = false;
		period_ = dur_t{ 0 };
		return elapsed;
	}

	// elapsed ms since arm (0ms if not armed)
	dur_t elapsed_ms() const {
		if (!armed_) {
			return dur_t{ 0 };
		}
		return std::chrono::duration_cast<dur_t>(clock_t::now() - armed_at_);
	}

	bool check_timer_expired() const {
		return armed_ && clock_t::now() >= until_;
	}

	bool is_armed() const { return armed_; }

	// last armed duration (0 when disarmed)
	dur_t period() const { return period_; }

private:
	bool armed_ = false;
	dur_t period_{ 0 };
	timepoint_t until_{};
	timepoint_t armed_at_{};
};
