/*
==============================================================================
	File: IStimulusRenderer.h
	Desc: Abstract display surface the Trial/TrialController draw through.
	The core never touches pixels: implementations decide what "show" means
	(publish to the StateStore for the browser page, record calls in tests...).
==============================================================================
*/

#pragma once
#include <cstddef>
#include <vector>
#include "../utils/Types.h"

struct IStimulusRenderer_S {
	virtual ~IStimulusRenderer_S() = default;
	// grid of every option before the first flash
	virtual void show_preview(const std::vector<Option_S>& options) = 0;
	// one flash; flashIndex is 1-based within the RUNNING phase
	virtual void show_flash(std::size_t flashIndex, const Option_S& option) = 0;
	// winning option after an accepted trial
	virtual void show_result(const Option_S& best, double confidence) = 0;
	// nothing running; simulated tells the operator no live signal is attached
	virtual void show_idle(bool simulated) = 0;
}; // IStimulusRenderer_S
