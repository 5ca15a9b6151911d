/*
==============================================================================
	File: BufferedSignalCollector.h
	Desc: Live signal collector. The external classifier pushes one score per
	flash (POST /sample); scores without a flash index are attributed to the
	oldest flash that hasn't received one yet, in begin_flash() order.

	NOTE: pushes come from the HTTP thread, flash marks from the controller
	thread -> everything is behind one mutex.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>
#include "ISignalCollector.h"

class BufferedSignalCollector_C : public ISignalCollector_S {
public:
	BufferedSignalCollector_C() = default;
	// should not be able to copy (owns a mutex)
	BufferedSignalCollector_C(const BufferedSignalCollector_C&) = delete;
	BufferedSignalCollector_C& operator=(const BufferedSignalCollector_C&) = delete;

	// ISignalCollector_S
	void begin_collection_block() override;
	void end_collection_block() override;
	bool in_block() const override;
	void begin_flash(std::size_t flashIndex) override;
	std::vector<FlashSample_S> get_block_samples() override;

	// Producer side. Returns false when the sample could not be attributed.
	bool push_sample(double signalValue, double rankPosition);
	bool push_labeled_sample(const FlashSample_S& sample); // caller already knows the flash index

	std::size_t get_dropped_count() const;
	std::size_t get_pending_flash_count() const;

private:
	mutable std::mutex mtx_;
	bool inBlock_ = false;
	std::size_t lastFlashIndex_ = 0;          // highest index marked in this block
	std::deque<std::size_t> unlabeledFlashes_; // flashes still waiting for a score
	std::vector<FlashSample_S> samples_;
	std::size_t dropped_ = 0;
}; // BufferedSignalCollector_C
