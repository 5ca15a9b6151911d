#include "BufferedSignalCollector.h"
#include <algorithm>
#include "../utils/Logger.hpp"

void BufferedSignalCollector_C::begin_collection_block() {
	std::lock_guard<std::mutex> lock(mtx_);
	// previous block is stale once a new one opens
	samples_.clear();
	unlabeledFlashes_.clear();
	lastFlashIndex_ = 0;
	dropped_ = 0;
	inBlock_ = true;
	LOG_DBG("collector: block open");
}

void BufferedSignalCollector_C::end_collection_block() {
	std::lock_guard<std::mutex> lock(mtx_);
	inBlock_ = false;
	// unlabeled flashes stay queued: late scores for the last flashes still land
	LOG_DBG("collector: block closed, samples=" << samples_.size()
	        << " waiting=" << unlabeledFlashes_.size());
}

bool BufferedSignalCollector_C::in_block() const {
	std::lock_guard<std::mutex> lock(mtx_);
	return inBlock_;
}

void BufferedSignalCollector_C::begin_flash(std::size_t flashIndex) {
	std::lock_guard<std::mutex> lock(mtx_);
	if (!inBlock_) {
		LOG_WARN("collector: flash " << flashIndex << " marked outside a block, ignored");
		return;
	}
	lastFlashIndex_ = std::max(lastFlashIndex_, flashIndex);
	unlabeledFlashes_.push_back(flashIndex);
}

std::vector<FlashSample_S> BufferedSignalCollector_C::get_block_samples() {
	std::lock_guard<std::mutex> lock(mtx_);
	return samples_; // copy
}

bool BufferedSignalCollector_C::push_sample(double signalValue, double rankPosition) {
	std::lock_guard<std::mutex> lock(mtx_);
	if (unlabeledFlashes_.empty()) {
		dropped_++;
		LOG_DBG("collector: sample with no pending flash dropped");
		return false;
	}
	FlashSample_S s{};
	s.flashIndex = unlabeledFlashes_.front();
	s.signalValue = signalValue;
	s.rankPosition = rankPosition;
	unlabeledFlashes_.pop_front();
	samples_.push_back(s);
	return true;
}

bool BufferedSignalCollector_C::push_labeled_sample(const FlashSample_S& sample) {
	std::lock_guard<std::mutex> lock(mtx_);
	if (sample.flashIndex == 0 || sample.flashIndex > lastFlashIndex_) {
		dropped_++;
		return false;
	}
	// it no longer needs an unlabeled score
	auto it = std::find(unlabeledFlashes_.begin(), unlabeledFlashes_.end(), sample.flashIndex);
	if (it != unlabeledFlashes_.end()) {
		unlabeledFlashes_.erase(it);
	}
	samples_.push_back(sample);
	return true;
}

std::size_t BufferedSignalCollector_C::get_dropped_count() const {
	std::lock_guard<std::mutex> lock(mtx_);
	return dropped_;
}

std::size_t BufferedSignalCollector_C::get_pending_flash_count() const {
	std::lock_guard<std::mutex> lock(mtx_);
	return unlabeledFlashes_.size();
}
