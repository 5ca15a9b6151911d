#include "SyntheticSampleSource.h"
#include <algorithm>
#include <numeric>
#include "../utils/Logger.hpp"

SyntheticSampleSource_C::SyntheticSampleSource_C(const synthConfigs_S& configs)
	: configs_(configs), rng_(configs.seed) {
	// clamp to something usable
	configs_.noiseSigma = std::max(0.0, configs_.noiseSigma);
	configs_.responseRate = std::clamp(configs_.responseRate, 0.0, 1.0);
}

std::vector<FlashSample_S> SyntheticSampleSource_C::random_block(const PresentationOrder_T& order,
                                                                 const RepeatPlan_T& repeatPlan) {
	std::vector<FlashSample_S> samples;
	if (order.empty() || repeatPlan.empty()) {
		return samples;
	}

	if (order != lastOrder_) {
		if (configs_.attendedOption >= 0 && static_cast<std::size_t>(configs_.attendedOption) < repeatPlan.size()) {
			attended_ = configs_.attendedOption;
		} else {
			std::uniform_int_distribution<int> pick(0, static_cast<int>(repeatPlan.size()) - 1);
			attended_ = pick(rng_);
		}
		lastOrder_ = order;
		LOG_DBG("synth: attended option idx=" << attended_);
	}

	samples.resize(order.size());
	for (std::size_t i = 0; i < order.size(); ++i) {
		double v = configs_.baseline + configs_.noiseSigma * noiseNorm_(rng_);
		const bool attendedFlash = (static_cast<int>(order[i]) == attended_);
		if (attendedFlash && uni01_(rng_) < configs_.responseRate) {
			v += configs_.responseAmplitude;
		}
		samples[i].flashIndex = i + 1;
		samples[i].signalValue = v;
	}

	// rank inside the block: strongest response first
	std::vector<std::size_t> byStrength(samples.size());
	std::iota(byStrength.begin(), byStrength.end(), std::size_t{ 0 });
	std::stable_sort(byStrength.begin(), byStrength.end(), [&](std::size_t a, std::size_t b) {
		return samples[a].signalValue > samples[b].signalValue;
	});
	const double denom = (samples.size() > 1) ? static_cast<double>(samples.size() - 1) : 1.0;
	for (std::size_t rank = 0; rank < byStrength.size(); ++rank) {
		samples[byStrength[rank]].rankPosition = static_cast<double>(rank) / denom;
	}
	return samples;
}
