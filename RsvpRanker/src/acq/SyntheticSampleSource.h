/*
==============================================================================
	File: SyntheticSampleSource.h
	Desc: Stands in for the classifier when no live signal source is attached
	(SIGNAL_BACKEND_SIM builds + tests). One sample per flash of the block:
	baseline + gaussian noise, plus a response bump on flashes of the
	"attended" option. rankPosition is the sample's rank inside the block
	(0 = strongest, 1 = weakest).

	NOTE: Not designed to be used across multiple threads (no atomics)
	(controller thread only)
==============================================================================
*/

#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include "../utils/Types.h"

class SyntheticSampleSource_C {
public:
	struct synthConfigs_S {
		double baseline = 1.0;
		double responseAmplitude = 10.0; // added on attended flashes
		double noiseSigma = 0.5;
		double responseRate = 1.0;       // share of attended flashes that actually respond
		int attendedOption = -1;         // option index; -1 = pick one at random per presentation order
		unsigned int seed = 0xC0FFEEu;
	}; // synthConfigs_S

	explicit SyntheticSampleSource_C(const synthConfigs_S& configs);
	// should not be able to copy: delete copy constructor/assignment operator
	SyntheticSampleSource_C(const SyntheticSampleSource_C&) = delete;
	SyntheticSampleSource_C& operator=(const SyntheticSampleSource_C&) = delete;

	// one sample per flash of order, flash indices 1..order.size()
	std::vector<FlashSample_S> random_block(const PresentationOrder_T& order, const RepeatPlan_T& repeatPlan);

	// option index used for the last generated block (-1 before the first)
	int get_attended_option() const { return attended_; }

private:
	synthConfigs_S configs_{};
	std::mt19937 rng_;
	std::normal_distribution<double> noiseNorm_{ 0.0, 1.0 }; // std=1; scaled later
	std::uniform_real_distribution<double> uni01_{ 0.0, 1.0 };

	PresentationOrder_T lastOrder_; // retries replay the same order -> keep the same target
	int attended_ = -1;
}; // SyntheticSampleSource_C
