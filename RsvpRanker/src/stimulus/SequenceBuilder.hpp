/*
==============================================================================
	File: SequenceBuilder.hpp
	Desc: Builds the flash order for one trial. Every option gets a random
	repeat count in [minRepeat, maxRepeat]; repeats are spread out with a
	max-heap on "remaining count" so the same option is never flashed twice in
	a row unless it is the only one left.
	Stateless: all randomness comes from the caller's rng.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include "../utils/Types.h"

class SequenceBuilder_C {
public:
	// throws std::invalid_argument if optionCount == 0
	static SequencePlan_S build(std::size_t optionCount, std::size_t minRepeat,
	                            std::size_t maxRepeat, std::mt19937& rng);

	// greedy max-heap pass with a one-step reinsertion delay
	static PresentationOrder_T spread_repeats(const RepeatPlan_T& repeatPlan, std::mt19937& rng);

	// random swaps that never increase the number of adjacent repeats
	static void shuffle_keep_spacing(PresentationOrder_T& order, std::mt19937& rng);

	// number of positions p where order[p] == order[p+1]
	static std::size_t count_adjacent_repeats(const PresentationOrder_T& order);

	// fewest adjacent repeats any ordering of this plan can have
	static std::size_t min_adjacent_repeats(const RepeatPlan_T& repeatPlan);

private:
	struct heapEntry_S {
		std::size_t remaining = 0;
		std::uint32_t tiebreak = 0; // random, so equal counts come out in arbitrary order
		OptionIdx_T idx = 0;

		bool operator<(const heapEntry_S& other) const {
			if (remaining != other.remaining) return remaining < other.remaining;
			return tiebreak < other.tiebreak;
		}
	};

	static std::size_t repeats_around(const PresentationOrder_T& order, std::size_t i, std::size_t j);
}; // SequenceBuilder_C
