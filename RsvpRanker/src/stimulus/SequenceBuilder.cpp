#include "SequenceBuilder.hpp"
#include <algorithm>
#include <numeric>
#include <optional>
#include <queue>
#include <stdexcept>
#include "../utils/Logger.hpp"

SequencePlan_S SequenceBuilder_C::build(std::size_t optionCount, std::size_t minRepeat,
                                        std::size_t maxRepeat, std::mt19937& rng) {
	if (optionCount == 0) {
		throw std::invalid_argument("SequenceBuilder: need at least one option");
	}
	// clamp so the range is always usable
	minRepeat = std::max<std::size_t>(1, minRepeat);
	maxRepeat = std::max(minRepeat, maxRepeat);

	SequencePlan_S plan{};
	plan.repeatPlan.resize(optionCount);
	std::uniform_int_distribution<std::size_t> repeatDist(minRepeat, maxRepeat);
	for (auto& count : plan.repeatPlan) {
		count = repeatDist(rng);
	}

	plan.order = spread_repeats(plan.repeatPlan, rng);
	shuffle_keep_spacing(plan.order, rng);

	LOG_DBG("SB: built order len=" << plan.order.size() << " options=" << optionCount
	        << " adjacent_repeats=" << count_adjacent_repeats(plan.order));
	return plan;
}

PresentationOrder_T SequenceBuilder_C::spread_repeats(const RepeatPlan_T& repeatPlan, std::mt19937& rng) {
	PresentationOrder_T order;
	order.reserve(std::accumulate(repeatPlan.begin(), repeatPlan.end(), std::size_t{ 0 }));

	std::uniform_int_distribution<std::uint32_t> tieDist;
	std::priority_queue<heapEntry_S> heap;
	for (OptionIdx_T idx = 0; idx < repeatPlan.size(); ++idx) {
		if (repeatPlan[idx] > 0) {
			heap.push(heapEntry_S{ repeatPlan[idx], tieDist(rng), idx });
		}
	}

	// the option emitted last step sits out of the heap for exactly one extraction
	std::optional<heapEntry_S> held;
	while (!heap.empty()) {
		heapEntry_S top = heap.top();
		heap.pop();
		if (held.has_value() && held->remaining > 0) {
			heap.push(*held);
		}
		order.push_back(top.idx);
		top.remaining--;
		held = top;
	}

	// heap ran dry: whatever is held is the only option left, emit it back to back
	if (held.has_value()) {
		for (std::size_t r = held->remaining; r > 0; --r) {
			order.push_back(held->idx);
		}
	}
	return order;
}

void SequenceBuilder_C::shuffle_keep_spacing(PresentationOrder_T& order, std::mt19937& rng) {
	const std::size_t n = order.size();
	if (n < 3) return;

	std::uniform_int_distribution<std::size_t> posDist(0, n - 1);
	for (std::size_t attempt = 0; attempt < n; ++attempt) {
		const std::size_t i = posDist(rng);
		const std::size_t j = posDist(rng);
		if (i == j || order[i] == order[j]) continue;

		const std::size_t before = repeats_around(order, i, j);
		std::swap(order[i], order[j]);
		if (repeats_around(order, i, j) > before) {
			std::swap(order[i], order[j]); // undo
		}
	}
}

std::size_t SequenceBuilder_C::count_adjacent_repeats(const PresentationOrder_T& order) {
	std::size_t repeats = 0;
	for (std::size_t p = 0; p + 1 < order.size(); ++p) {
		if (order[p] == order[p + 1]) repeats++;
	}
	return repeats;
}

std::size_t SequenceBuilder_C::min_adjacent_repeats(const RepeatPlan_T& repeatPlan) {
	if (repeatPlan.empty()) return 0;
	const std::size_t total = std::accumulate(repeatPlan.begin(), repeatPlan.end(), std::size_t{ 0 });
	const std::size_t largest = *std::max_element(repeatPlan.begin(), repeatPlan.end());
	const std::size_t others = total - largest;
	// largest can be separated by at most (others + 1) gaps
	return (largest > others + 1) ? largest - others - 1 : 0;
}

// adjacent repeats on the pairs touching position i or j
std::size_t SequenceBuilder_C::repeats_around(const PresentationOrder_T& order, std::size_t i, std::size_t j) {
	const std::size_t n = order.size();
	std::size_t starts[4];
	std::size_t numStarts = 0;
	auto add_start = [&](std::size_t p) {
		if (p + 1 >= n) return;
		for (std::size_t k = 0; k < numStarts; ++k) {
			if (starts[k] == p) return;
		}
		starts[numStarts++] = p;
	};
	if (i > 0) add_start(i - 1);
	add_start(i);
	if (j > 0) add_start(j - 1);
	add_start(j);

	std::size_t repeats = 0;
	for (std::size_t k = 0; k < numStarts; ++k) {
		if (order[starts[k]] == order[starts[k] + 1]) repeats++;
	}
	return repeats;
}
