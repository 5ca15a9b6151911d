#include "SelfTest.hpp"
#include "../src/stimulus/SequenceBuilder.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>

/* TEST COMPONENTS:
- repeat counts stay inside [min, max] and the order contains each option exactly that many times
- no two adjacent flashes of the same option when the plan allows it
- the "one option left over" plans only repeat as much as they have to
- empty option set is rejected
*/

static std::size_t occurrences(const PresentationOrder_T& order, OptionIdx_T idx) {
    return static_cast<std::size_t>(std::count(order.begin(), order.end(), idx));
}

static void check_plan_matches_order(const SequencePlan_S& plan) {
    const std::size_t total = std::accumulate(plan.repeatPlan.begin(), plan.repeatPlan.end(), std::size_t{ 0 });
    SELFTEST_REQUIRE(plan.order.size() == total);
    for (OptionIdx_T idx = 0; idx < plan.repeatPlan.size(); ++idx) {
        SELFTEST_REQUIRE(occurrences(plan.order, idx) == plan.repeatPlan[idx]);
    }
}

static void test_three_options_fixed_repeats() {
    for (unsigned int seed : { 1u, 2u, 99u, 12345u }) {
        std::mt19937 rng(seed);
        const SequencePlan_S plan = SequenceBuilder_C::build(3, 3, 3, rng);
        SELFTEST_REQUIRE(plan.repeatPlan == RepeatPlan_T({ 3, 3, 3 }));
        SELFTEST_REQUIRE(plan.order.size() == 9);
        check_plan_matches_order(plan);
        SELFTEST_REQUIRE(SequenceBuilder_C::count_adjacent_repeats(plan.order) == 0);
    }
}

static void test_random_plans_keep_spacing() {
    std::mt19937 rng(7);
    for (int run = 0; run < 500; ++run) {
        const std::size_t n = 2 + static_cast<std::size_t>(run % 9);
        const SequencePlan_S plan = SequenceBuilder_C::build(n, DEFAULT_MIN_REPEAT, DEFAULT_MAX_REPEAT, rng);
        check_plan_matches_order(plan);
        for (std::size_t count : plan.repeatPlan) {
            SELFTEST_REQUIRE(count >= DEFAULT_MIN_REPEAT && count <= DEFAULT_MAX_REPEAT);
        }
        // two options can still be lopsided enough (7 vs 3) to force back-to-back flashes
        SELFTEST_REQUIRE(SequenceBuilder_C::count_adjacent_repeats(plan.order)
                         == SequenceBuilder_C::min_adjacent_repeats(plan.repeatPlan));
        if (n >= 3) {
            SELFTEST_REQUIRE(SequenceBuilder_C::count_adjacent_repeats(plan.order) == 0);
        }
    }
}

static void test_lopsided_plan_repeats_only_the_tail() {
    std::mt19937 rng(3);
    const RepeatPlan_T plan{ 6, 1, 1 };
    SELFTEST_REQUIRE(SequenceBuilder_C::min_adjacent_repeats(plan) == 3);
    for (int run = 0; run < 50; ++run) {
        PresentationOrder_T order = SequenceBuilder_C::spread_repeats(plan, rng);
        SELFTEST_REQUIRE(order.size() == 8);
        SELFTEST_REQUIRE(SequenceBuilder_C::count_adjacent_repeats(order) == 3);
        SequenceBuilder_C::shuffle_keep_spacing(order, rng);
        SELFTEST_REQUIRE(SequenceBuilder_C::count_adjacent_repeats(order) <= 3);
        SELFTEST_REQUIRE(occurrences(order, 0) == 6);
    }
}

static void test_single_option() {
    std::mt19937 rng(11);
    const SequencePlan_S plan = SequenceBuilder_C::build(1, 2, 2, rng);
    SELFTEST_REQUIRE(plan.order == PresentationOrder_T({ 0, 0 }));
}

static void test_repeat_bounds_are_clamped() {
    std::mt19937 rng(5);
    // min 0 -> 1, max below min -> min
    const SequencePlan_S plan = SequenceBuilder_C::build(4, 0, 0, rng);
    SELFTEST_REQUIRE(plan.repeatPlan == RepeatPlan_T({ 1, 1, 1, 1 }));
    check_plan_matches_order(plan);
}

static void test_empty_option_set_throws() {
    std::mt19937 rng(1);
    bool threw = false;
    try {
        (void)SequenceBuilder_C::build(0, 3, 7, rng);
    }
    catch (const std::invalid_argument&) {
        threw = true;
    }
    SELFTEST_REQUIRE(threw);
}

static void test_seeds_change_order() {
    bool anyDifferent = false;
    std::mt19937 rngA(100);
    const SequencePlan_S first = SequenceBuilder_C::build(5, 3, 3, rngA);
    for (unsigned int seed = 101; seed < 120 && !anyDifferent; ++seed) {
        std::mt19937 rngB(seed);
        anyDifferent = SequenceBuilder_C::build(5, 3, 3, rngB).order != first.order;
    }
    SELFTEST_REQUIRE(anyDifferent);
}

int main() {
    logger::init();
    logger::tlabel = "SequenceBuilderSelfTest";
    LOG_ALWAYS("SequenceBuilderSelfTest starting");

    test_three_options_fixed_repeats();
    test_random_plans_keep_spacing();
    test_lopsided_plan_repeats_only_the_tail();
    test_single_option();
    test_repeat_bounds_are_clamped();
    test_empty_option_set_throws();
    test_seeds_change_order();

    SELFTEST_PASS("SequenceBuilderSelfTest");
}
