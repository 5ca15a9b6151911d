#include "SelfTest.hpp"
#include "Recorders.hpp"
#include "../src/stimulus/Trial.hpp"
#include <stdexcept>

/* TEST COMPONENTS:
- 2 + len(order) advances walk INIT -> PREVIEW -> RUNNING x len -> COMPLETED with the configured waits
- flash indices are 1-based, marked on the collector before the renderer sees the flash
- reset() replays the exact same flash sequence with a fresh cursor
- abort from every live state, and the no-op cases
*/

static std::vector<Option_S> make_options() {
    return { Option_S{ 10, "a.png" }, Option_S{ 20, "b.png" }, Option_S{ 30, "c.png" } };
}

static SequencePlan_S make_plan() {
    SequencePlan_S plan{};
    plan.repeatPlan = { 2, 2, 1 };
    plan.order = { 0, 1, 0, 2, 1 };
    return plan;
}

static TrialTiming_S make_timing() {
    TrialTiming_S t{};
    t.preview_ms = ms_T{ 400 };
    t.flash_ms = ms_T{ 30 };
    return t;
}

static void run_to_completion(Trial_C& trial, const TrialTiming_S& timing) {
    const std::size_t n = trial.get_order().size();
    SELFTEST_REQUIRE(trial.get_state() == TrialState_Init);

    SELFTEST_REQUIRE(trial.advance() == timing.preview_ms);
    SELFTEST_REQUIRE(trial.get_state() == TrialState_Preview);

    for (std::size_t i = 0; i < n; ++i) {
        SELFTEST_REQUIRE(trial.advance() == timing.flash_ms);
        SELFTEST_REQUIRE(trial.get_state() == TrialState_Running);
        SELFTEST_REQUIRE(trial.get_cursor() == i);
        SELFTEST_REQUIRE(trial.get_flash_index() == i + 1);
    }

    SELFTEST_REQUIRE(trial.advance() == ms_T{ 0 });
    SELFTEST_REQUIRE(trial.get_state() == TrialState_Completed);
    SELFTEST_REQUIRE(trial.is_terminal());
    SELFTEST_REQUIRE(trial.get_cursor() == n);
}

static void test_full_run() {
    RecordingRenderer_S renderer;
    RecordingCollector_S collector;
    const TrialTiming_S timing = make_timing();
    Trial_C trial(make_options(), make_plan(), timing, &renderer, &collector);

    run_to_completion(trial, timing);

    SELFTEST_REQUIRE(renderer.previews == 1);
    SELFTEST_REQUIRE(renderer.flashIndices == std::vector<std::size_t>({ 1, 2, 3, 4, 5 }));
    SELFTEST_REQUIRE(renderer.flashedIds == std::vector<int>({ 10, 20, 10, 30, 20 }));
    SELFTEST_REQUIRE(collector.marked == renderer.flashIndices);
    SELFTEST_REQUIRE(collector.blocksBegun == 1);
    SELFTEST_REQUIRE(collector.blocksEnded == 1);
    SELFTEST_REQUIRE(!collector.in_block());

    // nothing left to show
    SELFTEST_REQUIRE(trial.advance() == ms_T{ 0 });
    SELFTEST_REQUIRE(trial.get_state() == TrialState_Completed);
}

static void test_reset_replays_same_sequence() {
    RecordingRenderer_S renderer;
    RecordingCollector_S collector;
    const TrialTiming_S timing = make_timing();
    Trial_C trial(make_options(), make_plan(), timing, &renderer, &collector);

    run_to_completion(trial, timing);
    const PresentationOrder_T firstOrder = trial.get_order();
    const std::vector<int> firstFlashes = renderer.flashedIds;

    SELFTEST_REQUIRE(trial.reset() == timing.preview_ms);
    SELFTEST_REQUIRE(trial.get_state() == TrialState_Init);
    SELFTEST_REQUIRE(trial.get_cursor() == 0);
    SELFTEST_REQUIRE(trial.get_flash_index() == 0);
    SELFTEST_REQUIRE(trial.get_order() == firstOrder);
    SELFTEST_REQUIRE(trial.get_reset_count() == 1);

    renderer.flashedIds.clear();
    renderer.flashIndices.clear();
    run_to_completion(trial, timing);
    SELFTEST_REQUIRE(renderer.flashedIds == firstFlashes);
    SELFTEST_REQUIRE(renderer.flashIndices == std::vector<std::size_t>({ 1, 2, 3, 4, 5 }));
    SELFTEST_REQUIRE(collector.blocksBegun == 2);
    SELFTEST_REQUIRE(renderer.previews == 2);
}

static void test_reset_refused_mid_run() {
    const TrialTiming_S timing = make_timing();
    Trial_C trial(make_options(), make_plan(), timing, nullptr, nullptr);
    (void)trial.advance(); // PREVIEW
    (void)trial.advance(); // first flash
    SELFTEST_REQUIRE(trial.reset() == ms_T{ 0 });
    SELFTEST_REQUIRE(trial.get_state() == TrialState_Running);
    SELFTEST_REQUIRE(trial.get_reset_count() == 0);

    // INIT -> INIT is allowed
    Trial_C fresh(make_options(), make_plan(), timing, nullptr, nullptr);
    SELFTEST_REQUIRE(fresh.reset() == timing.preview_ms);
    SELFTEST_REQUIRE(fresh.get_state() == TrialState_Init);
}

static void test_abort() {
    const TrialTiming_S timing = make_timing();
    for (int stepsBeforeAbort = 0; stepsBeforeAbort < 4; ++stepsBeforeAbort) {
        RecordingCollector_S collector;
        Trial_C trial(make_options(), make_plan(), timing, nullptr, &collector);
        for (int i = 0; i < stepsBeforeAbort; ++i) {
            (void)trial.advance();
        }
        trial.abort();
        SELFTEST_REQUIRE(trial.get_state() == TrialState_Aborted);
        SELFTEST_REQUIRE(trial.is_terminal());
        SELFTEST_REQUIRE(!collector.in_block());
        SELFTEST_REQUIRE(trial.advance() == ms_T{ 0 });
        SELFTEST_REQUIRE(trial.get_state() == TrialState_Aborted);
        SELFTEST_REQUIRE(trial.reset() == ms_T{ 0 });
    }

    // completed trial stays completed
    Trial_C done(make_options(), make_plan(), timing, nullptr, nullptr);
    run_to_completion(done, timing);
    done.abort();
    SELFTEST_REQUIRE(done.get_state() == TrialState_Completed);
}

static void test_bad_plans_throw() {
    const TrialTiming_S timing = make_timing();
    int thrown = 0;

    SequencePlan_S empty{};
    empty.repeatPlan = { 0, 0, 0 };
    try { Trial_C t(make_options(), empty, timing, nullptr, nullptr); }
    catch (const std::invalid_argument&) { thrown++; }

    SequencePlan_S mismatched = make_plan();
    mismatched.repeatPlan = { 2, 3 };
    try { Trial_C t(make_options(), mismatched, timing, nullptr, nullptr); }
    catch (const std::invalid_argument&) { thrown++; }

    SequencePlan_S outOfRange = make_plan();
    outOfRange.order.push_back(7);
    try { Trial_C t(make_options(), outOfRange, timing, nullptr, nullptr); }
    catch (const std::invalid_argument&) { thrown++; }

    SELFTEST_REQUIRE(thrown == 3);
}

int main() {
    logger::init();
    logger::tlabel = "TrialStateMachineSelfTest";
    LOG_ALWAYS("TrialStateMachineSelfTest starting");

    test_full_run();
    test_reset_replays_same_sequence();
    test_reset_refused_mid_run();
    test_abort();
    test_bad_plans_throw();

    SELFTEST_PASS("TrialStateMachineSelfTest");
}
