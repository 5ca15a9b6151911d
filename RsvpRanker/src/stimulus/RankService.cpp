#include "RankService.hpp"
#include <chrono>
#include <thread>
#include "../utils/Logger.hpp"

RankService_C::RankService_C(StateStore_s& stateStoreRef, TrialController_C& controllerRef)
    : stateStoreRef_(stateStoreRef), controllerRef_(controllerRef) {
    controllerRef_.set_outcome_callback([this](const RankOutcome_S& outcome) {
        stateStoreRef_.publish_outcome(outcome);
    });
}

void RankService_C::step() {
    // (1) abort has priority over anything queued behind it, but only for the request it was aimed at
    const std::uint64_t abortTarget = stateStoreRef_.g_abort_target.exchange(0, std::memory_order_acq_rel);
    if (abortTarget != 0) {
        if (controllerRef_.is_busy() && controllerRef_.get_request_id() == abortTarget) {
            LOG_ALWAYS("RS: abort requested for running request " << abortTarget);
            controllerRef_.abort(); // publishes through the outcome callback
        } else if (auto pending = stateStoreRef_.take_pending_request_if(abortTarget)) {
            // accepted by http but never started
            LOG_ALWAYS("RS: abort requested for parked request " << abortTarget);
            RankOutcome_S outcome{};
            outcome.requestId = pending->id;
            outcome.status = RankStatus_Aborted;
            stateStoreRef_.publish_outcome(outcome);
        } else {
            LOG_ALWAYS("RS: stale abort for request " << abortTarget << " ignored");
        }
    }

    // (2) new request parked by http
    if (auto pending = stateStoreRef_.take_pending_request()) {
        const RequestStatus_E status = controllerRef_.submit_request(pending->request, pending->id);
        if (status != RequestStatus_Accepted) {
            LOG_WARN("RS: request " << pending->id << " declined (status=" << static_cast<int>(status) << ")");
            RankOutcome_S outcome{};
            outcome.requestId = pending->id;
            outcome.status = RankStatus_Declined;
            stateStoreRef_.publish_outcome(outcome);
        }
    }

    // (3) trial timer
    controllerRef_.poll();
}

void RankService_C::run() {
    logger::tlabel = "RankService";
    LOG_ALWAYS("RS: starting (" << (controllerRef_.is_simulated() ? "simulated" : "live") << " signal)");
    while (!is_stopped_.load(std::memory_order_acquire)) {
        step();
        std::this_thread::sleep_for(std::chrono::milliseconds(CONTROLLER_POLL_MS));
    }
    if (controllerRef_.is_busy()) {
        controllerRef_.abort();
    }
    LOG_ALWAYS("RS: stopped");
}
