#pragma once
#include "../utils/Types.h"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <string>
#include <vector>
/* STATESTORE
--> A single source of truth shared by the controller thread + http thread (+ the js display page through /state):
    1) what the display should show right now (preview grid / flash / result / idle)
    2) the one-slot ranking request mailbox (http -> controller)
    3) the outcome of the last request (controller -> http)
*/

struct DisplaySnapshot_s {
    DisplayMode_E mode = DisplayMode_Idle;
    std::size_t flash_index = 0;       // 1-based, 0 outside RUNNING
    int option_id = 0;                 // flashed / winning option
    std::string stimulus;              // flashed / winning stimulus
    std::vector<Option_S> preview;     // preview grid contents
    int grid_cols = 0;                 // ceil(sqrt(n)) cells per side
    double confidence = 0.0;           // result screen only
    std::string banner;                // idle text
};

struct PendingRequest_s {
    std::uint64_t id = 0;
    RankRequest_S request;
};

struct StateStore_s {

    std::atomic<int> g_ui_seq{0}; // increment each time a new display state is published so html can detect quickly
    std::atomic<bool> g_is_simulated{false};

    // custom type requires mutex protection
    mutable std::mutex display_mtx;
    DisplaySnapshot_s display;

    DisplaySnapshot_s get_display() const {
        std::lock_guard<std::mutex> lock(display_mtx);
        return display; // return by value (copy)
    }

    // controller side publishes + bumps seq
    void set_display(DisplaySnapshot_s v) {
        {
            std::lock_guard<std::mutex> lock(display_mtx);
            display = std::move(v);
        }
        g_ui_seq.fetch_add(1, std::memory_order_acq_rel);
    }

    // ONE outstanding request: set by http when it accepts, cleared by controller on the terminal outcome
    std::atomic<bool> g_rank_busy{false};
    std::atomic<std::uint64_t> g_next_request_id{1};
    std::atomic<std::uint64_t> g_active_request_id{0}; // 0 when the slot is free
    std::atomic<std::uint64_t> g_abort_target{0};       // request id /abort was aimed at, 0 = none

    std::mutex pending_mtx;
    std::optional<PendingRequest_s> pending_request;

    // http side: claim the busy flag then park the request; returns 0 if busy
    std::uint64_t try_post_request(const RankRequest_S& req) {
        bool expected = false;
        if (!g_rank_busy.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return 0;
        }
        const std::uint64_t id = g_next_request_id.fetch_add(1, std::memory_order_acq_rel);
        std::lock_guard<std::mutex> lock(pending_mtx);
        pending_request = PendingRequest_s{ id, req };
        g_active_request_id.store(id, std::memory_order_release);
        return id;
    }

    // http side: aim an abort at whatever request holds the slot right now; false if none
    bool request_abort() {
        const std::uint64_t id = g_active_request_id.load(std::memory_order_acquire);
        if (id == 0) return false;
        g_abort_target.store(id, std::memory_order_release);
        return true;
    }

    // controller side: parked request only if it carries this id
    std::optional<PendingRequest_s> take_pending_request_if(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(pending_mtx);
        if (!pending_request || pending_request->id != id) return std::nullopt;
        std::optional<PendingRequest_s> out = std::move(pending_request);
        pending_request.reset();
        return out;
    }

    // controller side
    std::optional<PendingRequest_s> take_pending_request() {
        std::lock_guard<std::mutex> lock(pending_mtx);
        std::optional<PendingRequest_s> out = std::move(pending_request);
        pending_request.reset();
        return out;
    }

    mutable std::mutex outcome_mtx;
    RankOutcome_S last_outcome;

    RankOutcome_S get_last_outcome() const {
        std::lock_guard<std::mutex> lock(outcome_mtx);
        return last_outcome;
    }

    // publish then free the slot (order matters: /result must be readable once busy drops)
    void publish_outcome(const RankOutcome_S& outcome) {
        {
            std::lock_guard<std::mutex> lock(outcome_mtx);
            last_outcome = outcome;
        }
        g_active_request_id.store(0, std::memory_order_release);
        g_rank_busy.store(false, std::memory_order_release);
    }
};
