/*
RANK SERVICE : the controller thread
- bridges the StateStore mailbox (written by http) and the TrialController (single-threaded)
- each loop: abort flag -> pending request -> trial timer, then a short sleep
- every terminal outcome is published back to the StateStore, which frees the busy slot
*/

#pragma once
#include <atomic>
#include "../shared/StateStore.hpp"
#include "TrialController.hpp"

class RankService_C {
public:
    RankService_C(StateStore_s& stateStoreRef, TrialController_C& controllerRef);

    void run();   // blocking loop until stop()
    void step();  // one loop iteration without sleeping (tests drive it directly)
    void stop() { is_stopped_.store(true, std::memory_order_release); }

private:
    StateStore_s& stateStoreRef_;
    TrialController_C& controllerRef_;
    std::atomic<bool> is_stopped_{false};
};
