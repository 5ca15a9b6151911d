#include "StateStoreRenderer.hpp"
#include <cmath>

int StateStoreRenderer_C::grid_cols_for(std::size_t numOptions) {
    if (numOptions == 0) return 0;
    return static_cast<int>(std::ceil(std::sqrt(static_cast<double>(numOptions))));
}

void StateStoreRenderer_C::show_preview(const std::vector<Option_S>& options) {
    DisplaySnapshot_s snap{};
    snap.mode = DisplayMode_Preview;
    snap.preview = options;
    snap.grid_cols = grid_cols_for(options.size());
    snap.banner = "Previewing " + std::to_string(options.size()) + " images";
    stateStoreRef_.set_display(std::move(snap));
}

void StateStoreRenderer_C::show_flash(std::size_t flashIndex, const Option_S& option) {
    DisplaySnapshot_s snap{};
    snap.mode = DisplayMode_Flash;
    snap.flash_index = flashIndex;
    snap.option_id = option.id;
    snap.stimulus = option.stimulus;
    stateStoreRef_.set_display(std::move(snap));
}

void StateStoreRenderer_C::show_result(const Option_S& best, double confidence) {
    DisplaySnapshot_s snap{};
    snap.mode = DisplayMode_Result;
    snap.option_id = best.id;
    snap.stimulus = best.stimulus;
    snap.confidence = confidence;
    snap.banner = "Selected option id: " + std::to_string(best.id);
    stateStoreRef_.set_display(std::move(snap));
}

void StateStoreRenderer_C::show_idle(bool simulated) {
    DisplaySnapshot_s snap{};
    snap.mode = DisplayMode_Idle;
    snap.banner = simulated ? "SIMULATION MODE" : "BCI Reset";
    stateStoreRef_.g_is_simulated.store(simulated, std::memory_order_release);
    stateStoreRef_.set_display(std::move(snap));
}
