/*
STATESTORE RENDERER : writer
- the Trial's display surface in the real program
- every instruction becomes a DisplaySnapshot_s in the StateStore + a new 'seq'
- the html page polls GET /state, sees seq change and draws it (page itself is not ours)
*/

#pragma once
#include "IStimulusRenderer.h"
#include "../shared/StateStore.hpp"

class StateStoreRenderer_C : public IStimulusRenderer_S {
public:
    explicit StateStoreRenderer_C(StateStore_s& stateStoreRef) : stateStoreRef_(stateStoreRef) {}

    void show_preview(const std::vector<Option_S>& options) override;
    void show_flash(std::size_t flashIndex, const Option_S& option) override;
    void show_result(const Option_S& best, double confidence) override;
    void show_idle(bool simulated) override;

    // cells per side of the preview grid
    static int grid_cols_for(std::size_t numOptions);

private:
    StateStore_s& stateStoreRef_;
};
