#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "../src/stimulus/IStimulusRenderer.h"
#include "../src/acq/ISignalCollector.h"

// test doubles: remember every call so the self-tests can replay what the trial did

struct RecordingRenderer_S : public IStimulusRenderer_S {
    std::size_t previews = 0;
    std::size_t idles = 0;
    bool lastIdleSimulated = false;
    std::vector<std::size_t> flashIndices;
    std::vector<int> flashedIds;
    std::vector<int> resultIds;
    double lastConfidence = 0.0;

    void show_preview(const std::vector<Option_S>& options) override {
        (void)options;
        previews++;
    }
    void show_flash(std::size_t flashIndex, const Option_S& option) override {
        flashIndices.push_back(flashIndex);
        flashedIds.push_back(option.id);
    }
    void show_result(const Option_S& best, double confidence) override {
        resultIds.push_back(best.id);
        lastConfidence = confidence;
    }
    void show_idle(bool simulated) override {
        idles++;
        lastIdleSimulated = simulated;
    }
};

// hands back whatever the test queued in nextBlock when asked for samples
struct RecordingCollector_S : public ISignalCollector_S {
    std::size_t blocksBegun = 0;
    std::size_t blocksEnded = 0;
    bool open = false;
    std::vector<std::size_t> marked;
    std::vector<FlashSample_S> nextBlock;

    void begin_collection_block() override {
        blocksBegun++;
        open = true;
        marked.clear();
    }
    void end_collection_block() override {
        blocksEnded++;
        open = false;
    }
    bool in_block() const override { return open; }
    void begin_flash(std::size_t flashIndex) override { marked.push_back(flashIndex); }
    std::vector<FlashSample_S> get_block_samples() override { return nextBlock; }
};
