/*
==============================================================================
	File: ISignalCollector.h
	Desc: Abstract class interface for per-flash signal sources. The Trial
	marks each flash as it starts so the collector can attribute the next
	arriving classifier score to the right flash index.
	Collection blocks bracket the RUNNING phase of a trial; opening a block
	drops whatever the previous block gathered.
==============================================================================
*/

#pragma once
#include <cstddef>
#include <vector>
#include "../utils/Types.h"

struct ISignalCollector_S {
	virtual ~ISignalCollector_S() = default; // virtual destructor for proper cleanup of derived classes
	virtual void begin_collection_block() = 0;
	virtual void end_collection_block() = 0;
	virtual bool in_block() const = 0;
	virtual void begin_flash(std::size_t flashIndex) = 0; // 1-based
	virtual std::vector<FlashSample_S> get_block_samples() = 0; // samples of the last (or current) block
}; // ISignalCollector_S
