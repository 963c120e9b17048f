#pragma once

#include "config.hpp"
#include "disk_space.hpp"
#include "object_store.hpp"
#include "sync_engine.hpp"
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace resplit {

// Counters of one invocation, passed explicitly from step to step
struct RunState {
    uint64_t source_size = 0;
    uint64_t total_chunks = 0;
    size_t suffix_width = 0;
    uint64_t resume_index = 0;
    uint64_t next_index = 0;
    uint64_t chunks_created = 0;
};

struct RunReport {
    RunState state;
    std::vector<uint64_t> missing;
    // Stopped before the end because free space ran below chunk size + buffer
    bool paused_for_space = false;
    // Suffix of the next chunk to create when paused
    std::string next_suffix;
    std::optional<SyncReport> sync;

    uint64_t remaining() const { return state.total_chunks - state.next_index; }
    bool complete() const {
        return state.next_index >= state.total_chunks && (!sync || sync->complete());
    }
};

// Drives one resumable split: scan, validate, verify the boundary chunk, then
// create the missing chunks (or hand the whole range to the sync engine).
class Splitter {
public:
    // store is required in sync mode and ignored otherwise
    Splitter(const RunConfiguration& config, SpaceProbe& space_probe, ObjectStore* store = nullptr);

    // Throws on every fatal condition. Running out of space is not one.
    RunReport run();

private:
    RunConfiguration config_;
    SpaceProbe& space_probe_;
    ObjectStore* store_;
};

} // namespace resplit
