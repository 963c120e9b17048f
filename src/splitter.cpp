#include "splitter.hpp"
#include "byte_range_reader.hpp"
#include "chunk_inventory.hpp"
#include "chunk_layout.hpp"
#include "chunk_writer.hpp"
#include "digest_record.hpp"
#include "digester.hpp"
#include "errors.hpp"
#include "integrity_verifier.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace resplit {

namespace {

uint64_t to_gib(uint64_t bytes) {
    return bytes / GIB;
}

} // namespace

Splitter::Splitter(const RunConfiguration& config, SpaceProbe& space_probe, ObjectStore* store)
    : config_(config), space_probe_(space_probe), store_(store) {}

RunReport Splitter::run() {
    config_.validate();
    if (config_.sync && store_ == nullptr) {
        throw ConfigError("Sync mode needs an object store");
    }
    std::unique_ptr<Digester> digester = make_digester(config_.digest);

    SourceFile source = scan_source(config_.source_path);
    std::error_code ec;
    if (!fs::is_directory(config_.output_dir, ec)) {
        throw SourceUnavailable("Output directory " + config_.output_dir + " not found!");
    }

    RunReport report;
    RunState& state = report.state;

    ChunkLayout layout(source.size, config_.chunk_size_bytes);
    FileRangeReader source_reader(source.path);
    DigestCache cache(*digester);
    ChunkInventory inventory(config_.output_dir, config_.prefix, layout);
    ChunkWriter writer(layout, source_reader);
    DiskSpaceGovernor governor(space_probe_, config_.output_dir, config_.chunk_size_bytes,
                               config_.safety_buffer_bytes);

    std::unique_ptr<SyncEngine> sync_engine;
    if (config_.sync) {
        SyncOptions options;
        options.remote_prefix = config_.remote_prefix;
        options.workers = config_.sync_workers;
        sync_engine = std::make_unique<SyncEngine>(layout, inventory, writer, *store_, *digester, options);
        sync_engine->preflight();
    }

    state.source_size = source.size;
    state.total_chunks = layout.total_chunks();
    state.suffix_width = layout.suffix_width();

    std::cout << "[Splitter] Source file: " << source.path << "\n"
              << "[Splitter] File size: " << source.size << " bytes (" << to_gib(source.size) << " GB)\n"
              << "[Splitter] Chunk size: " << config_.chunk_size_bytes << " bytes\n"
              << "[Splitter] Total chunks needed: " << state.total_chunks << std::endl;

    Inventory found = inventory.scan();
    // Gaps are only meaningful below a last chunk that belongs to this source
    inventory.validate(found);
    for (uint64_t index : found.missing) {
        std::cerr << "[Inventory] WARNING: chunk " << layout.chunk_name(config_.prefix, index)
                  << " is missing (moved elsewhere?), continuing" << std::endl;
    }
    report.missing = found.missing;

    IntegrityVerifier verifier(layout, source_reader, cache);
    verifier.verify_boundary(found);

    state.resume_index = found.resume_index();
    state.next_index = state.resume_index;
    if (found.last_index) {
        std::cout << "[Splitter] Found existing chunks up to " << layout.suffix(*found.last_index)
                  << ", resuming from chunk " << state.resume_index << std::endl;
    } else {
        std::cout << "[Splitter] No existing chunks found, starting from the beginning" << std::endl;
    }
    std::cout << "[Splitter] Available space: " << to_gib(governor.available()) << " GB" << std::endl;

    if (sync_engine) {
        report.sync = sync_engine->run();
        state.next_index = state.total_chunks;
        return report;
    }

    for (; state.next_index < state.total_chunks; ++state.next_index) {
        SpaceCheck space = governor.check();
        if (!space.admitted) {
            std::cout << "[Splitter] Insufficient disk space. Need " << to_gib(space.required)
                      << " GB, have " << to_gib(space.available) << " GB" << std::endl;
            report.paused_for_space = true;
            report.next_suffix = layout.suffix(state.next_index);
            break;
        }

        std::string path = inventory.chunk_path(state.next_index);
        std::cout << "[Splitter] Creating chunk " << layout.suffix(state.next_index) << " ("
                  << state.next_index + 1 << "/" << state.total_chunks << ")..." << std::endl;
        // A record left by an earlier chunk at this path must not vouch for the new one
        cache.discard(path);
        writer.write(state.next_index, path);
        ++state.chunks_created;
        std::cout << "[Splitter] Successfully created: " << path << "\n"
                  << "[Splitter] Remaining space: " << to_gib(governor.available()) << " GB" << std::endl;
    }

    return report;
}

} // namespace resplit
