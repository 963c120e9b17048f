#include "sync_engine.hpp"
#include "errors.hpp"
#include "resplit/hex_utils.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace resplit {

const char* to_string(ChunkSyncState state) {
    switch (state) {
        case ChunkSyncState::LocalOnly: return "local-only";
        case ChunkSyncState::LocalHashed: return "local-hashed";
        case ChunkSyncState::Verified: return "verified";
        case ChunkSyncState::Uploaded: return "uploaded";
        case ChunkSyncState::Deleted: return "deleted";
        case ChunkSyncState::Failed: return "failed";
    }
    return "unknown";
}

SyncEngine::SyncEngine(const ChunkLayout& layout, const ChunkInventory& inventory, ChunkWriter& writer,
                       ObjectStore& store, Digester& digester, const SyncOptions& options)
    : layout_(layout),
      inventory_(inventory),
      writer_(writer),
      store_(store),
      digester_(digester),
      options_(options) {}

void SyncEngine::preflight() {
    if (options_.workers == 0) {
        throw ConfigError("Sync worker count must be at least 1");
    }
    store_.check_available();

    // Sidecars are only reusable against the store if both sides hash alike
    std::string remote_algorithm = hex::normalize(store_.digest_algorithm());
    if (remote_algorithm != digester_.algorithm()) {
        throw ConfigError("Object store hashes with " + remote_algorithm + " but local digests use " +
                          digester_.algorithm() + "; run with --digest " + remote_algorithm);
    }
}

std::string SyncEngine::remote_name(uint64_t index) const {
    return options_.remote_prefix + layout_.chunk_name(inventory_.prefix(), index);
}

ChunkSyncResult SyncEngine::make_result(uint64_t index, ChunkSyncState state) const {
    ChunkSyncResult result;
    result.index = index;
    result.suffix = layout_.suffix(index);
    result.state = state;
    return result;
}

void SyncEngine::delete_local(const std::string& chunk_path) {
    std::error_code ec;
    fs::remove(chunk_path, ec);
    if (ec) {
        throw IoError("Could not delete local chunk " + chunk_path + ": " + ec.message());
    }
}

VerifyOutcome SyncEngine::verify(uint64_t index, DigestCache& cache) {
    std::string path = inventory_.chunk_path(index);
    std::string name = remote_name(index);
    std::cout << "[Sync] Verifying chunk against remote: " << name << std::endl;

    auto remote_digest = store_.fetch_digest(name);
    if (!remote_digest) {
        std::cout << "[Sync] Remote file not found: " << name << std::endl;
        return VerifyOutcome::NotFound;
    }

    std::string local_digest = cache.local_digest(path);
    std::string remote = hex::normalize(*remote_digest);
    if (local_digest == remote) {
        std::cout << "[Sync] Hash verification successful for " << name << std::endl;
        return VerifyOutcome::Match;
    }

    std::cout << "[Sync] Hash mismatch for " << name << "\n"
              << "  Local:  " << local_digest << "\n"
              << "  Remote: " << remote << std::endl;
    return VerifyOutcome::Mismatch;
}

bool SyncEngine::upload(uint64_t index, DigestCache& cache) {
    std::string path = inventory_.chunk_path(index);
    std::string name = remote_name(index);
    std::cout << "[Sync] Uploading chunk: " << name << std::endl;

    store_.upload(path, name);
    std::cout << "[Sync] Upload successful for " << name << std::endl;

    // An upload is never trusted until the store reports the same digest
    if (verify(index, cache) != VerifyOutcome::Match) {
        std::cerr << "[Sync] Upload verification failed for " << name << std::endl;
        return false;
    }
    std::cout << "[Sync] Upload verification successful for " << name << std::endl;
    return true;
}

ChunkSyncResult SyncEngine::reconcile(uint64_t index, DigestCache& cache, bool materialized) {
    ChunkSyncResult result = make_result(index, ChunkSyncState::LocalOnly);
    result.materialized = materialized;
    std::string path = inventory_.chunk_path(index);

    try {
        if (materialized) {
            cache.refresh(path);
        } else {
            cache.local_digest(path);
        }
        result.state = ChunkSyncState::LocalHashed;

        if (verify(index, cache) == VerifyOutcome::Match) {
            result.state = ChunkSyncState::Verified;
        } else if (upload(index, cache)) {
            result.state = ChunkSyncState::Uploaded;
            result.uploaded = true;
        } else {
            result.state = ChunkSyncState::Failed;
            result.detail = "remote digest does not match after upload";
            return result;
        }

        std::cout << "[Sync] Deleting local chunk: " << fs::path(path).filename().string()
                  << " (keeping hash file)" << std::endl;
        delete_local(path);
        result.state = ChunkSyncState::Deleted;
    } catch (const Error& e) {
        result.state = ChunkSyncState::Failed;
        result.detail = e.what();
        std::cerr << "[Sync] Chunk " << result.suffix << " kept for retry: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        result.state = ChunkSyncState::Failed;
        result.detail = std::string("unexpected error: ") + e.what();
        std::cerr << "[Sync] Chunk " << result.suffix << " kept for retry: " << result.detail << std::endl;
    }
    return result;
}

bool SyncEngine::prepare(uint64_t index, DigestCache& cache, ChunkSyncResult& result) {
    result = make_result(index, ChunkSyncState::LocalOnly);
    std::string path = inventory_.chunk_path(index);

    std::error_code ec;
    if (fs::exists(path, ec)) {
        return true;
    }

    // Chunk already synced and deleted (or moved away): settle it from the sidecar
    if (auto cached = cache.cached_digest(path)) {
        std::optional<std::string> remote;
        try {
            remote = store_.fetch_digest(remote_name(index));
        } catch (const RemoteError& e) {
            result.state = ChunkSyncState::Failed;
            result.detail = e.what();
            std::cerr << "[Sync] Could not query remote for chunk " << result.suffix << ": " << e.what() << std::endl;
            return false;
        }
        if (remote && hex::normalize(*remote) == *cached) {
            std::cout << "[Sync] Cached hash matches remote, chunk " << result.suffix
                      << " already uploaded correctly" << std::endl;
            result.state = ChunkSyncState::Verified;
            result.from_cache = true;
            return false;
        }
        std::cout << "[Sync] Cached hash of chunk " << result.suffix << " not matched remotely, re-creating it"
                  << std::endl;
    }

    std::cout << "[Sync] Creating chunk " << result.suffix << " for upload..." << std::endl;
    writer_.write(index, path);
    result.materialized = true;
    return true;
}

ChunkSyncResult SyncEngine::sync_chunk(uint64_t index) {
    DigestCache cache(digester_);
    ChunkSyncResult result;
    if (!prepare(index, cache, result)) {
        return result;
    }
    return reconcile(index, cache, result.materialized);
}

void SyncEngine::tally(SyncReport& report, const ChunkSyncResult& result) {
    if (result.state == ChunkSyncState::Failed) {
        report.failed.push_back(result);
    } else if (result.from_cache) {
        ++report.cached;
    } else if (result.uploaded) {
        ++report.uploaded;
    } else {
        ++report.verified;
    }
}

SyncReport SyncEngine::run_sequential() {
    SyncReport report;
    for (uint64_t index = 0; index < layout_.total_chunks(); ++index) {
        tally(report, sync_chunk(index));
    }
    return report;
}

SyncReport SyncEngine::run_parallel() {
    std::vector<ChunkSyncResult> results;
    std::mutex mutex;
    std::condition_variable slot_free;
    size_t in_flight = 0;
    DigestCache cache(digester_);

    {
        boost::asio::thread_pool pool(options_.workers);

        for (uint64_t index = 0; index < layout_.total_chunks(); ++index) {
            // Materialize at most `workers` chunks ahead of their deletion
            {
                std::unique_lock<std::mutex> lock(mutex);
                slot_free.wait(lock, [&] { return in_flight < options_.workers; });
            }

            ChunkSyncResult result;
            if (!prepare(index, cache, result)) {
                std::lock_guard<std::mutex> lock(mutex);
                results.push_back(result);
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                ++in_flight;
            }
            bool materialized = result.materialized;
            boost::asio::post(pool, [this, index, materialized, &results, &mutex, &slot_free, &in_flight]() {
                std::unique_ptr<Digester> digester = digester_.clone();
                DigestCache worker_cache(*digester);
                ChunkSyncResult worker_result = reconcile(index, worker_cache, materialized);
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    results.push_back(worker_result);
                    --in_flight;
                }
                slot_free.notify_one();
            });
        }

        pool.join();
    }

    std::sort(results.begin(), results.end(), [](const ChunkSyncResult& a, const ChunkSyncResult& b) {
        return a.index < b.index;
    });
    SyncReport report;
    for (const auto& result : results) {
        tally(report, result);
    }
    return report;
}

SyncReport SyncEngine::run() {
    std::cout << "[Sync] Processing all " << layout_.total_chunks() << " chunks"
              << (options_.workers > 1 ? " with " + std::to_string(options_.workers) + " workers" : std::string())
              << std::endl;

    SyncReport report = options_.workers > 1 ? run_parallel() : run_sequential();

    std::cout << "[Sync] Verified: " << report.verified << ", uploaded: " << report.uploaded
              << ", already synced: " << report.cached << ", failed: " << report.failed.size() << std::endl;
    for (const auto& failed : report.failed) {
        std::cerr << "[Sync] Chunk " << failed.suffix << " not synced: " << failed.detail << std::endl;
    }
    return report;
}

} // namespace resplit
