#pragma once

#include "chunk_inventory.hpp"
#include "chunk_layout.hpp"
#include "chunk_writer.hpp"
#include "digest_record.hpp"
#include "digester.hpp"
#include "object_store.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace resplit {

// Per-chunk progress: LocalOnly -> LocalHashed -> {Verified | Uploaded} -> Deleted.
// Failed means the local chunk was kept for a later retry.
enum class ChunkSyncState { LocalOnly, LocalHashed, Verified, Uploaded, Deleted, Failed };

const char* to_string(ChunkSyncState state);

enum class VerifyOutcome { Match, Mismatch, NotFound };

struct ChunkSyncResult {
    uint64_t index;
    std::string suffix;
    ChunkSyncState state;
    // The remote copy was written during this run
    bool uploaded = false;
    // Settled from the sidecar alone, no chunk I/O happened
    bool from_cache = false;
    // Recreated from the source during this run
    bool materialized = false;
    std::string detail;
};

struct SyncReport {
    uint64_t verified = 0;
    uint64_t uploaded = 0;
    uint64_t cached = 0;
    std::vector<ChunkSyncResult> failed;

    bool complete() const { return failed.empty(); }
};

struct SyncOptions {
    std::string remote_prefix;
    // > 1 runs verify/upload of materialized chunks on a bounded thread pool
    size_t workers = 1;
};

// Reconciles every chunk of the source with an object store, keyed by content
// digest. Local chunks are removed only after the remote copy is proven equal;
// digest sidecars are never removed.
class SyncEngine {
public:
    SyncEngine(const ChunkLayout& layout, const ChunkInventory& inventory, ChunkWriter& writer,
               ObjectStore& store, Digester& digester, const SyncOptions& options);

    // Throws RemoteUnavailable if the store is unusable and ConfigError if it
    // hashes with another algorithm than the local sidecars.
    void preflight();

    // Walks the full range 0..total_chunks-1 in index order
    SyncReport run();

    // Settles one chunk, materializing it from the source when needed.
    // Only CopyFailure (and other writer errors) escape.
    ChunkSyncResult sync_chunk(uint64_t index);

    // Compares the local digest of a present chunk with the remote one.
    // Throws RemoteError if the store could not be asked.
    VerifyOutcome verify(uint64_t index, DigestCache& cache);

    // Uploads a present chunk and verifies the remote copy again.
    // Returns false if the re-verification did not match.
    bool upload(uint64_t index, DigestCache& cache);

    std::string remote_name(uint64_t index) const;

private:
    // Remote half for a chunk that exists locally: verify, else upload, then delete.
    // A materialized chunk is hashed afresh instead of trusting an older sidecar.
    ChunkSyncResult reconcile(uint64_t index, DigestCache& cache, bool materialized);

    // Decides for an index on the calling thread. Returns true if the chunk is
    // on disk and still needs reconcile(), otherwise fills `result`.
    bool prepare(uint64_t index, DigestCache& cache, ChunkSyncResult& result);

    ChunkSyncResult make_result(uint64_t index, ChunkSyncState state) const;
    void delete_local(const std::string& chunk_path);

    SyncReport run_sequential();
    SyncReport run_parallel();
    static void tally(SyncReport& report, const ChunkSyncResult& result);

    const ChunkLayout& layout_;
    const ChunkInventory& inventory_;
    ChunkWriter& writer_;
    ObjectStore& store_;
    Digester& digester_;
    SyncOptions options_;
};

} // namespace resplit
