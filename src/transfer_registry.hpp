#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace lx {

enum class TransferStatus {
    Active,
    Paused,
    Done
};

const char* to_string(TransferStatus status);

struct TransferRecord {
    std::string id;
    std::string name;
    uint64_t size = 0;
    uint64_t sent = 0;
    TransferStatus status = TransferStatus::Active;
    std::string client_ip;
    std::chrono::system_clock::time_point started;
    uint64_t sequence = 0;   // start order, breaks timestamp ties
};

// Table of in-flight and recently finished transfers. The streaming worker
// owns `sent` and normal completion; pause/resume/cancel arrive from other
// threads. Every operation runs under one mutex and never does I/O inside it.
class TransferRegistry {
public:
    explicit TransferRegistry(size_t retained_completed = 20);

    // Non-copyable
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // New active record with sent = 0; returns its id
    std::string start(const std::string& name, uint64_t size, const std::string& client_ip);

    // Overwrites sent; unknown ids are ignored
    void update(const std::string& id, uint64_t sent);

    bool is_paused(const std::string& id) const;

    // Each returns false ("not found") for unknown ids or a wrong source state
    bool pause(const std::string& id);
    bool resume(const std::string& id);
    bool cancel(const std::string& id);

    // Finished normally: done, sent = size, then retention pruning
    void complete(const std::string& id);

    // Finished early (cancelled or connection lost): done, sent unchanged
    void abort(const std::string& id);

    // Blocks while the transfer is paused, re-checking at least every `poll`.
    // Returns Active to continue or Done to stop (cancelled or unknown).
    TransferStatus wait_while_paused(const std::string& id, std::chrono::milliseconds poll);

    // Cancels everything still running; used on shutdown
    void cancel_all();

    std::optional<TransferRecord> find(const std::string& id) const;

    // Most recently started first
    std::vector<TransferRecord> list() const;

    struct Stats {
        size_t active = 0;
        size_t paused = 0;
        size_t done = 0;
        uint64_t bytes_in_flight = 0;   // sent so far by unfinished transfers
    };
    Stats get_stats() const;

private:
    void finish_locked(TransferRecord& record);
    void prune_completed_locked();
    std::string generate_id_locked();

    const size_t retained_completed_;
    mutable std::mutex mutex_;
    std::condition_variable state_changed_;
    std::unordered_map<std::string, TransferRecord> transfers_;
    uint64_t next_sequence_ = 0;

    // Id source; guarded by mutex_ like the table it keys
    std::mt19937 id_gen_;
    std::uniform_int_distribution<uint32_t> id_dist_;
};

} // namespace lx
