#include "transfer_registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace lx {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Active: return "active";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Done:   return "done";
    }
    return "unknown";
}

TransferRegistry::TransferRegistry(size_t retained_completed)
    : retained_completed_(retained_completed)
    , id_gen_(std::random_device{}())
{
}

std::string TransferRegistry::generate_id_locked() {
    for (;;) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0') << std::setw(8) << id_dist_(id_gen_);
        std::string id = oss.str();
        if (transfers_.find(id) == transfers_.end()) {
            return id;
        }
    }
}

std::string TransferRegistry::start(const std::string& name, uint64_t size,
                                    const std::string& client_ip) {
    std::lock_guard<std::mutex> lock(mutex_);

    TransferRecord record;
    record.id = generate_id_locked();
    record.name = name;
    record.size = size;
    record.client_ip = client_ip;
    record.started = std::chrono::system_clock::now();
    record.sequence = next_sequence_++;

    std::string id = record.id;
    transfers_.emplace(id, std::move(record));
    return id;
}

void TransferRegistry::update(const std::string& id, uint64_t sent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it != transfers_.end()) {
        it->second.sent = sent;
    }
}

bool TransferRegistry::is_paused(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    return it != transfers_.end() && it->second.status == TransferStatus::Paused;
}

bool TransferRegistry::pause(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end() || it->second.status != TransferStatus::Active) {
            return false;
        }
        it->second.status = TransferStatus::Paused;
    }
    spdlog::info("Transfer {} paused", id);
    return true;
}

bool TransferRegistry::resume(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end() || it->second.status != TransferStatus::Paused) {
            return false;
        }
        it->second.status = TransferStatus::Active;
    }
    state_changed_.notify_all();
    spdlog::info("Transfer {} resumed", id);
    return true;
}

bool TransferRegistry::cancel(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end()) {
            return false;
        }
        finish_locked(it->second);
    }
    state_changed_.notify_all();
    spdlog::info("Transfer {} cancelled", id);
    return true;
}

void TransferRegistry::complete(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end()) {
            return;
        }
        it->second.sent = it->second.size;
        finish_locked(it->second);
    }
    state_changed_.notify_all();
}

void TransferRegistry::abort(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end()) {
            return;
        }
        finish_locked(it->second);
    }
    state_changed_.notify_all();
}

void TransferRegistry::cancel_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, record] : transfers_) {
            record.status = TransferStatus::Done;
        }
        prune_completed_locked();
    }
    state_changed_.notify_all();
}

// Pruning may erase `record` itself; callers must not touch it afterwards
void TransferRegistry::finish_locked(TransferRecord& record) {
    record.status = TransferStatus::Done;
    prune_completed_locked();
}

void TransferRegistry::prune_completed_locked() {
    std::vector<std::pair<uint64_t, std::string>> done;
    for (const auto& [id, record] : transfers_) {
        if (record.status == TransferStatus::Done) {
            done.emplace_back(record.sequence, id);
        }
    }
    if (done.size() <= retained_completed_) {
        return;
    }

    // Keep the most recently started, drop the rest
    std::sort(done.begin(), done.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    for (size_t i = retained_completed_; i < done.size(); ++i) {
        transfers_.erase(done[i].second);
    }
}

TransferStatus TransferRegistry::wait_while_paused(const std::string& id,
                                                   std::chrono::milliseconds poll) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        auto it = transfers_.find(id);
        if (it == transfers_.end()) {
            return TransferStatus::Done;
        }
        if (it->second.status != TransferStatus::Paused) {
            return it->second.status;
        }
        // No deadline: a paused transfer may stay paused indefinitely
        state_changed_.wait_for(lock, poll);
    }
}

std::optional<TransferRecord> TransferRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TransferRecord> TransferRegistry::list() const {
    std::vector<TransferRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(transfers_.size());
        for (const auto& [id, record] : transfers_) {
            records.push_back(record);
        }
    }
    std::sort(records.begin(), records.end(),
              [](const TransferRecord& a, const TransferRecord& b) {
                  return a.sequence > b.sequence;
              });
    return records;
}

TransferRegistry::Stats TransferRegistry::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    for (const auto& [id, record] : transfers_) {
        switch (record.status) {
            case TransferStatus::Active:
                stats.active++;
                stats.bytes_in_flight += record.sent;
                break;
            case TransferStatus::Paused:
                stats.paused++;
                stats.bytes_in_flight += record.sent;
                break;
            case TransferStatus::Done:
                stats.done++;
                break;
        }
    }
    return stats;
}

} // namespace lx
