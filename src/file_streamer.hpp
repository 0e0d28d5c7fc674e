#pragma once

#include "transfer_registry.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lx {

struct StreamOptions {
    size_t chunk_size = 8 * 1024 * 1024;
    std::chrono::milliseconds pause_poll{200};
    bool zero_copy = true;       // false forces the buffered path
};

enum class StreamOutcome {
    Completed,        // all requested bytes sent
    SourceExhausted,  // file ended early (truncated while streaming)
    Cancelled,        // registry said done before we finished
    ConnectionLost,   // peer reset / broken pipe
    ReadError         // file read failed in the buffered path
};

const char* to_string(StreamOutcome outcome);

struct StreamResult {
    StreamOutcome outcome = StreamOutcome::Completed;
    uint64_t bytes_sent = 0;
    bool used_fallback = false;
};

// Sends `length` bytes of `file_fd` starting at `offset` to `sock_fd`.
// Before each chunk the transfer's registry state is consulted (pause blocks,
// cancel stops); after each chunk `sent` is updated to the absolute file
// offset reached. The transfer is marked done on every exit path.
StreamResult stream_file_range(int sock_fd, int file_fd,
                               uint64_t offset, uint64_t length,
                               TransferRegistry& registry,
                               const std::string& transfer_id,
                               const StreamOptions& options);

} // namespace lx
