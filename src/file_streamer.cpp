#include "file_streamer.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#ifdef __linux__
#include <sys/sendfile.h>
#endif

namespace lx {

const char* to_string(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::Completed:       return "completed";
        case StreamOutcome::SourceExhausted: return "source exhausted";
        case StreamOutcome::Cancelled:       return "cancelled";
        case StreamOutcome::ConnectionLost:  return "connection lost";
        case StreamOutcome::ReadError:       return "read error";
    }
    return "unknown";
}

static ssize_t zero_copy_send(int sock_fd, int file_fd, off_t* offset, size_t count) {
#ifdef __linux__
    return sendfile(sock_fd, file_fd, offset, count);
#else
    (void)sock_fd; (void)file_fd; (void)offset; (void)count;
    errno = ENOSYS;
    return -1;
#endif
}

static bool is_transport_error(int err) {
    return err == EPIPE || err == ECONNRESET || err == ENOTCONN
        || err == ESHUTDOWN || err == ETIMEDOUT || err == ECONNABORTED;
}

namespace {

class RangeSender {
public:
    RangeSender(int sock_fd, int file_fd, uint64_t offset, uint64_t length,
                TransferRegistry& registry, const std::string& id,
                const StreamOptions& options)
        : sock_fd_(sock_fd), file_fd_(file_fd), begin_(offset), length_(length)
        , registry_(registry), id_(id), options_(options)
    {
    }

    StreamResult run() {
        StreamResult result;
        bool zero_copy = options_.zero_copy;

        while (sent_ < length_) {
            if (registry_.wait_while_paused(id_, options_.pause_poll) == TransferStatus::Done) {
                result.outcome = StreamOutcome::Cancelled;
                break;
            }

            size_t want = static_cast<size_t>(
                std::min<uint64_t>(options_.chunk_size, length_ - sent_));

            ChunkStatus status = zero_copy ? send_zero_copy(want) : send_buffered(want);
            if (status == ChunkStatus::Unsupported) {
                spdlog::debug("Transfer {}: zero-copy unavailable ({}), using buffered reads",
                              id_, std::strerror(last_errno_));
                zero_copy = false;
                continue;
            }

            registry_.update(id_, begin_ + sent_);

            if (status == ChunkStatus::Eof) {
                result.outcome = StreamOutcome::SourceExhausted;
                break;
            }
            if (status == ChunkStatus::PeerGone) {
                result.outcome = StreamOutcome::ConnectionLost;
                break;
            }
            if (status == ChunkStatus::ReadFailed) {
                result.outcome = StreamOutcome::ReadError;
                break;
            }
        }

        result.used_fallback = !zero_copy;
        result.bytes_sent = sent_;
        return result;
    }

private:
    enum class ChunkStatus { Ok, Eof, PeerGone, ReadFailed, Unsupported };

    ChunkStatus send_zero_copy(size_t want) {
        off_t file_offset = static_cast<off_t>(begin_ + sent_);
        for (;;) {
            ssize_t n = zero_copy_send(sock_fd_, file_fd_, &file_offset, want);
            if (n > 0) {
                sent_ += static_cast<uint64_t>(n);
                return ChunkStatus::Ok;
            }
            if (n == 0) {
                return ChunkStatus::Eof;
            }
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            last_errno_ = errno;
            return is_transport_error(errno) ? ChunkStatus::PeerGone : ChunkStatus::Unsupported;
        }
    }

    ChunkStatus send_buffered(size_t want) {
        if (buffer_.size() < want) {
            buffer_.resize(want);
        }

        ssize_t n;
        do {
            n = pread(file_fd_, buffer_.data(), want, static_cast<off_t>(begin_ + sent_));
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            spdlog::warn("Transfer {}: read failed: {}", id_, std::strerror(errno));
            return ChunkStatus::ReadFailed;
        }
        if (n == 0) {
            return ChunkStatus::Eof;
        }

        size_t written = 0;
        while (written < static_cast<size_t>(n)) {
            ssize_t w = send(sock_fd_, buffer_.data() + written,
                             static_cast<size_t>(n) - written, MSG_NOSIGNAL);
            if (w < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                sent_ += written;
                return ChunkStatus::PeerGone;
            }
            written += static_cast<size_t>(w);
        }
        sent_ += written;
        return ChunkStatus::Ok;
    }

    const int sock_fd_;
    const int file_fd_;
    const uint64_t begin_;
    const uint64_t length_;
    TransferRegistry& registry_;
    const std::string& id_;
    const StreamOptions& options_;

    uint64_t sent_ = 0;
    int last_errno_ = 0;
    std::vector<char> buffer_;
};

} // namespace

StreamResult stream_file_range(int sock_fd, int file_fd,
                               uint64_t offset, uint64_t length,
                               TransferRegistry& registry,
                               const std::string& transfer_id,
                               const StreamOptions& options) {
    RangeSender sender(sock_fd, file_fd, offset, length, registry, transfer_id, options);
    StreamResult result = sender.run();

    switch (result.outcome) {
        case StreamOutcome::Completed:
        case StreamOutcome::SourceExhausted:
            registry.complete(transfer_id);
            break;
        case StreamOutcome::Cancelled:
        case StreamOutcome::ConnectionLost:
        case StreamOutcome::ReadError:
            registry.abort(transfer_id);
            break;
    }
    return result;
}

} // namespace lx
