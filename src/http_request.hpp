#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace lx {

// Case-insensitive ordering for header names
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string method;                     // upper-cased
    std::string target;                     // raw request target
    std::string path;                       // percent-decoded path component
    std::optional<std::string> query_path;  // decoded ?path= parameter
    bool target_valid = true;               // false if decoding failed
    HeaderMap headers;

    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

// Percent-decodes a URL token. Returns nullopt for truncated or non-hex
// escapes and for escapes that decode to NUL. With `plus_as_space`, '+'
// decodes to ' ' (query component rules).
std::optional<std::string> url_decode(const std::string& in, bool plus_as_space = false);

// Finds the raw (still encoded) value of `key` in a query string.
std::optional<std::string> query_param(const std::string& query, const std::string& key);

// Parses a header block (everything before CRLF CRLF). Returns nullopt if the
// request line lacks a method and target.
std::optional<HttpRequest> parse_request(const std::string& header_block);

enum class ReadStatus {
    Complete,       // header terminator seen
    PeerClosed,     // EOF before the terminator
    TooLarge,       // limit exceeded without a terminator
    Error           // recv() failed
};

struct ReadResult {
    ReadStatus status = ReadStatus::Error;
    std::string header_block;   // bytes before CRLF CRLF when Complete
};

// Reads from `fd` until CRLF CRLF, at most `max_bytes` in total.
ReadResult read_header_block(int fd, std::size_t max_bytes);

} // namespace lx
