#pragma once

#include <cstdint>
#include <string>

namespace lx {

struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;       // inclusive; meaningless when length == 0
    uint64_t length = 0;
    bool partial = false;   // answer with 206 + Content-Range
};

// Selects the bytes to serve for `range_header` ("bytes=<start>-<end>").
// An empty header means the whole file with 200. Any non-empty header answers
// 206, even when it is malformed and the whole file is served instead.
ByteRange negotiate_range(uint64_t file_size, const std::string& range_header);

// "bytes <start>-<end>/<total>", or "bytes */0" for an empty file
std::string content_range(const ByteRange& range, uint64_t file_size);

} // namespace lx
