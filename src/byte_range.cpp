#include "byte_range.hpp"
#include <cctype>
#include <optional>

namespace lx {

static std::optional<uint64_t> parse_decimal(const std::string& s) {
    size_t begin = s.find_first_not_of(' ');
    size_t end = s.find_last_not_of(' ');
    if (begin == std::string::npos) return std::nullopt;

    uint64_t value = 0;
    for (size_t i = begin; i <= end; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) return std::nullopt;
        uint64_t digit = c - '0';
        if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

static ByteRange whole_file(uint64_t file_size) {
    ByteRange r;
    r.start = 0;
    r.end = file_size > 0 ? file_size - 1 : 0;
    r.length = file_size;
    return r;
}

ByteRange negotiate_range(uint64_t file_size, const std::string& range_header) {
    ByteRange r = whole_file(file_size);
    if (range_header.empty()) {
        return r;
    }
    r.partial = true;

    std::string spec = range_header;
    size_t unit = spec.find("bytes=");
    if (unit != std::string::npos) {
        spec.erase(unit, 6);
    }

    size_t dash = spec.find('-');
    std::string first = spec.substr(0, dash);
    std::string second = dash == std::string::npos ? "" : spec.substr(dash + 1);

    // Omitted bounds default to the start / end of the file; anything else
    // that is not a plain decimal number leaves the whole-file range
    uint64_t start = 0;
    uint64_t end = r.end;
    if (first.find_first_not_of(' ') != std::string::npos) {
        auto v = parse_decimal(first);
        if (!v) return r;
        start = *v;
    }
    if (second.find_first_not_of(' ') != std::string::npos) {
        auto v = parse_decimal(second);
        if (!v) return r;
        end = *v;
    }

    if (file_size == 0) {
        return r;
    }
    if (end > file_size - 1) {
        end = file_size - 1;
    }
    if (start > end) {
        return r;
    }

    r.start = start;
    r.end = end;
    r.length = end - start + 1;
    return r;
}

std::string content_range(const ByteRange& range, uint64_t file_size) {
    if (file_size == 0) {
        return "bytes */0";
    }
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end)
         + "/" + std::to_string(file_size);
}

} // namespace lx
