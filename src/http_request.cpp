#include "http_request.hpp"
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <strings.h>

namespace lx {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return strcasecmp(a.c_str(), b.c_str()) < 0;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string();
}

bool HttpRequest::has_header(const std::string& name) const {
    return headers.find(name) != headers.end();
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> url_decode(const std::string& in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;

            char decoded = static_cast<char>((hi << 4) | lo);
            if (decoded == '\0') return std::nullopt;
            out.push_back(decoded);
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> query_param(const std::string& query, const std::string& key) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string pair = query.substr(pos, amp - pos);
        size_t eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
            return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

static std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<HttpRequest> parse_request(const std::string& header_block) {
    HttpRequest req;

    // Parse first line: "GET /path?query HTTP/1.1"
    size_t line_end = header_block.find("\r\n");
    std::string first_line = header_block.substr(0, line_end);

    std::istringstream iss(first_line);
    iss >> req.method >> req.target;
    if (req.method.empty() || req.target.empty()) {
        return std::nullopt;
    }
    std::transform(req.method.begin(), req.method.end(), req.method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    // Split the query before decoding so an encoded '?' stays in the path
    std::string raw_path = req.target;
    std::string query;
    size_t qpos = raw_path.find('?');
    if (qpos != std::string::npos) {
        query = raw_path.substr(qpos + 1);
        raw_path.erase(qpos);
    }

    auto decoded = url_decode(raw_path);
    if (decoded) {
        req.path = std::move(*decoded);
    } else {
        req.target_valid = false;
    }

    if (auto raw_value = query_param(query, "path")) {
        auto value = url_decode(*raw_value, true);
        if (value) {
            req.query_path = std::move(*value);
        } else {
            req.target_valid = false;
        }
    }

    // Remaining lines are "key: value"; lines without a colon are skipped
    size_t pos = line_end == std::string::npos ? header_block.size() : line_end + 2;
    while (pos < header_block.size()) {
        size_t next = header_block.find("\r\n", pos);
        if (next == std::string::npos) next = header_block.size();

        std::string line = header_block.substr(pos, next - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = trim(line.substr(0, colon));
            if (!key.empty()) {
                req.headers[key] = trim(line.substr(colon + 1));
            }
        }
        pos = next + 2;
    }

    return req;
}

ReadResult read_header_block(int fd, std::size_t max_bytes) {
    ReadResult result;
    std::string raw;
    char buf[8192];

    for (;;) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            result.status = ReadStatus::Error;
            return result;
        }
        if (n == 0) {
            result.status = ReadStatus::PeerClosed;
            return result;
        }

        // Resume the terminator search just before the new bytes
        size_t search_from = raw.size() >= 3 ? raw.size() - 3 : 0;
        raw.append(buf, static_cast<size_t>(n));

        size_t term = raw.find("\r\n\r\n", search_from);
        if (term != std::string::npos) {
            result.status = ReadStatus::Complete;
            result.header_block = raw.substr(0, term);
            return result;
        }
        if (raw.size() > max_bytes) {
            result.status = ReadStatus::TooLarge;
            return result;
        }
    }
}

} // namespace lx
