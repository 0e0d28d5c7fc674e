#include "mime_types.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace lx {

static const std::unordered_map<std::string, std::string> mime_types_ = {
    {".html", "text/html"},
    {".htm",  "text/html"},
    {".css",  "text/css"},
    {".js",   "application/javascript"},
    {".json", "application/json"},
    {".txt",  "text/plain"},
    {".csv",  "text/csv"},
    {".xml",  "application/xml"},
    {".pdf",  "application/pdf"},
    {".zip",  "application/zip"},
    {".gz",   "application/gzip"},
    {".tar",  "application/x-tar"},
    {".7z",   "application/x-7z-compressed"},
    {".rar",  "application/vnd.rar"},
    {".doc",  "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls",  "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".ppt",  "application/vnd.ms-powerpoint"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".webp", "image/webp"},
    {".bmp",  "image/bmp"},
    {".heic", "image/heic"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".mp3",  "audio/mpeg"},
    {".wav",  "audio/x-wav"},
    {".ogg",  "audio/ogg"},
    {".flac", "audio/flac"},
    {".m4a",  "audio/mp4"},
    {".mp4",  "video/mp4"},
    {".mkv",  "video/x-matroska"},
    {".webm", "video/webm"},
    {".avi",  "video/x-msvideo"},
    {".mov",  "video/quicktime"},
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
    {".apk",  "application/vnd.android.package-archive"},
};

std::string guess_mime_type(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    auto it = mime_types_.find(ext);
    if (it != mime_types_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string ascii_safe_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());

    for (unsigned char c : name) {
        if (c >= 0x80) {
            // One '?' per UTF-8 sequence: skip continuation bytes
            if ((c & 0xC0) != 0x80) out.push_back('?');
        } else if (c < 0x20 || c == 0x7F || c == '"') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

} // namespace lx
