#pragma once

#include <string>

namespace lx {

// Content type by file extension (case-insensitive), with APK packages forced
// to the Android installer type. Unknown extensions are octet-stream.
std::string guess_mime_type(const std::string& path);

// ASCII-only rendition of a file name for Content-Disposition: each non-ASCII
// character becomes '?', quotes and control characters become '_'.
std::string ascii_safe_filename(const std::string& name);

} // namespace lx
