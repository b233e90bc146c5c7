#include "CodeCapture.h"

namespace Capture {

namespace {

bool is_allowed(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-' || c == '/';
}

std::string join_clean_segments(const std::string& path) {
    std::string out;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        std::string segment = path.substr(pos, slash - pos);
        pos = slash + 1;
        if (segment.empty() || segment == "." || segment == "..") continue;
        if (!out.empty()) out.push_back('/');
        out += segment;
    }
    return out;
}

} // namespace

std::string sanitize_filename(const std::string& raw) {
    std::string filtered;
    filtered.reserve(raw.size());
    for (char c : trim_copy(raw)) {
        if (c == '\\') c = '/';
        if (is_allowed(c)) filtered.push_back(c);
    }

    std::string clean = join_clean_segments(filtered);
    if (clean.size() > kMaxSanitizedLength) {
        // Truncation can leave a dangling '/' or a new "." / ".." tail.
        clean = join_clean_segments(clean.substr(0, kMaxSanitizedLength));
    }

    TRACE_MSG("sanitized '", raw, "' -> '", clean, "'");
    return clean;
}

bool is_bare_basename(const std::string& sanitized) {
    return !sanitized.empty() && sanitized.find('/') == std::string::npos;
}

}
