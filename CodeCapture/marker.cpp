#include "CodeCapture.h"

namespace Capture {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Accepts "#" or "//" in front of the token, as found in script comments.
size_t skip_comment_leader(const std::string& line, size_t i) {
    if (line.compare(i, 2, "//") == 0) i += 2;
    else if (i < line.size() && line[i] == '#') i += 1;
    else return i;
    while (i < line.size() && is_space(line[i])) ++i;
    return i;
}

} // namespace

std::optional<Marker> extract_marker(const std::string& payload, const std::string& token) {
    TRACE_FN("payload_bytes=", payload.size(), ", token=", token);
    if (token.empty()) return std::nullopt;

    size_t line_start = 0;
    while (line_start < payload.size()) {
        size_t nl = payload.find('\n', line_start);
        size_t line_end = nl == std::string::npos ? payload.size() : nl;
        std::string line = payload.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (is_blank(line)) {
            if (nl == std::string::npos) break;
            line_start = nl + 1;
            continue;
        }

        // First non-empty line decides.
        size_t i = 0;
        while (i < line.size() && is_space(line[i])) ++i;

        size_t after_leader = skip_comment_leader(line, i);
        if (starts_with_icase(line.substr(after_leader), token)) {
            i = after_leader;
        } else if (!starts_with_icase(line.substr(i), token)) {
            return std::nullopt;
        }
        i += token.size();

        if (i >= line.size() || !is_space(line[i])) return std::nullopt;

        std::string filename = trim_copy(line.substr(i));
        if (filename.empty()) return std::nullopt;

        Marker marker;
        marker.filename = filename;
        marker.body_offset = nl == std::string::npos ? payload.size() : nl + 1;
        TRACE_MSG("marker filename='", marker.filename, "' body_offset=", marker.body_offset);
        return marker;
    }
    return std::nullopt;
}

std::string marker_body(const std::string& payload, const std::optional<Marker>& marker) {
    if (!marker) return payload;
    if (marker->body_offset >= payload.size()) return {};
    return payload.substr(marker->body_offset);
}

}
