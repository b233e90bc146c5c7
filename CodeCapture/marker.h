#ifndef _CodeCapture_marker_h_
#define _CodeCapture_marker_h_

namespace Capture {

//
// Filename directive at the top of a payload, e.g. "@@FILENAME@@ src/app.py"
//

constexpr const char* kDefaultMarkerToken = "@@FILENAME@@";

struct Marker {
    std::string filename;     // trimmed, unsanitized
    size_t body_offset = 0;   // first byte after the directive line
};

// Looks at the first non-empty line only. No error conditions: anything that
// does not look like a directive means "no marker".
std::optional<Marker> extract_marker(const std::string& payload,
                                     const std::string& token = kDefaultMarkerToken);

// Payload with the directive line removed (payload itself when absent).
std::string marker_body(const std::string& payload, const std::optional<Marker>& marker);

}

#endif
