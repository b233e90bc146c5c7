#ifndef _CodeCapture_sanitizer_h_
#define _CodeCapture_sanitizer_h_

namespace Capture {

constexpr size_t kMaxSanitizedLength = 200;

// Reduces a raw filename to [A-Za-z0-9_.-/] joined by single '/', without
// empty, "." or ".." segments and at most kMaxSanitizedLength characters.
// Empty result means nothing usable survived.
std::string sanitize_filename(const std::string& raw);

// True for a sanitized path without any directory part.
bool is_bare_basename(const std::string& sanitized);

}

#endif
