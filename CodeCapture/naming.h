#ifndef _CodeCapture_naming_h_
#define _CodeCapture_naming_h_

namespace Capture {

// ============================================================================
// Capture naming: language guess and timestamped quarantine filenames
// ============================================================================

constexpr const char* kDefaultExtension = ".txt";

struct LanguageGuess {
    std::string extension;   // ".py"
    std::string name;        // "Python"
};

// Shebang first, then keyword patterns. Falls back to {".txt", "Text"}.
LanguageGuess detect_language(const std::string& code);

// ".py" -> "Python"; "Unknown" for extensions we have no name for.
std::string language_for_extension(const std::string& extension);

// Filename prefix derived from a language name ("JavaScript" -> "javascript").
// Text and Unknown map to "code".
std::string prefix_for_language(const std::string& language);

// <dir>/<prefix>_<YYYYMMDD>_<NNN><ext> for the first unused NNN in 001..999,
// then <prefix>_<YYYYMMDD_HHMMSS_micros><ext>. Nothing is created on disk.
std::filesystem::path generate_capture_path(const std::filesystem::path& dir,
                                            const std::string& extension,
                                            const std::string& prefix = "code");

}

#endif
