#ifndef _CodeCapture_bundle_h_
#define _CodeCapture_bundle_h_

namespace Capture {

// ============================================================================
// Multi-file bundles: a directory tree as one fenced text file and back
// ============================================================================
//
//   --- START OF FILE src/app.py ---
//   ```python
//   ...content...
//   ```
//   --- END OF FILE src/app.py ---

constexpr const char* kBundleStartPrefix = "--- START OF FILE ";
constexpr const char* kBundleEndPrefix = "--- END OF ";
constexpr const char* kBundleMarkerSuffix = " ---";
constexpr const char* kBundleFence = "```";
constexpr const char* kDefaultBundleFile = "all_generated.txt";

struct BundleStats {
    size_t files = 0;       // files written to the bundle / extracted from it
    size_t skipped = 0;     // ignored, unreadable or malformed entries
};

struct DumpOptions {
    bool use_gitignore = true;
    bool verbose = false;
    std::filesystem::path exclude;   // usually the bundle file itself
};

// Fence tag for a file name: exact names first ("Dockerfile"), then the
// lowercased extension, "text" otherwise.
const char* fence_language_for(const std::filesystem::path& file);

// Non-empty, non-comment lines of a .gitignore. Missing file -> empty.
std::vector<std::string> read_gitignore_patterns(const std::filesystem::path& gitignore);

// rel uses '/' separators. Supports "dir/" (directories only), "/anchored"
// and plain glob patterns; negations are not supported and never match.
bool gitignore_match(const std::string& rel, bool is_dir, const std::vector<std::string>& patterns);

// Writes every text file under dir (sorted, .git skipped) to out.
BundleStats dump_tree(const std::filesystem::path& dir, std::ostream& out, const DumpOptions& options = {});

// Filename carried by the inner part of an END marker: "FILE x", "`x`" or
// "@@FILENAME@@ x". nullopt for anything else.
std::optional<std::string> end_marker_filename(const std::string& inner);

// Extracts every START/END block of in below outdir. Names pass through
// sanitize_filename and must stay inside outdir. Throws std::runtime_error
// when outdir cannot be created.
BundleStats split_bundle(std::istream& in, const std::filesystem::path& outdir);

}

#endif
