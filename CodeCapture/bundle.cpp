#include "CodeCapture.h"

namespace Capture {

namespace {

struct FenceLanguage {
    const char* key;
    const char* language;
};

const FenceLanguage kExactNames[] = {
    {"Dockerfile", "dockerfile"},
    {"Makefile", "makefile"},
    {"CMakeLists.txt", "cmake"},
    {".gitignore", "text"},
    {".env", "text"},
};

const FenceLanguage kExtensions[] = {
    {".py", "python"},     {".js", "javascript"}, {".mjs", "javascript"}, {".jsx", "jsx"},
    {".ts", "typescript"}, {".tsx", "tsx"},       {".html", "html"},      {".htm", "html"},
    {".css", "css"},       {".scss", "scss"},     {".sass", "sass"},      {".json", "json"},
    {".yaml", "yaml"},     {".yml", "yaml"},      {".md", "markdown"},    {".sh", "bash"},
    {".bash", "bash"},     {".zsh", "zsh"},       {".txt", "text"},       {".sql", "sql"},
    {".xml", "xml"},       {".java", "java"},     {".c", "c"},            {".cpp", "cpp"},
    {".cc", "cpp"},        {".h", "c"},           {".hpp", "cpp"},        {".cs", "csharp"},
    {".go", "go"},         {".rb", "ruby"},       {".php", "php"},        {".swift", "swift"},
    {".kt", "kotlin"},     {".kts", "kotlin"},    {".rs", "rust"},        {".toml", "toml"},
    {".cfg", "ini"},       {".ini", "ini"},       {".dockerfile", "dockerfile"},
};

// Trailing lines that belong to the wrapper, not to the file.
const std::regex& filename_marker_line() {
    static const std::regex re(R"(^\s*(?:/\*|\*|#|//)?\s*@@FILENAME@@.*\s*(?:\*/)?\s*$)");
    return re;
}

bool is_wrapper_line(const std::string& line) {
    std::string t = trim_copy(line);
    return t == kBundleFence || std::regex_match(t, filename_marker_line());
}

void trim_wrapper_lines(std::vector<std::string>& lines) {
    while (!lines.empty() && is_wrapper_line(lines.back())) {
        TRACE_MSG("bundle: dropping trailing line '", trim_copy(lines.back()), "'");
        lines.pop_back();
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool looks_binary(const std::string& content) {
    size_t probe = std::min<size_t>(content.size(), 8192);
    return std::memchr(content.data(), '\0', probe) != nullptr;
}

std::string strip_backticks(std::string name) {
    if (name.size() > 1 && name.front() == '`' && name.back() == '`') name = trim_copy(name.substr(1, name.size() - 2));
    return name;
}

class TreeDumper {
public:
    TreeDumper(const std::filesystem::path& root, std::ostream& out, const DumpOptions& options)
        : root_(root), out_(out), options_(options) {
        if (options_.use_gitignore) {
            patterns_ = read_gitignore_patterns(root_ / ".gitignore");
            if (!patterns_.empty()) log_info("Bundle", "using .gitignore patterns from " + (root_ / ".gitignore").string());
        }
        if (!options_.exclude.empty()) exclude_ = canonical_root(options_.exclude);
    }

    void walk(const std::filesystem::path& dir, const std::string& prefix) {
        std::vector<std::filesystem::directory_entry> entries;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) entries.push_back(entry);
        if (ec) {
            log_warn("Bundle", "cannot list " + dir.string() + ": " + ec.message());
            stats_.skipped++;
            return;
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

        for (const auto& entry : entries) {
            std::string name = entry.path().filename().string();
            std::string rel = prefix.empty() ? name : prefix + "/" + name;
            std::error_code entry_ec;
            bool is_dir = entry.is_directory(entry_ec);

            if (name == ".git") continue;
            if (options_.use_gitignore && gitignore_match(rel, is_dir, patterns_)) {
                if (options_.verbose) log_info("Bundle", "ignoring " + rel);
                stats_.skipped++;
                continue;
            }
            if (is_dir) {
                if (entry.is_symlink(entry_ec)) continue;
                walk(entry.path(), rel);
                continue;
            }
            if (!entry.is_regular_file(entry_ec)) continue;
            if (!exclude_.empty() && canonical_root(entry.path()) == exclude_) {
                if (options_.verbose) log_info("Bundle", "skipping the bundle file itself: " + rel);
                continue;
            }
            emit(entry.path(), rel);
        }
    }

    BundleStats stats() const { return stats_; }

private:
    void emit(const std::filesystem::path& file, const std::string& rel) {
        std::string content;
        try {
            content = read_text_file(file);
        } catch (const std::exception& e) {
            log_warn("Bundle", "skipping " + rel + ": " + e.what());
            stats_.skipped++;
            return;
        }
        if (looks_binary(content)) {
            log_warn("Bundle", "skipping " + rel + " (binary content)");
            stats_.skipped++;
            return;
        }

        if (options_.verbose) log_info("Bundle", "adding " + rel);
        if (stats_.files > 0) out_ << "\n";
        out_ << kBundleStartPrefix << rel << kBundleMarkerSuffix << "\n";
        out_ << kBundleFence << fence_language_for(file) << "\n";
        out_ << ensure_trailing_newline(content);
        out_ << kBundleFence << "\n";
        out_ << kBundleEndPrefix << "FILE " << rel << kBundleMarkerSuffix << "\n";
        stats_.files++;
    }

    std::filesystem::path root_;
    std::ostream& out_;
    DumpOptions options_;
    std::vector<std::string> patterns_;
    std::filesystem::path exclude_;
    BundleStats stats_;
};

class BundleSplitter {
public:
    explicit BundleSplitter(std::filesystem::path outdir) : outdir_(std::move(outdir)) {}

    void feed(const std::string& line, size_t line_no) {
        std::string stripped = trim_copy(line);

        if (!inside_ && stripped.rfind(kBundleStartPrefix, 0) == 0 && is_marker(stripped, kBundleStartPrefix)) {
            start(stripped, line_no);
            return;
        }
        if (inside_ && stripped.rfind(kBundleEndPrefix, 0) == 0 && is_marker(stripped, kBundleEndPrefix)) {
            finish(stripped, line_no);
            return;
        }
        if (!inside_) return;

        if (first_line_) {
            first_line_ = false;
            std::string fence = kBundleFence;
            if (stripped.rfind(fence, 0) == 0 && stripped.size() > fence.size()) return;
        }
        lines_.push_back(line);
    }

    void end_of_input() {
        if (!inside_) return;
        log_warn("Bundle", "input ended without END marker for '" + expected_ + "'");
        trim_wrapper_lines(lines_);
        if (lines_.empty()) {
            stats_.skipped++;
        } else {
            write();
        }
        inside_ = false;
    }

    BundleStats stats() const { return stats_; }

private:
    static bool is_marker(const std::string& stripped, const char* prefix) {
        size_t min = std::strlen(prefix) + std::strlen(kBundleMarkerSuffix);
        return stripped.size() >= min && ends_with(stripped, kBundleMarkerSuffix);
    }

    static std::string marker_inner(const std::string& stripped, const char* prefix) {
        size_t begin = std::strlen(prefix);
        return stripped.substr(begin, stripped.size() - begin - std::strlen(kBundleMarkerSuffix));
    }

    void start(const std::string& stripped, size_t line_no) {
        std::string name = strip_backticks(trim_copy(marker_inner(stripped, kBundleStartPrefix)));
        if (name.empty()) {
            log_warn("Bundle", "line " + std::to_string(line_no) + ": START marker without filename");
            stats_.skipped++;
            return;
        }
        expected_ = name;
        inside_ = true;
        first_line_ = true;
        lines_.clear();
    }

    void finish(const std::string& stripped, size_t line_no) {
        auto name = end_marker_filename(marker_inner(stripped, kBundleEndPrefix));
        if (!name) {
            log_warn("Bundle", "line " + std::to_string(line_no) + ": unrecognized END marker: " + stripped);
            return;
        }
        if (*name != expected_)
            log_warn("Bundle", "line " + std::to_string(line_no) + ": END marker '" + *name +
                                   "' does not match '" + expected_ + "'");

        trim_wrapper_lines(lines_);
        write();
        inside_ = false;
        lines_.clear();
    }

    void write() {
        std::string sanitized = sanitize_filename(expected_);
        if (sanitized.empty()) {
            log_warn("Bundle", "no usable filename in '" + expected_ + "'");
            stats_.skipped++;
            return;
        }
        std::filesystem::path target = outdir_ / sanitized;
        if (!is_within_root(outdir_, canonical_root(target))) {
            log_warn("Bundle", "'" + expected_ + "' escapes the output directory");
            stats_.skipped++;
            return;
        }

        std::string content;
        for (const auto& l : lines_) content += l;
        try {
            write_text_file(target, content);
        } catch (const std::exception& e) {
            log_error("Bundle", e.what());
            stats_.skipped++;
            return;
        }
        log_info("Bundle", "wrote " + target.string() + " (" + std::to_string(lines_.size()) + " lines)");
        stats_.files++;
    }

    std::filesystem::path outdir_;
    bool inside_ = false;
    bool first_line_ = false;
    std::string expected_;
    std::vector<std::string> lines_;
    BundleStats stats_;
};

} // namespace

const char* fence_language_for(const std::filesystem::path& file) {
    std::string name = file.filename().string();
    for (const auto& e : kExactNames)
        if (name == e.key) return e.language;

    std::string ext = to_lower_copy(file.extension().string());
    for (const auto& e : kExtensions)
        if (ext == e.key) return e.language;
    return "text";
}

std::vector<std::string> read_gitignore_patterns(const std::filesystem::path& gitignore) {
    std::vector<std::string> patterns;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(gitignore, ec)) return patterns;

    std::string text;
    try {
        text = read_text_file(gitignore);
    } catch (const std::exception& e) {
        log_warn("Bundle", std::string("cannot read .gitignore: ") + e.what());
        return patterns;
    }

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim_copy(line);
        if (!t.empty() && t[0] != '#') patterns.push_back(t);
    }
    return patterns;
}

bool gitignore_match(const std::string& rel, bool is_dir, const std::vector<std::string>& patterns) {
    if (rel == ".git" || rel.rfind(".git/", 0) == 0) return true;

    std::string base = rel.substr(rel.rfind('/') == std::string::npos ? 0 : rel.rfind('/') + 1);
    for (std::string pattern : patterns) {
        if (pattern.empty() || pattern[0] == '!') continue;

        bool dir_only = false;
        if (pattern.back() == '/') {
            dir_only = true;
            pattern.pop_back();
        }
        if (dir_only && !is_dir) continue;

        bool anchored = false;
        if (!pattern.empty() && pattern[0] == '/') {
            anchored = true;
            pattern.erase(0, 1);
        }
        if (pattern.empty()) continue;
        if (pattern.find('/') != std::string::npos) anchored = true;

        if (fnmatch(pattern.c_str(), rel.c_str(), 0) == 0) return true;
        if (!anchored && fnmatch(pattern.c_str(), base.c_str(), 0) == 0) return true;
    }
    return false;
}

BundleStats dump_tree(const std::filesystem::path& dir, std::ostream& out, const DumpOptions& options) {
    TRACE_FN("dir=", dir.string());
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
        throw std::runtime_error("input directory not found: " + dir.string());

    TreeDumper dumper(dir, out, options);
    dumper.walk(dir, "");
    out.flush();
    if (!out) throw std::runtime_error("failed writing bundle output");
    return dumper.stats();
}

std::optional<std::string> end_marker_filename(const std::string& inner) {
    std::string content = trim_copy(inner);
    if (content.rfind("FILE ", 0) == 0) {
        std::string name = strip_backticks(trim_copy(content.substr(5)));
        if (!name.empty()) return name;
        return std::nullopt;
    }
    if (content.size() > 2 && content.front() == '`' && content.back() == '`') {
        std::string name = trim_copy(content.substr(1, content.size() - 2));
        if (!name.empty()) return name;
        return std::nullopt;
    }
    std::string token = std::string(kDefaultMarkerToken) + " ";
    if (content.rfind(token, 0) == 0) {
        std::string name = trim_copy(content.substr(token.size()));
        if (!name.empty()) return name;
    }
    return std::nullopt;
}

BundleStats split_bundle(std::istream& in, const std::filesystem::path& outdir) {
    TRACE_FN("outdir=", outdir.string());
    std::error_code ec;
    std::filesystem::create_directories(outdir, ec);
    if (ec) throw std::runtime_error("cannot create output directory '" + outdir.string() + "': " + ec.message());

    BundleSplitter splitter(canonical_root(outdir));
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!in.eof()) line += '\n';
        splitter.feed(line, line_no);
    }
    splitter.end_of_input();
    return splitter.stats();
}

}
