#include "CodeCapture.h"

namespace Capture {

namespace {

std::vector<std::string> split_nul(const std::string& s) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t end = s.find('\0', pos);
        if (end == std::string::npos) end = s.size();
        if (end > pos) parts.push_back(s.substr(pos, end - pos));
        pos = end + 1;
    }
    return parts;
}

std::string basename_of(const std::string& relpath) {
    size_t slash = relpath.rfind('/');
    return slash == std::string::npos ? relpath : relpath.substr(slash + 1);
}

} // namespace

GitRepository::GitRepository(std::filesystem::path root, bool available)
    : root_(std::move(root)), available_(available) {}

bool GitRepository::is_work_tree(const std::filesystem::path& dir) {
    ProcessOptions opts;
    opts.cwd = dir.string();
    opts.timeout = kGitQueryTimeout;
    ProcessResult r = run_process({"git", "rev-parse", "--is-inside-work-tree"}, opts);
    if (!r.started) {
        log_warn("Git", "git not runnable: " + r.error);
        return false;
    }
    return r.ok() && trim_copy(r.out) == "true";
}

GitRepository GitRepository::detect(const std::filesystem::path& dir) {
    return GitRepository(canonical_root(dir), is_work_tree(dir));
}

ProcessResult GitRepository::git(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("git");
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions opts;
    opts.cwd = root_.string();
    opts.timeout = timeout;
    ProcessResult r = run_process(argv, opts);
    if (r.timed_out) log_warn("Git", "'" + join_args(argv) + "' timed out");
    else if (!r.started) log_warn("Git", "'" + join_args(argv) + "' could not start: " + r.error);
    return r;
}

std::optional<std::string> GitRepository::find_tracked_by_basename(const std::string& basename) const {
    TRACE_FN("basename=", basename);
    if (!available_ || basename.empty()) return std::nullopt;

    ProcessResult r = git({"ls-files", "-z", "--", basename, "*/" + basename}, kGitQueryTimeout);
    if (!r.ok()) {
        if (r.started && !r.timed_out) log_warn("Git", "ls-files failed: " + trim_copy(r.err));
        return std::nullopt;
    }

    std::set<std::string> matches;
    for (const auto& path : split_nul(r.out)) {
        if (basename_of(path) == basename) matches.insert(path);
    }

    if (matches.size() == 1) {
        log_info("Git", "unique tracked match for '" + basename + "': " + *matches.begin());
        return *matches.begin();
    }
    if (matches.size() > 1) {
        std::string list;
        for (const auto& m : matches) list += (list.empty() ? "" : ", ") + m;
        log_warn("Git", "ambiguous basename '" + basename + "' matches " + list);
    }
    return std::nullopt;
}

bool GitRepository::is_tracked(const std::string& relpath) const {
    if (!available_ || relpath.empty()) return false;
    // A pathspec naming a directory matches every file below it; only an
    // exact entry counts as tracked.
    ProcessResult r = git({"ls-files", "-z", "--error-unmatch", "--", relpath}, kGitQueryTimeout);
    if (!r.ok()) return false;
    for (const auto& path : split_nul(r.out)) {
        if (path == relpath) return true;
    }
    return false;
}

ProcessResult GitRepository::stage(const std::string& relpath) const {
    return git({"add", "--", relpath}, kGitAddTimeout);
}

ProcessResult GitRepository::commit(const std::string& relpath, const std::string& message, bool amend) const {
    std::vector<std::string> args{"commit"};
    if (amend) {
        args.push_back("--amend");
        args.push_back("--no-edit");
    } else {
        args.push_back("-m");
        args.push_back(message);
    }
    args.push_back("--");
    args.push_back(relpath);
    return git(args, kGitCommitTimeout);
}

std::optional<std::vector<std::string>> GitRepository::last_commit_files(bool relative) const {
    std::vector<std::string> args{"diff-tree", "--root", "--no-commit-id", "--name-only", "-r", "-z"};
    if (relative) args.push_back("--relative");
    args.push_back("HEAD");
    ProcessResult r = git(args, kGitQueryTimeout);
    if (!r.ok()) return std::nullopt;
    return split_nul(r.out);
}

bool GitRepository::last_commit_touches_only(const std::string& relpath) const {
    if (!available_) return false;
    // Paths relative to root_ may differ from top-level paths when root_ is
    // a subdirectory of the checkout; the full list only supplies the count.
    auto all = last_commit_files(false);
    auto here = last_commit_files(true);
    if (!all || !here) return false;
    return all->size() == 1 && here->size() == 1 && here->front() == relpath;
}

}
