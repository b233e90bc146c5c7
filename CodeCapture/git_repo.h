#ifndef _CodeCapture_git_repo_h_
#define _CodeCapture_git_repo_h_

namespace Capture {

// ============================================================================
// Git working tree access (tracked-file locator + stage/commit plumbing)
// ============================================================================

constexpr std::chrono::milliseconds kGitQueryTimeout{5000};
constexpr std::chrono::milliseconds kGitAddTimeout{10000};
constexpr std::chrono::milliseconds kGitCommitTimeout{15000};

class GitRepository {
public:
    GitRepository(std::filesystem::path root, bool available);

    // Runs "git rev-parse --is-inside-work-tree" in dir.
    static bool is_work_tree(const std::filesystem::path& dir);
    static GitRepository detect(const std::filesystem::path& dir);

    bool available() const { return available_; }
    const std::filesystem::path& root() const { return root_; }

    // Unique tracked path (relative to root) whose last component equals
    // basename. Zero or several matches yield nullopt.
    std::optional<std::string> find_tracked_by_basename(const std::string& basename) const;
    // relpath must be a tracked file itself, not a directory containing some.
    bool is_tracked(const std::string& relpath) const;

    ProcessResult stage(const std::string& relpath) const;
    // Commits only relpath. With amend, reuses the previous message.
    ProcessResult commit(const std::string& relpath, const std::string& message, bool amend) const;
    // True when HEAD exists and its change list is exactly relpath.
    bool last_commit_touches_only(const std::string& relpath) const;

private:
    // Files changed by HEAD, relative to root_ (relative) or to the top level.
    std::optional<std::vector<std::string>> last_commit_files(bool relative) const;
    ProcessResult git(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const;

    std::filesystem::path root_;
    bool available_;
};

}

#endif
