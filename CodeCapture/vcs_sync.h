#ifndef _CodeCapture_vcs_sync_h_
#define _CodeCapture_vcs_sync_h_

namespace Capture {

// ============================================================================
// Change-aware write + stage + commit
// ============================================================================

// Writes content to path (parents created) and reports bytes and digest.
// Never throws; failures land in WriteOutcome::detail.
WriteOutcome write_capture(const std::filesystem::path& path, const std::string& content);

// CRLF -> LF and a terminating newline on both sides before comparing.
bool same_after_normalization(const std::string& current, const std::string& incoming);

std::string commit_message_for(const std::string& relpath);

// Git output that means "nothing was staged", not a failure.
bool is_no_change_output(const std::string& output);

struct SyncResult {
    WriteOutcome write;
    CommitOutcome commit;
};

class VcsSynchronizer {
public:
    VcsSynchronizer(const GitRepository& repo, bool amend_single_file);

    // Tracked target: compare, write when different, stage, commit.
    SyncResult sync(const Tracked& target, const std::string& content) const;
    // Quarantine target: plain write, commit not applicable.
    SyncResult save(const Fallback& target, const std::string& content) const;

private:
    CommitOutcome commit(const std::string& relpath) const;

    const GitRepository& repo_;
    bool amend_single_file_;
};

}

#endif
