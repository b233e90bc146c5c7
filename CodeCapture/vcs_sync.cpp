#include "CodeCapture.h"

namespace Capture {

WriteOutcome write_capture(const std::filesystem::path& path, const std::string& content) {
    WriteOutcome outcome;
    try {
        write_text_file(path, content);
        outcome.status = WriteStatus::Written;
        outcome.bytes = content.size();
        outcome.digest = compute_string_hash(content);
        log_info("Sync", "wrote " + std::to_string(content.size()) + " bytes to " + path.string());
    } catch (const std::exception& e) {
        outcome.status = WriteStatus::Failed;
        outcome.detail = e.what();
        log_error("Sync", std::string("write failed: ") + e.what());
    }
    return outcome;
}

bool same_after_normalization(const std::string& current, const std::string& incoming) {
    return ensure_trailing_newline(normalize_newlines(current)) ==
           ensure_trailing_newline(normalize_newlines(incoming));
}

std::string commit_message_for(const std::string& relpath) {
    return "Update " + relpath + " from AI Code Capture";
}

bool is_no_change_output(const std::string& output) {
    static const char* phrases[] = {
        "nothing to commit",
        "no changes added to commit",
        "nothing added to commit",
    };
    std::string lower = to_lower_copy(output);
    for (const char* phrase : phrases) {
        if (lower.find(phrase) != std::string::npos) return true;
    }
    return false;
}

VcsSynchronizer::VcsSynchronizer(const GitRepository& repo, bool amend_single_file)
    : repo_(repo), amend_single_file_(amend_single_file) {}

SyncResult VcsSynchronizer::sync(const Tracked& target, const std::string& content) const {
    TRACE_FN("relpath=", target.relative_path);
    SyncResult result;

    std::error_code ec;
    if (std::filesystem::exists(target.absolute_path, ec)) {
        try {
            std::string current = read_text_file(target.absolute_path);
            if (same_after_normalization(current, content)) {
                log_info("Sync", "content of '" + target.relative_path + "' unchanged, skipping write and commit");
                result.write.status = WriteStatus::Unchanged;
                result.write.bytes = current.size();
                result.write.digest = compute_string_hash(current);
                result.commit.status = CommitStatus::SkippedIdentical;
                return result;
            }
        } catch (const std::exception& e) {
            // Unreadable current content counts as a change.
            log_warn("Sync", std::string("cannot compare with current content: ") + e.what());
        }
    }

    result.write = write_capture(target.absolute_path, content);
    if (result.write.status == WriteStatus::Failed) {
        result.commit.status = CommitStatus::NotApplicable;
        return result;
    }

    if (!repo_.available()) {
        result.commit.status = CommitStatus::SkippedNoRepo;
        return result;
    }

    result.commit = commit(target.relative_path);
    return result;
}

SyncResult VcsSynchronizer::save(const Fallback& target, const std::string& content) const {
    SyncResult result;
    result.write = write_capture(target.absolute_path, content);
    result.commit.status = CommitStatus::NotApplicable;
    return result;
}

CommitOutcome VcsSynchronizer::commit(const std::string& relpath) const {
    CommitOutcome outcome;

    ProcessResult add = repo_.stage(relpath);
    if (!add.ok()) {
        outcome.status = CommitStatus::Failed;
        outcome.detail = add.timed_out ? "git add timed out" : "git add failed: " + trim_copy(add.combined_output() + add.error);
        log_error("Sync", outcome.detail);
        return outcome;
    }

    bool amend = amend_single_file_ && repo_.last_commit_touches_only(relpath);
    outcome.message = commit_message_for(relpath);
    outcome.amended = amend;

    ProcessResult r = repo_.commit(relpath, outcome.message, amend);
    if (r.ok()) {
        outcome.status = CommitStatus::Committed;
        log_info("Sync", std::string(amend ? "amended" : "committed") + " '" + relpath + "'");
        return outcome;
    }

    if (r.started && !r.timed_out && is_no_change_output(r.combined_output())) {
        outcome.status = CommitStatus::SkippedIdentical;
        outcome.amended = false;
        log_info("Sync", "git reports no staged change for '" + relpath + "'");
        return outcome;
    }

    outcome.status = CommitStatus::Failed;
    if (r.timed_out) outcome.detail = "git commit timed out";
    else if (!r.started) outcome.detail = "git commit could not start: " + r.error;
    else outcome.detail = "git commit exited with " + std::to_string(r.exit_code) + ": " + trim_copy(r.combined_output());
    log_error("Sync", outcome.detail);
    return outcome;
}

}
