#include "CodeCapture.h"

namespace Capture {

const char* to_string(WriteStatus s) {
    switch (s) {
        case WriteStatus::Unchanged: return "unchanged";
        case WriteStatus::Written: return "written";
        case WriteStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(CommitStatus s) {
    switch (s) {
        case CommitStatus::NotApplicable: return "notApplicable";
        case CommitStatus::SkippedNoRepo: return "skippedNoRepo";
        case CommitStatus::SkippedIdentical: return "skippedIdentical";
        case CommitStatus::Committed: return "committed";
        case CommitStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(ExecStatus s) {
    switch (s) {
        case ExecStatus::NotExecuted: return "notExecuted";
        case ExecStatus::Ok: return "ok";
        case ExecStatus::SyntaxError: return "syntaxError";
        case ExecStatus::Failed: return "failed";
        case ExecStatus::TimedOut: return "timedOut";
        case ExecStatus::InterpreterMissing: return "interpreterMissing";
    }
    return "unknown";
}

const char* to_string(SubmissionStatus s) {
    switch (s) {
        case SubmissionStatus::Completed: return "success";
        case SubmissionStatus::InvalidInput: return "invalid";
        case SubmissionStatus::Busy: return "busy";
        case SubmissionStatus::WriteFailed: return "error";
    }
    return "unknown";
}

std::string disposition_to_json(const Disposition& d) {
    JsonObjectBuilder write;
    write.add("status", to_string(d.write.status))
         .add("bytes", static_cast<std::uint64_t>(d.write.bytes))
         .add("digest", d.write.digest);
    if (!d.write.detail.empty()) write.add("detail", d.write.detail);

    JsonObjectBuilder commit;
    commit.add("status", to_string(d.commit.status));
    if (!d.commit.message.empty()) commit.add("message", d.commit.message);
    if (d.commit.amended) commit.add("amended", true);
    if (!d.commit.detail.empty()) commit.add("detail", d.commit.detail);

    JsonObjectBuilder exec;
    exec.add("status", to_string(d.execution.status));
    if (d.execution.status != ExecStatus::NotExecuted) {
        exec.add("exit_code", d.execution.exit_code)
            .add("stdout", d.execution.out)
            .add("stderr", d.execution.err);
    }
    if (!d.execution.log_path.empty()) exec.add("log_file", d.execution.log_path);
    if (!d.execution.detail.empty()) exec.add("detail", d.execution.detail);

    JsonObjectBuilder root;
    root.add("status", to_string(d.status))
        .add("request_id", d.request_id)
        .add("message", d.message);
    if (d.decision) {
        root.add("resolution", decision_kind(*d.decision));
        if (const auto* rejected = std::get_if<Rejected>(&*d.decision)) root.add("reason", rejected->reason);
    } else {
        root.add_null("resolution");
    }
    if (d.marker_filename) root.add("marker_filename", *d.marker_filename);
    else root.add_null("marker_filename");
    root.add("sanitized_path", d.sanitized_path)
        .add("path", d.path)
        .add("saved_path", d.saved_path)
        .add("language", d.language)
        .add_raw("write", write.str())
        .add_raw("commit", commit.str())
        .add_raw("execution", exec.str());
    return root.str();
}

}
