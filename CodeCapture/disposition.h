#ifndef _CodeCapture_disposition_h_
#define _CodeCapture_disposition_h_

namespace Capture {

// ============================================================================
// Per-submission outcome records
// ============================================================================

enum class WriteStatus { Unchanged, Written, Failed };

struct WriteOutcome {
    WriteStatus status = WriteStatus::Unchanged;
    size_t bytes = 0;          // bytes persisted (or already on disk when unchanged)
    std::string digest;        // BLAKE3 of those bytes
    std::string detail;        // failure detail
};

enum class CommitStatus { NotApplicable, SkippedNoRepo, SkippedIdentical, Committed, Failed };

struct CommitOutcome {
    CommitStatus status = CommitStatus::NotApplicable;
    std::string message;       // commit message used
    bool amended = false;
    std::string detail;
};

enum class ExecStatus { NotExecuted, Ok, SyntaxError, Failed, TimedOut, InterpreterMissing };

struct ExecutionResult {
    ExecStatus status = ExecStatus::NotExecuted;
    int exit_code = -1;
    std::string out;
    std::string err;
    std::string log_path;      // empty when no log was written
    std::string detail;
};

enum class SubmissionStatus { Completed, InvalidInput, Busy, WriteFailed };

struct Disposition {
    std::uint64_t request_id = 0;
    SubmissionStatus status = SubmissionStatus::Completed;
    std::optional<ResolutionDecision> decision;    // unset for InvalidInput / Busy
    std::optional<std::string> marker_filename;
    std::string sanitized_path;
    std::string path;          // relative for tracked files, absolute otherwise
    std::string saved_path;    // absolute path actually written
    std::string language;
    WriteOutcome write;
    CommitOutcome commit;
    ExecutionResult execution;
    std::string message;
};

const char* to_string(WriteStatus s);
const char* to_string(CommitStatus s);
const char* to_string(ExecStatus s);
const char* to_string(SubmissionStatus s);

std::string disposition_to_json(const Disposition& d);

}

#endif
