#include "CodeCapture.h"

namespace Capture {

CapturePipeline::CapturePipeline(PipelineSettings settings)
    : settings_(std::move(settings)),
      repo_(canonical_root(settings_.working_root), settings_.is_repo),
      resolver_(repo_, settings_.quarantine_root),
      sync_(repo_, settings_.amend_single_file),
      sandbox_(settings_.sandbox) {}

void CapturePipeline::set_auto_run(bool python, bool shell) {
    settings_.sandbox.run_python = python;
    settings_.sandbox.run_shell = shell;
    sandbox_ = ExecutionSandbox(settings_.sandbox);
}

Disposition CapturePipeline::process(const std::string& payload, std::uint64_t request_id) {
    TRACE_FN("request_id=", request_id, ", bytes=", payload.size());
    Disposition d;
    d.request_id = request_id;

    try {
        auto marker = extract_marker(payload, settings_.marker_token);
        std::string body = marker_body(payload, marker);
        std::string content = ensure_trailing_newline(body);

        if (marker) {
            d.marker_filename = marker->filename;
            d.sanitized_path = sanitize_filename(marker->filename);
            log_info("Pipeline", "#" + std::to_string(request_id) + " marker '" + marker->filename +
                                     "' sanitized to '" + d.sanitized_path + "'");
            d.decision = resolver_.resolve(d.sanitized_path);
        } else {
            LanguageGuess guess = detect_language(body);
            d.language = guess.name;
            log_info("Pipeline", "#" + std::to_string(request_id) + " no marker, detected " + guess.name);
            d.decision = Fallback{generate_capture_path(resolver_.quarantine_root(), guess.extension,
                                                       prefix_for_language(guess.name))};
        }

        persist(d, body, content);
        if (d.write.status == WriteStatus::Failed) {
            d.status = SubmissionStatus::WriteFailed;
            d.message = "Failed to save file: " + d.write.detail;
            return d;
        }

        d.execution = sandbox_.execute(d.saved_path);
        d.status = SubmissionStatus::Completed;
        compose_message(d);
    } catch (const std::exception& e) {
        log_error("Pipeline", "#" + std::to_string(request_id) + " unexpected error: " + e.what());
        d.status = SubmissionStatus::WriteFailed;
        d.write.status = WriteStatus::Failed;
        d.write.detail = e.what();
        d.message = std::string("Internal error: ") + e.what();
    }
    return d;
}

void CapturePipeline::persist(Disposition& d, const std::string& body, const std::string& content) {
    SyncResult sync;
    std::filesystem::path saved;

    if (const auto* tracked = std::get_if<Tracked>(&*d.decision)) {
        sync = sync_.sync(*tracked, content);
        d.path = tracked->relative_path;
        saved = tracked->absolute_path;
    } else if (const auto* fallback = std::get_if<Fallback>(&*d.decision)) {
        sync = sync_.save(*fallback, content);
        saved = fallback->absolute_path;
        d.path = saved.string();
    } else {
        const auto& rejected = std::get<Rejected>(*d.decision);
        saved = rejected_capture_path(d.sanitized_path, body);
        log_warn("Pipeline", "filename rejected (" + rejected.reason + "), saving as " + saved.filename().string());
        sync = sync_.save(Fallback{saved}, content);
        d.path = saved.string();
    }

    d.write = sync.write;
    d.commit = sync.commit;
    d.saved_path = saved.string();
    if (d.language.empty()) d.language = language_for_extension(saved.extension().string());
}

std::filesystem::path CapturePipeline::rejected_capture_path(const std::string& sanitized,
                                                             const std::string& body) const {
    if (!sanitized.empty()) {
        std::filesystem::path hint(sanitized);
        std::string stem = hint.stem().string();
        std::string ext = hint.extension().string();
        return generate_capture_path(resolver_.quarantine_root(), ext.empty() ? kDefaultExtension : ext,
                                     stem.empty() ? "code" : stem);
    }
    LanguageGuess guess = detect_language(body);
    return generate_capture_path(resolver_.quarantine_root(), guess.extension, prefix_for_language(guess.name));
}

void CapturePipeline::compose_message(Disposition& d) const {
    std::ostringstream oss;
    if (d.write.status == WriteStatus::Unchanged) oss << "Content unchanged: " << d.path;
    else oss << "Code saved to " << d.path;

    switch (d.commit.status) {
        case CommitStatus::Committed:
            oss << (d.commit.amended ? " (commit amended)" : " (committed)");
            break;
        case CommitStatus::SkippedIdentical: oss << " (no commit, identical)"; break;
        case CommitStatus::SkippedNoRepo: oss << " (no repository)"; break;
        case CommitStatus::Failed: oss << " (commit failed: " << d.commit.detail << ")"; break;
        case CommitStatus::NotApplicable: break;
    }

    if (d.execution.status != ExecStatus::NotExecuted) oss << "; execution " << to_string(d.execution.status);
    d.message = oss.str();
    log_info("Pipeline", "#" + std::to_string(d.request_id) + " " + d.message);
}

}
