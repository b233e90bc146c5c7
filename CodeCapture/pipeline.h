#ifndef _CodeCapture_pipeline_h_
#define _CodeCapture_pipeline_h_

namespace Capture {

// ============================================================================
// Submission-to-disposition pipeline
// ============================================================================

struct PipelineSettings {
    std::filesystem::path working_root;       // git working tree (when is_repo)
    std::filesystem::path quarantine_root;    // fallback captures
    bool is_repo = false;
    std::string marker_token = kDefaultMarkerToken;
    bool amend_single_file = false;
    SandboxConfig sandbox;
};

// Not thread safe; SubmissionSerializer is the only intended caller.
class CapturePipeline {
public:
    explicit CapturePipeline(PipelineSettings settings);
    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    // marker -> sanitize -> resolve -> write/commit -> execute
    Disposition process(const std::string& payload, std::uint64_t request_id = 0);

    const PipelineSettings& settings() const { return settings_; }
    const GitRepository& repository() const { return repo_; }
    void set_auto_run(bool python, bool shell);

private:
    void persist(Disposition& d, const std::string& body, const std::string& content);
    std::filesystem::path rejected_capture_path(const std::string& sanitized, const std::string& body) const;
    void compose_message(Disposition& d) const;

    PipelineSettings settings_;
    GitRepository repo_;
    PathResolver resolver_;
    VcsSynchronizer sync_;
    ExecutionSandbox sandbox_;
};

}

#endif
