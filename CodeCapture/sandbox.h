#ifndef _CodeCapture_sandbox_h_
#define _CodeCapture_sandbox_h_

namespace Capture {

// ============================================================================
// Execution sandbox: optional syntax check + timeout-bounded run
// ============================================================================

enum class ScriptKind { Python, Shell, Unknown };

struct ScriptCapability {
    ScriptKind kind;
    const char* label;                        // "python", "shell"
    const char* extension;
    bool syntax_checkable;
    std::vector<std::string> interpreters;    // PATH fallbacks, in order
};

const ScriptCapability& script_capability(ScriptKind kind);
ScriptKind script_kind_for(const std::filesystem::path& file);
const char* script_kind_label(ScriptKind kind);

struct SandboxConfig {
    bool run_python = false;
    bool run_shell = false;
    std::string python_interpreter;           // empty = PATH lookup
    std::string shell_interpreter;
    std::chrono::milliseconds exec_timeout{15000};
    std::chrono::milliseconds syntax_timeout{10000};
    std::filesystem::path log_dir;            // empty = no run logs
};

class ExecutionSandbox {
public:
    explicit ExecutionSandbox(SandboxConfig config);

    bool enabled_for(ScriptKind kind) const;
    std::optional<std::string> resolve_interpreter(ScriptKind kind) const;

    ExecutionResult execute(const std::filesystem::path& file) const;
    ExecutionResult execute(const std::filesystem::path& file, ScriptKind kind) const;

    const SandboxConfig& config() const { return config_; }

private:
    std::string write_log(const std::filesystem::path& file, const std::string& suffix,
                          const std::vector<std::string>& argv, const ProcessResult& r) const;

    SandboxConfig config_;
};

}

#endif
