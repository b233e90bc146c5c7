#include "CodeCapture.h"

namespace Capture {

namespace {

const char* kPythonCompileCheck =
    "import sys; compile(open(sys.argv[1], 'rb').read(), sys.argv[1], 'exec')";

std::string describe_exit(const ProcessResult& r) {
    if (!r.started) return "not started: " + r.error;
    if (r.timed_out) return "timed out";
    if (r.term_signal != 0) return "killed by signal " + std::to_string(r.term_signal);
    return "exit code " + std::to_string(r.exit_code);
}

} // namespace

const ScriptCapability& script_capability(ScriptKind kind) {
    static const std::vector<ScriptCapability> table = {
        {ScriptKind::Python, "python", ".py", true, {"python3", "python"}},
        {ScriptKind::Shell, "shell", ".sh", true, {"bash", "sh"}},
        {ScriptKind::Unknown, "unknown", "", false, {}},
    };
    for (const auto& cap : table) {
        if (cap.kind == kind) return cap;
    }
    return table.back();
}

ScriptKind script_kind_for(const std::filesystem::path& file) {
    std::string ext = to_lower_copy(file.extension().string());
    if (ext == ".py") return ScriptKind::Python;
    if (ext == ".sh") return ScriptKind::Shell;
    return ScriptKind::Unknown;
}

const char* script_kind_label(ScriptKind kind) {
    return script_capability(kind).label;
}

ExecutionSandbox::ExecutionSandbox(SandboxConfig config) : config_(std::move(config)) {}

bool ExecutionSandbox::enabled_for(ScriptKind kind) const {
    switch (kind) {
        case ScriptKind::Python: return config_.run_python;
        case ScriptKind::Shell: return config_.run_shell;
        case ScriptKind::Unknown: return false;
    }
    return false;
}

std::optional<std::string> ExecutionSandbox::resolve_interpreter(ScriptKind kind) const {
    const std::string& configured = kind == ScriptKind::Python ? config_.python_interpreter
                                                              : config_.shell_interpreter;
    if (!configured.empty()) return find_executable(configured);

    for (const auto& name : script_capability(kind).interpreters) {
        if (auto path = find_executable(name)) return path;
    }
    return std::nullopt;
}

ExecutionResult ExecutionSandbox::execute(const std::filesystem::path& file) const {
    return execute(file, script_kind_for(file));
}

ExecutionResult ExecutionSandbox::execute(const std::filesystem::path& file, ScriptKind kind) const {
    TRACE_FN("file=", file.string(), ", kind=", script_kind_label(kind));
    ExecutionResult result;
    const ScriptCapability& cap = script_capability(kind);

    if (kind == ScriptKind::Unknown) {
        result.detail = "no runner for this file type";
        return result;
    }
    if (!enabled_for(kind)) {
        result.detail = std::string("auto-run disabled for ") + cap.label;
        return result;
    }

    auto interpreter = resolve_interpreter(kind);
    if (!interpreter) {
        result.status = ExecStatus::InterpreterMissing;
        result.detail = std::string("no ") + cap.label + " interpreter found";
        log_warn("Sandbox", result.detail);
        return result;
    }

    const std::string script = file.string();

    if (cap.syntax_checkable) {
        std::vector<std::string> check_argv;
        if (kind == ScriptKind::Shell) check_argv = {*interpreter, "-n", script};
        else check_argv = {*interpreter, "-c", kPythonCompileCheck, script};

        ProcessOptions opts;
        opts.timeout = config_.syntax_timeout;
        ProcessResult check = run_process(check_argv, opts);
        if (!check.ok()) {
            result.exit_code = check.exit_code;
            result.out = check.out;
            result.err = check.err;
            result.log_path = write_log(file, std::string(cap.label) + "_syntax", check_argv, check);
            if (!check.started) {
                result.status = ExecStatus::Failed;
                result.detail = "syntax check " + describe_exit(check);
            } else if (check.timed_out) {
                result.status = ExecStatus::TimedOut;
                result.detail = "syntax check timed out";
            } else {
                result.status = ExecStatus::SyntaxError;
                result.detail = "syntax check failed with " + describe_exit(check);
            }
            log_warn("Sandbox", file.filename().string() + ": " + result.detail);
            return result;
        }
    }

    std::vector<std::string> run_argv{*interpreter, script};
    ProcessOptions opts;
    opts.cwd = file.parent_path().string();
    opts.timeout = config_.exec_timeout;
    log_info("Sandbox", "running " + join_args(run_argv));
    ProcessResult run = run_process(run_argv, opts);

    result.exit_code = run.exit_code;
    result.out = run.out;
    result.err = run.err;
    result.log_path = write_log(file, std::string(cap.label) + "_run", run_argv, run);

    if (!run.started) {
        result.status = ExecStatus::Failed;
        result.detail = describe_exit(run);
    } else if (run.timed_out) {
        result.status = ExecStatus::TimedOut;
        result.detail = "killed after " + std::to_string(config_.exec_timeout.count()) + " ms";
    } else if (run.ok()) {
        result.status = ExecStatus::Ok;
    } else {
        result.status = ExecStatus::Failed;
        result.detail = describe_exit(run);
    }
    log_info("Sandbox", file.filename().string() + ": " + to_string(result.status));
    return result;
}

std::string ExecutionSandbox::write_log(const std::filesystem::path& file, const std::string& suffix,
                                        const std::vector<std::string>& argv, const ProcessResult& r) const {
    if (config_.log_dir.empty()) return {};

    std::filesystem::path log_path = config_.log_dir / (file.stem().string() + "_" + suffix + ".log");
    std::ostringstream oss;
    oss << "File: " << file.string() << "\n"
        << "Command: " << join_args(argv) << "\n"
        << "Time: " << format_local_time("%Y-%m-%d %H:%M:%S") << "\n"
        << "Result: " << describe_exit(r) << "\n"
        << "--- STDOUT ---\n" << r.out << "\n"
        << "--- STDERR ---\n" << r.err << "\n";
    try {
        write_text_file(log_path, oss.str());
    } catch (const std::exception& e) {
        log_warn("Sandbox", std::string("cannot write run log: ") + e.what());
        return {};
    }
    return log_path.string();
}

}
