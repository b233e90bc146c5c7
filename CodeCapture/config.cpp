#include "CodeCapture.h"

namespace Capture {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

int parse_port(const std::string& text) {
    try {
        size_t used = 0;
        int port = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return port;
    } catch (const std::exception&) {
        throw std::runtime_error("invalid port '" + text + "'");
    }
}

double parse_seconds(const std::string& option, const std::string& text) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size() || v < 0) throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error(option + " expects a non-negative number of seconds, got '" + text + "'");
    }
}

int clamp_port(int port) {
    int clamped = std::clamp(port, 1, 65535);
    if (clamped != port) log_warn("Config", "port " + std::to_string(port) + " out of range, using " + std::to_string(clamped));
    return clamped;
}

} // namespace

CaptureConfig default_config(const std::filesystem::path& working_root) {
    CaptureConfig config;
    config.working_root = canonical_root(working_root);
    return config;
}

void apply_config_file(CaptureConfig& config, const std::string& json_text) {
    JsonObject obj = parse_json_object(json_text);

    auto find = [&](const char* key, bool (JsonValue::*is_kind)() const, const char* expected) -> const JsonValue* {
        auto it = obj.find(key);
        if (it == obj.end()) return nullptr;
        if (!(it->second.*is_kind)()) {
            log_warn("Config", std::string("ignoring '") + key + "': expected " + expected);
            return nullptr;
        }
        return &it->second;
    };

    if (auto v = find("port", &JsonValue::is_number, "a number")) config.port = clamp_port(static_cast<int>(std::clamp(v->number, -1.0e6, 1.0e6)));
    if (auto v = find("auto_run_python", &JsonValue::is_bool, "true/false")) config.auto_run_python = v->boolean;
    if (auto v = find("auto_run_shell", &JsonValue::is_bool, "true/false")) config.auto_run_shell = v->boolean;
    if (auto v = find("git_amend_single_file", &JsonValue::is_bool, "true/false")) config.git_amend_single_file = v->boolean;
    if (auto v = find("save_dir", &JsonValue::is_string, "a string")) {
        if (!v->text.empty()) config.save_dir = v->text;
    }
    if (auto v = find("log_dir", &JsonValue::is_string, "a string")) {
        if (!v->text.empty()) config.log_dir = v->text;
    }
    if (auto v = find("marker_token", &JsonValue::is_string, "a string")) {
        std::string token = trim_copy(v->text);
        if (token.empty()) log_warn("Config", "ignoring empty marker_token");
        else config.marker_token = token;
    }
    if (auto v = find("python_interpreter", &JsonValue::is_string, "a string")) config.python_interpreter = v->text;
    if (auto v = find("shell_interpreter", &JsonValue::is_string, "a string")) config.shell_interpreter = v->text;
    if (auto v = find("exec_timeout_seconds", &JsonValue::is_number, "a number")) {
        if (v->number > 0) config.exec_timeout_seconds = v->number;
    }
    if (auto v = find("syntax_timeout_seconds", &JsonValue::is_number, "a number")) {
        if (v->number > 0) config.syntax_timeout_seconds = v->number;
    }
    if (auto v = find("lock_wait_seconds", &JsonValue::is_number, "a number")) {
        if (v->number >= 0) config.lock_wait_seconds = v->number;
    }
}

bool load_config_file(CaptureConfig& config) {
    auto path = resolve_in_root(config, config.config_file);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        log_info("Config", "no config file at " + path.string() + ", using defaults");
        return false;
    }
    try {
        apply_config_file(config, read_text_file(path));
    } catch (const std::exception& e) {
        log_warn("Config", "cannot use " + path.string() + ": " + e.what());
        return false;
    }
    log_info("Config", "loaded " + path.string());
    return true;
}

const char* command_line_usage() {
    return "usage: capture_server [-p|--port <port>] [--shell] [--enable-python-run]\n"
           "                      [--save-dir <dir>] [--log-dir <dir>] [--config <file>]\n"
           "                      [--marker <token>] [--lock-wait <seconds>] [--quiet]";
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cli;
    auto value_of = [&](size_t& i, const std::string& option) -> const std::string& {
        if (i + 1 >= args.size()) throw std::runtime_error(option + " requires a value");
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--port" || arg == "-p") {
            cli.port = parse_port(value_of(i, arg));
            continue;
        }
        if (arg == "--shell") {
            cli.enable_shell = true;
            continue;
        }
        if (arg == "--enable-python-run") {
            cli.enable_python = true;
            continue;
        }
        if (arg == "--save-dir") {
            cli.save_dir = value_of(i, arg);
            continue;
        }
        if (arg == "--log-dir") {
            cli.log_dir = value_of(i, arg);
            continue;
        }
        if (arg == "--config") {
            cli.config_file = value_of(i, arg);
            continue;
        }
        if (arg == "--marker") {
            std::string token = trim_copy(value_of(i, arg));
            if (token.empty()) throw std::runtime_error("--marker requires a non-empty token");
            cli.marker_token = token;
            continue;
        }
        if (arg == "--lock-wait") {
            cli.lock_wait_seconds = parse_seconds(arg, value_of(i, arg));
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            cli.quiet = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            cli.help = true;
            continue;
        }
        throw std::runtime_error("unknown option '" + arg + "'");
    }
    return cli;
}

void apply_command_line(CaptureConfig& config, const CommandLine& cli) {
    if (cli.port) config.port = clamp_port(*cli.port);
    if (cli.enable_shell) config.auto_run_shell = true;
    if (cli.enable_python) config.auto_run_python = true;
    if (cli.save_dir) config.save_dir = *cli.save_dir;
    if (cli.log_dir) config.log_dir = *cli.log_dir;
    if (cli.config_file) config.config_file = *cli.config_file;
    if (cli.marker_token) config.marker_token = *cli.marker_token;
    if (cli.lock_wait_seconds) config.lock_wait_seconds = *cli.lock_wait_seconds;
    if (cli.quiet) config.quiet = true;
}

std::filesystem::path resolve_in_root(const CaptureConfig& config, const std::filesystem::path& p) {
    if (p.is_absolute()) return p.lexically_normal();
    return (config.working_root / p).lexically_normal();
}

std::string config_to_json(const CaptureConfig& config) {
    JsonObjectBuilder b;
    b.add("port", config.port)
     .add("auto_run_python", config.auto_run_python)
     .add("auto_run_shell", config.auto_run_shell)
     .add("save_dir", config.save_dir.string())
     .add("log_dir", config.log_dir.string())
     .add("marker_token", config.marker_token)
     .add("python_interpreter", config.python_interpreter)
     .add("shell_interpreter", config.shell_interpreter)
     .add("exec_timeout_seconds", config.exec_timeout_seconds)
     .add("syntax_timeout_seconds", config.syntax_timeout_seconds)
     .add("lock_wait_seconds", config.lock_wait_seconds)
     .add("git_amend_single_file", config.git_amend_single_file);
    return b.str();
}

bool save_config(const CaptureConfig& config, const ConfigUpdate& update) {
    // Start from what the file holds so command-line overrides stay transient.
    CaptureConfig stored = default_config(config.working_root);
    stored.config_file = config.config_file;
    load_config_file(stored);

    if (update.port) stored.port = clamp_port(*update.port);
    if (update.auto_run_python) stored.auto_run_python = *update.auto_run_python;
    if (update.auto_run_shell) stored.auto_run_shell = *update.auto_run_shell;

    auto path = resolve_in_root(config, config.config_file);
    try {
        write_text_file(path, config_to_json(stored) + "\n");
    } catch (const std::exception& e) {
        log_error("Config", std::string("cannot save configuration: ") + e.what());
        return false;
    }
    log_info("Config", "saved " + path.string());
    return true;
}

PipelineSettings make_pipeline_settings(const CaptureConfig& config) {
    PipelineSettings s;
    s.working_root = config.working_root;
    s.quarantine_root = resolve_in_root(config, config.save_dir);
    s.is_repo = config.is_repo;
    s.marker_token = config.marker_token;
    s.amend_single_file = config.git_amend_single_file;
    s.sandbox.run_python = config.auto_run_python;
    s.sandbox.run_shell = config.auto_run_shell;
    s.sandbox.python_interpreter = config.python_interpreter;
    s.sandbox.shell_interpreter = config.shell_interpreter;
    s.sandbox.exec_timeout = seconds_to_ms(config.exec_timeout_seconds);
    s.sandbox.syntax_timeout = seconds_to_ms(config.syntax_timeout_seconds);
    s.sandbox.log_dir = resolve_in_root(config, config.log_dir);
    return s;
}

}
