#ifndef _CodeCapture_config_h_
#define _CodeCapture_config_h_

namespace Capture {

// ============================================================================
// Server configuration: defaults -> server_config.json -> command line
// ============================================================================

constexpr int kDefaultPort = 5000;

struct CaptureConfig {
    int port = kDefaultPort;
    std::filesystem::path working_root;                     // absolute
    std::filesystem::path save_dir = "received_codes";      // relative to working_root unless absolute
    std::filesystem::path log_dir = "logs";
    std::filesystem::path config_file = "server_config.json";
    std::string marker_token = kDefaultMarkerToken;
    bool auto_run_python = false;
    bool auto_run_shell = false;
    std::string python_interpreter;
    std::string shell_interpreter;
    double exec_timeout_seconds = 15.0;
    double syntax_timeout_seconds = 10.0;
    double lock_wait_seconds = 0.0;                         // 0 = wait indefinitely
    bool git_amend_single_file = false;
    bool is_repo = false;                                   // detected, never read from file
    bool quiet = false;
};

CaptureConfig default_config(const std::filesystem::path& working_root);

// Overlays the keys present in a JSON object. Unknown keys are ignored,
// wrongly typed values are skipped with a warning. Throws on malformed JSON.
void apply_config_file(CaptureConfig& config, const std::string& json_text);

// Reads config.config_file. Returns false when the file is absent or unreadable.
bool load_config_file(CaptureConfig& config);

struct CommandLine {
    std::optional<int> port;
    bool enable_shell = false;
    bool enable_python = false;
    std::optional<std::filesystem::path> save_dir;
    std::optional<std::filesystem::path> log_dir;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> marker_token;
    std::optional<double> lock_wait_seconds;
    bool quiet = false;
    bool help = false;
};

const char* command_line_usage();

// args excludes argv[0]. Throws std::runtime_error on bad usage.
CommandLine parse_command_line(const std::vector<std::string>& args);
void apply_command_line(CaptureConfig& config, const CommandLine& cli);

// Relative paths are taken against working_root.
std::filesystem::path resolve_in_root(const CaptureConfig& config, const std::filesystem::path& p);

// Keys of the config file that can be changed at runtime.
struct ConfigUpdate {
    std::optional<int> port;
    std::optional<bool> auto_run_python;
    std::optional<bool> auto_run_shell;
};

std::string config_to_json(const CaptureConfig& config);

// Merges update into the file-backed configuration and rewrites the file.
// Returns false (and logs) when the file cannot be written.
bool save_config(const CaptureConfig& config, const ConfigUpdate& update);

PipelineSettings make_pipeline_settings(const CaptureConfig& config);

}

#endif
