#include "CodeCapture.h"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_stop_signal(int){
    g_stop_requested = 1;
}

bool ensure_directory(const std::filesystem::path& dir, const char* what){
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if(ec){
        std::cerr << "failed to create " << what << " directory '" << dir.string() << "': " << ec.message() << "\n";
        return false;
    }
    return true;
}

void print_settings(const Capture::CaptureConfig& config){
    using Capture::resolve_in_root;
    std::cout << "--- Code Capture Server ---\n";
    std::cout << "Working directory: " << config.working_root.string() << "\n";
    std::cout << "Git repository:    " << (config.is_repo ? "yes" : "no (saving to capture directory only)") << "\n";
    std::cout << "Capture directory: " << resolve_in_root(config, config.save_dir).string() << "\n";
    std::cout << "Log directory:     " << resolve_in_root(config, config.log_dir).string() << "\n";
    std::cout << "Config file:       " << resolve_in_root(config, config.config_file).string() << "\n";
    std::cout << "Marker token:      " << config.marker_token << "\n";
    std::cout << "Auto-run python:   " << (config.auto_run_python ? "enabled" : "disabled") << "\n";
    std::cout << "Auto-run shell:    " << (config.auto_run_shell ? "enabled" : "disabled") << "\n";
    if(config.lock_wait_seconds > 0)
        std::cout << "Busy after:        " << config.lock_wait_seconds << "s waiting for a running submission\n";
    std::cout << "Listening on:      http://localhost:" << config.port << "/submit_code\n";
    std::cout.flush();
}

}

int main(int argc, char** argv){
    using namespace Capture;
    TRACE_FN();

    std::vector<std::string> args;
    for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    CommandLine cli;
    try{
        cli = parse_command_line(args);
    } catch(const std::exception& e){
        std::cerr << e.what() << "\n" << command_line_usage() << "\n";
        return 1;
    }
    if(cli.help){
        std::cout << command_line_usage() << "\n";
        return 0;
    }
    set_quiet(cli.quiet);

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if(ec){
        std::cerr << "cannot determine working directory: " << ec.message() << "\n";
        return 1;
    }

    // defaults -> config file (possibly named on the command line) -> command line
    CaptureConfig config = default_config(cwd);
    if(cli.config_file) config.config_file = *cli.config_file;
    load_config_file(config);
    apply_command_line(config, cli);
    config.is_repo = GitRepository::is_work_tree(config.working_root);
    set_quiet(config.quiet);

    if(!ensure_directory(resolve_in_root(config, config.save_dir), "capture")) return 1;
    if(!ensure_directory(resolve_in_root(config, config.log_dir), "log")) return 1;

    std::unique_ptr<CapturePipeline> pipeline;
    try{
        pipeline = std::make_unique<CapturePipeline>(make_pipeline_settings(config));
    } catch(const std::exception& e){
        std::cerr << "failed to initialize capture pipeline: " << e.what() << "\n";
        return 1;
    }

    auto lock_wait = std::chrono::milliseconds(static_cast<long long>(std::llround(config.lock_wait_seconds * 1000.0)));
    SubmissionSerializer serializer(*pipeline, lock_wait);
    CaptureService service(config, serializer);

    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    print_settings(config);
    if(!WebServer::start(config.port, [&service](const WebServer::Request& r){ return service.handle(r); })){
        std::cerr << "Failed to start web server on port " << config.port << "\n";
        return 1;
    }
    std::cout << "Server running. Press Ctrl+C to stop.\n";
    std::cout.flush();

    while(WebServer::is_running() && !g_stop_requested){
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down...\n";
    WebServer::stop();
    return 0;
}
