#ifndef _CodeCapture_process_h_
#define _CodeCapture_process_h_

namespace Capture {

// ============================================================================
// Child process execution with captured output and a wall-clock deadline
// ============================================================================

struct ProcessOptions {
    std::string cwd;                          // Empty = inherit
    std::chrono::milliseconds timeout{0};     // 0 = wait indefinitely
};

struct ProcessResult {
    bool started = false;     // false when fork/exec/chdir failed
    bool timed_out = false;   // deadline hit, process group killed
    int exit_code = -1;       // valid when the child exited normally
    int term_signal = 0;      // non-zero when killed by a signal
    std::string out;
    std::string err;
    std::string error;        // spawn failure detail

    bool ok() const { return started && !timed_out && term_signal == 0 && exit_code == 0; }
    std::string combined_output() const { return out + err; }
};

// Runs argv[0] (PATH lookup) in its own process group. stdin is /dev/null.
// Never throws for child failures; inspect the result instead.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

// Runs argv[0] on the caller's terminal and waits. Returns the exit code,
// or -1 when the program could not be started or died from a signal.
int run_attached(const std::vector<std::string>& argv);

}

#endif
