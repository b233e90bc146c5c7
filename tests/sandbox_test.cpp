/**
 * Unit tests for the execution sandbox (syntax check, run, timeout, logs)
 */

#include "test_support.h"

using namespace Capture;
using TestSupport::TempDir;

SandboxConfig shell_config(const std::filesystem::path& log_dir) {
    SandboxConfig c;
    c.run_shell = true;
    c.log_dir = log_dir;
    c.exec_timeout = std::chrono::milliseconds(5000);
    c.syntax_timeout = std::chrono::milliseconds(5000);
    return c;
}

void test_capabilities() {
    std::cout << "Running capability table tests..." << std::endl;

    assert(script_kind_for("a.py") == ScriptKind::Python);
    assert(script_kind_for("dir/b.SH") == ScriptKind::Shell);
    assert(script_kind_for("c.txt") == ScriptKind::Unknown);
    assert(script_kind_for("noext") == ScriptKind::Unknown);

    assert(std::string(script_kind_label(ScriptKind::Python)) == "python");
    assert(std::string(script_kind_label(ScriptKind::Shell)) == "shell");
    assert(script_capability(ScriptKind::Python).syntax_checkable);
    assert(script_capability(ScriptKind::Shell).interpreters.front() == "bash");
    assert(!script_capability(ScriptKind::Unknown).syntax_checkable);
    assert(script_capability(ScriptKind::Unknown).interpreters.empty());

    std::cout << "Capability table tests passed!" << std::endl;
}

void test_not_executed() {
    std::cout << "Running not-executed tests..." << std::endl;

    TempDir dir("sandbox");
    TestSupport::write_file(dir / "notes.txt", "hello\n");
    TestSupport::write_file(dir / "job.py", "print(1)\n");

    ExecutionSandbox off{SandboxConfig{}};
    ExecutionResult r = off.execute(dir / "notes.txt");
    assert(r.status == ExecStatus::NotExecuted);
    assert(!r.detail.empty());

    r = off.execute(dir / "job.py");
    assert(r.status == ExecStatus::NotExecuted);
    assert(r.detail.find("disabled") != std::string::npos);
    assert(!off.enabled_for(ScriptKind::Python));
    assert(!off.enabled_for(ScriptKind::Unknown));

    SandboxConfig missing = shell_config(dir / "logs");
    missing.shell_interpreter = "capture-no-such-shell-xyz";
    TestSupport::write_file(dir / "run.sh", "echo hi\n");
    ExecutionSandbox no_interp(missing);
    r = no_interp.execute(dir / "run.sh");
    assert(r.status == ExecStatus::InterpreterMissing);

    std::cout << "Not-executed tests passed!" << std::endl;
}

void test_shell_runs() {
    std::cout << "Running shell execution tests..." << std::endl;

    TempDir dir("shell");
    ExecutionSandbox sandbox(shell_config(dir / "logs"));
    assert(sandbox.resolve_interpreter(ScriptKind::Shell).has_value());

    TestSupport::write_file(dir / "hello.sh", "echo hi\necho oops >&2\n");
    ExecutionResult r = sandbox.execute(dir / "hello.sh");
    assert(r.status == ExecStatus::Ok);
    assert(r.exit_code == 0);
    assert(r.out == "hi\n");
    assert(r.err == "oops\n");
    assert(r.log_path == (dir / "logs/hello_shell_run.log").string());
    std::string log = TestSupport::read_file(r.log_path);
    assert(log.find("--- STDOUT ---\nhi\n") != std::string::npos);

    // Scripts run next to the saved file
    TestSupport::write_file(dir / "sub/where.sh", "pwd -P > where.txt\n");
    r = sandbox.execute(dir / "sub/where.sh");
    assert(r.status == ExecStatus::Ok);
    assert(TestSupport::read_file(dir / "sub/where.txt") == (dir / "sub").string() + "\n");

    TestSupport::write_file(dir / "fail.sh", "exit 3\n");
    r = sandbox.execute(dir / "fail.sh");
    assert(r.status == ExecStatus::Failed);
    assert(r.exit_code == 3);

    TestSupport::write_file(dir / "broken.sh", "if then fi (\n");
    r = sandbox.execute(dir / "broken.sh");
    assert(r.status == ExecStatus::SyntaxError);
    assert(r.log_path == (dir / "logs/broken_shell_syntax.log").string());
    assert(std::filesystem::exists(r.log_path));

    std::cout << "Shell execution tests passed!" << std::endl;
}

void test_shell_timeout() {
    std::cout << "Running execution timeout tests..." << std::endl;

    TempDir dir("timeout");
    SandboxConfig c = shell_config(dir / "logs");
    c.exec_timeout = std::chrono::milliseconds(300);
    ExecutionSandbox sandbox(c);

    TestSupport::write_file(dir / "slow.sh", "sleep 10\n");
    auto begin = std::chrono::steady_clock::now();
    ExecutionResult r = sandbox.execute(dir / "slow.sh");
    assert(r.status == ExecStatus::TimedOut);
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));

    // No log directory configured: nothing is written
    c.log_dir.clear();
    ExecutionSandbox quiet(c);
    TestSupport::write_file(dir / "ok.sh", "true\n");
    r = quiet.execute(dir / "ok.sh");
    assert(r.status == ExecStatus::Ok);
    assert(r.log_path.empty());

    std::cout << "Execution timeout tests passed!" << std::endl;
}

void test_python_runs() {
    std::cout << "Running python execution tests..." << std::endl;

    TempDir dir("python");
    SandboxConfig c;
    c.run_python = true;
    c.log_dir = dir / "logs";
    ExecutionSandbox sandbox(c);

    TestSupport::write_file(dir / "calc.py", "print(1 + 1)\n");
    ExecutionResult r = sandbox.execute(dir / "calc.py");
    assert(r.status == ExecStatus::Ok);
    assert(r.out == "2\n");

    // Compile check must not run the script
    TestSupport::write_file(dir / "bad.py", "open('ran.txt', 'w')\ndef (:\n");
    r = sandbox.execute(dir / "bad.py");
    assert(r.status == ExecStatus::SyntaxError);
    assert(!std::filesystem::exists(dir / "ran.txt"));
    assert(std::filesystem::exists(dir / "logs/bad_python_syntax.log"));

    TestSupport::write_file(dir / "exit2.py", "raise SystemExit(2)\n");
    r = sandbox.execute(dir / "exit2.py");
    assert(r.status == ExecStatus::Failed);
    assert(r.exit_code == 2);

    std::cout << "Python execution tests passed!" << std::endl;
}

int main() {
    std::cout << "Starting sandbox tests..." << std::endl;
    set_quiet(true);

    test_capabilities();
    test_not_executed();
    if (TestSupport::tool_available("sh")) {
        test_shell_runs();
        test_shell_timeout();
    }
    if (TestSupport::tool_available("python3")) test_python_runs();

    std::cout << "All tests passed successfully!" << std::endl;
    return 0;
}
