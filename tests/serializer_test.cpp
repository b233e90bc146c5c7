/**
 * Unit tests for the submission serializer (validation, ordering, busy gate)
 */

#include "test_support.h"

using namespace Capture;
using TestSupport::TempDir;

PipelineSettings plain_settings(const std::filesystem::path& root) {
    PipelineSettings s;
    s.working_root = root;
    s.quarantine_root = root / "received_codes";
    return s;
}

void test_validation() {
    std::cout << "Running payload validation tests..." << std::endl;

    TempDir root("serial");
    CapturePipeline pipeline(plain_settings(root.path()));
    SubmissionSerializer serializer(pipeline);

    Disposition d = serializer.submit("");
    assert(d.status == SubmissionStatus::InvalidInput);
    assert(d.message == "No code provided");
    assert(!d.decision.has_value());
    assert(d.request_id == 1);

    d = serializer.submit(" \n\t ");
    assert(d.status == SubmissionStatus::InvalidInput);
    assert(d.request_id == 2);

    d = serializer.submit("print(1)");
    assert(d.status == SubmissionStatus::Completed);
    assert(d.request_id == 3);
    assert(serializer.last_request_id() == 3);
    assert(!std::filesystem::exists(root / "received_codes") ||
           std::distance(std::filesystem::directory_iterator(root / "received_codes"),
                         std::filesystem::directory_iterator()) == 1);

    std::cout << "Payload validation tests passed!" << std::endl;
}

void test_concurrent_submissions() {
    std::cout << "Running concurrent submission tests..." << std::endl;

    TempDir root("concurrent");
    CapturePipeline pipeline(plain_settings(root.path()));
    SubmissionSerializer serializer(pipeline);

    const int kThreads = 8;
    std::vector<Disposition> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] { results[i] = serializer.submit("value = " + std::to_string(i) + "\n"); });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> paths;
    std::set<std::uint64_t> ids;
    for (const auto& d : results) {
        assert(d.status == SubmissionStatus::Completed);
        paths.insert(d.saved_path);
        ids.insert(d.request_id);
    }
    // Generated names never collide while the gate is held
    assert(paths.size() == static_cast<size_t>(kThreads));
    assert(ids.size() == static_cast<size_t>(kThreads));
    assert(serializer.last_request_id() == static_cast<std::uint64_t>(kThreads));

    std::set<std::string> contents;
    for (const auto& p : paths) contents.insert(TestSupport::read_file(p));
    assert(contents.size() == static_cast<size_t>(kThreads));

    std::cout << "Concurrent submission tests passed!" << std::endl;
}

void test_exclusive_section() {
    std::cout << "Running exclusive section tests..." << std::endl;

    TempDir root("exclusive");
    CapturePipeline pipeline(plain_settings(root.path()));
    SubmissionSerializer serializer(pipeline);

    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] {
            serializer.with_exclusive([&](CapturePipeline&) {
                int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                --inside;
            });
        });
    }
    for (auto& t : threads) t.join();
    assert(max_inside.load() == 1);

    bool run_shell = serializer.with_exclusive([](CapturePipeline& p) {
        p.set_auto_run(false, true);
        return p.settings().sandbox.run_shell;
    });
    assert(run_shell);

    std::cout << "Exclusive section tests passed!" << std::endl;
}

void test_busy() {
    std::cout << "Running busy gate tests..." << std::endl;

    TempDir root("busy");
    CapturePipeline pipeline(plain_settings(root.path()));
    SubmissionSerializer serializer(pipeline, std::chrono::milliseconds(50));
    assert(serializer.lock_wait() == std::chrono::milliseconds(50));

    std::atomic<bool> holding{false};
    std::atomic<bool> release{false};
    std::thread holder([&] {
        serializer.with_exclusive([&](CapturePipeline&) {
            holding = true;
            while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        });
    });
    while (!holding) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    Disposition d = serializer.submit("print(1)");
    assert(d.status == SubmissionStatus::Busy);
    assert(!d.decision.has_value());
    assert(!std::filesystem::exists(root / "received_codes"));

    release = true;
    holder.join();

    d = serializer.submit("print(1)");
    assert(d.status == SubmissionStatus::Completed);

    // Waiting indefinitely never reports busy
    serializer.set_lock_wait(std::chrono::milliseconds(0));
    release = false;
    holding = false;
    std::thread second([&] {
        serializer.with_exclusive([&](CapturePipeline&) {
            holding = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        });
    });
    while (!holding) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    d = serializer.submit("print(2)");
    assert(d.status == SubmissionStatus::Completed);
    second.join();

    std::cout << "Busy gate tests passed!" << std::endl;
}

int main() {
    std::cout << "Starting serializer tests..." << std::endl;
    set_quiet(true);

    test_validation();
    test_concurrent_submissions();
    test_exclusive_section();
    test_busy();

    std::cout << "All tests passed successfully!" << std::endl;
    return 0;
}
