#ifndef _CodeCapture_serializer_h_
#define _CodeCapture_serializer_h_

namespace Capture {

// Single mutual-exclusion gate in front of CapturePipeline. At most one
// submission is between marker extraction and execution at any time.
class SubmissionSerializer {
public:
    // lock_wait == 0 waits indefinitely; otherwise a submission that cannot
    // enter within lock_wait comes back as SubmissionStatus::Busy.
    explicit SubmissionSerializer(CapturePipeline& pipeline,
                                  std::chrono::milliseconds lock_wait = std::chrono::milliseconds(0));

    Disposition submit(const std::string& payload);

    // Runs fn(pipeline) inside the gate (blocking), e.g. for config updates.
    template<typename Fn>
    auto with_exclusive(Fn&& fn) -> decltype(fn(std::declval<CapturePipeline&>())) {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        return fn(pipeline_);
    }

    void set_lock_wait(std::chrono::milliseconds wait) { lock_wait_ms_ = wait.count(); }
    std::chrono::milliseconds lock_wait() const { return std::chrono::milliseconds(lock_wait_ms_.load()); }
    std::uint64_t last_request_id() const { return next_id_.load() - 1; }

private:
    CapturePipeline& pipeline_;
    std::timed_mutex mutex_;
    std::atomic<std::uint64_t> next_id_{1};
    std::atomic<long long> lock_wait_ms_;
};

}

#endif
