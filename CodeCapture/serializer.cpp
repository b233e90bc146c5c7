#include "CodeCapture.h"

namespace Capture {

SubmissionSerializer::SubmissionSerializer(CapturePipeline& pipeline, std::chrono::milliseconds lock_wait)
    : pipeline_(pipeline), lock_wait_ms_(lock_wait.count()) {}

Disposition SubmissionSerializer::submit(const std::string& payload) {
    const std::uint64_t id = next_id_++;

    if (is_blank(payload)) {
        Disposition d;
        d.request_id = id;
        d.status = SubmissionStatus::InvalidInput;
        d.message = "No code provided";
        log_warn("Serializer", "#" + std::to_string(id) + " rejected: empty payload");
        return d;
    }

    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    const auto wait = lock_wait();
    if (wait.count() > 0) {
        if (!lock.try_lock_for(wait)) {
            Disposition d;
            d.request_id = id;
            d.status = SubmissionStatus::Busy;
            d.message = "Server busy, another submission is being processed";
            log_warn("Serializer", "#" + std::to_string(id) + " gave up after " + std::to_string(wait.count()) + " ms");
            return d;
        }
    } else {
        lock.lock();
    }

    return pipeline_.process(payload, id);
}

}
