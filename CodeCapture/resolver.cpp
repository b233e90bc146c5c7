#include "CodeCapture.h"

namespace Capture {

const char* decision_kind(const ResolutionDecision& decision) {
    if (std::holds_alternative<Tracked>(decision)) return "tracked";
    if (std::holds_alternative<Fallback>(decision)) return "fallback";
    return "rejected";
}

PathResolver::PathResolver(const GitRepository& repo, std::filesystem::path quarantine_root)
    : repo_(repo), quarantine_root_(canonical_root(quarantine_root)) {}

ResolutionDecision PathResolver::resolve(const std::string& sanitized) const {
    TRACE_FN("sanitized=", sanitized);
    if (sanitized.empty()) return Rejected{"no usable filename"};
    if (!repo_.available()) return fallback(sanitized);

    std::string candidate = sanitized;
    if (is_bare_basename(sanitized)) {
        if (auto found = repo_.find_tracked_by_basename(sanitized)) candidate = *found;
    }

    const std::filesystem::path& root = repo_.root();
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(root / candidate, ec);
    if (ec) absolute = (root / candidate).lexically_normal();

    if (!is_within_root(root, absolute)) {
        log_warn("Resolver", "'" + candidate + "' resolves to " + absolute.string() + ", outside " + root.string());
        return Rejected{"escapes repository root"};
    }

    if (repo_.is_tracked(candidate)) return Tracked{candidate, absolute};

    log_info("Resolver", "'" + candidate + "' is not tracked, using quarantine");
    return fallback(sanitized);
}

ResolutionDecision PathResolver::fallback(const std::string& sanitized) const {
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(quarantine_root_ / sanitized, ec);
    if (ec) absolute = (quarantine_root_ / sanitized).lexically_normal();

    if (!is_within_root(quarantine_root_, absolute)) {
        log_warn("Resolver", "'" + sanitized + "' resolves to " + absolute.string() + ", outside " +
                                 quarantine_root_.string());
        return Rejected{"escapes quarantine root"};
    }
    return Fallback{absolute};
}

}
