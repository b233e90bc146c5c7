#ifndef _CodeCapture_resolver_h_
#define _CodeCapture_resolver_h_

namespace Capture {

// ============================================================================
// Path resolution policy: tracked file reuse vs. quarantine fallback
// ============================================================================

struct Tracked {
    std::string relative_path;              // as the VCS knows it
    std::filesystem::path absolute_path;
};

struct Fallback {
    std::filesystem::path absolute_path;    // inside the quarantine root
};

struct Rejected {
    std::string reason;
};

using ResolutionDecision = std::variant<Tracked, Fallback, Rejected>;

const char* decision_kind(const ResolutionDecision& decision);   // "tracked" / "fallback" / "rejected"

class PathResolver {
public:
    PathResolver(const GitRepository& repo, std::filesystem::path quarantine_root);

    // Exactly one decision per sanitized path. Non-rejected paths are
    // always strictly inside their governing root.
    ResolutionDecision resolve(const std::string& sanitized) const;

    const std::filesystem::path& quarantine_root() const { return quarantine_root_; }

private:
    ResolutionDecision fallback(const std::string& sanitized) const;

    const GitRepository& repo_;
    std::filesystem::path quarantine_root_;
};

}

#endif
