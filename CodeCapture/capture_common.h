#ifndef _CodeCapture_capture_common_h_
#define _CodeCapture_capture_common_h_

// Tracing (optional debug feature, build with -DCAPTURE_TRACE)
#ifdef CAPTURE_TRACE
namespace capture_trace {
    void log_line(const std::string& line);

    inline std::string concat(){ return {}; }

    template<typename... Args>
    std::string concat(Args&&... args){
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    struct Scope {
        std::string name;
        Scope(const char* fn, const std::string& details);
        ~Scope();
    };
}

#define CAPTURE_TRACE_CAT(a,b) CAPTURE_TRACE_CAT_1(a,b)
#define CAPTURE_TRACE_CAT_1(a,b) a##b
#define TRACE_FN(...) auto CAPTURE_TRACE_CAT(_capture_trace_scope_, __LINE__) = ::capture_trace::Scope(__func__, ::capture_trace::concat(__VA_ARGS__))
#define TRACE_MSG(...) ::capture_trace::log_line(::capture_trace::concat(__VA_ARGS__))
#else
#define TRACE_FN(...)
#define TRACE_MSG(...)
#endif

namespace Capture {

// Component-prefixed diagnostics on stderr, e.g. "[Pipeline] saved ..."
enum class LogLevel { Info, Warning, Error };

void set_quiet(bool quiet);
bool is_quiet();
void log_line(LogLevel level, const char* component, const std::string& message);

inline void log_info(const char* component, const std::string& message){
    log_line(LogLevel::Info, component, message);
}
inline void log_warn(const char* component, const std::string& message){
    log_line(LogLevel::Warning, component, message);
}
inline void log_error(const char* component, const std::string& message){
    log_line(LogLevel::Error, component, message);
}

}

#endif
