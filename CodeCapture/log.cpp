#include "CodeCapture.h"

#ifdef CAPTURE_TRACE
namespace capture_trace {
    namespace {
        std::mutex& trace_mutex(){ static std::mutex m; return m; }
        std::ofstream& trace_stream(){
            static std::ofstream s("capture_trace.log", std::ios::app);
            return s;
        }
    }

    void log_line(const std::string& line){
        std::lock_guard<std::mutex> lock(trace_mutex());
        auto& os = trace_stream();
        os << line << '\n';
        os.flush();
    }

    Scope::Scope(const char* fn, const std::string& details) : name(fn ? fn : "?"){
        std::string msg = std::string("enter ") + name;
        if(!details.empty()) msg += " | " + details;
        log_line(msg);
    }

    Scope::~Scope(){
        log_line(std::string("exit ") + name);
    }
}
#endif

namespace Capture {

namespace {
    std::atomic<bool> g_quiet{false};

    std::mutex& output_mutex(){
        static std::mutex m;
        return m;
    }
}

void set_quiet(bool quiet){
    g_quiet.store(quiet, std::memory_order_relaxed);
}

bool is_quiet(){
    return g_quiet.load(std::memory_order_relaxed);
}

void log_line(LogLevel level, const char* component, const std::string& message){
    if(level == LogLevel::Info && is_quiet()) return;

    const char* tag = "";
    switch(level){
        case LogLevel::Info: break;
        case LogLevel::Warning: tag = "warning: "; break;
        case LogLevel::Error: tag = "error: "; break;
    }

    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[" << (component ? component : "?") << "] " << tag << message << "\n";
    std::cerr.flush();
#ifdef CAPTURE_TRACE
    capture_trace::log_line(std::string("log ") + (component ? component : "?") + " | " + message);
#endif
}

}
