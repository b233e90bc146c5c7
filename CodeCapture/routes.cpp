#include "CodeCapture.h"

namespace Capture {

namespace {

using WebServer::Request;
using WebServer::Response;

Response json_response(int status, const std::string& body) {
    Response r;
    r.status = status;
    r.content_type = "application/json";
    r.body = body;
    return r;
}

Response error_response(int status, const std::string& message) {
    return json_response(status, JsonObjectBuilder().add("status", "error").add("message", message).str());
}

Response text_response(int status, const std::string& body) {
    Response r;
    r.status = status;
    r.content_type = "text/plain; charset=utf-8";
    r.body = body;
    return r;
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string url_encode(const std::string& s) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') oss << c;
        else oss << '%' << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

const char* kLogsPageHead =
    "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>Logs Browser</title><style>"
    "body{font-family:sans-serif;background-color:#f4f4f4;color:#333;margin:0;padding:20px}"
    "h1{color:#444;border-bottom:1px solid #ccc;padding-bottom:10px}ul{list-style:none;padding:0}"
    "li{background-color:#fff;margin-bottom:8px;border:1px solid #ddd;border-radius:4px}"
    "li a{color:#007bff;text-decoration:none;display:block;padding:12px 15px}li a:hover{background-color:#eee}"
    "p{color:#666}</style></head><body><h1>Available Logs</h1>";

} // namespace

int http_status_for(const Disposition& d) {
    switch (d.status) {
        case SubmissionStatus::Completed: return 200;
        case SubmissionStatus::InvalidInput: return 400;
        case SubmissionStatus::Busy: return 429;
        case SubmissionStatus::WriteFailed: return 500;
    }
    return 500;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

CaptureService::CaptureService(CaptureConfig config, SubmissionSerializer& serializer)
    : config_(std::move(config)), serializer_(serializer) {}

CaptureConfig CaptureService::config_snapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

Response CaptureService::handle(const Request& request) {
    std::string path = request.uri;
    size_t query = path.find('?');
    if (query != std::string::npos) path.erase(query);

    log_info("HTTP", request.method + " " + path);

    try {
        if (request.method == "OPTIONS") {
            Response r = text_response(204, "");
            return r;
        }
        if (path == "/submit_code") {
            if (request.method != "POST") return error_response(405, "Use POST");
            return submit_code(request.body);
        }
        if (path == "/status" || path == "/test_connection") {
            if (request.method != "GET") return error_response(405, "Use GET");
            return status();
        }
        if (path == "/update_config") {
            if (request.method != "POST") return error_response(405, "Use POST");
            return update_config(request.body);
        }
        if (path == "/logs" || path == "/logs/") {
            if (request.method != "GET") return error_response(405, "Use GET");
            return list_logs();
        }
        if (path.rfind("/logs/", 0) == 0) {
            if (request.method != "GET") return error_response(405, "Use GET");
            return show_log(path.substr(6));
        }
        return error_response(404, "Not found: " + path);
    } catch (const std::exception& e) {
        log_error("HTTP", std::string("handler failed: ") + e.what());
        return error_response(500, std::string("Internal server error: ") + e.what());
    }
}

Response CaptureService::submit_code(const std::string& body) {
    JsonObject obj;
    try {
        obj = parse_json_object(body);
    } catch (const std::exception& e) {
        return error_response(400, std::string("Request must be JSON: ") + e.what());
    }

    auto it = obj.find("code");
    if (it == obj.end() || !it->second.is_string()) return error_response(400, "No code provided");

    Disposition d = serializer_.submit(it->second.text);
    return json_response(http_status_for(d), disposition_to_json(d));
}

std::string CaptureService::stored_config_json() const {
    CaptureConfig current = config_snapshot();
    CaptureConfig stored = default_config(current.working_root);
    stored.config_file = current.config_file;
    load_config_file(stored);
    return config_to_json(stored);
}

Response CaptureService::status() const {
    CaptureConfig c = config_snapshot();
    std::error_code ec;
    bool file_exists = std::filesystem::is_regular_file(resolve_in_root(c, c.config_file), ec);

    JsonObjectBuilder b;
    b.add("status", "running")
     .add("working_directory", c.working_root.string())
     .add("save_directory", c.save_dir.string())
     .add("log_directory", c.log_dir.string())
     .add("is_git_repo", c.is_repo)
     .add("port", c.port)
     .add("auto_run_python", c.auto_run_python)
     .add("auto_run_shell", c.auto_run_shell)
     .add("marker_token", c.marker_token)
     .add("lock_wait_seconds", c.lock_wait_seconds)
     .add("requests_received", serializer_.last_request_id())
     .add("config_file_exists", file_exists)
     .add_raw("config_file_content", stored_config_json());
    return json_response(200, b.str());
}

Response CaptureService::update_config(const std::string& body) {
    JsonObject obj;
    try {
        obj = parse_json_object(body);
    } catch (const std::exception& e) {
        return error_response(400, std::string("Request must be JSON: ") + e.what());
    }

    CaptureConfig current = config_snapshot();
    ConfigUpdate update;
    bool port_changed = false;

    if (auto it = obj.find("port"); it != obj.end()) {
        const JsonValue& v = it->second;
        if (v.is_number() && v.number == std::floor(v.number) && v.number >= 1 && v.number <= 65535) {
            update.port = static_cast<int>(v.number);
            port_changed = *update.port != current.port;
        } else {
            log_warn("Config", "ignoring invalid port in update");
        }
    }
    if (auto it = obj.find("auto_run_python"); it != obj.end()) {
        if (it->second.is_bool()) update.auto_run_python = it->second.boolean;
        else log_warn("Config", "auto_run_python must be a JSON boolean");
    }
    if (auto it = obj.find("auto_run_shell"); it != obj.end()) {
        if (it->second.is_bool()) update.auto_run_shell = it->second.boolean;
        else log_warn("Config", "auto_run_shell must be a JSON boolean");
    }

    if (!update.port && !update.auto_run_python && !update.auto_run_shell) {
        return json_response(200, JsonObjectBuilder()
                                      .add("status", "success")
                                      .add("message", "No valid config changes requested. Config file not modified.")
                                      .add_raw("current_config_file", stored_config_json())
                                      .str());
    }

    bool python = update.auto_run_python.value_or(current.auto_run_python);
    bool shell = update.auto_run_shell.value_or(current.auto_run_shell);
    bool runtime_changed = python != current.auto_run_python || shell != current.auto_run_shell;

    if (runtime_changed) {
        // Applied between submissions, never in the middle of one.
        serializer_.with_exclusive([&](CapturePipeline& pipeline) {
            pipeline.set_auto_run(python, shell);
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_.auto_run_python = python;
            config_.auto_run_shell = shell;
        });
        log_info("Config", std::string("runtime auto-run: python=") + (python ? "on" : "off") +
                               ", shell=" + (shell ? "on" : "off"));
    }

    if (!save_config(current, update)) return error_response(500, "Failed to save config file.");

    std::string message = "Server config updated. ";
    if (port_changed) message += "Restart server for port change to take effect.";
    else if (runtime_changed) message += "Auto-run setting applied immediately.";
    else message += "No runtime settings changed.";

    return json_response(200, JsonObjectBuilder()
                                  .add("status", "success")
                                  .add("message", message)
                                  .add_raw("saved_config", stored_config_json())
                                  .str());
}

Response CaptureService::list_logs() const {
    CaptureConfig c = config_snapshot();
    std::filesystem::path dir = resolve_in_root(c, c.log_dir);

    std::vector<std::pair<std::filesystem::file_time_type, std::string>> logs;
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec) || entry.path().extension() != ".log") continue;
            auto mtime = entry.last_write_time(entry_ec);
            if (entry_ec) continue;
            logs.emplace_back(mtime, entry.path().filename().string());
        }
    }
    std::sort(logs.begin(), logs.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second < b.second;
    });

    std::ostringstream html;
    html << kLogsPageHead;
    if (logs.empty()) {
        html << "<p>No log files found in '" << html_escape(dir.filename().string()) << "'.</p>";
    } else {
        html << "<p>Found " << logs.size() << " log file(s) in '" << html_escape(dir.filename().string())
             << "'. Click to view.</p><ul>";
        for (const auto& log : logs) {
            html << "<li><a href=\"/logs/" << url_encode(log.second) << "\">" << html_escape(log.second) << "</a></li>";
        }
        html << "</ul>";
    }
    html << "</body></html>";

    Response r;
    r.status = 200;
    r.content_type = "text/html; charset=utf-8";
    r.body = html.str();
    return r;
}

Response CaptureService::show_log(const std::string& encoded_name) const {
    std::string name = url_decode(encoded_name);
    if (name.empty() || name.find("..") != std::string::npos || name.front() == '/')
        return text_response(403, "Forbidden");

    CaptureConfig c = config_snapshot();
    std::filesystem::path dir = canonical_root(resolve_in_root(c, c.log_dir));
    std::error_code ec;
    auto requested = std::filesystem::weakly_canonical(dir / name, ec);
    if (ec || !is_within_root(dir, requested) || !std::filesystem::is_regular_file(requested, ec))
        return text_response(404, "Log file not found");

    try {
        return text_response(200, read_text_file(requested));
    } catch (const std::exception& e) {
        log_error("HTTP", std::string("error serving log: ") + e.what());
        return text_response(500, "Error serving file");
    }
}

}
