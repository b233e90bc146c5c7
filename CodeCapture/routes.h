#ifndef _CodeCapture_routes_h_
#define _CodeCapture_routes_h_

namespace Capture {

// ============================================================================
// HTTP endpoints of the capture server (transport independent)
// ============================================================================

class CaptureService {
public:
    CaptureService(CaptureConfig config, SubmissionSerializer& serializer);

    // Entry point for WebServer. Never throws.
    WebServer::Response handle(const WebServer::Request& request);

    CaptureConfig config_snapshot() const;

private:
    WebServer::Response submit_code(const std::string& body);
    WebServer::Response status() const;
    WebServer::Response update_config(const std::string& body);
    WebServer::Response list_logs() const;
    WebServer::Response show_log(const std::string& encoded_name) const;

    std::string stored_config_json() const;

    CaptureConfig config_;
    mutable std::mutex config_mutex_;
    SubmissionSerializer& serializer_;
};

int http_status_for(const Disposition& d);
std::string url_decode(const std::string& s);

}

#endif
