#ifndef _CodeCapture_web_server_h_
#define _CodeCapture_web_server_h_

// Lightweight HTTP server on libwebsockets. Requests are parsed on the
// service thread and answered from a worker thread, so a slow handler never
// stalls the accept loop.
namespace WebServer {

struct Request {
    std::string method;     // "GET", "POST", "OPTIONS", ...
    std::string uri;        // path only, no query string
    std::string body;
};

struct Response {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

using RequestHandler = std::function<Response(const Request&)>;

constexpr size_t kMaxRequestBody = 8 * 1024 * 1024;

bool start(int port, RequestHandler handler);
void stop();
bool is_running();

const char* status_text(int status);

}

#endif
