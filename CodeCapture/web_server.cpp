// web_server.cpp - HTTP front end for the capture service
// Built with libwebsockets; handlers run on worker threads

#include "CodeCapture.h"
#include <libwebsockets.h>

// HTTP session tracking
struct HttpSession {
    lws* wsi = nullptr;
    WebServer::Request request;
    bool body_too_large = false;
    bool ready = false;              // response filled in by the worker
    bool write_requested = false;
    bool headers_sent = false;
    size_t body_sent = 0;
    WebServer::Response response;
    std::mutex mutex;
};

// Global state for web server
static std::map<lws*, std::shared_ptr<HttpSession>> g_sessions;
static std::mutex g_sessions_mutex;
static lws_context* g_lws_context = nullptr;
static std::atomic<bool> g_server_running{false};
static std::thread g_server_thread;
static WebServer::RequestHandler g_handler;

// Detached request workers; stop() waits for them.
static std::mutex g_workers_mutex;
static std::condition_variable g_workers_cv;
static int g_active_workers = 0;

static const char* method_name(int method) {
    switch (method) {
    case LWSHUMETH_GET: return "GET";
    case LWSHUMETH_POST: return "POST";
    case LWSHUMETH_OPTIONS: return "OPTIONS";
    case LWSHUMETH_PUT: return "PUT";
    case LWSHUMETH_PATCH: return "PATCH";
    case LWSHUMETH_DELETE: return "DELETE";
    default: return "OTHER";
    }
}

static size_t request_content_length(lws* wsi) {
    char value[32];
    if (lws_hdr_total_length(wsi, WSI_TOKEN_HTTP_CONTENT_LENGTH) <= 0)
        return 0;
    if (lws_hdr_copy(wsi, value, static_cast<int>(sizeof(value)), WSI_TOKEN_HTTP_CONTENT_LENGTH) < 0)
        return 0;
    return static_cast<size_t>(std::strtoull(value, nullptr, 10));
}

static void wake_service_loop() {
    std::lock_guard<std::mutex> lock(g_sessions_mutex);
    if (g_lws_context)
        lws_cancel_service(g_lws_context);
}

// Runs the handler off the service thread and signals completion.
static void dispatch(const std::shared_ptr<HttpSession>& session) {
    {
        std::lock_guard<std::mutex> lock(g_workers_mutex);
        ++g_active_workers;
    }

    WebServer::Request request;
    bool too_large = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        request = session->request;
        too_large = session->body_too_large;
    }

    std::thread([session, request, too_large]() {
        WebServer::Response response;
        if (too_large) {
            response.status = 413;
            response.body = "{\"status\":\"error\",\"message\":\"Request body too large\"}";
        } else if (!g_handler) {
            response.status = 503;
            response.body = "{\"status\":\"error\",\"message\":\"No request handler registered\"}";
        } else {
            try {
                response = g_handler(request);
            } catch (const std::exception& e) {
                std::cerr << "[WebServer] handler error: " << e.what() << std::endl;
                response = WebServer::Response{};
                response.status = 500;
                response.body = "{\"status\":\"error\",\"message\":\"" + Capture::json_escape(e.what()) + "\"}";
            }
        }

        {
            std::lock_guard<std::mutex> lock(session->mutex);
            session->response = std::move(response);
            session->ready = true;
        }
        wake_service_loop();

        std::lock_guard<std::mutex> lock(g_workers_mutex);
        --g_active_workers;
        g_workers_cv.notify_all();
    }).detach();
}

static std::shared_ptr<HttpSession> find_session(lws* wsi) {
    std::lock_guard<std::mutex> lock(g_sessions_mutex);
    auto it = g_sessions.find(wsi);
    return it == g_sessions.end() ? nullptr : it->second;
}

static void drop_session(lws* wsi) {
    std::lock_guard<std::mutex> lock(g_sessions_mutex);
    g_sessions.erase(wsi);
}

static int write_headers(lws* wsi, HttpSession& session) {
    unsigned char buffer[LWS_PRE + 2048];
    unsigned char* start = &buffer[LWS_PRE];
    unsigned char* p = start;
    unsigned char* end = &buffer[sizeof(buffer) - 1];

    const auto& r = session.response;
    if (lws_add_http_common_headers(wsi, static_cast<unsigned int>(r.status), r.content_type.c_str(),
                                    static_cast<lws_filepos_t>(r.body.size()), &p, end))
        return 1;
    if (lws_add_http_header_by_name(wsi, reinterpret_cast<const unsigned char*>("Access-Control-Allow-Origin:"),
                                    reinterpret_cast<const unsigned char*>("*"), 1, &p, end))
        return 1;
    static const char* allow_methods = "GET, POST, OPTIONS";
    if (lws_add_http_header_by_name(wsi, reinterpret_cast<const unsigned char*>("Access-Control-Allow-Methods:"),
                                    reinterpret_cast<const unsigned char*>(allow_methods),
                                    static_cast<int>(std::strlen(allow_methods)), &p, end))
        return 1;
    static const char* allow_headers = "Content-Type";
    if (lws_add_http_header_by_name(wsi, reinterpret_cast<const unsigned char*>("Access-Control-Allow-Headers:"),
                                    reinterpret_cast<const unsigned char*>(allow_headers),
                                    static_cast<int>(std::strlen(allow_headers)), &p, end))
        return 1;
    if (lws_finalize_write_http_header(wsi, start, &p, end))
        return 1;
    session.headers_sent = true;
    return 0;
}

// HTTP callback: collect request, hand off to a worker, stream the response
static int callback_http(lws *wsi, enum lws_callback_reasons reason,
                         void *user, void *in, size_t len) {
    (void)user;
    switch (reason) {
    case LWS_CALLBACK_HTTP: {
        auto session = std::make_shared<HttpSession>();
        session->wsi = wsi;

        char* uri = nullptr;
        int uri_len = 0;
        int method = lws_http_get_uri_and_method(wsi, &uri, &uri_len);
        session->request.method = method_name(method);
        if (uri && uri_len > 0)
            session->request.uri.assign(uri, static_cast<size_t>(uri_len));
        else if (in)
            session->request.uri = static_cast<const char*>(in);

        {
            std::lock_guard<std::mutex> lock(g_sessions_mutex);
            g_sessions[wsi] = session;
        }

        // Handlers may sit behind the submission gate for a while.
        lws_set_timeout(wsi, NO_PENDING_TIMEOUT, 0);

        bool expects_body = (method == LWSHUMETH_POST || method == LWSHUMETH_PUT || method == LWSHUMETH_PATCH) &&
                            request_content_length(wsi) > 0;
        if (!expects_body)
            dispatch(session);
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY: {
        auto session = find_session(wsi);
        if (!session)
            break;
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->request.body.size() + len > WebServer::kMaxRequestBody)
            session->body_too_large = true;
        else
            session->request.body.append(static_cast<const char*>(in), len);
        break;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
        auto session = find_session(wsi);
        if (session)
            dispatch(session);
        return 0;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // A worker finished: ask for a writable callback on its connection.
        std::lock_guard<std::mutex> lock(g_sessions_mutex);
        for (auto& pair : g_sessions) {
            std::lock_guard<std::mutex> session_lock(pair.second->mutex);
            if (pair.second->ready && !pair.second->write_requested) {
                pair.second->write_requested = true;
                lws_callback_on_writable(pair.first);
            }
        }
        break;
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        auto session = find_session(wsi);
        if (!session)
            break;

        std::unique_lock<std::mutex> lock(session->mutex);
        if (!session->ready)
            break;

        if (!session->headers_sent) {
            if (write_headers(wsi, *session))
                return 1;
            if (!session->response.body.empty()) {
                lws_callback_on_writable(wsi);
                return 0;
            }
        }

        const std::string& body = session->response.body;
        if (session->body_sent < body.size()) {
            constexpr size_t kChunk = 4096;
            unsigned char buffer[LWS_PRE + kChunk];
            size_t n = std::min(kChunk, body.size() - session->body_sent);
            std::memcpy(buffer + LWS_PRE, body.data() + session->body_sent, n);
            session->body_sent += n;
            bool last = session->body_sent >= body.size();
            if (lws_write(wsi, buffer + LWS_PRE, n, last ? LWS_WRITE_HTTP_FINAL : LWS_WRITE_HTTP) != static_cast<int>(n))
                return 1;
            if (!last) {
                lws_callback_on_writable(wsi);
                return 0;
            }
        }

        std::cerr << "[WebServer] " << session->request.method << " " << session->request.uri << " -> "
                  << session->response.status << " " << WebServer::status_text(session->response.status) << std::endl;
        lock.unlock();
        drop_session(wsi);
        if (lws_http_transaction_completed(wsi))
            return -1;
        return 0;
    }

    case LWS_CALLBACK_CLOSED_HTTP:
        drop_session(wsi);
        break;

    default:
        break;
    }

    return 0;
}

// Protocol definitions
static struct lws_protocols protocols[] = {
    {
        "http",
        callback_http,
        0,
        0,
        0, nullptr, 0
    },
    LWS_PROTOCOL_LIST_TERM
};

// Server thread function
static void server_thread_func() {
    while (g_server_running) {
        lws_service(g_lws_context, 50);
    }
}

// Public API
namespace WebServer {

const char* status_text(int status) {
    switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "";
    }
}

bool start(int port, RequestHandler handler) {
    if (g_server_running) {
        std::cerr << "[WebServer] Server already running" << std::endl;
        return false;
    }

    g_handler = std::move(handler);
    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info info;
    memset(&info, 0, sizeof(info));
    info.port = port;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

    lws_context* context = lws_create_context(&info);
    if (!context) {
        std::cerr << "[WebServer] Failed to create libwebsockets context on port " << port << std::endl;
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(g_sessions_mutex);
        g_lws_context = context;
    }

    std::cerr << "[WebServer] Listening on http://localhost:" << port << std::endl;

    g_server_running = true;
    g_server_thread = std::thread(server_thread_func);
    return true;
}

void stop() {
    if (!g_server_running)
        return;

    g_server_running = false;
    wake_service_loop();

    if (g_server_thread.joinable())
        g_server_thread.join();

    // Workers only touch the context under g_sessions_mutex.
    lws_context* context = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_sessions_mutex);
        context = g_lws_context;
        g_lws_context = nullptr;
    }

    {
        std::unique_lock<std::mutex> lock(g_workers_mutex);
        g_workers_cv.wait(lock, [] { return g_active_workers == 0; });
    }

    if (context)
        lws_context_destroy(context);

    std::lock_guard<std::mutex> lock(g_sessions_mutex);
    g_sessions.clear();
}

bool is_running() {
    return g_server_running;
}

} // namespace WebServer
