#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/http.h — Express-style HTTP server, Request, Response
// ═══════════════════════════════════════════════════════════════════
//
//    auto app = http::createServer();
//    app.get("/api/hello", [](auto& req, auto& res) {
//        res.json({{"greeting", "hello API"}});
//    });
//    app.workers(4).listen("0.0.0.0", 3000, []{ console::log("up"); });
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace shorturl::http {

class Request;
class Response;
class Server;

using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;
using HeaderMap          = std::unordered_map<std::string, std::string>;

// Percent-decoding for query strings and form bodies; '+' is a space.
// Malformed escapes are kept verbatim.
inline std::string urlDecode(const std::string& str) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hexValue(str[i + 1]);
            int lo = hexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += (str[i] == '+') ? ' ' : str[i];
    }
    return result;
}

// Percent-encodes every byte outside the URL character set, leaving
// valid %XX escapes alone. Used for the Location header, so CR, LF
// and other control bytes never reach the header block.
inline std::string encodeUrl(const std::string& url) {
    static const char* hex = "0123456789ABCDEF";
    auto isHex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };
    auto allowed = [](unsigned char c) {
        if (c >= 'a' && c <= 'z') return true;
        if (c >= 'A' && c <= 'Z') return true;
        if (c >= '0' && c <= '9') return true;
        switch (c) {
            case '!': case '#': case '$': case '&': case '\'': case '(': case ')':
            case '*': case '+': case ',': case '-': case '.': case '/': case ':':
            case ';': case '=': case '?': case '@': case '[': case ']': case '_':
            case '~':
                return true;
            default:
                return false;
        }
    };

    std::string out;
    out.reserve(url.size());
    for (std::size_t i = 0; i < url.size(); ++i) {
        unsigned char c = url[i];
        if (c == '%' && i + 2 < url.size() && isHex(url[i + 1]) && isHex(url[i + 2])) {
            out += url.substr(i, 3);
            i += 2;
        } else if (c != '%' && allowed(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  An incoming request. body is filled in by middleware::bodyParser.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Target including query string
    std::string path;           // Target without query string
    std::string rawBody;
    std::string ip;
    std::string hostname;       // Host header

    HeaderMap headers;          // Lowercase keys
    HeaderMap params;           // Route parameters (:code -> params["code"])
    HeaderMap query;

    JsonValue body;

    // Case-insensitive header lookup, "" when absent
    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    bool is(const std::string& type) const {
        return header("content-type").find(type) != std::string::npos;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  Buffers status and headers until send(); the SendCallback hands
//  the finished response to the transport (or to a test).
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(
        int statusCode,
        const HeaderMap& headers,
        const std::string& body
    )>;

    explicit Response(SendCallback cb)
        : sendCallback_(std::move(cb)) {}

    Response() : sendCallback_(nullptr) {}

    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    // Only the first send() reaches the transport
    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    void send(const char* body) {
        send(std::string(body));
    }

    template <typename T>
    void json(const T& data) {
        nlohmann::json j;
        if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
            j = data;
        } else if constexpr (std::is_same_v<std::decay_t<T>, JsonValue>) {
            j = data.raw();
        } else {
            j = nlohmann::json(data);
        }
        set("Content-Type", "application/json; charset=utf-8");
        send(j.dump());
    }

    // res.json({{"error", "invalid url"}})
    void json(nlohmann::json::initializer_list_t init) {
        json(nlohmann::json(init));
    }

    void sendStatus(int code) {
        status(code);
        send(std::to_string(code));
    }

    void redirect(const std::string& location) {
        redirect(302, location);
    }

    void redirect(int code, const std::string& location) {
        auto encoded = encodeUrl(location);
        status(code);
        set("Location", encoded);
        send("Found. Redirecting to " + encoded);
    }

    void end() {
        if (!sent_) send("");
    }

    bool headersSent() const { return sent_; }

    // Hands the response to code that finishes it later, possibly on
    // another thread. The returned Response carries the status,
    // headers and transport; this one reports headersSent() and
    // ignores further sends.
    std::shared_ptr<Response> detach() {
        auto later = std::make_shared<Response>(std::move(sendCallback_));
        later->statusCode_ = statusCode_;
        later->headers_ = headers_;
        sendCallback_ = nullptr;
        sent_ = true;
        detached_ = true;
        return later;
    }

    bool detached() const { return detached_; }

    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const HeaderMap& getHeaders() const { return headers_; }

private:
    int statusCode_ = 200;
    HeaderMap headers_;
    bool sent_ = false;
    bool detached_ = false;
    SendCallback sendCallback_;
    std::string body_;
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Routing, middleware chain, and a Boost.Beast listener (pimpl).
//  The io_context runs on workers() threads; each connection is
//  serialized on its own strand.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    Server& use(MiddlewareFunction middleware);

    template <typename Handler>
    Server& get(const std::string& path, Handler&& handler) {
        addRoute("GET", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    template <typename Handler>
    Server& post(const std::string& path, Handler&& handler) {
        addRoute("POST", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    template <typename Handler>
    Server& all(const std::string& path, Handler&& handler) {
        addRoute("*", path, wrapHandler(std::forward<Handler>(handler)));
        return *this;
    }

    // Number of io_context threads used by listen(); at least 1
    Server& workers(int count);

    // Blocks until close() is called
    void listen(int port, std::function<void()> callback = nullptr);
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);

    // Runs `handler` on a worker when one of `signals` arrives while
    // listen() is running (boost::asio::signal_set)
    Server& onSignal(std::vector<int> signals, std::function<void(int)> handler);

    // Safe to call from any thread, including a worker
    void close();

    bool listening() const;

    // Runs middleware and routing without a socket (tests, TestClient)
    void handleRequest(Request& req, Response& res);

private:
    friend class HttpSession;
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler);

    template <typename Handler>
    static RouteHandler wrapHandler(Handler&& handler) {
        return [h = std::forward<Handler>(handler)](Request& req, Response& res) mutable {
            h(req, res);
        };
    }
};

inline Server createServer() {
    return Server();
}

} // namespace shorturl::http
