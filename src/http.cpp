// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast HTTP server implementation
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/http.h"
#include "shorturl/console.h"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <atomic>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace shorturl::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

// Largest request body accepted from a client
constexpr std::uint64_t kBodyLimit = 64 * 1024;

struct CompiledRoute {
    std::string method;
    std::string pattern;
    std::regex  regex;
    std::vector<std::string> paramNames;
    RouteHandler handler;
};

namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

inline std::pair<std::string, std::string> splitTarget(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) return {target, ""};
    return {target.substr(0, pos), target.substr(pos + 1)};
}

inline HeaderMap parseQueryString(const std::string& qs) {
    HeaderMap result;
    if (qs.empty()) return result;

    std::istringstream stream(qs);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[http::urlDecode(pair.substr(0, eq))] = http::urlDecode(pair.substr(eq + 1));
        } else {
            result[http::urlDecode(pair)] = "";
        }
    }
    return result;
}

// "/api/shorturl/:code" -> ^/api/shorturl/([^/]+)$ with paramNames {"code"}
inline CompiledRoute compileRoute(const std::string& method,
                                  const std::string& pattern,
                                  RouteHandler handler) {
    CompiledRoute route;
    route.method  = method;
    route.pattern = pattern;
    route.handler = std::move(handler);

    std::string regexStr;
    std::size_t pos = 0;

    while (pos < pattern.size()) {
        char c = pattern[pos];
        if (c == ':') {
            pos++;
            std::string paramName;
            while (pos < pattern.size() && pattern[pos] != '/') {
                paramName += pattern[pos++];
            }
            route.paramNames.push_back(paramName);
            regexStr += "([^/]+)";
        } else if (c == '*') {
            regexStr += "(.*)";
            route.paramNames.push_back("*");
            pos++;
        } else {
            if (c == '.' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '{' ||
                c == '}' || c == '+' || c == '?' ||
                c == '^' || c == '$' || c == '|' || c == '\\') {
                regexStr += '\\';
            }
            regexStr += c;
            pos++;
        }
    }

    route.regex = std::regex("^" + regexStr + "$");
    return route;
}

inline bool matchRoute(const CompiledRoute& route,
                       const std::string& method,
                       const std::string& path,
                       Request& req) {
    if (route.method != method && route.method != "*") return false;

    std::smatch match;
    if (!std::regex_match(path, match, route.regex)) return false;

    for (std::size_t i = 0; i < route.paramNames.size(); ++i) {
        req.params[route.paramNames[i]] = match[i + 1].str();
    }
    return true;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    std::vector<MiddlewareFunction>  middlewares;
    std::vector<CompiledRoute>       routes;
    std::unique_ptr<net::io_context> ioc;
    int workers = 1;
    std::atomic<bool> running{false};

    std::vector<int> signals;
    std::vector<std::function<void(int)>> signalHandlers;

    void executeMiddlewareChain(Request& req, Response& res,
                                std::size_t index,
                                std::function<void()> done) {
        if (res.headersSent()) return;
        if (index >= middlewares.size()) {
            done();
            return;
        }

        auto& mw = middlewares[index];
        mw(req, res, [this, &req, &res, index, done = std::move(done)]() {
            executeMiddlewareChain(req, res, index + 1, std::move(done));
        });
    }

    void dispatch(Request& req, Response& res) {
        executeMiddlewareChain(req, res, 0, [this, &req, &res]() {
            if (res.headersSent()) return;

            for (auto& route : routes) {
                auto savedParams = req.params;
                req.params.clear();

                if (detail::matchRoute(route, req.method, req.path, req)) {
                    route.handler(req, res);
                    return;
                }

                req.params = std::move(savedParams);
            }

            res.status(404).json(nlohmann::json{
                {"error", "Not Found"},
                {"message", "Cannot " + req.method + " " + req.path}
            });
        });
    }

    // Handlers never take the connection down with them
    void handleRequest(Request& req, Response& res) {
        try {
            dispatch(req, res);
        } catch (const std::exception& e) {
            console::error(req.method, req.path, "failed:", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{{"error", "internal error"}});
            }
        }
    }
};

// ═══════════════════════════════════════════
//  HttpSession — one connection, on its own strand
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Server::Impl& server)
        : socket_(std::move(socket))
        , server_(server)
    {}

    void run() {
        readRequest();
    }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    Server::Impl& server_;

    void readRequest() {
        parser_.emplace();
        parser_->body_limit(kBodyLimit);

        auto self = shared_from_this();
        bhttp::async_read(
            socket_, buffer_, *parser_,
            [self](beast::error_code ec, std::size_t /*bytes_transferred*/) {
                if (ec == bhttp::error::end_of_stream) {
                    beast::error_code shutdownEc;
                    self->socket_.shutdown(tcp::socket::shutdown_send, shutdownEc);
                    return;
                }
                if (!ec) {
                    self->processRequest();
                }
            }
        );
    }

    void processRequest() {
        auto self = shared_from_this();
        auto& beastRequest = parser_->get();
        const bool keepAlive = beastRequest.keep_alive();
        const unsigned version = beastRequest.version();

        Request req;
        req.method = std::string(beastRequest.method_string());
        req.url    = std::string(beastRequest.target());

        auto [path, queryString] = detail::splitTarget(req.url);
        req.path    = path;
        req.query   = detail::parseQueryString(queryString);
        req.rawBody = beastRequest.body();

        beast::error_code endpointEc;
        auto remote = socket_.remote_endpoint(endpointEc);
        req.ip = endpointEc ? "unknown" : remote.address().to_string();

        for (auto& field : beastRequest) {
            req.headers[detail::toLower(std::string(field.name_string()))]
                = std::string(field.value());
        }
        req.hostname = req.header("host");

        // A detached response may finish on another thread; the write
        // always happens on this connection's strand.
        Response res([self, keepAlive, version](int statusCode,
                                                const HeaderMap& headers,
                                                const std::string& body) {
            auto beastRes = std::make_shared<bhttp::response<bhttp::string_body>>();
            beastRes->result(static_cast<bhttp::status>(statusCode));
            beastRes->version(version);

            for (auto& [key, value] : headers) {
                if (!value.empty()) {
                    beastRes->set(key, value);
                }
            }

            beastRes->body() = body;
            beastRes->prepare_payload();
            beastRes->keep_alive(keepAlive);

            net::dispatch(self->socket_.get_executor(), [self, beastRes, keepAlive] {
                self->writeResponse(beastRes, keepAlive);
            });
        });

        server_.handleRequest(req, res);

        if (!res.headersSent()) {
            res.status(404).json(nlohmann::json{
                {"error", "Not Found"},
                {"message", "No response sent by handler"}
            });
        }
    }

    void writeResponse(std::shared_ptr<bhttp::response<bhttp::string_body>> beastRes,
                       bool keepAlive) {
        auto self = shared_from_this();
        bhttp::async_write(
            socket_, *beastRes,
            [self, beastRes, keepAlive](beast::error_code ec, std::size_t /*bytes*/) {
                if (keepAlive && !ec) {
                    self->readRequest();
                } else {
                    beast::error_code shutdownEc;
                    self->socket_.shutdown(tcp::socket::shutdown_send, shutdownEc);
                }
            }
        );
    }
};

// ═══════════════════════════════════════════
//  HttpListener — accepts connections
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, tcp::endpoint endpoint, Server::Impl& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

        acceptor_.bind(endpoint, ec);
        if (ec) throw std::runtime_error("Failed to bind to port: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("Failed to listen: " + ec.message());
    }

    void run() {
        doAccept();
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;

    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this())
        );
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            console::warn("accept failed:", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), server_)->run();
        }
        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Server
// ═══════════════════════════════════════════

Server::Server()
    : impl_(std::make_unique<Impl>())
{}

Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

Server& Server::workers(int count) {
    impl_->workers = std::max(1, count);
    return *this;
}

Server& Server::onSignal(std::vector<int> signals, std::function<void(int)> handler) {
    for (int sig : signals) {
        if (std::find(impl_->signals.begin(), impl_->signals.end(), sig) == impl_->signals.end()) {
            impl_->signals.push_back(sig);
        }
    }
    impl_->signalHandlers.push_back(std::move(handler));
    return *this;
}

void Server::addRoute(const std::string& method,
                      const std::string& pattern,
                      RouteHandler handler) {
    impl_->routes.push_back(
        detail::compileRoute(method, pattern, std::move(handler))
    );
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

void Server::listen(int port, std::function<void()> callback) {
    listen("0.0.0.0", port, std::move(callback));
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    impl_->ioc = std::make_unique<net::io_context>(impl_->workers);

    auto address  = net::ip::make_address(host);
    auto endpoint = tcp::endpoint(address, static_cast<unsigned short>(port));

    std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_)->run();

    // Delivered through the io_context, so handlers run as ordinary
    // completion handlers rather than in signal context
    std::optional<net::signal_set> signals;
    if (!impl_->signals.empty()) {
        signals.emplace(*impl_->ioc);
        for (int sig : impl_->signals) {
            signals->add(sig);
        }
        signals->async_wait([impl = impl_.get()](const beast::error_code& ec, int sig) {
            if (ec) return;
            for (auto& handler : impl->signalHandlers) {
                handler(sig);
            }
        });
    }

    impl_->running = true;

    if (callback) {
        callback();
    }

    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(impl_->workers - 1));
    for (int i = 1; i < impl_->workers; ++i) {
        pool.emplace_back([ioc = impl_->ioc.get()] { ioc->run(); });
    }

    impl_->ioc->run();

    for (auto& t : pool) {
        t.join();
    }
    impl_->running = false;
}

void Server::close() {
    if (impl_->ioc && impl_->running.exchange(false)) {
        impl_->ioc->stop();
    }
}

bool Server::listening() const {
    return impl_->running.load();
}

} // namespace shorturl::http
