#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/testing.h — In-process TestClient (supertest-style)
// ═══════════════════════════════════════════════════════════════════
//
//    testing::TestClient client(app);
//    auto r = client.post("/api/shorturl").form({{"url", "example.com"}}).exec();
//    EXPECT_EQ(r.json()["original_url"], "http://example.com");
//
//  Requests go through Server::handleRequest, so the full middleware
//  chain runs, including bodyParser. No sockets are opened. exec()
//  blocks until a detached response is finished.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "json_utils.h"
#include <algorithm>
#include <cctype>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shorturl::testing {

inline http::Request createRequest(
    const std::string& method = "GET",
    const std::string& path = "/",
    const std::string& body = "",
    const http::HeaderMap& headers = {}) {
    http::Request req;
    req.method = method;
    req.path = path;
    req.url = path;
    req.rawBody = body;
    req.ip = "127.0.0.1";
    req.hostname = "localhost";
    for (auto& [k, v] : headers) {
        std::string lk = k;
        std::transform(lk.begin(), lk.end(), lk.begin(), ::tolower);
        req.headers[lk] = v;
    }
    return req;
}

struct TestResult {
    int status = 0;
    std::string body;
    http::HeaderMap headers;

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : "";
    }
};

class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, std::string method, std::string path)
            : app_(app), method_(std::move(method)), path_(std::move(path)) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        RequestBuilder& send(const nlohmann::json& j) {
            body_ = j.dump();
            headers_["Content-Type"] = "application/json";
            return *this;
        }

        // Raw body with an explicit content type
        RequestBuilder& send(const std::string& body, const std::string& contentType) {
            body_ = body;
            headers_["Content-Type"] = contentType;
            return *this;
        }

        // application/x-www-form-urlencoded, values percent-encoded
        RequestBuilder& form(const std::vector<std::pair<std::string, std::string>>& fields) {
            std::string encoded;
            for (auto& [k, v] : fields) {
                if (!encoded.empty()) encoded += '&';
                encoded += encode(k) + "=" + encode(v);
            }
            return send(encoded, "application/x-www-form-urlencoded");
        }

        // Waits for detached responses, which may finish on another thread
        TestResult exec() {
            auto req = createRequest(method_, path_, body_, headers_);

            auto result = std::make_shared<TestResult>();
            auto done = std::make_shared<std::promise<void>>();
            auto finished = done->get_future();
            http::Response res([result, done](int status,
                                              const http::HeaderMap& headers,
                                              const std::string& body) {
                result->status = status;
                result->body = body;
                result->headers = headers;
                done->set_value();
            });

            app_.handleRequest(req, res);
            if (res.detached()) {
                finished.wait();
            } else if (!res.headersSent()) {
                result->status = res.getStatusCode();
                result->headers = res.getHeaders();
            }
            return *result;
        }

    private:
        static std::string encode(const std::string& s) {
            static const char* hex = "0123456789ABCDEF";
            std::string out;
            for (unsigned char c : s) {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                    out += static_cast<char>(c);
                } else {
                    out += '%';
                    out += hex[c >> 4];
                    out += hex[c & 0x0F];
                }
            }
            return out;
        }

        http::Server& app_;
        std::string method_;
        std::string path_;
        std::string body_;
        http::HeaderMap headers_;
    };

    RequestBuilder get(const std::string& path) { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }
    RequestBuilder options(const std::string& path) { return {app_, "OPTIONS", path}; }

private:
    http::Server& app_;
};

} // namespace shorturl::testing
