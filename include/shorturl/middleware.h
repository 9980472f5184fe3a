#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/middleware.h — Express-style middleware
// ═══════════════════════════════════════════════════════════════════
//
//    • bodyParser()     — JSON and urlencoded request bodies
//    • cors()           — Cross-Origin Resource Sharing headers
//    • requestLogger()  — one log line per request
//    • staticFiles()    — files under a mount path, gzip + ETag
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include "compress.h"
#include "crypto.h"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace shorturl::middleware {

// ═══════════════════════════════════════════
//  bodyParser
// ═══════════════════════════════════════════
//  application/json                    -> req.body = parsed document
//  application/x-www-form-urlencoded   -> req.body = {field: decoded}
//  Malformed JSON ends the chain with 400.
//
inline http::MiddlewareFunction bodyParser() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        if (req.rawBody.empty()) {
            next();
            return;
        }

        if (req.is("application/json")) {
            try {
                req.body = JsonValue(nlohmann::json::parse(req.rawBody));
            } catch (const nlohmann::json::exception& e) {
                res.status(400).json(nlohmann::json{
                    {"error", "Bad Request"},
                    {"message", std::string("Invalid JSON: ") + e.what()}
                });
                return;
            }
        } else if (req.is("application/x-www-form-urlencoded")) {
            nlohmann::json form = nlohmann::json::object();
            std::istringstream stream(req.rawBody);
            std::string pair;
            while (std::getline(stream, pair, '&')) {
                if (pair.empty()) continue;
                auto eq = pair.find('=');
                if (eq == std::string::npos) {
                    form[http::urlDecode(pair)] = "";
                } else {
                    form[http::urlDecode(pair.substr(0, eq))] = http::urlDecode(pair.substr(eq + 1));
                }
            }
            req.body = JsonValue(std::move(form));
        }

        next();
    };
}

// ═══════════════════════════════════════════
//  cors
// ═══════════════════════════════════════════
struct CorsOptions {
    std::string origin       = "*";
    std::string methods      = "GET, POST, OPTIONS";
    std::string allowHeaders = "Content-Type";
    int         maxAge       = 86400; // seconds
};

inline http::MiddlewareFunction cors(CorsOptions options = {}) {
    return [options](http::Request& req, http::Response& res, http::NextFunction next) {
        res.set("Access-Control-Allow-Origin", options.origin);
        res.set("Access-Control-Allow-Methods", options.methods);
        res.set("Access-Control-Allow-Headers", options.allowHeaders);

        if (req.method == "OPTIONS") {
            res.set("Access-Control-Max-Age", std::to_string(options.maxAge));
            res.status(204).end();
            return;
        }

        next();
    };
}

// ═══════════════════════════════════════════
//  requestLogger
// ═══════════════════════════════════════════
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();

        next();

        auto elapsed = std::chrono::steady_clock::now() - start;
        auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

        if (res.detached()) {
            console::debug(req.method, req.path, "completing asynchronously", req.ip);
            return;
        }

        int status = res.getStatusCode();
        std::ostringstream took;
        took << std::fixed << std::setprecision(2) << ms << "ms";

        if (status >= 500) {
            console::error(req.method, req.path, status, took.str(), req.ip);
        } else if (status >= 400) {
            console::warn(req.method, req.path, status, took.str(), req.ip);
        } else {
            console::info(req.method, req.path, status, took.str(), req.ip);
        }
    };
}

// ═══════════════════════════════════════════
//  sendFile / staticFiles
// ═══════════════════════════════════════════
namespace detail {

inline std::string mimeType(const std::string& ext) {
    static const std::unordered_map<std::string, std::string> types = {
        {".html", "text/html; charset=utf-8"},
        {".htm",  "text/html; charset=utf-8"},
        {".css",  "text/css; charset=utf-8"},
        {".js",   "application/javascript; charset=utf-8"},
        {".json", "application/json; charset=utf-8"},
        {".txt",  "text/plain; charset=utf-8"},
        {".png",  "image/png"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif",  "image/gif"},
        {".svg",  "image/svg+xml"},
        {".ico",  "image/x-icon"},
        {".woff", "font/woff"},
        {".woff2","font/woff2"},
    };
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

// Rejects ".." segments so a request cannot leave the root
inline bool isSafeRelative(const std::string& rel) {
    std::filesystem::path p(rel);
    if (p.is_absolute()) return false;
    for (auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace detail

// Sends a file with Content-Type, ETag and optional gzip.
// Returns false (nothing sent) when the file cannot be read.
inline bool sendFile(http::Request& req, http::Response& res,
                     const std::filesystem::path& file,
                     compress::Options gzip = {}) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) return false;

    std::ifstream in(file, std::ios::binary);
    if (!in) return false;
    std::ostringstream oss;
    oss << in.rdbuf();
    std::string body = oss.str();

    auto tag = crypto::etag(body);
    res.set("ETag", tag);
    res.type(detail::mimeType(file.extension().string()));

    if (req.header("if-none-match") == tag) {
        res.status(304).send("");
        return true;
    }

    if (body.size() >= gzip.threshold && compress::acceptsGzip(req.header("accept-encoding"))) {
        res.set("Content-Encoding", "gzip");
        res.set("Vary", "Accept-Encoding");
        res.send(compress::gzipCompress(body, gzip.level));
        return true;
    }

    res.send(body);
    return true;
}

// Serves GET/HEAD requests under `mount` from directory `root`;
// anything it cannot serve goes to the next handler.
inline http::MiddlewareFunction staticFiles(const std::string& mount,
                                            const std::string& root,
                                            compress::Options gzip = {}) {
    std::string prefix = mount;
    if (prefix.empty() || prefix.back() != '/') prefix += '/';

    return [prefix, root, gzip](http::Request& req, http::Response& res, http::NextFunction next) {
        if ((req.method != "GET" && req.method != "HEAD") ||
            req.path.compare(0, prefix.size(), prefix) != 0) {
            next();
            return;
        }

        auto rel = http::urlDecode(req.path.substr(prefix.size()));
        if (rel.empty() || !detail::isSafeRelative(rel)) {
            next();
            return;
        }

        if (!sendFile(req, res, std::filesystem::path(root) / rel, gzip)) {
            next();
        }
    };
}

} // namespace shorturl::middleware
