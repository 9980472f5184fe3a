// ═══════════════════════════════════════════════════════════════════
//  api.cpp — Shortener route handlers
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/api.h"
#include "shorturl/console.h"
#include "shorturl/middleware.h"
#include "shorturl/validator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace shorturl::api {

namespace {

const nlohmann::json kInvalidUrl = {{"error", "invalid url"}};

bool isDigits(const std::string& s, int base) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [base](unsigned char c) {
        if (base == 16) return std::isxdigit(c) != 0;
        return c >= '0' && c < '0' + base;
    });
}

// The code as a JSON number, or null when the segment is not numeric.
// Accepts what a JavaScript Number() conversion accepts: decimals,
// exponents and 0x/0o/0b literals. Whole numbers come back as
// integers, so "12.0" and "1e3" name codes 12 and 1000.
nlohmann::json parseCode(const std::string& raw) {
    if (raw.empty()) return nullptr;

    if (raw.size() > 2 && raw[0] == '0') {
        int base = 0;
        switch (raw[1]) {
            case 'x': case 'X': base = 16; break;
            case 'o': case 'O': base = 8;  break;
            case 'b': case 'B': base = 2;  break;
        }
        if (base != 0) {
            auto digits = raw.substr(2);
            if (!isDigits(digits, base)) return nullptr;
            try {
                return static_cast<std::int64_t>(std::stoull(digits, nullptr, base));
            } catch (const std::out_of_range&) {
                return nullptr;
            }
        }
    }

    // Only digits, exponent and sign characters; rejects "inf", "nan"
    // and hex floats that strtod would take
    if (!std::all_of(raw.begin(), raw.end(), [](unsigned char c) {
            return std::isdigit(c) || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
        })) {
        return nullptr;
    }

    try {
        std::size_t used = 0;
        long long integer = std::stoll(raw, &used);
        if (used == raw.size()) return integer;
    } catch (const std::logic_error&) {
    }

    try {
        std::size_t used = 0;
        double real = std::stod(raw, &used);
        if (used != raw.size() || !std::isfinite(real)) return nullptr;

        constexpr double kInt64Bound = 9223372036854775808.0;   // 2^63
        if (std::trunc(real) == real && real >= -kInt64Bound && real < kInt64Bound) {
            return static_cast<std::int64_t>(real);
        }
        return real;
    } catch (const std::logic_error&) {
    }
    return nullptr;
}

void respondShortened(registry::Registry& urls, const std::string& normalized,
                      http::Response& res) {
    try {
        auto registration = urls.shorten(normalized);
        if (registration.created) {
            console::info("shortened", registration.entry.original_url,
                          "as", registration.entry.short_url);
        }
        res.json(registration.entry);
    } catch (const registry::CodeSpaceExhausted& e) {
        console::error("code space exhausted:", e.what());
        res.status(500).json({{"error", "internal error"}});
    } catch (const store::StoreError& e) {
        console::error("store failure:", e.what());
        res.status(500).json({{"error", "internal error"}});
    }
}

// The probe may complete on a resolver thread, so the response is
// detached and the worker returns to serving other connections.
void shorten(registry::Registry& urls, dns::HostProbe& probe,
             http::Request& req, http::Response& res) {
    auto input = req.body.string("url");
    if (!input || input->empty() || !validator::isValid(*input)) {
        res.json(kInvalidUrl);
        return;
    }

    auto normalized = validator::normalize(*input);
    auto host = validator::probeHost(normalized);
    if (!host) {
        res.json(kInvalidUrl);
        return;
    }

    auto pending = res.detach();
    probe.probe(*host, [&urls, normalized, pending](bool reachable) {
        if (!reachable) {
            pending->json(kInvalidUrl);
            return;
        }
        try {
            respondShortened(urls, normalized, *pending);
        } catch (const std::exception& e) {
            console::error("POST /api/shorturl failed:", e.what());
            pending->status(500).json({{"error", "internal error"}});
        }
    });
}

void resolve(registry::Registry& urls, http::Request& req, http::Response& res) {
    auto code = parseCode(req.params["code"]);

    std::optional<Entry> entry;
    if (code.is_number_integer()) {
        try {
            entry = urls.lookup(code.get<std::int64_t>());
        } catch (const store::StoreError& e) {
            console::error("store failure:", e.what());
            res.status(500).json({{"error", "internal error"}});
            return;
        }
    }

    if (!entry) {
        res.status(404).json({{"error", "Short URL not found"}, {"short", code}});
        return;
    }
    res.redirect(entry->original_url);
}

} // namespace

void mount(http::Server& app, registry::Registry& urls, dns::HostProbe& probe,
           const Options& options) {
    app.post("/api/shorturl", [&urls, &probe](http::Request& req, http::Response& res) {
        shorten(urls, probe, req, res);
    });

    app.get("/api/shorturl/:code", [&urls](http::Request& req, http::Response& res) {
        resolve(urls, req, res);
    });

    app.get("/api/hello", [](http::Request&, http::Response& res) {
        res.json({{"greeting", "hello API"}});
    });

    auto index = std::filesystem::path(options.viewsDir) / "index.html";
    app.get("/", [index, gzip = options.gzip](http::Request& req, http::Response& res) {
        if (!middleware::sendFile(req, res, index, gzip)) {
            res.status(404).json({{"error", "Not Found"}, {"message", "index.html is missing"}});
        }
    });
}

http::Server createApp(registry::Registry& urls, dns::HostProbe& probe,
                       const Options& options) {
    auto app = http::createServer();

    if (options.logRequests) {
        app.use(middleware::requestLogger());
    }
    app.use(middleware::cors());
    app.use(middleware::bodyParser());
    app.use(middleware::staticFiles("/public", options.publicDir, options.gzip));

    mount(app, urls, probe, options);
    return app;
}

} // namespace shorturl::api
