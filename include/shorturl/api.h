#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/api.h — HTTP routes of the URL shortener
// ═══════════════════════════════════════════════════════════════════
//
//    POST /api/shorturl         url=<string>  -> {original_url, short_url}
//                                             |  {error: "invalid url"}
//    GET  /api/shorturl/:code   302 -> original_url
//                               404 {error: "Short URL not found", short}
//    GET  /api/hello            {greeting: "hello API"}
//    GET  /                     views/index.html
//    GET  /public/*             static assets
//
// ═══════════════════════════════════════════════════════════════════

#include "compress.h"
#include "dns.h"
#include "http.h"
#include "registry.h"
#include <string>

namespace shorturl::api {

struct Options {
    std::string publicDir = "./public";
    std::string viewsDir = "./views";
    bool logRequests = false;
    compress::Options gzip;
};

// Routes only; the caller provides body parsing and the rest
void mount(http::Server& app, registry::Registry& urls, dns::HostProbe& probe,
           const Options& options = {});

// Server with requestLogger (optional), cors, bodyParser, static
// files and the routes above
http::Server createApp(registry::Registry& urls, dns::HostProbe& probe,
                       const Options& options = {});

} // namespace shorturl::api
