// ═══════════════════════════════════════════════════════════════════
//  main.cpp — shorturl-server entry point
// ═══════════════════════════════════════════════════════════════════
//
//    shorturl-server [config.json]
//
//  Loads .env, the config file (default shorturl.json) and the
//  environment, then serves the API until SIGINT/SIGTERM.
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/shorturl.h"

#include <chrono>
#include <memory>

using namespace shorturl;

int main(int argc, char** argv) {
    config::Config cfg;
    try {
        config::loadDotEnv(".env");
        cfg = config::loadFromFile(argc > 1 ? argv[1] : "shorturl.json");
        config::applyEnvironment(cfg);
        config::validate(cfg);
    } catch (const config::ConfigError& e) {
        console::error("configuration:", e.what());
        return 1;
    }
    console::setLevel(console::parseLevel(cfg.logLevel));

    std::unique_ptr<store::EntryStore> entries;
    try {
        entries = store::open(cfg.storage.kind, cfg.storage.path);
    } catch (const store::StoreError& e) {
        console::error("storage:", e.what());
        return 1;
    }

    registry::Registry urls(*entries);

    std::unique_ptr<dns::HostProbe> probe;
    if (cfg.probe.enabled) {
        probe = std::make_unique<dns::Resolver>(std::chrono::milliseconds(cfg.probe.timeoutMs),
                                                static_cast<std::size_t>(cfg.probe.concurrency));
    } else {
        console::warn("DNS probe disabled; every syntactically valid URL is accepted");
        probe = std::make_unique<dns::StaticProbe>(true);
    }

    auto app = api::createApp(urls, *probe, {
        .publicDir = cfg.paths.publicDir,
        .viewsDir = cfg.paths.viewsDir,
        .logRequests = true,
    });

    lifecycle::enableGracefulShutdown(app);

    try {
        app.workers(cfg.server.threads).listen(cfg.server.host, cfg.server.port, [&] {
            console::success("Listening on port", cfg.server.port);
            console::info("host", cfg.server.host, "workers", cfg.server.threads,
                          "store", entries->describe());
        });
    } catch (const std::exception& e) {
        console::error("server:", e.what());
        return 1;
    }

    // Lookups still in flight finish against a live registry
    probe.reset();
    console::info("Server stopped.");
    return 0;
}
