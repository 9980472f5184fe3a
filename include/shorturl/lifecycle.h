#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/lifecycle.h — Graceful shutdown on SIGINT / SIGTERM
// ═══════════════════════════════════════════════════════════════════
//
//    lifecycle::enableGracefulShutdown(app);
//    app.listen(3000);            // returns after SIGINT or SIGTERM
//
//  Signals are delivered through the server's io_context, so the
//  shutdown path may log and take locks.
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <csignal>

namespace shorturl::lifecycle {

// Stops the server's event loop so listen() returns to main
inline void enableGracefulShutdown(http::Server& server) {
    server.onSignal({SIGINT, SIGTERM}, [&server](int sig) {
        console::info("Received signal", sig, "- shutting down");
        server.close();
    });
}

} // namespace shorturl::lifecycle
