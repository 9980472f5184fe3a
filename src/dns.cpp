// ═══════════════════════════════════════════════════════════════════
//  dns.cpp — Resolver on a Boost.Asio thread pool
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/dns.h"
#include "shorturl/console.h"

#include <boost/asio.hpp>

#include <algorithm>
#include <thread>

namespace shorturl::dns {

namespace net = boost::asio;
using tcp     = net::ip::tcp;

namespace {

// Whichever of lookup and deadline finishes first answers
struct Pending {
    explicit Pending(HostProbe::Callback cb) : done(std::move(cb)) {}

    bool finish(bool ok) {
        if (finished.exchange(true)) return false;
        done(ok);
        return true;
    }

    std::atomic<bool> finished{false};
    HostProbe::Callback done;
};

} // namespace

struct Resolver::Impl {
    explicit Impl(std::size_t threads, Lookup fn)
        : lookups(threads)
        , lookup(std::move(fn))
    {}

    ~Impl() {
        // Queued lookups are dropped; running ones finish first
        lookups.stop();
        lookups.join();

        guard.reset();
        timers.stop();
        if (timerThread.joinable()) timerThread.join();
    }

    net::thread_pool lookups;
    net::io_context timers;
    net::executor_work_guard<net::io_context::executor_type> guard{timers.get_executor()};
    std::thread timerThread{[this] { timers.run(); }};
    Lookup lookup;
};

Resolver::Resolver(std::chrono::milliseconds timeout, std::size_t concurrency, Lookup lookup)
    : impl_(std::make_unique<Impl>(std::max<std::size_t>(1, concurrency), std::move(lookup)))
    , timeout_(timeout)
    , concurrency_(std::max<std::size_t>(1, concurrency))
{}

Resolver::~Resolver() = default;

bool Resolver::systemLookup(const std::string& host) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    boost::system::error_code ec;
    auto results = resolver.resolve(host, "80", ec);
    return !ec && !results.empty();
}

void Resolver::probe(const std::string& host, Callback done) {
    if (host.empty()) {
        done(false);
        return;
    }

    auto* impl   = impl_.get();
    auto pending = std::make_shared<Pending>(std::move(done));
    auto timer   = std::make_shared<net::steady_timer>(impl->timers, timeout_);

    // The timer is only touched from the timer thread
    net::post(impl->timers, [timer, pending, host] {
        timer->async_wait([timer, pending, host](const boost::system::error_code& ec) {
            if (ec) return;
            if (pending->finish(false)) {
                console::warn("DNS lookup timed out for", host);
            }
        });
    });

    net::post(impl->lookups, [impl, timer, pending, host] {
        bool ok = false;
        try {
            ok = impl->lookup(host);
        } catch (const std::exception& e) {
            console::debug("DNS lookup threw for", host, e.what());
        }

        net::post(impl->timers, [timer] { timer->cancel(); });
        if (pending->finish(ok) && !ok) {
            console::debug("DNS lookup failed for", host);
        }
    });
}

} // namespace shorturl::dns
