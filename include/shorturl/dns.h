#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/dns.h — Hostname reachability probes
// ═══════════════════════════════════════════════════════════════════
//
//  The POST handler asks a HostProbe whether a hostname resolves
//  before any code is minted. Resolver does a real DNS lookup with
//  a deadline; StaticProbe answers from a fixed table.
//
//    probe.probe("example.com", [](bool ok) { ... });   // async
//    bool ok = probe.reachable("example.com");          // blocking
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <unordered_set>

namespace shorturl::dns {

class HostProbe {
public:
    using Callback = std::function<void(bool reachable)>;

    virtual ~HostProbe() = default;

    // Calls `done` exactly once, possibly on another thread and
    // possibly before returning. Failures and timeouts report false.
    virtual void probe(const std::string& host, Callback done) = 0;

    // Blocks the calling thread until probe() completes
    bool reachable(const std::string& host) {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        probe(host, [promise](bool ok) { promise->set_value(ok); });
        return future.get();
    }
};

// ═══════════════════════════════════════════
//  Resolver — blocking lookups on a thread pool, with a deadline
// ═══════════════════════════════════════════
//  Each lookup occupies one pool thread, so a lookup that hangs does
//  not delay the others. The deadline runs on a separate timer thread
//  and answers false when it fires first; a lookup that hangs past it
//  keeps its pool thread until the system resolver gives up.
class Resolver : public HostProbe {
public:
    // true when `host` resolves; runs on a pool thread
    using Lookup = std::function<bool(const std::string& host)>;

    static constexpr std::size_t kDefaultConcurrency = 16;

    explicit Resolver(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                      std::size_t concurrency = kDefaultConcurrency,
                      Lookup lookup = systemLookup);
    ~Resolver() override;

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    void probe(const std::string& host, Callback done) override;

    std::chrono::milliseconds timeout() const { return timeout_; }
    std::size_t concurrency() const { return concurrency_; }

    // getaddrinfo through boost::asio::ip::tcp::resolver
    static bool systemLookup(const std::string& host);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::chrono::milliseconds timeout_;
    std::size_t concurrency_;
};

// ═══════════════════════════════════════════
//  StaticProbe — fixed answers, no network
// ═══════════════════════════════════════════
//  Completes inline, before probe() returns.
class StaticProbe : public HostProbe {
public:
    // Same answer for every host
    explicit StaticProbe(bool answer = true) : answer_(answer), useTable_(false) {}

    // Only the listed hosts are reachable
    explicit StaticProbe(std::unordered_set<std::string> reachableHosts)
        : hosts_(std::move(reachableHosts)), useTable_(true) {}

    void probe(const std::string& host, Callback done) override {
        ++calls_;
        done(useTable_ ? hosts_.count(host) > 0 : answer_);
    }

    std::size_t calls() const { return calls_.load(); }

private:
    bool answer_ = false;
    std::unordered_set<std::string> hosts_;
    bool useTable_;
    std::atomic<std::size_t> calls_{0};
};

} // namespace shorturl::dns
