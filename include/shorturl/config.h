#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/config.h — Service configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Precedence, lowest first: defaults, JSON file, environment.
//
//    {
//      "server":  { "host": "0.0.0.0", "port": 3000, "threads": 4 },
//      "storage": { "kind": "json", "path": "./public/data.json" },
//      "probe":   { "enabled": true, "timeout_ms": 5000, "concurrency": 16 },
//      "paths":   { "public_dir": "./public", "views_dir": "./views" },
//      "log_level": "info"
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

namespace shorturl::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    int threads = 4;
};

struct StorageConfig {
    std::string kind = "json";              // json | sqlite | memory
    std::string path = "./public/data.json";
};

struct ProbeConfig {
    bool enabled = true;
    int timeoutMs = 5000;
    int concurrency = 16;       // lookups in flight at once
};

struct PathsConfig {
    std::string publicDir = "./public";
    std::string viewsDir = "./views";
};

struct Config {
    ServerConfig server;
    StorageConfig storage;
    ProbeConfig probe;
    PathsConfig paths;
    std::string logLevel = "info";
};

// Missing file -> defaults. Malformed JSON or wrong types -> ConfigError.
Config loadFromFile(const std::string& path);

// PORT, HOST, SHORTURL_STORE, SHORTURL_DATA, SHORTURL_THREADS,
// SHORTURL_DNS_TIMEOUT_MS, SHORTURL_DNS_CONCURRENCY, SHORTURL_LOG_LEVEL
void applyEnvironment(Config& config);

// KEY=VALUE lines into the environment; existing variables win.
// Returns the number of variables set; a missing file sets none.
int loadDotEnv(const std::string& path);

// Range and enum checks; throws ConfigError
void validate(const Config& config);

} // namespace shorturl::config
