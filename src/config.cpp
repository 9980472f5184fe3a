// ═══════════════════════════════════════════════════════════════════
//  config.cpp — JSON file, .env and environment loading
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/config.h"
#include "shorturl/fs.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace shorturl::config {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

int parseInt(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

Config loadFromFile(const std::string& path) {
    Config config;
    if (!fs::existsSync(path)) return config;

    try {
        auto j = nlohmann::json::parse(fs::readFileSync(path));

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host"))    config.server.host = s["host"].get<std::string>();
            if (s.contains("port"))    config.server.port = s["port"].get<int>();
            if (s.contains("threads")) config.server.threads = s["threads"].get<int>();
        }

        if (j.contains("storage")) {
            auto& st = j["storage"];
            if (st.contains("kind")) config.storage.kind = st["kind"].get<std::string>();
            if (st.contains("path")) config.storage.path = st["path"].get<std::string>();
        }

        if (j.contains("probe")) {
            auto& p = j["probe"];
            if (p.contains("enabled"))    config.probe.enabled = p["enabled"].get<bool>();
            if (p.contains("timeout_ms"))  config.probe.timeoutMs = p["timeout_ms"].get<int>();
            if (p.contains("concurrency")) config.probe.concurrency = p["concurrency"].get<int>();
        }

        if (j.contains("paths")) {
            auto& p = j["paths"];
            if (p.contains("public_dir")) config.paths.publicDir = p["public_dir"].get<std::string>();
            if (p.contains("views_dir"))  config.paths.viewsDir = p["views_dir"].get<std::string>();
        }

        if (j.contains("log_level")) config.logLevel = j["log_level"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigError(path + ": " + e.what());
    }

    return config;
}

void applyEnvironment(Config& config) {
    if (auto v = env("PORT"))                      config.server.port = parseInt("PORT", v);
    if (auto v = env("HOST"))                      config.server.host = v;
    if (auto v = env("SHORTURL_THREADS"))          config.server.threads = parseInt("SHORTURL_THREADS", v);
    if (auto v = env("SHORTURL_STORE"))            config.storage.kind = v;
    if (auto v = env("SHORTURL_DATA"))             config.storage.path = v;
    if (auto v = env("SHORTURL_DNS_TIMEOUT_MS"))   config.probe.timeoutMs = parseInt("SHORTURL_DNS_TIMEOUT_MS", v);
    if (auto v = env("SHORTURL_DNS_CONCURRENCY"))  config.probe.concurrency = parseInt("SHORTURL_DNS_CONCURRENCY", v);
    if (auto v = env("SHORTURL_LOG_LEVEL"))        config.logLevel = v;
}

int loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return 0;

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty()) continue;

        if (std::getenv(key.c_str()) != nullptr) continue;
        if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
            throw ConfigError(path + ": cannot set " + key);
        }
        ++count;
    }
    return count;
}

void validate(const Config& config) {
    if (config.server.port < 0 || config.server.port > 65535) {
        throw ConfigError("server.port out of range: " + std::to_string(config.server.port));
    }
    if (config.server.threads < 1) {
        throw ConfigError("server.threads must be at least 1");
    }
    if (config.storage.kind != "json" && config.storage.kind != "sqlite" &&
        config.storage.kind != "memory") {
        throw ConfigError("storage.kind must be json, sqlite or memory, got '" +
                          config.storage.kind + "'");
    }
    if (config.storage.kind != "memory" && config.storage.path.empty()) {
        throw ConfigError("storage.path is required for " + config.storage.kind);
    }
    if (config.probe.timeoutMs <= 0) {
        throw ConfigError("probe.timeout_ms must be positive");
    }
    if (config.probe.concurrency < 1) {
        throw ConfigError("probe.concurrency must be at least 1");
    }
}

} // namespace shorturl::config
