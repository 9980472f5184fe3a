// ═══════════════════════════════════════════════════════════════════
//  test_config.cpp — Defaults, config file, .env and environment
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <shorturl/config.h>
#include <shorturl/fs.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

using namespace shorturl;
using namespace shorturl::config;
namespace stdfs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    stdfs::path dir;

    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = stdfs::temp_directory_path() / ("shorturl-config-" + std::to_string(stamp));
        stdfs::create_directories(dir);
        for (auto name : kVariables) ::unsetenv(name);
    }

    void TearDown() override {
        for (auto name : kVariables) ::unsetenv(name);
        std::error_code ec;
        stdfs::remove_all(dir, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = (dir / name).string();
        fs::writeFileSync(path, content);
        return path;
    }

    static constexpr const char* kVariables[] = {
        "PORT", "HOST", "SHORTURL_STORE", "SHORTURL_DATA", "SHORTURL_THREADS",
        "SHORTURL_DNS_TIMEOUT_MS", "SHORTURL_DNS_CONCURRENCY", "SHORTURL_LOG_LEVEL",
        "SHORTURL_TEST_A", "SHORTURL_TEST_B", "SHORTURL_TEST_C",
    };
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    auto config = loadFromFile((dir / "absent.json").string());

    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.server.threads, 4);
    EXPECT_EQ(config.storage.kind, "json");
    EXPECT_EQ(config.storage.path, "./public/data.json");
    EXPECT_TRUE(config.probe.enabled);
    EXPECT_EQ(config.probe.timeoutMs, 5000);
    EXPECT_EQ(config.probe.concurrency, 16);
    EXPECT_EQ(config.paths.viewsDir, "./views");
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_NO_THROW(validate(config));
}

TEST_F(ConfigTest, FileOverridesOnlyListedKeys) {
    auto path = write("shorturl.json", R"({
        "server":  { "port": 8080 },
        "storage": { "kind": "sqlite", "path": "/var/lib/shorturl/urls.db" },
        "probe":   { "enabled": false, "concurrency": 32 },
        "log_level": "debug"
    })");

    auto config = loadFromFile(path);
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.storage.kind, "sqlite");
    EXPECT_EQ(config.storage.path, "/var/lib/shorturl/urls.db");
    EXPECT_FALSE(config.probe.enabled);
    EXPECT_EQ(config.probe.timeoutMs, 5000);
    EXPECT_EQ(config.probe.concurrency, 32);
    EXPECT_EQ(config.logLevel, "debug");
}

TEST_F(ConfigTest, MalformedFileThrows) {
    auto path = write("broken.json", "{ \"server\": ");
    EXPECT_THROW(loadFromFile(path), ConfigError);
}

TEST_F(ConfigTest, WrongTypeThrows) {
    auto path = write("typed.json", R"({ "server": { "port": "eighty" } })");
    EXPECT_THROW(loadFromFile(path), ConfigError);
}

TEST_F(ConfigTest, EnvironmentWinsOverFile) {
    auto path = write("shorturl.json", R"({ "server": { "port": 8080 } })");
    ::setenv("PORT", "9090", 1);
    ::setenv("SHORTURL_STORE", "memory", 1);
    ::setenv("SHORTURL_DNS_TIMEOUT_MS", "250", 1);
    ::setenv("SHORTURL_DNS_CONCURRENCY", "8", 1);

    auto config = loadFromFile(path);
    applyEnvironment(config);

    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.storage.kind, "memory");
    EXPECT_EQ(config.probe.timeoutMs, 250);
    EXPECT_EQ(config.probe.concurrency, 8);
}

TEST_F(ConfigTest, EmptyVariableIsIgnored) {
    ::setenv("PORT", "", 1);
    Config config;
    applyEnvironment(config);
    EXPECT_EQ(config.server.port, 3000);
}

TEST_F(ConfigTest, NonNumericPortThrows) {
    ::setenv("PORT", "80x", 1);
    Config config;
    EXPECT_THROW(applyEnvironment(config), ConfigError);
}

TEST_F(ConfigTest, DotEnvSetsUnsetVariables) {
    ::setenv("SHORTURL_TEST_C", "from-shell", 1);
    auto path = write(".env",
        "# comment\n"
        "SHORTURL_TEST_A=plain\n"
        "export SHORTURL_TEST_B=\"quoted value\"\n"
        "SHORTURL_TEST_C=from-file\n"
        "not a pair\n");

    EXPECT_EQ(loadDotEnv(path), 2);
    EXPECT_STREQ(std::getenv("SHORTURL_TEST_A"), "plain");
    EXPECT_STREQ(std::getenv("SHORTURL_TEST_B"), "quoted value");
    EXPECT_STREQ(std::getenv("SHORTURL_TEST_C"), "from-shell");
}

TEST_F(ConfigTest, MissingDotEnvSetsNothing) {
    EXPECT_EQ(loadDotEnv((dir / ".env").string()), 0);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config config;
    config.server.port = 70000;
    EXPECT_THROW(validate(config), ConfigError);

    config = Config{};
    config.server.threads = 0;
    EXPECT_THROW(validate(config), ConfigError);

    config = Config{};
    config.storage.kind = "redis";
    EXPECT_THROW(validate(config), ConfigError);

    config = Config{};
    config.storage.path.clear();
    EXPECT_THROW(validate(config), ConfigError);

    config = Config{};
    config.probe.timeoutMs = 0;
    EXPECT_THROW(validate(config), ConfigError);

    config = Config{};
    config.probe.concurrency = 0;
    EXPECT_THROW(validate(config), ConfigError);
}

TEST_F(ConfigTest, MemoryStoreNeedsNoPath) {
    Config config;
    config.storage.kind = "memory";
    config.storage.path.clear();
    EXPECT_NO_THROW(validate(config));
}
