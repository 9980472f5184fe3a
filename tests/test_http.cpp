// ═══════════════════════════════════════════════════════════════════
//  test_http.cpp — Request, Response, middleware and routing
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <shorturl/console.h>
#include <shorturl/http.h>
#include <shorturl/lifecycle.h>
#include <shorturl/middleware.h>
#include <shorturl/testing.h>

#include <atomic>
#include <csignal>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace shorturl;
using namespace shorturl::http;

// ═══════════════════════════════════════════
//  Request Tests
// ═══════════════════════════════════════════

TEST(RequestTest, HeaderLookupCaseInsensitive) {
    Request req;
    req.headers["content-type"] = "application/json";
    req.headers["x-forwarded-for"] = "10.0.0.1";

    EXPECT_EQ(req.header("Content-Type"), "application/json");
    EXPECT_EQ(req.header("X-Forwarded-For"), "10.0.0.1");
    EXPECT_EQ(req.header("nonexistent"), "");
}

TEST(RequestTest, ContentTypeCheck) {
    Request req;
    req.headers["content-type"] = "application/x-www-form-urlencoded; charset=utf-8";

    EXPECT_TRUE(req.is("application/x-www-form-urlencoded"));
    EXPECT_FALSE(req.is("application/json"));
}

TEST(UrlDecodeTest, DecodesEscapesAndPlus) {
    EXPECT_EQ(urlDecode("https%3A%2F%2Fexample.com%2Fa+b"), "https://example.com/a b");
}

TEST(UrlDecodeTest, KeepsMalformedEscapes) {
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz"), "%zz");
    EXPECT_EQ(urlDecode("%4"), "%4");
}

TEST(EncodeUrlTest, EscapesControlBytesAndSpaces) {
    EXPECT_EQ(encodeUrl("https://example.com/a\r\nX: y"), "https://example.com/a%0D%0AX:%20y");
    EXPECT_EQ(encodeUrl("https://example.com/\t"), "https://example.com/%09");
}

TEST(EncodeUrlTest, KeepsUrlCharactersAndValidEscapes) {
    EXPECT_EQ(encodeUrl("https://example.com/p?a=1&b=%2F#frag"), "https://example.com/p?a=1&b=%2F#frag");
    EXPECT_EQ(encodeUrl("https://[::1]:8080/~user"), "https://[::1]:8080/~user");
}

TEST(EncodeUrlTest, EscapesStrayPercentAndNonAscii) {
    EXPECT_EQ(encodeUrl("100%"), "100%25");
    EXPECT_EQ(encodeUrl("%zz"), "%25zz");
    EXPECT_EQ(encodeUrl("caf\xC3\xA9"), "caf%C3%A9");
    EXPECT_EQ(encodeUrl("<\"{}|>"), "%3C%22%7B%7D%7C%3E");
}

// ═══════════════════════════════════════════
//  Response Tests
// ═══════════════════════════════════════════

TEST(ResponseTest, DefaultStatus200) {
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });

    res.send("OK");
    EXPECT_EQ(sentStatus, 200);
}

TEST(ResponseTest, SendOnlyOnce) {
    int calls = 0;
    Response res([&](int, const auto&, const auto&) { ++calls; });

    res.send("first");
    res.send("second");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(res.getBody(), "first");
}

TEST(ResponseTest, JsonSetsContentType) {
    HeaderMap sentHeaders;
    std::string sentBody;
    Response res([&](int, const HeaderMap& h, const std::string& b) {
        sentHeaders = h;
        sentBody = b;
    });

    res.json({{"error", "invalid url"}});
    EXPECT_EQ(sentHeaders["Content-Type"], "application/json; charset=utf-8");
    EXPECT_EQ(nlohmann::json::parse(sentBody)["error"], "invalid url");
}

TEST(ResponseTest, RedirectIs302WithLocation) {
    int sentStatus = 0;
    HeaderMap sentHeaders;
    std::string sentBody;
    Response res([&](int s, const HeaderMap& h, const std::string& b) {
        sentStatus = s;
        sentHeaders = h;
        sentBody = b;
    });

    res.redirect("https://example.com");
    EXPECT_EQ(sentStatus, 302);
    EXPECT_EQ(sentHeaders["Location"], "https://example.com");
    EXPECT_EQ(sentBody, "Found. Redirecting to https://example.com");
}

TEST(ResponseTest, RedirectEncodesLocation) {
    HeaderMap sentHeaders;
    Response res([&](int, const HeaderMap& h, const std::string&) { sentHeaders = h; });

    res.redirect("https://example.com/a\r\nSet-Cookie: x=1");
    EXPECT_EQ(sentHeaders["Location"], "https://example.com/a%0D%0ASet-Cookie:%20x=1");
}

TEST(ResponseTest, DetachedResponseFinishesLater) {
    int sentStatus = 0;
    std::string sentBody;
    Response res([&](int s, const auto&, const std::string& b) {
        sentStatus = s;
        sentBody = b;
    });
    res.status(201).set("X-Request", "abc");

    auto later = res.detach();
    EXPECT_TRUE(res.detached());
    EXPECT_TRUE(res.headersSent());
    res.send("ignored");
    EXPECT_EQ(sentStatus, 0);

    std::thread([later] { later->send("done"); }).join();
    EXPECT_EQ(sentStatus, 201);
    EXPECT_EQ(sentBody, "done");
    EXPECT_EQ(later->getHeaders().at("X-Request"), "abc");
}

TEST(ResponseTest, SendStatusShorthand) {
    int sentStatus = 0;
    std::string sentBody;
    Response res([&](int s, const auto&, const std::string& b) {
        sentStatus = s;
        sentBody = b;
    });

    res.sendStatus(404);
    EXPECT_EQ(sentStatus, 404);
    EXPECT_EQ(sentBody, "404");
}

// ═══════════════════════════════════════════
//  Middleware Tests
// ═══════════════════════════════════════════

TEST(MiddlewareTest, BodyParserParsesJson) {
    auto req = shorturl::testing::createRequest("POST", "/", R"({"url":"https://example.com"})",
                                      {{"Content-Type", "application/json"}});
    Response res;
    bool nextCalled = false;

    middleware::bodyParser()(req, res, [&] { nextCalled = true; });

    EXPECT_TRUE(nextCalled);
    EXPECT_EQ(req.body.string("url"), "https://example.com");
}

TEST(MiddlewareTest, BodyParserRejectsInvalidJson) {
    auto req = shorturl::testing::createRequest("POST", "/", "{ broken",
                                      {{"Content-Type", "application/json"}});
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });
    bool nextCalled = false;

    middleware::bodyParser()(req, res, [&] { nextCalled = true; });

    EXPECT_FALSE(nextCalled);
    EXPECT_EQ(sentStatus, 400);
}

TEST(MiddlewareTest, BodyParserDecodesFormData) {
    auto req = shorturl::testing::createRequest("POST", "/", "url=https%3A%2F%2Fexample.com%2F%3Fq%3D1&x=a+b",
                                      {{"Content-Type", "application/x-www-form-urlencoded"}});
    Response res;

    middleware::bodyParser()(req, res, [] {});

    EXPECT_EQ(req.body.string("url"), "https://example.com/?q=1");
    EXPECT_EQ(req.body.string("x"), "a b");
}

TEST(MiddlewareTest, BodyParserSkipsEmptyBody) {
    auto req = shorturl::testing::createRequest("POST", "/", "", {{"Content-Type", "application/json"}});
    Response res;
    bool nextCalled = false;

    middleware::bodyParser()(req, res, [&] { nextCalled = true; });

    EXPECT_TRUE(nextCalled);
    EXPECT_FALSE(req.body.string("url").has_value());
}

TEST(MiddlewareTest, CorsSetsHeaders) {
    auto req = shorturl::testing::createRequest("GET", "/api/hello");
    Response res;
    bool nextCalled = false;

    middleware::cors()(req, res, [&] { nextCalled = true; });

    EXPECT_TRUE(nextCalled);
    EXPECT_EQ(res.getHeaders().at("Access-Control-Allow-Origin"), "*");
}

TEST(MiddlewareTest, CorsAnswersPreflight) {
    auto req = shorturl::testing::createRequest("OPTIONS", "/api/shorturl");
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });
    bool nextCalled = false;

    middleware::cors()(req, res, [&] { nextCalled = true; });

    EXPECT_FALSE(nextCalled);
    EXPECT_EQ(sentStatus, 204);
}

TEST(MiddlewareTest, MimeTypes) {
    EXPECT_EQ(middleware::detail::mimeType(".css"), "text/css; charset=utf-8");
    EXPECT_EQ(middleware::detail::mimeType(".html"), "text/html; charset=utf-8");
    EXPECT_EQ(middleware::detail::mimeType(".bin"), "application/octet-stream");
}

TEST(MiddlewareTest, RejectsParentSegments) {
    EXPECT_TRUE(middleware::detail::isSafeRelative("css/site.css"));
    EXPECT_FALSE(middleware::detail::isSafeRelative("../secret"));
    EXPECT_FALSE(middleware::detail::isSafeRelative("a/../../b"));
    EXPECT_FALSE(middleware::detail::isSafeRelative("/etc/passwd"));
}

// ═══════════════════════════════════════════
//  Server Routing Tests
// ═══════════════════════════════════════════

TEST(ServerTest, RouteParameters) {
    auto app = createServer();
    app.get("/api/shorturl/:code", [](Request& req, Response& res) {
        res.send(req.params["code"]);
    });

    shorturl::testing::TestClient client(app);
    auto r = client.get("/api/shorturl/417").exec();
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "417");
}

TEST(ServerTest, ParameterDoesNotSpanSegments) {
    auto app = createServer();
    app.get("/api/shorturl/:code", [](Request&, Response& res) { res.send("matched"); });

    shorturl::testing::TestClient client(app);
    EXPECT_EQ(client.get("/api/shorturl/1/2").exec().status, 404);
}

TEST(ServerTest, MethodMatching) {
    auto app = createServer();
    app.get("/api/shorturl", [](Request&, Response& res) { res.send("get"); });
    app.post("/api/shorturl", [](Request&, Response& res) { res.send("post"); });

    shorturl::testing::TestClient client(app);
    EXPECT_EQ(client.get("/api/shorturl").exec().body, "get");
    EXPECT_EQ(client.post("/api/shorturl").exec().body, "post");
}

TEST(ServerTest, AllMatchesAnyMethod) {
    auto app = createServer();
    app.all("/ping", [](Request& req, Response& res) { res.send(req.method); });

    shorturl::testing::TestClient client(app);
    EXPECT_EQ(client.get("/ping").exec().body, "GET");
    EXPECT_EQ(client.post("/ping").exec().body, "POST");
}

TEST(ServerTest, Returns404ForUnknownRoute) {
    auto app = createServer();
    shorturl::testing::TestClient client(app);

    auto r = client.get("/nope").exec();
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.json()["message"], "Cannot GET /nope");
}

TEST(ServerTest, MiddlewareExecutionOrder) {
    auto app = createServer();
    std::vector<int> order;

    app.use([&](Request&, Response&, NextFunction next) { order.push_back(1); next(); });
    app.use([&](Request&, Response&, NextFunction next) { order.push_back(2); next(); });
    app.get("/", [&](Request&, Response& res) {
        order.push_back(3);
        res.send("done");
    });

    shorturl::testing::TestClient client(app);
    client.get("/").exec();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(ServerTest, MiddlewareCanShortCircuit) {
    auto app = createServer();
    bool handlerRan = false;

    app.use([](Request&, Response& res, NextFunction) { res.status(403).send("no"); });
    app.get("/", [&](Request&, Response& res) {
        handlerRan = true;
        res.send("yes");
    });

    shorturl::testing::TestClient client(app);
    auto r = client.get("/").exec();
    EXPECT_EQ(r.status, 403);
    EXPECT_FALSE(handlerRan);
}

TEST(ServerTest, DetachedResponseSkipsFallback) {
    auto app = createServer();
    std::shared_ptr<Response> pending;
    app.get("/later", [&](Request&, Response& res) { pending = res.detach(); });

    int sentStatus = 0;
    auto req = shorturl::testing::createRequest("GET", "/later");
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });
    app.handleRequest(req, res);

    EXPECT_EQ(sentStatus, 0);
    ASSERT_TRUE(pending);
    pending->json({{"ok", true}});
    EXPECT_EQ(sentStatus, 200);
}

TEST(ServerTest, HandlerExceptionBecomes500) {
    console::setLevel(console::Level::Silent);
    auto app = createServer();
    app.get("/boom", [](Request&, Response&) {
        throw std::runtime_error("disk on fire");
    });

    shorturl::testing::TestClient client(app);
    auto r = client.get("/boom").exec();
    console::setLevel(console::Level::Info);

    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.json()["error"], "internal error");
}

// ═══════════════════════════════════════════
//  JsonValue (req.body)
// ═══════════════════════════════════════════

TEST(JsonValueTest, MissingKeysAreNull) {
    JsonValue body(nlohmann::json{{"url", "https://example.com"}});

    EXPECT_TRUE(body.has("url"));
    EXPECT_FALSE(body.has("code"));
    EXPECT_TRUE(body["code"].isNull());
    EXPECT_EQ(body["url"].get<std::string>(), "https://example.com");
}

TEST(JsonValueTest, TypedFieldWithFallback) {
    JsonValue body(nlohmann::json{{"url", 42}, {"limit", 5}});

    EXPECT_EQ(body.get<int>("limit", 1), 5);
    EXPECT_EQ(body.get<std::string>("url", "none"), "none");
    EXPECT_EQ(body.get<int>("absent", 7), 7);
    EXPECT_FALSE(body.string("url").has_value());
}

TEST(JsonValueTest, DefaultIsEmptyObject) {
    JsonValue body;
    EXPECT_TRUE(body.isObject());
    EXPECT_EQ(body.size(), 0u);
    EXPECT_EQ(body.dump(), "{}");
}

// ═══════════════════════════════════════════
//  Console levels
// ═══════════════════════════════════════════

TEST(ConsoleTest, ParseLevel) {
    EXPECT_EQ(console::parseLevel("debug"), console::Level::Debug);
    EXPECT_EQ(console::parseLevel("warn"), console::Level::Warn);
    EXPECT_EQ(console::parseLevel("silent"), console::Level::Silent);
    EXPECT_EQ(console::parseLevel("verbose"), console::Level::Info);
}

TEST(ConsoleTest, SetLevelIsVisible) {
    console::setLevel(console::Level::Error);
    EXPECT_EQ(console::level(), console::Level::Error);
    console::setLevel(console::Level::Info);
}

// ═══════════════════════════════════════════
//  Shutdown through signal_set
// ═══════════════════════════════════════════

TEST(ShutdownTest, SigtermStopsListen) {
    console::setLevel(console::Level::Silent);
    auto app = createServer();
    app.get("/", [](Request&, Response& res) { res.send("ok"); });
    lifecycle::enableGracefulShutdown(app);

    std::promise<void> up;
    auto ready = up.get_future();
    std::thread server([&] {
        app.workers(2).listen("127.0.0.1", 0, [&] { up.set_value(); });
    });

    ASSERT_EQ(ready.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(app.listening());
    std::raise(SIGTERM);
    server.join();

    EXPECT_FALSE(app.listening());
    console::setLevel(console::Level::Info);
}

TEST(ShutdownTest, SignalHandlersRunOnWorker) {
    console::setLevel(console::Level::Silent);
    auto app = createServer();
    std::atomic<int> seen{0};
    app.onSignal({SIGUSR1}, [&](int sig) {
        seen = sig;
        app.close();
    });

    std::promise<void> up;
    auto ready = up.get_future();
    std::thread server([&] {
        app.listen("127.0.0.1", 0, [&] { up.set_value(); });
    });

    ASSERT_EQ(ready.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    std::raise(SIGUSR1);
    server.join();

    EXPECT_EQ(seen.load(), SIGUSR1);
    console::setLevel(console::Level::Info);
}
