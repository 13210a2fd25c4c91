#include <gtest/gtest.h>

#include <cxxroute.hxx>

using namespace cxxroute;

static http::response_t serve(const route::c_router& router, const http::e_method method, const std::string_view& uri) {
    const http::request_t req(method, uri);

    http::response_t response{};

    router.serve(req, response);

    return response;
}

static route::router_cfg_t no_assets_cfg() {
    route::router_cfg_t cfg{};

    cfg.m_asset_dir = "/nonexistent/cxxroute-assets";

    return cfg;
}

TEST(RouterTest, DispatchesParamRoute) {
    route::c_router router(no_assets_cfg());

    router.get("/user/:name", [](http::http_ctx_t& ctx) { ctx.write_string(fmt::format("hello {}", ctx.param("name"))); });

    const auto response = serve(router, http::e_method::get, "/user/alice");

    EXPECT_EQ(response.status(), http::e_status::ok);
    EXPECT_EQ(response.body(), "hello alice");
}

TEST(RouterTest, RegexMismatchFallsThroughToNotFound) {
    route::c_router router(no_assets_cfg());

    router.get("/product/{id:[0-9]+}", [](http::http_ctx_t& ctx) { ctx.write_string(ctx.param("id")); });

    EXPECT_EQ(serve(router, http::e_method::get, "/product/123").body(), "123");

    const auto missing = serve(router, http::e_method::get, "/product/abc");

    EXPECT_EQ(missing.status(), http::e_status::not_found);
    EXPECT_EQ(missing.body(), "404 - Not Found");
}

TEST(RouterTest, NoHandlerIsNotFound) {
    route::c_router router(no_assets_cfg());

    router.get("/a/b", [](http::http_ctx_t& ctx) { ctx.write_string("ab"); });

    EXPECT_EQ(serve(router, http::e_method::get, "/a").status(), http::e_status::not_found);
}

TEST(RouterTest, WrongMethodIsNotFound) {
    route::c_router router(no_assets_cfg());

    router.post("/items", [](http::http_ctx_t& ctx) { ctx.write_string("created"); });

    EXPECT_EQ(serve(router, http::e_method::post, "/items").body(), "created");
    EXPECT_EQ(serve(router, http::e_method::get, "/items").status(), http::e_status::not_found);
}

TEST(RouterTest, AllRegistrarVerbs) {
    route::c_router router(no_assets_cfg());

    const auto reply = [](std::string body) {
        return [body = std::move(body)](http::http_ctx_t& ctx) { ctx.write_string(body); };
    };

    router.get("/r", reply("get"));
    router.post("/r", reply("post"));
    router.put("/r", reply("put"));
    router.delete_("/r", reply("delete"));
    router.patch("/r", reply("patch"));
    router.head("/r", reply("head"));
    router.options("/r", reply("options"));

    EXPECT_EQ(serve(router, http::e_method::put, "/r").body(), "put");
    EXPECT_EQ(serve(router, http::e_method::delete_, "/r").body(), "delete");
    EXPECT_EQ(serve(router, http::e_method::options, "/r").body(), "options");
    EXPECT_EQ(router.routes().size(), 7u);
}

TEST(RouterTest, DuplicateRegistrationThrows) {
    route::c_router router(no_assets_cfg());

    router.get("/dup", [](http::http_ctx_t&) {});

    EXPECT_THROW(router.get("/dup", [](http::http_ctx_t&) {}), exceptions::route_exception_t);
}

TEST(RouterTest, CaseFoldingLowersRequestPath) {
    route::c_router router(no_assets_cfg());

    router.get("/Users/:name", [](http::http_ctx_t& ctx) { ctx.write_string(ctx.param("name")); });

    const auto response = serve(router, http::e_method::get, "/USERS/Alice");

    EXPECT_EQ(response.status(), http::e_status::ok);
    EXPECT_EQ(response.body(), "alice");
}

TEST(RouterTest, CaseSensitiveWhenFoldingDisabled) {
    auto cfg = no_assets_cfg();

    cfg.m_case_folding = false;

    route::c_router router(cfg);

    router.get("/Users/:name", [](http::http_ctx_t& ctx) { ctx.write_string(ctx.param("name")); });

    EXPECT_EQ(serve(router, http::e_method::get, "/Users/Alice").body(), "Alice");
    EXPECT_EQ(serve(router, http::e_method::get, "/users/Alice").status(), http::e_status::not_found);
}

TEST(RouterTest, DecodedPathIsMatched) {
    route::c_router router(no_assets_cfg());

    router.get("/files/:name", [](http::http_ctx_t& ctx) { ctx.write_string(ctx.param("name")); });

    EXPECT_EQ(serve(router, http::e_method::get, "/files/a%20b?x=1").body(), "a b");
}

TEST(RouterTest, GlobalHooksRunAroundHandler) {
    route::c_router router(no_assets_cfg());

    std::vector<std::string> trace{};

    router.add_before([&trace](http::http_ctx_t&) {
        trace.emplace_back("before");

        return true;
    });

    router.add_after([&trace](http::http_ctx_t&) { trace.emplace_back("after"); });

    router.get("/ping", [&trace](http::http_ctx_t& ctx) {
        trace.emplace_back("handler");

        ctx.write_string("pong");
    });

    EXPECT_EQ(serve(router, http::e_method::get, "/ping").body(), "pong");
    EXPECT_EQ(trace, (std::vector<std::string>{"before", "handler", "after"}));

    trace.clear();

    EXPECT_EQ(serve(router, http::e_method::get, "/nope").status(), http::e_status::not_found);
    EXPECT_EQ(trace, (std::vector<std::string>{"before", "after"}));
}

TEST(RouterTest, BeforeHookAbortSkipsHandlerAndAfterHooks) {
    route::c_router router(no_assets_cfg());

    bool handler_ran{};
    bool after_ran{};

    router.add_before([](http::http_ctx_t& ctx) {
        if (ctx.request().header("Authorization"))
            return true;

        ctx.response() = http::response_t("denied", http::e_status::unauthorized);

        return false;
    });

    router.add_after([&after_ran](http::http_ctx_t&) { after_ran = true; });

    router.get("/secret", [&handler_ran](http::http_ctx_t&) { handler_ran = true; });

    const auto response = serve(router, http::e_method::get, "/secret");

    EXPECT_EQ(response.status(), http::e_status::unauthorized);
    EXPECT_EQ(response.body(), "denied");
    EXPECT_FALSE(handler_ran);
    EXPECT_FALSE(after_ran);
}

TEST(RouterTest, CustomNotFound) {
    route::c_router router(no_assets_cfg());

    router.set_not_found([](http::http_ctx_t& ctx) {
        ctx.response() = http::response_t(fmt::format("no {}", ctx.request().path()), http::e_status::not_found);
    });

    EXPECT_EQ(serve(router, http::e_method::get, "/missing").body(), "no /missing");

    router.set_not_found(nullptr);

    EXPECT_EQ(serve(router, http::e_method::get, "/missing").body(), "404 - Not Found");
}

TEST(RouterTest, JsonResponseClass) {
    auto cfg = no_assets_cfg();

    cfg.m_response_class = http::e_response_class::json;

    route::c_router router(cfg);

    router.get("/boom", [](http::http_ctx_t&) { throw std::runtime_error("boom"); });

    const auto missing = serve(router, http::e_method::get, "/missing");

    EXPECT_EQ(missing.status(), http::e_status::not_found);
    EXPECT_EQ(missing.headers().at("Content-Type"), "application/json");
    EXPECT_EQ(missing.body(), R"({"message":"Not found"})");

    const auto failed = serve(router, http::e_method::get, "/boom");

    EXPECT_EQ(failed.status(), http::e_status::internal_server_error);
    EXPECT_EQ(failed.body(), R"({"message":"Internal server error"})");
}

TEST(RouterTest, FrozenRouterRejectsChanges) {
    route::c_router router(no_assets_cfg());

    auto group = router.group("/api");

    router.freeze();

    EXPECT_TRUE(router.frozen());

    EXPECT_THROW(router.get("/late", [](http::http_ctx_t&) {}), exceptions::route_exception_t);
    EXPECT_THROW(router.add_before([](http::http_ctx_t&) { return true; }), exceptions::route_exception_t);
    EXPECT_THROW(router.add_after([](http::http_ctx_t&) {}), exceptions::route_exception_t);
    EXPECT_THROW(router.set_not_found(nullptr), exceptions::route_exception_t);
    EXPECT_THROW(router.set_recovery(nullptr), exceptions::route_exception_t);
    EXPECT_THROW(router.set_assets(nullptr), exceptions::route_exception_t);
    EXPECT_THROW(static_cast<void>(router.group("/v2")), exceptions::route_exception_t);

    EXPECT_THROW(group.get("/late", [](http::http_ctx_t&) {}), exceptions::route_exception_t);
    EXPECT_THROW(group.add_before([](http::http_ctx_t&) { return true; }), exceptions::route_exception_t);
    EXPECT_THROW(static_cast<void>(group.group("/v1")), exceptions::route_exception_t);
}

TEST(RouterTest, MatchExposesStatus) {
    route::c_router router(no_assets_cfg());

    router.get("/a/:id", [](http::http_ctx_t&) {});

    const auto result = router.match(http::e_method::get, "/A/7");

    EXPECT_EQ(result.m_status, route::internal::e_match_status::matched);
    EXPECT_EQ(result.m_params.at("id"), "7");

    EXPECT_EQ(router.match(http::e_method::get, "/b").m_status, route::internal::e_match_status::no_route);
}

TEST(RouterTest, AddRouteWithExplicitMethod) {
    route::c_router router(no_assets_cfg());

    router.add_route(http::e_method::post, "/product/{id:[0-9]+}", [](http::http_ctx_t& ctx) { ctx.write_string(ctx.param("id")); });

    EXPECT_EQ(serve(router, http::e_method::post, "/product/123").body(), "123");
    EXPECT_EQ(serve(router, http::e_method::post, "/product/abc").status(), http::e_status::not_found);
}

TEST(RouterTest, HooksBeforeAbortStillRan) {
    route::c_router router(no_assets_cfg());

    std::vector<std::string> trace{};

    router.add_before([&trace](http::http_ctx_t&) {
        trace.emplace_back("first");

        return true;
    });

    router.add_before([&trace](http::http_ctx_t&) {
        trace.emplace_back("abort");

        return false;
    });

    router.add_before([&trace](http::http_ctx_t&) {
        trace.emplace_back("never");

        return true;
    });

    router.get("/x", [&trace](http::http_ctx_t&) { trace.emplace_back("handler"); });

    serve(router, http::e_method::get, "/x");

    EXPECT_EQ(trace, (std::vector<std::string>{"first", "abort"}));
}

TEST(RouterTest, ConcurrentServeKeepsParamsPerRequest) {
    route::c_router router(no_assets_cfg());

    router.get("/user/:name", [](http::http_ctx_t& ctx) {
        std::this_thread::yield();

        ctx.write_string(ctx.param("name"));
    });

    router.freeze();

    constexpr std::size_t k_threads = 8u;
    constexpr std::size_t k_requests = 200u;

    std::atomic<std::size_t> mismatches{};

    std::vector<std::thread> threads{};

    for (std::size_t t{}; t < k_threads; t++) {
        threads.emplace_back([&router, &mismatches, t] {
            for (std::size_t i{}; i < k_requests; i++) {
                const auto name = fmt::format("u{}-{}", t, i);

                const auto response = serve(router, http::e_method::get, fmt::format("/user/{}", name));

                if (response.status() != http::e_status::ok
                    || response.body() != name)
                    mismatches.fetch_add(1u, std::memory_order_relaxed);
            }
        });
    }

    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(mismatches.load(), 0u);
}
