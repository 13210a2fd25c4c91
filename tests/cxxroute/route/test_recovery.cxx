#include <gtest/gtest.h>

#include <cxxroute.hxx>

using namespace cxxroute;

static http::response_t serve(const route::c_router& router, const std::string_view& uri) {
    const http::request_t req(http::e_method::get, uri);

    http::response_t response{};

    router.serve(req, response);

    return response;
}

TEST(RecoveryTest, ThrowingHandlerGivesFixed500) {
    route::c_router router{};

    router.get("/panic", [](http::http_ctx_t&) { throw std::runtime_error("kaboom"); });
    router.get("/ok", [](http::http_ctx_t& ctx) { ctx.write_string("fine"); });

    const auto failed = serve(router, "/panic");

    EXPECT_EQ(failed.status(), http::e_status::internal_server_error);
    EXPECT_EQ(failed.body(), "500 - Internal Server Error");

    // The router keeps serving after a failure.
    const auto next = serve(router, "/ok");

    EXPECT_EQ(next.status(), http::e_status::ok);
    EXPECT_EQ(next.body(), "fine");
}

TEST(RecoveryTest, PartialResponseIsReplaced) {
    route::c_router router{};

    router.get("/half", [](http::http_ctx_t& ctx) {
        ctx.write_string("partial");

        throw std::logic_error("late failure");
    });

    const auto response = serve(router, "/half");

    EXPECT_EQ(response.status(), http::e_status::internal_server_error);
    EXPECT_EQ(response.body(), "500 - Internal Server Error");
}

TEST(RecoveryTest, RecoveryHandlerReceivesFailure) {
    route::c_router router{};

    std::string seen{};

    router.set_recovery([&seen](http::http_ctx_t& ctx, const recovered_failure_t& failure) {
        seen = failure.message();

        EXPECT_TRUE(failure.standard());
        EXPECT_THROW(failure.rethrow(), std::invalid_argument);

        ctx.response() = http::response_t(fmt::format("recovered {}", ctx.request().path()), http::e_status::service_unavailable);
    });

    router.get("/bad", [](http::http_ctx_t&) { throw std::invalid_argument("bad input"); });

    const auto response = serve(router, "/bad");

    EXPECT_EQ(seen, "bad input");
    EXPECT_EQ(response.status(), http::e_status::service_unavailable);
    EXPECT_EQ(response.body(), "recovered /bad");
}

TEST(RecoveryTest, RecoveryHandlerStartsFromEmptyResponse) {
    route::c_router router{};

    router.set_recovery([](http::http_ctx_t& ctx, const recovered_failure_t&) {
        EXPECT_TRUE(ctx.response().body().empty());
    });

    router.get("/dirty", [](http::http_ctx_t& ctx) {
        ctx.write_string("dirty");

        throw std::runtime_error("fail");
    });

    const auto response = serve(router, "/dirty");

    EXPECT_EQ(response.status(), http::e_status::ok);
    EXPECT_TRUE(response.body().empty());
}

TEST(RecoveryTest, NonStandardFailureIsCaught) {
    route::c_router router{};

    bool standard{true};

    std::string message{};

    router.set_recovery([&](http::http_ctx_t&, const recovered_failure_t& failure) {
        standard = failure.standard();
        message = failure.message();
    });

    router.get("/int", [](http::http_ctx_t&) { throw 42; });

    serve(router, "/int");

    EXPECT_FALSE(standard);
    EXPECT_EQ(message, "unknown failure");
}

TEST(RecoveryTest, AfterHooksSkippedOnFailure) {
    route::c_router router{};

    bool global_after{};
    bool group_after{};

    router.add_after([&global_after](http::http_ctx_t&) { global_after = true; });

    auto group = router.group("/g");

    group.add_after([&group_after](http::http_ctx_t&) { group_after = true; });

    group.get("/fail", [](http::http_ctx_t&) { throw std::runtime_error("fail"); });

    EXPECT_EQ(serve(router, "/g/fail").status(), http::e_status::internal_server_error);

    EXPECT_FALSE(global_after);
    EXPECT_FALSE(group_after);
}

TEST(RecoveryTest, HandlerRunsExactlyOnce) {
    route::c_router router{};

    std::int32_t calls{};

    router.get("/once", [&calls](http::http_ctx_t&) {
        ++calls;

        throw std::runtime_error("once");
    });

    serve(router, "/once");

    EXPECT_EQ(calls, 1);
}

TEST(RecoveryTest, FailingHookIsRecovered) {
    route::c_router router{};

    router.add_before([](http::http_ctx_t&) -> bool { throw std::runtime_error("hook failure"); });

    router.get("/x", [](http::http_ctx_t& ctx) { ctx.write_string("x"); });

    EXPECT_EQ(serve(router, "/x").status(), http::e_status::internal_server_error);
}

TEST(RecoveryTest, EmptyRecoveryRestoresFixed500) {
    route::c_router router{};

    router.set_recovery([](http::http_ctx_t& ctx, const recovered_failure_t&) { ctx.write_string("custom"); });
    router.set_recovery(nullptr);

    router.get("/boom", [](http::http_ctx_t&) { throw std::runtime_error("boom"); });

    EXPECT_EQ(serve(router, "/boom").body(), "500 - Internal Server Error");
}
