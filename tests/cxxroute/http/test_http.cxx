#include <gtest/gtest.h>

#include <cxxroute.hxx>

using namespace cxxroute::http;

TEST(HttpTest, MethodStringRoundTrip) {
    EXPECT_EQ(str_to_method("GET"), e_method::get);
    EXPECT_EQ(str_to_method("DELETE"), e_method::delete_);
    EXPECT_EQ(str_to_method("PATCH"), e_method::patch);

    EXPECT_EQ(method_to_str(e_method::options), "OPTIONS");
    EXPECT_EQ(method_to_str(e_method::head), "HEAD");
}

TEST(HttpTest, MethodsAreCaseSensitive) {
    EXPECT_EQ(str_to_method("get"), e_method::unknown);
    EXPECT_EQ(str_to_method("BREW"), e_method::unknown);
}

TEST(HttpTest, RequestPathIsDecodedWithoutQuery) {
    request_t req(e_method::get, "/files/my%20doc.txt?version=2");

    EXPECT_EQ(req.path(), "/files/my doc.txt");
}

TEST(HttpTest, QueryFirstOccurrenceWins) {
    request_t req(e_method::get, "/search?q=first&q=second&page=3&name=a%20b");

    const auto query = req.query();

    EXPECT_EQ(query.at("q"), "first");
    EXPECT_EQ(query.at("page"), "3");
    EXPECT_EQ(query.at("name"), "a b");
}

TEST(HttpTest, HeaderLookupIsCaseInsensitive) {
    request_t req{};

    req.headers().emplace("Content-Type", "application/json");

    ASSERT_TRUE(req.header("content-type").has_value());
    EXPECT_EQ(*req.header("CONTENT-TYPE"), "application/json");
    EXPECT_FALSE(req.header("Accept").has_value());
}

TEST(HttpTest, KeepAliveFollowsVersionDefaults) {
    request_t req{};

    EXPECT_TRUE(req.keep_alive());

    req.headers().emplace("Connection", "close");

    EXPECT_FALSE(req.keep_alive());
}

TEST(HttpTest, KeepAliveHttp10ClosesByDefault) {
    request_t req{};

    req.version() = 10u;

    EXPECT_FALSE(req.keep_alive());

    req.headers().emplace("Connection", "Keep-Alive");

    EXPECT_TRUE(req.keep_alive());
}

TEST(HttpTest, KeepAliveReadsConnectionTokens) {
    request_t req{};

    req.headers().emplace("Connection", "Upgrade, close");

    EXPECT_FALSE(req.keep_alive());

    req.headers().at("Connection") = "Upgrade";

    EXPECT_TRUE(req.keep_alive());
}

TEST(HttpTest, PlainResponseSetsContentType) {
    response_t response("hello", e_status::created);

    EXPECT_EQ(response.status(), e_status::created);
    EXPECT_EQ(response.body(), "hello");
    EXPECT_EQ(response.headers().at("content-type"), "text/plain; charset=utf-8");
}

TEST(HttpTest, JsonResponseSerializesBody) {
    json_response_t response(json_t::json_obj_t{{"message", "Not found"}}, e_status::not_found);

    EXPECT_EQ(response.status(), e_status::not_found);
    EXPECT_EQ(response.headers().at("Content-Type"), "application/json");

    const auto parsed = json_t::deserialize(response.body());

    EXPECT_EQ(json_t::at<std::string>(parsed, "message"), "Not found");
}

TEST(HttpTest, FileResponseMissingFileIsNotFound) {
    file_response_t response(boost::filesystem::path("/nonexistent/cxxroute/file.txt"));

    EXPECT_EQ(response.status(), e_status::not_found);
    EXPECT_FALSE(response.stream());
    EXPECT_EQ(response.body(), "File not found");
}

TEST(HttpTest, FileResponseOnDirectoryIsBadRequest) {
    file_response_t response(boost::filesystem::temp_directory_path());

    EXPECT_EQ(response.status(), e_status::bad_request);
    EXPECT_FALSE(response.stream());
}

TEST(HttpTest, MimeTypeByExtension) {
    EXPECT_EQ(mime_types_t::get("index.html"), "text/html; charset=utf-8");
    EXPECT_EQ(mime_types_t::get("app.js"), "text/javascript; charset=utf-8");
    EXPECT_EQ(mime_types_t::get("blob.unknownext"), mime_types_t::k_default_mime_type);
}

TEST(HttpTest, BuiltinResponseClasses) {
    const auto plain = make_builtin_response(e_response_class::plain, e_status::not_found, "404 - Not Found", "Not found");

    EXPECT_EQ(plain.body(), "404 - Not Found");

    const auto json = make_builtin_response(e_response_class::json, e_status::not_found, "404 - Not Found", "Not found");

    EXPECT_EQ(json.body(), R"({"message":"Not found"})");
    EXPECT_EQ(json.status(), e_status::not_found);
}
