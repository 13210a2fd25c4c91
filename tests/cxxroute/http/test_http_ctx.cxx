#include <gtest/gtest.h>

#include <cxxroute.hxx>

using namespace cxxroute::http;

static request_t make_basic_request(const std::string_view& uri = "/test", e_method m = e_method::get) {
    request_t req(m, uri);

    req.client() = request_t::client_info_t("10.0.0.7", 51000u);

    return req;
}

TEST(HttpCtxTest, ParamLookup) {
    const auto req = make_basic_request("/user/alice");

    response_t response{};

    http_ctx_t ctx(req, response, params_t{{"name", "alice"}});

    EXPECT_EQ(ctx.param("name"), "alice");
    EXPECT_EQ(ctx.param("missing"), "");
}

TEST(HttpCtxTest, QueryValuePrefersParams) {
    const auto req = make_basic_request("/user/alice?name=bob&page=2");

    response_t response{};

    http_ctx_t ctx(req, response, params_t{{"name", "alice"}});

    EXPECT_EQ(ctx.query_value("name"), "alice");
    EXPECT_EQ(ctx.query_value("page"), "2");
    EXPECT_EQ(ctx.query_value("missing"), "");
    EXPECT_EQ(ctx.query().at("name"), "bob");
}

TEST(HttpCtxTest, RealIpFromRealIpHeader) {
    auto req = make_basic_request();

    req.headers().emplace("X-Real-IP", "203.0.113.9");
    req.headers().emplace("X-Forwarded-For", "198.51.100.1");

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.real_ip(), "203.0.113.9");
}

TEST(HttpCtxTest, RealIpFromLastForwardedEntry) {
    auto req = make_basic_request();

    req.headers().emplace("x-forwarded-for", "198.51.100.1, 192.0.2.44 ");

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.real_ip(), "192.0.2.44");
}

TEST(HttpCtxTest, RealIpFallsBackToPeer) {
    const auto req = make_basic_request();

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.real_ip(), "10.0.0.7");
}

TEST(HttpCtxTest, WriteString) {
    const auto req = make_basic_request();

    response_t response{};

    http_ctx_t ctx(req, response);

    ctx.write_string("pong");

    EXPECT_EQ(response.status(), e_status::ok);
    EXPECT_EQ(response.body(), "pong");
}

TEST(HttpCtxTest, WriteSuccessJsonEnvelope) {
    const auto req = make_basic_request("/api/items?limit=5");

    response_t response{};

    http_ctx_t ctx(req, response);

    ctx.write_success_json(json_t::json_obj_t{{"id", 7}});

    EXPECT_EQ(response.status(), e_status::ok);
    EXPECT_EQ(response.headers().at("Content-Type"), "application/json");

    const auto body = json_t::deserialize(response.body());

    EXPECT_EQ(json_t::at<std::int32_t>(body, "code"), 200);
    EXPECT_EQ(json_t::at<std::string>(body, "url"), "/api/items");
    EXPECT_EQ(body.at("data").at("id").get<std::int32_t>(), 7);

    const auto desc = json_t::at<std::string>(body, "desc");

    EXPECT_EQ(desc.rfind("test_http_ctx.cxx:", 0u), 0u);
}

TEST(HttpCtxTest, WriteErrorJsonPrefixesCategory) {
    const auto req = make_basic_request("/login");

    response_t response{};

    http_ctx_t ctx(req, response);

    ctx.write_error_json(e_error_code::auth, "token expired");

    EXPECT_EQ(response.status(), e_status::ok);

    const auto body = json_t::deserialize(response.body());

    EXPECT_EQ(json_t::at<std::int32_t>(body, "code"), 1000);
    EXPECT_EQ(json_t::at<std::string>(body, "data"), "AuthError: token expired");
}

TEST(HttpCtxTest, WriteErrorJsonCustomCode) {
    const auto req = make_basic_request("/orders");

    response_t response{};

    http_ctx_t ctx(req, response);

    ctx.write_error_json(4242, json_t::json_obj_t{{"field", "qty"}});

    const auto body = json_t::deserialize(response.body());

    EXPECT_EQ(json_t::at<std::int32_t>(body, "code"), 4242);
    EXPECT_EQ(body.at("data").at("field").get<std::string>(), "qty");
}

TEST(HttpCtxTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_str(e_error_code::param), "ParamError");
    EXPECT_EQ(error_code_to_str(e_error_code::db), "DBError");
    EXPECT_EQ(error_code_to_str(static_cast<e_error_code>(1)), "Unknown");
}

TEST(HttpCtxTest, QueryValueReadsUrlEncodedBody) {
    auto req = make_basic_request("/login?user=query&page=3", e_method::post);

    req.headers().emplace("Content-Type", "application/x-www-form-urlencoded; charset=utf-8");
    req.body() = "user=form&note=hello%20world";

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.query_value("user"), "form");
    EXPECT_EQ(ctx.query_value("note"), "hello world");
    EXPECT_EQ(ctx.query_value("page"), "3");
    EXPECT_EQ(ctx.query_value("missing"), "");
}

TEST(HttpCtxTest, BodyIgnoredForGet) {
    auto req = make_basic_request("/login", e_method::get);

    req.headers().emplace("Content-Type", "application/x-www-form-urlencoded");
    req.body() = "user=form";

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.query_value("user"), "");
    EXPECT_TRUE(ctx.form().m_values.empty());
}

TEST(HttpCtxTest, QueryValuesKeepsEveryOccurrence) {
    auto req = make_basic_request("/tags?tag=c&tag=d", e_method::post);

    req.headers().emplace("Content-Type", "application/x-www-form-urlencoded");
    req.body() = "tag=a&tag=b";

    response_t response{};

    http_ctx_t ctx(req, response, params_t{{"tag", "bound"}});

    EXPECT_EQ(ctx.query_values("tag"), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_TRUE(ctx.query_values("missing").empty());
}

TEST(HttpCtxTest, QueryValueReadsMultipartFields) {
    auto req = make_basic_request("/upload?title=query", e_method::post);

    req.headers().emplace("Content-Type", "multipart/form-data; boundary=XyZ");
    req.body() =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"title\"\r\n"
        "\r\n"
        "first line\r\nsecond line\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"doc\"; filename=\"notes.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "file body\r\n"
        "--XyZ--\r\n";

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.query_value("title"), "first line\r\nsecond line");
    EXPECT_EQ(ctx.query_value("doc"), "");

    const auto* file = ctx.form_file("doc");

    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->filename(), "notes.txt");
    EXPECT_EQ(file->content_type(), "text/plain");
    EXPECT_EQ(file->data(), "file body");
    EXPECT_EQ(ctx.form_file("title"), nullptr);
}

TEST(HttpCtxTest, MultipartWithoutClosingBoundaryIsEmpty) {
    auto req = make_basic_request("/upload", e_method::post);

    req.headers().emplace("Content-Type", "multipart/form-data; boundary=\"XyZ\"");
    req.body() =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"title\"\r\n"
        "\r\n"
        "cut off";

    response_t response{};

    http_ctx_t ctx(req, response);

    EXPECT_EQ(ctx.query_value("title"), "");
    EXPECT_TRUE(ctx.form().m_files.empty());
}

TEST(HttpCtxTest, HandleFormDataVisitsValuesThenFiles) {
    auto req = make_basic_request("/upload?q=1", e_method::post);

    req.headers().emplace("Content-Type", "multipart/form-data; boundary=b");
    req.body() =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n"
        "\r\n"
        "x\r\n"
        "--b\r\n"
        "Content-Disposition: form-data; name=\"f\"; filename=\"f.bin\"\r\n"
        "\r\n"
        "yy\r\n"
        "--b--";

    response_t response{};

    http_ctx_t ctx(req, response);

    std::vector<std::string> seen{};

    ctx.handle_form_data(
        [&seen](const std::string& key, const std::string& value) { seen.push_back(key + "=" + value); },
        [&seen](const std::string& key, const form_file_t& file) { seen.push_back(key + ":" + file.filename() + ":" + std::to_string(file.size())); }
    );

    EXPECT_EQ(seen, (std::vector<std::string>{"a=x", "q=1", "f:f.bin:2"}));
}

TEST(HttpCtxTest, ParseJsonBody) {
    auto req = make_basic_request("/items", e_method::post);

    req.body() = R"({"id": 7, "tags": ["a", "b"]})";

    response_t response{};

    http_ctx_t ctx(req, response);

    const auto body = ctx.parse_json_body();

    EXPECT_EQ(json_t::at<std::int32_t>(body, "id"), 7);
    EXPECT_EQ(ctx.parse_json_body<std::map<std::string, nlohmann::json>>().size(), 2u);
}

TEST(HttpCtxTest, ParseJsonBodyRejectsMalformedInput) {
    auto req = make_basic_request("/items", e_method::post);

    req.body() = "{not json";

    response_t response{};

    http_ctx_t ctx(req, response);

    try {
        static_cast<void>(ctx.parse_json_body());

        FAIL() << "Expected client_exception_t";
    }
    catch (const cxxroute::exceptions::client_exception_t& e) {
        EXPECT_EQ(e.status(), 400u);
    }
}

TEST(HttpCtxTest, WriteSuccessXml) {
    const auto req = make_basic_request("/report");

    response_t response{};

    http_ctx_t ctx(req, response);

    xml_tree_t data{};

    data.put("Name", "alice");

    ctx.write_success_xml(data);

    EXPECT_EQ(response.status(), e_status::ok);
    EXPECT_EQ(response.headers().at("Content-Type"), "application/xml");

    std::istringstream stream(response.body());

    xml_tree_t parsed{};

    boost::property_tree::read_xml(stream, parsed);

    EXPECT_EQ(parsed.get<std::int32_t>("ResponseResult.Code"), 200);
    EXPECT_EQ(parsed.get<std::string>("ResponseResult.URL"), "/report");
    EXPECT_EQ(parsed.get<std::string>("ResponseResult.Data.Name"), "alice");
    EXPECT_NE(parsed.get<std::string>("ResponseResult.Desc").find("test_http_ctx.cxx:"), std::string::npos);
}

TEST(HttpCtxTest, WriteErrorXmlUsesStatus) {
    const auto req = make_basic_request("/report");

    response_t response{};

    http_ctx_t ctx(req, response);

    ctx.write_error_xml(e_status::forbidden, "no access");

    EXPECT_EQ(response.status(), e_status::forbidden);

    std::istringstream stream(response.body());

    xml_tree_t parsed{};

    boost::property_tree::read_xml(stream, parsed);

    EXPECT_EQ(parsed.get<std::int32_t>("ResponseResult.Code"), 403);
    EXPECT_EQ(parsed.get<std::string>("ResponseResult.Data"), "no access");
}
