#include <gtest/gtest.h>

#include <cxxroute.hxx>

using namespace cxxroute;

namespace {
    struct temp_dir_t {
        temp_dir_t() : m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cxxroute-cfg-%%%%-%%%%")) {
            boost::filesystem::create_directories(m_path);
        }

        ~temp_dir_t() {
            boost::system::error_code error_code{};

            boost::filesystem::remove_all(m_path, error_code);
        }

        boost::filesystem::path m_path{};
    };

    void write_file(const boost::filesystem::path& path, const std::string& content) {
        std::ofstream file(path.string());

        file << content;
    }
}

TEST(ConfigTest, MissingFileIsCreatedWithDefaults) {
    temp_dir_t dir{};

    const auto path = dir.m_path / "server_conf.json";

    const auto cfg = config::load_from_file(path);

    EXPECT_TRUE(boost::filesystem::exists(path));

    ASSERT_EQ(cfg.m_listeners.size(), 1u);
    EXPECT_EQ(cfg.m_listeners.front().m_host, "localhost");
    EXPECT_EQ(cfg.m_listeners.front().m_port, 8080u);
    EXPECT_EQ(cfg.m_router.m_asset_dir, boost::filesystem::path("./static"));

    // A second load reads the file that was just written.
    const auto reloaded = config::load_from_file(path);

    EXPECT_EQ(reloaded.m_listeners.front().m_port, 8080u);
    EXPECT_EQ(reloaded.m_router.m_index_file, "index.html");
    EXPECT_EQ(reloaded.m_http.m_keep_alive_timeout, std::chrono::seconds(30));
}

TEST(ConfigTest, LoadsAllKeys) {
    temp_dir_t dir{};

    const auto path = dir.m_path / "server_conf.json";

    write_file(path, R"({
        "servers": [
            {
                "domain": "0.0.0.0",
                "port": 9000,
                "workers": 2,
                "max_header_bytes": 4096,
                "keep_alive": {"enabled": false, "timeout": 5},
                "static_files": {"static_dir": "/srv/www", "index_file": "home.html"},
                "logging": {"log_level": "warn"}
            },
            {
                "domain": "127.0.0.1",
                "port": 9001,
                "workers": 16
            }
        ]
    })");

    const auto cfg = config::load_from_file(path);

    ASSERT_EQ(cfg.m_listeners.size(), 2u);
    EXPECT_EQ(cfg.m_listeners[0].m_host, "0.0.0.0");
    EXPECT_EQ(cfg.m_listeners[0].m_port, 9000u);
    EXPECT_EQ(cfg.m_listeners[1].m_host, "127.0.0.1");
    EXPECT_EQ(cfg.m_listeners[1].m_port, 9001u);

    // Shared settings come from the first entry.
    EXPECT_EQ(cfg.m_server.m_workers, 2);
    EXPECT_EQ(cfg.m_server.m_max_header_bytes, 4096u);
    EXPECT_FALSE(cfg.m_http.m_keep_alive);
    EXPECT_EQ(cfg.m_http.m_keep_alive_timeout, std::chrono::seconds(5));
    EXPECT_EQ(cfg.m_router.m_asset_dir, boost::filesystem::path("/srv/www"));
    EXPECT_EQ(cfg.m_router.m_index_file, "home.html");

#ifdef CXXROUTE_HAS_LOGGING_IMPL
    EXPECT_EQ(cfg.m_logger.m_level, e_log_level::warning);
#endif // CXXROUTE_HAS_LOGGING_IMPL
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    const auto cfg = config::from_json(shared::json_traits_t::deserialize(R"({"servers": [{"port": 7000}]})"));

    ASSERT_EQ(cfg.m_listeners.size(), 1u);
    EXPECT_EQ(cfg.m_listeners.front().m_host, "localhost");
    EXPECT_EQ(cfg.m_listeners.front().m_port, 7000u);
    EXPECT_EQ(cfg.m_server.m_workers, 4);
    EXPECT_TRUE(cfg.m_http.m_keep_alive);
}

TEST(ConfigTest, MalformedJsonThrows) {
    temp_dir_t dir{};

    const auto path = dir.m_path / "server_conf.json";

    write_file(path, R"({"servers": [ {"port": 80, )");

    EXPECT_THROW(config::load_from_file(path), exceptions::config_exception_t);
}

TEST(ConfigTest, InvalidShapeThrows) {
    using json_t = shared::json_traits_t;

    EXPECT_THROW(config::from_json(json_t::deserialize("{}")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": []})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": {"port": 80}})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"port": "eighty"}]})")), exceptions::config_exception_t);

    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"port": 70000}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"port": -1}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"port": 80.5}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"workers": -2}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"workers": 4294967297}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"max_header_bytes": 0}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"max_header_bytes": 4294967296}]})")), exceptions::config_exception_t);
    EXPECT_THROW(config::from_json(json_t::deserialize(R"({"servers": [{"keep_alive": {"timeout": -5}}]})")), exceptions::config_exception_t);
}

TEST(ConfigTest, IntegerBoundsAreAccepted) {
    using json_t = shared::json_traits_t;

    const auto cfg = config::from_json(json_t::deserialize(R"({"servers": [{"port": 65535, "workers": 0, "max_header_bytes": 4294967295}]})"));

    EXPECT_EQ(cfg.m_listeners.front().m_port, 65535u);
    EXPECT_EQ(cfg.m_server.m_workers, 0);
    EXPECT_EQ(cfg.m_server.m_max_header_bytes, 4294967295u);
}

TEST(ConfigTest, SaveThenLoadKeepsValues) {
    temp_dir_t dir{};

    const auto path = dir.m_path / "custom.json";

    auto cfg = config::default_cfg();

    cfg.m_listeners = {{"127.0.0.1", 8181u}};
    cfg.m_server.m_workers = 3;
    cfg.m_router.m_index_file = "start.html";

    config::save_to_file(cfg, path);

    const auto loaded = config::load_from_file(path);

    ASSERT_EQ(loaded.m_listeners.size(), 1u);
    EXPECT_EQ(loaded.m_listeners.front().m_port, 8181u);
    EXPECT_EQ(loaded.m_server.m_workers, 3);
    EXPECT_EQ(loaded.m_router.m_index_file, "start.html");
}

TEST(ConfigTest, AppTakesRouterSettingsFromConfig) {
    auto cfg = config::default_cfg();

    cfg.m_router.m_case_folding = false;

    c_cxxroute app(cfg);

    app.router().get("/CaseSensitive", [](http::http_ctx_t& ctx) { ctx.write_string("yes"); });

    EXPECT_FALSE(app.running());
    EXPECT_FALSE(app.router().frozen());
    EXPECT_EQ(app.router().routes(), std::vector<std::string>{"GET /CaseSensitive"});
}
