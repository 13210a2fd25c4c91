#include <cxxroute.hxx>

namespace cxxroute::config {
    using json_t = shared::json_traits_t;

    namespace {
        /**
         * @brief Read an optional integer field and check it fits [min, max].
         * @throws exceptions::config_exception_t if the value is not an integer or is out of range.
         */
        template <typename _type_t>
        _type_t bounded_value(
            const json_t::json_obj_t& obj,
            const std::string& key,

            const _type_t fallback,

            const std::int64_t min,
            const std::int64_t max
        ) {
            if (!obj.is_object())
                return fallback;

            const auto it = obj.find(key);

            if (it == obj.end()
                || it->is_null())
                return fallback;

            if (!it->is_number_integer())
                throw exceptions::config_exception_t(fmt::format("\"{}\" must be an integer, got {}", key, it->dump()));

            const auto in_range = it->is_number_unsigned()
                                    ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(max)
                                    : it->get<std::int64_t>() >= min && it->get<std::int64_t>() <= max;

            if (!in_range)
                throw exceptions::config_exception_t(fmt::format("\"{}\" must be between {} and {}, got {}", key, min, max, it->dump()));

            return static_cast<_type_t>(it->get<std::int64_t>());
        }
    }

    cxxroute_cfg_t default_cfg() {
        cxxroute_cfg_t cfg{};

        cfg.m_router.m_asset_dir = "./static";

        return cfg;
    }

    cxxroute_cfg_t from_json(const json_t::json_obj_t& document) {
        cxxroute_cfg_t cfg{};

        try {
            const auto& servers = document.at("servers");

            if (!servers.is_array()
                || servers.empty())
                throw exceptions::config_exception_t("\"servers\" must be a non-empty array");

            cfg.m_listeners.clear();

            for (const auto& server : servers) {
                cxxroute_cfg_t::listener_t listener{};

                listener.m_host = json_t::value<std::string>(server, "domain", listener.m_host);
                listener.m_port = bounded_value<std::uint16_t>(server, "port", listener.m_port, 0, std::numeric_limits<std::uint16_t>::max());

                cfg.m_listeners.push_back(std::move(listener));
            }

            const auto& first = servers.front();

            cfg.m_server.m_workers = bounded_value<std::int32_t>(first, "workers", cfg.m_server.m_workers, 0, std::numeric_limits<std::int32_t>::max());
            cfg.m_server.m_max_header_bytes = bounded_value<std::size_t>(first, "max_header_bytes", cfg.m_server.m_max_header_bytes, 1, std::numeric_limits<std::uint32_t>::max());

            if (const auto keep_alive = first.find("keep_alive"); keep_alive != first.end()) {
                cfg.m_http.m_keep_alive = json_t::value<bool>(*keep_alive, "enabled", cfg.m_http.m_keep_alive);

                cfg.m_http.m_keep_alive_timeout = std::chrono::seconds(
                    bounded_value<std::int64_t>(*keep_alive, "timeout", cfg.m_http.m_keep_alive_timeout.count(), 0, std::numeric_limits<std::int32_t>::max())
                );
            }

            if (const auto static_files = first.find("static_files"); static_files != first.end()) {
                cfg.m_router.m_asset_dir = json_t::value<std::string>(*static_files, "static_dir", cfg.m_router.m_asset_dir.string());
                cfg.m_router.m_index_file = json_t::value<std::string>(*static_files, "index_file", cfg.m_router.m_index_file);
            }

#ifdef CXXROUTE_HAS_LOGGING_IMPL
            if (const auto logging = first.find("logging"); logging != first.end()) {
                const auto level = json_t::value<std::string>(*logging, "log_level", "info");

                cfg.m_logger.m_level = shared::str_to_lvl(level);
            }
#endif // CXXROUTE_HAS_LOGGING_IMPL
        }
        catch (const exceptions::config_exception_t&) {
            throw;
        }
        catch (const std::exception& e) {
            throw exceptions::config_exception_t(fmt::format("Invalid configuration: {}", e.what()));
        }

        return cfg;
    }

    json_t::json_obj_t to_json(const cxxroute_cfg_t& cfg) {
        auto servers = json_t::json_obj_t::array();

        for (const auto& listener : cfg.m_listeners) {
            json_t::json_obj_t server{};

            server["domain"] = listener.m_host;
            server["port"] = listener.m_port;
            server["workers"] = cfg.m_server.m_workers;
            server["max_header_bytes"] = cfg.m_server.m_max_header_bytes;

            server["keep_alive"] = {
                {"enabled", cfg.m_http.m_keep_alive},
                {"timeout", cfg.m_http.m_keep_alive_timeout.count()}
            };

            server["static_files"] = {
                {"static_dir", cfg.m_router.m_asset_dir.string()},
                {"index_file", cfg.m_router.m_index_file}
            };

#ifdef CXXROUTE_HAS_LOGGING_IMPL
            server["logging"] = {
                {"log_level", cfg.m_logger.m_level == e_log_level::none
                                  ? std::string("none")
                                  : boost::algorithm::to_lower_copy(std::string(g_logging->lvl_to_str(cfg.m_logger.m_level)))}
            };
#endif // CXXROUTE_HAS_LOGGING_IMPL

            servers.push_back(std::move(server));
        }

        return json_t::json_obj_t{{"servers", std::move(servers)}};
    }

    void save_to_file(const cxxroute_cfg_t& cfg, const boost::filesystem::path& path) {
        std::ofstream file(path.string(), std::ios::trunc);

        if (!file)
            throw exceptions::config_exception_t(fmt::format("Can't open {} for writing", path.string()));

        file << json_t::serialize(to_json(cfg), 4) << "\n";

        if (!file)
            throw exceptions::config_exception_t(fmt::format("Can't write {}", path.string()));
    }

    cxxroute_cfg_t load_from_file(const boost::filesystem::path& path) {
        boost::system::error_code error_code{};

        if (!boost::filesystem::exists(path, error_code)) {
            auto cfg = default_cfg();

            save_to_file(cfg, path);

#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::info, "[Config] {} not found, created it with defaults", path.string());
#else
            std::cerr << fmt::format("[Config] {} not found, created it with defaults", path.string()) << "\n";
#endif // CXXROUTE_USE_LOGGING_IMPL

            return cfg;
        }

        std::ifstream file(path.string());

        if (!file)
            throw exceptions::config_exception_t(fmt::format("Can't open {}", path.string()));

        const std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

        json_t::json_obj_t document{};

        try {
            document = json_t::deserialize(content);
        }
        catch (const std::exception& e) {
            throw exceptions::config_exception_t(fmt::format("Malformed {}: {}", path.string(), e.what()));
        }

        return from_json(document);
    }
}
