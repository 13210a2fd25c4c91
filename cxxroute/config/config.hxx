/**
 * @file config.hxx
 * @brief Loading and writing server_conf.json.
 *
 * The file holds {"servers": [ {...}, ... ]}. Every entry contributes a
 * listener (domain, port); the remaining settings are read from the first
 * entry.
 */

#ifndef CXXROUTE_CONFIG_HXX
#define CXXROUTE_CONFIG_HXX

namespace cxxroute::config {
    /** @brief Default configuration file name. */
    inline constexpr std::string_view k_default_path = "server_conf.json";

    /**
     * @brief Build a configuration from a parsed document.
     * @param document Parsed server_conf.json.
     * @return Configuration; absent keys keep their defaults.
     * @throws exceptions::config_exception_t if a key has the wrong type or "servers" is empty.
     */
    cxxroute_cfg_t from_json(const shared::json_traits_t::json_obj_t& document);

    /**
     * @brief Render a configuration as a server_conf.json document.
     * @param cfg Configuration.
     * @return Document with one "servers" entry per listener.
     */
    shared::json_traits_t::json_obj_t to_json(const cxxroute_cfg_t& cfg);

    /**
     * @brief Write a configuration file (4-space indented).
     * @param cfg Configuration.
     * @param path Destination.
     * @throws exceptions::config_exception_t if the file can't be written.
     */
    void save_to_file(const cxxroute_cfg_t& cfg, const boost::filesystem::path& path);

    /**
     * @brief Load a configuration file, creating it with defaults if it does not exist.
     * @param path Configuration file.
     * @return Loaded configuration.
     * @throws exceptions::config_exception_t on unreadable or malformed files.
     */
    cxxroute_cfg_t load_from_file(const boost::filesystem::path& path = boost::filesystem::path(std::string(k_default_path)));

    /**
     * @brief Configuration written when no file exists.
     *
     * localhost:8080, keep-alive 30s, info logging, assets from ./static.
     */
    cxxroute_cfg_t default_cfg();
}

#endif // CXXROUTE_CONFIG_HXX
