#include <cxxroute.hxx>

namespace cxxroute::route::fallback {
    bool assets_probe_t::operator()(http::http_ctx_t& ctx) const {
        const auto file = resolve(ctx.request().path());

        if (!file)
            return true;

        ctx.response() = http::file_response_t(*file);

        if (ctx.response().status() != http::e_status::ok) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(
                e_log_level::warning,

                "[Router] Asset {} could not be served: {}",

                file->string(), ctx.response().body()
            );
#endif // CXXROUTE_USE_LOGGING_IMPL
        }

        return false;
    }

    std::optional<boost::filesystem::path> assets_probe_t::resolve(const std::string_view& request_path) const {
        boost::filesystem::path relative{};

        for (const auto& part : internal::split_path(request_path)) {
            if (part.empty()
                || part == ".")
                continue;

            if (part == ".."
                || part.find('\\') != std::string::npos
                || part.find('\0') != std::string::npos)
                return std::nullopt;

            relative /= part;
        }

        boost::system::error_code error_code{};

        const auto root = boost::filesystem::weakly_canonical(m_root, error_code);

        if (error_code)
            return std::nullopt;

        auto candidate = root / relative;

        if (boost::filesystem::is_directory(candidate, error_code))
            candidate /= m_index_file;

        if (!boost::filesystem::is_regular_file(candidate, error_code))
            return std::nullopt;

        const auto resolved = boost::filesystem::canonical(candidate, error_code);

        if (error_code)
            return std::nullopt;

        if (std::mismatch(root.begin(), root.end(), resolved.begin(), resolved.end()).first != root.end())
            return std::nullopt;

        return resolved;
    }

    void not_found_t::operator()(http::http_ctx_t& ctx) const {
        ctx.response() = http::make_builtin_response(
            m_response_class,

            http::e_status::not_found,

            "404 - Not Found",
            "Not found"
        );
    }

    http::response_t internal_error(const http::e_response_class& response_class) {
        return http::make_builtin_response(
            response_class,

            http::e_status::internal_server_error,

            "500 - Internal Server Error",
            "Internal server error"
        );
    }
}
