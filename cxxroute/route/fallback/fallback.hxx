/**
 * @file fallback.hxx
 * @brief Built-in handlers used when a request matches no route or dispatch fails.
 */

#ifndef CXXROUTE_ROUTE_FALLBACK_HXX
#define CXXROUTE_ROUTE_FALLBACK_HXX

namespace cxxroute::route::fallback {
    /**
     * @brief Default asset fallback: serves files below a root directory.
     *
     * Returns false when it answered the request, true when routing should
     * go on to the not-found handler.
     */
    struct assets_probe_t {
        /**
         * @brief Construct a probe.
         * @param root Directory files are served from.
         * @param index_file File served for a directory.
         */
        CXXROUTE_INLINE assets_probe_t(boost::filesystem::path root, std::string index_file)
            : m_root(std::move(root)), m_index_file(std::move(index_file)) {}

      public:
        /**
         * @brief Try to serve the request path as a file.
         * @param ctx HTTP context.
         * @return true to continue routing, false if a file was served.
         */
        bool operator()(http::http_ctx_t& ctx) const;

        /**
         * @brief Map a request path to a regular file below the root.
         * @param request_path Decoded request path.
         * @return The file, or nullopt if it escapes the root or does not exist.
         */
        [[nodiscard]] std::optional<boost::filesystem::path> resolve(const std::string_view& request_path) const;

      public:
        [[nodiscard]] CXXROUTE_INLINE const auto& root() const { return m_root; }

        [[nodiscard]] CXXROUTE_INLINE const auto& index_file() const { return m_index_file; }

      private:
        /** @brief Directory files are served from. */
        boost::filesystem::path m_root{};

        /** @brief File served for a directory. */
        std::string m_index_file{};
    };

    /**
     * @brief Default not-found handler.
     *
     * 404 with "404 - Not Found", or {"message": "Not found"} for the json class.
     */
    struct not_found_t {
        CXXROUTE_INLINE explicit not_found_t(const http::e_response_class& response_class)
            : m_response_class(response_class) {}

      public:
        void operator()(http::http_ctx_t& ctx) const;

      private:
        /** @brief Body format. */
        http::e_response_class m_response_class{};
    };

    /**
     * @brief Fixed internal-error response used when no recovery handler is set.
     * @param response_class Body format.
     * @return 500 with "500 - Internal Server Error", or {"message": "Internal server error"}.
     */
    http::response_t internal_error(const http::e_response_class& response_class);
}

#endif // CXXROUTE_ROUTE_FALLBACK_HXX
