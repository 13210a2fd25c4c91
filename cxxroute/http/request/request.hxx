/**
 * @file request.hxx
 * @brief Defines the HTTP request handed to the dispatch entrypoint.
 *
 * Encapsulates method, request target, headers, body and client info of one
 * inbound HTTP request, independent of the transport that produced it.
 */

#ifndef CXXROUTE_HTTP_REQUEST_HXX
#define CXXROUTE_HTTP_REQUEST_HXX

namespace cxxroute::http {
    /**
     * @brief Represents an HTTP request in CXXROUTE.
     *
     * The router reads the method and the decoded path; handlers read
     * everything else through http_ctx_t. The request is never modified by
     * the router, so the asset fallback sees the original target.
     */
    struct request_t {
        /**
         * @brief Default constructor.
         */
        CXXROUTE_INLINE request_t() = default;

        /**
         * @brief Construct a request from a method and a target.
         * @param method HTTP method.
         * @param uri Origin-form request target, query string included.
         */
        CXXROUTE_INLINE request_t(const e_method& method, const std::string_view& uri)
            : m_method(method), m_uri(uri) {
        }

      public:
        /**
         * @brief Determine whether the client requested a persistent connection.
         * @return For HTTP/1.1, true unless the Connection header lists "close";
         *         for HTTP/1.0, true only if it lists "keep-alive".
         */
        [[nodiscard]] CXXROUTE_INLINE bool keep_alive() const {
            const auto it = m_headers.find("connection");

            const auto persistent_by_default = m_version >= 11u;

            if (it == m_headers.end())
                return persistent_by_default;

            std::vector<std::string> tokens{};

            boost::algorithm::split(tokens, it->second, boost::is_any_of(","));

            for (auto& token : tokens) {
                boost::algorithm::trim(token);

                if (boost::iequals(token, "close"))
                    return false;

                if (boost::iequals(token, "keep-alive"))
                    return true;
            }

            return persistent_by_default;
        }

        /**
         * @brief Percent-decoded path of the target, without the query string.
         */
        [[nodiscard]] CXXROUTE_INLINE std::string path() const { return utils::decode_path(m_uri); }

        /**
         * @brief Decoded query-string parameters of the target.
         */
        [[nodiscard]] CXXROUTE_INLINE query_t query() const { return utils::decode_query(m_uri); }

        /**
         * @brief Look up a header value.
         * @param name Header name (case-insensitive).
         * @return The value, or nullopt if the header is absent.
         */
        [[nodiscard]] CXXROUTE_INLINE std::optional<std::string_view> header(const std::string_view& name) const {
            const auto it = m_headers.find(name);

            if (it == m_headers.end())
                return std::nullopt;

            return std::string_view{it->second};
        }

      public:
        /**
         * @brief Information about the peer that sent the request.
         */
        struct client_info_t {
            CXXROUTE_INLINE client_info_t() = default;

            /**
             * @brief Constructs a client info object.
             * @param remote_addr The client's remote address.
             * @param remote_port The client's remote port.
             */
            CXXROUTE_INLINE client_info_t(
                const std::string_view& remote_addr,
                const std::uint16_t& remote_port
            )
                : m_remote_addr(remote_addr),
                  m_remote_port(remote_port) {
            }

          public:
            CXXROUTE_INLINE auto& remote_addr() { return m_remote_addr; }

            [[nodiscard]] CXXROUTE_INLINE const auto& remote_addr() const { return m_remote_addr; }

            CXXROUTE_INLINE auto& remote_port() { return m_remote_port; }

            [[nodiscard]] CXXROUTE_INLINE const auto& remote_port() const { return m_remote_port; }

          private:
            /** @brief The client's remote address. */
            std::string m_remote_addr{};

            /** @brief The client's remote port. */
            std::uint16_t m_remote_port{};
        };

      public:
        /**
         * @brief Get the HTTP method (mutable).
         */
        CXXROUTE_INLINE auto& method() { return m_method; }

        /**
         * @brief Get the HTTP method (read-only).
         */
        [[nodiscard]] CXXROUTE_INLINE const auto& method() const { return m_method; }

        /**
         * @brief Get the raw request target (mutable).
         */
        CXXROUTE_INLINE auto& uri() { return m_uri; }

        /**
         * @brief Get the raw request target (read-only).
         */
        [[nodiscard]] CXXROUTE_INLINE const auto& uri() const { return m_uri; }

        /**
         * @brief HTTP version as major * 10 + minor (11 for HTTP/1.1).
         */
        CXXROUTE_INLINE auto& version() { return m_version; }

        [[nodiscard]] CXXROUTE_INLINE const auto& version() const { return m_version; }

        CXXROUTE_INLINE auto& body() { return m_body; }

        [[nodiscard]] CXXROUTE_INLINE const auto& body() const { return m_body; }

        CXXROUTE_INLINE auto& headers() { return m_headers; }

        [[nodiscard]] CXXROUTE_INLINE const auto& headers() const { return m_headers; }

        CXXROUTE_INLINE auto& client() { return m_client_info; }

        [[nodiscard]] CXXROUTE_INLINE const auto& client() const { return m_client_info; }

      private:
        /** @brief HTTP method. */
        e_method m_method{e_method::get};

        /** @brief Request target as received. */
        uri_t m_uri{"/"};

        /** @brief HTTP version. */
        std::uint32_t m_version{11u};

        /** @brief Request body. */
        body_t m_body{};

        /** @brief HTTP headers. */
        headers_t m_headers{};

        /** @brief Client information. */
        client_info_t m_client_info{};
    };
}

#endif // CXXROUTE_HTTP_REQUEST_HXX
