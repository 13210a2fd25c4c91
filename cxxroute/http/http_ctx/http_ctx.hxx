/**
 * @file http_ctx.hxx
 * @brief Per-request context passed to hooks, handlers and fallbacks.
 */

#ifndef CXXROUTE_HTTP_HTTP_CTX_HXX
#define CXXROUTE_HTTP_HTTP_CTX_HXX

namespace cxxroute::http {
    /**
     * @brief Application error categories carried in JSON error payloads.
     */
    enum struct e_error_code : std::int32_t {
        auth = 1000,  ///< Permission or authentication failure.
        param = 2000, ///< Invalid or missing parameter.
        biz = 3000,   ///< Business rule violation.
        net = 4000,   ///< Network failure.
        db = 5000,    ///< Database failure.
        io = 6000,    ///< I/O failure.
        other = 7000  ///< Anything else.
    };

    /**
     * @brief Convert an error code to its display name.
     * @param code Error code.
     * @return "AuthError", "ParamError", ... or "Unknown".
     */
    CXXROUTE_INLINE constexpr std::string_view error_code_to_str(const e_error_code& code) {
        switch (code) {
            case e_error_code::auth:
                return "AuthError";
            case e_error_code::param:
                return "ParamError";
            case e_error_code::biz:
                return "BizError";
            case e_error_code::net:
                return "NetError";
            case e_error_code::db:
                return "DBError";
            case e_error_code::io:
                return "IOError";
            case e_error_code::other:
                return "OtherError";
            default:
                return "Unknown";
        }
    }

    /**
     * @brief HTTP context: the request, the response sink and the bound route parameters.
     *
     * Built by the router once per request. Parameters are owned by the
     * context, so concurrent requests never share them.
     */
    struct http_ctx_t {
        /**
         * @brief Constructor binding a request and its response sink.
         * @param request HTTP request object.
         * @param response Response sink filled during dispatch.
         * @param params Initial route parameters.
         */
        CXXROUTE_INLINE http_ctx_t(const request_t& request, response_t& response, params_t params = {})
            : m_request(request), m_response(response), m_params(std::move(params)) {
        }

      public:
        CXXROUTE_INLINE http_ctx_t(const http_ctx_t&) = delete;

        CXXROUTE_INLINE http_ctx_t& operator=(const http_ctx_t&) = delete;

      public:
        /**
         * @brief Value of a bound route parameter.
         * @param name Parameter name as written in the pattern.
         * @return The bound value, empty if the route has no such parameter.
         */
        [[nodiscard]] std::string param(const std::string_view& name) const;

        /**
         * @brief Decoded query-string parameters of the request.
         */
        [[nodiscard]] query_t query() const;

        /**
         * @brief Look a parameter up in every request source.
         * @param key Parameter name.
         * @return The bound route parameter, else the first value of a body
         *         form field, else the first query-string value; empty if
         *         no source has it.
         */
        [[nodiscard]] std::string query_value(const std::string_view& key) const;

        /**
         * @brief Every value of a parameter: body form fields first, then the query string.
         * @param key Parameter name.
         * @return The values in order, empty if there are none.
         */
        [[nodiscard]] std::vector<std::string> query_values(const std::string_view& key) const;

        /**
         * @brief Fields and files decoded from the request body.
         *
         * Only POST, PUT and PATCH bodies are read, as
         * application/x-www-form-urlencoded or multipart/form-data. The
         * result is decoded once and kept for the rest of the request.
         */
        [[nodiscard]] const form_t& form() const;

        /**
         * @brief First uploaded file of a multipart field.
         * @param key Field name.
         * @return The file, nullptr if the field has none.
         */
        [[nodiscard]] const form_file_t* form_file(const std::string_view& key) const;

        /**
         * @brief Visit every form value: body fields, then query-string parameters.
         * @param handler Called with each key and value.
         */
        void handle_form_values(const std::function<void(const std::string&, const std::string&)>& handler) const;

        /**
         * @brief Visit every uploaded file.
         * @param handler Called with each field name and file.
         */
        void handle_form_files(const std::function<void(const std::string&, const form_file_t&)>& handler) const;

        /**
         * @brief Visit every form value, then every uploaded file.
         * @param value_handler Called with each key and value.
         * @param file_handler Called with each field name and file.
         */
        void handle_form_data(
            const std::function<void(const std::string&, const std::string&)>& value_handler,
            const std::function<void(const std::string&, const form_file_t&)>& file_handler
        ) const;

        /**
         * @brief Decode the request body as JSON.
         * @tparam _type_t Target type (default is the JSON document).
         * @return The decoded value.
         * @throws exceptions::client_exception_t with status 400 if the body is not valid JSON for the type.
         */
        template <typename _type_t = json_t::json_obj_t>
        [[nodiscard]] CXXROUTE_INLINE _type_t parse_json_body() const {
            try {
                return json_t::deserialize<_type_t>(m_request.body());
            }
            catch (const std::runtime_error& e) {
                throw exceptions::client_exception_t(e.what(), 400u);
            }
        }

        /**
         * @brief Address of the originating client.
         * @return X-Real-IP, else the last X-Forwarded-For entry, else the peer address.
         */
        [[nodiscard]] std::string real_ip() const;

      public:
        /**
         * @brief Write a plain-text 200 response.
         * @param body Response body.
         */
        void write_string(std::string body);

        /**
         * @brief Write a 200 JSON result: {"code":200,"url":..,"desc":..,"data":..}.
         * @param data Payload placed under "data".
         * @param location Call site, rendered as "file:line" into "desc".
         */
        void write_success_json(
            const json_t::json_obj_t& data,

            const std::source_location location = std::source_location::current()
        );

        /**
         * @brief Write an error result with an application error code.
         * @param code Error category, its name prefixes the message.
         * @param message Error message.
         * @param location Call site.
         *
         * The HTTP status stays 200; the error lives in the payload.
         */
        void write_error_json(
            const e_error_code& code,
            const std::string_view& message,

            const std::source_location location = std::source_location::current()
        );

        /**
         * @brief Write an error result with a raw numeric code.
         * @param code Code placed under "code".
         * @param data Payload placed under "data", unmodified.
         * @param location Call site.
         */
        void write_error_json(
            const std::int32_t code,
            const json_t::json_obj_t& data,

            const std::source_location location = std::source_location::current()
        );

        /**
         * @brief Write a 200 XML result with the same fields as write_success_json.
         * @param data Tree placed under ResponseResult.Data.
         * @param location Call site.
         */
        void write_success_xml(
            const xml_tree_t& data,

            const std::source_location location = std::source_location::current()
        );

        /**
         * @brief Write an XML error result with the given HTTP status.
         * @param status HTTP status, also placed under ResponseResult.Code.
         * @param message Text placed under ResponseResult.Data.
         * @param location Call site.
         */
        void write_error_xml(
            const e_status& status,
            const std::string_view& message,

            const std::source_location location = std::source_location::current()
        );

      public:
        /**
         * @brief Getter for the HTTP request object.
         */
        [[nodiscard]] CXXROUTE_INLINE const auto& request() const { return m_request; }

        /**
         * @brief Getter for the response sink.
         */
        CXXROUTE_INLINE auto& response() { return m_response; }

        [[nodiscard]] CXXROUTE_INLINE const auto& response() const { return m_response; }

        /**
         * @brief Getter for the route parameters (mutable).
         */
        CXXROUTE_INLINE auto& params() { return m_params; }

        [[nodiscard]] CXXROUTE_INLINE const auto& params() const { return m_params; }

      private:
        /**
         * @brief Fill the response with a {code,url,desc,data} payload.
         */
        void write_result(
            const std::int32_t code,
            const json_t::json_obj_t& data,

            const std::source_location& location
        );

        void write_xml_result(
            const e_status& status,
            const xml_tree_t& data,

            const std::source_location& location
        );

      private:
        /** @brief HTTP request object. */
        const request_t& m_request;

        /** @brief Response sink. */
        response_t& m_response;

        /** @brief Route parameters bound by the matcher. */
        params_t m_params{};

        /** @brief Body form, decoded on first use. */
        mutable std::optional<form_t> m_form{};
    };
}

#endif // CXXROUTE_HTTP_HTTP_CTX_HXX
