/**
 * @file response.hxx
 * @brief HTTP response abstractions.
 */

#ifndef CXXROUTE_HTTP_RESPONSE_HXX
#define CXXROUTE_HTTP_RESPONSE_HXX

namespace cxxroute::http {
    /**
     * @brief The response sink filled by hooks, handlers and fallbacks.
     *
     * Derived types only add constructors, so assigning one of them to a
     * response_t& (ctx.response() = json_response_t{...}) keeps everything.
     */
    struct response_t {
        /**
         * @brief Sink a streaming callback writes body chunks into.
         */
        using chunk_writer_t = std::function<boost::asio::awaitable<void>(std::string_view)>;

        /**
         * @brief Type alias for a callback producing a streamed body.
         *
         * The transport writes the headers first, then hands the callback a
         * writer that puts each chunk on the wire.
         */
        using callback_t = std::function<boost::asio::awaitable<void>(const chunk_writer_t&)>;

      public:
        /**
         * @brief Default constructor: 200 with an empty body.
         */
        CXXROUTE_INLINE response_t() = default;

        CXXROUTE_INLINE virtual ~response_t() = default;

        CXXROUTE_INLINE response_t(const response_t&) = default;

        CXXROUTE_INLINE response_t& operator=(const response_t&) = default;

        CXXROUTE_INLINE response_t(response_t&&) = default;

        CXXROUTE_INLINE response_t& operator=(response_t&&) = default;

        /**
         * @brief Construct a plain-text response.
         * @param body The response body.
         * @param status_code The HTTP status code to send (default is 200 OK).
         * @param headers Additional headers to include.
         */
        CXXROUTE_INLINE response_t(std::string&& body, e_status&& status_code = e_status::ok, headers_t&& headers = {}) {
            m_body = std::move(body);

            merge_headers(std::move(headers));

            m_headers.emplace("Content-Type", "text/plain; charset=utf-8");

            m_status = std::move(status_code);
        }

      protected:
        /**
         * @brief Move caller-supplied headers in, overwriting existing keys.
         */
        CXXROUTE_INLINE void merge_headers(headers_t&& headers) {
            for (auto& header : headers)
                m_headers[header.first] = std::move(header.second);
        }

      public:
        CXXROUTE_INLINE auto& body() { return m_body; }

        [[nodiscard]] CXXROUTE_INLINE const auto& body() const { return m_body; }

        CXXROUTE_INLINE auto& headers() { return m_headers; }

        [[nodiscard]] CXXROUTE_INLINE const auto& headers() const { return m_headers; }

        CXXROUTE_INLINE auto& status() { return m_status; }

        [[nodiscard]] CXXROUTE_INLINE const auto& status() const { return m_status; }

        /**
         * @brief Whether the body is produced by the callback instead of m_body.
         */
        [[nodiscard]] CXXROUTE_INLINE bool stream() const { return m_stream; }

        [[nodiscard]] CXXROUTE_INLINE const auto& callback() const { return m_callback; }

      public:
        /** @brief Body. */
        body_t m_body{};

        /** @brief Headers. */
        headers_t m_headers{};

        /** @brief Status code. */
        e_status m_status{e_status::ok};

        /** @brief Flag indicating if the response is streamed. */
        bool m_stream{false};

        /** @brief Callback producing the streamed body. */
        callback_t m_callback{};
    };

    /**
     * @brief A JSON response, serializing a JSON object to the body.
     *
     * Sets "Content-Type: application/json".
     */
    struct json_response_t : public response_t {
        CXXROUTE_INLINE json_response_t() = default;

        /**
         * @brief Construct a JSON response from a JSON object.
         * @param body The JSON object to serialize.
         * @param status_code The HTTP status code (default is 200 OK).
         * @param headers Additional headers to include.
         */
        CXXROUTE_INLINE json_response_t(const json_t::json_obj_t& body, e_status&& status_code = e_status::ok, headers_t&& headers = {}) {
            m_body = json_t::serialize(body);

            merge_headers(std::move(headers));

            m_headers.emplace("Content-Type", "application/json");

            m_status = std::move(status_code);
        }
    };

    /**
     * @brief An XML response, writing a property tree to the body.
     *
     * Sets "Content-Type: application/xml".
     */
    struct xml_response_t : public response_t {
        CXXROUTE_INLINE xml_response_t() = default;

        /**
         * @brief Construct an XML response from a property tree.
         * @param body The tree to write, its single top-level child is the root element.
         * @param status_code The HTTP status code (default is 200 OK).
         * @param headers Additional headers to include.
         */
        CXXROUTE_INLINE xml_response_t(const xml_tree_t& body, e_status&& status_code = e_status::ok, headers_t&& headers = {}) {
            std::ostringstream stream{};

            boost::property_tree::write_xml(stream, body);

            m_body = stream.str();

            merge_headers(std::move(headers));

            m_headers.emplace("Content-Type", "application/xml");

            m_status = std::move(status_code);
        }
    };

    /**
     * @brief A file response, streaming a file from disk in fixed-size chunks.
     *
     * Sets Content-Type (from the extension), Content-Length and ETag; the
     * file is opened again and read chunk by chunk when the transport runs
     * the callback. On errors, answers with an error status and a plain-text
     * message instead.
     */
    struct file_response_t : public response_t {
        /** @brief Size of one chunk read from disk. */
        static constexpr std::size_t k_chunk_size = 8192u;

      public:
        CXXROUTE_INLINE file_response_t() = default;

        /**
         * @brief Construct a file response for a given file path.
         * @param file_path Path to the file on disk.
         * @param status_code The HTTP status code (default is 200 OK).
         * @param headers Additional headers to include.
         *
         * A missing file gives 404, a non-regular one 400, a stat failure 500.
         */
        CXXROUTE_INLINE file_response_t(
            const boost::filesystem::path& file_path,

            e_status&& status_code = e_status::ok,

            headers_t&& headers = {}
        ) {
            boost::system::error_code error_code{};

            if (!boost::filesystem::exists(file_path, error_code)) {
                fail(e_status::not_found, "File not found");

                return;
            }

            if (!boost::filesystem::is_regular_file(file_path, error_code)) {
                fail(e_status::bad_request, "Bad request");

                return;
            }

            const auto file_size = boost::filesystem::file_size(file_path, error_code);

            if (error_code) {
                fail(e_status::internal_server_error, "Internal server error");

                return;
            }

            merge_headers(std::move(headers));

            m_headers.try_emplace("Content-Type", std::string(mime_types_t::get(file_path)));
            m_headers.try_emplace("Content-Length", boost::lexical_cast<std::string>(file_size));

            {
                const auto last_write = boost::filesystem::last_write_time(file_path, error_code);

                m_headers.try_emplace("ETag", fmt::format("\"{}-{}\"", error_code ? 0 : last_write, file_size));
            }

            m_status = std::move(status_code);

            m_stream = true;

            m_callback = [path_copy = file_path, file_size](const chunk_writer_t& writer) -> boost::asio::awaitable<void> {
                std::ifstream file_stream(path_copy.string(), std::ios::binary);

                if (!file_stream)
                    throw base_exception_t(fmt::format("Failed to open file {}", path_copy.string()));

                std::array<char, k_chunk_size> buffer{};

                std::uintmax_t total_sent{};

                while (total_sent < file_size && file_stream) {
                    file_stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));

                    const auto bytes_read = file_stream.gcount();

                    if (bytes_read <= 0)
                        break;

                    const auto chunk = static_cast<std::size_t>(std::min<std::uintmax_t>(static_cast<std::uintmax_t>(bytes_read), file_size - total_sent));

                    co_await writer(std::string_view(buffer.data(), chunk));

                    total_sent += chunk;
                }

                if (total_sent < file_size)
                    throw base_exception_t(fmt::format("File {} shrank while streaming ({} of {} bytes)", path_copy.string(), total_sent, file_size));
            };
        }

      private:
        CXXROUTE_INLINE void fail(const e_status& status, const std::string_view& message) {
            m_status = status;

            m_body = std::string(message);

            m_headers.insert_or_assign("Content-Type", "text/plain; charset=utf-8");
        }
    };

    /**
     * @enum e_response_class
     * @brief The body format of the built-in not-found and internal-error responses.
     */
    enum struct e_response_class : std::uint8_t {
        plain, ///< text/plain, "404 - Not Found"
        json   ///< application/json, {"message": "Not found"}
    };

    /**
     * @brief Build one of the built-in responses in the configured class.
     * @param response_class Body format.
     * @param status Status code.
     * @param plain_body Body used for the plain class.
     * @param json_message "message" field used for the json class.
     * @return The response.
     */
    CXXROUTE_INLINE response_t make_builtin_response(
        const e_response_class& response_class,

        e_status status,

        std::string plain_body,
        const std::string_view& json_message
    ) {
        if (response_class == e_response_class::json)
            return json_response_t(json_t::json_obj_t{{"message", json_message}}, std::move(status));

        return response_t(std::move(plain_body), std::move(status));
    }
}

#endif // CXXROUTE_HTTP_RESPONSE_HXX
