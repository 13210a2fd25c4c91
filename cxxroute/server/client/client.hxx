/**
 * @file client.hxx
 * @brief One accepted connection: request parsing, dispatch and response writing.
 */

#ifndef CXXROUTE_SERVER_CLIENT_HXX
#define CXXROUTE_SERVER_CLIENT_HXX

namespace cxxroute {
    class c_cxxroute;

    namespace server {
        class c_server;

        /**
         * @brief Set the framing headers of a buffered response before it is written.
         * @param response Response to finish.
         * @param head Whether it answers a HEAD request.
         *
         * Content-Length always reflects the body; a HEAD response then drops
         * the body and keeps the length.
         */
        CXXROUTE_INLINE void prepare_response(boost::beast::http::response<boost::beast::http::string_body>& response, const bool head) {
            response.prepare_payload();

            if (head)
                response.body().clear();
        }

        /**
         * @brief Represents a client connection to the server.
         *
         * Reads requests one after another on the same socket while the
         * peer asks for keep-alive.
         */
        struct client_t {
            /**
             * @brief Constructs a new client session.
             * @param socket Accepted socket.
             * @param app Application providing the configuration and the router.
             * @param server Server that accepted the socket.
             */
            CXXROUTE_INLINE client_t(boost::asio::ip::tcp::socket&& socket, c_cxxroute& app, c_server& server)
                : m_app(app),
                  m_server(server),
                  m_socket(std::move(socket)) {
            }

          public:
            /**
             * @brief Serve requests until the peer or the server closes the connection.
             */
            boost::asio::awaitable<void> start();

          private:
            /**
             * @brief Dispatch one request and write the response.
             * @param req Parsed request.
             */
            boost::asio::awaitable<void> handle_request(http::request_t&& req);

            /**
             * @brief Write a streamed response: the headers, then the chunks its callback produces.
             * @param response_data Response with a callback.
             * @param version HTTP version of the request.
             * @param keep_alive Whether the connection stays open.
             * @param head Whether it answers a HEAD request, which gets the headers only.
             */
            boost::asio::awaitable<void> write_stream(
                http::response_t& response_data,

                const std::uint32_t version,

                const bool keep_alive,
                const bool head
            );

            /**
             * @brief Write a built-in error response and mark the connection for closing.
             * @param status 400 or 500.
             * @param version HTTP version of the request.
             */
            boost::asio::awaitable<void> write_error(const std::size_t status, const std::uint32_t version);

          private:
            /** @brief Flag indicating if the connection should be closed. */
            bool m_close{false};

            /** @brief Owning application. */
            c_cxxroute& m_app;

            /** @brief Server that accepted the socket. */
            c_server& m_server;

            /** @brief TCP socket for the connection. */
            boost::asio::ip::tcp::socket m_socket;

            /** @brief Read buffer kept across requests. */
            boost::beast::flat_buffer m_buffer;
        };
    }
}

#endif // CXXROUTE_SERVER_CLIENT_HXX
