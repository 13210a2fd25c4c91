#include <cxxroute.hxx>

namespace cxxroute::server {
    boost::asio::awaitable<void> client_t::start() {
        while (!m_close && m_server.running(std::memory_order_relaxed)) {
            std::tuple<bool, std::size_t> catch_tuple{};

            std::uint32_t version{11u};

            try {
                boost::system::error_code error_code{};

                const auto& cfg = m_app.cfg();

                boost::beast::http::request_parser<boost::beast::http::string_body> parser{};

                parser.header_limit(static_cast<std::uint32_t>(cfg.m_server.m_max_header_bytes));
                parser.body_limit(cfg.m_server.m_max_request_size);

                co_await boost::beast::http::async_read(
                    m_socket,
                    m_buffer,

                    parser,

                    boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
                );

                if (error_code == boost::beast::http::error::end_of_stream
                    || error_code == boost::asio::error::connection_reset
                    || error_code == boost::asio::error::operation_aborted
                    || error_code == boost::asio::error::eof)
                    break;

                if (error_code.category() == boost::beast::http::make_error_code(boost::beast::http::error::bad_target).category())
                    throw exceptions::client_exception_t(error_code.message(), 400u);

                if (error_code)
                    throw exceptions::client_exception_t(error_code.message(), 500u);

                auto parsed = parser.release();

                version = parsed.version();

                http::request_t req{};

                {
                    req.uri() = std::string(parsed.target());
                    req.method() = http::str_to_method(std::string_view(parsed.method_string().data(), parsed.method_string().size()));

                    for (const auto& field : parsed)
                        req.headers().emplace(std::string(field.name_string()), std::string(field.value()));

                    req.version() = parsed.version();

                    req.body() = std::move(parsed.body());
                }

                {
                    boost::system::error_code endpoint_ec{};

                    const auto remote_endpoint = m_socket.remote_endpoint(endpoint_ec);

                    if (!endpoint_ec)
                        req.client() = http::request_t::client_info_t(remote_endpoint.address().to_string(), remote_endpoint.port());
                }

                co_await handle_request(std::move(req));
            }
#ifdef CXXROUTE_USE_LOGGING_IMPL
            catch (const exceptions::client_exception_t& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.message()
                );

                catch_tuple = std::make_tuple(true, e.status());
            }
            catch (const boost::system::system_error& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server-Client] Exception while handling client (id: {}): code={}, category={}, message={}",

                    m_socket.native_handle(), e.code().value(), e.code().category().name(), e.what()
                );

                catch_tuple = std::make_tuple(true, 500u);
            }
            catch (const std::exception& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.what()
                );

                catch_tuple = std::make_tuple(true, 500u);
            }
#else
            catch (const exceptions::client_exception_t& e) {
                std::cerr << fmt::format(
                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.message()
                ) << "\n";

                catch_tuple = std::make_tuple(true, e.status());
            }
            catch (const boost::system::system_error& e) {
                std::cerr << fmt::format(
                    "[Server-Client] Exception while handling client (id: {}): code={}, category={}, message={}",

                    m_socket.native_handle(), e.code().value(), e.code().category().name(), e.what()
                ) << "\n";

                catch_tuple = std::make_tuple(true, 500u);
            }
            catch (const std::exception& e) {
                std::cerr << fmt::format(
                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.what()
                ) << "\n";

                catch_tuple = std::make_tuple(true, 500u);
            }
#endif // CXXROUTE_USE_LOGGING_IMPL

            if (std::get<0u>(catch_tuple)) {
                if (!m_socket.is_open())
                    break;

                co_await write_error(std::get<1u>(catch_tuple), version);
            }
        }

        boost::system::error_code ignored_error_code{};

        m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored_error_code);

        co_return;
    }

    boost::asio::awaitable<void> client_t::handle_request(http::request_t&& req) {
        const auto& cfg = m_app.cfg();

        const auto keep_alive = cfg.m_http.m_keep_alive && req.keep_alive();

        const auto head = req.method() == http::e_method::head;

        const auto version = req.version();

        http::response_t response_data{};

        m_app.router().serve(req, response_data);

        if (response_data.stream()) {
            co_await write_stream(response_data, version, keep_alive, head);

            co_return;
        }

        boost::beast::http::response<boost::beast::http::string_body> response{};

        response.version(version);

        for (auto&& [key, value] : response_data.m_headers) {
            if (boost::iequals(key, "content-length"))
                continue;

            response.insert(key, std::move(value));
        }

        response.result(static_cast<unsigned>(response_data.m_status));

        response.body() = std::move(response_data.m_body);

        if (keep_alive) {
            response.keep_alive(true);

            response.set(boost::beast::http::field::keep_alive, fmt::format("timeout={}", cfg.m_http.m_keep_alive_timeout.count()));
        }
        else {
            response.keep_alive(false);

            m_close = true;
        }

        prepare_response(response, head);

        co_await boost::beast::http::async_write(m_socket, response, boost::asio::use_awaitable);
    }

    boost::asio::awaitable<void> client_t::write_stream(
        http::response_t& response_data,

        const std::uint32_t version,

        const bool keep_alive,
        const bool head
    ) {
        const auto& cfg = m_app.cfg();

        boost::beast::http::response<boost::beast::http::empty_body> response{};

        {
            response.version(version);

            for (const auto& [key, value] : response_data.m_headers)
                response.insert(key, value);

            response.result(static_cast<unsigned>(response_data.m_status));

            if (keep_alive) {
                response.keep_alive(true);

                response.set(boost::beast::http::field::keep_alive, fmt::format("timeout={}", cfg.m_http.m_keep_alive_timeout.count()));
            }
            else {
                response.keep_alive(false);

                m_close = true;
            }
        }

        {
            boost::beast::http::response_serializer<boost::beast::http::empty_body> sr{response};

            co_await boost::beast::http::async_write_header(m_socket, sr, boost::asio::use_awaitable);
        }

        if (head)
            co_return;

        const http::response_t::chunk_writer_t writer = [this](std::string_view chunk) -> boost::asio::awaitable<void> {
            co_await boost::asio::async_write(m_socket, boost::asio::buffer(chunk.data(), chunk.size()), boost::asio::use_awaitable);
        };

        // Headers are on the wire, so a failure here can only end the connection.
        try {
            co_await response_data.m_callback(writer);
        }
        catch (const std::exception& e) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::error, "[Server-Client] Streamed response aborted (id: {}): {}", m_socket.native_handle(), e.what());
#else
            std::cerr << fmt::format("[Server-Client] Streamed response aborted (id: {}): {}", m_socket.native_handle(), e.what()) << "\n";
#endif // CXXROUTE_USE_LOGGING_IMPL

            m_close = true;
        }
    }

    boost::asio::awaitable<void> client_t::write_error(const std::size_t status, const std::uint32_t version) {
        const auto& cfg = m_app.cfg();

        const auto response_data = status == 400u
                                     ? http::make_builtin_response(cfg.m_router.m_response_class, http::e_status::bad_request, "Bad request", "Bad request")
                                     : route::fallback::internal_error(cfg.m_router.m_response_class);

        boost::beast::http::response<boost::beast::http::string_body> response{};

        response.version(version);

        response.result(static_cast<unsigned>(response_data.m_status));

        for (const auto& [key, value] : response_data.m_headers)
            response.set(key, value);

        response.body() = response_data.m_body;

        response.keep_alive(false);

        prepare_response(response, false);

        m_close = true;

        boost::system::error_code error_code{};

        co_await boost::beast::http::async_write(m_socket, response, boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

        if (error_code) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Server-Client] Failed to write error response: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL
        }
    }
}
