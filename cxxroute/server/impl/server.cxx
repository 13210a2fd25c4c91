#include <cxxroute.hxx>

namespace cxxroute::server {
    c_server::c_server(c_cxxroute& app, const std::string& host, const std::uint16_t port)
        : m_app(app),
          m_acceptor(m_io_ctx) {
        boost::system::error_code error_code{};

        const auto& cfg = m_app.cfg();

        const auto address = boost::asio::ip::make_address(host == "localhost" ? "127.0.0.1" : host, error_code);

        if (error_code)
            throw exceptions::server_exception_t(fmt::format("Invalid listen address '{}': {}", host, error_code.message()));

        const boost::asio::ip::tcp::endpoint endpoint{address, port};

        m_acceptor.open(endpoint.protocol(), error_code);

        if (error_code)
            throw exceptions::server_exception_t(fmt::format("Failed to open acceptor: {}", error_code.message()));

        {
            m_acceptor.set_option(boost::asio::socket_base::reuse_address(true), error_code);

            if (error_code) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Server] Failed to set REUSEADDR option: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL

                error_code = {};
            }
        }

        m_acceptor.bind(endpoint, error_code);

        if (error_code)
            throw exceptions::server_exception_t(fmt::format("Failed to bind {}:{}: {}", host, port, error_code.message()));

        m_acceptor.listen(cfg.m_server.m_max_connections, error_code);

        if (error_code)
            throw exceptions::server_exception_t(fmt::format("Failed to listen: {}", error_code.message()));

#ifdef CXXROUTE_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::debug,

            "[Server] Listening on {}:{} (max connections: {})",

            host, m_acceptor.local_endpoint().port(), cfg.m_server.m_max_connections
        );
#endif // CXXROUTE_USE_LOGGING_IMPL
    }

    void c_server::start(const std::int32_t workers_count) {
        m_running.store(true, std::memory_order_release);

        try {
            const auto workers = workers_count <= 0
                                   ? std::max(1, static_cast<std::int32_t>(std::thread::hardware_concurrency()))
                                   : workers_count;

            if (workers_count <= 0) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::debug, "[Server] Overriding workers count to {} based on hardware concurrency", workers);
#endif // CXXROUTE_USE_LOGGING_IMPL
            }

            boost::asio::co_spawn(m_io_ctx, do_accept(), boost::asio::detached);

            m_thread_pool = std::make_unique<boost::asio::thread_pool>(workers);

            for (std::int32_t i{}; i < workers; i++) {
                boost::asio::post(*m_thread_pool, [this] {
                    try {
                        m_io_ctx.run();
                    }
#ifdef CXXROUTE_USE_LOGGING_IMPL
                    catch (const boost::system::system_error& e) {
                        g_logging->log(
                            e_log_level::error,

                            "[Server] Boost system error in worker thread: code={}, category={}, message={}",

                            e.code().value(), e.code().category().name(), e.what()
                        );
                    }
                    catch (const std::exception& e) {
                        g_logging->log(e_log_level::error, "[Server] Exception in worker thread: {}", e.what());
                    }
#else
                    catch (const boost::system::system_error& e) {
                        std::cerr << fmt::format(
                            "[Server] Boost system error in worker thread: code={}, category={}, message={}",

                            e.code().value(), e.code().category().name(), e.what()
                        ) << "\n";
                    }
                    catch (const std::exception& e) {
                        std::cerr << fmt::format("[Server] Exception in worker thread: {}", e.what()) << "\n";
                    }
#endif // CXXROUTE_USE_LOGGING_IMPL
                });
            }
        }
        catch (const boost::system::system_error& e) {
            throw exceptions::server_exception_t(
                fmt::format(
                    "Boost system error during server start: code={}, category={}, message={}",

                    e.code().value(), e.code().category().name(), e.what()
                )
            );
        }
        catch (const std::exception& e) {
            throw exceptions::server_exception_t(fmt::format("Exception during server start: {}", e.what()));
        }
    }

    void c_server::stop() {
        if (!m_running.exchange(false, std::memory_order_acq_rel))
            return;

        boost::system::error_code error_code{};

        if (m_acceptor.is_open()) {
            m_acceptor.cancel(error_code);

            if (error_code) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[Server] Failed to cancel acceptor: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL

                error_code = {};
            }

            m_acceptor.close(error_code);

            if (error_code) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[Server] Failed to close acceptor: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL
            }
        }

        m_io_ctx.stop();

        if (m_thread_pool) {
            m_thread_pool->stop();
            m_thread_pool->join();

            m_thread_pool.reset();
        }
    }

    boost::asio::awaitable<void> c_server::do_accept() {
        const auto executor = co_await boost::asio::this_coro::executor;

        while (m_running.load(std::memory_order_relaxed)) {
            boost::system::error_code error_code{};

            boost::asio::ip::tcp::socket socket(m_io_ctx);

            co_await m_acceptor.async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

            if (error_code) {
                if (error_code == boost::asio::error::operation_aborted)
                    co_return;

#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Server] Accept failed: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL

                continue;
            }

            {
                const auto& cfg = m_app.cfg();

                if (cfg.m_socket.m_tcp_no_delay)
                    socket.set_option(boost::asio::ip::tcp::no_delay(true), error_code);

                if (!error_code && cfg.m_socket.m_rcv_buf_size)
                    socket.set_option(boost::asio::socket_base::receive_buffer_size(static_cast<int>(cfg.m_socket.m_rcv_buf_size)), error_code);

                if (!error_code && cfg.m_socket.m_snd_buf_size)
                    socket.set_option(boost::asio::socket_base::send_buffer_size(static_cast<int>(cfg.m_socket.m_snd_buf_size)), error_code);

                if (error_code) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                    g_logging->log(e_log_level::error, "[Server] Failed to set socket option: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL

                    boost::system::error_code close_ec{};

                    socket.close(close_ec);

                    continue;
                }
            }

            boost::asio::co_spawn(
                executor,

                [self = shared_from_this(), sock = std::move(socket)]() mutable -> boost::asio::awaitable<void> {
                    co_await client_t(std::move(sock), self->m_app, *self).start();
                },

                boost::asio::detached
            );
        }

        co_return;
    }
}
