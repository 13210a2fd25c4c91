#include <cxxroute.hxx>

namespace cxxroute {
    void c_cxxroute::start() {
        if (m_running.load(std::memory_order_acquire))
            return;

#ifdef CXXROUTE_USE_LOGGING_IMPL
        g_logging->init(
            m_cfg.m_logger.m_level,
            m_cfg.m_logger.m_force_flush,
            m_cfg.m_logger.m_async,
            m_cfg.m_logger.m_buffer_size,
            m_cfg.m_logger.m_strategy
        );
#endif // CXXROUTE_USE_LOGGING_IMPL

        if (m_cfg.m_listeners.empty())
            throw exceptions::server_exception_t("No listener configured");

        m_router.freeze();

#ifdef CXXROUTE_USE_LOGGING_IMPL
        for (const auto& route : m_router.routes())
            g_logging->log(e_log_level::debug, "[Core] Route: {}", route);
#endif // CXXROUTE_USE_LOGGING_IMPL

        m_running.store(true, std::memory_order_release);

        try {
            for (const auto& listener : m_cfg.m_listeners) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::info, "[{}:{}] Starting server...", listener.m_host, listener.m_port);
#endif // CXXROUTE_USE_LOGGING_IMPL

                m_servers.push_back(std::make_shared<server::c_server>(*this, listener.m_host, listener.m_port));
            }

            m_signals.emplace(m_servers.front()->io_ctx(), SIGINT, SIGTERM, SIGQUIT);

            m_signals->async_wait([this](const boost::system::error_code& err_code, [[maybe_unused]] std::int32_t signo) {
                if (!err_code)
                    this->stop();
            });

            for (const auto& server : m_servers)
                server->start(m_cfg.m_server.m_workers);
        }
        catch (const base_exception_t& e) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::critical, "[Core] Can't start: {}", e.what());
#endif // CXXROUTE_USE_LOGGING_IMPL

            stop();

            throw;
        }
        catch (const boost::system::system_error& e) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::critical, "[Core] Can't start: {}", e.what());
#endif // CXXROUTE_USE_LOGGING_IMPL

            stop();

            throw exceptions::server_exception_t(fmt::format("Can't install signal handling: {}", e.what()));
        }
    }

    void c_cxxroute::stop() {
        if (!m_running.exchange(false, std::memory_order_acq_rel))
            return;

        if (m_signals.has_value()) {
            boost::system::error_code error_code{};

            m_signals->cancel(error_code);

            if (error_code) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[Core] Failed to cancel signals: {}", error_code.message());
#endif // CXXROUTE_USE_LOGGING_IMPL
            }
        }

        // A worker thread can't join its own pool, so from a signal handler only the contexts are stopped and wait() joins.
        const auto on_worker = std::any_of(m_servers.begin(), m_servers.end(), [](const auto& server) {
            return server->io_ctx().get_executor().running_in_this_thread();
        });

        if (on_worker) {
            for (const auto& server : m_servers)
                server->io_ctx().stop();

#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::info, "[Core] Shutdown requested by signal");
#endif // CXXROUTE_USE_LOGGING_IMPL
        }
        else {
            release_servers();

#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::info, "[Core] Servers stopped...");
#endif // CXXROUTE_USE_LOGGING_IMPL
        }

        {
            std::lock_guard lock(m_wait_mutex);
        }

        m_wait_cv.notify_all();
    }

    void c_cxxroute::wait() {
#ifdef CXXROUTE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Core] Wait state initiated, thread blocked pending shutdown signal");
#endif // CXXROUTE_USE_LOGGING_IMPL

        {
            std::unique_lock lock(m_wait_mutex);

            m_wait_cv.wait(lock, [this] {
                return !m_running.load(std::memory_order_acquire);
            });
        }

        release_servers();

#ifdef CXXROUTE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Core] Wait state terminated, shutdown procedure complete");
#endif // CXXROUTE_USE_LOGGING_IMPL
    }

    void c_cxxroute::release_servers() {
        std::lock_guard lock(m_servers_mutex);

        for (const auto& server : m_servers)
            server->stop();

        m_signals.reset();

        m_servers.clear();
    }
}
