/**
 * @file cxxroute.hxx
 * @brief Main public API and configuration structures for the cxxroute.
 */

#ifndef CXXROUTE_HXX
#define CXXROUTE_HXX

#include "shared/shared.hxx"

/**
 * @namespace cxxroute
 * @brief Main namespace for the CXXROUTE.
 */
namespace cxxroute {
#ifdef CXXROUTE_USE_LOGGING_IMPL
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Global logger instance for cxxroute. */
    inline const auto g_logging = std::make_unique<shared::c_logging>();
#endif // CXXROUTE_USE_LOGGING_IMPL
}

#include "exception/exception.hxx"

#include "http/http.hxx"

#include "route/route.hxx"

#include "server/server.hxx"

namespace cxxroute {
    /**
     * @brief Configuration parameters for the cxxroute.
     */
    struct cxxroute_cfg_t {
        /**
         * @brief One listening endpoint.
         */
        struct listener_t {
            /** @brief Hostname or IP address to bind. (default: localhost) */
            std::string m_host{"localhost"};

            /** @brief Port to bind, 0 for an ephemeral one. (default: 8080) */
            std::uint16_t m_port{8080u};
        };

        /** @brief Endpoints served by the same router. (default: localhost:8080) */
        std::vector<listener_t> m_listeners{listener_t{}};

        /**
         * @brief Server-specific configuration parameters.
         */
        struct {
            /** @brief Number of worker threads per listener, 0 for the hardware concurrency. (default: 4) */
            std::int32_t m_workers{4};

            /** @brief Listen backlog. (default: 2048) */
            std::int32_t m_max_connections{2048};

            /** @brief Maximum size of the request header section in bytes. (default: 1 MB) */
            std::size_t m_max_header_bytes{1048576u};

            /** @brief Maximum request body size in bytes. (default: 100 MB) */
            std::size_t m_max_request_size{104857600u};
        } m_server{};

        /**
         * @brief HTTP-specific configuration parameters.
         */
        struct http_t {
            /** @brief Honour keep-alive requests. (default: true) */
            bool m_keep_alive{true};

            /** @brief Keep-alive timeout advertised to clients. (default: 30 seconds) */
            std::chrono::seconds m_keep_alive_timeout{std::chrono::seconds(30)};
        } m_http{};

        /**
         * @brief Socket-specific configuration parameters.
         */
        struct {
            /** @brief Enable or disable TCP_NODELAY option. (default: true) */
            bool m_tcp_no_delay{true};

            /** @brief Receive buffer size, 0 keeps the system default. (default: 512 KB) */
            std::size_t m_rcv_buf_size{524288u};

            /** @brief Send buffer size, 0 keeps the system default. (default: 512 KB) */
            std::size_t m_snd_buf_size{524288u};
        } m_socket{};

        /** @brief Router settings: case folding, assets, built-in response format. */
        route::router_cfg_t m_router{};

#ifdef CXXROUTE_HAS_LOGGING_IMPL
        /**
         * @brief Configuration for the internal CXXROUTE logger.
         */
        struct logger_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Whether to flush output immediately after each message. (default: false) */
            bool m_force_flush{false};

            /** @brief Enable asynchronous logging. (default: true) */
            bool m_async{true};

            /** @brief Size of the internal log buffer. (default: 16384) */
            std::size_t m_buffer_size{16384u};

            /** @brief Strategy for handling buffer overflows. (default: discard_oldest) */
            c_logging::e_overflow_strategy m_strategy{c_logging::e_overflow_strategy::discard_oldest};
        };

        /** @brief Logger configuration for CXXROUTE. */
        logger_t m_logger{};
#endif // CXXROUTE_HAS_LOGGING_IMPL
    };
}

#include "config/config.hxx"

namespace cxxroute {
    /**
     * @brief Application: a router served on every configured listener.
     *
     * Routes are registered on router() before start(); start() freezes the
     * router.
     */
    class c_cxxroute {
      public:
        /**
         * @brief Construct the application.
         * @param cfg Configuration; its router settings apply from construction on.
         */
        CXXROUTE_INLINE explicit c_cxxroute(cxxroute_cfg_t cfg = {})
            : m_cfg(std::move(cfg)), m_router(m_cfg.m_router) {}

        CXXROUTE_INLINE ~c_cxxroute() { stop(); }

        c_cxxroute(const c_cxxroute&) = delete;

        c_cxxroute& operator=(const c_cxxroute&) = delete;

      public:
        /**
         * @brief Initialise logging, freeze the router and start every listener.
         * @throws exceptions::server_exception_t if a listener can't be started.
         */
        void start();

        /**
         * @brief Stop every listener and release wait().
         */
        void stop();

        /**
         * @brief Block until stop() is called or a termination signal arrives.
         */
        void wait();

      public:
        [[nodiscard]] CXXROUTE_INLINE const auto& cfg() const { return m_cfg; }

        CXXROUTE_INLINE auto& router() { return m_router; }

        [[nodiscard]] CXXROUTE_INLINE const auto& router() const { return m_router; }

        [[nodiscard]] CXXROUTE_INLINE const auto& servers() const { return m_servers; }

        [[nodiscard]] CXXROUTE_INLINE bool running() const { return m_running.load(std::memory_order_acquire); }

      private:
        /**
         * @brief Join every listener and drop the signal set, once.
         */
        void release_servers();

      private:
        /** @brief Configuration parameters. */
        cxxroute_cfg_t m_cfg{};

        /** @brief Router served on every listener. */
        route::c_router m_router;

        /** @brief Atomic flag indicating whether the application is running. */
        std::atomic_bool m_running{};

        /** @brief One server per listener. */
        std::vector<std::shared_ptr<server::c_server>> m_servers{};

        /** @brief Signal set for handling termination signals. */
        std::optional<boost::asio::signal_set> m_signals{};

        /** @brief Serialises listener teardown between stop() and wait(). */
        std::mutex m_servers_mutex{};

        /** @brief Mutex guarding the wait condition. */
        std::mutex m_wait_mutex{};

        /** @brief Condition variable released by stop(). */
        std::condition_variable m_wait_cv{};
    };
}

#endif // CXXROUTE_HXX
