/**
 * @file server.hxx
 * @brief HTTP/1.1 listener feeding accepted connections to the router.
 */

#ifndef CXXROUTE_SERVER_HXX
#define CXXROUTE_SERVER_HXX

#include "client/client.hxx"

namespace cxxroute::server {
    /**
     * @brief One listening endpoint with its own io_context and worker pool.
     *
     * Every accepted connection becomes a client_t coroutine that parses
     * requests and hands them to the application's router.
     */
    class c_server : public std::enable_shared_from_this<c_server> {
      public:
        /**
         * @brief Bind and listen.
         * @param app Application providing the configuration and the router.
         * @param host Address to bind to.
         * @param port Port to listen on.
         * @throws exceptions::server_exception_t if the endpoint can't be bound.
         */
        c_server(c_cxxroute& app, const std::string& host, std::uint16_t port);

        CXXROUTE_INLINE ~c_server() { stop(); }

      public:
        /**
         * @brief Spawn the accept loop and the worker threads.
         * @param workers_count Number of threads; 0 or less uses the hardware concurrency.
         */
        void start(std::int32_t workers_count);

        /**
         * @brief Close the acceptor and join the workers.
         */
        void stop();

      public:
        CXXROUTE_INLINE auto& io_ctx() { return m_io_ctx; }

        [[nodiscard]] CXXROUTE_INLINE bool running(const std::memory_order& m) const { return m_running.load(m); }

        /**
         * @brief Endpoint actually bound (port resolved when 0 was requested).
         */
        [[nodiscard]] CXXROUTE_INLINE auto endpoint() const { return m_acceptor.local_endpoint(); }

      private:
        /**
         * @brief Accept connections until the server stops.
         */
        boost::asio::awaitable<void> do_accept();

      private:
        /** @brief Owning application. */
        c_cxxroute& m_app;

        /** @brief IO context for handling asynchronous operations. */
        boost::asio::io_context m_io_ctx;

        /** @brief TCP acceptor for incoming connections. */
        boost::asio::ip::tcp::acceptor m_acceptor;

        /** @brief Atomic flag indicating if server is running. */
        std::atomic_bool m_running{false};

        /** @brief Thread pool running m_io_ctx. */
        std::unique_ptr<boost::asio::thread_pool> m_thread_pool{};
    };
}

#endif // CXXROUTE_SERVER_HXX
