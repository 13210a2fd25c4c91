/**
 * @file logging.hxx
 * @brief Asynchronous logging system with buffering and overflow strategies.
 */

#ifndef CXXROUTE_SHARED_LOGGING_HXX
#define CXXROUTE_SHARED_LOGGING_HXX

#define CXXROUTE_HAS_LOGGING_IMPL

namespace shared {
#ifdef CXXROUTE_USE_LOGGING_IMPL
    /**
     * @brief Log severity levels.
     */
    enum struct e_log_level : std::int16_t {
        debug,    ///< Debug-level messages.
        info,     ///< Informational messages.
        warning,  ///< Warning conditions.
        error,    ///< Error conditions.
        critical, ///< Critical conditions.
        none = -1 ///< Logging disabled.
    };

    /**
     * @brief Parse a textual log level as found in configuration files.
     * @param str Level name, case-insensitive ("debug", "info", "warn", "warning", ...).
     * @return Matching level, or none if the name is not recognised.
     */
    CXXROUTE_INLINE e_log_level str_to_lvl(const std::string_view& str) {
        if (boost::iequals(str, "debug"))
            return e_log_level::debug;

        if (boost::iequals(str, "info"))
            return e_log_level::info;

        if (boost::iequals(str, "warning") || boost::iequals(str, "warn"))
            return e_log_level::warning;

        if (boost::iequals(str, "error"))
            return e_log_level::error;

        if (boost::iequals(str, "critical") || boost::iequals(str, "fatal"))
            return e_log_level::critical;

        return e_log_level::none;
    }

    /**
     * @brief Represents a single log message with metadata.
     */
    struct log_message_t {
        /** @brief Severity level of the log message. */
        e_log_level m_level{};

        /** @brief Log message text. */
        std::string m_message{};

        /** @brief Timestamp when the message was created. */
        std::chrono::system_clock::time_point m_timestamp{};
    };

    /**
     * @brief Bounded FIFO of pending log messages, safe for concurrent producers.
     */
    class log_buffer_t {
      public:
        /**
         * @brief Construct a log buffer with a given capacity.
         * @param capacity Maximum number of messages to buffer.
         */
        CXXROUTE_INLINE log_buffer_t(std::size_t capacity = 4096u) : m_capacity(capacity) {}

      public:
        /**
         * @brief Append a message.
         * @param msg Log message to add.
         * @return True if added, false if the buffer is full.
         */
        CXXROUTE_INLINE bool push(log_message_t&& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_queue.size() >= m_capacity)
                return false;

            m_queue.push_back(std::move(msg));

            return true;
        }

        /**
         * @brief Remove the oldest message.
         * @param msg Receives the removed message.
         * @return True if a message was removed, false if the buffer was empty.
         */
        CXXROUTE_INLINE bool pop(log_message_t& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_queue.empty())
                return false;

            msg = std::move(m_queue.front());

            m_queue.pop_front();

            return true;
        }

        /**
         * @brief Number of pending messages.
         */
        CXXROUTE_INLINE std::size_t size() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_queue.size();
        }

        /**
         * @brief Check whether no message is pending.
         */
        CXXROUTE_INLINE bool empty() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_queue.empty();
        }

        /**
         * @brief Take up to batch_size of the oldest messages.
         * @param batch_size Maximum number of messages to retrieve.
         * @return Messages in arrival order.
         */
        CXXROUTE_INLINE std::vector<log_message_t> get_batch(std::size_t batch_size) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            const auto count = std::min(batch_size, m_queue.size());

            std::vector<log_message_t> batch{};

            batch.reserve(count);

            for (std::size_t i{}; i < count; i++) {
                batch.push_back(std::move(m_queue.front()));

                m_queue.pop_front();
            }

            return batch;
        }

      private:
        /** @brief Pending messages, oldest first. */
        std::deque<log_message_t> m_queue{};

        /** @brief Guards m_queue. */
        mutable std::shared_mutex m_mutex;

        /** @brief Maximum number of pending messages. */
        std::size_t m_capacity;
    };

    /**
     * @brief Asynchronous logger with configurable buffering and overflow handling.
     *
     * Messages at error level and above go to stderr, the rest to stdout.
     */
    class c_logging {
      public:
        /**
         * @brief Construct a logger with optional log level and flush behavior.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         */
        CXXROUTE_INLINE c_logging(const e_log_level& log_level = e_log_level::none, bool force_flush = false)
            : m_force_flush(force_flush), m_log_level(log_level), m_running(false) {
        }

        /**
         * @brief Destructor. Stops the worker and flushes remaining messages.
         */
        CXXROUTE_INLINE ~c_logging() { stop_async(); }

      public:
        /**
         * @brief Overflow handling strategies for the log buffer.
         */
        enum struct e_overflow_strategy {
            block,          ///< Block producer threads until space is available.
            discard_oldest, ///< Discard the oldest message to make room.
            discard_newest  ///< Discard the new incoming message.
        };

        /**
         * @brief Initialize the logger with configuration options.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         * @param async Enable asynchronous logging.
         * @param buffer_size Size of the internal log buffer.
         * @param strategy Overflow handling strategy.
         */
        CXXROUTE_INLINE void init(
            const e_log_level& log_level,

            bool force_flush = false,
            bool async = true,

            std::size_t buffer_size = 16384u,

            e_overflow_strategy strategy = e_overflow_strategy::discard_oldest
        ) {
            m_log_level = log_level;
            m_force_flush = force_flush;
            m_buffer_size = buffer_size;
            m_overflow_strategy = strategy;

            if (!async)
                return;

            start_async();
        }

        /**
         * @brief Convert a log level enum to a string representation.
         * @param level Log level to convert.
         * @return String representation of the log level.
         */
        CXXROUTE_INLINE const char* lvl_to_str(const e_log_level& level) const {
            switch (level) {
                case e_log_level::info:
                    return "INFO";
                case e_log_level::debug:
                    return "DEBUG";
                case e_log_level::warning:
                    return "WARNING";
                case e_log_level::error:
                    return "ERROR";
                case e_log_level::critical:
                    return "CRITICAL";
                default:
                    return "UNKNOWN";
            }
        }

        /**
         * @brief Current minimum level.
         */
        CXXROUTE_INLINE e_log_level level() const { return m_log_level; }

        /**
         * @brief Check whether a message of the given level would be emitted.
         */
        CXXROUTE_INLINE bool enabled(const e_log_level& log_level) const {
            return m_log_level != e_log_level::none && log_level >= m_log_level;
        }

        /**
         * @brief Immediately print a formatted log message, bypassing level and buffering.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        CXXROUTE_INLINE void force_log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            print_message(
                log_message_t{
                    log_level,

                    fmt::format(message, std::forward<_args_t>(args)...),

                    std::chrono::system_clock::now()
                }
            );

            std::fflush(stdout);
            std::fflush(stderr);
        }

        /**
         * @brief Log a formatted message, asynchronously if enabled.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        CXXROUTE_INLINE void log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            if (!enabled(log_level))
                return;

            log_message_t log_msg{
                log_level,

                fmt::format(message, std::forward<_args_t>(args)...),

                std::chrono::system_clock::now()
            };

            if (m_running && m_log_buffer) {
                if (!m_log_buffer->push(std::move(log_msg))) {
                    handle_overflow(std::move(log_msg));
                }
                else
                    m_condition.notify_one();

                return;
            }

            print_message(log_msg);

            if (!m_force_flush)
                return;

            std::fflush(stdout);
            std::fflush(stderr);
        }

        /**
         * @brief Start the asynchronous logging thread.
         */
        CXXROUTE_INLINE void start_async() {
            if (m_running)
                return;

            m_log_buffer = std::make_unique<log_buffer_t>(m_buffer_size);

            m_running = true;

            m_worker_thread = std::thread(&c_logging::process_logs, this);
        }

        /**
         * @brief Stop the asynchronous logging thread and flush remaining messages.
         */
        CXXROUTE_INLINE void stop_async() {
            if (!m_running)
                return;

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                m_running = false;
            }

            m_condition.notify_all();

            if (m_worker_thread.joinable())
                m_worker_thread.join();

            if (m_log_buffer) {
                print_batch(m_log_buffer->get_batch(m_buffer_size));

                m_log_buffer.reset();
            }
        }

      private:
        /**
         * @brief Write one message with timestamp and level to its stream.
         * @param msg Message to print.
         */
        CXXROUTE_INLINE void print_message(const log_message_t& msg) const {
            const auto in_time_t = std::chrono::system_clock::to_time_t(msg.m_timestamp);

            fmt::print(
                msg.m_level >= e_log_level::error ? stderr : stdout,

                "[{:%Y-%m-%d %H:%M:%S}] {} - {}\n",

                fmt::styled(
                    std::chrono::system_clock::from_time_t(in_time_t),
                    fmt::emphasis::bold | fg(fmt::rgb(245, 245, 184))
                ),

                fmt::styled(
                    lvl_to_str(msg.m_level),
                    msg.m_level >= e_log_level::error
                        ? fmt::emphasis::bold | fg(fmt::rgb(255, 110, 110))
                        : fmt::text_style(fmt::emphasis::bold)
                ),

                fmt::styled(
                    msg.m_message,
                    fg(fmt::rgb(255, 255, 230))
                )
            );
        }

        /**
         * @brief Print a batch of messages and flush both streams.
         */
        CXXROUTE_INLINE void print_batch(const std::vector<log_message_t>& batch) const {
            for (const auto& msg : batch)
                print_message(msg);

            std::fflush(stdout);
            std::fflush(stderr);
        }

        /**
         * @brief Handle buffer overflow according to the configured strategy.
         * @param msg Log message that could not be added.
         */
        CXXROUTE_INLINE void handle_overflow(log_message_t&& msg) {
            switch (m_overflow_strategy) {
                case e_overflow_strategy::block:
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);

                        m_condition.wait(lock, [this] {
                            return !m_running || (m_log_buffer && m_log_buffer->size() < m_buffer_size);
                        });

                        if (m_running && m_log_buffer) {
                            m_log_buffer->push(std::move(msg));

                            m_condition.notify_one();
                        }

                        break;
                    }

                case e_overflow_strategy::discard_oldest:
                    {
                        if (m_log_buffer) {
                            log_message_t old_msg{};

                            if (m_log_buffer->pop(old_msg)) {
                                m_log_buffer->push(std::move(msg));

                                m_condition.notify_one();
                            }
                        }

                        break;
                    }

                case e_overflow_strategy::discard_newest:
                    break;
            }
        }

        /**
         * @brief Worker thread loop.
         */
        CXXROUTE_INLINE void process_logs() {
            constexpr std::size_t k_batch_size = 256u;

            while (true) {
                {
                    std::unique_lock<std::mutex> lock(m_mutex);

                    m_condition.wait_for(lock, std::chrono::milliseconds(50), [this] {
                        return !m_running || (m_log_buffer && !m_log_buffer->empty());
                    });

                    if (!m_running
                        && (!m_log_buffer
                            || m_log_buffer->empty()))
                        break;
                }

                if (!m_log_buffer)
                    continue;

                auto batch = m_log_buffer->get_batch(k_batch_size);

                if (batch.empty())
                    continue;

                print_batch(batch);

                m_condition.notify_all();
            }
        }

      private:
        /** @brief Whether to flush output immediately after each message. */
        bool m_force_flush{};

        /** @brief Minimum severity level to log. */
        e_log_level m_log_level{e_log_level::none};

        /** @brief Indicates if the asynchronous logger is running. */
        std::atomic<bool> m_running{};

        /** @brief Pending messages when running asynchronously. */
        std::unique_ptr<log_buffer_t> m_log_buffer;

        /** @brief Mutex for synchronizing access to logger state. */
        std::mutex m_mutex;

        /** @brief Condition variable for coordinating producer and consumer threads. */
        std::condition_variable m_condition;

        /** @brief Worker thread for asynchronous logging. */
        std::thread m_worker_thread;

        /** @brief Maximum size of the log buffer. */
        std::size_t m_buffer_size{16384u};

        /** @brief Strategy for handling buffer overflows. */
        e_overflow_strategy m_overflow_strategy{e_overflow_strategy::discard_oldest};
    };
#endif // CXXROUTE_USE_LOGGING_IMPL
}

#endif // CXXROUTE_SHARED_LOGGING_HXX
