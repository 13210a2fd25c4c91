/**
 * @file exception.hxx
 * @brief Defines the exception hierarchy used throughout the CXXROUTE framework.
 *
 * Provides a base exception class (`base_exception_t`) derived from `std::runtime_error`,
 * the specialized exception types raised by routing, configuration and the host
 * transport, and the `recovered_failure_t` value handed to recovery handlers.
 */

#ifndef CXXROUTE_EXCEPTION_HXX
#define CXXROUTE_EXCEPTION_HXX

namespace cxxroute {
    /**
     * @brief Base exception type for all errors in CXXROUTE.
     *
     * Inherits from std::runtime_error and provides status code handling,
     * optional message prefixes, and full error formatting.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct a base exception with a plain message.
         * @param str Error message.
         */
        CXXROUTE_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct a base exception with a message, status code, and optional prefix.
         * @param str Error message.
         * @param status Associated status code.
         * @param prefix Optional prefix to include in the formatted message.
         */
        CXXROUTE_INLINE base_exception_t(const std::string& str, const std::size_t& status, const std::string_view& prefix = "")
            : std::runtime_error(str), m_status(status), m_prefix(prefix), m_message(str) {
            if (!m_prefix.empty()) {
                m_what = fmt::format("[{}] {}", m_prefix, m_message);
            }
            else
                m_what = m_message;
        }

      public:
        /**
         * @brief Status code associated with the exception (mutable).
         */
        CXXROUTE_INLINE auto& status() { return m_status; }

        /**
         * @brief Status code associated with the exception (read-only).
         */
        CXXROUTE_INLINE const auto& status() const { return m_status; }

        /**
         * @brief Message prefix (read-only).
         */
        CXXROUTE_INLINE const auto& prefix() const { return m_prefix; }

        /**
         * @brief Raw message without prefix (read-only).
         */
        CXXROUTE_INLINE const auto& message() const { return m_message; }

        /**
         * @brief Get the full formatted error message.
         * @return Pointer to a null-terminated C-string with the exception message.
         */
        CXXROUTE_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Status code associated with the exception. */
        std::size_t m_status{};

        /** @brief Optional prefix used to qualify the error message. */
        std::string m_prefix{};

        /** @brief Raw message content (without prefix). */
        std::string m_message{};

        /** @brief Cached full message string used in what(). */
        std::string m_what{};
    };

    namespace exceptions {
        /**
         * @brief Raised by route registration: duplicates, malformed segments,
         *        invalid regex constraints, registration on a frozen router.
         */
        struct route_exception_t : public base_exception_t {
            /**
             * @brief Construct a new route_exception_t.
             * @param str Error message.
             * @param status Associated status code.
             * @param prefix Prefix prepended to the error message.
             */
            CXXROUTE_INLINE route_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Route"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Raised when a configuration file can't be read, parsed or written.
         */
        struct config_exception_t : public base_exception_t {
            /**
             * @brief Construct a new config_exception_t.
             * @param str Error message.
             * @param status Associated status code.
             * @param prefix Prefix prepended to the error message.
             */
            CXXROUTE_INLINE config_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Config"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception type for server-client errors.
         */
        struct client_exception_t : public base_exception_t {
            /**
             * @brief Construct a new client_exception_t.
             * @param str Error message.
             * @param status HTTP status the transport should answer with.
             * @param prefix Prefix prepended to the error message.
             */
            CXXROUTE_INLINE client_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Server-Client"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception type for server errors.
         */
        struct server_exception_t : public base_exception_t {
            /**
             * @brief Construct a new server_exception_t.
             * @param str Error message.
             * @param status Associated status code.
             * @param prefix Prefix prepended to the error message.
             */
            CXXROUTE_INLINE server_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Server"
            )
                : base_exception_t(str, status, prefix) {
            }
        };
    }

    /**
     * @brief A failure caught by the router's recovery guard.
     *
     * Holds the original exception so a recovery handler can rethrow and
     * inspect it, plus a printable description.
     */
    struct recovered_failure_t {
        /**
         * @brief Capture the exception currently being handled.
         * @return Failure describing std::current_exception().
         */
        static recovered_failure_t capture() {
            recovered_failure_t failure{};

            failure.m_exception = std::current_exception();

            try {
                std::rethrow_exception(failure.m_exception);
            }
            catch (const std::exception& e) {
                failure.m_message = e.what();
                failure.m_standard = true;
            }
            catch (...) {
                failure.m_message = "unknown failure";
            }

            return failure;
        }

      public:
        /**
         * @brief Rethrow the captured exception.
         */
        [[noreturn]] CXXROUTE_INLINE void rethrow() const { std::rethrow_exception(m_exception); }

        /**
         * @brief The captured exception.
         */
        CXXROUTE_INLINE const auto& exception() const { return m_exception; }

        /**
         * @brief what() of a std::exception, "unknown failure" otherwise.
         */
        CXXROUTE_INLINE const auto& message() const { return m_message; }

        /**
         * @brief True if the failure derives from std::exception.
         */
        CXXROUTE_INLINE bool standard() const { return m_standard; }

      private:
        /** @brief The captured exception. */
        std::exception_ptr m_exception{};

        /** @brief Printable description. */
        std::string m_message{};

        /** @brief Whether the exception derives from std::exception. */
        bool m_standard{};
    };
}

#endif // CXXROUTE_EXCEPTION_HXX
