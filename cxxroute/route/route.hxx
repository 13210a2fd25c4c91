/**
 * @file route.hxx
 * @brief Core routing types: callbacks, type-erased handlers and the registration shorthands.
 */

#ifndef CXXROUTE_ROUTE_HXX
#define CXXROUTE_ROUTE_HXX

#include "internal/internal.hxx"

namespace cxxroute::route {
    /** @brief Runs before the handler; returning false aborts the request. */
    using before_hook_t = std::function<bool(http::http_ctx_t&)>;

    /** @brief Runs after the handler. */
    using after_hook_t = std::function<void(http::http_ctx_t&)>;

    /** @brief Turns a failure caught during dispatch into a response. */
    using recovery_handler_t = std::function<void(http::http_ctx_t&, const recovered_failure_t&)>;

    /** @brief Answers requests that matched no handler. */
    using not_found_handler_t = std::function<void(http::http_ctx_t&)>;

    /** @brief Tries to serve an unmatched request; returns true to continue routing. */
    using assets_handler_t = std::function<bool(http::http_ctx_t&)>;

    struct group_scope_t;

    /**
     * @brief Base interface for HTTP route handlers.
     */
    struct route_t {
        virtual ~route_t() = default;

        /**
         * @brief Handle an HTTP request.
         * @param ctx HTTP context; the handler writes its result into ctx.response().
         */
        virtual void handle(http::http_ctx_t& ctx) const = 0;

      public:
        /**
         * @brief Hook scope the route was registered through (null for none).
         */
        CXXROUTE_INLINE auto& scope() { return m_scope; }

        [[nodiscard]] CXXROUTE_INLINE const auto& scope() const { return m_scope; }

      private:
        /** @brief Hook scope captured at registration. */
        std::shared_ptr<const group_scope_t> m_scope{};
    };

    /**
     * @brief Concept for handler callables.
     * @tparam _fn_t Type to check.
     */
    template <typename _fn_t>
    concept handler_c = std::invocable<_fn_t&, http::http_ctx_t&>;

    /**
     * @brief Concrete route implementation using a function handler.
     * @tparam _fn_t Type of the handler function.
     */
    template <handler_c _fn_t>
    struct fn_route_t : public route_t {
        /**
         * @brief Construct a new route with handler function.
         * @param fn Handler function to invoke.
         */
        CXXROUTE_INLINE explicit fn_route_t(_fn_t&& fn)
            : m_fn(std::move(fn)) {}

        /**
         * @brief Construct a new route copying the handler function.
         * @param fn Handler function to invoke.
         */
        CXXROUTE_INLINE explicit fn_route_t(const _fn_t& fn)
            : m_fn(fn) {}

      public:
        CXXROUTE_INLINE fn_route_t(const fn_route_t&) = delete;

        CXXROUTE_INLINE fn_route_t& operator=(const fn_route_t&) = delete;

      public:
        /**
         * @brief Invoke the handler; its return value, if any, is discarded.
         */
        CXXROUTE_INLINE void handle(http::http_ctx_t& ctx) const override { std::invoke(m_fn, ctx); }

      private:
        /** @brief Handler function for this route. */
        mutable _fn_t m_fn;
    };

    /**
     * @brief Wrap a callable into a type-erased route.
     * @tparam _fn_t Type of the handler function.
     * @param fn Handler function.
     * @return Shared route owning the handler.
     */
    template <handler_c _fn_t>
    CXXROUTE_INLINE std::shared_ptr<route_t> make_route(_fn_t&& fn) {
        return std::make_shared<fn_route_t<std::decay_t<_fn_t>>>(std::forward<_fn_t>(fn));
    }

    /**
     * @brief Per-method registration shorthands shared by c_router and c_group.
     * @tparam _derived_t Type providing add_route(method, path, fn).
     */
    template <typename _derived_t>
    struct route_registrar_t {
        template <handler_c _fn_t>
        CXXROUTE_INLINE void get(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::get, path, std::forward<_fn_t>(fn));
        }

        template <handler_c _fn_t>
        CXXROUTE_INLINE void post(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::post, path, std::forward<_fn_t>(fn));
        }

        template <handler_c _fn_t>
        CXXROUTE_INLINE void put(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::put, path, std::forward<_fn_t>(fn));
        }

        template <handler_c _fn_t>
        CXXROUTE_INLINE void delete_(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::delete_, path, std::forward<_fn_t>(fn));
        }

        template <handler_c _fn_t>
        CXXROUTE_INLINE void patch(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::patch, path, std::forward<_fn_t>(fn));
        }

        template <handler_c _fn_t>
        CXXROUTE_INLINE void head(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::head, path, std::forward<_fn_t>(fn));
        }

        template <handler_c _fn_t>
        CXXROUTE_INLINE void options(const http::path_t& path, _fn_t&& fn) {
            derived().add_route(http::e_method::options, path, std::forward<_fn_t>(fn));
        }

      private:
        CXXROUTE_INLINE _derived_t& derived() { return static_cast<_derived_t&>(*this); }
    };
}

#include "group/group.hxx"

#include "fallback/fallback.hxx"

#include "router.hxx"

#endif // CXXROUTE_ROUTE_HXX
