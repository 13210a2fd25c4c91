/**
 * @file router.hxx
 * @brief The router: route trie, global hooks, fallbacks and the dispatch entrypoint.
 */

#ifndef CXXROUTE_ROUTE_ROUTER_HXX
#define CXXROUTE_ROUTE_ROUTER_HXX

namespace cxxroute::route {
    /**
     * @brief Router settings.
     */
    struct router_cfg_t {
        /** @brief Lowercase literals and request paths, match regexes case-insensitively. (default: true) */
        bool m_case_folding{true};

        /** @brief Root directory of the default asset fallback. (default: ".") */
        boost::filesystem::path m_asset_dir{"."};

        /** @brief File served for a directory by the default asset fallback. (default: index.html) */
        std::string m_index_file{"index.html"};

        /** @brief Body format of the built-in not-found and internal-error responses. (default: plain) */
        http::e_response_class m_response_class{http::e_response_class::plain};
    };

    /**
     * @brief Trie-based HTTP router.
     *
     * Routes are registered before traffic starts; freeze() makes any later
     * registration throw. serve() is const and keeps all per-request state in
     * the context, so it may run concurrently once the router is frozen.
     */
    class c_router : public route_registrar_t<c_router> {
      public:
        /** @brief Trie type holding the type-erased routes. */
        using trie_t = internal::trie_node_t<std::shared_ptr<route_t>>;

      public:
        /**
         * @brief Construct a router with the default fallbacks.
         * @param cfg Router settings.
         */
        explicit c_router(router_cfg_t cfg = {});

        c_router(const c_router&) = delete;

        c_router& operator=(const c_router&) = delete;

      public:
        /**
         * @brief Register a handler for method + pattern.
         * @tparam _fn_t Type of the handler function.
         * @param method HTTP method to handle.
         * @param path Route pattern ("/user/:name", "/product/{id:[0-9]+}").
         * @param fn Handler function.
         * @throws exceptions::route_exception_t on a malformed pattern, a duplicate or a frozen router.
         */
        template <handler_c _fn_t>
        CXXROUTE_INLINE void add_route(const http::e_method& method, const http::path_t& path, _fn_t&& fn) {
            insert_route(method, path, make_route(std::forward<_fn_t>(fn)), nullptr);
        }

        /**
         * @brief Register an already wrapped route.
         * @param method HTTP method to handle.
         * @param path Full route pattern.
         * @param route Route to store.
         * @param scope Hook scope run around the route, may be null.
         */
        void insert_route(
            const http::e_method& method,
            const http::path_t& path,

            std::shared_ptr<route_t> route,
            std::shared_ptr<const group_scope_t> scope
        );

        /**
         * @brief Derive a group sharing this router's trie.
         * @param prefix Path prefix of the group.
         * @return The group, with an empty hook scope.
         */
        c_group group(const http::path_t& prefix);

        /**
         * @brief Add a global before-hook, run for every request.
         */
        void add_before(before_hook_t hook);

        /**
         * @brief Add a global after-hook, run for every request that was not aborted.
         */
        void add_after(after_hook_t hook);

        /**
         * @brief Replace the not-found handler (an empty function restores the default).
         */
        void set_not_found(not_found_handler_t handler);

        /**
         * @brief Replace the recovery handler (an empty function restores the fixed 500).
         */
        void set_recovery(recovery_handler_t handler);

        /**
         * @brief Replace the asset fallback (an empty function restores the default probe).
         */
        void set_assets(assets_handler_t handler);

      public:
        /**
         * @brief Dispatch one request.
         * @param request Inbound request.
         * @param response Response sink.
         *
         * Failures of hooks, handlers and fallbacks are recovered here; only a
         * failure of the recovery handler itself escapes.
         */
        void serve(const http::request_t& request, http::response_t& response) const;

        /**
         * @brief Look up a request path without running anything.
         * @param method HTTP method.
         * @param path Decoded request path; case-folded here if the router folds case.
         * @return Match status, route and bound parameters.
         */
        [[nodiscard]] internal::match_result_t<std::shared_ptr<route_t>> match(const http::e_method& method, const std::string_view& path) const;

        /**
         * @brief Registered routes as "METHOD /full/path", in trie order.
         */
        [[nodiscard]] CXXROUTE_INLINE std::vector<std::string> routes() const { return m_trie.routes(); }

        /**
         * @brief Reject any further registration.
         */
        CXXROUTE_INLINE void freeze() { m_frozen.store(true, std::memory_order_release); }

        [[nodiscard]] CXXROUTE_INLINE bool frozen() const { return m_frozen.load(std::memory_order_acquire); }

      public:
        [[nodiscard]] CXXROUTE_INLINE const auto& cfg() const { return m_cfg; }

        [[nodiscard]] CXXROUTE_INLINE const auto& trie() const { return m_trie; }

      private:
        /**
         * @brief Hooks, matching, handler and fallbacks, without the recovery guard.
         */
        void dispatch(http::http_ctx_t& ctx) const;

        /**
         * @brief Throw if the router is frozen.
         * @param what Operation attempted, for the message.
         */
        void require_unfrozen(const std::string_view& what) const;

      private:
        /** @brief Router settings. */
        router_cfg_t m_cfg{};

        /** @brief Route trie. */
        trie_t m_trie{};

        /** @brief Global before-hooks. */
        std::vector<before_hook_t> m_before{};

        /** @brief Global after-hooks. */
        std::vector<after_hook_t> m_after{};

        /** @brief Not-found handler. */
        not_found_handler_t m_not_found{};

        /** @brief Recovery handler, empty for the fixed 500. */
        recovery_handler_t m_recovery{};

        /** @brief Asset fallback. */
        assets_handler_t m_assets{};

        /** @brief Registration is closed. */
        std::atomic_bool m_frozen{};
    };
}

#endif // CXXROUTE_ROUTE_ROUTER_HXX
