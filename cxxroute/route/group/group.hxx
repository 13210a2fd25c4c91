/**
 * @file group.hxx
 * @brief Route groups: a path prefix plus a hook scope, sharing the router's trie.
 */

#ifndef CXXROUTE_ROUTE_GROUP_HXX
#define CXXROUTE_ROUTE_GROUP_HXX

namespace cxxroute::route {
    class c_router;

    /**
     * @brief Hook container of a group.
     *
     * A scope sees its parent's effective hooks as they were when the scope
     * was created (the parent's counts are recorded then), followed by its
     * own hooks. Own hooks stay live: adding one later still affects every
     * route registered through the scope.
     */
    struct group_scope_t {
        /**
         * @brief Construct a root scope (no parent, no hooks).
         */
        CXXROUTE_INLINE group_scope_t() = default;

        /**
         * @brief Construct a child scope, recording the parent's current hook counts.
         * @param parent Parent scope.
         */
        CXXROUTE_INLINE explicit group_scope_t(std::shared_ptr<const group_scope_t> parent)
            : m_parent(std::move(parent)) {
            if (m_parent) {
                m_parent_before_mark = m_parent->before_count();
                m_parent_after_mark = m_parent->after_count();
            }
        }

      public:
        /**
         * @brief Run the effective before-hooks in order.
         * @param ctx HTTP context.
         * @param limit Run at most this many hooks.
         * @return false as soon as a hook aborts, true otherwise.
         */
        bool run_before(http::http_ctx_t& ctx, const std::size_t limit = std::numeric_limits<std::size_t>::max()) const;

        /**
         * @brief Run the effective after-hooks in order.
         * @param ctx HTTP context.
         * @param limit Run at most this many hooks.
         */
        void run_after(http::http_ctx_t& ctx, const std::size_t limit = std::numeric_limits<std::size_t>::max()) const;

        /**
         * @brief Number of effective before-hooks.
         */
        [[nodiscard]] CXXROUTE_INLINE std::size_t before_count() const { return (m_parent ? m_parent_before_mark : 0u) + m_before.size(); }

        /**
         * @brief Number of effective after-hooks.
         */
        [[nodiscard]] CXXROUTE_INLINE std::size_t after_count() const { return (m_parent ? m_parent_after_mark : 0u) + m_after.size(); }

      public:
        CXXROUTE_INLINE auto& before() { return m_before; }

        [[nodiscard]] CXXROUTE_INLINE const auto& before() const { return m_before; }

        CXXROUTE_INLINE auto& after() { return m_after; }

        [[nodiscard]] CXXROUTE_INLINE const auto& after() const { return m_after; }

        [[nodiscard]] CXXROUTE_INLINE const auto& parent() const { return m_parent; }

      private:
        /** @brief Parent scope, null for a root scope. */
        std::shared_ptr<const group_scope_t> m_parent{};

        /** @brief Parent's effective before-hook count at creation. */
        std::size_t m_parent_before_mark{};

        /** @brief Parent's effective after-hook count at creation. */
        std::size_t m_parent_after_mark{};

        /** @brief Own before-hooks. */
        std::vector<before_hook_t> m_before{};

        /** @brief Own after-hooks. */
        std::vector<after_hook_t> m_after{};
    };

    /**
     * @brief A view of a router with a path prefix and its own hook scope.
     *
     * Groups register into the router's trie. A group must not outlive the
     * router it was created from.
     */
    class c_group : public route_registrar_t<c_group> {
      public:
        /**
         * @brief Construct a group view.
         * @param router Router owning the trie.
         * @param prefix Full path prefix of the group.
         * @param scope Hook scope of the group.
         */
        CXXROUTE_INLINE c_group(c_router& router, http::path_t prefix, std::shared_ptr<group_scope_t> scope)
            : m_router(router), m_prefix(std::move(prefix)), m_scope(std::move(scope)) {}

      public:
        /**
         * @brief Register a handler under the group prefix.
         * @tparam _fn_t Type of the handler function.
         * @param method HTTP method to handle.
         * @param path Pattern relative to the group prefix.
         * @param fn Handler function.
         */
        template <handler_c _fn_t>
        CXXROUTE_INLINE void add_route(const http::e_method& method, const http::path_t& path, _fn_t&& fn) {
            insert(method, path, make_route(std::forward<_fn_t>(fn)));
        }

        /**
         * @brief Derive a sub-group.
         * @param prefix Prefix appended to this group's prefix.
         * @return The sub-group; it sees this group's hooks registered so far.
         */
        c_group group(const http::path_t& prefix) const;

        /**
         * @brief Add a before-hook to this group.
         * @param hook Hook to append.
         */
        void add_before(before_hook_t hook);

        /**
         * @brief Add an after-hook to this group.
         * @param hook Hook to append.
         */
        void add_after(after_hook_t hook);

      public:
        [[nodiscard]] CXXROUTE_INLINE const auto& prefix() const { return m_prefix; }

        [[nodiscard]] CXXROUTE_INLINE const auto& scope() const { return m_scope; }

      private:
        /**
         * @brief Hand a wrapped handler to the router with this group's prefix and scope.
         */
        void insert(const http::e_method& method, const http::path_t& path, std::shared_ptr<route_t> route);

      private:
        /** @brief Router owning the trie. */
        c_router& m_router;

        /** @brief Full path prefix. */
        http::path_t m_prefix{};

        /** @brief Hook scope. */
        std::shared_ptr<group_scope_t> m_scope{};
    };

    /**
     * @brief Join a group prefix and a pattern, collapsing the slash at the seam.
     * @param prefix Group prefix ("/api" or "/api/").
     * @param path Pattern ("/users").
     * @return "/api/users".
     */
    CXXROUTE_INLINE http::path_t join_path(const std::string_view& prefix, const std::string_view& path) {
        if (!prefix.empty()
            && prefix.back() == '/'
            && !path.empty()
            && path.front() == '/')
            return fmt::format("{}{}", prefix, path.substr(1u));

        return fmt::format("{}{}", prefix, path);
    }
}

#endif // CXXROUTE_ROUTE_GROUP_HXX
