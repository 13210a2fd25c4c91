/**
 * @file internal.hxx
 * @brief Internal implementation details for route handling: segments and the route trie.
 */

#ifndef CXXROUTE_ROUTE_INTERNAL_HXX
#define CXXROUTE_ROUTE_INTERNAL_HXX

namespace cxxroute::route::internal {
    /**
     * @brief Kind of a pattern segment, in matching precedence order.
     */
    enum struct e_segment_kind : std::uint8_t {
        static_, ///< Literal text, compared for equality.
        regex,   ///< "{name:pattern}", whole-segment regex match.
        param    ///< ":name", any non-empty segment.
    };

    /** @brief Number of segment kinds (one child bucket per kind). */
    inline constexpr std::size_t k_segment_kinds = 3u;

    /**
     * @brief One parsed segment of a route pattern.
     */
    struct segment_t {
        /** @brief Segment kind. */
        e_segment_kind m_kind{e_segment_kind::static_};

        /** @brief Identity of the segment among its siblings: the literal, or the text as written. */
        std::string m_text{};

        /** @brief Parameter name for regex and param segments. */
        std::string m_name{};

        /** @brief Compiled constraint for regex segments. */
        std::optional<std::regex> m_regex{};
    };

    /**
     * @brief Classify and parse a pattern segment.
     * @param text Segment text, without slashes.
     * @param fold_case Lowercase literals and compile regexes case-insensitively.
     * @return The parsed segment.
     * @throws exceptions::route_exception_t on an empty name or an invalid regex.
     */
    segment_t parse_segment(const std::string_view& text, const bool fold_case);

    /**
     * @brief Split a path into segments: trim '/' on both ends, then split on '/'.
     * @param path Path or pattern.
     * @return Segments; "/" and "" give a single empty segment, inner "//" gives an empty one.
     */
    std::vector<std::string> split_path(const std::string_view& path);

    /**
     * @brief Outcome of a trie lookup.
     */
    enum struct e_match_status : std::uint8_t {
        matched,   ///< A node with a handler was reached.
        no_route,  ///< Some segment had no compatible child.
        no_handler ///< The path was consumed but the final node has no handler.
    };

    /**
     * @brief Result of trie_node_t::match.
     * @tparam _type_t Type of the handler stored in the trie.
     */
    template <typename _type_t>
    struct match_result_t {
        /** @brief Lookup outcome. */
        e_match_status m_status{e_match_status::no_route};

        /** @brief Matched handler, set only when m_status is matched. */
        const _type_t* m_handler{};

        /** @brief Parameters bound along the way. */
        http::params_t m_params{};
    };

    /**
     * @brief Trie node: one pattern segment registered under one method.
     * @tparam _type_t Type of the handler stored in the node.
     *
     * Children are kept in one bucket per segment kind, each in registration
     * order. Matching walks the buckets static, regex, param and takes the
     * first compatible child without backtracking.
     */
    template <typename _type_t>
    struct trie_node_t {
        /**
         * @brief Construct the root node (no segment, no method, no handler).
         */
        CXXROUTE_INLINE trie_node_t() = default;

        /**
         * @brief Construct a child node.
         * @param segment Parsed segment.
         * @param method Method the node belongs to.
         * @param full_path Pattern from the root to this node.
         * @param level Depth, 1 for children of the root.
         */
        CXXROUTE_INLINE trie_node_t(
            segment_t segment,
            const http::e_method& method,

            std::string full_path,
            const std::size_t level
        )
            : m_segment(std::move(segment)), m_method(method), m_full_path(std::move(full_path)), m_level(level) {
        }

      public:
        CXXROUTE_INLINE trie_node_t(const trie_node_t&) = delete;

        CXXROUTE_INLINE trie_node_t& operator=(const trie_node_t&) = delete;

      public:
        /**
         * @brief Insert a handler for method + pattern.
         * @param method HTTP method to handle.
         * @param path Route pattern.
         * @param handler Handler to store on the terminal node.
         * @param fold_case Whether literals are case-folded.
         * @return The terminal node holding the handler.
         * @throws exceptions::route_exception_t on a malformed pattern or a duplicate route.
         */
        trie_node_t& insert(
            const http::e_method& method,
            const std::string_view& path,

            _type_t handler,

            const bool fold_case = true
        );

        /**
         * @brief Walk the trie for a request path.
         * @param method HTTP method of the request.
         * @param path Decoded request path, already case-folded if the router folds case.
         * @return Match status, handler and bound parameters.
         */
        [[nodiscard]] match_result_t<_type_t> match(const http::e_method& method, const std::string_view& path) const;

        /**
         * @brief List registered routes as "METHOD /full/path", in trie order.
         */
        [[nodiscard]] std::vector<std::string> routes() const;

      public:
        [[nodiscard]] CXXROUTE_INLINE const auto& segment() const { return m_segment; }

        [[nodiscard]] CXXROUTE_INLINE const auto& method() const { return m_method; }

        [[nodiscard]] CXXROUTE_INLINE const auto& handler() const { return m_handler; }

        [[nodiscard]] CXXROUTE_INLINE const auto& full_path() const { return m_full_path; }

        [[nodiscard]] CXXROUTE_INLINE const auto& level() const { return m_level; }

        /**
         * @brief Children of one kind, in registration order.
         */
        [[nodiscard]] CXXROUTE_INLINE const auto& children(const e_segment_kind& kind) const {
            return m_children[static_cast<std::size_t>(kind)];
        }

      private:
        /**
         * @brief Find or append the child for (segment, method).
         */
        trie_node_t& child_for(segment_t&& segment, const http::e_method& method);

        /**
         * @brief First child compatible with a request segment, by precedence.
         * @param params Receives the binding of a regex or param child.
         */
        const trie_node_t* next(const http::e_method& method, const std::string& part, http::params_t& params) const;

        void collect_routes(std::vector<std::string>& out) const;

      private:
        /** @brief Segment this node matches (empty literal for the root). */
        segment_t m_segment{};

        /** @brief Method the node was registered under. */
        http::e_method m_method{http::e_method::unknown};

        /** @brief Handler, present iff the node completes a route. */
        std::optional<_type_t> m_handler{};

        /** @brief Pattern from the root, for diagnostics. */
        std::string m_full_path{};

        /** @brief Depth in the trie. */
        std::size_t m_level{};

        /** @brief Child buckets indexed by e_segment_kind. */
        std::array<std::vector<std::unique_ptr<trie_node_t>>, k_segment_kinds> m_children{};
    };
}

#endif // CXXROUTE_ROUTE_INTERNAL_HXX
