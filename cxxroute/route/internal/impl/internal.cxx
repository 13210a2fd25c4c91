#include <cxxroute.hxx>

namespace cxxroute::route::internal {
    segment_t parse_segment(const std::string_view& text, const bool fold_case) {
        segment_t segment{};

        if (!text.empty() && text.front() == ':') {
            if (text.size() == 1u)
                throw exceptions::route_exception_t("Parameter segment without name: \":\"");

            segment.m_kind = e_segment_kind::param;
            segment.m_name = std::string(text.substr(1u));
            segment.m_text = std::string(text);

            return segment;
        }

        if (text.size() >= 2u
            && text.front() == '{'
            && text.back() == '}') {
            const auto content = text.substr(1u, text.size() - 2u);

            const auto colon = content.find(':');

            if (colon != std::string_view::npos) {
                if (colon == 0u)
                    throw exceptions::route_exception_t(fmt::format("Regex segment without name: \"{}\"", text));

                segment.m_kind = e_segment_kind::regex;
                segment.m_name = std::string(content.substr(0u, colon));
                segment.m_text = std::string(text);

                auto flags = std::regex::ECMAScript;

                if (fold_case)
                    flags |= std::regex::icase;

                try {
                    segment.m_regex.emplace(std::string(content.substr(colon + 1u)), flags);
                }
                catch (const std::regex_error& e) {
                    throw exceptions::route_exception_t(fmt::format("Invalid regex in segment \"{}\": {}", text, e.what()));
                }

                return segment;
            }
        }

        segment.m_kind = e_segment_kind::static_;
        segment.m_text = fold_case ? boost::algorithm::to_lower_copy(std::string(text)) : std::string(text);

        return segment;
    }

    std::vector<std::string> split_path(const std::string_view& path) {
        const auto first = path.find_first_not_of('/');

        if (first == std::string_view::npos)
            return {std::string{}};

        const auto trimmed = path.substr(first, path.find_last_not_of('/') - first + 1u);

        std::vector<std::string> segments{};

        segments.reserve(static_cast<std::size_t>(std::count(trimmed.begin(), trimmed.end(), '/')) + 1u);

        std::size_t start{};

        while (true) {
            const auto end = trimmed.find('/', start);

            if (end == std::string_view::npos) {
                segments.emplace_back(trimmed.substr(start));

                break;
            }

            segments.emplace_back(trimmed.substr(start, end - start));

            start = end + 1u;
        }

        return segments;
    }

    template <typename _type_t>
    trie_node_t<_type_t>& trie_node_t<_type_t>::insert(
        const http::e_method& method,
        const std::string_view& path,

        _type_t handler,

        const bool fold_case
    ) {
        try {
            if (method == http::e_method::unknown)
                throw exceptions::route_exception_t(fmt::format("Unsupported method for path: {}", path));

            auto node = this;

            for (const auto& part : split_path(path))
                node = &node->child_for(parse_segment(part, fold_case), method);

            if (node->m_handler.has_value())
                throw exceptions::route_exception_t(
                    fmt::format("Route already exists: {} {}", http::method_to_str(method), node->m_full_path)
                );

            node->m_handler.emplace(std::move(handler));

            return *node;
        }
        catch (const exceptions::route_exception_t&) {
            throw;
        }
        catch (const std::exception& e) {
            throw exceptions::route_exception_t(fmt::format("Error while inserting route: {}", e.what()));
        }
    }

    template <typename _type_t>
    trie_node_t<_type_t>& trie_node_t<_type_t>::child_for(segment_t&& segment, const http::e_method& method) {
        auto& bucket = m_children[static_cast<std::size_t>(segment.m_kind)];

        for (auto& child : bucket) {
            if (child->m_method == method
                && child->m_segment.m_text == segment.m_text)
                return *child;
        }

        auto full_path = fmt::format("{}/{}", m_full_path, segment.m_text);

        bucket.emplace_back(std::make_unique<trie_node_t>(std::move(segment), method, std::move(full_path), m_level + 1u));

        return *bucket.back();
    }

    template <typename _type_t>
    match_result_t<_type_t> trie_node_t<_type_t>::match(const http::e_method& method, const std::string_view& path) const {
        match_result_t<_type_t> result{};

        const trie_node_t* node = this;

        for (const auto& part : split_path(path)) {
            node = node->next(method, part, result.m_params);

            if (!node) {
                result.m_status = e_match_status::no_route;

                return result;
            }
        }

        if (!node->m_handler.has_value()) {
            result.m_status = e_match_status::no_handler;

            return result;
        }

        result.m_status = e_match_status::matched;
        result.m_handler = &*node->m_handler;

        return result;
    }

    template <typename _type_t>
    const trie_node_t<_type_t>* trie_node_t<_type_t>::next(
        const http::e_method& method,
        const std::string& part,

        http::params_t& params
    ) const {
        for (const auto& child : children(e_segment_kind::static_)) {
            if (child->m_method == method
                && child->m_segment.m_text == part)
                return child.get();
        }

        for (const auto& child : children(e_segment_kind::regex)) {
            if (child->m_method == method
                && std::regex_match(part, *child->m_segment.m_regex)) {
                params.insert_or_assign(child->m_segment.m_name, part);

                return child.get();
            }
        }

        if (part.empty())
            return nullptr;

        for (const auto& child : children(e_segment_kind::param)) {
            if (child->m_method == method) {
                params.insert_or_assign(child->m_segment.m_name, part);

                return child.get();
            }
        }

        return nullptr;
    }

    template <typename _type_t>
    std::vector<std::string> trie_node_t<_type_t>::routes() const {
        std::vector<std::string> out{};

        collect_routes(out);

        return out;
    }

    template <typename _type_t>
    void trie_node_t<_type_t>::collect_routes(std::vector<std::string>& out) const {
        if (m_handler.has_value())
            out.emplace_back(fmt::format("{} {}", http::method_to_str(m_method), m_full_path));

        for (const auto& bucket : m_children) {
            for (const auto& child : bucket)
                child->collect_routes(out);
        }
    }

    /**
     * @brief Explicit template instantiation for trie_node_t with std::shared_ptr<route_t> as the template parameter.
     */
    template struct trie_node_t<std::shared_ptr<route_t>>;

    /**
     * @brief Explicit template instantiation for trie_node_t with plain callbacks as the template parameter.
     */
    template struct trie_node_t<std::function<void(http::http_ctx_t&)>>;
}
