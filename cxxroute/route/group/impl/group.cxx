#include <cxxroute.hxx>

namespace cxxroute::route {
    bool group_scope_t::run_before(http::http_ctx_t& ctx, const std::size_t limit) const {
        const auto inherited = m_parent ? m_parent_before_mark : 0u;

        if (m_parent
            && !m_parent->run_before(ctx, std::min(limit, inherited)))
            return false;

        const auto own = std::min(limit > inherited ? limit - inherited : 0u, m_before.size());

        for (std::size_t i{}; i < own; ++i) {
            if (!m_before[i](ctx))
                return false;
        }

        return true;
    }

    void group_scope_t::run_after(http::http_ctx_t& ctx, const std::size_t limit) const {
        const auto inherited = m_parent ? m_parent_after_mark : 0u;

        if (m_parent)
            m_parent->run_after(ctx, std::min(limit, inherited));

        const auto own = std::min(limit > inherited ? limit - inherited : 0u, m_after.size());

        for (std::size_t i{}; i < own; ++i)
            m_after[i](ctx);
    }

    c_group c_group::group(const http::path_t& prefix) const {
        if (m_router.frozen())
            throw exceptions::route_exception_t("Can't create a group after the router was frozen");

        return c_group(
            m_router,

            join_path(m_prefix, prefix),

            std::make_shared<group_scope_t>(m_scope)
        );
    }

    void c_group::add_before(before_hook_t hook) {
        if (m_router.frozen())
            throw exceptions::route_exception_t("Can't add a hook after the router was frozen");

        m_scope->before().push_back(std::move(hook));
    }

    void c_group::add_after(after_hook_t hook) {
        if (m_router.frozen())
            throw exceptions::route_exception_t("Can't add a hook after the router was frozen");

        m_scope->after().push_back(std::move(hook));
    }

    void c_group::insert(const http::e_method& method, const http::path_t& path, std::shared_ptr<route_t> route) {
        m_router.insert_route(method, join_path(m_prefix, path), std::move(route), m_scope);
    }
}
