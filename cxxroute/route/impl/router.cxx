#include <cxxroute.hxx>

namespace cxxroute::route {
    c_router::c_router(router_cfg_t cfg)
        : m_cfg(std::move(cfg)) {
        set_not_found(nullptr);
        set_assets(nullptr);
    }

    void c_router::insert_route(
        const http::e_method& method,
        const http::path_t& path,

        std::shared_ptr<route_t> route,
        std::shared_ptr<const group_scope_t> scope
    ) {
        require_unfrozen("register a route");

        route->scope() = std::move(scope);

        try {
            const auto& node = m_trie.insert(method, path, std::move(route), m_cfg.m_case_folding);

#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Router] Registered {} {}", http::method_to_str(method), node.full_path());
#else
            static_cast<void>(node);
#endif // CXXROUTE_USE_LOGGING_IMPL
        }
        catch (const exceptions::route_exception_t& e) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::critical, "[Router] Can't register {} {}: {}", http::method_to_str(method), path, e.message());
#else
            std::cerr << fmt::format("[Router] Can't register {} {}: {}\n", http::method_to_str(method), path, e.message());
#endif // CXXROUTE_USE_LOGGING_IMPL

            throw;
        }
    }

    c_group c_router::group(const http::path_t& prefix) {
        require_unfrozen("create a group");

        return c_group(*this, join_path("", prefix), std::make_shared<group_scope_t>());
    }

    void c_router::add_before(before_hook_t hook) {
        require_unfrozen("add a hook");

        m_before.push_back(std::move(hook));
    }

    void c_router::add_after(after_hook_t hook) {
        require_unfrozen("add a hook");

        m_after.push_back(std::move(hook));
    }

    void c_router::set_not_found(not_found_handler_t handler) {
        require_unfrozen("replace the not-found handler");

        if (!handler)
            handler = fallback::not_found_t(m_cfg.m_response_class);

        m_not_found = std::move(handler);
    }

    void c_router::set_recovery(recovery_handler_t handler) {
        require_unfrozen("replace the recovery handler");

        m_recovery = std::move(handler);
    }

    void c_router::set_assets(assets_handler_t handler) {
        require_unfrozen("replace the asset fallback");

        if (!handler)
            handler = fallback::assets_probe_t(m_cfg.m_asset_dir, m_cfg.m_index_file);

        m_assets = std::move(handler);
    }

    void c_router::serve(const http::request_t& request, http::response_t& response) const {
        http::http_ctx_t ctx{request, response};

        try {
            dispatch(ctx);
        }
        catch (...) {
            const auto failure = recovered_failure_t::capture();

#ifdef CXXROUTE_USE_LOGGING_IMPL
            g_logging->log(
                e_log_level::error,

                "[Router] Failure while serving {} {}: {}",

                http::method_to_str(request.method()), request.uri(), failure.message()
            );
#else
            std::cerr << fmt::format(
                "[Router] Failure while serving {} {}: {}\n",

                http::method_to_str(request.method()), request.uri(), failure.message()
            );
#endif // CXXROUTE_USE_LOGGING_IMPL

            if (m_recovery) {
                response = http::response_t{};

                m_recovery(ctx, failure);
            }
            else
                response = fallback::internal_error(m_cfg.m_response_class);
        }
    }

    internal::match_result_t<std::shared_ptr<route_t>> c_router::match(const http::e_method& method, const std::string_view& path) const {
        if (!m_cfg.m_case_folding)
            return m_trie.match(method, path);

        return m_trie.match(method, boost::algorithm::to_lower_copy(std::string(path)));
    }

    void c_router::dispatch(http::http_ctx_t& ctx) const {
        for (const auto& hook : m_before) {
            if (!hook(ctx))
                return;
        }

        auto result = match(ctx.request().method(), ctx.request().path());

        switch (result.m_status) {
            case internal::e_match_status::matched: {
                ctx.params() = std::move(result.m_params);

                const auto& route = *result.m_handler;

                const auto& scope = route->scope();

                if (scope
                    && !scope->run_before(ctx))
                    return;

                route->handle(ctx);

                if (scope)
                    scope->run_after(ctx);

                break;
            }

            case internal::e_match_status::no_route:
                if (m_assets(ctx))
                    m_not_found(ctx);

                break;

            case internal::e_match_status::no_handler:
                m_not_found(ctx);

                break;
        }

        for (const auto& hook : m_after)
            hook(ctx);
    }

    void c_router::require_unfrozen(const std::string_view& what) const {
        if (frozen())
            throw exceptions::route_exception_t(fmt::format("Can't {} after the router was frozen", what));
    }
}
