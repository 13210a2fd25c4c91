#include <cxxroute.hxx>

namespace cxxroute::http {
    std::string http_ctx_t::param(const std::string_view& name) const {
        const auto it = m_params.find(std::string(name));

        return it != m_params.end() ? it->second : std::string{};
    }

    query_t http_ctx_t::query() const { return m_request.query(); }

    std::string http_ctx_t::query_value(const std::string_view& key) const {
        const auto it = m_params.find(std::string(key));

        if (it != m_params.end())
            return it->second;

        const auto& values = form().m_values;

        if (const auto form_it = values.find(std::string(key)); form_it != values.end() && !form_it->second.empty())
            return form_it->second.front();

        const auto query = m_request.query();

        const auto query_it = query.find(std::string(key));

        return query_it != query.end() ? query_it->second : std::string{};
    }

    std::vector<std::string> http_ctx_t::query_values(const std::string_view& key) const {
        std::vector<std::string> ret{};

        const auto& values = form().m_values;

        if (const auto it = values.find(std::string(key)); it != values.end())
            ret.insert(ret.end(), it->second.begin(), it->second.end());

        const auto query = utils::decode_query_values(m_request.uri());

        if (const auto it = query.find(std::string(key)); it != query.end())
            ret.insert(ret.end(), it->second.begin(), it->second.end());

        return ret;
    }

    const form_t& http_ctx_t::form() const {
        if (m_form.has_value())
            return *m_form;

        m_form.emplace();

        const auto method = m_request.method();

        if (method != e_method::post
            && method != e_method::put
            && method != e_method::patch)
            return *m_form;

        const auto content_type = m_request.header("Content-Type");

        if (!content_type)
            return *m_form;

        if (boost::istarts_with(*content_type, "application/x-www-form-urlencoded"))
            m_form->m_values = utils::decode_form(m_request.body());
        else if (const auto boundary = multipart_t::boundary(*content_type); boundary.has_value()) {
            *m_form = multipart_t::parse(m_request.body(), *boundary);

            if (m_form->m_values.empty()
                && m_form->m_files.empty()
                && !m_request.body().empty()) {
#ifdef CXXROUTE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Router] Malformed multipart body on {}", m_request.path());
#endif // CXXROUTE_USE_LOGGING_IMPL
            }
        }

        return *m_form;
    }

    const form_file_t* http_ctx_t::form_file(const std::string_view& key) const {
        const auto& files = form().m_files;

        const auto it = files.find(std::string(key));

        if (it == files.end()
            || it->second.empty())
            return nullptr;

        return &it->second.front();
    }

    void http_ctx_t::handle_form_values(const std::function<void(const std::string&, const std::string&)>& handler) const {
        for (const auto& [key, values] : form().m_values) {
            for (const auto& value : values)
                handler(key, value);
        }

        for (const auto& [key, values] : utils::decode_query_values(m_request.uri())) {
            for (const auto& value : values)
                handler(key, value);
        }
    }

    void http_ctx_t::handle_form_files(const std::function<void(const std::string&, const form_file_t&)>& handler) const {
        for (const auto& [key, files] : form().m_files) {
            for (const auto& file : files)
                handler(key, file);
        }
    }

    void http_ctx_t::handle_form_data(
        const std::function<void(const std::string&, const std::string&)>& value_handler,
        const std::function<void(const std::string&, const form_file_t&)>& file_handler
    ) const {
        handle_form_values(value_handler);

        handle_form_files(file_handler);
    }

    std::string http_ctx_t::real_ip() const {
        if (const auto real_ip = m_request.header("X-Real-IP"); real_ip && !real_ip->empty())
            return std::string(*real_ip);

        if (const auto forwarded = m_request.header("X-Forwarded-For"); forwarded && !forwarded->empty()) {
            const auto last = forwarded->substr(forwarded->rfind(',') + 1u);

            return boost::algorithm::trim_copy(std::string(last));
        }

        return m_request.client().remote_addr();
    }

    void http_ctx_t::write_string(std::string body) {
        m_response = response_t(std::move(body), e_status::ok);
    }

    void http_ctx_t::write_success_json(const json_t::json_obj_t& data, const std::source_location location) {
        write_result(static_cast<std::int32_t>(e_status::ok), data, location);
    }

    void http_ctx_t::write_error_json(
        const e_error_code& code,
        const std::string_view& message,

        const std::source_location location
    ) {
        write_result(
            static_cast<std::int32_t>(code),

            fmt::format("{}: {}", error_code_to_str(code), message),

            location
        );
    }

    void http_ctx_t::write_error_json(
        const std::int32_t code,
        const json_t::json_obj_t& data,

        const std::source_location location
    ) {
        write_result(code, data, location);
    }

    void http_ctx_t::write_success_xml(const xml_tree_t& data, const std::source_location location) {
        write_xml_result(e_status::ok, data, location);
    }

    void http_ctx_t::write_error_xml(
        const e_status& status,
        const std::string_view& message,

        const std::source_location location
    ) {
        xml_tree_t data{};

        data.put_value(std::string(message));

        write_xml_result(status, data, location);
    }

    void http_ctx_t::write_xml_result(
        const e_status& status,
        const xml_tree_t& data,

        const std::source_location& location
    ) {
        xml_tree_t result{};

        result.put("Code", static_cast<std::int32_t>(status));
        result.put("URL", m_request.path());
        result.put("Desc", fmt::format("{}:{}", boost::filesystem::path(location.file_name()).filename().string(), location.line()));
        result.add_child("Data", data);

        xml_tree_t document{};

        document.add_child("ResponseResult", result);

        m_response = xml_response_t(document, e_status(status));
    }

    void http_ctx_t::write_result(
        const std::int32_t code,
        const json_t::json_obj_t& data,

        const std::source_location& location
    ) {
        json_t::json_obj_t payload{};

        payload["code"] = code;
        payload["url"] = m_request.path();
        payload["desc"] = fmt::format("{}:{}", boost::filesystem::path(location.file_name()).filename().string(), location.line());
        payload["data"] = data;

        m_response = json_response_t(payload, e_status::ok);
    }
}
