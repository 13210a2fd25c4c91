/**
 * @file http.hxx
 * @brief Core HTTP types, status codes, methods, and conversion helpers for the CXXROUTE.
 */

#ifndef CXXROUTE_HTTP_HXX
#define CXXROUTE_HTTP_HXX

#include "utils/utils.hxx"

namespace cxxroute::http {
    /** @brief Type alias for HTTP URI (request target as received). */
    using uri_t = std::string;

    /** @brief Type alias for HTTP message body. */
    using body_t = std::string;

    /** @brief Type alias for HTTP path. */
    using path_t = std::string;

    /** @brief Type alias for JSON payloads. */
    using json_t = shared::json_traits_t;

    /** @brief Type alias for XML payloads. */
    using xml_tree_t = boost::property_tree::ptree;

    /** @brief Type alias for HTTP headers (case-insensitive keys). */
    using headers_t = std::map<std::string, std::string, internal::ci_less_t>;

    /** @brief Type alias for route parameters bound by the matcher (case-sensitive names). */
    using params_t = std::map<std::string, std::string>;

    /** @brief Type alias for decoded query-string parameters (first occurrence wins). */
    using query_t = std::map<std::string, std::string>;

    /**
     * @brief HTTP status codes.
     */
    enum struct e_status : std::int16_t {
        // 1xx Informational
        continue_status = 100,     ///< Client should continue with the request body.
        switching_protocols = 101, ///< Protocol upgrade accepted.

        // 2xx Success
        ok = 200,         ///< The request succeeded.
        created = 201,    ///< A resource was created.
        accepted = 202,   ///< Accepted for later processing.
        no_content = 204, ///< Success without a body.

        // 3xx Redirection
        moved_permanently = 301,  ///< Resource moved for good.
        found = 302,              ///< Resource temporarily elsewhere.
        see_other = 303,          ///< Follow up with a GET elsewhere.
        not_modified = 304,       ///< Cached copy is still valid.
        temporary_redirect = 307, ///< Repeat the request elsewhere, same method.
        permanent_redirect = 308, ///< Repeat the request elsewhere for good, same method.

        // 4xx Client Error
        bad_request = 400,                     ///< Malformed request.
        unauthorized = 401,                    ///< Authentication needed.
        forbidden = 403,                       ///< Authenticated but not allowed.
        not_found = 404,                       ///< Nothing matched the request.
        method_not_allowed = 405,              ///< Verb not supported for this resource.
        request_timeout = 408,                 ///< Client too slow.
        conflict = 409,                        ///< State conflict.
        payload_too_large = 413,               ///< Body exceeds the configured limit.
        uri_too_long = 414,                    ///< Request target too long.
        unsupported_media_type = 415,          ///< Body format not accepted.
        unprocessable_entity = 422,            ///< Body understood but semantically invalid.
        too_many_requests = 429,               ///< Rate limited.
        request_header_fields_too_large = 431, ///< Header section exceeds the configured limit.

        // 5xx Server Error
        internal_server_error = 500,     ///< Unhandled failure while serving.
        not_implemented = 501,           ///< Functionality not provided.
        bad_gateway = 502,               ///< Upstream answered badly.
        service_unavailable = 503,       ///< Temporarily unable to serve.
        gateway_timeout = 504,           ///< Upstream too slow.
        http_version_not_supported = 505 ///< Protocol version refused.
    };

    /**
     * @brief HTTP request methods.
     */
    enum struct e_method : std::int16_t {
        get,     ///< GET
        head,    ///< HEAD
        post,    ///< POST
        put,     ///< PUT
        delete_, ///< DELETE
        connect, ///< CONNECT
        options, ///< OPTIONS
        trace,   ///< TRACE
        patch,   ///< PATCH
        unknown  ///< Anything else, never routable
    };

    /**
     * @brief Convert HTTP method enum to string.
     * @param method HTTP method enum value.
     * @return Upper-case method token.
     */
    CXXROUTE_INLINE constexpr std::string_view method_to_str(const e_method& method) {
        switch (method) {
            case e_method::get:
                return "GET";
            case e_method::head:
                return "HEAD";
            case e_method::post:
                return "POST";
            case e_method::put:
                return "PUT";
            case e_method::delete_:
                return "DELETE";
            case e_method::connect:
                return "CONNECT";
            case e_method::options:
                return "OPTIONS";
            case e_method::trace:
                return "TRACE";
            case e_method::patch:
                return "PATCH";
            default:
                return "UNKNOWN";
        }
    }

    /**
     * @brief Convert HTTP method string to enum value.
     * @param method_str Method token, matched exactly (methods are case-sensitive).
     * @return Corresponding enum value, e_method::unknown if unrecognized.
     */
    CXXROUTE_INLINE constexpr e_method str_to_method(const std::string_view& method_str) {
        switch (utils::fnv1a_hash(method_str)) {
            case utils::fnv1a_hash("GET"):
                return e_method::get;

            case utils::fnv1a_hash("HEAD"):
                return e_method::head;

            case utils::fnv1a_hash("POST"):
                return e_method::post;

            case utils::fnv1a_hash("PUT"):
                return e_method::put;

            case utils::fnv1a_hash("DELETE"):
                return e_method::delete_;

            case utils::fnv1a_hash("CONNECT"):
                return e_method::connect;

            case utils::fnv1a_hash("OPTIONS"):
                return e_method::options;

            case utils::fnv1a_hash("TRACE"):
                return e_method::trace;

            case utils::fnv1a_hash("PATCH"):
                return e_method::patch;

            default:
                return e_method::unknown;
        }
    }
}

#include "request/request.hxx"

#include "response/response.hxx"

#include "http_ctx/http_ctx.hxx"

#endif // CXXROUTE_HTTP_HXX
