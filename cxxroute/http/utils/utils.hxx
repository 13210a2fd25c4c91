/**
 * @file utils.hxx
 * @brief Aggregates HTTP utility headers and request-target helpers.
 */

#ifndef CXXROUTE_HTTP_UTILS_HXX
#define CXXROUTE_HTTP_UTILS_HXX

#include "internal/internal.hxx"

#include "mimes/mimes.hxx"

#include "multipart/multipart.hxx"

namespace cxxroute::http::utils {
    /**
     * @brief Computes the 32-bit FNV-1a hash for the given string.
     * @param str Input string to hash.
     * @return 32-bit FNV-1a hash value.
     */
    CXXROUTE_INLINE constexpr std::uint32_t fnv1a_hash(const std::string_view str) {
        std::uint32_t hash = 2166136261u;

        for (const auto c : str) {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= 16777619u;
        }

        return hash;
    }

    /**
     * @brief Extract the percent-decoded path of a request target.
     * @param target Origin-form target ("/a%20b?x=1").
     * @return Decoded path ("/a b"). A target that fails to parse yields
     *         its raw text up to the first '?'.
     */
    CXXROUTE_INLINE std::string decode_path(const std::string_view& target) {
        const auto parsed = boost::urls::parse_origin_form(target);

        if (parsed.has_value())
            return std::string(parsed->path());

        return std::string(target.substr(0u, target.find('?')));
    }

    /**
     * @brief Decode the query string of a request target.
     * @param target Origin-form target.
     * @return Decoded key/value pairs; the first occurrence of a key wins.
     */
    CXXROUTE_INLINE std::map<std::string, std::string> decode_query(const std::string_view& target) {
        std::map<std::string, std::string> ret{};

        const auto parsed = boost::urls::parse_origin_form(target);

        if (!parsed.has_value())
            return ret;

        for (const auto& param : parsed->params()) {
            if (param.key.empty())
                continue;

            ret.emplace(
                param.key,

                param.has_value ? param.value : std::string{}
            );
        }

        return ret;
    }

    /**
     * @brief Decode the query string of a request target keeping every occurrence.
     * @param target Origin-form target.
     * @return Values per key, in the order they appear.
     */
    CXXROUTE_INLINE std::map<std::string, std::vector<std::string>> decode_query_values(const std::string_view& target) {
        std::map<std::string, std::vector<std::string>> ret{};

        const auto parsed = boost::urls::parse_origin_form(target);

        if (!parsed.has_value())
            return ret;

        for (const auto& param : parsed->params()) {
            if (param.key.empty())
                continue;

            ret[param.key].push_back(param.has_value ? param.value : std::string{});
        }

        return ret;
    }

    /**
     * @brief Decode an application/x-www-form-urlencoded body.
     * @param body Request body ("a=1&b=x%20y").
     * @return Values per key, in the order they appear.
     */
    CXXROUTE_INLINE std::map<std::string, std::vector<std::string>> decode_form(const std::string_view& body) {
        return decode_query_values(fmt::format("/?{}", body));
    }
}

#endif // CXXROUTE_HTTP_UTILS_HXX
