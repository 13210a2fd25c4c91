/**
 * @file internal.hxx
 * @brief Internal HTTP helpers: case-insensitive ordering for header maps.
 */

#ifndef CXXROUTE_HTTP_UTILS_INTERNAL_HXX
#define CXXROUTE_HTTP_UTILS_INTERNAL_HXX

namespace cxxroute::http::internal {
    /**
     * @brief Case-insensitive "less" for header names.
     */
    struct ci_less_t {
        /** @brief Allows lookups by std::string_view without building a std::string. */
        using is_transparent = void;

        CXXROUTE_INLINE bool operator()(const std::string_view& lhs, const std::string_view& rhs) const {
            return boost::algorithm::ilexicographical_compare(lhs, rhs);
        }
    };
}

#endif // CXXROUTE_HTTP_UTILS_INTERNAL_HXX
