/**
 * @file mimes.hxx
 * @brief Extension to Content-Type lookup used by the asset fallback.
 */

#ifndef CXXROUTE_HTTP_UTILS_MIMES_HXX
#define CXXROUTE_HTTP_UTILS_MIMES_HXX

namespace cxxroute::http {
    /**
     * @brief MIME type lookup by file extension (case-insensitive).
     */
    struct mime_types_t {
      private:
        /** @brief Type alias for the MIME map. */
        using mime_map_t = boost::unordered_map<std::string_view, std::string_view>;

        /** @brief Known extensions, web assets first. */
        inline static constexpr std::array<std::pair<std::string_view, std::string_view>, 32u> k_mime_entries{
            {{".html", "text/html; charset=utf-8"},
             {".htm", "text/html; charset=utf-8"},
             {".css", "text/css; charset=utf-8"},
             {".js", "text/javascript; charset=utf-8"},
             {".mjs", "text/javascript; charset=utf-8"},
             {".json", "application/json"},
             {".map", "application/json"},
             {".txt", "text/plain; charset=utf-8"},
             {".md", "text/markdown; charset=utf-8"},
             {".csv", "text/csv; charset=utf-8"},
             {".xml", "application/xml"},
             {".wasm", "application/wasm"},
             {".png", "image/png"},
             {".jpg", "image/jpeg"},
             {".jpeg", "image/jpeg"},
             {".gif", "image/gif"},
             {".webp", "image/webp"},
             {".avif", "image/avif"},
             {".svg", "image/svg+xml"},
             {".ico", "image/x-icon"},
             {".woff", "font/woff"},
             {".woff2", "font/woff2"},
             {".ttf", "font/ttf"},
             {".otf", "font/otf"},
             {".mp3", "audio/mpeg"},
             {".ogg", "audio/ogg"},
             {".wav", "audio/wav"},
             {".mp4", "video/mp4"},
             {".webm", "video/webm"},
             {".pdf", "application/pdf"},
             {".zip", "application/zip"},
             {".gz", "application/gzip"}}
        };

        CXXROUTE_INLINE static const mime_map_t& mime_map() {
            static const mime_map_t map = [] {
                mime_map_t ret;

                ret.reserve(k_mime_entries.size());

                for (const auto& [ext, mime] : k_mime_entries)
                    ret.emplace(ext, mime);

                return ret;
            }();

            return map;
        }

      public:
        /** @brief Returned for unknown or missing extensions. */
        static constexpr std::string_view k_default_mime_type = "application/octet-stream";

        /**
         * @brief Get the MIME type for a file path.
         * @param path File path to check.
         * @return MIME type, k_default_mime_type if the extension is unknown.
         */
        CXXROUTE_INLINE static std::string_view get(const boost::filesystem::path& path) {
            const auto ext = boost::algorithm::to_lower_copy(path.extension().string());

            if (ext.empty())
                return k_default_mime_type;

            const auto& map = mime_map();

            const auto it = map.find(ext);

            return it != map.end() ? it->second : k_default_mime_type;
        }
    };
}

#endif // CXXROUTE_HTTP_UTILS_MIMES_HXX
