/**
 * @file multipart.hxx
 * @brief multipart/form-data parser for request bodies held in memory.
 */

#ifndef CXXROUTE_HTTP_UTILS_MULTIPART_HXX
#define CXXROUTE_HTTP_UTILS_MULTIPART_HXX

namespace cxxroute::http {
    /**
     * @brief An uploaded file part.
     */
    struct form_file_t {
        CXXROUTE_INLINE form_file_t() = default;

        /**
         * @brief Construct an uploaded file.
         * @param filename Client-side file name from Content-Disposition.
         * @param content_type Content-Type of the part, empty if none was sent.
         * @param data File content.
         */
        CXXROUTE_INLINE form_file_t(std::string&& filename, std::string&& content_type, std::string&& data)
            : m_filename(std::move(filename)), m_content_type(std::move(content_type)), m_data(std::move(data)) {
        }

      public:
        [[nodiscard]] CXXROUTE_INLINE const auto& filename() const { return m_filename; }

        [[nodiscard]] CXXROUTE_INLINE const auto& content_type() const { return m_content_type; }

        [[nodiscard]] CXXROUTE_INLINE const auto& data() const { return m_data; }

        [[nodiscard]] CXXROUTE_INLINE std::size_t size() const { return m_data.size(); }

      private:
        /** @brief Client-side file name. */
        std::string m_filename{};

        /** @brief Content-Type of the part. */
        std::string m_content_type{};

        /** @brief File content. */
        std::string m_data{};
    };

    /** @brief Form field values, every occurrence kept in order. */
    using form_values_t = std::map<std::string, std::vector<std::string>>;

    /** @brief Uploaded files by field name. */
    using form_files_t = std::map<std::string, std::vector<form_file_t>>;

    /**
     * @brief Fields and files decoded from a request body.
     */
    struct form_t {
        /** @brief Plain fields. */
        form_values_t m_values{};

        /** @brief File parts. */
        form_files_t m_files{};
    };

    /**
     * @brief Parses multipart/form-data bodies.
     *
     * Parts with a filename become files, the others become plain values.
     * A body without its closing boundary yields an empty form.
     */
    struct multipart_t {
        /**
         * @brief Parse a multipart/form-data body.
         * @param body The request body.
         * @param boundary The boundary from the Content-Type header.
         * @return Decoded fields and files.
         */
        CXXROUTE_INLINE static form_t parse(const std::string_view body, const std::string_view boundary) {
            form_t ret{};

            if (boundary.empty())
                return ret;

            const std::string dash_boundary = "--" + std::string(boundary);

            const std::string delimiter = "\r\n" + dash_boundary;

            std::size_t pos = body.find(dash_boundary);

            if (pos == std::string_view::npos)
                return ret;

            pos += dash_boundary.size();

            bool saw_closing_boundary{};

            while (pos <= body.size()) {
                if (body.compare(pos, 2u, "--") == 0) {
                    saw_closing_boundary = true;

                    break;
                }

                if (body.compare(pos, 2u, "\r\n") != 0)
                    break;

                pos += 2u;

                const std::size_t header_end = body.find("\r\n\r\n", pos);

                if (header_end == std::string_view::npos)
                    break;

                const std::string_view headers = body.substr(pos, header_end - pos);

                pos = header_end + 4u;

                const std::size_t part_end = body.find(delimiter, pos);

                if (part_end == std::string_view::npos)
                    break;

                std::string name{}, filename{}, ctype{};

                parse_part_headers(headers, name, filename, ctype);

                if (!name.empty()) {
                    std::string content(body.substr(pos, part_end - pos));

                    if (filename.empty())
                        ret.m_values[name].push_back(std::move(content));
                    else
                        ret.m_files[name].emplace_back(std::move(filename), std::move(ctype), std::move(content));
                }

                pos = part_end + delimiter.size();
            }

            if (!saw_closing_boundary)
                return form_t{};

            return ret;
        }

        /**
         * @brief Extract the boundary parameter of a multipart/form-data Content-Type.
         * @param content_type Content-Type header value.
         * @return The boundary, or nullopt if the type is not multipart/form-data.
         */
        CXXROUTE_INLINE static std::optional<std::string> boundary(const std::string_view content_type) {
            if (!boost::istarts_with(content_type, "multipart/form-data"))
                return std::nullopt;

            for (const auto& param : _split(content_type, ";")) {
                auto trimmed = boost::algorithm::trim_copy(std::string(param));

                if (!boost::istarts_with(trimmed, "boundary="))
                    continue;

                auto value = trimmed.substr(9u);

                if (value.size() >= 2u
                    && value.front() == '"'
                    && value.back() == '"')
                    value = value.substr(1u, value.size() - 2u);

                if (value.empty())
                    return std::nullopt;

                return value;
            }

            return std::nullopt;
        }

      private:
        /**
         * @brief Read the field name, file name and Content-Type of a part.
         * @param headers The header block of the part.
         * @param name Field name.
         * @param filename File name, empty for plain fields.
         * @param ctype Content-Type of the part.
         */
        CXXROUTE_INLINE static void parse_part_headers(
            const std::string_view headers,

            std::string& name,
            std::string& filename,
            std::string& ctype
        ) {
            for (const auto line : _split(headers, "\r\n")) {
                if (boost::istarts_with(line, "content-disposition")) {
                    name = std::string(_extract_between(line, " name=\"", "\""));

                    if (name.empty())
                        name = std::string(_extract_between(line, ";name=\"", "\""));

                    filename = std::string(_extract_between(line, "filename=\"", "\""));
                }
                else if (boost::istarts_with(line, "content-type")) {
                    const auto colon = line.find(':');

                    if (colon != std::string_view::npos)
                        ctype = boost::algorithm::trim_copy(std::string(line.substr(colon + 1u)));
                }
            }
        }

      public:
        /**
         * @brief Split a string into substrings by a delimiter.
         * @param str The string to split.
         * @param delimiter The delimiter to split by.
         * @return A vector of substrings.
         */
        CXXROUTE_INLINE static std::vector<std::string_view> _split(
            const std::string_view& str,

            const std::string_view& delimiter
        ) {
            std::vector<std::string_view> ret{};

            if (str.empty())
                return ret;

            std::size_t start{}, end{};

            while ((end = str.find(delimiter, start)) != std::string_view::npos) {
                ret.push_back(str.substr(start, end - start));

                start = end + delimiter.length();
            }

            ret.push_back(str.substr(start));

            return ret;
        }

        /**
         * @brief Extract a substring between two markers in a string.
         * @param str The string to extract from.
         * @param start The starting marker.
         * @param end The ending marker.
         * @return The extracted substring, empty if a marker is missing.
         */
        CXXROUTE_INLINE static std::string_view _extract_between(
            const std::string_view& str,

            const std::string_view& start,
            const std::string_view& end
        ) {
            auto first = str.find(start);

            if (first == std::string_view::npos)
                return "";

            first += start.size();

            const auto last = str.find(end, first);

            if (last == std::string_view::npos)
                return "";

            return str.substr(first, last - first);
        }
    };
}

#endif // CXXROUTE_HTTP_UTILS_MULTIPART_HXX
