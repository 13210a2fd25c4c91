/**
 * @file json_traits.hxx
 * @brief JSON serialization/deserialization helpers on top of nlohmann::json.
 */

#ifndef CXXROUTE_SHARED_JSON_TRAITS_HXX
#define CXXROUTE_SHARED_JSON_TRAITS_HXX

namespace shared {
    /**
     * @brief Type traits for JSON serialization and deserialization.
     *
     * Every JSON touch point of the CXXROUTE (result payloads, internal
     * error bodies, configuration files) goes through this type.
     */
    struct json_traits_t final {
        /** @brief The serialized JSON representation. */
        using json_type_t = std::string;

        /** @brief The in-memory JSON document type. */
        using json_obj_t = nlohmann::json;

        /**
         * @brief Serialize a value to a JSON string.
         * @tparam _type_t The type of the value to serialize (default is json_obj_t).
         * @param value The value to serialize.
         * @param indent Indentation width, -1 for the compact form.
         * @return The serialized JSON string.
         */
        template <typename _type_t = json_obj_t>
        CXXROUTE_INLINE static json_type_t serialize(const _type_t& value, const std::int32_t indent = -1) {
            try {
                nlohmann::json j = value;

                return j.dump(indent);
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't serialize value to json: {}", e.what()));
            }
        }

        /**
         * @brief Deserialize a value from a JSON string.
         * @tparam _type_t The type of the value to deserialize to (default is json_obj_t).
         * @param json The JSON string to deserialize from.
         * @return The deserialized value.
         */
        template <typename _type_t = json_obj_t>
        CXXROUTE_INLINE static _type_t deserialize(const json_type_t& json) {
            try {
                nlohmann::json j = nlohmann::json::parse(json);

                return j.get<_type_t>();
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't deserialize json to value: {}", e.what()));
            }
        }

        /**
         * @brief Get a required value from a JSON object.
         * @tparam _type_t The type of the value to retrieve.
         * @param obj The JSON object to access.
         * @param key The key to access in the JSON object.
         * @return The value retrieved from the JSON object.
         */
        template <typename _type_t>
        CXXROUTE_INLINE static _type_t at(const json_obj_t& obj, const std::string_view& key) { return obj.at(key).get<_type_t>(); }

        /**
         * @brief Get an optional value from a JSON object.
         * @tparam _type_t The type of the value to retrieve.
         * @param obj The JSON object to access.
         * @param key The key to access in the JSON object.
         * @param fallback Value returned when the key is absent or null.
         * @return The stored value or the fallback.
         */
        template <typename _type_t>
        CXXROUTE_INLINE static _type_t value(const json_obj_t& obj, const std::string_view& key, _type_t fallback) {
            if (!obj.is_object())
                return fallback;

            const auto it = obj.find(key);

            if (it == obj.end() || it->is_null())
                return fallback;

            return it->template get<_type_t>();
        }
    };
}

#endif // CXXROUTE_SHARED_JSON_TRAITS_HXX
