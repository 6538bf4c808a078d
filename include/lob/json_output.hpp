#pragma once

#include "lob/prelude.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>

namespace lob {

/**
 * @brief Converts a pipeline value to JSON.
 *
 * Empty optionals become null, pairs become two-element arrays and
 * string-keyed maps become objects. Everything else goes through
 * nlohmann's own conversions.
 */
template <typename T>
nlohmann::json to_json_value(const T &value) {
    if constexpr (detail::Json<T>) {
        return value;
    } else if constexpr (detail::StringLike<T>) {
        return std::string(value);
    } else if constexpr (std::is_arithmetic_v<T>) {
        return value;
    } else if constexpr (detail::is_optional<T>::value) {
        return value ? to_json_value(*value) : nlohmann::json(nullptr);
    } else if constexpr (detail::is_pair<T>::value) {
        return nlohmann::json::array({to_json_value(value.first), to_json_value(value.second)});
    } else if constexpr (detail::MapLike<T> && detail::StringLike<typename T::key_type>) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto &[key, mapped] : value)
            out[std::string(key)] = to_json_value(mapped);
        return out;
    } else if constexpr (detail::MapLike<T>) {
        // Non-text keys: an array of [key, value] pairs.
        nlohmann::json out = nlohmann::json::array();
        for (const auto &[key, mapped] : value)
            out.push_back(nlohmann::json::array({to_json_value(key), to_json_value(mapped)}));
        return out;
    } else if constexpr (detail::Iterable<T>) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto &item : value)
            out.push_back(to_json_value(item));
        return out;
    } else {
        return nlohmann::json(value);
    }
}

/**
 * @brief One compact JSON document per line.
 *
 * Bytes that are not valid UTF-8 are written as U+FFFD.
 */
template <typename T>
void print_jsonl(const T &value) {
    std::println("{}", to_json_value(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

/** @brief The whole value as one indented JSON document. */
template <typename T>
void print_json(const T &value) {
    std::println("{}", to_json_value(value).dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace lob
