#pragma once

#include "patchscript/utils.hpp"

#include <string>
#include <string_view>

namespace patchscript::internal::painless {

    using namespace std::string_view_literals;

    inline constexpr auto document_root = "ctx._source"sv;
    inline constexpr auto params_root = "params"sv;
    inline constexpr auto list_type = "ArrayList"sv;

    constexpr bool is_identifier(std::string_view text) {
        if (text.empty() || utils::is_ascii_digit(text.front())) {
            return false;
        }
        for (char c : text) {
            if (!utils::is_ascii_alpha(c) && !utils::is_ascii_digit(c) && c != '_') {
                return false;
            }
        }
        return true;
    }

    // body of a single-quoted string literal
    inline std::string escape(std::string_view text) {
        std::string escaped{};
        escaped.reserve(text.size());
        for (char c : text) {
            if (c == '\\' || c == '\'') {
                escaped.push_back('\\');
            }
            escaped.push_back(c);
        }
        return escaped;
    }

    inline std::string quote(std::string_view text) {
        std::string quoted{"'"};
        quoted += escape(text);
        quoted.push_back('\'');
        return quoted;
    }

    // ".name" for identifiers, "['some key']" otherwise
    inline std::string member(std::string_view segment) {
        if (is_identifier(segment)) {
            std::string out{"."};
            out += segment;
            return out;
        }
        std::string out{"["};
        out += quote(segment);
        out.push_back(']');
        return out;
    }

    // identifier-safe rendering of a path for params keys and locals
    inline std::string token(std::string_view path) {
        std::string out{};
        out.reserve(path.size() + 1U);
        if (path.empty() || utils::is_ascii_digit(path.front())) {
            out.push_back('_');
        }
        for (char c : path) {
            out.push_back(utils::is_ascii_alpha(c) || utils::is_ascii_digit(c) ? c : '_');
        }
        return out;
    }

    inline std::string param_ref(std::string_view key) {
        std::string out{params_root};
        out += member(key);
        return out;
    }

}  // namespace patchscript::internal::painless
