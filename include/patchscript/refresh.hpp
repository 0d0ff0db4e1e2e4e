#pragma once

#include "config.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace patchscript {

    using warning_sink = std::function<void(std::string_view)>;

    // writes "warning: <message>" to stderr
    void stderr_warning_sink(std::string_view message);

    using refresh_value = std::variant<bool, std::string>;

    /*
     * Maps a request-supplied refresh value onto "true", "false" or "wait_for".
     *
     * Boolean-like values (a bool, or true/false/1/0/yes/no/y/n in any case) go through
     * the process-wide default flag: a boolean-like `env_default` (DATABASE_REFRESH)
     * wins over the request value, anything else in `env_default` is reported and
     * ignored. "wait_for" passes through in any case. Any other string is reported and
     * degrades to "false".
     */
    class refresh_normalizer {
      public:
        explicit refresh_normalizer(
                std::optional<std::string> env_default = std::nullopt, warning_sink warn = stderr_warning_sink);

        refresh_mode normalize(const refresh_value& value) const;

        std::string_view validate(const refresh_value& value) const { return to_string(normalize(value)); }

      private:
        bool resolve_flag(bool requested) const;

        std::optional<std::string> env_default_{};
        warning_sink warn_{};
    };

}  // namespace patchscript
