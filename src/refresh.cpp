#include "patchscript/refresh.hpp"

#include "patchscript/format.hpp"

#include <iostream>
#include <utility>
#include <variant>

using namespace patchscript::literals;

namespace patchscript {

    void stderr_warning_sink(std::string_view message) {
        std::cerr << "warning: " << message << '\n';
    }

    refresh_normalizer::refresh_normalizer(std::optional<std::string> env_default, warning_sink warn)
            : env_default_{std::move(env_default)}, warn_{std::move(warn)} {}

    bool refresh_normalizer::resolve_flag(bool requested) const {
        if (!env_default_) {
            return requested;
        }
        bool flag = requested;
        if (try_parse_bool_like(utils::trim_view(*env_default_), flag)) {
            return flag;
        }
        if (warn_) {
            warn_("Invalid value for {}: '{}'. Expected a boolean-like value. Using '{}'."_format(
                    refresh_env_var, *env_default_, requested ? "true" : "false"));
        }
        return requested;
    }

    refresh_mode refresh_normalizer::normalize(const refresh_value& value) const {
        if (const auto* flag = std::get_if<bool>(&value)) {
            return resolve_flag(*flag) ? refresh_mode::enabled : refresh_mode::disabled;
        }

        const auto& text = std::get<std::string>(value);
        bool requested = false;
        if (try_parse_bool_like(text, requested)) {
            return resolve_flag(requested) ? refresh_mode::enabled : refresh_mode::disabled;
        }

        if (utils::str_case_eq(text, "wait_for"sv)) {
            return refresh_mode::wait_for;
        }

        if (warn_) {
            warn_("Invalid value for `refresh`: '{}'. Expected 'true', 'false', or 'wait_for'. Defaulting to 'false'."_format(
                    utils::to_lower(text)));
        }
        return refresh_mode::disabled;
    }

}  // namespace patchscript
