#pragma once

#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace patchscript {

    using namespace std::string_view_literals;

    /*
     * patchscript Startup Config Options
     *
     * Input
     * - input_file: JSON file holding the patch; stdin when unset or "-".
     * - input: How the JSON is interpreted ("operations" array or "merge" document).
     *
     * Output
     * - refresh: Optional request refresh value; when set the output is a full update
     *   request body (script + refresh) instead of the bare script artifact.
     * - pretty: Indent JSON output.
     * - quiet/verbose: Coarse output verbosity knobs for app logs.
     *
     * Environment
     * - refresh_env: Raw value of DATABASE_REFRESH, the process-wide default flag
     *   consulted for boolean-like refresh values.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    inline constexpr auto refresh_env_var = "DATABASE_REFRESH"sv;

    enum class input_mode { operations, merge };
    enum class refresh_mode { enabled, disabled, wait_for };

    inline constexpr std::string_view to_string(input_mode mode) {
        switch (mode) {
            case input_mode::operations:
                return "operations"sv;
            case input_mode::merge:
                return "merge"sv;
        }
        return "operations"sv;
    }

    inline constexpr bool try_parse_input_mode(std::string_view text, input_mode& out) {
        if (utils::str_case_eq(text, "operations"sv) || utils::str_case_eq(text, "json-patch"sv)) {
            out = input_mode::operations;
            return true;
        }
        if (utils::str_case_eq(text, "merge"sv) || utils::str_case_eq(text, "merge-patch"sv)) {
            out = input_mode::merge;
            return true;
        }
        return false;
    }

    // wire form expected by the store's `refresh` query parameter
    inline constexpr std::string_view to_string(refresh_mode mode) {
        switch (mode) {
            case refresh_mode::enabled:
                return "true"sv;
            case refresh_mode::disabled:
                return "false"sv;
            case refresh_mode::wait_for:
                return "wait_for"sv;
        }
        return "false"sv;
    }

    inline constexpr bool try_parse_bool_like(std::string_view text, bool& out) {
        for (auto token : {"true"sv, "1"sv, "yes"sv, "y"sv}) {
            if (utils::str_case_eq(text, token)) {
                out = true;
                return true;
            }
        }
        for (auto token : {"false"sv, "0"sv, "no"sv, "n"sv}) {
            if (utils::str_case_eq(text, token)) {
                out = false;
                return true;
            }
        }
        return false;
    }

    inline std::optional<std::string> read_env(std::string_view name) {
        if (const char* value = std::getenv(std::string{name}.c_str())) {
            return std::string{value};
        }
        return std::nullopt;
    }

    struct startup_config {
        std::optional<std::filesystem::path> input_file{};
        input_mode input{input_mode::operations};

        std::optional<std::string> refresh{};
        bool pretty{false};
        bool quiet{false};
        bool verbose{false};

        std::optional<std::string> refresh_env{};

        bool print_config{false};
    };

}  // namespace patchscript
