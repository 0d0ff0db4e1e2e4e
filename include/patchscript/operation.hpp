#pragma once

#include "utils.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchscript {

    using namespace std::string_view_literals;

    // JSON value carried by add/replace/test and bound into script params. Integers
    // are kept as int64 so large ids survive the trip into `params` unrounded.
    using json_value = glz::generic_i64;

    enum class op_kind : uint8_t { add, remove, replace, move, copy, test };

    inline constexpr std::string_view to_string(op_kind kind) {
        switch (kind) {
            case op_kind::add:
                return "add"sv;
            case op_kind::remove:
                return "remove"sv;
            case op_kind::replace:
                return "replace"sv;
            case op_kind::move:
                return "move"sv;
            case op_kind::copy:
                return "copy"sv;
            case op_kind::test:
                return "test"sv;
        }
        return "add"sv;
    }

    inline constexpr bool try_parse_op_kind(std::string_view text, op_kind& out) {
        for (auto kind : {op_kind::add, op_kind::remove, op_kind::replace, op_kind::move, op_kind::copy, op_kind::test}) {
            if (text == to_string(kind)) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    inline constexpr bool needs_from(op_kind kind) {
        return kind == op_kind::move || kind == op_kind::copy;
    }

    inline constexpr bool needs_value(op_kind kind) {
        return kind == op_kind::add || kind == op_kind::replace || kind == op_kind::test;
    }

    struct patch_operation {
        op_kind op{op_kind::add};
        std::string path{};
        std::optional<std::string> from{};
        json_value value{};

        // compact JSON text of `value`, used in test failure explanations
        std::string display_value() const;
    };

    using operation_list = std::vector<patch_operation>;

    patch_operation make_add(std::string path, json_value value);
    patch_operation make_remove(std::string path);
    patch_operation make_replace(std::string path, json_value value);
    patch_operation make_move(std::string from, std::string path);
    patch_operation make_copy(std::string from, std::string path);
    patch_operation make_test(std::string path, json_value value);

    /*
     * Flattens a merge document into patch operations. For every key, depth first:
     * null removes the dotted path, a nested object recurses with "key." prefixed to
     * each produced path, anything else is added verbatim. Non-object input yields
     * no operations.
     */
    operation_list merge_to_operations(const json_value& document);

    // Throws std::runtime_error naming the offending operation on invalid input
    operation_list parse_operations(std::string_view json);

    json_value parse_merge_document(std::string_view json);

    std::string write_json_value(const json_value& value);

}  // namespace patchscript
