#pragma once

#include "commands.hpp"
#include "operation.hpp"
#include "path.hpp"

#include <glaze/glaze.hpp>

#include <map>
#include <string>
#include <string_view>

namespace patchscript {

    using namespace std::string_view_literals;

    inline constexpr auto script_lang = "painless"sv;

    using param_map = std::map<std::string, json_value>;

    struct script_artifact {
        std::string source{};
        std::string lang{script_lang};
        param_map params{};
        struct glaze {
            using T = script_artifact;
            static constexpr auto value = glz::object(&T::source, &T::lang, &T::params);
        };
    };

    // Body of a scripted partial update together with its refresh query value
    struct update_request {
        std::string refresh{"false"};
        script_artifact script{};
        struct glaze {
            using T = update_request;
            static constexpr auto value = glz::object(&T::refresh, &T::script);
        };
    };

    /*
     * Existence checks for one side of an operation. Guards the nest chain, then the
     * key itself for indexed paths, remove/replace/test, and source paths. A source
     * path with an index additionally asserts the element exists.
     */
    void emit_guards(command_set& commands, op_kind op, const path_descriptor& path, bool from_path = false);

    void emit_remove(command_set& commands, const path_descriptor& path);

    void emit_add_or_replace(
            command_set& commands,
            const patch_operation& operation,
            const path_descriptor& path,
            const path_descriptor* from_path,
            param_map& params);

    void emit_test(
            command_set& commands, const patch_operation& operation, const path_descriptor& path, param_map& params);

    script_artifact compile(const operation_list& operations);

    script_artifact compile_merge(const json_value& document);

    std::string to_json(const script_artifact& artifact, bool pretty = false);
    std::string to_json(const update_request& request, bool pretty = false);

}  // namespace patchscript
