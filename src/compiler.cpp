#include "patchscript/compiler.hpp"

#include "patchscript/format.hpp"

#include "internal/painless.hpp"

#include <glaze/glaze.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace patchscript::literals;

namespace patchscript {

    namespace detail {

        namespace painless = internal::painless;

        static bool requires_existing_key(op_kind op) {
            return op == op_kind::remove || op == op_kind::replace || op == op_kind::test;
        }

        // binds the operation's literal under the target's param key and returns its reference
        static std::string bind_param(const patch_operation& operation, const path_descriptor& path, param_map& params) {
            params.insert_or_assign(path.param_key(), operation.value);
            return painless::param_ref(path.param_key());
        }

        template <typename T>
        static std::string write_json(const T& value, bool pretty) {
            std::string json{};
            auto ec = pretty ? glz::write<glz::opts{.prettify = true}>(value, json) : glz::write_json(value, json);
            if (ec) {
                throw std::runtime_error("failed to serialize script json");
            }
            return json;
        }

    }  // namespace detail

    void emit_guards(command_set& commands, op_kind op, const path_descriptor& path, bool from_path) {
        for (const auto& level : path.nest_chain()) {
            if (level.index) {
                commands.add(
                        element_guard{
                                .container = level.container_accessor,
                                .index = *level.index,
                                .explanation = "{} does not exist"_format(level.path)});
                continue;
            }
            commands.add(
                    key_guard{
                            .container = level.container_accessor,
                            .key = level.key,
                            .explanation = "{} does not exist"_format(level.path)});
        }

        if (path.has_index() || detail::requires_existing_key(op) || from_path) {
            commands.add(
                    key_guard{
                            .container = path.nest_accessor(),
                            .key = path.key(),
                            .explanation = "{} does not exist in {}"_format(path.key(), path.nest().value_or("document"))});
        }

        if (from_path && path.has_index()) {
            commands.add(
                    index_guard{
                            .location = path.location_accessor(),
                            .index = *path.index(),
                            .index_token = *path.index_token(),
                            .explanation = "{} does not exist"_format(path.path())});
        }
    }

    void emit_remove(command_set& commands, const path_descriptor& path) {
        if (path.has_index()) {
            commands.add(
                    remove_statement{
                            .variable = path.scratch_var(), .container = path.location_accessor(), .index = path.index()});
            return;
        }
        commands.add(
                remove_statement{.variable = path.scratch_var(), .container = path.nest_accessor(), .key = path.key()});
    }

    void emit_add_or_replace(
            command_set& commands,
            const patch_operation& operation,
            const path_descriptor& path,
            const path_descriptor* from_path,
            param_map& params) {
        std::string value{};
        if (from_path != nullptr && operation.op == op_kind::move) {
            value = from_path->scratch_var();
        }
        else if (from_path != nullptr) {
            value = from_path->full_accessor();
        }
        else {
            value = detail::bind_param(operation, path, params);
        }

        assign_statement statement{.target = path.full_accessor(), .value = std::move(value)};
        if (path.has_index()) {
            statement.indexed = indexed_target{
                    .location = path.location_accessor(),
                    .index = *path.index(),
                    .insert = operation.op == op_kind::add || operation.op == op_kind::move};
        }
        commands.add(std::move(statement));
    }

    void emit_test(
            command_set& commands, const patch_operation& operation, const path_descriptor& path, param_map& params) {
        auto expected = detail::bind_param(operation, path, params);
        commands.add(
                test_guard{
                        .target = path.full_accessor(),
                        .expected = std::move(expected),
                        .path = path.path(),
                        .display = operation.display_value()});
    }

    script_artifact compile(const operation_list& operations) {
        command_set commands{};
        param_map params{};
        path_resolver resolver{};

        for (const auto& operation : operations) {
            auto path = resolver.resolve(operation.path);
            std::optional<path_descriptor> from_path{};
            if (operation.from) {
                from_path = resolver.resolve(*operation.from);
            }
            const path_descriptor* from = from_path ? &*from_path : nullptr;

            emit_guards(commands, operation.op, path);
            if (from != nullptr) {
                emit_guards(commands, operation.op, *from, true);
            }

            switch (operation.op) {
                case op_kind::remove:
                    emit_remove(commands, from != nullptr ? *from : path);
                    break;
                case op_kind::move:
                    emit_remove(commands, from != nullptr ? *from : path);
                    emit_add_or_replace(commands, operation, path, from, params);
                    break;
                case op_kind::add:
                case op_kind::replace:
                case op_kind::copy:
                    emit_add_or_replace(commands, operation, path, from, params);
                    break;
                case op_kind::test:
                    emit_test(commands, operation, path, params);
                    break;
            }
        }

        return script_artifact{.source = commands.source(), .params = std::move(params)};
    }

    script_artifact compile_merge(const json_value& document) {
        return compile(merge_to_operations(document));
    }

    std::string to_json(const script_artifact& artifact, bool pretty) {
        return detail::write_json(artifact, pretty);
    }

    std::string to_json(const update_request& request, bool pretty) {
        return detail::write_json(request, pretty);
    }

}  // namespace patchscript
