#include "patchscript/operation.hpp"

#include "patchscript/format.hpp"

#include <glaze/glaze.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

using namespace patchscript::literals;
using namespace std::string_view_literals;

namespace patchscript {

    namespace detail {

        using object_t = json_value::object_t;
        using array_t = json_value::array_t;

        static bool is_null(const json_value& value) {
            return std::holds_alternative<json_value::null_t>(value.data);
        }

        static const json_value* find_member(const object_t& object, std::string_view name) {
            if (auto it = object.find(name); it != object.end()) {
                return &it->second;
            }
            return nullptr;
        }

        static std::optional<std::string> string_member(
                const object_t& object, std::string_view name, size_t position) {
            const auto* member = find_member(object, name);
            if (member == nullptr || is_null(*member)) {
                return std::nullopt;
            }
            const auto* text = std::get_if<std::string>(&member->data);
            if (text == nullptr) {
                throw std::runtime_error("patch operation {}: '{}' must be a string"_format(position, name));
            }
            return *text;
        }

        static patch_operation read_operation(const json_value& entry, size_t position) {
            const auto* object = std::get_if<object_t>(&entry.data);
            if (object == nullptr) {
                throw std::runtime_error("patch operation {} is not an object"_format(position));
            }

            auto op_text = string_member(*object, "op"sv, position);
            if (!op_text) {
                throw std::runtime_error("patch operation {} has no 'op'"_format(position));
            }

            patch_operation operation{};
            if (!try_parse_op_kind(*op_text, operation.op)) {
                throw std::runtime_error(
                        "patch operation {}: unknown op '{}' (expected add|remove|replace|move|copy|test)"_format(
                                position, *op_text));
            }

            auto path = string_member(*object, "path"sv, position);
            if (!path) {
                throw std::runtime_error("patch operation {} ({}) has no 'path'"_format(position, *op_text));
            }
            operation.path = std::move(*path);

            if (needs_from(operation.op)) {
                auto from = string_member(*object, "from"sv, position);
                if (!from) {
                    throw std::runtime_error("patch operation {} ({}) requires 'from'"_format(position, *op_text));
                }
                operation.from = std::move(*from);
            }

            // an explicit null is a value; only a missing member is rejected
            if (needs_value(operation.op)) {
                const auto* value = find_member(*object, "value"sv);
                if (value == nullptr) {
                    throw std::runtime_error("patch operation {} ({}) requires 'value'"_format(position, *op_text));
                }
                operation.value = *value;
            }

            return operation;
        }

    }  // namespace detail

    std::string patch_operation::display_value() const {
        return write_json_value(value);
    }

    patch_operation make_add(std::string path, json_value value) {
        return patch_operation{.op = op_kind::add, .path = std::move(path), .value = std::move(value)};
    }

    patch_operation make_remove(std::string path) {
        return patch_operation{.op = op_kind::remove, .path = std::move(path)};
    }

    patch_operation make_replace(std::string path, json_value value) {
        return patch_operation{.op = op_kind::replace, .path = std::move(path), .value = std::move(value)};
    }

    patch_operation make_move(std::string from, std::string path) {
        return patch_operation{.op = op_kind::move, .path = std::move(path), .from = std::move(from)};
    }

    patch_operation make_copy(std::string from, std::string path) {
        return patch_operation{.op = op_kind::copy, .path = std::move(path), .from = std::move(from)};
    }

    patch_operation make_test(std::string path, json_value value) {
        return patch_operation{.op = op_kind::test, .path = std::move(path), .value = std::move(value)};
    }

    operation_list merge_to_operations(const json_value& document) {
        operation_list operations{};

        const auto* object = std::get_if<detail::object_t>(&document.data);
        if (object == nullptr) {
            return operations;
        }

        for (const auto& [key, value] : *object) {
            if (detail::is_null(value)) {
                operations.push_back(make_remove(key));
            }
            else if (std::holds_alternative<detail::object_t>(value.data)) {
                for (auto& nested : merge_to_operations(value)) {
                    nested.path = "{}.{}"_format(key, nested.path);
                    operations.push_back(std::move(nested));
                }
            }
            else {
                operations.push_back(make_add(key, value));
            }
        }

        return operations;
    }

    operation_list parse_operations(std::string_view json) {
        json_value document{};
        auto ec = glz::read_json(document, json);
        if (ec) {
            throw std::runtime_error("failed to parse patch operations json");
        }

        const auto* entries = std::get_if<detail::array_t>(&document.data);
        if (entries == nullptr) {
            throw std::runtime_error("patch operations must be a json array");
        }

        operation_list operations{};
        operations.reserve(entries->size());
        for (size_t i = 0; i < entries->size(); ++i) {
            operations.push_back(detail::read_operation((*entries)[i], i));
        }
        return operations;
    }

    json_value parse_merge_document(std::string_view json) {
        json_value document{};
        auto ec = glz::read_json(document, json);
        if (ec) {
            throw std::runtime_error("failed to parse merge document json");
        }
        if (!std::holds_alternative<detail::object_t>(document.data)) {
            throw std::runtime_error("merge document must be a json object");
        }
        return document;
    }

    std::string write_json_value(const json_value& value) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json value");
        }
        return json;
    }

}  // namespace patchscript
