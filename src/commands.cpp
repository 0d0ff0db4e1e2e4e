#include "patchscript/commands.hpp"

#include "patchscript/format.hpp"

#include "internal/painless.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>

using namespace patchscript::literals;
using namespace std::string_view_literals;

namespace patchscript {

    namespace detail {

        namespace painless = internal::painless;

        static std::string explain(std::string_view message) {
            return "{{Debug.explain({});}}"_format(painless::quote(message));
        }

        static std::string render_statement(const key_guard& guard) {
            return "if (!{}.containsKey({})){}"_format(
                    guard.container, painless::quote(guard.key), explain(guard.explanation));
        }

        static std::string render_statement(const element_guard& guard) {
            return "if (!({0} instanceof {1}) || {0}.size() <= {2}){3}"_format(
                    guard.container, painless::list_type, guard.index, explain(guard.explanation));
        }

        static std::string render_statement(const index_guard& guard) {
            return "if (({0} instanceof {1} && {0}.size() <= {2}) || (!({0} instanceof {1}) && !{0}.containsKey({3}))){4}"_format(
                    guard.location,
                    painless::list_type,
                    guard.index,
                    painless::quote(guard.index_token),
                    explain(guard.explanation));
        }

        static std::string render_statement(const remove_statement& statement) {
            if (statement.index) {
                return "def {} = {}.remove({});"_format(statement.variable, statement.container, *statement.index);
            }
            return "def {} = {}.remove({});"_format(statement.variable, statement.container, painless::quote(statement.key));
        }

        static std::string render_statement(const assign_statement& statement) {
            if (!statement.indexed) {
                return "{} = {};"_format(statement.target, statement.value);
            }
            const auto& indexed = *statement.indexed;
            return "if ({0} instanceof {1}){{{0}.{2}({3}, {4});}}else{{{5} = {4};}}"_format(
                    indexed.location,
                    painless::list_type,
                    indexed.insert ? "add" : "set",
                    indexed.index,
                    statement.value,
                    statement.target);
        }

        // actual value is appended at runtime so the explanation shows both sides
        static std::string render_statement(const test_guard& guard) {
            auto message = "Test failed `{}` | {} != "_format(guard.path, guard.display);
            return "if ({0} != {1}){{Debug.explain({2} + {0});}}"_format(
                    guard.target, guard.expected, painless::quote(message));
        }

    }  // namespace detail

    std::string render(const script_statement& statement) {
        return std::visit([](const auto& node) { return detail::render_statement(node); }, statement);
    }

    bool command_set::add(script_statement statement) {
        auto line = render(statement);
        if (!seen_.insert(line).second) {
            return false;
        }
        statements_.push_back(std::move(statement));
        lines_.push_back(std::move(line));
        return true;
    }

    bool command_set::contains(const script_statement& statement) const {
        return seen_.contains(render(statement));
    }

    std::string command_set::source() const {
        return utils::join_with_separator(lines_, ""sv);
    }

}  // namespace patchscript
