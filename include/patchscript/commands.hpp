#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace patchscript {

    // Aborts the script unless `container` holds `key`
    struct key_guard {
        std::string container{};
        std::string key{};
        std::string explanation{};
    };

    // Aborts unless `container` is a list holding position `index`
    struct element_guard {
        std::string container{};
        std::string index{};
        std::string explanation{};
    };

    // Aborts unless `location` is a list long enough for `index`, or a map holding `index_token`
    struct index_guard {
        std::string location{};
        std::string index{};
        std::string index_token{};
        std::string explanation{};
    };

    // Removes a value from its container and keeps it in `variable`
    struct remove_statement {
        std::string variable{};
        std::string container{};
        std::optional<std::string> index{};
        std::string key{};
    };

    struct indexed_target {
        std::string location{};
        std::string index{};
        bool insert{false};
    };

    /*
     * Stores `value` at `target`. With an indexed target the list at `location` is
     * inserted into (or overwritten at) the index; a non-list container falls back to
     * plain assignment at `target`.
     */
    struct assign_statement {
        std::string target{};
        std::string value{};
        std::optional<indexed_target> indexed{};
    };

    // Aborts unless the value at `target` equals the bound parameter `expected`
    struct test_guard {
        std::string target{};
        std::string expected{};
        std::string path{};
        std::string display{};
    };

    using script_statement = std::variant<key_guard, element_guard, index_guard, remove_statement, assign_statement, test_guard>;

    std::string render(const script_statement& statement);

    /*
     * Ordered statement list with set semantics on the rendered text: adding a
     * statement that is already present is a no-op, so operations sharing a path
     * prefix share its guards. This also applies to mutations without a per-occurrence
     * token: a second identical copy assignment is dropped.
     */
    class command_set {
      public:
        // returns false when an identical statement was already present
        bool add(script_statement statement);

        bool contains(const script_statement& statement) const;

        const std::vector<script_statement>& statements() const { return statements_; }
        const std::vector<std::string>& lines() const { return lines_; }

        size_t size() const { return statements_.size(); }
        bool empty() const { return statements_.empty(); }

        std::string source() const;

      private:
        std::vector<script_statement> statements_{};
        std::vector<std::string> lines_{};
        std::unordered_set<std::string> seen_{};
    };

}  // namespace patchscript
