#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchscript {

    // One ancestor container of a path's `key`, outermost first. A level whose
    // segment is a list position ("links.0.href") carries `index` instead of a map key.
    struct nest_level {
        std::string path{};
        std::string container_accessor{};
        std::string key{};
        std::optional<std::string> index{};
    };

    /*
     * Resolved form of one patch path. For "a.b.c" the container of `key` ("c") is the
     * nest "a.b". For an indexed path such as "a.b.3" the key names the array ("b")
     * inside nest "a" and `index` addresses the element; "-" appends past the end and
     * "-n" counts back from it.
     *
     * All accessors are painless expressions rooted at `ctx._source`:
     *  - nest_accessor:     container holding `key`
     *  - location_accessor: value stored under `key` (the array for indexed paths)
     *  - full_accessor:     the addressed value, including any index
     */
    class path_descriptor {
      public:
        static constexpr bool to_string_formattable = true;

        const std::string& path() const { return path_; }
        const std::optional<std::string>& nest() const { return nest_; }
        const std::string& key() const { return key_; }

        // painless expression for the element position, when indexed
        const std::optional<std::string>& index() const { return index_; }
        // raw segment text of the index ("3", "-", "-1")
        const std::optional<std::string>& index_token() const { return index_token_; }
        bool has_index() const { return index_.has_value(); }

        const std::vector<nest_level>& nest_chain() const { return nest_chain_; }

        const std::string& nest_accessor() const { return nest_accessor_; }
        const std::string& location_accessor() const { return location_accessor_; }
        const std::string& full_accessor() const { return full_accessor_; }

        const std::string& param_key() const { return param_key_; }
        const std::string& scratch_var() const { return scratch_var_; }

        std::string_view to_string() const { return path_; }

      private:
        friend class path_resolver;

        path_descriptor() = default;

        std::string path_{};
        std::optional<std::string> nest_{};
        std::string key_{};
        std::optional<std::string> index_{};
        std::optional<std::string> index_token_{};
        std::vector<nest_level> nest_chain_{};
        std::string nest_accessor_{};
        std::string location_accessor_{};
        std::string full_accessor_{};
        std::string param_key_{};
        std::string scratch_var_{};
    };

    /*
     * Turns path strings into descriptors. Accepts dotted paths ("a.b.0") and JSON
     * pointers ("/a/b/0"). Each resolve() call draws the next occurrence number, which
     * keeps param keys and scratch variables unique within one script while staying
     * deterministic for a given operation list. Use one resolver per compiled script.
     *
     * Throws std::invalid_argument for empty paths, empty segments, an index with no
     * key before it, or a list position that does not fit a painless int.
     */
    class path_resolver {
      public:
        path_descriptor resolve(std::string_view path);

        uint32_t occurrences() const { return occurrence_; }

      private:
        uint32_t occurrence_{};
    };

    // "/a/b/0" -> "a.b.0"; dotted paths pass through
    std::string normalize_path(std::string_view path);

}  // namespace patchscript
