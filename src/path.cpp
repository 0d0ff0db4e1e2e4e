#include "patchscript/path.hpp"

#include "patchscript/format.hpp"

#include "internal/painless.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace patchscript::literals;
using namespace std::string_view_literals;

namespace patchscript {

    namespace detail {

        static bool is_index_segment(std::string_view segment) {
            if (segment == "-"sv) {
                return true;
            }
            if (segment.starts_with('-')) {
                segment.remove_prefix(1U);
            }
            if (segment.empty()) {
                return false;
            }
            for (char c : segment) {
                if (!utils::is_ascii_digit(c)) {
                    return false;
                }
            }
            return true;
        }

        static bool is_position_segment(std::string_view segment) {
            if (segment.empty()) {
                return false;
            }
            for (char c : segment) {
                if (!utils::is_ascii_digit(c)) {
                    return false;
                }
            }
            return true;
        }

        // painless list methods take int positions; a long would bind to remove(Object)
        static int32_t parse_position(std::string_view token, std::string_view path) {
            auto parsed = utils::parse_integer<int32_t>(token);
            if (!parsed) {
                throw std::invalid_argument("array index out of range in patch path: {}"_format(path));
            }
            return *parsed;
        }

        // "-" appends, "-n" counts back from the end of the list at `location`
        static std::string index_expression(std::string_view token, std::string_view location, std::string_view path) {
            if (token == "-"sv) {
                return "{}.size()"_format(location);
            }

            bool from_end = token.starts_with('-');
            if (from_end) {
                token.remove_prefix(1U);
            }

            auto position = parse_position(token, path);
            if (from_end) {
                return "{}.size() - {}"_format(location, position);
            }
            return std::to_string(position);
        }

    }  // namespace detail

    std::string normalize_path(std::string_view path) {
        auto first = path.find_first_not_of('/');
        if (first == std::string_view::npos) {
            return {};
        }
        std::string normalized{path.substr(first)};
        for (auto& c : normalized) {
            if (c == '/') {
                c = '.';
            }
        }
        return normalized;
    }

    path_descriptor path_resolver::resolve(std::string_view path) {
        namespace painless = internal::painless;

        auto normalized = normalize_path(path);
        if (normalized.empty()) {
            throw std::invalid_argument("empty patch path");
        }

        auto segments = utils::split(normalized, '.');
        for (const auto& segment : segments) {
            if (segment.empty()) {
                throw std::invalid_argument("empty segment in patch path: {}"_format(path));
            }
        }

        path_descriptor desc{};
        desc.path_ = normalized;

        if (detail::is_index_segment(segments.back())) {
            desc.index_token_ = segments.back();
            segments.pop_back();
            if (segments.empty()) {
                throw std::invalid_argument("array index without a key in patch path: {}"_format(path));
            }
        }

        desc.key_ = segments.back();
        segments.pop_back();

        std::string accessor{painless::document_root};
        std::string nest_path{};
        for (const auto& segment : segments) {
            auto level_path = nest_path.empty() ? segment : "{}.{}"_format(nest_path, segment);
            nest_level level{.path = level_path, .container_accessor = accessor, .key = segment};

            // digits below the root step into a list element
            if (!nest_path.empty() && detail::is_position_segment(segment)) {
                level.index = std::to_string(detail::parse_position(segment, path));
                accessor += "[{}]"_format(*level.index);
            }
            else {
                accessor += painless::member(segment);
            }

            desc.nest_chain_.push_back(std::move(level));
            nest_path = std::move(level_path);
        }
        if (!nest_path.empty()) {
            desc.nest_ = nest_path;
        }

        desc.nest_accessor_ = accessor;
        desc.location_accessor_ = accessor + painless::member(desc.key_);

        if (desc.index_token_) {
            desc.index_ = detail::index_expression(*desc.index_token_, desc.location_accessor_, path);
            desc.full_accessor_ = "{}[{}]"_format(desc.location_accessor_, *desc.index_);
        }
        else {
            desc.full_accessor_ = desc.location_accessor_;
        }

        auto occurrence = occurrence_++;
        auto token = painless::token(desc.path_);
        desc.param_key_ = "{}_{}"_format(token, occurrence);
        desc.scratch_var_ = "removed_{}_{}"_format(token, occurrence);

        return desc;
    }

}  // namespace patchscript
