#include "patchscript/cli.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using namespace patchscript::literals;

namespace patchscript::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "input_file=" << (cfg.input_file ? cfg.input_file->string() : "<stdin>") << '\n';
            os << "input=" << to_string(cfg.input) << '\n';
            os << "refresh=" << (cfg.refresh ? *cfg.refresh : "<unset>") << '\n';
            os << refresh_env_var << '=' << (cfg.refresh_env ? *cfg.refresh_env : "<unset>") << '\n';
            os << "pretty=" << (cfg.pretty ? "true" : "false") << '\n';
        }

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static std::string read_input(const startup_config& cfg, std::istream& in) {
            if (cfg.input_file) {
                debug_log("reading patch from ", cfg.input_file->string());
                return read_text_file(*cfg.input_file);
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

    }  // namespace detail

    int run(const startup_config& cfg, std::istream& in, std::ostream& out, std::ostream& err) {
        auto text = detail::read_input(cfg, in);

        auto artifact = cfg.input == input_mode::merge ? compile_merge(parse_merge_document(text))
                                                       : compile(parse_operations(text));

        if (cfg.verbose) {
            err << "compiled {} bytes of {} source, {} params\n"_format(
                    artifact.source.size(), artifact.lang, artifact.params.size());
        }

        if (!cfg.refresh) {
            out << to_json(artifact, cfg.pretty) << '\n';
            return 0;
        }

        warning_sink warn{};
        if (!cfg.quiet) {
            warn = [&err](std::string_view message) { err << "warning: " << message << '\n'; };
        }
        refresh_normalizer normalizer{cfg.refresh_env, std::move(warn)};

        update_request request{
                .refresh = std::string{normalizer.validate(refresh_value{*cfg.refresh})}, .script = std::move(artifact)};
        out << to_json(request, cfg.pretty) << '\n';
        return 0;
    }

    int run(const startup_config& cfg) {
        return run(cfg, std::cin, std::cout, std::cerr);
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"patchscript: compile JSON patch operations into a painless update script"};

        bool show_version = false;
        bool merge_flag = false;
        std::string input_arg{};
        std::string mode_arg{std::string{to_string(cfg.input)}};
        std::string refresh_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-i,--input", input_arg, "Patch file (reads stdin when omitted or '-')");
        app.add_option("--mode", mode_arg, "Input interpretation: operations|merge");
        app.add_flag("--merge", merge_flag, "Shorthand for --mode merge");
        app.add_option("--refresh", refresh_arg, "Refresh value; emits a full update request: true|false|wait_for");
        app.add_flag("--pretty", cfg.pretty, "Indent JSON output");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress warnings");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_input_mode(mode_arg, cfg.input)) {
            std::cerr << "invalid --mode value: " << mode_arg << " (expected operations|merge)\n";
            return std::optional<int>{2};
        }
        if (merge_flag) {
            cfg.input = input_mode::merge;
        }

        if (auto input = detail::normalize_optional(input_arg); input && *input != "-"sv) {
            cfg.input_file = *input;
        }
        if (app.get_option("--refresh")->count() > 0U) {
            cfg.refresh = std::string{utils::trim_view(refresh_arg)};
        }
        cfg.refresh_env = read_env(refresh_env_var);

        if (show_version) {
            std::cout << "patchscript 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace patchscript::cli
