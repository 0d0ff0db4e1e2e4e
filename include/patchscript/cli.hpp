#pragma once

#include "patchscript.hpp"

#include <iosfwd>
#include <optional>

namespace patchscript::cli {

    // nullopt means continue to run(); otherwise the process exit code
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // reads the patch from cfg.input_file, or `in` when unset
    int run(const startup_config& cfg, std::istream& in, std::ostream& out, std::ostream& err);
    int run(const startup_config& cfg);

}  // namespace patchscript::cli
