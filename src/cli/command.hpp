#pragma once

namespace wtm::cli {

// argv[0] is the subcommand name
using command_fn = int (*)(int argc, char **argv);

} // namespace wtm::cli
