#pragma once

namespace gro::cli {

// Subcommand handler: argv[0] is the command name
using command_fn = int (*)(int argc, char **argv);

} // namespace gro::cli
