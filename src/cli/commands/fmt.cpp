#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "gro/config.hpp"
#include "gro/fs.hpp"

#include <iostream>
#include <string>

int cmd_fmt(int argc, char ** /*argv*/) {
  if (argc > 1)
    return gro::cli::usage_error("fmt");

  auto config = gro::cli::load_config_or_report("fmt");
  if (!config)
    return 1;

  try {
    const auto path = gro::cli::config_path();
    const auto bytes = gro::fs::read_file(path);
    const std::string current(bytes.begin(), bytes.end());
    const std::string formatted = gro::dump_config(*config);
    if (current == formatted) {
      std::cout << "Config already formatted\n";
      return 0;
    }
    if (gro::cli::options().dry_run) {
      std::cout << "Would reformat " << path.string() << "\n";
      return 0;
    }
    gro::fs::write_text_atomic(path, formatted);
    std::cout << "Formatted " << path.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "fmt: " << e.what() << "\n";
    return 1;
  }
}
