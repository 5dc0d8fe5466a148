#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "linetrim/app/Runner.hpp"
#include "linetrim/config/IniConfig.hpp"

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  std::optional<int> threads;
  bool validate_config = false;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path> [--threads N] [--validate-config]\n"
      << "       " << argv0 << " --version\n"
      << "\n"
      << "Trims spectral line lists to the configured wavelength segments.\n"
      << "Exit status: 0 ok, 1 fatal error, 2 finished but some files were malformed.\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << LINETRIM_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--threads") {
      if (i + 1 >= argc) throw std::runtime_error("--threads requires a value");
      cli.threads = std::stoi(argv[++i]);
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (cli.config.empty()) {
    throw std::runtime_error("--config is required");
  }
  return cli;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);

#if !LINETRIM_HAS_OPENMP
    if (cli.threads && *cli.threads > 1) {
      std::cerr << "[linetrim] built without OpenMP; --threads ignored\n";
    }
#endif

    linetrim::IniConfig cfg(cli.config);
    linetrim::Runner runner(cfg, cli.threads);
    if (cli.validate_config) {
      return runner.validate_config();
    }
    return runner.run();

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
