#include "gitwatch/config.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/log.hpp"
#include "gitwatch/output.hpp"
#include "gitwatch/records.hpp"
#include "gitwatch/status.hpp"

#include "cli/args.hpp"
#include "cli/registry.hpp"

#include <filesystem>
#include <iostream>
#include <unistd.h>

int cmd_status(int argc, char **argv) {
  using namespace gitwatch;
  try {
    const WatchConfig cfg = cli::parse_watch_args(argc, argv);
    log::set_level(cfg.verbosity);

    const RepoStatus st = compute_status_at(cfg.root);

    if (cfg.format == OutputFormat::Events) {
      // one "<code> <path>" line per changed path
      for (const auto &[path, fs] : st.file_statuses)
        std::cout << short_code(fs) << ' ' << path << "\n";
      return cli::kExitOk;
    }
    const Formatter fmt(cfg.format, ::isatty(STDOUT_FILENO) != 0);
    std::cout << fmt.summary(summarize(st)) << "\n";
    return cli::kExitOk;
  } catch (const ConfigError &e) {
    std::cerr << "status: " << e.what() << "\n";
    return cli::kExitUsage;
  } catch (const Error &e) {
    std::cerr << "status: " << e.what() << "\n";
    return cli::kExitFailure;
  }
}
