#include "gitwatch/cancellation.hpp"
#include "gitwatch/config.hpp"
#include "gitwatch/debouncer.hpp"
#include "gitwatch/errors.hpp"
#include "gitwatch/event_source.hpp"
#include "gitwatch/log.hpp"
#include "gitwatch/orchestrator.hpp"
#include "gitwatch/output.hpp"
#include "gitwatch/path_matcher.hpp"
#include "gitwatch/repo.hpp"
#include "gitwatch/status.hpp"
#include "gitwatch/status_cache.hpp"

#include "cli/args.hpp"
#include "cli/registry.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <unistd.h>

namespace {

std::atomic<bool> *g_stop = nullptr;

extern "C" void on_signal(int) {
  if (g_stop)
    g_stop->store(true);
}

// SIGINT/SIGTERM cancel `token` while in scope.
struct SignalScope {
  explicit SignalScope(const gitwatch::CancellationToken &token) {
    g_stop = token.flag();
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
  }
  ~SignalScope() { g_stop = nullptr; }

  SignalScope(const SignalScope &) = delete;
  SignalScope &operator=(const SignalScope &) = delete;
};

} // namespace

int cmd_watch(int argc, char **argv) {
  using namespace gitwatch;
  try {
    const WatchConfig cfg = cli::parse_watch_args(argc, argv);
    log::set_level(cfg.verbosity);
    validate(cfg);

    auto matcher = std::make_shared<const PathMatcher>(PathMatcher::compile(
        cfg.root, cfg.use_default_excludes, cfg.use_ignore_file, cfg.extra_patterns));
    log::debug("compiled ", matcher->rule_count(), " ignore rules");

    std::optional<std::filesystem::path> repo_root;
    if (cfg.git != GitMode::Off) {
      if (auto repo = Repository::discover(cfg.root))
        repo_root = repo->workdir();
    }
    const bool git_enabled =
        cfg.git == GitMode::On || (cfg.git == GitMode::Auto && repo_root.has_value());
    if (cfg.git == GitMode::On && !repo_root)
      log::warn("no git repository at ", cfg.root.string(), " yet; status is retried");

    std::unique_ptr<StatusCache> cache;
    if (git_enabled) {
      cache = std::make_unique<StatusCache>(
          cfg.ttl, [root = cfg.root] { return compute_status_at(root); });
    }

    StreamSink sink(std::cout, Formatter(cfg.format, ::isatty(STDOUT_FILENO) != 0));

    // Initial status for the human-oriented formats
    if (cache && (cfg.format == OutputFormat::Pretty || cfg.format == OutputFormat::Summary)) {
      if (auto st = cache->get()) {
        sink.on_summary(summarize(*st));
        if (cfg.format == OutputFormat::Pretty)
          std::cout << '\n';
      }
    }

    InotifyEventSource source(cfg.root, cfg.recursive, cfg.max_depth);
    Debouncer debouncer(cfg.debounce, matcher);

    CancellationToken token;
    SignalScope signals(token);

    OrchestratorOptions opts;
    opts.tick = cfg.tick;
    opts.heartbeat = cfg.heartbeat.value_or(cfg.format == OutputFormat::Summary);
    opts.repo_root = repo_root;

    log::info("watching ", cfg.root.string(), " as ", to_string(cfg.format),
              git_enabled ? " with git status" : "");
    Orchestrator orch(std::move(opts), source, debouncer, matcher, cache.get(), sink, token);
    orch.run();
    if (orch.failed())
      return cli::kExitFailure;
    log::info("watcher stopped");
    return cli::kExitOk;
  } catch (const ConfigError &e) {
    std::cerr << "watch: " << e.what() << "\n";
    return cli::kExitUsage;
  } catch (const Error &e) {
    std::cerr << "watch: " << e.what() << "\n";
    return cli::kExitFailure;
  }
}
