#pragma once
#include "gitwatch/errors.hpp"
#include "gitwatch/records.hpp"

#include <string>

namespace gitwatch {

// Consumer of orchestrator output. Called from the orchestrator thread only.
class Sink {
public:
  virtual ~Sink() = default;

  virtual void on_event(const EventRecord& rec) = 0;
  virtual void on_summary(const SummaryRecord& rec) = 0;
  // Non-fatal: a single path failed; the run continues.
  virtual void on_error(const std::string& message) = 0;
  // Terminal: delivered at most once, after which the run stops.
  virtual void on_fatal(const FatalWatchError& err) = 0;
};

} // namespace gitwatch
