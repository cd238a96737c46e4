#pragma once
#include "gitwatch/config.hpp"
#include "gitwatch/records.hpp"
#include "gitwatch/sink.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace gitwatch {

/**
 * Renders records in one of the output formats. An empty string means the format
 * has no line for that record (events mode prints no summaries, summary mode no events).
 *
 *   json     one object per line
 *   pretty   colored labels, multi-line status block
 *   events   "<code> <op> <path>" with op one of + ~ - R
 *   summary  "[branch] ↑a ↓b | M:x S:y U:z [CONFLICT]"
 */
class Formatter {
public:
  explicit Formatter(OutputFormat format, bool color = true) : format_(format), color_(color) {}

  [[nodiscard]] std::string event(const EventRecord& rec) const;
  [[nodiscard]] std::string summary(const SummaryRecord& rec) const;
  [[nodiscard]] std::string error(std::string_view message, bool fatal,
                                  std::int64_t timestamp) const;

  [[nodiscard]] OutputFormat format() const { return format_; }

private:
  [[nodiscard]] std::string paint(std::string_view text, std::string_view sgr) const;

  OutputFormat format_;
  bool color_;
};

// Writes formatted records to a stream, one line each, flushed per line.
class StreamSink final : public Sink {
public:
  StreamSink(std::ostream& out, Formatter fmt) : out_(out), fmt_(fmt) {}

  void on_event(const EventRecord& rec) override;
  void on_summary(const SummaryRecord& rec) override;
  void on_error(const std::string& message) override;
  void on_fatal(const FatalWatchError& err) override;

private:
  void put(const std::string& line);

  std::ostream& out_;
  Formatter fmt_;
};

} // namespace gitwatch
