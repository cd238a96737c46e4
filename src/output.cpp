#include "gitwatch/output.hpp"

#include "gitwatch/time.hpp"

#include <json/json.h>
#include <sstream>

namespace gitwatch {

namespace {

// SGR sequences
constexpr std::string_view kBoldGreen = "1;32";
constexpr std::string_view kBoldYellow = "1;33";
constexpr std::string_view kBoldRed = "1;31";
constexpr std::string_view kBoldBlue = "1;34";
constexpr std::string_view kBoldCyan = "1;36";
constexpr std::string_view kGreen = "32";
constexpr std::string_view kYellow = "33";
constexpr std::string_view kRed = "31";
constexpr std::string_view kBlue = "34";
constexpr std::string_view kGrey = "90";
constexpr std::string_view kWhite = "97";

std::string to_json_line(const Json::Value &v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, v);
}

std::string_view status_color(FileStatus s) {
  switch (s) {
  case FileStatus::Modified:
    return kYellow;
  case FileStatus::Added:
  case FileStatus::Staged:
    return kGreen;
  case FileStatus::Deleted:
    return kRed;
  case FileStatus::Renamed:
    return kBlue;
  case FileStatus::Untracked:
    return kGrey;
  case FileStatus::Conflicted:
    return kBoldRed;
  }
  return kWhite;
}

char event_op(std::string_view type) {
  if (type == "created")
    return '+';
  if (type == "modified")
    return '~';
  if (type == "deleted")
    return '-';
  return 'R';
}

} // namespace

std::string Formatter::paint(std::string_view text, std::string_view sgr) const {
  if (!color_)
    return std::string(text);
  std::string s = "\x1b[";
  s.append(sgr);
  s.push_back('m');
  s.append(text);
  s.append("\x1b[0m");
  return s;
}

std::string Formatter::event(const EventRecord &rec) const {
  switch (format_) {
  case OutputFormat::Json: {
    Json::Value v(Json::objectValue);
    v["event_type"] = rec.event_type;
    v["path"] = rec.path;
    if (rec.from_path)
      v["from_path"] = *rec.from_path;
    v["git_status"] =
        rec.git_status ? Json::Value(std::string(short_code(*rec.git_status))) : Json::Value();
    v["timestamp"] = Json::Int64{rec.timestamp};
    return to_json_line(v);
  }
  case OutputFormat::Pretty: {
    std::ostringstream os;
    if (rec.git_status)
      os << '[' << paint(short_code(*rec.git_status), status_color(*rec.git_status)) << "] ";
    if (rec.event_type == "created")
      os << paint("CREATED", kBoldGreen);
    else if (rec.event_type == "modified")
      os << paint("MODIFIED", kBoldYellow);
    else if (rec.event_type == "deleted")
      os << paint("DELETED", kBoldRed);
    else
      os << paint("RENAMED", kBoldBlue);
    os << ' ';
    if (rec.from_path)
      os << *rec.from_path << " -> ";
    os << rec.path;
    return os.str();
  }
  case OutputFormat::Events: {
    std::string s(rec.git_status ? short_code(*rec.git_status) : " ");
    s.push_back(' ');
    s.push_back(event_op(rec.event_type));
    s.push_back(' ');
    if (rec.from_path)
      s += *rec.from_path + " -> ";
    s += rec.path;
    return s;
  }
  case OutputFormat::Summary:
    return {};
  }
  return {};
}

std::string Formatter::summary(const SummaryRecord &rec) const {
  switch (format_) {
  case OutputFormat::Json: {
    Json::Value v(Json::objectValue);
    v["branch"] = rec.branch ? Json::Value(*rec.branch) : Json::Value();
    v["ahead"] = Json::UInt64{rec.ahead};
    v["behind"] = Json::UInt64{rec.behind};
    v["modified_files"] = Json::UInt64{rec.modified_files};
    v["staged_files"] = Json::UInt64{rec.staged_files};
    v["untracked_files"] = Json::UInt64{rec.untracked_files};
    v["has_conflicts"] = rec.has_conflicts;
    return to_json_line(v);
  }
  case OutputFormat::Pretty: {
    std::ostringstream os;
    os << paint("Branch:", kBoldCyan) << ' ' << paint(rec.branch.value_or("(none)"), kWhite);
    if (rec.ahead > 0 || rec.behind > 0) {
      os << '\n'
         << paint("Status:", kBoldCyan) << ' ' << paint(std::to_string(rec.ahead), kGreen)
         << " ahead, " << paint(std::to_string(rec.behind), kRed) << " behind";
    }
    if (rec.has_conflicts)
      os << '\n' << paint("CONFLICTS DETECTED", kBoldRed);
    os << '\n'
       << paint("Files:", kBoldCyan) << ' ' << rec.modified_files << " modified, "
       << rec.staged_files << " staged, " << rec.untracked_files << " untracked";
    return os.str();
  }
  case OutputFormat::Summary: {
    std::ostringstream os;
    os << '[' << rec.branch.value_or("") << "] \xE2\x86\x91" << rec.ahead << " \xE2\x86\x93"
       << rec.behind << " | M:" << rec.modified_files << " S:" << rec.staged_files
       << " U:" << rec.untracked_files;
    if (rec.has_conflicts)
      os << " [CONFLICT]";
    return os.str();
  }
  case OutputFormat::Events:
    return {};
  }
  return {};
}

std::string Formatter::error(std::string_view message, bool fatal, std::int64_t timestamp) const {
  switch (format_) {
  case OutputFormat::Json: {
    Json::Value v(Json::objectValue);
    v["event_type"] = "error";
    v["message"] = std::string(message);
    v["timestamp"] = Json::Int64{timestamp};
    if (fatal)
      v["fatal"] = true;
    return to_json_line(v);
  }
  case OutputFormat::Pretty:
    return paint(fatal ? "FATAL" : "ERROR", kBoldRed) + " " + std::string(message);
  case OutputFormat::Events:
  case OutputFormat::Summary:
    return "! " + std::string(message);
  }
  return {};
}

void StreamSink::put(const std::string &line) {
  if (line.empty())
    return;
  out_ << line << '\n';
  out_.flush();
}

void StreamSink::on_event(const EventRecord &rec) { put(fmt_.event(rec)); }

void StreamSink::on_summary(const SummaryRecord &rec) { put(fmt_.summary(rec)); }

void StreamSink::on_error(const std::string &message) {
  put(fmt_.error(message, false, timeutil::now_seconds()));
}

void StreamSink::on_fatal(const FatalWatchError &err) {
  put(fmt_.error(err.what(), true, timeutil::now_seconds()));
}

} // namespace gitwatch
