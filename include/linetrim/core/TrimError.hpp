#pragma once

#include <stdexcept>
#include <string>

namespace linetrim {

enum class TrimErrorKind {
  IOUnreadable,
  EmptyFile,
  MalformedHeader,
  MalformedRecord,
  MissingDirectory,
};

inline std::string trim_error_kind_name(TrimErrorKind k) {
  switch (k) {
    case TrimErrorKind::IOUnreadable: return "io_unreadable";
    case TrimErrorKind::EmptyFile: return "empty_file";
    case TrimErrorKind::MalformedHeader: return "malformed_header";
    case TrimErrorKind::MalformedRecord: return "malformed_record";
    case TrimErrorKind::MissingDirectory: return "missing_directory";
  }
  return "io_unreadable";
}

// Domain fault raised by readers and the extractor. Whether it is fatal is the
// caller's decision: IOUnreadable/EmptyFile become warnings, malformed input
// aborts the current file only, MissingDirectory stops the run.
class TrimError : public std::runtime_error {
public:
  TrimError(TrimErrorKind kind, const std::string& msg)
      : std::runtime_error(msg), kind_(kind) {}

  TrimErrorKind kind() const { return kind_; }

  bool is_file_fault() const {
    return kind_ == TrimErrorKind::MalformedHeader || kind_ == TrimErrorKind::MalformedRecord;
  }

private:
  TrimErrorKind kind_;
};

} // namespace linetrim
