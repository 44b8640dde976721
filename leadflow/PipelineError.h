#ifndef LEADFLOW_PIPELINE_ERROR_H
#define LEADFLOW_PIPELINE_ERROR_H

#include <string>
#include <utility>
#include <vector>
#include <folly/Expected.h>
#include <folly/Range.h>

namespace folly {
  struct dynamic;
}

enum PipelineErrorCode {
  PIPE_DNC_VIOLATION = 0,
  PIPE_INVALID_TRANSITION,
  PIPE_VALIDATION_FAILED,
  PIPE_NOT_FOUND,
  PIPE_MALFORMED_RECORD,
  PIPE_STORAGE_BUSY,
  PIPE_BAD_CONFIG,
  PIPE_ERROR_MAX,
};

struct PipelineErrorClass;
class PipelineError {
 public:
  PipelineError() noexcept = default;
  /* implicit */ PipelineError(PipelineErrorCode code) noexcept;

  /** Append a value substituted for the next %N of the message text. */
  PipelineError& putVariable(folly::StringPiece value);

  /** Fully substituted human-readable message. */
  std::string message() const;
  folly::dynamic toJson() const;

  operator bool() const noexcept { return kind_ != nullptr; }
  PipelineErrorCode code() const noexcept;
  const char* id() const noexcept;
  const char* reflect() const noexcept;

  /** Only lock contention is worth retrying. */
  bool retryable() const noexcept;

 private:
  const PipelineErrorClass *kind_ = nullptr;
  std::string vars_;
};

template<class T>
using PipelineResult = folly::Expected<T, PipelineError>;

/** Outcome of a batch where one bad record must not stop the rest. */
template<class T, class Record>
struct BatchResult {
  std::vector<T> succeeded;
  std::vector<std::pair<Record, PipelineError>> failed;
};

#endif // LEADFLOW_PIPELINE_ERROR_H
