#include "PipelineError.h"

#include <folly/dynamic.h>
#include <folly/String.h>
#include <folly/Conv.h>

#include <vector>

using folly::dynamic;
using folly::StringPiece;

struct PipelineErrorClass {
  PipelineErrorCode code;
  const char *id;
  const char *reflect;
  const char *text;
  bool retryable;
};

static const PipelineErrorClass pipelineError[] = {
  { PIPE_DNC_VIOLATION, "PIP4030", "PIPE_DNC_VIOLATION",
    "Prospect %1 is Do-Not-Contact: %2", false },
  { PIPE_INVALID_TRANSITION, "PIP4090", "PIPE_INVALID_TRANSITION",
    "Prospect %1 cannot move %2", false },
  { PIPE_VALIDATION_FAILED, "PIP4220", "PIPE_VALIDATION_FAILED",
    "Prospect %1 rejected: %2", false },
  { PIPE_NOT_FOUND, "PIP4040", "PIPE_NOT_FOUND",
    "Prospect %1 not found", false },
  { PIPE_MALFORMED_RECORD, "PIP4000", "PIPE_MALFORMED_RECORD",
    "Malformed import record: %1", false },
  { PIPE_STORAGE_BUSY, "PIP5030", "PIPE_STORAGE_BUSY",
    "Entity store busy, try again later", true },
  { PIPE_BAD_CONFIG, "PIP5000", "PIPE_BAD_CONFIG",
    "Invalid configuration ‘%1’: %2", false },
};
static_assert(sizeof(pipelineError) / sizeof(pipelineError[0]) == PIPE_ERROR_MAX,
              "error table out of sync with PipelineErrorCode");

PipelineError::PipelineError(PipelineErrorCode code) noexcept
  : kind_(&pipelineError[code])
{
}

PipelineErrorCode PipelineError::code() const noexcept {
  return kind_->code;
}

const char* PipelineError::id() const noexcept {
  return kind_->id;
}

const char* PipelineError::reflect() const noexcept {
  return kind_->reflect;
}

bool PipelineError::retryable() const noexcept {
  return kind_ && kind_->retryable;
}

PipelineError& PipelineError::putVariable(StringPiece value) {
  if (!vars_.empty())
    vars_ += '\t';
  vars_.append(value.data(), value.size());
  return *this;
}

std::string PipelineError::message() const {
  if (!kind_)
    return "no error";

  std::vector<StringPiece> vars;
  if (!vars_.empty())
    folly::split('\t', vars_, vars);

  std::string out;
  for (const char *p = kind_->text; *p; ++p) {
    if (p[0] == '%' && p[1] >= '1' && p[1] <= '9') {
      size_t index = p[1] - '1';
      if (index < vars.size())
        out.append(vars[index].data(), vars[index].size());
      else
        out += '?';
      ++p;
    } else {
      out += *p;
    }
  }
  return out;
}

dynamic PipelineError::toJson() const {
  dynamic vars = dynamic::array;
  if (!vars_.empty()) {
    folly::splitTo<StringPiece>('\t', vars_, std::back_inserter(vars));
  }

  return dynamic::object
    ("messageId", kind_ ? kind_->id : "")
    ("reflect", kind_ ? kind_->reflect : "")
    ("text", message())
    ("variables", std::move(vars))
    ("retryable", retryable());
}
