#ifndef LEADFLOW_CODEC_H
#define LEADFLOW_CODEC_H

#include "Pipeline.h"
#include "PipelineError.h"

#include <folly/Optional.h>
#include <folly/Range.h>

namespace folly {
  struct dynamic;
}

/**
 * Storage representation of the domain enums. Business logic never sees
 * these strings; they exist for snapshots, CLI arguments and logs.
 */
template<class E>
struct EnumCodec {
  static folly::StringPiece name(E value) noexcept;
  static folly::Optional<E> parse(folly::StringPiece s) noexcept;
};

template<class E>
folly::StringPiece toString(E value) noexcept {
  return EnumCodec<E>::name(value);
}

/** "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS". */
folly::Optional<Timestamp> parseTimestamp(folly::StringPiece s) noexcept;
folly::Optional<Date> parseDate(folly::StringPiece s) noexcept;
std::string formatTimestamp(const Timestamp &ts);
std::string formatDate(const Date &date);

/** Entity <-> JSON at the persistence boundary. */
template<class M>
struct EntityCodec {
  static folly::dynamic toJson(const M &entity);
  /** Throws folly::TypeError, std::out_of_range or std::invalid_argument. */
  static M fromJson(const folly::dynamic &json);
  /** Non-throwing wrapper reporting PIPE_MALFORMED_RECORD. */
  static PipelineResult<M> decode(const folly::dynamic &json);
};

#endif // LEADFLOW_CODEC_H
