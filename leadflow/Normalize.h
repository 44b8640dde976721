#ifndef LEADFLOW_NORMALIZE_H
#define LEADFLOW_NORMALIZE_H

#include <string>
#include <folly/Range.h>

class PhoneNumber {
 public:
  /** Keep digits only and strip the US country code from 11-digit
    * numbers starting with '1'. Non-US numbers keep all digits. */
  static std::string normalize(folly::StringPiece s);

  /** A normalized phone we are able to dial (10 digits). */
  static bool isUsable(folly::StringPiece normalized) noexcept;
};

class EmailAddress {
 public:
  /** Trimmed and lowercased. */
  static std::string normalize(folly::StringPiece s);

  /** Has a local part, a single '@' and a dotted domain. */
  static bool isUsable(folly::StringPiece normalized) noexcept;
};

class CompanyName {
 public:
  /** Dedup key: lowercase with trailing legal suffixes (LLC, Inc, Corp...)
    * removed. Business terms such as Holdings or Capital are kept. */
  static std::string normalize(folly::StringPiece name);
};

/** US state code to calling timezone. Unknown states map to "central". */
folly::StringPiece timezoneFromState(folly::StringPiece state);

/** East to west calling order, used to sort work queues. */
int timezoneRank(folly::StringPiece timezone) noexcept;

#endif // LEADFLOW_NORMALIZE_H
