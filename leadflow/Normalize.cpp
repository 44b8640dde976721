#include "Normalize.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <folly/String.h>

using folly::StringPiece;

std::string PhoneNumber::normalize(StringPiece s) {
  std::string digits;

  s = folly::trimWhitespace(s);
  digits.reserve(s.size());
  std::copy_if(s.begin(), s.end(), std::back_inserter(digits),
               [](char c) { return c >= '0' && c <= '9'; });

  if (digits.size() == 11 && digits[0] == '1')
    digits.erase(0, 1);
  return digits;
}

bool PhoneNumber::isUsable(StringPiece normalized) noexcept {
  return normalized.size() == 10 &&
    std::all_of(normalized.begin(), normalized.end(),
                [](char c) { return c >= '0' && c <= '9'; });
}

std::string EmailAddress::normalize(StringPiece s) {
  std::string email = folly::trimWhitespace(s).str();
  folly::toLowerAscii(email);
  return email;
}

bool EmailAddress::isUsable(StringPiece normalized) noexcept {
  size_t at = normalized.find('@');
  if (at == StringPiece::npos || at == 0)
    return false;
  StringPiece domain = normalized.subpiece(at + 1);
  if (domain.find('@') != StringPiece::npos)
    return false;
  size_t dot = domain.rfind('.');
  return dot != StringPiece::npos && dot > 0 && dot + 1 < domain.size() &&
    std::none_of(normalized.begin(), normalized.end(),
                 [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

// Legal entity suffixes, trailing period already removed.
static const StringPiece legalSuffixes[] = {
  "llc", "l.l.c", "inc", "incorporated", "corp", "corporation",
  "ltd", "limited", "lp", "l.p", "co", "company",
};

static bool stripLegalSuffix(StringPiece &name) {
  StringPiece body = name;
  body.removeSuffix(".");

  for (StringPiece suffix : legalSuffixes) {
    if (!body.endsWith(suffix))
      continue;

    StringPiece head = body.subpiece(0, body.size() - suffix.size());
    if (head.empty())
      continue;
    // Whole words only: "Taco" must not lose its "co"
    if (head.back() != ' ' && head.back() != ',' && head.back() != '\t')
      continue;

    head = folly::rtrimWhitespace(head);
    head.removeSuffix(",");
    head = folly::rtrimWhitespace(head);
    if (head.empty())
      continue;

    name = head;
    return true;
  }
  return false;
}

std::string CompanyName::normalize(StringPiece name) {
  std::string lower = folly::trimWhitespace(name).str();
  folly::toLowerAscii(lower);

  StringPiece key = lower;
  while (stripLegalSuffix(key)) {
  }
  return key.str();
}

struct StateZone {
  const char *state;
  const char *timezone;
};

static const StateZone stateZones[] = {
  {"AK", "alaska"}, {"AL", "central"}, {"AR", "central"}, {"AZ", "mountain"},
  {"CA", "pacific"}, {"CO", "mountain"}, {"CT", "eastern"}, {"DC", "eastern"},
  {"DE", "eastern"}, {"FL", "eastern"}, {"GA", "eastern"}, {"HI", "hawaii"},
  {"IA", "central"}, {"ID", "mountain"}, {"IL", "central"}, {"IN", "eastern"},
  {"KS", "central"}, {"KY", "eastern"}, {"LA", "central"}, {"MA", "eastern"},
  {"MD", "eastern"}, {"ME", "eastern"}, {"MI", "eastern"}, {"MN", "central"},
  {"MO", "central"}, {"MS", "central"}, {"MT", "mountain"}, {"NC", "eastern"},
  {"ND", "central"}, {"NE", "central"}, {"NH", "eastern"}, {"NJ", "eastern"},
  {"NM", "mountain"}, {"NV", "pacific"}, {"NY", "eastern"}, {"OH", "eastern"},
  {"OK", "central"}, {"OR", "pacific"}, {"PA", "eastern"}, {"RI", "eastern"},
  {"SC", "eastern"}, {"SD", "central"}, {"TN", "central"}, {"TX", "central"},
  {"UT", "mountain"}, {"VA", "eastern"}, {"VT", "eastern"}, {"WA", "pacific"},
  {"WI", "central"}, {"WV", "eastern"}, {"WY", "mountain"},
};

StringPiece timezoneFromState(StringPiece state) {
  std::string code = folly::trimWhitespace(state).str();
  std::transform(code.begin(), code.end(), code.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  auto it = std::lower_bound(
      std::begin(stateZones), std::end(stateZones), code,
      [](const StateZone &lhs, const std::string &rhs) {
        return StringPiece(lhs.state) < StringPiece(rhs);
      });
  if (it != std::end(stateZones) && code == it->state)
    return it->timezone;
  return "central";
}

int timezoneRank(StringPiece timezone) noexcept {
  static const StringPiece order[] = {
    "eastern", "central", "mountain", "pacific", "alaska", "hawaii",
  };
  for (size_t i = 0; i < std::size(order); ++i) {
    if (order[i] == timezone)
      return static_cast<int>(i);
  }
  return 1;
}
