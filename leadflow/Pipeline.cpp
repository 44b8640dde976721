#include "Pipeline.h"

#include <folly/Conv.h>
#include <folly/Format.h>
#include <folly/String.h>
#include <boost/date_time/posix_time/posix_time.hpp>

bool isTerminal(Population pop) noexcept {
  switch (pop) {
  case Population::ClosedWon:
  case Population::Partnership:
  case Population::DeadDnc:
    return true;
  case Population::Broken:
  case Population::Unengaged:
  case Population::Engaged:
  case Population::Lost:
  case Population::Parked:
    return false;
  }
  return false;
}

bool isSystemPaced(Population pop) noexcept {
  return pop == Population::Unengaged || pop == Population::Broken;
}

folly::Optional<ParkedMonth> ParkedMonth::parse(folly::StringPiece s) {
  s = folly::trimWhitespace(s);
  if (s.size() != 7 || s[4] != '-')
    return folly::none;

  auto year = folly::tryTo<int>(s.subpiece(0, 4));
  auto month = folly::tryTo<int>(s.subpiece(5, 2));
  if (!year || !month || *month < 1 || *month > 12)
    return folly::none;

  return ParkedMonth{*year, *month};
}

ParkedMonth ParkedMonth::of(const Date &date) {
  return ParkedMonth{static_cast<int>(date.year()),
                     static_cast<int>(date.month())};
}

std::string ParkedMonth::str() const {
  return folly::sformat("{:04d}-{:02d}", year, month);
}

std::string Prospect::fullName() const {
  std::string name = firstName;
  if (!firstName.empty() && !lastName.empty())
    name += ' ';
  name += lastName;
  return name;
}

namespace {
class SystemClock final : public Clock {
 public:
  Timestamp now() const override {
    return boost::posix_time::second_clock::local_time();
  }
};
}

const Clock& Clock::system() noexcept {
  static const SystemClock clock{};
  return clock;
}
