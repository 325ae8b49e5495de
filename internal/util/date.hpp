#pragma once

#include <optional>
#include <string_view>

namespace famgraph::util {

/*
  Calendar dates in ISO 8601 extended form (YYYY-MM-DD).

  Only proleptic Gregorian dates with a four digit year are accepted;
  partial dates ("1850", "1850-03") are rejected.
*/
struct Date {
  int year  = 0;
  int month = 0;
  int day   = 0;

  auto operator<=>(const Date&) const = default;
};

std::optional<Date> ParseIsoDate(std::string_view text);

bool IsValidIsoDate(std::string_view text);

} // namespace famgraph::util
