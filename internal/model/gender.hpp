#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace famgraph::model {

enum class Gender : std::uint8_t {
  kMale = 1,
  kFemale = 2,
  kOther = 3,
};

constexpr std::string_view ToString(Gender gender) {
  switch (gender) {
    case Gender::kMale:
      return "male";
    case Gender::kFemale:
      return "female";
    case Gender::kOther:
    default:
      return "other";
  }
}

// Accepts any letter case ("Male", "FEMALE").
std::optional<Gender> ParseGender(std::string_view text);

} // namespace famgraph::model
