#include "internal/model/person.hpp"

#include <string>

#include "internal/util/strings.hpp"

namespace famgraph::model {

std::optional<Gender> ParseGender(std::string_view text) {
  const auto lowered = util::ToLower(util::Trim(text));

  for (auto gender : {Gender::kMale, Gender::kFemale, Gender::kOther}) {
    if (ToString(gender) == lowered) {
      return gender;
    }
  }
  return std::nullopt;
}

std::string Person::FullName() const {
  if (last_name.empty()) return first_name;
  if (first_name.empty()) return last_name;
  return first_name + " " + last_name;
}

std::string Person::DisplayName() const {
  auto name = FullName();
  if (nickname && !nickname->empty()) {
    name += " (" + *nickname + ")";
  }
  return name;
}

} // namespace famgraph::model
