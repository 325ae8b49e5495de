#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/model/gender.hpp"

namespace famgraph::model {

struct Person {
  std::string id;

  std::string first_name;
  std::string last_name;
  std::optional<std::string> nickname;

  // ISO YYYY-MM-DD
  std::optional<std::string> birth_date;
  std::optional<std::string> death_date;

  std::optional<std::string> place_of_birth;
  std::optional<std::string> place_of_death;
  std::optional<Gender> gender;
  std::optional<std::string> notes;

  std::map<std::string, std::string> attributes;

  std::string FullName() const;
  std::string DisplayName() const;
};

/*
  Input for AddPerson and EditPerson.

  For edits an unset field is left untouched and an empty string clears an
  optional field. Attributes are merged key by key.
*/
struct PersonFields {
  std::optional<std::string> first_name;
  std::optional<std::string> last_name;
  std::optional<std::string> nickname;
  std::optional<std::string> birth_date;
  std::optional<std::string> death_date;
  std::optional<std::string> place_of_birth;
  std::optional<std::string> place_of_death;
  std::optional<std::string> gender;
  std::optional<std::string> notes;
  std::map<std::string, std::string> attributes;
};

/*
  Filters for SearchPeople. Unset or blank filters are ignored and the rest
  must all match; an empty query matches everyone.

  name, places and notes match as case-insensitive substrings, dates and
  gender exactly. attribute_key and attribute_value must hold for the same
  attribute.
*/
struct PersonQuery {
  std::optional<std::string> name;
  std::optional<std::string> birth_date;
  std::optional<std::string> death_date;
  std::optional<std::string> gender;
  std::optional<std::string> place_of_birth;
  std::optional<std::string> place_of_death;
  std::optional<std::string> notes;
  std::optional<std::string> attribute_key;
  std::optional<std::string> attribute_value;
};

} // namespace famgraph::model
