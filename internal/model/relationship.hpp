#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/person.hpp"
#include "internal/model/relationship_type.hpp"

namespace famgraph::model {

/*
  Directed, typed edge: person1 is the <type> of person2.
*/
struct Relationship {
  std::string id;
  std::string person1_id;
  std::string person2_id;
  RelationshipType type = RelationshipType::kOther;

  std::optional<std::string> start_date;
  std::optional<std::string> end_date;
  std::optional<std::string> location;
  std::optional<std::string> notes;

  std::map<std::string, std::string> attributes;

  bool Touches(const std::string& person_id) const {
    return person1_id == person_id || person2_id == person_id;
  }

  const std::string& Other(const std::string& person_id) const {
    return person1_id == person_id ? person2_id : person1_id;
  }
};

// Same edit semantics as PersonFields.
struct RelationshipFields {
  std::optional<std::string> person1_id;
  std::optional<std::string> person2_id;
  std::optional<std::string> type;
  std::optional<std::string> start_date;
  std::optional<std::string> end_date;
  std::optional<std::string> location;
  std::optional<std::string> notes;
  std::map<std::string, std::string> attributes;
};

// Unit of persistence: the full committed graph.
struct GraphSnapshot {
  std::vector<Person> people;
  std::vector<Relationship> relationships;
};

} // namespace famgraph::model
