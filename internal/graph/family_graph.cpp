#include "internal/graph/family_graph.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/date.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/uuid.hpp"

namespace famgraph::graph {

using model::Person;
using model::PersonFields;
using model::Relationship;
using model::RelationshipFields;
using model::RelationshipType;
using observability::StringField;

namespace {

// Trimmed filter text; nullopt when unset or blank.
std::optional<std::string> ActiveFilter(const std::optional<std::string>& filter) {
  if (!filter) return std::nullopt;
  auto value = util::Trim(*filter);
  if (value.empty()) return std::nullopt;
  return value;
}

bool OptionalContains(const std::optional<std::string>& field, std::string_view needle) {
  return field && util::ContainsIgnoreCase(*field, needle);
}

bool MatchesName(const Person& p, std::string_view needle) {
  return util::ContainsIgnoreCase(p.first_name, needle) || util::ContainsIgnoreCase(p.last_name, needle) ||
         OptionalContains(p.nickname, needle) || util::ContainsIgnoreCase(p.FullName(), needle);
}

// Unset: keep. Empty after trim: clear. Otherwise: set.
void ApplyOptional(std::optional<std::string>& target, const std::optional<std::string>& update) {
  if (!update) return;
  auto value = util::Trim(*update);
  if (value.empty()) {
    target.reset();
  } else {
    target = std::move(value);
  }
}

void ApplyOptionalDate(std::optional<std::string>& target, const std::optional<std::string>& update, std::string_view field) {
  ApplyOptional(target, update);
  if (target && !util::IsValidIsoDate(*target)) {
    throw util::ValidationError(std::string(field) + " must be a valid YYYY-MM-DD date: " + *target);
  }
}

// Attributes merge key by key; an empty value removes the key.
void ApplyAttributes(std::map<std::string, std::string>& target, const std::map<std::string, std::string>& update) {
  for (const auto& [key, value] : update) {
    auto k = util::Trim(key);
    if (k.empty()) throw util::ValidationError("attribute key must not be empty");
    if (value.empty()) {
      target.erase(k);
    } else {
      target[k] = value;
    }
  }
}

void CheckDateOrder(const std::optional<std::string>& first, const std::optional<std::string>& second, std::string_view message) {
  if (!first || !second) return;
  if (*util::ParseIsoDate(*second) < *util::ParseIsoDate(*first)) {
    throw util::ValidationError(std::string(message));
  }
}

void ApplyPersonFields(Person& person, const PersonFields& fields) {
  if (fields.first_name) {
    person.first_name = util::Trim(*fields.first_name);
  }
  if (person.first_name.empty()) {
    throw util::ValidationError("first_name is required");
  }
  if (fields.last_name) {
    person.last_name = util::Trim(*fields.last_name);
  }

  ApplyOptional(person.nickname, fields.nickname);
  ApplyOptionalDate(person.birth_date, fields.birth_date, "birth_date");
  ApplyOptionalDate(person.death_date, fields.death_date, "death_date");
  ApplyOptional(person.place_of_birth, fields.place_of_birth);
  ApplyOptional(person.place_of_death, fields.place_of_death);
  ApplyOptional(person.notes, fields.notes);

  if (fields.gender) {
    auto text = util::Trim(*fields.gender);
    if (text.empty()) {
      person.gender.reset();
    } else {
      auto gender = model::ParseGender(text);
      if (!gender) throw util::ValidationError("gender must be one of male, female, other: " + text);
      person.gender = *gender;
    }
  }

  ApplyAttributes(person.attributes, fields.attributes);
  CheckDateOrder(person.birth_date, person.death_date, "death_date must not precede birth_date");
}

// Date formats are checked later by ValidateEdge.
void ApplyRelationshipDetails(Relationship& rel, const RelationshipFields& fields) {
  ApplyOptional(rel.start_date, fields.start_date);
  ApplyOptional(rel.end_date, fields.end_date);
  ApplyOptional(rel.location, fields.location);
  ApplyOptional(rel.notes, fields.notes);
  ApplyAttributes(rel.attributes, fields.attributes);
}

RelationshipType ParseTypeOrThrow(std::string_view text) {
  auto type = model::ParseRelationshipType(text);
  if (!type) throw util::ValidationError("unknown relationship type: " + std::string(text));
  return *type;
}

// Shared by add and edit, in the order callers observe errors: type is parsed
// by the caller, then self, existence, dates, duplicate.
void ValidateEdge(const PersonStore& people, const RelationshipStore& relationships, const Relationship& rel) {
  if (rel.person1_id == rel.person2_id) {
    throw util::ValidationError("a person cannot have a relationship with themselves: " + rel.person1_id);
  }
  if (!people.Contains(rel.person1_id)) throw util::NotFound("person not found: " + rel.person1_id);
  if (!people.Contains(rel.person2_id)) throw util::NotFound("person not found: " + rel.person2_id);

  for (const auto* date : {&rel.start_date, &rel.end_date}) {
    if (*date && !util::IsValidIsoDate(**date)) {
      throw util::ValidationError("relationship dates must be valid YYYY-MM-DD dates: " + **date);
    }
  }
  CheckDateOrder(rel.start_date, rel.end_date, "end_date must not precede start_date");

  auto existing = relationships.FindEdge(rel.person1_id, rel.person2_id, rel.type);
  if (existing && *existing != rel.id) {
    throw util::DuplicateEdge("relationship " + std::string(model::ToString(rel.type)) + " already exists between " + rel.person1_id + " and " +
                              rel.person2_id + ": " + *existing);
  }
}

} // namespace

FamilyGraph::FamilyGraph(TraversalLimits limits) : limits_(limits) {
  if (limits_.max_depth < 0) throw util::ValidationError("traversal max_depth must not be negative");
  if (limits_.max_visited == 0) throw util::ValidationError("traversal max_visited must be positive");
}

Person FamilyGraph::AddPerson(const PersonFields& fields) {
  Person person;
  if (!fields.first_name) throw util::ValidationError("first_name is required");
  ApplyPersonFields(person, fields);

  return Write([&](PersonStore& people, RelationshipStore&) {
    do {
      person.id = util::NewId();
    } while (people.Contains(person.id));
    return people.Insert(std::move(person));
  });
}

Person FamilyGraph::EditPerson(const std::string& id, const PersonFields& update) {
  return Write([&](PersonStore& people, RelationshipStore&) {
    auto* current = people.FindMutable(id);
    if (!current) throw util::NotFound("person not found: " + id);

    Person edited = *current;
    ApplyPersonFields(edited, update);
    *current = std::move(edited);
    return *current;
  });
}

std::size_t FamilyGraph::DeletePerson(const std::string& id) {
  return Write([&](PersonStore& people, RelationshipStore& relationships) {
    if (!people.Contains(id)) throw util::NotFound("person not found: " + id);

    auto edge_ids = relationships.EdgeIdsOf(id);
    for (const auto& edge_id : edge_ids) {
      relationships.Erase(edge_id);
    }
    people.Erase(id);
    return edge_ids.size();
  });
}

Relationship FamilyGraph::AddRelationship(const std::string& person1_id, const std::string& person2_id, std::string_view type,
                                          const RelationshipFields& details) {
  Relationship rel;
  rel.type       = ParseTypeOrThrow(type);
  rel.person1_id = util::Trim(person1_id);
  rel.person2_id = util::Trim(person2_id);
  ApplyRelationshipDetails(rel, details);

  return Write([&](PersonStore& people, RelationshipStore& relationships) {
    ValidateEdge(people, relationships, rel);
    do {
      rel.id = util::NewId();
    } while (relationships.Contains(rel.id));
    return relationships.Insert(std::move(rel));
  });
}

Relationship FamilyGraph::AddRelationship(const RelationshipFields& fields) {
  if (!fields.type) throw util::ValidationError("relationship type is required");
  if (!fields.person1_id || !fields.person2_id) throw util::ValidationError("person1_id and person2_id are required");
  return AddRelationship(*fields.person1_id, *fields.person2_id, *fields.type, fields);
}

Relationship FamilyGraph::EditRelationship(const std::string& id, const RelationshipFields& update) {
  return Write([&](PersonStore& people, RelationshipStore& relationships) {
    const auto* current = relationships.Find(id);
    if (!current) throw util::NotFound("relationship not found: " + id);

    Relationship edited = *current;
    if (update.type) edited.type = ParseTypeOrThrow(*update.type);
    if (update.person1_id) edited.person1_id = util::Trim(*update.person1_id);
    if (update.person2_id) edited.person2_id = util::Trim(*update.person2_id);
    ApplyRelationshipDetails(edited, update);

    ValidateEdge(people, relationships, edited);
    return relationships.Replace(std::move(edited));
  });
}

void FamilyGraph::DeleteRelationship(const std::string& id) {
  Write([&](PersonStore&, RelationshipStore& relationships) {
    if (!relationships.Erase(id)) throw util::NotFound("relationship not found: " + id);
  });
}

Person FamilyGraph::GetPerson(const std::string& id) const {
  return Read([&](const PersonStore& people, const RelationshipStore&) {
    const auto* person = people.Find(id);
    if (!person) throw util::NotFound("person not found: " + id);
    return *person;
  });
}

Relationship FamilyGraph::GetRelationship(const std::string& id) const {
  return Read([&](const PersonStore&, const RelationshipStore& relationships) {
    const auto* rel = relationships.Find(id);
    if (!rel) throw util::NotFound("relationship not found: " + id);
    return *rel;
  });
}

std::vector<Person> FamilyGraph::ListPeople() const {
  return Read([](const PersonStore& people, const RelationshipStore&) {
    std::vector<Person> out;
    out.reserve(people.Size());
    people.ForEach([&](const Person& p) { out.push_back(p); });
    return out;
  });
}

std::vector<Relationship> FamilyGraph::ListRelationships() const {
  return Read([](const PersonStore&, const RelationshipStore& relationships) {
    std::vector<Relationship> out;
    out.reserve(relationships.Size());
    relationships.ForEach([&](const Relationship& r) { out.push_back(r); });
    return out;
  });
}

std::vector<Relationship> FamilyGraph::RelationshipsOf(const std::string& person_id) const {
  return Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    if (!people.Contains(person_id)) throw util::NotFound("person not found: " + person_id);
    std::vector<Relationship> out;
    relationships.ForEachEdgeOf(person_id, [&](const Relationship& r) { out.push_back(r); });
    return out;
  });
}

std::vector<Person> FamilyGraph::FindPeopleByName(std::string_view query) const {
  const auto needle = util::Trim(query);
  return Read([&](const PersonStore& people, const RelationshipStore&) {
    std::vector<Person> out;
    if (needle.empty()) return out;
    people.ForEach([&](const Person& p) {
      if (MatchesName(p, needle)) out.push_back(p);
    });
    return out;
  });
}

std::vector<Person> FamilyGraph::SearchPeople(const model::PersonQuery& query) const {
  const auto name            = ActiveFilter(query.name);
  const auto birth_date      = ActiveFilter(query.birth_date);
  const auto death_date      = ActiveFilter(query.death_date);
  const auto place_of_birth  = ActiveFilter(query.place_of_birth);
  const auto place_of_death  = ActiveFilter(query.place_of_death);
  const auto notes           = ActiveFilter(query.notes);
  const auto attribute_key   = ActiveFilter(query.attribute_key);
  const auto attribute_value = ActiveFilter(query.attribute_value);

  if (birth_date && !util::IsValidIsoDate(*birth_date)) {
    throw util::ValidationError("birth_date must be a valid YYYY-MM-DD date: " + *birth_date);
  }
  if (death_date && !util::IsValidIsoDate(*death_date)) {
    throw util::ValidationError("death_date must be a valid YYYY-MM-DD date: " + *death_date);
  }
  std::optional<model::Gender> gender;
  if (const auto text = ActiveFilter(query.gender)) {
    gender = model::ParseGender(*text);
    if (!gender) throw util::ValidationError("gender must be one of male, female, other: " + *text);
  }

  auto has_attribute = [&](const Person& p) {
    return std::any_of(p.attributes.begin(), p.attributes.end(), [&](const auto& attribute) {
      return (!attribute_key || attribute.first == *attribute_key) &&
             (!attribute_value || util::ContainsIgnoreCase(attribute.second, *attribute_value));
    });
  };

  return Read([&](const PersonStore& people, const RelationshipStore&) {
    std::vector<Person> out;
    people.ForEach([&](const Person& p) {
      if (name && !MatchesName(p, *name)) return;
      if (birth_date && p.birth_date != birth_date) return;
      if (death_date && p.death_date != death_date) return;
      if (gender && p.gender != gender) return;
      if (place_of_birth && !OptionalContains(p.place_of_birth, *place_of_birth)) return;
      if (place_of_death && !OptionalContains(p.place_of_death, *place_of_death)) return;
      if (notes && !OptionalContains(p.notes, *notes)) return;
      if ((attribute_key || attribute_value) && !has_attribute(p)) return;
      out.push_back(p);
    });
    return out;
  });
}

std::vector<Relationship> FamilyGraph::FindRelationshipsByType(RelationshipType type) const {
  return Read([&](const PersonStore&, const RelationshipStore& relationships) {
    std::vector<Relationship> out;
    relationships.ForEach([&](const Relationship& r) {
      if (r.type == type) out.push_back(r);
    });
    return out;
  });
}

std::size_t FamilyGraph::PersonCount() const {
  return Read([](const PersonStore& people, const RelationshipStore&) { return people.Size(); });
}

std::size_t FamilyGraph::RelationshipCount() const {
  return Read([](const PersonStore&, const RelationshipStore& relationships) { return relationships.Size(); });
}

CommittedSnapshot FamilyGraph::SnapshotLocked() const {
  CommittedSnapshot snapshot;
  snapshot.version = version_;
  snapshot.graph.people.reserve(people_.Size());
  snapshot.graph.relationships.reserve(relationships_.Size());
  people_.ForEach([&](const Person& p) { snapshot.graph.people.push_back(p); });
  relationships_.ForEach([&](const Relationship& r) { snapshot.graph.relationships.push_back(r); });
  return snapshot;
}

CommittedSnapshot FamilyGraph::Snapshot() const {
  std::shared_lock lock(mutex_);
  return SnapshotLocked();
}

RestoreStats FamilyGraph::Restore(const model::GraphSnapshot& snapshot) {
  RestoreStats stats;

  PersonStore       people;
  RelationshipStore relationships;

  for (const auto& record : snapshot.people) {
    if (record.id.empty() || people.Contains(record.id)) {
      FAMGRAPH_LOG_WARN("Skipping person record", {StringField("id", record.id), StringField("reason", "missing or duplicate id")});
      ++stats.people_skipped;
      continue;
    }
    try {
      Person person;
      person.id = record.id;
      PersonFields fields;
      fields.first_name     = record.first_name;
      fields.last_name      = record.last_name;
      fields.nickname       = record.nickname;
      fields.birth_date     = record.birth_date;
      fields.death_date     = record.death_date;
      fields.place_of_birth = record.place_of_birth;
      fields.place_of_death = record.place_of_death;
      fields.notes          = record.notes;
      if (record.gender) fields.gender = std::string(model::ToString(*record.gender));
      fields.attributes = record.attributes;
      ApplyPersonFields(person, fields);
      people.Insert(std::move(person));
      ++stats.people_loaded;
    } catch (const util::ValidationError& ex) {
      FAMGRAPH_LOG_WARN("Skipping person record", {StringField("id", record.id), StringField("reason", ex.what())});
      ++stats.people_skipped;
    }
  }

  for (const auto& record : snapshot.relationships) {
    if (record.id.empty() || relationships.Contains(record.id)) {
      FAMGRAPH_LOG_WARN("Skipping relationship record", {StringField("id", record.id), StringField("reason", "missing or duplicate id")});
      ++stats.relationships_skipped;
      continue;
    }
    try {
      Relationship rel;
      rel.id         = record.id;
      rel.person1_id = record.person1_id;
      rel.person2_id = record.person2_id;
      rel.type       = record.type;
      RelationshipFields details;
      details.start_date = record.start_date;
      details.end_date   = record.end_date;
      details.location   = record.location;
      details.notes      = record.notes;
      details.attributes = record.attributes;
      ApplyRelationshipDetails(rel, details);
      ValidateEdge(people, relationships, rel);
      relationships.Insert(std::move(rel));
      ++stats.relationships_loaded;
    } catch (const std::runtime_error& ex) {
      FAMGRAPH_LOG_WARN("Skipping relationship record", {StringField("id", record.id), StringField("reason", ex.what())});
      ++stats.relationships_skipped;
    }
  }

  {
    std::unique_lock lock(mutex_);
    ++version_;
    people_        = std::move(people);
    relationships_ = std::move(relationships);
  }

  FAMGRAPH_LOG_INFO("Family graph restored", {observability::IntField("people", static_cast<std::int64_t>(stats.people_loaded)),
                                              observability::IntField("relationships", static_cast<std::int64_t>(stats.relationships_loaded)),
                                              observability::IntField("people_skipped", static_cast<std::int64_t>(stats.people_skipped)),
                                              observability::IntField("relationships_skipped", static_cast<std::int64_t>(stats.relationships_skipped))});
  return stats;
}

} // namespace famgraph::graph
