#include "internal/model/relationship_type.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace famgraph::model {

namespace {

std::size_t Index(RelationshipType type) {
  return static_cast<std::size_t>(type);
}

} // namespace

std::optional<RelationshipType> ParseRelationshipType(std::string_view text) {
  auto normalized = util::ToLower(util::Trim(text));
  for (auto& c : normalized) {
    if (c == ' ' || c == '-' || c == '/') c = '_';
  }
  for (std::size_t i = 0; i < kRelationshipTypeCount; ++i) {
    const auto type = static_cast<RelationshipType>(i);
    if (ToString(type) == normalized) {
      return type;
    }
  }
  return std::nullopt;
}

ReciprocityResolver::ReciprocityResolver() {
  using T = RelationshipType;

  // aunt_uncle and nephew_niece only appear as values; they resolve through
  // the override table.
  entries_ = {
      {T::kParent, T::kChild},
      {T::kChild, T::kParent},
      {T::kSpouse, T::kSpouse},
      {T::kPartner, T::kPartner},
      {T::kSibling, T::kSibling},
      {T::kHalfSibling, T::kHalfSibling},
      {T::kGrandparent, T::kGrandchild},
      {T::kGrandchild, T::kGrandparent},
      {T::kAunt, T::kNephewNiece},
      {T::kUncle, T::kNephewNiece},
      {T::kNephew, T::kAuntUncle},
      {T::kNiece, T::kAuntUncle},
      {T::kCousin, T::kCousin},
      {T::kStepParent, T::kStepChild},
      {T::kStepChild, T::kStepParent},
      {T::kStepSibling, T::kStepSibling},
      {T::kAdoptiveParent, T::kAdoptedChild},
      {T::kAdoptedChild, T::kAdoptiveParent},
      {T::kGodparent, T::kGodchild},
      {T::kGodchild, T::kGodparent},
      {T::kFriend, T::kFriend},
      {T::kDivorced, T::kDivorced},
  };

  for (const auto& entry : entries_) {
    primary_[Index(entry.key)] = entry.value;
  }

  overrides_[Index(T::kNephewNiece)] = T::kAuntUncle;
  overrides_[Index(T::kAuntUncle)]   = T::kNephewNiece;

  Validate();
}

const ReciprocityResolver& ReciprocityResolver::Default() {
  static const ReciprocityResolver resolver;
  return resolver;
}

void ReciprocityResolver::Validate() const {
  std::array<int, kRelationshipTypeCount> key_count_per_value{};

  for (const auto& entry : entries_) {
    if (entry.key == entry.value) {
      continue;
    }
    ++key_count_per_value[Index(entry.value)];

    // a non-symmetric pair must not collapse onto a symmetric type
    const auto& back = primary_[Index(entry.value)];
    if (back && *back == entry.value) {
      throw std::logic_error("reciprocity table: " + std::string(ToString(entry.key)) + " maps onto symmetric type " +
                             std::string(ToString(entry.value)));
    }
  }

  for (std::size_t i = 0; i < kRelationshipTypeCount; ++i) {
    if (key_count_per_value[i] > 1 && !primary_[i] && !overrides_[i]) {
      throw std::logic_error("reciprocity table: ambiguous reverse lookup for " +
                             std::string(ToString(static_cast<RelationshipType>(i))) + " needs an override");
    }
  }
}

Reciprocal ReciprocityResolver::Resolve(RelationshipType type) const {
  if (const auto& direct = primary_[Index(type)]) {
    return {*direct, true};
  }

  if (const auto& forced = overrides_[Index(type)]) {
    return {*forced, true};
  }

  for (const auto& entry : entries_) {
    if (entry.value == type) {
      return {entry.key, true};
    }
  }

  FAMGRAPH_LOG_WARN("No reciprocal defined for relationship type", {observability::StringField("type", ToString(type))});
  return {type, false};
}

bool ReciprocityResolver::IsSymmetric(RelationshipType type) const {
  const auto& direct = primary_[Index(type)];
  return direct && *direct == type;
}

} // namespace famgraph::model
