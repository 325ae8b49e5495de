#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace famgraph::model {

/*
  Closed relationship vocabulary.

  A Relationship(person1, person2, type) reads "person1 is the <type> of person2".
  Symmetric types (spouse, sibling, cousin, ...) are direction-irrelevant.
*/
enum class RelationshipType : std::uint8_t {
  kParent = 0,
  kChild,
  kSpouse,
  kPartner,
  kSibling,
  kHalfSibling,
  kGrandparent,
  kGrandchild,
  kAunt,
  kUncle,
  kAuntUncle,
  kNephew,
  kNiece,
  kNephewNiece,
  kCousin,
  kStepParent,
  kStepChild,
  kStepSibling,
  kAdoptiveParent,
  kAdoptedChild,
  kGodparent,
  kGodchild,
  kFriend,
  kDivorced,
  kOther,
};

inline constexpr std::size_t kRelationshipTypeCount = static_cast<std::size_t>(RelationshipType::kOther) + 1;

constexpr std::string_view ToString(RelationshipType type) {
  switch (type) {
    case RelationshipType::kParent:
      return "parent";
    case RelationshipType::kChild:
      return "child";
    case RelationshipType::kSpouse:
      return "spouse";
    case RelationshipType::kPartner:
      return "partner";
    case RelationshipType::kSibling:
      return "sibling";
    case RelationshipType::kHalfSibling:
      return "half_sibling";
    case RelationshipType::kGrandparent:
      return "grandparent";
    case RelationshipType::kGrandchild:
      return "grandchild";
    case RelationshipType::kAunt:
      return "aunt";
    case RelationshipType::kUncle:
      return "uncle";
    case RelationshipType::kAuntUncle:
      return "aunt_uncle";
    case RelationshipType::kNephew:
      return "nephew";
    case RelationshipType::kNiece:
      return "niece";
    case RelationshipType::kNephewNiece:
      return "nephew_niece";
    case RelationshipType::kCousin:
      return "cousin";
    case RelationshipType::kStepParent:
      return "step_parent";
    case RelationshipType::kStepChild:
      return "step_child";
    case RelationshipType::kStepSibling:
      return "step_sibling";
    case RelationshipType::kAdoptiveParent:
      return "adoptive_parent";
    case RelationshipType::kAdoptedChild:
      return "adopted_child";
    case RelationshipType::kGodparent:
      return "godparent";
    case RelationshipType::kGodchild:
      return "godchild";
    case RelationshipType::kFriend:
      return "friend";
    case RelationshipType::kDivorced:
      return "divorced";
    case RelationshipType::kOther:
    default:
      return "other";
  }
}

// Case-insensitive; ' ', '-' and '/' are accepted in place of '_'.
std::optional<RelationshipType> ParseRelationshipType(std::string_view text);

struct Reciprocal {
  RelationshipType type;
  // false when the vocabulary defines no inverse and `type` was returned unchanged
  bool defined = true;
};

/*
  Maps a relationship type to its semantic inverse.

  Lookup order:
    1. primary table
    2. override table (values that several keys map to)
    3. reverse scan of the primary table, first key in declaration order
    4. fallback: the type itself, flagged as undefined

  The tables are validated on construction; an inconsistent table is a
  programming error and throws std::logic_error.
*/
class ReciprocityResolver {
 public:
  ReciprocityResolver();

  static const ReciprocityResolver& Default();

  Reciprocal Resolve(RelationshipType type) const;

  bool IsSymmetric(RelationshipType type) const;

 private:
  struct Entry {
    RelationshipType key;
    RelationshipType value;
  };

  void Validate() const;

  std::array<std::optional<RelationshipType>, kRelationshipTypeCount> primary_{};
  std::array<std::optional<RelationshipType>, kRelationshipTypeCount> overrides_{};
  std::vector<Entry>                                                  entries_;
};

inline Reciprocal ReciprocalOf(RelationshipType type) {
  return ReciprocityResolver::Default().Resolve(type);
}

inline bool IsSymmetric(RelationshipType type) {
  return ReciprocityResolver::Default().IsSymmetric(type);
}

} // namespace famgraph::model
