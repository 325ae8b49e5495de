#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/relationship_type.hpp"

namespace {

using famgraph::model::ParseRelationshipType;
using famgraph::model::ReciprocalOf;
using famgraph::model::RelationshipType;

void TestParseAcceptsSpellingVariants() {
  assert(ParseRelationshipType("parent") == RelationshipType::kParent);
  assert(ParseRelationshipType("  Parent ") == RelationshipType::kParent);
  assert(ParseRelationshipType("STEP-PARENT") == RelationshipType::kStepParent);
  assert(ParseRelationshipType("adopted child") == RelationshipType::kAdoptedChild);
  assert(ParseRelationshipType("aunt/uncle") == RelationshipType::kAuntUncle);
  assert(ParseRelationshipType("half_sibling") == RelationshipType::kHalfSibling);

  assert(!ParseRelationshipType(""));
  assert(!ParseRelationshipType("parents"));
  assert(!ParseRelationshipType("arch-enemy"));
}

void TestEveryTypeRoundTripsThroughItsWireName() {
  for (std::size_t i = 0; i < famgraph::model::kRelationshipTypeCount; ++i) {
    const auto type = static_cast<RelationshipType>(i);
    assert(ParseRelationshipType(ToString(type)) == type);
  }
}

void TestReciprocalOfSymmetricTypesIsInvolution() {
  for (auto type : {RelationshipType::kSpouse, RelationshipType::kSibling, RelationshipType::kCousin, RelationshipType::kPartner,
                    RelationshipType::kFriend, RelationshipType::kDivorced, RelationshipType::kStepSibling, RelationshipType::kHalfSibling}) {
    assert(famgraph::model::IsSymmetric(type));
    const auto once = ReciprocalOf(type);
    assert(once.defined && once.type == type);
    assert(ReciprocalOf(once.type).type == type);
  }
}

void TestAsymmetricPairs() {
  assert(ReciprocalOf(RelationshipType::kParent).type == RelationshipType::kChild);
  assert(ReciprocalOf(RelationshipType::kChild).type == RelationshipType::kParent);
  assert(ReciprocalOf(RelationshipType::kGrandparent).type == RelationshipType::kGrandchild);
  assert(ReciprocalOf(RelationshipType::kAdoptiveParent).type == RelationshipType::kAdoptedChild);
  assert(!famgraph::model::IsSymmetric(RelationshipType::kParent));
}

void TestManyToOneValuesUseOverrides() {
  assert(ReciprocalOf(RelationshipType::kAunt).type == RelationshipType::kNephewNiece);
  assert(ReciprocalOf(RelationshipType::kUncle).type == RelationshipType::kNephewNiece);
  assert(ReciprocalOf(RelationshipType::kNiece).type == RelationshipType::kAuntUncle);

  // several keys map here; the override decides instead of declaration order
  const auto back = ReciprocalOf(RelationshipType::kNephewNiece);
  assert(back.defined && back.type == RelationshipType::kAuntUncle);
  assert(ReciprocalOf(RelationshipType::kAuntUncle).type == RelationshipType::kNephewNiece);
}

void TestOtherHasNoReciprocal() {
  const auto r = ReciprocalOf(RelationshipType::kOther);
  assert(!r.defined);
  assert(r.type == RelationshipType::kOther);
  assert(!famgraph::model::IsSymmetric(RelationshipType::kOther));
}

} // namespace

int main() {
  TestParseAcceptsSpellingVariants();
  TestEveryTypeRoundTripsThroughItsWireName();
  TestReciprocalOfSymmetricTypesIsInvolution();
  TestAsymmetricPairs();
  TestManyToOneValuesUseOverrides();
  TestOtherHasNoReciprocal();

  std::cout << "famgraph_unit_relationship_type: pass\n";
  return 0;
}
