#include "internal/graph/relationship_store.hpp"

#include <algorithm>

namespace famgraph::graph {

std::string RelationshipStore::EdgeKey(const std::string& person1_id, const std::string& person2_id, model::RelationshipType type) {
  std::string key;
  key.reserve(person1_id.size() + person2_id.size() + 4);
  key.append(person1_id).push_back('\x1f');
  key.append(person2_id).push_back('\x1f');
  key.append(std::to_string(static_cast<int>(type)));
  return key;
}

const model::Relationship* RelationshipStore::Find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &*arena_[it->second];
}

std::optional<std::string> RelationshipStore::FindEdge(const std::string& person1_id, const std::string& person2_id,
                                                       model::RelationshipType type) const {
  auto it = edge_keys_.find(EdgeKey(person1_id, person2_id, type));
  if (it == edge_keys_.end()) return std::nullopt;
  return it->second;
}

void RelationshipStore::Link(std::size_t slot) {
  const auto& rel = *arena_[slot];
  index_[rel.id] = slot;
  edge_keys_[EdgeKey(rel.person1_id, rel.person2_id, rel.type)] = rel.id;
  adjacency_[rel.person1_id].push_back(slot);
  adjacency_[rel.person2_id].push_back(slot);
}

void RelationshipStore::Unlink(std::size_t slot) {
  const auto& rel = *arena_[slot];
  index_.erase(rel.id);
  edge_keys_.erase(EdgeKey(rel.person1_id, rel.person2_id, rel.type));

  for (const auto* person_id : {&rel.person1_id, &rel.person2_id}) {
    auto it = adjacency_.find(*person_id);
    if (it == adjacency_.end()) continue;
    auto& slots = it->second;
    slots.erase(std::remove(slots.begin(), slots.end(), slot), slots.end());
    if (slots.empty()) adjacency_.erase(it);
  }
}

const model::Relationship& RelationshipStore::Insert(model::Relationship relationship) {
  std::size_t slot;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
  } else {
    slot = arena_.size();
    arena_.emplace_back();
  }

  arena_[slot] = std::move(relationship);
  Link(slot);
  return *arena_[slot];
}

const model::Relationship& RelationshipStore::Replace(model::Relationship relationship) {
  const auto slot = index_.at(relationship.id);
  Unlink(slot);
  arena_[slot] = std::move(relationship);
  Link(slot);
  return *arena_[slot];
}

bool RelationshipStore::Erase(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;

  const auto slot = it->second;
  Unlink(slot);
  arena_[slot].reset();
  free_slots_.push_back(slot);
  return true;
}

void RelationshipStore::Clear() {
  arena_.clear();
  free_slots_.clear();
  index_.clear();
  adjacency_.clear();
  edge_keys_.clear();
}

std::vector<std::string> RelationshipStore::EdgeIdsOf(const std::string& person_id) const {
  std::vector<std::string> ids;
  ForEachEdgeOf(person_id, [&](const model::Relationship& rel) { ids.push_back(rel.id); });
  return ids;
}

} // namespace famgraph::graph
