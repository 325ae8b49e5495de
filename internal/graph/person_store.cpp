#include "internal/graph/person_store.hpp"

namespace famgraph::graph {

const model::Person* PersonStore::Find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &*arena_[it->second];
}

model::Person* PersonStore::FindMutable(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &*arena_[it->second];
}

const model::Person& PersonStore::Insert(model::Person person) {
  std::size_t slot;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
  } else {
    slot = arena_.size();
    arena_.emplace_back();
  }

  index_[person.id] = slot;
  arena_[slot]      = std::move(person);
  return *arena_[slot];
}

bool PersonStore::Erase(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;

  arena_[it->second].reset();
  free_slots_.push_back(it->second);
  index_.erase(it);
  return true;
}

void PersonStore::Clear() {
  arena_.clear();
  free_slots_.clear();
  index_.clear();
}

} // namespace famgraph::graph
