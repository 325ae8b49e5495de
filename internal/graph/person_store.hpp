#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/person.hpp"

namespace famgraph::graph {

/*
  Arena of Person records.

  Records live in index-addressable slots; erased slots are reused. The id
  index maps a person id to its slot. Iteration follows slot order, which is
  stable between mutations.

  Not thread-safe: FamilyGraph guards every access.
*/
class PersonStore {
 public:
  const model::Person* Find(const std::string& id) const;
  model::Person*       FindMutable(const std::string& id);

  bool Contains(const std::string& id) const {
    return index_.contains(id);
  }

  // Caller guarantees the id is not present yet.
  const model::Person& Insert(model::Person person);

  bool Erase(const std::string& id);

  void Clear();

  std::size_t Size() const {
    return index_.size();
  }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& slot : arena_) {
      if (slot) fn(*slot);
    }
  }

 private:
  std::vector<std::optional<model::Person>>    arena_;
  std::vector<std::size_t>                     free_slots_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace famgraph::graph
