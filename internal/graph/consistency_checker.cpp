#include "internal/graph/consistency_checker.hpp"

#include <algorithm>
#include <queue>
#include <set>
#include <unordered_map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/date.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace famgraph::graph {

using model::Person;
using model::Relationship;
using model::RelationshipType;
using observability::IntField;
using observability::StringField;

namespace {

std::string Describe(const Relationship& rel) {
  return rel.person1_id + " is " + std::string(model::ToString(rel.type)) + " of " + rel.person2_id;
}

// Ids of the parent edges forming a path from person_id back to itself,
// empty when there is none.
std::vector<std::string> FindAncestorCycle(const RelationshipStore& relationships, const std::string& person_id,
                                           const TraversalLimits& limits) {
  std::queue<std::string>                                             q;
  std::unordered_map<std::string, std::pair<std::string, std::string>> pred; // node -> (child node, edge id)

  q.push(person_id);
  pred.emplace(person_id, std::make_pair(std::string(), std::string()));

  while (!q.empty()) {
    const std::string node = q.front();
    q.pop();

    std::vector<std::string> cycle;
    relationships.ForEachEdgeOf(node, [&](const Relationship& rel) {
      if (!cycle.empty()) return;
      if (rel.type != RelationshipType::kParent || rel.person2_id != node) return;

      if (rel.person1_id == person_id) {
        cycle.push_back(rel.id);
        for (auto at = node; at != person_id; at = pred.at(at).first) {
          cycle.push_back(pred.at(at).second);
        }
        std::reverse(cycle.begin(), cycle.end());
        return;
      }
      if (pred.emplace(rel.person1_id, std::make_pair(node, rel.id)).second) {
        if (pred.size() > limits.max_visited) {
          throw util::ResourceExhausted("cycle check visited more than " + std::to_string(limits.max_visited) + " persons");
        }
        q.push(rel.person1_id);
      }
    });
    if (!cycle.empty()) return cycle;
  }
  return {};
}

void FillIfAbsent(std::optional<std::string>& target, const std::optional<std::string>& source) {
  if (!target && source) target = source;
}

} // namespace

std::string_view ToString(IssueKind kind) {
  switch (kind) {
    case IssueKind::kSelfRelationship:
      return "self_relationship";
    case IssueKind::kRedundantReciprocal:
      return "redundant_reciprocal";
    case IssueKind::kContradictoryEdges:
      return "contradictory_edges";
    case IssueKind::kAncestorCycle:
    default:
      return "ancestor_cycle";
  }
}

ConsistencyChecker::ConsistencyChecker(FamilyGraph& graph) : graph_(graph) {
}

std::vector<Issue> ConsistencyChecker::Check(const std::string& person_id) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore& relationships) {
    if (!people.Contains(person_id)) throw util::NotFound("person not found: " + person_id);

    std::vector<Issue>                              issues;
    std::set<std::pair<std::string, std::string>>   reported;
    const auto&                                     resolver = model::ReciprocityResolver::Default();

    auto report_pair = [&](IssueKind kind, const Relationship& a, const std::string& b_id, std::string message) {
      auto key = std::minmax(a.id, b_id);
      if (!reported.emplace(key.first, key.second).second) return;
      issues.push_back(Issue{kind, person_id, {a.id, b_id}, std::move(message)});
    };

    relationships.ForEachEdgeOf(person_id, [&](const Relationship& rel) {
      if (rel.person1_id == rel.person2_id) {
        issues.push_back(Issue{IssueKind::kSelfRelationship, person_id, {rel.id}, "relationship links a person to themselves: " + Describe(rel)});
        return;
      }

      const auto reciprocal = resolver.Resolve(rel.type);
      if (!reciprocal.defined || reciprocal.type == rel.type) return;

      if (auto mirror = relationships.FindEdge(rel.person2_id, rel.person1_id, reciprocal.type)) {
        const auto* other = relationships.Find(*mirror);
        report_pair(IssueKind::kRedundantReciprocal, rel, *mirror, "redundant reciprocal edges: " + Describe(rel) + " and " + Describe(*other));
      }
      if (auto clash = relationships.FindEdge(rel.person1_id, rel.person2_id, reciprocal.type)) {
        const auto* other = relationships.Find(*clash);
        report_pair(IssueKind::kContradictoryEdges, rel, *clash, "contradictory edges: " + Describe(rel) + " and " + Describe(*other));
      }
    });

    auto cycle = FindAncestorCycle(relationships, person_id, graph_.Limits());
    if (!cycle.empty()) {
      issues.push_back(Issue{IssueKind::kAncestorCycle, person_id, std::move(cycle), "person is their own ancestor through parent edges"});
    }
    return issues;
  });
}

std::vector<DuplicateCandidate> ConsistencyChecker::FindDuplicates(const DuplicatePolicy& policy) const {
  return graph_.Read([&](const PersonStore& people, const RelationshipStore&) {
    std::vector<std::string>                                         keys;
    std::unordered_map<std::string, std::vector<const Person*>>      groups;

    people.ForEach([&](const Person& p) {
      auto key  = util::NormalizeName(p.first_name + " " + p.last_name);
      auto& members = groups[key];
      if (members.empty()) keys.push_back(key);
      members.push_back(&p);
    });

    std::vector<DuplicateCandidate> candidates;
    for (const auto& key : keys) {
      const auto& members = groups[key];
      for (std::size_t i = 0; i < members.size(); ++i) {
        for (std::size_t j = i + 1; j < members.size(); ++j) {
          const auto& a = *members[i];
          const auto& b = *members[j];

          const bool both_dated = a.birth_date && b.birth_date;
          if (policy.compare_birth_date && both_dated && *a.birth_date != *b.birth_date) continue;

          candidates.push_back(DuplicateCandidate{a.id, b.id, policy.compare_birth_date && both_dated});
        }
      }
    }
    return candidates;
  });
}

MergeResult ConsistencyChecker::Merge(const std::string& keep_id, const std::string& remove_id) {
  if (keep_id == remove_id) throw util::ValidationError("cannot merge a person into themselves: " + keep_id);

  auto result = graph_.Write([&](PersonStore& people, RelationshipStore& relationships) {
    auto*       keep   = people.FindMutable(keep_id);
    const auto* remove = people.Find(remove_id);
    if (!keep) throw util::NotFound("person not found: " + keep_id);
    if (!remove) throw util::NotFound("person not found: " + remove_id);

    Person merged = *keep;
    if (merged.last_name.empty()) merged.last_name = remove->last_name;
    FillIfAbsent(merged.nickname, remove->nickname);
    FillIfAbsent(merged.birth_date, remove->birth_date);
    FillIfAbsent(merged.death_date, remove->death_date);
    FillIfAbsent(merged.place_of_birth, remove->place_of_birth);
    FillIfAbsent(merged.place_of_death, remove->place_of_death);
    FillIfAbsent(merged.notes, remove->notes);
    if (!merged.gender) merged.gender = remove->gender;
    merged.attributes.insert(remove->attributes.begin(), remove->attributes.end());

    if (merged.birth_date && merged.death_date && *util::ParseIsoDate(*merged.death_date) < *util::ParseIsoDate(*merged.birth_date)) {
      throw util::ValidationError("merged record would have death_date before birth_date");
    }

    MergeResult out;
    for (const auto& edge_id : relationships.EdgeIdsOf(remove_id)) {
      Relationship rel = *relationships.Find(edge_id);
      if (rel.person1_id == remove_id) rel.person1_id = keep_id;
      if (rel.person2_id == remove_id) rel.person2_id = keep_id;

      const auto existing = relationships.FindEdge(rel.person1_id, rel.person2_id, rel.type);
      if (rel.person1_id == rel.person2_id || (existing && *existing != rel.id)) {
        relationships.Erase(edge_id);
        ++out.relationships_dropped;
        continue;
      }
      relationships.Replace(std::move(rel));
      ++out.relationships_rewritten;
    }

    *keep = std::move(merged);
    out.person = *keep;
    people.Erase(remove_id);
    return out;
  });

  FAMGRAPH_LOG_INFO("Merged persons", {StringField("keep_id", keep_id), StringField("remove_id", remove_id),
                                       IntField("rewritten", static_cast<std::int64_t>(result.relationships_rewritten)),
                                       IntField("dropped", static_cast<std::int64_t>(result.relationships_dropped))});
  return result;
}

} // namespace famgraph::graph
