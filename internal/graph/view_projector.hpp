#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/graph/family_graph.hpp"

namespace famgraph::graph {

struct ViewNode {
  std::string                id;
  std::string                label;
  std::string                full_name;
  std::optional<std::string> gender;
  std::optional<std::string> birth_date;
  std::optional<std::string> death_date;
  std::optional<std::string> place_of_birth;
  std::optional<std::string> place_of_death;
};

struct ViewLink {
  std::string id; // first relationship record behind the link
  std::string source;
  std::string target;
  std::string type;
};

struct GraphView {
  std::vector<ViewNode> nodes;
  std::vector<ViewLink> links;
};

inline constexpr std::string_view kParentChildLink = "parent_child";

/*
  Node/link projection for visualization clients.

  parent and child records collapse into one parent_child link pointing from
  parent to child. Symmetric types yield one link per unordered pair, with the
  smaller id as source. Everything else is emitted as stored, once per
  (source, target, type).
*/
class ViewProjector {
 public:
  ViewProjector(const FamilyGraph& graph, int default_depth);

  // Whole graph without a start id; otherwise the start person and everyone
  // Related to it within max_depth (default_depth when unset).
  GraphView Project(const std::optional<std::string>& start_id, std::optional<int> max_depth) const;

 private:
  const FamilyGraph& graph_;
  int                default_depth_;
};

} // namespace famgraph::graph
