#ifndef LINEAGE_RAW_TOPOLOGY_H_
#define LINEAGE_RAW_TOPOLOGY_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"

namespace lineage {

// A parsed but unvalidated tree: a node list plus directed parent -> child edges, as produced by
// upstream converters (e.g., parse_newick) and consumed by Lineage_tree::populate_tree.
// Nodes mentioned only in edges need not be listed in `nodes`; nodes listed first keep that order.
// Identifiers of any type are forced to their string form on the way in.
struct Raw_edge {
  std::string parent;
  std::string child;
  std::optional<double> length;  // Absent lengths are taken to be 1

  auto operator==(const Raw_edge& that) const -> bool = default;
};

struct Raw_topology {
  std::vector<std::string> nodes;
  std::vector<Raw_edge> edges;

  template<typename Id>
  auto add_node(const Id& id) -> void {
    nodes.push_back(absl::StrCat(id));
  }

  template<typename Parent_id, typename Child_id>
  auto add_edge(const Parent_id& parent, const Child_id& child, std::optional<double> length = std::nullopt) -> void {
    edges.push_back(Raw_edge{absl::StrCat(parent), absl::StrCat(child), length});
  }

  auto operator==(const Raw_topology& that) const -> bool = default;
};

}  // namespace lineage

#endif // LINEAGE_RAW_TOPOLOGY_H_
