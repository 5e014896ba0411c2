#ifndef LINEAGE_NEWICK_H_
#define LINEAGE_NEWICK_H_

#include <string>
#include <string_view>

#include "lineage_tree.h"
#include "raw_topology.h"

namespace lineage {

// Newick (bracket notation) support
// =================================
//
// Grammar accepted by `parse_newick` (whitespace and `[...]` comments are skipped anywhere):
//
//   tree  : node ';'?
//   node  : ( '(' node (',' node)* ')' )? label? ( ':' length )?
//   label : UNQUOTED_LABEL | QUOTED_LABEL      (quotes inside a quoted label are doubled: 'it''s')
//
// Unnamed nodes are called "node0", "node1", ..., in pre-order, skipping any names already in use.
// Nodes are listed in pre-order in the result.  Absent lengths stay absent (populate_tree treats them as 1).
// Throws std::runtime_error on malformed input.
auto parse_newick(std::string_view text) -> Raw_topology;

// Writes every node's name; labels with Newick-special characters are quoted.  Branch lengths are written
// for all non-root nodes iff `record_branch_lengths`.  Throws Tree_validation_error if any node name
// contains a ',' (which many downstream readers mishandle even when quoted).
auto to_newick(const Lineage_tree& tree, bool record_branch_lengths = false) -> std::string;

}  // namespace lineage

#endif // LINEAGE_NEWICK_H_
