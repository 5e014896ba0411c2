#ifndef LINEAGE_ANCESTRAL_RECONSTRUCTION_H_
#define LINEAGE_ANCESTRAL_RECONSTRUCTION_H_

#include <span>

#include "character_state.h"

namespace lineage {

// Camin-Sokal (irreversible) parsimony
// ====================================
//
// Under irreversible parsimony, a character that has mutated can never revert to its unmutated
// state.  Hence, when the children of a node disagree at a character, no single ancestral state
// explains them all parsimoniously, and the ancestor is left unresolved (missing) rather than
// assigned a majority state.
//
// For each character position:
// - if every child holds the same non-missing state, the ancestor inherits it;
// - otherwise (disagreement, or some child missing there), the ancestor is Missing_state.
//
// Example (missing shown as -1):
//
//    [1, -1, 2]  and  [1, 3, 2]  ==>  [1, -1, 2]
//
// All state vectors must have the same length, and there must be at least one.
auto lca_characters(std::span<const State_vector> children_states) -> State_vector;

}  // namespace lineage

#endif // LINEAGE_ANCESTRAL_RECONSTRUCTION_H_
