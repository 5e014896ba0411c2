#ifndef LINEAGE_TREE_ERRORS_H_
#define LINEAGE_TREE_ERRORS_H_

#include <stdexcept>

namespace lineage {

// All faults raised by a Lineage_tree derive from Lineage_tree_error.  Failures are raised at the point
// of violation and leave the tree unchanged.
class Lineage_tree_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A structural query or mutation was attempted before any topology was populated
class Uninitialized_tree_error : public Lineage_tree_error {
 public:
  Uninitialized_tree_error() : Lineage_tree_error{"Tree has not been initialized."} {}
};

// Malformed input: unknown nodes or edges, wrong vector lengths, negative lengths, illegal surgery...
class Tree_validation_error : public Lineage_tree_error {
 public:
  using Lineage_tree_error::Lineage_tree_error;
};

// A time assignment would make some node older than its parent
class Time_consistency_error : public Lineage_tree_error {
 public:
  using Lineage_tree_error::Lineage_tree_error;
};

// A node attribute was read before ever being set
class Missing_attribute_error : public Lineage_tree_error {
 public:
  using Lineage_tree_error::Lineage_tree_error;
};

}  // namespace lineage

#endif // LINEAGE_TREE_ERRORS_H_
