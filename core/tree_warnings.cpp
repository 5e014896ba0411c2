#include "tree_warnings.h"

#include <iostream>
#include <string>

#include "absl/strings/str_format.h"

#include "estd.h"

namespace lineage {

auto default_tree_warning_hook(const Tree_warning& warning) -> void {
  auto msg = std::string{
    std::visit(estd::overloaded{
      [](const Tree_warnings::Dissimilarity_samples_mismatch& w) -> std::string {
        return absl::StrFormat(
            "the samples in the character matrix (%d) and the specified dissimilarity map (%d) do not agree",
            w.num_matrix_samples, w.num_map_samples);
      },
      [](const Tree_warnings::Ambiguous_character_matrix& w) -> std::string {
        return absl::StrFormat(
            "character matrix contains ambiguous characters (%d samples)", w.num_ambiguous_samples);
      }
    }, warning)
  };
  std::cerr << absl::StreamFormat("WARNING (lineage tree): %s\n", msg);
}

}  // namespace lineage
