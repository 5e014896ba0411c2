#include "newick.h"

#include <optional>
#include <stdexcept>

#include <boost/algorithm/string/replace.hpp>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

namespace lineage {

namespace {

class Newick_lexer {
 public:
  enum class Token_kind {
    k_label,
    k_quoted_label,
    k_left_paren,
    k_comma,
    k_right_paren,
    k_colon,
    k_semicolon,
    k_invalid,
    k_eof
  };

  explicit Newick_lexer(std::string_view text) : text_{text} { next_token(); }

  auto next_token() -> Token_kind { return token_kind_ = lex_next_token(); }
  auto token_kind() const -> Token_kind { return token_kind_; }
  auto lexeme() const -> std::string_view { return lexeme_; }
  auto position() const -> std::size_t { return token_start_; }

 private:
  std::string_view text_;
  std::size_t pos_{0};
  std::size_t token_start_{0};
  Token_kind token_kind_{Token_kind::k_invalid};
  std::string_view lexeme_{};

  static auto is_delimiter(char c) -> bool {
    switch (c) {
      case ' ': case '\t': case '\r': case '\n':
      case '(': case ')': case '[': case ']': case '\'': case ':': case ';': case ',':
        return true;
      default:
        return false;
    }
  }

  auto lex_next_token() -> Token_kind {
    // Skip whitespace and comments
    while (pos_ < text_.size()) {
      auto c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        ++pos_;
      } else if (c == '[') {
        auto end = text_.find(']', pos_);
        if (end == std::string_view::npos) {
          token_start_ = pos_;
          lexeme_ = text_.substr(pos_);
          pos_ = text_.size();
          return Token_kind::k_invalid;
        }
        pos_ = end + 1;
      } else {
        break;
      }
    }

    token_start_ = pos_;
    if (pos_ == text_.size()) {
      lexeme_ = {};
      return Token_kind::k_eof;
    }

    auto single = [&](Token_kind kind) {
      lexeme_ = text_.substr(pos_, 1);
      ++pos_;
      return kind;
    };
    switch (text_[pos_]) {
      case '(': return single(Token_kind::k_left_paren);
      case ')': return single(Token_kind::k_right_paren);
      case ',': return single(Token_kind::k_comma);
      case ':': return single(Token_kind::k_colon);
      case ';': return single(Token_kind::k_semicolon);
      case ']': return single(Token_kind::k_invalid);
      case '\'': {
        // '' inside a quoted label is an escaped quote
        auto end = pos_ + 1;
        while (true) {
          end = text_.find('\'', end);
          if (end == std::string_view::npos) {
            lexeme_ = text_.substr(pos_);
            pos_ = text_.size();
            return Token_kind::k_invalid;
          }
          if (end + 1 < text_.size() && text_[end + 1] == '\'') {
            end += 2;
          } else {
            break;
          }
        }
        lexeme_ = text_.substr(pos_, end + 1 - pos_);
        pos_ = end + 1;
        return Token_kind::k_quoted_label;
      }
      default: {
        auto end = pos_;
        while (end < text_.size() && not is_delimiter(text_[end])) { ++end; }
        lexeme_ = text_.substr(pos_, end - pos_);
        pos_ = end;
        return Token_kind::k_label;
      }
    }
  }
};

auto unquote(std::string_view quoted_label) -> std::string {
  auto unquoted_label = std::string{quoted_label.substr(1, quoted_label.size() - 2)};
  boost::replace_all(unquoted_label, "''", "'");
  return unquoted_label;
}

class Newick_parser {
 public:
  explicit Newick_parser(std::string_view text) : lexer_{text} {}

  auto parse_tree() -> Raw_topology {
    if (lexer_.token_kind() == Newick_lexer::Token_kind::k_eof) {
      fail("a tree");
    }
    parse_node(k_no_node);
    maybe_match(Newick_lexer::Token_kind::k_semicolon);
    if (lexer_.token_kind() != Newick_lexer::Token_kind::k_eof) {
      fail("end of input");
    }
    return finish();
  }

 private:
  struct Parsed_node {
    std::optional<std::string> name;
    Node_index parent;
    std::optional<double> length;
  };

  Newick_lexer lexer_;
  std::vector<Parsed_node> nodes_{};

  [[noreturn]] auto fail(std::string_view expected) -> void {
    throw std::runtime_error(absl::StrFormat(
        "Newick parse error at position %d: expected %s, but got '%s' instead",
        lexer_.position(), expected, lexer_.lexeme()));
  }

  auto maybe_match(Newick_lexer::Token_kind token_kind) -> bool {
    if (lexer_.token_kind() == token_kind) {
      lexer_.next_token();
      return true;
    }
    return false;
  }

  auto parse_node(Node_index parent) -> void {
    auto node = static_cast<Node_index>(std::ssize(nodes_));
    nodes_.push_back(Parsed_node{std::nullopt, parent, std::nullopt});

    // ( '(' node (',' node)* ')' )?
    if (maybe_match(Newick_lexer::Token_kind::k_left_paren)) {
      parse_node(node);
      while (true) {
        if (maybe_match(Newick_lexer::Token_kind::k_comma)) {
          parse_node(node);
        } else if (maybe_match(Newick_lexer::Token_kind::k_right_paren)) {
          break;
        } else {
          fail("',' or ')'");
        }
      }
    }

    // label?
    if (lexer_.token_kind() == Newick_lexer::Token_kind::k_label) {
      nodes_[node].name = std::string{lexer_.lexeme()};
      lexer_.next_token();
    } else if (lexer_.token_kind() == Newick_lexer::Token_kind::k_quoted_label) {
      nodes_[node].name = unquote(lexer_.lexeme());
      lexer_.next_token();
    }

    // ( ':' length )?
    if (maybe_match(Newick_lexer::Token_kind::k_colon)) {
      auto length = 0.0;
      if (lexer_.token_kind() != Newick_lexer::Token_kind::k_label
          || not absl::SimpleAtod(lexer_.lexeme(), &length)) {
        fail("a branch length");
      }
      nodes_[node].length = length;
      lexer_.next_token();
    }
  }

  auto finish() -> Raw_topology {
    auto used = absl::flat_hash_set<std::string>{};
    for (const auto& n : nodes_) {
      if (n.name.has_value()) { used.insert(*n.name); }
    }
    auto next_unnamed = 0;
    for (auto& n : nodes_) {
      if (not n.name.has_value()) {
        auto name = std::string{};
        do {
          name = absl::StrFormat("node%d", next_unnamed++);
        } while (used.contains(name));
        used.insert(name);
        n.name = std::move(name);
      }
    }

    auto result = Raw_topology{};
    for (const auto& n : nodes_) {
      result.add_node(*n.name);
      if (n.parent != k_no_node) {
        result.add_edge(*nodes_[n.parent].name, *n.name, n.length);
      }
    }
    return result;
  }
};

auto needs_quotes(std::string_view name) -> bool {
  return name.find_first_of(" \t\r\n()[]':;") != std::string_view::npos;
}

auto newick_label(const std::string& name) -> std::string {
  if (not needs_quotes(name)) { return name; }
  return absl::StrFormat("'%s'", boost::replace_all_copy(name, "'", "''"));
}

}  // namespace

auto parse_newick(std::string_view text) -> Raw_topology {
  return Newick_parser{text}.parse_tree();
}

auto to_newick(const Lineage_tree& tree, bool record_branch_lengths) -> std::string {
  const auto& topology = tree.topology();
  for (const auto& n : topology.nodes) {
    if (n.name.find(',') != std::string::npos) {
      throw Tree_validation_error(absl::StrFormat(
          "Node name '%s' contains a ',', which cannot be written to Newick", n.name));
    }
  }

  auto result = std::string{};
  for (const auto& [node, children_so_far] : traversal(topology)) {
    const auto& n = topology.at(node);
    auto num_children = std::ssize(n.children);

    if (children_so_far == 0 && num_children > 0) {
      result += '(';
    } else if (children_so_far > 0 && children_so_far < num_children) {
      result += ',';
    }

    if (children_so_far == num_children) {
      if (num_children > 0) {
        result += ')';
      }
      result += newick_label(n.name);
      if (record_branch_lengths && node != topology.root) {
        absl::StrAppendFormat(&result, ":%.10g", n.branch_length);
      }
    }
  }
  result += ';';
  return result;
}

}  // namespace lineage
