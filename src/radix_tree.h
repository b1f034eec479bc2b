#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace bitkv {

// Space-optimized trie over strings. Every non-root node holds a non-empty
// prefix; a non-terminal node other than the root never has exactly one child.
class RadixTree {
 public:
  // Result of comparing a word with the root prefix.
  struct MatchResult {
    std::string common;
    std::string remaining_prefix;
    std::string remaining_word;
  };

  RadixTree();
  ~RadixTree();
  RadixTree(RadixTree&&) noexcept;
  RadixTree& operator=(RadixTree&&) noexcept;

  void Insert(std::string_view word);
  [[nodiscard]] bool Find(std::string_view word) const;
  // Returns false when the word was not stored.
  bool Delete(std::string_view word);
  [[nodiscard]] MatchResult Match(std::string_view word) const;

  // Visits every stored word; order follows the first character of each edge.
  void ForEach(const std::function<void(const std::string&)>& fn) const;
  // Visits every node, root first (depth 0, empty prefix).
  void Walk(const std::function<void(std::string_view prefix, bool terminal, std::size_t children,
                                     std::size_t depth)>& fn) const;
  [[nodiscard]] std::size_t Size() const { return size_; }
  [[nodiscard]] bool Empty() const { return size_ == 0; }
  void Clear();

 private:
  struct Node {
    std::string prefix;
    bool terminal{false};
    std::map<char, std::unique_ptr<Node>> children;
  };

  static bool InsertAt(Node& node, std::string_view word);
  static bool DeleteAt(Node& node, std::string_view word, bool is_root);
  static void MergeOnlyChild(Node& node);

  std::unique_ptr<Node> root_;
  std::size_t size_{0};
};

}  // namespace bitkv
