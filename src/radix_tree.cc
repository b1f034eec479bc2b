#include "radix_tree.h"

#include <utility>
#include <vector>

namespace bitkv {

namespace {

std::size_t CommonPrefixLength(std::string_view a, std::string_view b) {
  std::size_t n = 0;
  while (n < a.size() && n < b.size() && a[n] == b[n]) ++n;
  return n;
}

inline bool StartsWith(std::string_view word, std::string_view prefix) {
  return word.size() >= prefix.size() && word.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

RadixTree::RadixTree() : root_(std::make_unique<Node>()) {}
RadixTree::~RadixTree() = default;
RadixTree::RadixTree(RadixTree&&) noexcept = default;
RadixTree& RadixTree::operator=(RadixTree&&) noexcept = default;

void RadixTree::Insert(std::string_view word) {
  if (InsertAt(*root_, word)) ++size_;
}

bool RadixTree::InsertAt(Node& node, std::string_view word) {
  if (word.empty()) {
    const bool added = !node.terminal;
    node.terminal = true;
    return added;
  }

  auto it = node.children.find(word[0]);
  if (it == node.children.end()) {
    auto child = std::make_unique<Node>();
    child->prefix.assign(word.data(), word.size());
    child->terminal = true;
    node.children.emplace(word[0], std::move(child));
    return true;
  }

  Node& child = *it->second;
  const std::size_t common = CommonPrefixLength(child.prefix, word);
  if (common == child.prefix.size()) {
    return InsertAt(child, word.substr(common));
  }

  // Split: the shared part becomes an intermediate node above the old child.
  auto mid = std::make_unique<Node>();
  mid->prefix.assign(word.data(), common);
  auto old = std::move(it->second);
  old->prefix.erase(0, common);
  const char edge = old->prefix[0];
  mid->children.emplace(edge, std::move(old));
  Node& mid_ref = *mid;
  it->second = std::move(mid);
  return InsertAt(mid_ref, word.substr(common));
}

bool RadixTree::Find(std::string_view word) const {
  const Node* node = root_.get();
  while (!word.empty()) {
    auto it = node->children.find(word[0]);
    if (it == node->children.end()) return false;
    const Node* child = it->second.get();
    if (!StartsWith(word, child->prefix)) return false;
    word.remove_prefix(child->prefix.size());
    node = child;
  }
  return node->terminal;
}

bool RadixTree::Delete(std::string_view word) {
  if (!DeleteAt(*root_, word, /*is_root=*/true)) return false;
  --size_;
  return true;
}

bool RadixTree::DeleteAt(Node& node, std::string_view word, bool is_root) {
  if (word.empty()) {
    // Only reached for the empty word, which lives on the root.
    if (!node.terminal) return false;
    node.terminal = false;
    return true;
  }

  auto it = node.children.find(word[0]);
  if (it == node.children.end()) return false;
  Node& child = *it->second;
  if (!StartsWith(word, child.prefix)) return false;
  const auto rest = word.substr(child.prefix.size());
  if (!rest.empty()) return DeleteAt(child, rest, /*is_root=*/false);
  if (!child.terminal) return false;

  if (child.children.empty()) {
    node.children.erase(it);
    if (!is_root && !node.terminal && node.children.size() == 1) MergeOnlyChild(node);
  } else if (child.children.size() == 1) {
    MergeOnlyChild(child);
  } else {
    child.terminal = false;
  }
  return true;
}

void RadixTree::MergeOnlyChild(Node& node) {
  auto only = std::move(node.children.begin()->second);
  node.prefix += only->prefix;
  node.terminal = only->terminal;
  node.children = std::move(only->children);
}

RadixTree::MatchResult RadixTree::Match(std::string_view word) const {
  const auto& prefix = root_->prefix;
  const std::size_t common = CommonPrefixLength(prefix, word);
  MatchResult result;
  result.common = prefix.substr(0, common);
  result.remaining_prefix = prefix.substr(common);
  result.remaining_word.assign(word.substr(common));
  return result;
}

void RadixTree::ForEach(const std::function<void(const std::string&)>& fn) const {
  std::vector<std::pair<const Node*, std::string>> stack;
  stack.emplace_back(root_.get(), root_->prefix);
  while (!stack.empty()) {
    auto [node, path] = std::move(stack.back());
    stack.pop_back();
    if (node->terminal) fn(path);
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      stack.emplace_back(it->second.get(), path + it->second->prefix);
    }
  }
}

void RadixTree::Walk(const std::function<void(std::string_view, bool, std::size_t, std::size_t)>& fn) const {
  std::vector<std::pair<const Node*, std::size_t>> stack;
  stack.emplace_back(root_.get(), 0);
  while (!stack.empty()) {
    auto [node, depth] = stack.back();
    stack.pop_back();
    fn(node->prefix, node->terminal, node->children.size(), depth);
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      stack.emplace_back(it->second.get(), depth + 1);
    }
  }
}

void RadixTree::Clear() {
  root_ = std::make_unique<Node>();
  size_ = 0;
}

}  // namespace bitkv
