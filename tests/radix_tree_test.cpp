#include <cassert>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "radix_tree.h"

namespace {

// Every non-root node has a prefix, and a non-terminal one branches.
bool CheckStructure(const bitkv::RadixTree& tree, const std::string& ctx) {
  bool ok = true;
  tree.Walk([&](std::string_view prefix, bool terminal, std::size_t children, std::size_t depth) {
    if (depth == 0) {
      if (!prefix.empty()) {
        std::cerr << ctx << ": root prefix not empty\n";
        ok = false;
      }
      return;
    }
    if (prefix.empty()) {
      std::cerr << ctx << ": empty prefix at depth " << depth << "\n";
      ok = false;
    }
    if (!terminal && children < 2) {
      std::cerr << ctx << ": non-terminal node '" << prefix << "' has " << children << " child(ren)\n";
      ok = false;
    }
  });
  return ok;
}

std::set<std::string> Contents(const bitkv::RadixTree& tree) {
  std::set<std::string> out;
  tree.ForEach([&](const std::string& w) { out.insert(w); });
  return out;
}

bool TestInsertAndFind() {
  bitkv::RadixTree tree;
  tree.Insert("myprefix");
  tree.Insert("myprefixA");
  tree.Insert("myprefixAA");
  tree.Insert("mystring");
  assert(tree.Find("myprefix"));
  assert(tree.Find("myprefixA"));
  assert(tree.Find("myprefixAA"));
  assert(tree.Find("mystring"));
  assert(!tree.Find("my"));
  assert(!tree.Find("myprefixAAA"));
  assert(!tree.Find("mys"));
  assert(!tree.Find("x"));
  assert(tree.Size() == 4);

  tree.Insert("mystring");
  assert(tree.Size() == 4);
  return CheckStructure(tree, "insert");
}

bool TestSplitMarksIntermediateTerminal() {
  bitkv::RadixTree tree;
  tree.Insert("1:10:5");
  tree.Insert("1:1");  // split inside the existing edge, leftover empty
  assert(tree.Find("1:1"));
  assert(tree.Find("1:10:5"));
  assert(!tree.Find("1:"));

  std::size_t nodes = 0;
  tree.Walk([&](std::string_view, bool, std::size_t, std::size_t) { ++nodes; });
  assert(nodes == 3);  // root, "1:1", "0:5"
  return CheckStructure(tree, "split");
}

bool TestDeleteMergesChains() {
  bitkv::RadixTree tree;
  tree.Insert("test");
  tree.Insert("tester");
  tree.Insert("team");

  // "te" branches into "st" and "am"; removing "team" must fold "te" + "st".
  assert(tree.Delete("team"));
  assert(!tree.Find("team"));
  assert(tree.Find("test"));
  assert(tree.Find("tester"));
  if (!CheckStructure(tree, "delete leaf")) return false;

  // Terminal node with one child absorbs it.
  assert(tree.Delete("test"));
  assert(!tree.Find("test"));
  assert(tree.Find("tester"));
  if (!CheckStructure(tree, "delete with one child")) return false;

  assert(!tree.Delete("test"));
  assert(!tree.Delete("tes"));
  assert(!tree.Delete("testers"));
  assert(tree.Size() == 1);
  return true;
}

bool TestDeleteBranchingNodeKeepsChildren() {
  bitkv::RadixTree tree;
  tree.Insert("ab");
  tree.Insert("abc");
  tree.Insert("abd");
  assert(tree.Delete("ab"));
  assert(!tree.Find("ab"));
  assert(tree.Find("abc"));
  assert(tree.Find("abd"));
  return CheckStructure(tree, "branching delete");
}

bool TestRootNeverMerges() {
  bitkv::RadixTree tree;
  tree.Insert("a");
  tree.Insert("b");
  assert(tree.Delete("b"));
  assert(tree.Find("a"));
  assert(tree.Match("a").remaining_word == "a");
  return CheckStructure(tree, "root");
}

bool TestEmptyWord() {
  bitkv::RadixTree tree;
  assert(!tree.Find(""));
  assert(!tree.Delete(""));
  tree.Insert("");
  assert(tree.Find(""));
  assert(tree.Size() == 1);
  tree.Insert("x");
  assert(tree.Delete(""));
  assert(!tree.Find(""));
  assert(tree.Find("x"));
  return true;
}

bool TestMatchAtRoot() {
  bitkv::RadixTree tree;
  tree.Insert("1:0:5");
  auto m = tree.Match("1:0:5");
  assert(m.common.empty());
  assert(m.remaining_prefix.empty());
  assert(m.remaining_word == "1:0:5");
  return true;
}

bool TestRandomAgainstSet() {
  std::mt19937_64 rng(20240611);
  std::uniform_int_distribution<int> len_dist(0, 7);
  std::uniform_int_distribution<int> ch_dist(0, 3);  // tiny alphabet for heavy sharing
  std::uniform_int_distribution<int> op_dist(0, 2);

  bitkv::RadixTree tree;
  std::set<std::string> model;
  for (int i = 0; i < 20000; ++i) {
    std::string w;
    const int len = len_dist(rng);
    for (int j = 0; j < len; ++j) w.push_back(static_cast<char>('a' + ch_dist(rng)));

    if (op_dist(rng) == 0) {
      const bool removed = tree.Delete(w);
      if (removed != (model.erase(w) == 1)) {
        std::cerr << "delete mismatch for '" << w << "'\n";
        return false;
      }
    } else {
      tree.Insert(w);
      model.insert(w);
    }

    if (i % 1000 == 999) {
      if (!CheckStructure(tree, "random step " + std::to_string(i))) return false;
      if (Contents(tree) != model) {
        std::cerr << "contents diverged at step " << i << "\n";
        return false;
      }
    }
  }
  for (const auto& w : model) assert(tree.Find(w));
  assert(tree.Size() == model.size());
  return CheckStructure(tree, "random final");
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestInsertAndFind();
  ok &= TestSplitMarksIntermediateTerminal();
  ok &= TestDeleteMergesChains();
  ok &= TestDeleteBranchingNodeKeepsChildren();
  ok &= TestRootNeverMerges();
  ok &= TestEmptyWord();
  ok &= TestMatchAtRoot();
  ok &= TestRandomAgainstSet();
  if (!ok) {
    std::cerr << "Tests failed\n";
    return 1;
  }
  std::cout << "All tests passed\n";
  return 0;
}
