#include <gtest/gtest.h>
#include <algorithm>
#include "../../src/automaton/trie.h"
#include "../../src/automaton/priority.h"
#include "../../src/utils/utf8.h"
#include "../common/test_utils.h"

using namespace hotstring;
using namespace hotstring_test;

class TrieTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Inserted in this order: ids below follow from it
        rules.push_back(makeRule(0, U"aaa", "3", /*internal=*/false, /*wait=*/true));
        rules.push_back(makeRule(1, U"aa", "2", /*internal=*/true, /*wait=*/true));
        rules.push_back(makeRule(2, U"a", "1", /*internal=*/true, /*wait=*/false));
        isEndChar = [](char32_t ch) { return utils::isEndCharacter(ch); };
    }

    RuleList rules;
    EndCharPredicate isEndChar;
};

TEST_F(TrieTest, RootsExistInEmptyTrie) {
    Trie trie = Trie::build(RuleList(), false);
    EXPECT_EQ(trie.size(), 2u);
    EXPECT_TRUE(trie.node(kWordBoundaryRoot).transitions.empty());
    EXPECT_TRUE(trie.node(kInternalRoot).transitions.empty());
}

TEST_F(TrieTest, NodeIdsFollowInsertionOrder) {
    Trie trie = Trie::build(rules, false);
    ASSERT_EQ(trie.size(), 9u);

    EXPECT_EQ(trie.child(kWordBoundaryRoot, 'a'), 3u);
    EXPECT_EQ(trie.child(3, 'a'), 4u);
    EXPECT_EQ(trie.child(4, 'a'), 5u);
    EXPECT_EQ(trie.child(5, kCompletionSymbol), 6u);
    EXPECT_EQ(trie.child(kInternalRoot, 'a'), 7u);
    EXPECT_EQ(trie.child(7, 'a'), 8u);
    EXPECT_EQ(trie.child(8, kCompletionSymbol), 9u);

    // The word-boundary root is not reachable through a stored edge
    EXPECT_EQ(trie.child(kInternalRoot, kWordBoundarySymbol), kNoNode);
}

TEST_F(TrieTest, ExpansionsSitOnTerminalNodes) {
    Trie trie = Trie::build(rules, false);

    ASSERT_EQ(trie.node(6).expansions.size(), 1u);
    EXPECT_EQ(trie.node(6).expansions[0], rules[0].get());
    ASSERT_EQ(trie.node(9).expansions.size(), 1u);
    EXPECT_EQ(trie.node(9).expansions[0], rules[1].get());
    ASSERT_EQ(trie.node(7).expansions.size(), 1u);
    EXPECT_EQ(trie.node(7).expansions[0], rules[2].get());
    EXPECT_TRUE(trie.node(5).expansions.empty());
}

TEST_F(TrieTest, CaseInsensitiveBuildLowercasesAbbreviations) {
    RuleList mixed{makeRule(0, U"BtW", "by the way")};
    Trie trie = Trie::build(mixed, true);

    NodeId b = trie.child(kWordBoundaryRoot, 'b');
    ASSERT_NE(b, kNoNode);
    NodeId t = trie.child(b, 't');
    ASSERT_NE(t, kNoNode);
    EXPECT_NE(trie.child(t, 'w'), kNoNode);
    EXPECT_EQ(trie.child(kWordBoundaryRoot, 'B'), kNoNode);

    // The rule keeps its configured spelling
    EXPECT_EQ(mixed[0]->abbreviation, U"BtW");
}

TEST_F(TrieTest, SharedTerminalKeepsEveryRule) {
    RuleList same{makeRule(0, U"ab", "x"), makeRule(1, U"AB", "y")};
    Trie trie = Trie::build(same, true);

    NodeId node = trie.child(trie.child(trie.child(kWordBoundaryRoot, 'a'), 'b'), kCompletionSymbol);
    ASSERT_NE(node, kNoNode);
    EXPECT_EQ(trie.node(node).expansions.size(), 2u);
}

TEST_F(TrieTest, SuffixLinks) {
    Trie trie = Trie::build(rules, false);
    ConflictLog conflicts;
    trie.decorate(isEndChar, &conflicts);
    ASSERT_TRUE(trie.isDecorated());

    EXPECT_EQ(trie.node(kWordBoundaryRoot).suffix, kInternalRoot);
    EXPECT_EQ(trie.node(kInternalRoot).suffix, kNoNode);
    EXPECT_EQ(trie.node(3).suffix, 7u);
    EXPECT_EQ(trie.node(4).suffix, 8u);
    EXPECT_EQ(trie.node(5).suffix, 8u);
    EXPECT_EQ(trie.node(6).suffix, 9u);
    EXPECT_EQ(trie.node(7).suffix, kInternalRoot);
    EXPECT_EQ(trie.node(8).suffix, 7u);
    EXPECT_EQ(trie.node(9).suffix, kInternalRoot);
    EXPECT_TRUE(conflicts.empty());
}

TEST_F(TrieTest, ResolvedExpansions) {
    Trie trie = Trie::build(rules, false);
    trie.decorate(isEndChar, nullptr);

    const Rule* a = rules[2].get();
    EXPECT_EQ(trie.node(3).expansion, a);
    EXPECT_EQ(trie.node(4).expansion, a);
    EXPECT_EQ(trie.node(5).expansion, a);
    EXPECT_EQ(trie.node(7).expansion, a);
    EXPECT_EQ(trie.node(8).expansion, a);
    EXPECT_EQ(trie.node(9).expansion, rules[1].get());
    // Longer abbreviation beats the suffix match
    EXPECT_EQ(trie.node(6).expansion, rules[0].get());

    EXPECT_EQ(trie.node(4).nextExpansion, 7u);
    EXPECT_EQ(trie.node(6).nextExpansion, 9u);
    EXPECT_EQ(trie.node(kWordBoundaryRoot).expansion, nullptr);
}

TEST_F(TrieTest, EndCharacterLabelsFallBackToWordBoundary) {
    RuleList dashed{makeRule(0, U"-x", "dash", /*internal=*/true)};
    Trie trie = Trie::build(dashed, false);
    trie.decorate(isEndChar, nullptr);

    NodeId dash = trie.child(kInternalRoot, '-');
    ASSERT_NE(dash, kNoNode);
    EXPECT_EQ(trie.node(dash).suffix, kWordBoundaryRoot);

    NodeId x = trie.child(dash, 'x');
    EXPECT_EQ(trie.node(x).suffix, kInternalRoot);
}

TEST_F(TrieTest, DumpListsEveryNode) {
    Trie trie = Trie::build(rules, false);
    trie.decorate(isEndChar, nullptr);
    std::string dump = trie.dump();

    EXPECT_NE(dump.find("<complete>"), std::string::npos);
    EXPECT_NE(dump.find("suffix="), std::string::npos);
    EXPECT_EQ(std::count(dump.begin(), dump.end(), '\n'), 9);
}
