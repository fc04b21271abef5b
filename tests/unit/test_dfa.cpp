#include <gtest/gtest.h>
#include <algorithm>
#include "../../src/automaton/dfa.h"
#include "../../src/automaton/priority.h"
#include "../../src/utils/utf8.h"
#include "../common/test_utils.h"

using namespace hotstring;
using namespace hotstring_test;

class DfaTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules.push_back(makeRule(0, U"aaa", "3", /*internal=*/false, /*wait=*/true));
        rules.push_back(makeRule(1, U"aa", "2", /*internal=*/true, /*wait=*/true));
        rules.push_back(makeRule(2, U"a", "1", /*internal=*/true, /*wait=*/false));
        isEndChar = [](char32_t ch) { return utils::isEndCharacter(ch); };
    }

    Dfa compile() {
        Trie trie = Trie::build(rules, false);
        return DfaFactory::create(trie, isEndChar, &conflicts);
    }

    RuleList rules;
    EndCharPredicate isEndChar;
    ConflictLog conflicts;
};

TEST_F(DfaTest, ReservedStatesComeFirst) {
    Dfa dfa = compile();
    ASSERT_GE(dfa.size(), 2u);
    EXPECT_EQ(dfa.state(kWordBoundaryState).nodes, std::vector<NodeId>{kWordBoundaryRoot});
    EXPECT_EQ(dfa.state(kInternalState).nodes, std::vector<NodeId>{kInternalRoot});
}

TEST_F(DfaTest, SubsetConstruction) {
    Dfa dfa = compile();
    ASSERT_EQ(dfa.size(), 9u);

    EXPECT_EQ(dfa.next(1, 'a'), 3u);
    EXPECT_EQ(dfa.next(2, 'a'), 4u);
    EXPECT_EQ(dfa.next(3, 'a'), 5u);
    EXPECT_EQ(dfa.next(4, 'a'), 6u);
    EXPECT_EQ(dfa.next(5, 'a'), 7u);
    EXPECT_EQ(dfa.next(5, kCompletionSymbol), 8u);
    EXPECT_EQ(dfa.next(6, 'a'), 6u);
    EXPECT_EQ(dfa.next(6, kCompletionSymbol), 8u);
    EXPECT_EQ(dfa.next(7, 'a'), 6u);
    EXPECT_EQ(dfa.next(7, kCompletionSymbol), 9u);
    EXPECT_EQ(dfa.next(1, 'b'), kNoState);

    EXPECT_EQ(dfa.state(3).nodes, (std::vector<NodeId>{3, 7}));
    EXPECT_EQ(dfa.state(5).nodes, (std::vector<NodeId>{4, 7, 8}));
    EXPECT_EQ(dfa.state(9).nodes, (std::vector<NodeId>{6, 9}));
}

TEST_F(DfaTest, StateExpansionsUsePriority) {
    Dfa dfa = compile();

    EXPECT_EQ(dfa.state(1).expansion, nullptr);
    EXPECT_EQ(dfa.state(2).expansion, nullptr);
    for (StateId id = 3; id <= 7; ++id) {
        EXPECT_EQ(dfa.state(id).expansion, rules[2].get()) << "state " << id;
    }
    EXPECT_EQ(dfa.state(8).expansion, rules[1].get());
    EXPECT_EQ(dfa.state(9).expansion, rules[0].get());
    EXPECT_TRUE(conflicts.empty());
}

TEST_F(DfaTest, EndCharacterTransitionsIncludeWordBoundary) {
    rules = {makeRule(0, U"x-y", "1", /*internal=*/true)};
    Dfa dfa = compile();

    StateId x = dfa.next(kInternalState, 'x');
    ASSERT_NE(x, kNoState);
    StateId dash = dfa.next(x, '-');
    ASSERT_NE(dash, kNoState);

    const auto& nodes = dfa.state(dash).nodes;
    EXPECT_NE(std::find(nodes.begin(), nodes.end(), kWordBoundaryRoot), nodes.end());
}

TEST_F(DfaTest, CompilationIsDeterministic) {
    rules = {
        makeRule(0, U"btw", "by the way"),
        makeRule(1, U"ard", "shorter", /*internal=*/true),
        makeRule(2, U"yard", "longer", /*internal=*/true),
        makeRule(3, U"-aac", "dashed"),
        makeRule(4, U"aa-aab", "bbb"),
    };
    EXPECT_EQ(compile().dump(), compile().dump());
}

TEST_F(DfaTest, IndistinguishableRulesAreReportedOnce) {
    rules = {
        makeRule(0, U"ab", "first"),
        makeRule(1, U"ab", "second"),
    };
    Dfa dfa = compile();

    StateId complete = dfa.next(dfa.next(dfa.next(1, 'a'), 'b'), kCompletionSymbol);
    ASSERT_NE(complete, kNoState);
    EXPECT_EQ(dfa.state(complete).expansion, rules[0].get());
    EXPECT_EQ(conflicts.messages().size(), 1u);
}
