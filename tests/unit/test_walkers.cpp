#include <gtest/gtest.h>
#include "../../src/automaton/dfa.h"
#include "../../src/matching/dfa_walker.h"
#include "../../src/matching/trie_walker.h"
#include "../../src/utils/utf8.h"
#include "../common/test_utils.h"
#include <random>

using namespace hotstring;
using namespace hotstring_test;

class WalkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules.push_back(makeRule(0, U"aaa", "3", /*internal=*/false, /*wait=*/true));
        rules.push_back(makeRule(1, U"aa", "2", /*internal=*/true, /*wait=*/true));
        rules.push_back(makeRule(2, U"a", "1", /*internal=*/true, /*wait=*/false));
        isEndChar = [](char32_t ch) { return utils::isEndCharacter(ch); };

        trie = std::make_unique<Trie>(Trie::build(rules, true));
        dfa = std::make_unique<Dfa>(DfaFactory::create(*trie, isEndChar, nullptr));
        trie->decorate(isEndChar, nullptr);
    }

    std::vector<const Rule*> walk(MatchEngine& walker, const std::u32string& text) {
        std::vector<const Rule*> matches;
        for (char32_t ch : text) {
            matches.push_back(walker.followEdge(ch));
        }
        return matches;
    }

    RuleList rules;
    EndCharPredicate isEndChar;
    std::unique_ptr<Trie> trie;
    std::unique_ptr<Dfa> dfa;
};

TEST_F(WalkerTest, DfaWalkerFollowsStates) {
    DfaWalker walker(*dfa, true, isEndChar, 50);
    EXPECT_EQ(walker.currentState(), 1u);

    auto matches = walk(walker, U"aaa ");
    EXPECT_EQ(walker.currentState(), 9u);
    EXPECT_TRUE(walker.isCompletionPending());
    EXPECT_EQ(matches[0], rules[2].get());
    EXPECT_EQ(matches[3], rules[0].get());
}

TEST_F(WalkerTest, TrieWalkerFollowsNodes) {
    TrieWalker walker(*trie, true, isEndChar, 50);

    auto matches = walk(walker, U"aaa ");
    EXPECT_EQ(walker.currentState(), 6u);
    EXPECT_TRUE(walker.isCompletionPending());
    EXPECT_EQ(matches[1], rules[2].get());
    EXPECT_EQ(matches[3], rules[0].get());
}

TEST_F(WalkerTest, CompletionRestartsAtWordBoundary) {
    DfaWalker walker(*dfa, true, isEndChar, 50);
    walk(walker, U"aa ");
    EXPECT_TRUE(walker.isCompletionPending());
    size_t before = walker.historySize();

    walker.followEdge('a');
    EXPECT_FALSE(walker.isCompletionPending());
    EXPECT_EQ(walker.currentState(), 3u);
    EXPECT_EQ(walker.historySize(), before + 1);
}

TEST_F(WalkerTest, CaseInsensitiveWalkersFoldInput) {
    DfaWalker dfaWalker(*dfa, true, isEndChar, 50);
    TrieWalker trieWalker(*trie, true, isEndChar, 50);

    EXPECT_EQ(walk(dfaWalker, U"AAA ").back(), rules[0].get());
    EXPECT_EQ(walk(trieWalker, U"AaA ").back(), rules[0].get());
}

TEST_F(WalkerTest, UnknownCharactersReturnToRoots) {
    DfaWalker walker(*dfa, true, isEndChar, 50);

    walker.followEdge('z');
    EXPECT_EQ(walker.currentState(), kInternalState);
    walker.followEdge(' ');
    EXPECT_EQ(walker.currentState(), kWordBoundaryState);
}

TEST_F(WalkerTest, RewindRestoresEveryStep) {
    for (EngineKind kind : {EngineKind::Dfa, EngineKind::Trie}) {
        std::unique_ptr<MatchEngine> walker;
        if (kind == EngineKind::Dfa) {
            walker = std::make_unique<DfaWalker>(*dfa, true, isEndChar, 50);
        } else {
            walker = std::make_unique<TrieWalker>(*trie, true, isEndChar, 50);
        }

        walk(*walker, U"x aa ");
        std::vector<std::pair<uint32_t, bool>> seen;
        seen.emplace_back(walker->currentState(), walker->isCompletionPending());

        std::u32string more = U"aaz a";
        for (char32_t ch : more) {
            walker->followEdge(ch);
            seen.emplace_back(walker->currentState(), walker->isCompletionPending());
        }

        for (size_t i = more.size(); i > 0; --i) {
            walker->rewind();
            EXPECT_EQ(walker->currentState(), seen[i - 1].first);
            EXPECT_EQ(walker->isCompletionPending(), seen[i - 1].second);
        }
    }
}

TEST_F(WalkerTest, RewindPastHistoryLandsAtStart) {
    DfaWalker walker(*dfa, true, isEndChar, 2);
    walk(walker, U"aaa");
    EXPECT_EQ(walker.historySize(), 2u);

    walker.rewind();
    walker.rewind();
    EXPECT_EQ(walker.currentState(), kWordBoundaryState);
    walker.rewind();
    EXPECT_EQ(walker.currentState(), kWordBoundaryState);
    EXPECT_EQ(walker.historySize(), 0u);
}

TEST_F(WalkerTest, ResetClearsHistory) {
    TrieWalker walker(*trie, true, isEndChar, 50);
    walk(walker, U"aa ");
    walker.reset();

    EXPECT_EQ(walker.currentState(), kWordBoundaryRoot);
    EXPECT_FALSE(walker.isCompletionPending());
    EXPECT_EQ(walker.historySize(), 0u);
}

TEST_F(WalkerTest, BackendsAgreeOnMatches) {
    rules = {
        makeRule(0, U"aa-aa-aa", "aaa"),
        makeRule(1, U"aa-aab", "bbb"),
        makeRule(2, U"aac", "ccc"),
        makeRule(3, U"-aac", "dashed"),
        makeRule(4, U"-aab", "dashed2", /*internal=*/true),
        makeRule(5, U"a", "1", /*internal=*/true, /*wait=*/false),
    };
    Trie plain = Trie::build(rules, true);
    Dfa compiled = DfaFactory::create(plain, isEndChar, nullptr);
    plain.decorate(isEndChar, nullptr);

    for (const std::u32string& text : {std::u32string(U"aa-aa--aac "), std::u32string(U"aazzaa-aab "),
                                       std::u32string(U"aa(aa-aab "), std::u32string(U"test-aab aac -aac ")}) {
        DfaWalker dfaWalker(compiled, true, isEndChar, 50);
        TrieWalker trieWalker(plain, true, isEndChar, 50);
        EXPECT_EQ(walk(dfaWalker, text), walk(trieWalker, text));
    }
}

TEST_F(WalkerTest, RandomEditsRewindSymmetrically) {
    const std::u32string alphabet = U"aAz -";
    std::mt19937 rng(20240917);
    std::uniform_int_distribution<size_t> pickChar(0, alphabet.size() - 1);
    std::uniform_int_distribution<int> pickOp(0, 9);

    DfaWalker dfaWalker(*dfa, true, isEndChar, 1024);
    TrieWalker trieWalker(*trie, true, isEndChar, 1024);
    using Snapshot = std::pair<uint32_t, bool>;
    std::vector<Snapshot> dfaSeen{{dfaWalker.currentState(), false}};
    std::vector<Snapshot> trieSeen{{trieWalker.currentState(), false}};

    for (int step = 0; step < 800; ++step) {
        if (pickOp(rng) < 3) {
            dfaWalker.rewind();
            trieWalker.rewind();
            if (dfaSeen.size() > 1) {
                dfaSeen.pop_back();
                trieSeen.pop_back();
            }
            ASSERT_EQ(Snapshot(dfaWalker.currentState(), dfaWalker.isCompletionPending()), dfaSeen.back())
                << "step " << step;
            ASSERT_EQ(Snapshot(trieWalker.currentState(), trieWalker.isCompletionPending()), trieSeen.back())
                << "step " << step;
            ASSERT_EQ(dfaWalker.historySize(), dfaSeen.size() - 1);
        } else {
            char32_t ch = alphabet[pickChar(rng)];
            const Rule* fromDfa = dfaWalker.followEdge(ch);
            const Rule* fromTrie = trieWalker.followEdge(ch);
            ASSERT_EQ(fromDfa, fromTrie) << "step " << step;
            dfaSeen.emplace_back(dfaWalker.currentState(), dfaWalker.isCompletionPending());
            trieSeen.emplace_back(trieWalker.currentState(), trieWalker.isCompletionPending());
        }
    }
}
