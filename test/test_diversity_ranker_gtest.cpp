#include <gtest/gtest.h>

#include <algorithm>

#include "docintel/DiversityRanker.hpp"
#include "docintel/PersonaProfiler.hpp"
#include "docintel/SimilarityEngine.hpp"
#include "text/TextUtil.hpp"
#include "test_helpers.hpp"

using namespace docintel;
using testing_helpers::make_section;

static ScoredSection candidate(
    const std::string& doc,
    const std::string& heading,
    double relevance,
    const std::string& vocab_text,
    int page = 1,
    int index = 0
) {
    ScoredSection s;
    s.section = make_section(doc, heading, HeadingLevel::H1, {}, page, index);
    s.relevance_score = relevance;
    s.vocabulary = textutil::vocabulary(vocab_text);
    return s;
}

static std::vector<ScoredSection> mixed_pool() {
    return {
        candidate("a.pdf", "Beaches", 0.90, "beach sand swim sun towel umbrella"),
        candidate("a.pdf", "Beach Clubs", 0.88, "beach sand swim sun towel lounge"),
        candidate("b.pdf", "Museums", 0.80, "museum art gallery painting ticket"),
        candidate("b.pdf", "Night Life", 0.75, "bar club dance music night"),
        candidate("c.pdf", "Markets", 0.70, "market food stall cheese fruit"),
        candidate("c.pdf", "Hiking", 0.65, "trail hike mountain boot map"),
        candidate("d.pdf", "Wine", 0.60, "wine vineyard tasting cellar grape"),
        candidate("d.pdf", "Cooking", 0.55, "cooking class chef recipe kitchen"),
    };
}

static double mean_pairwise_jaccard(const std::vector<const ScoredSection*>& picks) {
    double sum = 0.0;
    int n = 0;
    for (size_t i = 0; i < picks.size(); ++i) {
        for (size_t j = i + 1; j < picks.size(); ++j) {
            sum += jaccard(picks[i]->vocabulary, picks[j]->vocabulary);
            ++n;
        }
    }
    return n == 0 ? 0.0 : sum / n;
}

TEST(DiversityRankerTest, OutputNeverExceedsK) {
    RankerConfig cfg;
    for (int k : {0, 1, 3, 5, 20}) {
        cfg.k = k;
        const RankedOutput out = rank(mixed_pool(), cfg);
        EXPECT_LE((int)out.entries.size(), k);
    }
}

TEST(DiversityRankerTest, RanksAreConsecutiveAndFirstIsBest) {
    const RankedOutput out = rank(mixed_pool());
    ASSERT_FALSE(out.entries.empty());
    for (size_t i = 0; i < out.entries.size(); ++i) EXPECT_EQ(out.entries[i].rank, (int)i + 1);

    double best = 0.0;
    for (const auto& c : mixed_pool()) best = std::max(best, c.relevance_score);
    EXPECT_DOUBLE_EQ(out.entries[0].scored.relevance_score, best);
    EXPECT_DOUBLE_EQ(out.entries[0].redundancy, 0.0);
}

TEST(DiversityRankerTest, PrefixStable) {
    RankerConfig cfg;
    cfg.min_relevance = 0.0;
    for (int k = 2; k <= 6; ++k) {
        cfg.k = k;
        const RankedOutput big = rank(mixed_pool(), cfg);
        cfg.k = k - 1;
        const RankedOutput small = rank(mixed_pool(), cfg);

        ASSERT_LE(small.entries.size(), big.entries.size());
        for (size_t i = 0; i < small.entries.size(); ++i) {
            EXPECT_EQ(small.entries[i].scored.section.heading.block.text,
                      big.entries[i].scored.section.heading.block.text);
        }
    }
}

TEST(DiversityRankerTest, LessRedundantThanNaiveTopK) {
    std::vector<ScoredSection> pool = mixed_pool();
    RankerConfig cfg;
    cfg.k = 3;

    const RankedOutput out = rank(pool, cfg);
    std::vector<const ScoredSection*> mmr;
    for (const auto& e : out.entries) mmr.push_back(&e.scored);

    std::sort(pool.begin(), pool.end(),
              [](const ScoredSection& a, const ScoredSection& b) { return a.relevance_score > b.relevance_score; });
    std::vector<const ScoredSection*> naive;
    for (int i = 0; i < cfg.k; ++i) naive.push_back(&pool[(size_t)i]);

    EXPECT_LE(mean_pairwise_jaccard(mmr), mean_pairwise_jaccard(naive));
    EXPECT_EQ(out.entries[1].scored.section.heading.block.text, "Museums");
}

TEST(DiversityRankerTest, IdenticalBodiesKeepOnlyOne) {
    const std::vector<std::string> body = {
        "Pack light layers, a waterproof shell, sturdy walking shoes, sunscreen, reusable bottle,",
        "adapter plugs, earplugs, medication, copies of passports, travel insurance documents, snacks,",
        "headlamp, compact umbrella, swimwear, sunglasses, spare charger, cash envelope, notebook, pens,",
        "lightweight towel, laundry bag, phrasebook, offline maps, emergency contacts, small padlock.",
    };

    const PersonaProfile p = build_profile("Travel Planner", "Plan a 4-day trip for 10 college friends");
    const SimilarityEngine engine(p, nullptr, nullptr);

    std::vector<ScoredSection> pool = {
        engine.score(make_section("a.pdf", "Packing Tips", HeadingLevel::H1, body, 2, 10)),
        engine.score(make_section("b.pdf", "What to Bring", HeadingLevel::H1, body, 5, 40)),
        engine.score(make_section("c.pdf", "Getting Around", HeadingLevel::H1,
            {"Regional buses connect the coastal towns every hour from early morning."}, 1, 3)),
    };

    const RankedOutput out = rank(pool);
    int copies = 0;
    for (const auto& e : out.entries) {
        const std::string& h = e.scored.section.heading.block.text;
        if (h == "Packing Tips" || h == "What to Bring") ++copies;
    }
    EXPECT_LE(copies, 1);

    bool dropped = false;
    for (const auto& d : out.decisions) {
        if (d.reason == "near_duplicate") dropped = true;
    }
    EXPECT_TRUE(dropped);
}

TEST(DiversityRankerTest, AdaptiveFloorDropsWeakCandidates) {
    const std::vector<ScoredSection> pool = {
        candidate("a.pdf", "Strong", 0.9, "alpha beta"),
        candidate("a.pdf", "Good", 0.8, "gamma delta"),
        candidate("a.pdf", "Weak", 0.1, "epsilon zeta"),
    };

    const double floor = adaptive_floor(pool, RankerConfig{});
    EXPECT_GT(floor, 0.1);
    EXPECT_LT(floor, 0.8);

    const RankedOutput out = rank(pool);
    EXPECT_DOUBLE_EQ(out.floor, floor);
    ASSERT_EQ(out.entries.size(), 2u);
    ASSERT_EQ(out.decisions.size(), 3u);
    EXPECT_EQ(out.decisions[2].reason, "below_floor");
    EXPECT_FALSE(out.decisions[2].accepted);

    RankerConfig strict;
    strict.min_relevance = 0.85;
    EXPECT_DOUBLE_EQ(adaptive_floor(pool, strict), 0.85);
    EXPECT_EQ(rank(pool, strict).entries.size(), 1u);
}

TEST(DiversityRankerTest, TiesBreakOnPageThenDocThenHeadingIndex) {
    const std::vector<ScoredSection> pool = {
        candidate("b.pdf", "Later page", 0.5, "one two", 3, 0),
        candidate("b.pdf", "Same page b", 0.5, "three four", 1, 0),
        candidate("a.pdf", "Same page a, later block", 0.5, "five six", 1, 7),
        candidate("a.pdf", "Same page a", 0.5, "seven eight", 1, 2),
    };

    RankerConfig cfg;
    cfg.k = 4;
    const RankedOutput out = rank(pool, cfg);
    ASSERT_EQ(out.entries.size(), 4u);
    EXPECT_EQ(out.entries[0].scored.section.heading.block.text, "Same page a");
    EXPECT_EQ(out.entries[1].scored.section.heading.block.text, "Same page a, later block");
    EXPECT_EQ(out.entries[2].scored.section.heading.block.text, "Same page b");
    EXPECT_EQ(out.entries[3].scored.section.heading.block.text, "Later page");
}

TEST(DiversityRankerTest, EveryCandidateGetsADecision) {
    RankerConfig cfg;
    cfg.k = 2;
    const auto pool = mixed_pool();
    const RankedOutput out = rank(pool, cfg);

    ASSERT_EQ(out.decisions.size(), pool.size());
    int selected = 0;
    for (size_t i = 0; i < pool.size(); ++i) {
        const auto& d = out.decisions[i];
        EXPECT_EQ(d.heading, pool[i].section.heading.block.text);
        EXPECT_FALSE(d.reason.empty());
        if (d.accepted) {
            EXPECT_EQ(d.reason, "selected");
            ++selected;
        }
    }
    EXPECT_EQ(selected, 2);
}

TEST(DiversityRankerTest, EmptyPool) {
    RankerConfig cfg;
    cfg.min_relevance = 0.2;
    const RankedOutput out = rank({}, cfg);
    EXPECT_TRUE(out.entries.empty());
    EXPECT_TRUE(out.decisions.empty());
    EXPECT_DOUBLE_EQ(out.floor, 0.2);
}

TEST(DiversityRankerTest, Jaccard) {
    EXPECT_DOUBLE_EQ(jaccard({"a", "b"}, {"a", "b"}), 1.0);
    EXPECT_DOUBLE_EQ(jaccard({"a", "b"}, {"c"}), 0.0);
    EXPECT_DOUBLE_EQ(jaccard({"a", "b", "c"}, {"b", "c", "d"}), 0.5);
    EXPECT_DOUBLE_EQ(jaccard({}, {}), 0.0);
}

TEST(DiversityRankerTest, ShortIdenticalBodiesUnderDifferentHeadings) {
    const std::vector<std::string> body = {"Plan each day of the trip with your college friends."};

    const PersonaProfile p = build_profile("Travel Planner", "Plan a 4-day trip for 10 college friends");
    const SimilarityEngine engine(p, nullptr, nullptr);

    std::vector<ScoredSection> pool = {
        engine.score(make_section("a.pdf", "Trip Planning", HeadingLevel::H1, body, 1, 0)),
        engine.score(make_section("a.pdf", "Group Days", HeadingLevel::H1, body, 2, 5)),
        engine.score(make_section("b.pdf", "Visa Rules", HeadingLevel::H1,
            {"Consular offices process business visa applications quickly."}, 1, 0)),
        engine.score(make_section("c.pdf", "Museum Hours", HeadingLevel::H1,
            {"Galleries open at nine and close at five on weekdays."}, 1, 0)),
    };
    ASSERT_LT(jaccard(pool[0].vocabulary, pool[1].vocabulary), 0.9);

    RankerConfig cfg;
    cfg.k = 4;
    const RankedOutput out = rank(pool, cfg);

    int copies = 0;
    for (const auto& e : out.entries) {
        const std::string& h = e.scored.section.heading.block.text;
        if (h == "Trip Planning" || h == "Group Days") ++copies;
    }
    EXPECT_EQ(copies, 1);

    int dropped = 0;
    for (const auto& d : out.decisions) {
        if (d.reason == "near_duplicate") ++dropped;
    }
    EXPECT_EQ(dropped, 1);
}
