#include <gtest/gtest.h>

#include "docintel/PersonaProfiler.hpp"
#include "docintel/SubsectionRefiner.hpp"
#include "test_helpers.hpp"

using namespace docintel;
using testing_helpers::make_section;

static RankedOutput ranked_of(const std::vector<Section>& sections) {
    RankedOutput out;
    int r = 1;
    for (const auto& s : sections) {
        RankedEntry e;
        e.rank = r++;
        e.scored.section = s;
        out.entries.push_back(e);
    }
    return out;
}

static std::vector<std::string> bullet_body(const std::string& topic) {
    return {
        "\xE2\x80\xA2 " + topic + " option one: a full morning walking tour of the old harbour with a local guide and coffee stop.",
        "\xE2\x80\xA2 " + topic + " option two: an afternoon boat trip along the coast with swimming stops in two quiet bays.",
        "\xE2\x80\xA2 " + topic + " option three: an evening food crawl through the market streets for the whole group of friends.",
        "\xE2\x80\xA2 " + topic + " option four: a relaxed day at the beach club with loungers booked in advance for ten people.",
    };
}

TEST(SubsectionRefinerTest, SplitsNumberedItems) {
    const Section s = make_section("d", "Steps", HeadingLevel::H2, {
        "1. Book the train tickets early",
        "because prices rise in summer.",
        "2. Reserve the apartment",
        "3. Share the plan with everyone",
    });

    const auto passages = split_passages(s);
    ASSERT_EQ(passages.size(), 3u);
    EXPECT_EQ(passages[0].text, "1. Book the train tickets early because prices rise in summer.");
    EXPECT_EQ(passages[2].text, "3. Share the plan with everyone");
}

TEST(SubsectionRefinerTest, SplitsBulletItems) {
    const Section s = make_section("d", "Ideas", HeadingLevel::H2, {
        "Some ideas for the group:",
        "- hike the coastal path",
        "- rent bikes for a day",
    });

    const auto passages = split_passages(s);
    ASSERT_EQ(passages.size(), 3u);
    EXPECT_EQ(passages[0].text, "Some ideas for the group:");
    EXPECT_EQ(passages[1].text, "- hike the coastal path");
}

TEST(SubsectionRefinerTest, ShortProseIsOnePassage) {
    const Section s = make_section("d", "Note", HeadingLevel::H3, {"A short note.", "Second line."}, 4);
    const auto passages = split_passages(s);
    ASSERT_EQ(passages.size(), 1u);
    EXPECT_EQ(passages[0].text, "A short note. Second line.");
    EXPECT_EQ(passages[0].page, 4);
}

TEST(SubsectionRefinerTest, LongProseIsGroupedBySentences) {
    std::vector<std::string> body;
    for (int i = 0; i < 12; ++i) {
        body.push_back("Sentence number " + std::to_string(i) + " talks about the old town and its narrow streets.");
    }
    const Section s = make_section("d", "Old Town", HeadingLevel::H1, body);

    RefinerConfig cfg;
    const auto passages = split_passages(s, cfg);
    ASSERT_GE(passages.size(), 2u);
    for (size_t i = 0; i + 1 < passages.size(); ++i) EXPECT_GT(passages[i].text.size(), cfg.group_chars);
}

TEST(SubsectionRefinerTest, SentenceGroupsReportTheirOwnPage) {
    Section s = make_section("d", "Harbour Walk", HeadingLevel::H1, {
        "The walk begins at the lighthouse and follows the old sea wall past the fishing boats and the busy market square.",
        "Stop at the fort for views over the bay, then continue along the promenade towards the cathedral and its gardens.",
        "After lunch the path climbs to the castle hill, where a small museum tells the story of the port and its traders.",
        "Return by the funicular railway and finish the afternoon with a swim at the sandy beach below the eastern cliffs.",
    }, 4);
    s.body[2].block.page = 5;
    s.body[3].block.page = 5;

    const std::vector<Passage> ps = split_passages(s);
    ASSERT_EQ(ps.size(), 2u);
    EXPECT_EQ(ps[0].page, 4);
    EXPECT_EQ(ps[1].page, 5);
    EXPECT_EQ(ps[1].text.rfind("After lunch", 0), 0u);
}

TEST(SubsectionRefinerTest, EmptyBodyHasNoPassages) {
    EXPECT_TRUE(split_passages(make_section("d", "Alone", HeadingLevel::H1, {})).empty());
}

TEST(SubsectionRefinerTest, CapsPerSectionAndTotal) {
    const PersonaProfile p = build_profile("Travel Planner", "Plan a 4-day trip for 10 college friends");
    const RankedOutput ranked = ranked_of({
        make_section("a.pdf", "Morning", HeadingLevel::H1, bullet_body("Morning"), 1),
        make_section("b.pdf", "Afternoon", HeadingLevel::H1, bullet_body("Afternoon"), 2),
        make_section("c.pdf", "Evening", HeadingLevel::H1, bullet_body("Evening"), 3),
    });

    const auto refined = refine(ranked, p);
    ASSERT_EQ(refined.size(), 5u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(refined[(size_t)i].rank, 1);
        EXPECT_EQ(refined[(size_t)i].doc_id, "a.pdf");
        EXPECT_EQ(refined[(size_t)i].page, 1);
    }
    EXPECT_EQ(refined[3].rank, 2);
    EXPECT_EQ(refined[4].rank, 2);

    // best first within a section
    EXPECT_GE(refined[0].score, refined[1].score);
    EXPECT_GE(refined[1].score, refined[2].score);
}

TEST(SubsectionRefinerTest, FallsBackToLongestPassage) {
    const PersonaProfile p = build_profile("Travel Planner", "Plan a trip");
    const RankedOutput ranked = ranked_of({
        make_section("a.pdf", "Tips", HeadingLevel::H2, {"* pack light", "* bring a trip journal", "* relax"}),
    });

    const auto refined = refine(ranked, p);
    ASSERT_EQ(refined.size(), 1u);
    EXPECT_EQ(refined[0].text, "* bring a trip journal");
}

TEST(SubsectionRefinerTest, NothingRankedNothingRefined) {
    const PersonaProfile p = build_profile("Travel Planner", "Plan a trip");
    EXPECT_TRUE(refine(RankedOutput{}, p).empty());
}
