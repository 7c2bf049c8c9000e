/**
 * @file test_similarity_matcher.cpp
 * @brief Type-specific similarity rules and first-match scanning
 */

#include <gtest/gtest.h>
#include <integration/similarity_matcher.hpp>
#include <storage/graph_store.hpp>
#include <string>

using namespace Broadsheet;

namespace {

GlobalEntity make_entity(const std::string& id, EntityType type, const std::string& text) {
    GlobalEntity e;
    e.id = id;
    e.type = type;
    e.text = text;
    e.confidence = 0.9;
    return e;
}

GlobalEntity make_location(const std::string& id, const std::string& text, double lat, double lon) {
    GlobalEntity e = make_entity(id, EntityType::Location, text);
    e.location.latitude = lat;
    e.location.longitude = lon;
    return e;
}

GlobalEntity make_time(const std::string& id, const std::string& text, const std::string& start) {
    GlobalEntity e = make_entity(id, EntityType::Time, text);
    e.time.start_date = start;
    return e;
}

} // namespace

TEST(SimilarityMatcherTest, DifferentTypesNeverMatch) {
    SimilarityMatcher m;
    auto a = make_entity("a", EntityType::Person, "Austria");
    auto b = make_entity("b", EntityType::Organization, "Austria");
    EXPECT_FALSE(m.similar(a.view(), b.view()));
}

TEST(SimilarityMatcherTest, UnlistedTypesMatchOnlyTheSameName) {
    SimilarityMatcher m;
    auto date = make_entity("a", EntityType::Other, "4 April");
    date.other_type = "DATE";
    auto same = make_entity("b", EntityType::Other, "4 april");
    same.other_type = "DATE";
    auto gpe = make_entity("c", EntityType::Other, "4 April");
    gpe.other_type = "GPE";

    EXPECT_TRUE(m.similar(date.view(), same.view()));
    EXPECT_FALSE(m.similar(date.view(), gpe.view()));
}

TEST(SimilarityMatcherTest, GeoThreshold) {
    SimilarityMatcher m;
    auto vienna = make_location("v", "Vienna", 48.2082, 16.3738);
    auto nearby = make_location("n", "Stephansplatz", 48.2100, 16.3750);
    auto zurich = make_location("z", "Vienna", 47.3769, 8.5417);

    EXPECT_TRUE(m.similar(vienna.view(), nearby.view()));
    // Same name, far apart: coordinates decide
    EXPECT_FALSE(m.similar(vienna.view(), zurich.view()));
}

TEST(SimilarityMatcherTest, LocationWithoutCoordinatesUsesText) {
    SimilarityMatcher m;
    auto vienna = make_location("v", "Vienna", 48.2082, 16.3738);
    auto bare = make_entity("b", EntityType::Location, "vienna");
    auto other = make_entity("o", EntityType::Location, "Pressburg");

    EXPECT_TRUE(m.similar(vienna.view(), bare.view()));
    EXPECT_FALSE(m.similar(vienna.view(), other.view()));
}

TEST(SimilarityMatcherTest, TimeStartDateDecides) {
    SimilarityMatcher m;
    auto a = make_time("a", "13 November 1805", "1805-11-13");
    auto b = make_time("b", "the day Vienna fell", "1805-11-13");
    auto c = make_time("c", "13 November 1805", "1805-11-14");

    EXPECT_TRUE(m.similar(a.view(), b.view()));
    EXPECT_FALSE(m.similar(a.view(), c.view()));
}

TEST(SimilarityMatcherTest, TimeNormalizedDecidesWithoutDates) {
    SimilarityMatcher m;
    auto a = make_entity("a", EntityType::Time, "autumn 1805");
    a.normalized = "1805-autumn";
    auto b = make_entity("b", EntityType::Time, "autumn 1805");
    b.normalized = "1805-fall";

    EXPECT_FALSE(m.similar(a.view(), b.view()));
    b.normalized = "1805-autumn";
    EXPECT_TRUE(m.similar(a.view(), b.view()));
}

TEST(SimilarityMatcherTest, TextRatioUsesNormalizedAndIgnoresCase) {
    SimilarityMatcher m;
    auto a = make_entity("a", EntityType::Person, "Bonaparte");
    a.normalized = "Napoleon";
    auto b = make_entity("b", EntityType::Person, "NAPOLEON");

    EXPECT_DOUBLE_EQ(SimilarityMatcher::text_ratio(a.view(), b.view()), 1.0);
    EXPECT_TRUE(m.similar(a.view(), b.view()));
}

TEST(SimilarityMatcherTest, TextThreshold) {
    auto a = make_entity("a", EntityType::Concept, "apple");
    auto b = make_entity("b", EntityType::Concept, "appel");

    EXPECT_TRUE(SimilarityMatcher(0.8, 1.0).similar(a.view(), b.view()));
    EXPECT_FALSE(SimilarityMatcher(0.81, 1.0).similar(a.view(), b.view()));
}

TEST(SimilarityMatcherTest, Symmetry) {
    SimilarityMatcher m;
    const char* names[] = {"Napoleon", "Napoleon Bonaparte", "Bonaparte", "Kaiser Franz",
                           "Franz II", "French troops", "French Troops", "troops"};
    for (const char* x : names) {
        for (const char* y : names) {
            auto a = make_entity("a", EntityType::Person, x);
            auto b = make_entity("b", EntityType::Person, y);
            EXPECT_EQ(m.similar(a.view(), b.view()), m.similar(b.view(), a.view())) << x << " / " << y;
            EXPECT_DOUBLE_EQ(SimilarityMatcher::text_ratio(a.view(), b.view()),
                             SimilarityMatcher::text_ratio(b.view(), a.view()));
        }
    }
}

TEST(SimilarityMatcherTest, FindMatchIsFirstInCreationOrder) {
    GraphStore store;
    store.add_entity(make_entity("p1", EntityType::Person, "Murat"));
    store.add_entity(make_entity("p2", EntityType::Person, "Joachim Murat"));
    store.add_entity(make_entity("p3", EntityType::Person, "murat"));

    SimilarityMatcher m;
    LocalEntity local{"e1", EntityType::Person, "MURAT", std::nullopt, 0.5};
    CandidateEntity candidate{local, nullptr, nullptr};

    auto match = m.find_match(store, candidate.view());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, 0u);
}

TEST(SimilarityMatcherTest, FindMatchUsesCandidateAttributes) {
    GraphStore store;
    store.add_entity(make_location("l1", "Wien", 48.2082, 16.3738));

    SimilarityMatcher m;
    LocalEntity local{"e1", EntityType::Location, "Vienna", std::nullopt, 0.5};
    LocationAttributes attrs;
    attrs.latitude = 48.208174;
    attrs.longitude = 16.373819;

    EXPECT_FALSE(m.find_match(store, CandidateEntity{local, nullptr, nullptr}.view()).has_value());
    auto match = m.find_match(store, CandidateEntity{local, &attrs, nullptr}.view());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, 0u);
}

TEST(SimilarityMatcherTest, ConfiguredGeoRadius) {
    IntegrationConfig config;
    config.geo_match_km = 0.1;
    SimilarityMatcher m(config);
    auto vienna = make_location("v", "Vienna", 48.2082, 16.3738);
    auto nearby = make_location("n", "Stephansplatz", 48.2100, 16.3750);
    EXPECT_FALSE(m.similar(vienna.view(), nearby.view()));
}
