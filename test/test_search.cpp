#include "search/similarity_search.hpp"
#include "database/photo_catalog.hpp"
#include "fake_extractor.hpp"
#include <gtest/gtest.h>
#include <cmath>

class SearchTest : public ::testing::Test {
protected:
    Database db{":memory:"};
    PhotoCatalog photos{db};
    DescriptorStore store{db, 4};
    LinearScanIndex index{store};
    std::shared_ptr<FakeExtractor> extractor = std::make_shared<FakeExtractor>(4);
    SimilaritySearch search{extractor, index};

    int64_t photo_with(std::vector<std::vector<float>> embeddings) {
        int64_t id = photos.add("p" + std::to_string(photos.count()) + ".jpg", "juan");
        std::vector<FaceEmbedding> faces;
        for (auto& e : embeddings) faces.push_back(face(std::move(e)));
        store.add_all(id, faces);
        return id;
    }

    // Vector whose cosine with direction(4, 0) is exactly `cos`
    static std::vector<float> at_angle(double cos) {
        return {static_cast<float>(cos), static_cast<float>(std::sqrt(1.0 - cos * cos)), 0.0f, 0.0f};
    }
};

TEST_F(SearchTest, ScenarioA_SameFaceIsTopResult) {
    std::vector<float> e{0.3f, -0.2f, 0.9f, 0.1f};
    int64_t target = photo_with({e});
    photo_with({{-0.3f, 0.2f, -0.9f, 0.1f}});
    photo_with({{0.9f, 0.1f, 0.0f, 0.4f}});

    extractor->script("probe", {face(e)});
    auto result = search.identify(image_of("probe"), 0.65f, 20);

    EXPECT_EQ(result.status, IdentifyStatus::Found);
    ASSERT_FALSE(result.matches.empty());
    EXPECT_EQ(result.matches[0].photo_id, target);
    EXPECT_NEAR(result.matches[0].similarity, 1.0f, 1e-5);
}

TEST_F(SearchTest, ScenarioB_NoFaceIsDistinctFromNoMatch) {
    photo_with({direction(4, 0)});

    extractor->script("wall", {});
    auto none = search.identify(image_of("wall"));
    EXPECT_EQ(none.status, IdentifyStatus::NoFaceDetected);
    EXPECT_TRUE(none.matches.empty());

    extractor->script("stranger", {face(direction(4, 2))});
    auto stranger = search.identify(image_of("stranger"));
    EXPECT_EQ(stranger.status, IdentifyStatus::Found);
    EXPECT_TRUE(stranger.matches.empty());
}

TEST_F(SearchTest, ScenarioC_TopKKeepsHighestScores) {
    std::vector<int64_t> photo_ids;
    for (int i = 0; i < 25; ++i) {
        // cos from 0.70 to 0.94, all above 0.65
        photo_ids.push_back(photo_with({at_angle(0.70 + 0.01 * i)}));
    }
    photo_with({direction(4, 2)});

    extractor->script("probe", {face(direction(4, 0))});
    auto result = search.identify(image_of("probe"), 0.65f, 20);

    ASSERT_EQ(result.matches.size(), 20u);
    EXPECT_EQ(result.matches.front().photo_id, photo_ids[24]);
    EXPECT_EQ(result.matches.back().photo_id, photo_ids[5]);
    for (const auto& m : result.matches) {
        EXPECT_GE(m.similarity, 0.745f);
    }
}

TEST_F(SearchTest, ThresholdIsStrict) {
    photo_with({direction(4, 0)});
    auto matches = search.rank(direction(4, 0), 1.0f, 20);
    EXPECT_TRUE(matches.empty());

    matches = search.rank(direction(4, 0), 0.999f, 20);
    EXPECT_EQ(matches.size(), 1u);
}

TEST_F(SearchTest, ResultsSortedDescending) {
    for (double c : {0.8, 0.95, 0.7, 0.99, 0.85, 0.66}) {
        photo_with({at_angle(c)});
    }

    auto matches = search.rank(direction(4, 0), 0.65f, 20);
    ASSERT_EQ(matches.size(), 6u);
    for (size_t i = 1; i < matches.size(); ++i) {
        EXPECT_GE(matches[i - 1].similarity, matches[i].similarity);
    }
}

TEST_F(SearchTest, TiesBrokenByDescriptorId) {
    int64_t first = photo_with({direction(4, 1)});
    int64_t second = photo_with({direction(4, 1)});
    int64_t third = photo_with({direction(4, 1)});

    auto matches = search.rank(direction(4, 1), 0.5f, 2);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].photo_id, first);
    EXPECT_EQ(matches[1].photo_id, second);
    EXPECT_LT(matches[0].descriptor_id, matches[1].descriptor_id);
    (void)third;
}

TEST_F(SearchTest, PhotoWithoutFacesNeverReturned) {
    int64_t empty_photo = photos.add("crowd_back.jpg", "juan");
    photo_with({direction(4, 0)});

    for (size_t axis = 0; axis < 4; ++axis) {
        for (const auto& m : search.rank(direction(4, axis, 0.3f), -1.0f, 100)) {
            EXPECT_NE(m.photo_id, empty_photo);
        }
    }
}

TEST_F(SearchTest, UsesFirstFaceOfProbe) {
    int64_t a = photo_with({direction(4, 0)});
    photo_with({direction(4, 3)});

    extractor->script("two", {face(direction(4, 0)), face(direction(4, 3))});
    auto result = search.identify(image_of("two"));

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].photo_id, a);
}

TEST_F(SearchTest, ProbeDimensionMismatchFailsFast) {
    photo_with({direction(4, 0)});
    EXPECT_THROW(search.rank({1.0f, 0.0f}, 0.65f, 20), DimensionMismatch);
}

TEST_F(SearchTest, MismatchReportsProbeAsExpected) {
    photo_with({direction(4, 0)});
    try {
        search.rank({1.0f, 0.0f}, 0.65f, 20);
        FAIL() << "expected DimensionMismatch";
    } catch (const DimensionMismatch& e) {
        EXPECT_EQ(e.expected, 2u);
        EXPECT_EQ(e.actual, 4u);
    }
}

TEST_F(SearchTest, EmptyStoreAndZeroTopK) {
    EXPECT_TRUE(search.rank(direction(4, 0), 0.65f, 20).empty());
    photo_with({direction(4, 0)});
    EXPECT_TRUE(search.rank(direction(4, 0), 0.65f, 0).empty());
}

TEST_F(SearchTest, ExtractorOutagePropagates) {
    extractor->fail_on("probe");
    EXPECT_THROW(search.identify(image_of("probe")), ExtractionUnavailable);

    extractor->shutdown();
    extractor->script("ok", {face(direction(4, 0))});
    EXPECT_THROW(search.identify(image_of("ok")), ExtractionUnavailable);
}

TEST(RankMatches, OrdersAndTruncates) {
    std::vector<MatchResult> m(4);
    m[0].descriptor_id = 7; m[0].similarity = 0.8f;
    m[1].descriptor_id = 3; m[1].similarity = 0.9f;
    m[2].descriptor_id = 2; m[2].similarity = 0.8f;
    m[3].descriptor_id = 1; m[3].similarity = 0.7f;

    rank_matches(m, 3);
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m[0].descriptor_id, 3);
    EXPECT_EQ(m[1].descriptor_id, 2);
    EXPECT_EQ(m[2].descriptor_id, 7);
}
