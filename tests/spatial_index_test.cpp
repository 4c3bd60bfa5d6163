#include <gtest/gtest.h>
#include <graph_placement/spatial_index.hpp>
#include <cmath>
#include <limits>
#include <string>

using graph_model::Rect;
using graph_model::Vec2;
using graph_placement::PlacementParams;
using graph_placement::PlacementResult;
using graph_placement::SpatialIndex;

TEST(SpatialIndexTest, UpsertRejectsInvalidInput) {
    SpatialIndex index;
    EXPECT_FALSE(index.upsert("", Vec2{0.0, 0.0}, 20.0));
    EXPECT_FALSE(index.upsert("a", Vec2{0.0, 0.0}, 0.0));
    EXPECT_FALSE(index.upsert("a", Vec2{0.0, 0.0}, -5.0));
    EXPECT_FALSE(index.upsert("a", Vec2{std::numeric_limits<double>::quiet_NaN(), 0.0}, 20.0));
    EXPECT_FALSE(index.upsert("a", Vec2{0.0, 0.0}, std::numeric_limits<double>::infinity()));
    EXPECT_EQ(index.size(), 0u);

    EXPECT_TRUE(index.upsert("a", Vec2{1.0, 2.0}, 20.0));
    EXPECT_EQ(index.size(), 1u);
    EXPECT_FALSE(index.move("missing", Vec2{0.0, 0.0}));
    EXPECT_FALSE(index.remove("missing"));
}

TEST(SpatialIndexTest, UpsertReplacesExistingEntry) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("a", Vec2{300.0, 10.0}, 25.0));
    EXPECT_EQ(index.size(), 1u);
    const auto a = index.find("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_DOUBLE_EQ(a->pos.x, 300.0);
    EXPECT_DOUBLE_EQ(a->radius, 25.0);
    EXPECT_FALSE(index.pick(Vec2{0.0, 0.0}).has_value());
    EXPECT_EQ(index.pick(Vec2{305.0, 10.0}), std::optional<std::string>("a"));
}

TEST(SpatialIndexTest, OverlapBoundaryIsInclusiveOfExactSeparation) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    // radius sum 40 + min separation 10.
    EXPECT_FALSE(index.overlaps(Vec2{50.0, 0.0}, 20.0));
    EXPECT_TRUE(index.overlaps(Vec2{49.9, 0.0}, 20.0));
    EXPECT_FALSE(index.overlaps(Vec2{49.9, 0.0}, 20.0, "a"));
}

TEST(SpatialIndexTest, OverlapsTreatsInvalidCandidateAsOverlapping) {
    SpatialIndex index;
    EXPECT_TRUE(index.overlaps(Vec2{0.0, 0.0}, -1.0));
    EXPECT_TRUE(index.overlaps(Vec2{std::numeric_limits<double>::infinity(), 0.0}, 20.0));
}

TEST(SpatialIndexTest, FreeDesiredPositionIsReturnedUnchanged) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    const PlacementResult r = index.nearest_free_position(Vec2{200.0, 0.0}, 20.0);
    EXPECT_TRUE(r.is_free);
    EXPECT_EQ(r.rings_searched, 0);
    EXPECT_DOUBLE_EQ(r.position.x, 200.0);
    EXPECT_DOUBLE_EQ(r.position.y, 0.0);
}

TEST(SpatialIndexTest, DragTowardNeighborResolvesOutsideItsExclusionZone) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("n1", Vec2{100.0, 100.0}, 20.0));
    ASSERT_TRUE(index.upsert("n2", Vec2{140.0, 100.0}, 20.0));

    const PlacementResult r = index.nearest_free_position(Vec2{135.0, 100.0}, 20.0, "n1");
    EXPECT_TRUE(r.is_free);
    EXPECT_GE(graph_model::distance(r.position, Vec2{140.0, 100.0}), 50.0 - 1e-9);
    EXPECT_FALSE(index.overlaps(r.position, 20.0, "n1"));
}

TEST(SpatialIndexTest, NearestFreePositionIsDeterministic) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("b", Vec2{50.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("c", Vec2{25.0, 45.0}, 20.0));

    const PlacementResult first = index.nearest_free_position(Vec2{25.0, 15.0}, 20.0);
    const PlacementResult second = index.nearest_free_position(Vec2{25.0, 15.0}, 20.0);
    EXPECT_TRUE(first.is_free);
    EXPECT_EQ(first.position, second.position);
    EXPECT_EQ(first.rings_searched, second.rings_searched);
}

TEST(SpatialIndexTest, FirstFreeRingSampleStartsAtPositiveX) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    // Desired point sits on the neighbor; ring 13 (radius 52) is the first with free samples
    // and its first sample lies on +x.
    const PlacementResult r = index.nearest_free_position(Vec2{0.0, 0.0}, 20.0);
    EXPECT_TRUE(r.is_free);
    EXPECT_EQ(r.rings_searched, 13);
    EXPECT_NEAR(r.position.x, 52.0, 1e-9);
    EXPECT_NEAR(r.position.y, 0.0, 1e-9);
}

TEST(SpatialIndexTest, BoundedSearchReturnsLeastOverlappingCandidate) {
    PlacementParams params;
    params.max_rings = 3;
    SpatialIndex index(params);
    ASSERT_TRUE(index.upsert("big", Vec2{0.0, 0.0}, 200.0));

    const PlacementResult r = index.nearest_free_position(Vec2{0.0, 0.0}, 20.0);
    EXPECT_FALSE(r.is_free);
    EXPECT_EQ(r.rings_searched, 3);
    // Every ring-3 sample is 12 from the center: 200 + 20 + 10 - 12.
    EXPECT_NEAR(r.overlap_depth, 218.0, 1e-9);
    EXPECT_NEAR(graph_model::distance(r.position, Vec2{0.0, 0.0}), 12.0, 1e-9);
}

TEST(SpatialIndexTest, OutOfRangeParamsAreClampedOrDefaulted) {
    PlacementParams bad;
    bad.min_separation = -50.0;
    bad.ring_step = std::numeric_limits<double>::quiet_NaN();
    bad.max_rings = std::numeric_limits<int>::max();
    bad.min_angular_steps = -4;

    SpatialIndex index(bad);
    EXPECT_DOUBLE_EQ(index.params().min_separation, graph_placement::layout::min_separation);
    EXPECT_DOUBLE_EQ(index.params().ring_step, graph_placement::layout::ring_step);
    EXPECT_EQ(index.params().max_rings, graph_placement::layout::max_rings_limit);
    EXPECT_EQ(index.params().min_angular_steps, 1);

    bad.max_rings = 0;
    bad.ring_step = -2.0;
    bad.min_angular_steps = 1 << 30;
    index.set_params(bad);
    EXPECT_EQ(index.params().max_rings, 1);
    EXPECT_DOUBLE_EQ(index.params().ring_step, graph_placement::layout::ring_step);
    EXPECT_EQ(index.params().min_angular_steps, graph_placement::layout::angular_steps_limit);
}

TEST(SpatialIndexTest, HugeRingBoundStillTerminates) {
    PlacementParams params;
    params.max_rings = std::numeric_limits<int>::max();
    SpatialIndex index(params);
    // Nothing within 1024 rings of step 4 is outside this exclusion zone.
    ASSERT_TRUE(index.upsert("big", Vec2{0.0, 0.0}, 10000.0));

    const PlacementResult r = index.nearest_free_position(Vec2{0.0, 0.0}, 20.0);
    EXPECT_FALSE(r.is_free);
    EXPECT_EQ(r.rings_searched, graph_placement::layout::max_rings_limit);
}

TEST(SpatialIndexTest, SequentialAutoPlacementKeepsNoOverlapInvariant) {
    SpatialIndex index;
    for (int i = 0; i < 30; ++i) {
        const PlacementResult r = index.nearest_free_position(Vec2{0.0, 0.0}, 20.0);
        ASSERT_TRUE(r.is_free) << "node " << i;
        ASSERT_TRUE(index.upsert("n" + std::to_string(i), r.position, 20.0));
    }
    EXPECT_TRUE(index.overlapping_pairs().empty());

    const auto& ids = index.ids();
    for (std::size_t i = 0; i < ids.size(); ++i) {
        for (std::size_t j = i + 1; j < ids.size(); ++j) {
            const auto a = index.find(ids[i]);
            const auto b = index.find(ids[j]);
            EXPECT_GE(graph_model::distance(a->pos, b->pos), a->radius + b->radius + 10.0 - 1e-9);
        }
    }
}

TEST(SpatialIndexTest, OverlappingPairsReportsEachPairOnceInInsertionOrder) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("b", Vec2{30.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("c", Vec2{500.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("d", Vec2{0.0, 35.0}, 20.0));

    const auto pairs = index.overlapping_pairs();
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], std::make_pair(std::string("a"), std::string("b")));
    EXPECT_EQ(pairs[1], std::make_pair(std::string("a"), std::string("d")));
    EXPECT_EQ(pairs[2], std::make_pair(std::string("b"), std::string("d")));
}

TEST(SpatialIndexTest, QueryRectReturnsCentersInsideInInsertionOrder) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("z", Vec2{50.0, 50.0}, 20.0));
    ASSERT_TRUE(index.upsert("y", Vec2{10.0, 10.0}, 20.0));
    ASSERT_TRUE(index.upsert("x", Vec2{115.0, 50.0}, 20.0)); // disc overlaps rect, center outside
    ASSERT_TRUE(index.upsert("w", Vec2{90.0, 90.0}, 20.0));

    const auto ids = index.query_rect(Rect{0.0, 0.0, 100.0, 100.0});
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], "z");
    EXPECT_EQ(ids[1], "y");
    EXPECT_EQ(ids[2], "w");
}

TEST(SpatialIndexTest, QueryNearbyUsesDiscIntersection) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("b", Vec2{100.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("c", Vec2{300.0, 0.0}, 20.0));

    const auto near = index.query_nearby(Vec2{50.0, 0.0}, 30.0);
    ASSERT_EQ(near.size(), 2u);
    EXPECT_EQ(near[0], "a");
    EXPECT_EQ(near[1], "b");

    const auto excluded = index.query_nearby(Vec2{50.0, 0.0}, 30.0, "a");
    ASSERT_EQ(excluded.size(), 1u);
    EXPECT_EQ(excluded[0], "b");
}

TEST(SpatialIndexTest, PickPrefersNearestCenter) {
    SpatialIndex index;
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("b", Vec2{30.0, 0.0}, 20.0));

    EXPECT_EQ(index.pick(Vec2{10.0, 0.0}), std::optional<std::string>("a"));
    EXPECT_EQ(index.pick(Vec2{20.0, 0.0}), std::optional<std::string>("b"));
    // Equidistant: earlier insertion wins.
    EXPECT_EQ(index.pick(Vec2{15.0, 0.0}), std::optional<std::string>("a"));
    EXPECT_FALSE(index.pick(Vec2{0.0, 25.0}).has_value());
}

TEST(SpatialIndexTest, RemoveAndClearUpdateBounds) {
    SpatialIndex index;
    EXPECT_FALSE(index.content_bounds().has_value());
    ASSERT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
    ASSERT_TRUE(index.upsert("b", Vec2{100.0, 50.0}, 10.0));

    auto bounds = index.content_bounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_DOUBLE_EQ(bounds->x, -20.0);
    EXPECT_DOUBLE_EQ(bounds->y, -20.0);
    EXPECT_DOUBLE_EQ(bounds->right(), 110.0);
    EXPECT_DOUBLE_EQ(bounds->bottom(), 60.0);

    ASSERT_TRUE(index.remove("a"));
    EXPECT_FALSE(index.contains("a"));
    ASSERT_EQ(index.ids().size(), 1u);
    bounds = index.content_bounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_DOUBLE_EQ(bounds->x, 90.0);

    index.clear();
    EXPECT_EQ(index.size(), 0u);
    EXPECT_FALSE(index.content_bounds().has_value());
    EXPECT_TRUE(index.upsert("a", Vec2{0.0, 0.0}, 20.0));
}
