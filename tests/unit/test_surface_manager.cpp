/**
 * @file test_surface_manager.cpp
 * @brief Unit tests for surface mutation and crater generation
 */

#include <gtest/gtest.h>
#include "crater/surface/surface_manager.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace crater::test {

using namespace crater::surface;

class SurfaceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        geometry = TableGeometry::standard({0.0, 0.0}, 500.0, 5.0);
    }

    // Compare a grid snapshot with the current state around a crater
    static void expect_crater_invariants(const SpatialGrid& before, const SpatialGrid& after,
                                         const Vec2& center, Real radius, Int32 reported) {
        Int32 changed = 0;
        for (Int32 row = 0; row < before.rows(); ++row) {
            for (Int32 col = 0; col < before.cols(); ++col) {
                CellType was = before.cell_at(col, row);
                CellType now = after.cell_at(col, row);
                Real d = before.cell_center(col, row).distance_to(center);

                if (was != now) {
                    ++changed;
                    EXPECT_EQ(was, CellType::Surface);
                    EXPECT_EQ(now, CellType::Destroyed);
                }
                if (d > radius) {
                    EXPECT_EQ(was, now) << "cell beyond radius changed at " << col << "," << row;
                }
                if (d <= 0.67 * radius && was == CellType::Surface) {
                    EXPECT_EQ(now, CellType::Destroyed) << "inner zone survived at " << col << "," << row;
                }
            }
        }
        EXPECT_EQ(changed, reported);
    }

    TableGeometry geometry;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(SurfaceManagerTest, BuildsGridFromGeometry) {
    SurfaceManager surface(geometry);
    EXPECT_EQ(surface.classify({0.0, 0.0}), CellType::Surface);
    EXPECT_TRUE(surface.is_walkable({0.0, 0.0}));
    EXPECT_EQ(surface.grid().cols(), 170);
    EXPECT_DOUBLE_EQ(surface.destroyed_fraction(), 0.0);
}

TEST_F(SurfaceManagerTest, RejectsInvalidConfiguration) {
    TableGeometry bad = geometry;
    bad.cell_size = 0.0;
    EXPECT_THROW(SurfaceManager{bad}, std::invalid_argument);

    CraterParams params;
    params.segment_count = 0;
    EXPECT_THROW(SurfaceManager(geometry, params), std::invalid_argument);

    params = CraterParams{};
    params.inner_fraction = 1.5;
    EXPECT_THROW(SurfaceManager(geometry, params), std::invalid_argument);
}

// ============================================================================
// Crater Invariants
// ============================================================================

/**
 * @brief Inner zone always destroyed, nothing beyond the radius touched,
 *        only Surface -> Destroyed transitions, count matches
 */
TEST_F(SurfaceManagerTest, CraterZonesHoldAcrossSeeds) {
    const std::vector<std::pair<Vec2, Real>> craters = {
        {{0.0, 0.0}, 50.0},
        {{-200.0, 40.0}, 23.0},
        {{340.0, 170.0}, 60.0},     // overlaps a corner pocket and barrier
        {{0.0, 185.0}, 35.0},       // overlaps a side pocket
        {{100.0, -100.0}, 7.5},
        {{-300.0, -150.0}, 120.0},
    };

    for (UInt64 seed : {UInt64{1}, UInt64{42}, UInt64{2024}}) {
        SurfaceManager surface(geometry, {}, seed);
        for (const auto& [center, radius] : craters) {
            SpatialGrid before = surface.grid();
            Int32 destroyed = surface.destroy_radius(center, radius, 0.3);
            expect_crater_invariants(before, surface.grid(), center, radius, destroyed);
        }
    }
}

TEST_F(SurfaceManagerTest, CraterIsRaggedBetweenZones) {
    SurfaceManager surface(geometry, {}, 7);
    const Vec2 center{0.0, 0.0};
    const Real radius = 60.0;

    SizeT inner = 0;
    SizeT full = 0;
    const auto& grid = surface.grid();
    for (Int32 row = 0; row < grid.rows(); ++row) {
        for (Int32 col = 0; col < grid.cols(); ++col) {
            Real d = grid.cell_center(col, row).distance_to(center);
            if (grid.cell_at(col, row) != CellType::Surface) continue;
            if (d <= 0.67 * radius) ++inner;
            if (d <= radius) ++full;
        }
    }

    Int32 destroyed = surface.destroy_radius(center, radius, 0.3);
    EXPECT_GE(static_cast<SizeT>(destroyed), inner);
    EXPECT_LE(static_cast<SizeT>(destroyed), full);
    EXPECT_GT(static_cast<SizeT>(destroyed), inner) << "outer zone should lose some cells";
}

TEST_F(SurfaceManagerTest, CraterIsIdempotentOnDestroyedCells) {
    SurfaceManager surface(geometry, {}, 5);
    const Vec2 center{50.0, 20.0};

    Int32 first = surface.destroy_radius(center, 40.0, 0.3);
    EXPECT_GT(first, 0);
    const SizeT destroyed_after_first = surface.grid().count(CellType::Destroyed);

    // Fully inside the first crater's guaranteed core
    EXPECT_EQ(surface.destroy_radius(center, 20.0, 0.3), 0);
    EXPECT_EQ(surface.grid().count(CellType::Destroyed), destroyed_after_first);

    // Overlapping crater only counts cells it actually changed
    SpatialGrid before = surface.grid();
    Int32 second = surface.destroy_radius(center, 45.0, 0.3);
    expect_crater_invariants(before, surface.grid(), center, 45.0, second);
    EXPECT_EQ(surface.grid().count(CellType::Destroyed),
              destroyed_after_first + static_cast<SizeT>(second));
}

TEST_F(SurfaceManagerTest, BarrierAndPocketsSurviveCraters) {
    SurfaceManager surface(geometry, {}, 11);
    const SizeT barrier = surface.grid().count(CellType::Barrier);
    const SizeT pocket = surface.grid().count(CellType::Pocket);

    surface.destroy_radius({355.0, 180.0}, 100.0, 0.3);
    surface.destroy_radius({0.0, 192.0}, 80.0, 1.0);
    surface.destroy_radius({-355.0, -180.0}, 150.0, 0.0);

    EXPECT_EQ(surface.grid().count(CellType::Barrier), barrier);
    EXPECT_EQ(surface.grid().count(CellType::Pocket), pocket);
}

TEST_F(SurfaceManagerTest, IgnoresInvalidRequests) {
    SurfaceManager surface(geometry);
    const Real nan = std::numeric_limits<Real>::quiet_NaN();

    EXPECT_EQ(surface.destroy_radius({0.0, 0.0}, 0.0, 0.3), 0);
    EXPECT_EQ(surface.destroy_radius({0.0, 0.0}, -5.0, 0.3), 0);
    EXPECT_EQ(surface.destroy_radius({nan, 0.0}, 10.0, 0.3), 0);
    EXPECT_EQ(surface.destroy_radius({5000.0, 5000.0}, 10.0, 0.3), 0);
    EXPECT_EQ(surface.grid().count(CellType::Destroyed), 0u);
}

TEST_F(SurfaceManagerTest, SameSeedSameCrater) {
    SurfaceManager a(geometry, {}, 123);
    SurfaceManager b(geometry, {}, 123);

    for (int i = 0; i < 5; ++i) {
        Vec2 c{-200.0 + 90.0 * i, -50.0 + 20.0 * i};
        EXPECT_EQ(a.destroy_radius(c, 45.0, 0.3), b.destroy_radius(c, 45.0, 0.3));
    }
    for (Int32 row = 0; row < a.grid().rows(); ++row) {
        for (Int32 col = 0; col < a.grid().cols(); ++col) {
            ASSERT_EQ(a.grid().cell_at(col, row), b.grid().cell_at(col, row));
        }
    }
}

TEST_F(SurfaceManagerTest, CustomParamsWidenGuaranteedCore) {
    CraterParams params;
    params.inner_fraction = 1.0;
    SurfaceManager surface(geometry, params, 9);

    SpatialGrid before = surface.grid();
    surface.destroy_radius({0.0, 0.0}, 30.0, 0.3);
    for (Int32 row = 0; row < before.rows(); ++row) {
        for (Int32 col = 0; col < before.cols(); ++col) {
            if (before.cell_at(col, row) == CellType::Surface &&
                before.cell_center(col, row).length() <= 30.0) {
                EXPECT_EQ(surface.grid().cell_at(col, row), CellType::Destroyed);
            }
        }
    }
}

// ============================================================================
// Point Destruction, Render Trigger, Rebuild
// ============================================================================

TEST_F(SurfaceManagerTest, MarkDestroyedSingleCell) {
    SurfaceManager surface(geometry);
    EXPECT_TRUE(surface.mark_destroyed({0.0, 0.0}));
    EXPECT_FALSE(surface.mark_destroyed({0.0, 0.0}));
    EXPECT_FALSE(surface.mark_destroyed({200.0, 210.0}));
    EXPECT_TRUE(surface.is_open_hazard({0.0, 0.0}));
    EXPECT_EQ(surface.statistics().cells_destroyed, 1u);
}

TEST_F(SurfaceManagerTest, RenderSinkFiresOnChange) {
    SurfaceManager surface(geometry, {}, 3);
    std::vector<SurfaceChange> changes;
    surface.set_render_sink([&](const SurfaceChange& c) { changes.push_back(c); });
    surface.consume_dirty();

    Int32 n = surface.destroy_radius({0.0, 0.0}, 30.0, 0.3);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].kind, SurfaceChangeKind::Crater);
    EXPECT_EQ(changes[0].cells_destroyed, n);
    EXPECT_DOUBLE_EQ(changes[0].radius, 30.0);
    EXPECT_TRUE(surface.consume_dirty());
    EXPECT_FALSE(surface.consume_dirty());

    // Nothing left to destroy: no render refresh
    surface.destroy_radius({0.0, 0.0}, 10.0, 0.3);
    surface.mark_destroyed({200.0, 210.0});
    EXPECT_EQ(changes.size(), 1u);
    EXPECT_FALSE(surface.dirty());

    surface.mark_destroyed({100.0, 100.0});
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[1].kind, SurfaceChangeKind::Point);
}

TEST_F(SurfaceManagerTest, RebuildRestoresSurface) {
    SurfaceManager surface(geometry, {}, 4);
    const SizeT intact = surface.grid().count(CellType::Surface);
    surface.destroy_radius({0.0, 0.0}, 80.0, 0.3);
    EXPECT_GT(surface.destroyed_fraction(), 0.0);
    EXPECT_EQ(surface.statistics().craters, 1u);

    surface.rebuild(geometry);
    EXPECT_EQ(surface.grid().count(CellType::Surface), intact);
    EXPECT_EQ(surface.grid().count(CellType::Destroyed), 0u);
    EXPECT_EQ(surface.statistics().craters, 0u);
}

TEST_F(SurfaceManagerTest, SupportFraction) {
    SurfaceManager surface(geometry, {}, 6);
    EXPECT_DOUBLE_EQ(surface.support_fraction({0.0, 0.0}, 10.0), 1.0);

    surface.destroy_radius({0.0, 0.0}, 60.0, 0.3);
    EXPECT_DOUBLE_EQ(surface.support_fraction({0.0, 0.0}, 10.0), 0.0);

    // Straddling the crater rim: some samples still on ground
    Real partial = surface.support_fraction({40.0, 0.0}, 30.0);
    EXPECT_GT(partial, 0.0);
    EXPECT_LT(partial, 1.0);
}

/**
 * @brief Barriers hold a point up; pockets and off-table points do not
 */
TEST_F(SurfaceManagerTest, SupportFractionByCellType) {
    SurfaceManager surface(geometry);
    const SpatialGrid& grid = surface.grid();

    bool found_barrier = false;
    for (Int32 row = 0; row < grid.rows() && !found_barrier; ++row) {
        for (Int32 col = 0; col < grid.cols(); ++col) {
            if (grid.cell_at(col, row) == CellType::Barrier) {
                EXPECT_DOUBLE_EQ(surface.support_fraction(grid.cell_center(col, row), 0.0), 1.0);
                found_barrier = true;
                break;
            }
        }
    }
    EXPECT_TRUE(found_barrier);

    ASSERT_FALSE(geometry.pocket_centers.empty());
    const Vec2 pocket = geometry.pocket_centers.front();
    ASSERT_EQ(surface.classify(pocket), CellType::Pocket);
    EXPECT_DOUBLE_EQ(surface.support_fraction(pocket, 0.0), 0.0);

    EXPECT_DOUBLE_EQ(surface.support_fraction({10000.0, 0.0}, 0.0), 0.0);
}

// ============================================================================
// Crater Cell Rules
// ============================================================================

/**
 * @brief With perturbation off, every cell follows the zone, edge and score rules
 */
TEST_F(SurfaceManagerTest, CraterFollowsCellRules) {
    CraterParams params;
    params.perturbation = 0.0;
    SurfaceManager surface(geometry, params, 11);
    const SpatialGrid before = surface.grid();

    const Vec2 center{20.0, -15.0};
    const Real radius = 70.0;
    const Real raggedness = 1.0;
    const Real inner = radius * params.inner_fraction;
    Int32 reported = surface.destroy_radius(center, radius, raggedness);

    Int32 expected_count = 0;
    Int32 band_survivors = 0;
    for (Int32 row = 0; row < before.rows(); ++row) {
        for (Int32 col = 0; col < before.cols(); ++col) {
            if (before.cell_at(col, row) != CellType::Surface) {
                continue;
            }
            Real d = (before.cell_center(col, row) - center).length();
            bool expected = false;
            if (d <= inner) {
                expected = true;
            } else if (d <= radius) {
                Real edge = edge_progress(d, inner, radius);
                expected = crater_score(edge, position_noise(col, row), raggedness, params) >
                           params.destroy_threshold;
                band_survivors += expected ? 0 : 1;
            }
            expected_count += expected ? 1 : 0;
            EXPECT_EQ(surface.grid().cell_at(col, row),
                      expected ? CellType::Destroyed : CellType::Surface)
                << "cell " << col << "," << row;
        }
    }
    EXPECT_EQ(reported, expected_count);
    EXPECT_GT(band_survivors, 0);
}

TEST_F(SurfaceManagerTest, RaggednessAboveOneActsAsOne) {
    SurfaceManager a(geometry, {}, 21);
    SurfaceManager b(geometry, {}, 21);
    EXPECT_EQ(a.destroy_radius({0.0, 0.0}, 60.0, 1.0), b.destroy_radius({0.0, 0.0}, 60.0, 4.0));
    for (Int32 row = 0; row < a.grid().rows(); ++row) {
        for (Int32 col = 0; col < a.grid().cols(); ++col) {
            EXPECT_EQ(a.grid().cell_at(col, row), b.grid().cell_at(col, row));
        }
    }
}

} // namespace crater::test
