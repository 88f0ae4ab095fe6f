#pragma once
/**
 * @file surface_manager.h
 * @brief Owner of the table grid and its destructive mutations
 *
 * SurfaceManager builds the SpatialGrid from table geometry and is the only
 * writer of cell state. Craters are carved with a two-zone, angularly
 * perturbed, noise-biased pass so holes come out ragged instead of round.
 * Hosts observe changes through a render sink or by polling the dirty flag.
 */

#include "crater/core/types.h"
#include "crater/core/random.h"
#include "crater/surface/crater_shape.h"
#include "crater/surface/spatial_grid.h"
#include "crater/surface/table_geometry.h"
#include <functional>

namespace crater::surface {

/**
 * @brief One radius-based destruction request
 */
struct CraterRequest {
    Vec2 center{};
    Real radius{0.0};
    Real raggedness{0.3};
};

// ============================================================================
// Change Notification
// ============================================================================

enum class SurfaceChangeKind : UInt8 {
    Crater,
    Point,
    Rebuild
};

/**
 * @brief What changed, handed to the render sink
 */
struct SurfaceChange {
    SurfaceChangeKind kind{SurfaceChangeKind::Crater};
    Vec2 center{};
    Real radius{0.0};
    Int32 cells_destroyed{0};
};

using RenderSink = std::function<void(const SurfaceChange&)>;

/**
 * @brief Per-round surface statistics
 */
struct SurfaceStatistics {
    UInt64 craters{0};               ///< destroy_radius calls that destroyed at least one cell
    UInt64 cells_destroyed{0};       ///< Cells destroyed by any operation
};

// ============================================================================
// SurfaceManager
// ============================================================================

class SurfaceManager {
public:
    /**
     * @brief Build the grid for a round
     * @param geometry Table geometry
     * @param params Crater tuning
     * @param seed Seed for crater perturbations
     * @param call_counter Persisted draw counter for resuming a sequence
     * @throws std::invalid_argument on invalid geometry or parameters
     */
    explicit SurfaceManager(const TableGeometry& geometry,
                            const CraterParams& params = {},
                            UInt64 seed = 0,
                            UInt64 call_counter = 0);

    // Non-copyable (owns round state and a sink)
    SurfaceManager(const SurfaceManager&) = delete;
    SurfaceManager& operator=(const SurfaceManager&) = delete;

    SurfaceManager(SurfaceManager&&) noexcept = default;
    SurfaceManager& operator=(SurfaceManager&&) noexcept = default;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * @brief Carve a ragged crater
     *
     * Surface cells whose centers lie within inner_fraction x radius are
     * always destroyed. Cells beyond radius are never touched. Between the
     * two, destruction follows the perturbed falloff and positional noise.
     * Barrier, Pocket and Destroyed cells are ignored.
     *
     * @return Number of cells newly destroyed
     */
    Int32 destroy_radius(const Vec2& center, Real radius, Real raggedness);
    Int32 destroy_radius(const CraterRequest& request) {
        return destroy_radius(request.center, request.radius, request.raggedness);
    }

    /**
     * @brief Destroy the single Surface cell under a point
     * @return true if a cell changed
     */
    bool mark_destroyed(const Vec2& point);

    /**
     * @brief Start a new round on fresh geometry; restores every cell
     */
    void rebuild(const TableGeometry& geometry);

    // ========================================================================
    // Queries
    // ========================================================================

    CellType classify(const Vec2& p) const noexcept { return grid_.classify(p); }
    bool is_walkable(const Vec2& p) const noexcept { return grid_.is_walkable(p); }
    bool is_open_hazard(const Vec2& p) const noexcept { return grid_.is_open_hazard(p); }

    /**
     * @brief Fraction of a disc's sample points that still have ground
     *
     * Samples the center plus @p samples points on the rim. A sample
     * counts as supported when it lies on Surface or Barrier.
     */
    Real support_fraction(const Vec2& center, Real radius, Int32 samples = 8) const;

    /// Destroyed / (Surface + Destroyed); 0 for a grid without playable cells
    Real destroyed_fraction() const noexcept;

    const SpatialGrid& grid() const noexcept { return grid_; }
    const TableGeometry& geometry() const noexcept { return geometry_; }
    const CraterParams& crater_params() const noexcept { return params_; }
    const SurfaceStatistics& statistics() const noexcept { return stats_; }
    const SeededRandom& random() const noexcept { return rng_; }

    // ========================================================================
    // Render Trigger
    // ========================================================================

    /**
     * @brief Callback invoked after any mutation that changed cells
     */
    void set_render_sink(RenderSink sink) { render_sink_ = std::move(sink); }

    bool dirty() const noexcept { return dirty_; }

    /// Return and clear the dirty flag
    bool consume_dirty() noexcept;

private:
    void notify(const SurfaceChange& change);

    TableGeometry geometry_;
    SpatialGrid grid_;
    CraterParams params_;
    SeededRandom rng_;
    RenderSink render_sink_;
    SurfaceStatistics stats_;
    bool dirty_{true};
};

} // namespace crater::surface
