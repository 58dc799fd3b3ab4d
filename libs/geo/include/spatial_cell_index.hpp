#pragma once

#include <string>
#include <vector>

#include "geo_math.hpp"

namespace ridematch::geo {

/**
 * Maps points to fixed-resolution cell identifiers.
 *
 * Implementations must be deterministic: the same point and resolution
 * always yield the same id, and k_ring(point, res, k) always contains
 * cell_for_point(point, res).
 */
class SpatialCellIndex {
public:
    virtual ~SpatialCellIndex() = default;

    virtual std::string cell_for_point(const LatLng& point, int resolution) const = 0;

    /// Cells within k rings of the point's cell, origin first
    virtual std::vector<std::string> k_ring(const LatLng& point,
                                            int resolution,
                                            int k) const = 0;
};

/**
 * Square lat/lng grid.
 *
 * Cell edge shrinks by sqrt(7) per resolution step, with resolution 7
 * at roughly 1.2 km. Ids read "g<res>:<row>:<col>". Columns wrap at the
 * antimeridian; rows are clamped at the poles, so rings touching a pole
 * hold fewer than (2k+1)^2 cells.
 */
class GridCellIndex : public SpatialCellIndex {
public:
    static constexpr int kMinResolution = 0;
    static constexpr int kMaxResolution = 15;

    std::string cell_for_point(const LatLng& point, int resolution) const override;
    std::vector<std::string> k_ring(const LatLng& point,
                                    int resolution,
                                    int k) const override;

    /// Edge length in degrees for a resolution (clamped to the valid range)
    static double cell_size_degrees(int resolution);

private:
    struct Cell {
        long row;
        long col;
    };

    static Cell locate(const LatLng& point, double size);
    static std::string format_id(int resolution, long row, long col);
};

}  // namespace ridematch::geo
