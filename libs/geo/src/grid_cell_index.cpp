#include "spatial_cell_index.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ridematch::geo {

namespace {

constexpr double kKmPerDegree = 111.32;
constexpr double kResolution7EdgeKm = 1.2;
constexpr int kReferenceResolution = 7;

}  // namespace

double GridCellIndex::cell_size_degrees(int resolution) {
    int res = std::clamp(resolution, kMinResolution, kMaxResolution);
    double edge_km = kResolution7EdgeKm *
                     std::pow(std::sqrt(7.0), kReferenceResolution - res);
    return edge_km / kKmPerDegree;
}

GridCellIndex::Cell GridCellIndex::locate(const LatLng& point, double size) {
    long row = static_cast<long>(std::floor((point.latitude + 90.0) / size));
    long col = static_cast<long>(std::floor((point.longitude + 180.0) / size));
    return Cell{row, col};
}

std::string GridCellIndex::format_id(int resolution, long row, long col) {
    std::ostringstream ss;
    ss << "g" << resolution << ":" << row << ":" << col;
    return ss.str();
}

std::string GridCellIndex::cell_for_point(const LatLng& point, int resolution) const {
    int res = std::clamp(resolution, kMinResolution, kMaxResolution);
    double size = cell_size_degrees(res);
    Cell cell = locate(point, size);
    return format_id(res, cell.row, cell.col);
}

std::vector<std::string> GridCellIndex::k_ring(const LatLng& point,
                                               int resolution,
                                               int k) const {
    int res = std::clamp(resolution, kMinResolution, kMaxResolution);
    double size = cell_size_degrees(res);
    Cell origin = locate(point, size);

    long max_row = static_cast<long>(std::floor(180.0 / size));
    long num_cols = static_cast<long>(std::ceil(360.0 / size));
    int radius = std::max(k, 0);

    std::vector<std::string> cells;
    cells.reserve(static_cast<size_t>((2 * radius + 1) * (2 * radius + 1)));
    cells.push_back(format_id(res, origin.row, origin.col));

    for (long dr = -radius; dr <= radius; ++dr) {
        long row = origin.row + dr;
        if (row < 0 || row > max_row) continue;
        for (long dc = -radius; dc <= radius; ++dc) {
            if (dr == 0 && dc == 0) continue;
            long col = ((origin.col + dc) % num_cols + num_cols) % num_cols;
            cells.push_back(format_id(res, row, col));
        }
    }

    // Wrapping can alias columns on coarse grids
    std::sort(cells.begin() + 1, cells.end());
    cells.erase(std::unique(cells.begin() + 1, cells.end()), cells.end());
    cells.erase(std::remove(cells.begin() + 1, cells.end(), cells.front()),
                cells.end());
    return cells;
}

}  // namespace ridematch::geo
