#ifndef PLATEMESH_GRID_BUILDER_HXX
#define PLATEMESH_GRID_BUILDER_HXX

#include <vector>

// One stretch of the grid between two adjacent control points.
struct GridSegment {
    double start;   // coordinate of the lower control point
    double length;  // distance to the next control point
    int count;      // number of elements in the segment
    double size;    // element size; count * size reproduces length
};

// GridBuilder: spaces grid lines along a span [0, L] so that every control point
// falls exactly on a grid line and each segment between control points is meshed
// independently with elements no larger than the target size.
class GridBuilder {
public:
    // Throws MeshError if meshSize is not positive.
    explicit GridBuilder(double meshSize);

    // Add 0 and span to the caller's points, drop points outside [0, span],
    // sort and remove duplicates (compared at CoordMap::kRoundDigits places).
    static std::vector<double> normalizeControls(const std::vector<double>& points, double span);

    // Per-segment counts and sizes for sorted, duplicate-free control points.
    std::vector<GridSegment> segments(const std::vector<double>& controls) const;

    // Grid line coordinates, strictly increasing, first and last equal to the
    // first and last control point.
    std::vector<double> coordinates(const std::vector<double>& controls) const;

    double meshSize() const { return meshSize_; }

private:
    double meshSize_;
};

#endif // PLATEMESH_GRID_BUILDER_HXX
