#include "GridBuilder.hxx"
#include "CoordMap.hxx"
#include "MeshErrors.hxx"

#include <algorithm>
#include <cmath>

GridBuilder::GridBuilder(double meshSize) : meshSize_(meshSize) {
    if (!(meshSize > 0.0)) throw MeshError("Mesh size must be positive");
}

std::vector<double> GridBuilder::normalizeControls(const std::vector<double>& points, double span) {
    if (!(span > 0.0)) throw MeshError("Grid span must be positive");
    const double hi = CoordMap::roundTol(span);
    std::vector<double> out;
    out.reserve(points.size() + 2);
    out.push_back(0.0);
    out.push_back(span);
    for (double p : points) {
        const double r = CoordMap::roundTol(p);
        if (r < 0.0 || r > hi) continue;
        out.push_back(p);
    }
    std::sort(out.begin(), out.end());
    std::vector<double> unique;
    unique.reserve(out.size());
    for (double p : out) {
        if (!unique.empty() && CoordMap::roundTol(unique.back()) == CoordMap::roundTol(p)) {
            // Keep the exact boundary value over a near-duplicate caller point
            if (p == 0.0 || p == span) unique.back() = p;
            continue;
        }
        unique.push_back(p);
    }
    return unique;
}

std::vector<GridSegment> GridBuilder::segments(const std::vector<double>& controls) const {
    std::vector<GridSegment> segs;
    if (controls.size() < 2) return segs;
    segs.reserve(controls.size() - 1);
    for (std::size_t k = 0; k + 1 < controls.size(); ++k) {
        GridSegment s;
        s.start = controls[k];
        s.length = controls[k + 1] - controls[k];
        // Ratio rounded first so that e.g. 2.0000000000004 does not add an element
        const double ratio = CoordMap::roundTol(s.length / meshSize_);
        s.count = std::max(1, static_cast<int>(std::ceil(ratio)));
        s.size = s.length / s.count;
        segs.push_back(s);
    }
    return segs;
}

std::vector<double> GridBuilder::coordinates(const std::vector<double>& controls) const {
    std::vector<double> coords;
    if (controls.empty()) return coords;
    const auto segs = segments(controls);
    for (const auto& s : segs) {
        for (int i = 0; i < s.count; ++i) coords.push_back(s.start + i * s.size);
    }
    coords.push_back(controls.back());
    return coords;
}
