#include "MeshResults.hxx"
#include "MeshErrors.hxx"

#include <algorithm>

namespace {

enum class Force { Shear, Moment };

static int shearIndex(const std::string& direction) {
    if (direction == "Qx") return 0;
    if (direction == "Qy") return 1;
    throw InvalidTokenError("Invalid direction '" + direction + "' for mesh shear results. Valid values are 'Qx' or 'Qy'");
}

static int momentIndex(const std::string& direction) {
    if (direction == "Mx") return 0;
    if (direction == "My") return 1;
    if (direction == "Mxy") return 2;
    throw InvalidTokenError("Invalid direction '" + direction + "' for mesh moment results. Valid values are 'Mx', 'My' or 'Mxy'");
}

static double component(const PlateResults& R, const Element& e, Force f, int idx,
                        double x, double y, const std::string& combo) {
    if (f == Force::Shear) return R.shear(e, x, y, combo)[static_cast<std::size_t>(idx)];
    return R.moment(e, x, y, combo)[static_cast<std::size_t>(idx)];
}

// Shared scan; wantMax selects the extreme
static std::optional<double> scan(const Mesh& M, const PlateResults& R, Force f, int idx,
                                  const std::optional<std::string>& combo, bool wantMax) {
    std::optional<double> best;
    for (const auto& e : M.elements) {
        const auto pts = MeshResults::samplePoints(*e);
        for (const auto& name : R.loadCombos(*e)) {
            if (combo && *combo != name) continue;
            for (const auto& p : pts) {
                const double v = component(R, *e, f, idx, p[0], p[1], name);
                if (!best || (wantMax ? v > *best : v < *best)) best = v;
            }
        }
    }
    return best;
}

}

namespace MeshResults {

std::array<std::array<double,2>,5> samplePoints(const Element& e) {
    double xi, yi, xj, yj, xm, ym, xn, yn;
    if (e.type == ElementType::Rect) {
        const double w = Mesh::distance(*e.iNode, *e.jNode);
        const double h = Mesh::distance(*e.jNode, *e.mNode);
        xi = 0.0; yi = 0.0;
        xj = w;   yj = 0.0;
        xm = w;   ym = h;
        xn = 0.0; yn = h;
    } else {
        xi = -1.0; yi = -1.0;
        xj =  1.0; yj = -1.0;
        xm =  1.0; ym =  1.0;
        xn = -1.0; yn =  1.0;
    }
    return {{ {xi, yi}, {xj, yj}, {xm, ym}, {xn, yn}, {(xi + xj) / 2.0, (yi + yn) / 2.0} }};
}

std::optional<double> maxShear(const Mesh& M, const PlateResults& R, const std::string& direction,
                               const std::optional<std::string>& combo) {
    return scan(M, R, Force::Shear, shearIndex(direction), combo, true);
}

std::optional<double> minShear(const Mesh& M, const PlateResults& R, const std::string& direction,
                               const std::optional<std::string>& combo) {
    return scan(M, R, Force::Shear, shearIndex(direction), combo, false);
}

std::optional<double> maxMoment(const Mesh& M, const PlateResults& R, const std::string& direction,
                                const std::optional<std::string>& combo) {
    return scan(M, R, Force::Moment, momentIndex(direction), combo, true);
}

std::optional<double> minMoment(const Mesh& M, const PlateResults& R, const std::string& direction,
                                const std::optional<std::string>& combo) {
    return scan(M, R, Force::Moment, momentIndex(direction), combo, false);
}

} // namespace MeshResults
