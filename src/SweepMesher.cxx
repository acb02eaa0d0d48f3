#include "SweepMesher.hxx"
#include "RingMesher.hxx"
#include "MeshErrors.hxx"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;

static inline MeshParams ringParams(const MeshParams& base, const NameSeq& nodes, long n,
                                    const NameSeq& elems, long q) {
    MeshParams p = base;
    p.firstNode = std::string(1, nodes.prefix) + std::to_string(n);
    p.firstElement = std::string(1, elems.prefix) + std::to_string(q);
    return p;
}
}

Mesh SweepMesher::annulus(double meshSize, double outerRadius, double innerRadius,
                          const MeshParams& params, const Point3& origin, Axis axis,
                          SweepInfo* info) {
    const NameSeq nodeNames = NameSeq::parse(params.firstNode);
    const NameSeq elemNames = NameSeq::parse(params.firstElement);
    if (!(meshSize > 0.0)) throw MeshError("Mesh size must be positive");
    if (!(innerRadius > 0.0)) throw MeshError("Inner radius must be positive");
    if (!(outerRadius > innerRadius)) throw MeshError("Outer radius must exceed inner radius");

    long n = nodeNames.first;
    long q = elemNames.first;

    int nCirc = static_cast<int>(2.0 * kPi * innerRadius / meshSize);
    if (nCirc < 2) throw MeshError("Inner radius is too small for the mesh size: fewer than two sectors");
    SweepInfo summary;
    summary.innerQuads = nCirc;

    Mesh M(params);
    double rInner = innerRadius;
    while (CoordMap::roundTol(rInner) < CoordMap::roundTol(outerRadius)) {
        const double radial = outerRadius - rInner;               // remaining radial depth
        const double bCirc = 2.0 * kPi * rInner / nCirc;          // element width around the ring
        const double ratio = CoordMap::roundTol(radial / std::min(meshSize, 3.0 * bCirc));
        const int nRad = std::max(1, static_cast<int>(std::floor(ratio)));
        const double hRad = radial / nRad;                        // ring height

        const MeshParams rp = ringParams(params, nodeNames, n, elemNames, q);
        if (bCirc > 3.0 * meshSize) {
            // Elements are getting too wide: triple the sector count across this ring
            M.merge(RingMesher::transitionRing(rInner + hRad, rInner, nCirc, rp, origin, axis));
            n += 3L * nCirc;
            q += 4L * nCirc;
            nCirc *= 3;
            ++summary.transitions;
        } else {
            M.merge(RingMesher::annulusRing(rInner + hRad, rInner, nCirc, rp, origin, axis));
            n += nCirc;
            q += nCirc;
        }
        ++summary.rings;
        rInner += hRad;
    }

    summary.outerQuads = nCirc;
    if (info) *info = summary;
    return M;
}

Mesh SweepMesher::frustum(double meshSize, double largeRadius, double smallRadius, double height,
                          const MeshParams& params, const Point3& origin, Axis axis,
                          SweepInfo* info) {
    if (!(largeRadius > smallRadius)) throw MeshError("Large radius must exceed small radius");
    Mesh M = annulus(meshSize, largeRadius, smallRadius, params, origin, axis, info);

    // Taper the flat annulus using each node's own radius
    const double slope = height / (largeRadius - smallRadius);
    for (auto& node : M.nodes) {
        const double r = CoordMap::toLocal(node->coords(), axis, origin)[0];
        const double offset = (r - largeRadius) * slope;
        switch (axis) {
            case Axis::X: node->X += offset; break;
            case Axis::Y: node->Y += offset; break;
            case Axis::Z: node->Z += offset; break;
        }
    }
    return M;
}

Mesh SweepMesher::cylinder(double meshSize, double radius, double height,
                           const MeshParams& params, const Point3& center, Axis axis,
                           int numQuads, ElementType type, SweepInfo* info) {
    const NameSeq nodeNames = NameSeq::parse(params.firstNode);
    const NameSeq elemNames = NameSeq::parse(params.firstElement);
    if (!(meshSize > 0.0)) throw MeshError("Mesh size must be positive");
    if (!(radius > 0.0)) throw MeshError("Cylinder radius must be positive");
    if (!(height > 0.0)) throw MeshError("Cylinder height must be positive");

    if (numQuads <= 0) {
        numQuads = static_cast<int>(std::round(2.0 * kPi * radius / meshSize));
    }
    if (numQuads < 2) throw MeshError("A cylinder needs at least two sectors");

    long n = nodeNames.first;
    long q = elemNames.first;
    SweepInfo summary;
    summary.innerQuads = summary.outerQuads = numQuads;

    Mesh M(params);
    double y = 0.0; // height meshed so far
    while (CoordMap::roundTol(y) < CoordMap::roundTol(height)) {
        const double remaining = height - y;
        const int nVert = std::max(1, static_cast<int>(std::ceil(CoordMap::roundTol(remaining / meshSize))));
        const double hY = remaining / nVert;

        // Every ring shares the center; the shared edge's axial offset is the same
        // double on both sides (y + hY here, y on the next pass)
        const MeshParams rp = ringParams(params, nodeNames, n, elemNames, q);
        M.merge(RingMesher::ring({radius, y}, {radius, y + hY}, numQuads, rp, center, axis, type));
        n += numQuads;
        q += numQuads;
        ++summary.rings;
        y += hY;
    }

    if (info) *info = summary;
    return M;
}
