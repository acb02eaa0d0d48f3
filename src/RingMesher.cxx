#include "RingMesher.hxx"
#include "MeshErrors.hxx"

#include <cmath>
#include <string>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

Mesh RingMesher::ring(const RingEdge& first, const RingEdge& second, int numQuads,
                      const MeshParams& params, const Point3& origin, Axis axis,
                      ElementType type) {
    const NameSeq nodeNames = NameSeq::parse(params.firstNode);
    const NameSeq elemNames = NameSeq::parse(params.firstElement);
    if (numQuads < 2) throw MeshError("A ring needs at least two sectors");
    if (!(first.radius > 0.0) || !(second.radius > 0.0)) throw MeshError("Ring radii must be positive");
    if (first.radius == second.radius && first.axial == second.axial) {
        throw MeshError("Ring edges coincide");
    }

    const int n = numQuads;
    const double theta = 2.0 * kPi / n; // angle between nodes

    Mesh M(params);
    for (int k = 0; k < n; ++k) {
        M.addNode(nodeNames.at(k), CoordMap::toGlobal(first.radius, theta * k, first.axial, axis, origin));
    }
    for (int k = 0; k < n; ++k) {
        M.addNode(nodeNames.at(n + k), CoordMap::toGlobal(second.radius, theta * k, second.axial, axis, origin));
    }

    for (int k = 0; k < n; ++k) {
        const int next = (k + 1) % n;
        M.addElement(elemNames.at(k), type,
                     nodeNames.at(k), nodeNames.at(next),
                     nodeNames.at(n + next), nodeNames.at(n + k));
    }
    return M;
}

Mesh RingMesher::annulusRing(double outerRadius, double innerRadius, int numQuads,
                             const MeshParams& params, const Point3& origin, Axis axis) {
    if (!(outerRadius > innerRadius)) throw MeshError("Outer radius must exceed inner radius");
    return ring({innerRadius, 0.0}, {outerRadius, 0.0}, numQuads, params, origin, axis);
}

Mesh RingMesher::cylinderRing(double radius, double height, int numQuads,
                              const MeshParams& params, const Point3& origin, Axis axis,
                              ElementType type) {
    if (!(height > 0.0)) throw MeshError("Cylinder ring height must be positive");
    return ring({radius, 0.0}, {radius, height}, numQuads, params, origin, axis, type);
}

Mesh RingMesher::transitionRing(double outerRadius, double innerRadius, int numInnerQuads,
                                const MeshParams& params, const Point3& origin, Axis axis) {
    const NameSeq nodeNames = NameSeq::parse(params.firstNode);
    const NameSeq elemNames = NameSeq::parse(params.firstElement);
    if (numInnerQuads < 2) throw MeshError("A ring needs at least two sectors");
    if (!(innerRadius > 0.0)) throw MeshError("Ring radii must be positive");
    if (!(outerRadius > innerRadius)) throw MeshError("Outer radius must exceed inner radius");

    const int n = numInnerQuads;
    const double r1 = innerRadius;
    const double r2 = (innerRadius + outerRadius) / 2.0;
    const double r3 = outerRadius;
    const double theta1 = 2.0 * kPi / n;        // inner edge
    const double theta3 = 2.0 * kPi / (3 * n);  // mid radius and outer edge

    // Local node indices
    auto inner = [n](int k) { return k % n; };
    auto mid = [n](int k) { return n + k; };
    auto outer = [n](int k) { return 3 * n + k % (3 * n); };

    Mesh M(params);
    for (int k = 0; k < n; ++k) {
        M.addNode(nodeNames.at(inner(k)), CoordMap::toGlobal(r1, theta1 * k, 0.0, axis, origin));
    }
    // Two mid nodes per inner sector, at one and two thirds of the sector
    for (int k = 0; k < n; ++k) {
        M.addNode(nodeNames.at(mid(2 * k)), CoordMap::toGlobal(r2, theta3 * (3 * k + 1), 0.0, axis, origin));
        M.addNode(nodeNames.at(mid(2 * k + 1)), CoordMap::toGlobal(r2, theta3 * (3 * k + 2), 0.0, axis, origin));
    }
    for (int k = 0; k < 3 * n; ++k) {
        M.addNode(nodeNames.at(outer(k)), CoordMap::toGlobal(r3, theta3 * k, 0.0, axis, origin));
    }

    long e = 0;
    auto quad = [&](int i, int j, int m, int nn) {
        M.addElement(elemNames.at(e++), ElementType::Quad,
                     nodeNames.at(i), nodeNames.at(j), nodeNames.at(m), nodeNames.at(nn));
    };

    // Inner fan: each inner sector against its two mid nodes
    for (int k = 0; k < n; ++k) {
        quad(inner(k), inner(k + 1), mid(2 * k + 1), mid(2 * k));
    }
    // Per inner sector three outer sectors: the first and last converge on the
    // inner nodes, the middle one spans the two mid nodes
    for (int q = 0; q < n; ++q) {
        quad(inner(q), mid(2 * q), outer(3 * q + 1), outer(3 * q));
        quad(mid(2 * q), mid(2 * q + 1), outer(3 * q + 2), outer(3 * q + 1));
        quad(mid(2 * q + 1), inner(q + 1), outer(3 * q + 3), outer(3 * q + 2));
    }
    return M;
}
