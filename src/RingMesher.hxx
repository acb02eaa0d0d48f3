#ifndef PLATEMESH_RING_MESHER_HXX
#define PLATEMESH_RING_MESHER_HXX

#include "Mesh.hxx"
#include "CoordMap.hxx"

// One circular edge of a ring: radius about the axis and offset along it.
struct RingEdge {
    double radius;
    double axial;
};

// RingMesher: single circumferential bands of quadrilaterals revolved about a
// global axis through origin.
//
// Node numbering starts at params.firstNode, element numbering at params.firstElement.
// Corners run (first edge current, first edge next, second edge next, second edge
// current), i.e. counter-clockwise seen from the positive end of the axis when the
// first edge is the inner one. Sector numbering wraps so the last element closes the ring.
class RingMesher {
public:
    // n nodes on the first edge, then n on the second; n elements. n must be at least 2.
    static Mesh ring(const RingEdge& first, const RingEdge& second, int numQuads,
                     const MeshParams& params, const Point3& origin, Axis axis,
                     ElementType type = ElementType::Quad);

    // Flat ring between innerRadius and outerRadius
    static Mesh annulusRing(double outerRadius, double innerRadius, int numQuads,
                            const MeshParams& params, const Point3& origin = {0.0, 0.0, 0.0},
                            Axis axis = Axis::Y);

    // Cylindrical ring from origin up to origin + height along the axis
    static Mesh cylinderRing(double radius, double height, int numQuads,
                             const MeshParams& params, const Point3& origin = {0.0, 0.0, 0.0},
                             Axis axis = Axis::Y, ElementType type = ElementType::Quad);

    // Flat ring with numInnerQuads sectors on the inner edge and three times as many
    // on the outer edge. Nodes: n inner, 2n at the mid radius, 3n outer. Elements:
    // n fan quads against the inner edge followed by 3n transition quads.
    static Mesh transitionRing(double outerRadius, double innerRadius, int numInnerQuads,
                               const MeshParams& params, const Point3& origin = {0.0, 0.0, 0.0},
                               Axis axis = Axis::Y);
};

#endif // PLATEMESH_RING_MESHER_HXX
