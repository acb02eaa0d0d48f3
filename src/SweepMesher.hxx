#ifndef PLATEMESH_SWEEP_MESHER_HXX
#define PLATEMESH_SWEEP_MESHER_HXX

#include "Mesh.hxx"
#include "CoordMap.hxx"

// Summary of a sweep, filled on request.
struct SweepInfo {
    int innerQuads = 0;   // sectors on the first ring edge
    int outerQuads = 0;   // sectors on the last ring edge
    int rings = 0;        // rings stacked
    int transitions = 0;  // of which transition rings
};

// SweepMesher: meshes built by stacking rings from RingMesher and merging them.
// Adjoining rings are numbered so their shared edge nodes carry the same names;
// the merge keeps the first ring's node and repoints the next ring's elements.
class SweepMesher {
public:
    // Flat annulus meshed from the inner radius outward. The circumferential sector
    // count starts at floor(2*pi*innerRadius/meshSize) and triples through a
    // transition ring whenever the sector width exceeds three times meshSize.
    // Throws MeshError if that count is below two.
    static Mesh annulus(double meshSize, double outerRadius, double innerRadius,
                        const MeshParams& params, const Point3& origin = {0.0, 0.0, 0.0},
                        Axis axis = Axis::Y, SweepInfo* info = nullptr);

    // Annulus between smallRadius and largeRadius, then every node moved along the
    // axis by (r - largeRadius) / (largeRadius - smallRadius) * height.
    static Mesh frustum(double meshSize, double largeRadius, double smallRadius, double height,
                        const MeshParams& params, const Point3& origin = {0.0, 0.0, 0.0},
                        Axis axis = Axis::Y, SweepInfo* info = nullptr);

    // Cylinder from center up to center + height along the axis. numQuads <= 0 means
    // round(2*pi*radius/meshSize) sectors. Fewer than two sectors throws MeshError.
    static Mesh cylinder(double meshSize, double radius, double height,
                         const MeshParams& params, const Point3& center = {0.0, 0.0, 0.0},
                         Axis axis = Axis::Y, int numQuads = 0,
                         ElementType type = ElementType::Quad, SweepInfo* info = nullptr);
};

#endif // PLATEMESH_SWEEP_MESHER_HXX
