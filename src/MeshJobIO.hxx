#ifndef PLATEMESH_MESH_JOB_IO_HXX
#define PLATEMESH_MESH_JOB_IO_HXX

#include "Mesh.hxx"
#include "CoordMap.hxx"
#include "RectangleMesher.hxx"
#include "SweepMesher.hxx"

#include <string>
#include <vector>

enum class MeshKind { Rectangle, Annulus, Frustum, Cylinder };

// Everything needed to run one generator. Fields a kind does not use are ignored.
struct MeshJob {
    MeshKind kind = MeshKind::Rectangle;
    double meshSize = 0.0;
    double width = 0.0;        // rectangle
    double height = 0.0;       // rectangle, frustum, cylinder
    double outerRadius = 0.0;  // annulus; large radius of a frustum
    double innerRadius = 0.0;  // annulus; small radius of a frustum
    double radius = 0.0;       // cylinder
    int numQuads = 0;          // cylinder sectors, 0 derives them from meshSize
    MeshParams params;
    Point3 origin{0.0, 0.0, 0.0};
    Plane plane = Plane::XY;
    Axis axis = Axis::Y;
    ElementType elementType = ElementType::Quad;
    std::vector<double> xControl;
    std::vector<double> yControl;
    std::vector<RectOpening> openings;
};

namespace MeshJobIO {
// Mesh job text format (v1):
// * comment line
// mesh <rectangle|annulus|frustum|cylinder>
// mesh_size <s>
// width <w> / height <h>
// outer_radius <r> / inner_radius <r>      (large_radius / small_radius for frustums)
// radius <r> / num_quads <n>
// thickness <t> / modulus <E> / poisson <nu> / kx_mod <k> / ky_mod <k>
// first_node <N1> / first_element <Q1>
// origin <x> <y> <z>
// plane <XY|YZ|XZ> / axis <X|Y|Z> / element_type <Quad|Rect>
// x_control <x0> <x1> ... / y_control <y0> <y1> ...
// opening <name> <x_left> <y_bottom> <width> <height>
// end
// Text after '#' is ignored.

MeshKind parseKind(const std::string& token); // throws InvalidTokenError
const char* toString(MeshKind kind);

bool readFile(const std::string& path, MeshJob& out, std::string* errorMessage = nullptr);
bool writeFile(const std::string& path, const MeshJob& job, std::string* errorMessage = nullptr);

// Run the generator for job.kind. Throws MeshError (and subclasses).
Mesh generate(const MeshJob& job, SweepInfo* info = nullptr);
}

#endif // PLATEMESH_MESH_JOB_IO_HXX
