#ifndef PLATEMESH_RECTANGLE_MESHER_HXX
#define PLATEMESH_RECTANGLE_MESHER_HXX

#include "Mesh.hxx"
#include "CoordMap.hxx"

#include <string>
#include <vector>

// Rectangular opening in the mesh's local (x, y) coordinate system.
struct RectOpening {
    std::string name;
    double xLeft = 0.0;
    double yBottom = 0.0;
    double width = 0.0;
    double height = 0.0;
};

// RectangleMesher: structured grid of Quad or Rect elements over a width x height
// rectangle lying in a global plane, with optional rectangular openings cut out.
//
// Nodes are numbered row-major from the first node name; elements likewise from the
// first element name, except that Rect elements always take the prefix 'R'. Grid
// lines always pass through the caller's control points and the edges of every opening.
class RectangleMesher {
public:
    RectangleMesher(double meshSize, double width, double height, const MeshParams& params,
                    const Point3& origin = {0.0, 0.0, 0.0}, Plane plane = Plane::XY,
                    ElementType type = ElementType::Quad);

    // Control points along the local x / y axis
    void addXControl(double x) { xControl_.push_back(x); }
    void addYControl(double y) { yControl_.push_back(y); }
    const std::vector<double>& xControl() const { return xControl_; }
    const std::vector<double>& yControl() const { return yControl_; }

    // Register an opening and force grid lines onto its edges. Reusing a name
    // replaces the earlier opening's rectangle.
    void addRectOpening(const std::string& name, double xLeft, double yBottom, double width, double height);
    const std::vector<RectOpening>& openings() const { return openings_; }

    // Build the mesh. Throws InvalidNameError, MeshError.
    Mesh generate() const;

    // Node position in the mesh's local coordinate system
    Point2 localCoords(const Node& node) const { return CoordMap::toLocal(node.coords(), plane_, origin_); }

private:
    void cutOpenings(Mesh& M) const;

    double meshSize_;
    double width_;
    double height_;
    MeshParams params_;
    Point3 origin_;
    Plane plane_;
    ElementType type_;
    std::vector<double> xControl_;
    std::vector<double> yControl_;
    std::vector<RectOpening> openings_;
};

#endif // PLATEMESH_RECTANGLE_MESHER_HXX
