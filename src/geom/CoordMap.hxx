#ifndef PLATEMESH_COORD_MAP_HXX
#define PLATEMESH_COORD_MAP_HXX

#include <array>
#include <string>

using Point3 = std::array<double, 3>; // global (X, Y, Z)
using Point2 = std::array<double, 2>; // local (u, v)

// Plane a rectangular mesh is parallel to.
enum class Plane { XY, YZ, XZ };

// Global axis a ring is revolved about.
enum class Axis { X, Y, Z };

// Mapping between a mesh's local coordinates and the model's global ones.
// Planar form: local (u, v) populates two global axes, the third takes the origin's value.
//   XY: X=u, Y=v   YZ: Z=u, Y=v   XZ: X=u, Z=v
// Revolved form: (radius, angle, axial offset) about a global axis through origin.
//   X: X=axial, Y=r sin, Z=r cos
//   Y: X=r cos, Y=axial, Z=r sin
//   Z: X=r sin, Y=r cos, Z=axial
namespace CoordMap {

// Number of decimal places used for every "close enough" comparison.
constexpr int kRoundDigits = 10;

// Round to kRoundDigits decimal places.
double roundTol(double x);

// Token parsing; throws InvalidTokenError on anything unrecognized.
Plane parsePlane(const std::string& token);
Axis parseAxis(const std::string& token);
const char* toString(Plane plane);
const char* toString(Axis axis);

Point3 toGlobal(double u, double v, Plane plane, const Point3& origin);
Point2 toLocal(const Point3& p, Plane plane, const Point3& origin);

Point3 toGlobal(double radius, double angle, double axial, Axis axis, const Point3& origin);

// Inverse of the revolved form: returns (radial distance from the axis, axial offset).
Point2 toLocal(const Point3& p, Axis axis, const Point3& origin);

} // namespace CoordMap

#endif // PLATEMESH_COORD_MAP_HXX
