#include "CoordMap.hxx"
#include "MeshErrors.hxx"

#include <cmath>

namespace CoordMap {

double roundTol(double x) {
    static const double scale = std::pow(10.0, kRoundDigits);
    return std::round(x * scale) / scale;
}

Plane parsePlane(const std::string& token) {
    if (token == "XY") return Plane::XY;
    if (token == "YZ") return Plane::YZ;
    if (token == "XZ") return Plane::XZ;
    throw InvalidTokenError("Invalid plane '" + token + "'. Select 'XY', 'YZ' or 'XZ'.");
}

Axis parseAxis(const std::string& token) {
    if (token == "X") return Axis::X;
    if (token == "Y") return Axis::Y;
    if (token == "Z") return Axis::Z;
    throw InvalidTokenError("Invalid axis '" + token + "'. Select 'X', 'Y' or 'Z'.");
}

const char* toString(Plane plane) {
    switch (plane) {
        case Plane::XY: return "XY";
        case Plane::YZ: return "YZ";
        case Plane::XZ: return "XZ";
    }
    throw InvalidTokenError("Invalid plane");
}

const char* toString(Axis axis) {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    throw InvalidTokenError("Invalid axis");
}

Point3 toGlobal(double u, double v, Plane plane, const Point3& origin) {
    switch (plane) {
        case Plane::XY: return { origin[0] + u, origin[1] + v, origin[2] };
        case Plane::YZ: return { origin[0], origin[1] + v, origin[2] + u };
        case Plane::XZ: return { origin[0] + u, origin[1], origin[2] + v };
    }
    throw InvalidTokenError("Invalid plane");
}

Point2 toLocal(const Point3& p, Plane plane, const Point3& origin) {
    switch (plane) {
        case Plane::XY: return { p[0] - origin[0], p[1] - origin[1] };
        case Plane::YZ: return { p[2] - origin[2], p[1] - origin[1] };
        case Plane::XZ: return { p[0] - origin[0], p[2] - origin[2] };
    }
    throw InvalidTokenError("Invalid plane");
}

Point3 toGlobal(double radius, double angle, double axial, Axis axis, const Point3& origin) {
    const double c = radius * std::cos(angle);
    const double s = radius * std::sin(angle);
    switch (axis) {
        case Axis::X: return { origin[0] + axial, origin[1] + s, origin[2] + c };
        case Axis::Y: return { origin[0] + c, origin[1] + axial, origin[2] + s };
        case Axis::Z: return { origin[0] + s, origin[1] + c, origin[2] + axial };
    }
    throw InvalidTokenError("Invalid axis");
}

Point2 toLocal(const Point3& p, Axis axis, const Point3& origin) {
    const double dx = p[0] - origin[0];
    const double dy = p[1] - origin[1];
    const double dz = p[2] - origin[2];
    switch (axis) {
        case Axis::X: return { std::sqrt(dy*dy + dz*dz), dx };
        case Axis::Y: return { std::sqrt(dx*dx + dz*dz), dy };
        case Axis::Z: return { std::sqrt(dx*dx + dy*dy), dz };
    }
    throw InvalidTokenError("Invalid axis");
}

} // namespace CoordMap
