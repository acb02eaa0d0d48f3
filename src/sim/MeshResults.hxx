#ifndef PLATEMESH_MESH_RESULTS_HXX
#define PLATEMESH_MESH_RESULTS_HXX

#include "Mesh.hxx"

#include <array>
#include <optional>
#include <string>
#include <vector>

// Element results supplied by the analysis that solved the mesh. Points are given in
// the element's own local system: (0..w, 0..h) for Rect, natural (r, s) in [-1, 1]
// for Quad.
class PlateResults {
public:
    virtual ~PlateResults() = default;

    // Names of the load combinations the element has results for
    virtual std::vector<std::string> loadCombos(const Element& e) const = 0;

    // (Qx, Qy)
    virtual std::array<double,2> shear(const Element& e, double x, double y, const std::string& combo) const = 0;

    // (Mx, My, Mxy)
    virtual std::array<double,3> moment(const Element& e, double x, double y, const std::string& combo) const = 0;
};

// Extreme plate forces over a mesh. Each element is sampled at its four corners and
// at ((xi + xj)/2, (yi + yn)/2). combo == nullopt evaluates every load combination.
// Returns nullopt if nothing was evaluated. Invalid directions throw InvalidTokenError.
namespace MeshResults {

std::optional<double> maxShear(const Mesh& M, const PlateResults& R,
                               const std::string& direction = "Qx",
                               const std::optional<std::string>& combo = std::nullopt);
std::optional<double> minShear(const Mesh& M, const PlateResults& R,
                               const std::string& direction = "Qx",
                               const std::optional<std::string>& combo = std::nullopt);
std::optional<double> maxMoment(const Mesh& M, const PlateResults& R,
                                const std::string& direction = "Mx",
                                const std::optional<std::string>& combo = std::nullopt);
std::optional<double> minMoment(const Mesh& M, const PlateResults& R,
                                const std::string& direction = "Mx",
                                const std::optional<std::string>& combo = std::nullopt);

// Local (x, y) of the five sample points of an element, corners i, j, m, n then center.
std::array<std::array<double,2>,5> samplePoints(const Element& e);

} // namespace MeshResults

#endif // PLATEMESH_MESH_RESULTS_HXX
