#ifndef PLATEMESH_MSH_IO_HXX
#define PLATEMESH_MSH_IO_HXX

#include "Mesh.hxx"

#include <string>

// Exchange of plate meshes with Gmsh .msh files through the gmsh API.
namespace MshIO {

// Write M as a discrete surface of 4-node quadrangles (gmsh type 3). Node and
// element tags follow registry order starting at 1. physicalName, if not empty,
// names a physical surface holding every element.
bool writeFile(const std::string& path, const Mesh& M,
               const std::string& physicalName = std::string(),
               std::string* errorMessage = nullptr);

// Load the quadrangles of a .msh file. Nodes are named N<tag> and elements Q<tag>;
// nodes not used by a quadrangle are dropped. Returns false and leaves out empty on
// failure.
bool readFile(const std::string& path, Mesh& out, std::string* errorMessage = nullptr);

} // namespace MshIO

#endif // PLATEMESH_MSH_IO_HXX
