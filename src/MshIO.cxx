#include "MshIO.hxx"
#include <gmsh.h>

#include <unordered_map>
#include <stdexcept>
#include <vector>

namespace {
const int kQuad4 = 3; // gmsh element type: 4-node quadrangle

// Keeps gmsh initialized for one call and finalizes it on every exit path
struct GmshSession {
    GmshSession() {
        gmsh::initialize();
        gmsh::option::setNumber("General.Terminal", 0);
    }
    ~GmshSession() { gmsh::finalize(); }
    GmshSession(const GmshSession&) = delete;
    GmshSession& operator=(const GmshSession&) = delete;
};
}

namespace MshIO {

bool writeFile(const std::string& path, const Mesh& M, const std::string& physicalName,
               std::string* errorMessage) {
    try {
        if (M.elements.empty()) throw std::runtime_error("Mesh has no elements to write");
        GmshSession session;
        gmsh::model::add("platemesh");
        const int surf = gmsh::model::addDiscreteEntity(2);

        std::unordered_map<const Node*, std::size_t> tagOf;
        std::vector<std::size_t> nodeTags;
        std::vector<double> coords;
        nodeTags.reserve(M.nodes.size());
        coords.reserve(3 * M.nodes.size());
        std::size_t tag = 1;
        for (const auto& n : M.nodes) {
            tagOf[n.get()] = tag;
            nodeTags.push_back(tag++);
            coords.push_back(n->X); coords.push_back(n->Y); coords.push_back(n->Z);
        }
        gmsh::model::mesh::addNodes(2, surf, nodeTags, coords);

        std::vector<std::size_t> elemTags;
        std::vector<std::size_t> elemNodes;
        elemTags.reserve(M.elements.size());
        elemNodes.reserve(4 * M.elements.size());
        tag = 1;
        for (const auto& e : M.elements) {
            elemTags.push_back(tag++);
            for (const Node* c : e->corners()) {
                auto it = tagOf.find(c);
                if (it == tagOf.end()) throw std::runtime_error("Element " + e->name + " references a node outside the mesh");
                elemNodes.push_back(it->second);
            }
        }
        gmsh::model::mesh::addElementsByType(surf, kQuad4, elemTags, elemNodes);

        if (!physicalName.empty()) {
            const int group = gmsh::model::addPhysicalGroup(2, {surf});
            gmsh::model::setPhysicalName(2, group, physicalName);
        }
        gmsh::write(path);
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool readFile(const std::string& path, Mesh& out, std::string* errorMessage) {
    out.clear();
    try {
        GmshSession session;
        gmsh::open(path);

        std::vector<std::size_t> nodeTags;
        std::vector<double> nodeCoord;
        std::vector<double> nodeCoordParam; // unused parametric coords
        gmsh::model::mesh::getNodes(nodeTags, nodeCoord, nodeCoordParam);

        std::vector<std::size_t> elemTags;
        std::vector<std::size_t> elemNodes; // flattened, 4 per quadrangle
        gmsh::model::mesh::getElementsByType(kQuad4, elemTags, elemNodes);
        if (elemTags.empty()) throw std::runtime_error("No quadrangles in " + path);

        std::unordered_map<std::size_t, std::size_t> used;
        for (std::size_t t : elemNodes) used[t] = 1;

        Mesh M;
        for (std::size_t i = 0; i < nodeTags.size(); ++i) {
            if (!used.count(nodeTags[i])) continue;
            M.addNode("N" + std::to_string(nodeTags[i]),
                      { nodeCoord[3*i], nodeCoord[3*i + 1], nodeCoord[3*i + 2] });
        }
        for (std::size_t k = 0; k < elemTags.size(); ++k) {
            M.addElement("Q" + std::to_string(elemTags[k]), ElementType::Quad,
                         "N" + std::to_string(elemNodes[4*k]), "N" + std::to_string(elemNodes[4*k + 1]),
                         "N" + std::to_string(elemNodes[4*k + 2]), "N" + std::to_string(elemNodes[4*k + 3]));
        }
        out = std::move(M);
        return true;
    } catch (const std::exception& e) {
        out.clear();
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace MshIO
