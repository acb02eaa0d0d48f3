#include "Mesh.hxx"
#include "MeshErrors.hxx"

#include <unordered_map>
#include <unordered_set>
#include <algorithm>
#include <cctype>

bool Element::isDegenerate() const {
    const auto c = corners();
    for (std::size_t a = 0; a < c.size(); ++a) {
        if (!c[a]) return true;
        for (std::size_t b = a + 1; b < c.size(); ++b) if (c[a] == c[b]) return true;
    }
    return false;
}

NameSeq NameSeq::parse(const std::string& name) {
    if (name.size() < 2 || !std::isalpha(static_cast<unsigned char>(name[0]))) {
        throw InvalidNameError("Invalid name '" + name + "'. Enter a letter followed by a number (e.g. 'N25')");
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            throw InvalidNameError("Invalid name '" + name + "'. Enter a letter followed by a number (e.g. 'N25')");
        }
    }
    NameSeq seq;
    seq.prefix = name[0];
    try {
        seq.first = std::stol(name.substr(1));
    } catch (const std::out_of_range&) {
        throw InvalidNameError("Name number out of range in '" + name + "'");
    }
    if (seq.first < 1) throw InvalidNameError("Name number must be positive in '" + name + "'");
    if (seq.first > NameSeq::kMaxFirst) throw InvalidNameError("Name number too large in '" + name + "'");
    return seq;
}

void Mesh::clear() {
    elements.clear();
    nodes.clear();
}

Node* Mesh::addNode(const std::string& name, const Point3& p) {
    auto node = std::make_unique<Node>();
    node->name = name;
    node->X = p[0]; node->Y = p[1]; node->Z = p[2];
    Node* added = nodes.insert(std::move(node));
    if (!added) throw MeshError("Duplicate node name " + name);
    return added;
}

Element* Mesh::addElement(const std::string& name, ElementType type,
                          const std::string& i, const std::string& j,
                          const std::string& m, const std::string& n) {
    auto elem = std::make_unique<Element>();
    elem->name = name;
    elem->type = type;
    elem->material = params.material;
    const std::string* names[4] = { &i, &j, &m, &n };
    Node** slots[4] = { &elem->iNode, &elem->jNode, &elem->mNode, &elem->nNode };
    for (int k = 0; k < 4; ++k) {
        *slots[k] = nodes.find(*names[k]);
        if (!*slots[k]) throw MeshError("Element " + name + " references missing node " + *names[k]);
    }
    Element* added = elements.insert(std::move(elem));
    if (!added) throw MeshError("Duplicate element name " + name);
    return added;
}

void Mesh::merge(Mesh&& part) {
    // Check everything first so a rejected merge leaves both meshes untouched
    for (const auto& pn : part.nodes) {
        const Node* existing = nodes.find(pn->name);
        if (existing && !coincident(*existing, *pn)) {
            throw MeshError("Node " + pn->name + " is shared by two sub-meshes at different locations");
        }
    }
    for (const auto& pe : part.elements) {
        if (elements.contains(pe->name)) throw MeshError("Duplicate element name " + pe->name + " in merge");
    }

    // Canonical record for every node of the part
    // Dropped duplicates stay alive in partNodes until the elements are repointed
    std::unordered_map<const Node*, Node*> canonical;
    canonical.reserve(part.nodes.size());
    auto partNodes = part.nodes.releaseAll();
    for (auto& pn : partNodes) {
        const Node* key = pn.get();
        Node* existing = nodes.find(pn->name);
        if (existing) {
            canonical[key] = existing;
        } else {
            canonical[key] = nodes.insert(std::move(pn));
        }
    }
    for (auto& pe : part.elements.releaseAll()) {
        pe->iNode = canonical.at(pe->iNode);
        pe->jNode = canonical.at(pe->jNode);
        pe->mNode = canonical.at(pe->mNode);
        pe->nNode = canonical.at(pe->nNode);
        elements.insert(std::move(pe));
    }
}

std::size_t Mesh::removeOrphanNodes() {
    std::unordered_set<const Node*> used;
    used.reserve(nodes.size());
    for (const auto& e : elements) {
        for (const Node* c : e->corners()) used.insert(c);
    }
    return nodes.removeIf([&used](const Node& n) { return used.count(&n) == 0; });
}

bool Mesh::validate(std::string* reason) const {
    std::unordered_set<const Node*> resident;
    resident.reserve(nodes.size());
    for (const auto& n : nodes) resident.insert(n.get());

    std::unordered_set<const Node*> used;
    for (const auto& e : elements) {
        if (e->isDegenerate()) {
            if (reason) *reason = "Element " + e->name + " is degenerate";
            return false;
        }
        for (const Node* c : e->corners()) {
            if (!resident.count(c)) {
                if (reason) *reason = "Element " + e->name + " references a node outside the mesh";
                return false;
            }
            used.insert(c);
        }
    }
    for (const auto& n : nodes) {
        if (!used.count(n.get())) {
            if (reason) *reason = "Node " + n->name + " is not used by any element";
            return false;
        }
    }
    return true;
}

ElementType Mesh::parseElementType(const std::string& token) {
    if (token == "Quad") return ElementType::Quad;
    if (token == "Rect") return ElementType::Rect;
    throw InvalidTokenError("Invalid element type '" + token + "'. Select 'Quad' or 'Rect'.");
}

const char* Mesh::toString(ElementType type) {
    return type == ElementType::Rect ? "Rect" : "Quad";
}
