#ifndef PLATEMESH_MESH_HXX
#define PLATEMESH_MESH_HXX

#include "CoordMap.hxx"
#include "MeshErrors.hxx"

#include <vector>
#include <array>
#include <string>
#include <memory>
#include <unordered_map>
#include <cstddef>
#include <cmath>
#include <limits>

// Node of a plate mesh: a name and its global coordinates.
struct Node {
    std::string name;
    double X = 0.0;
    double Y = 0.0;
    double Z = 0.0;

    Point3 coords() const { return {X, Y, Z}; }
};

enum class ElementType { Quad, Rect };

// Element properties shared by every element of a mesh.
struct Material {
    double t = 0.0;      // thickness
    double E = 0.0;      // modulus of elasticity
    double nu = 0.0;     // Poisson's ratio
    double kxMod = 1.0;  // local x in-plane stiffness modifier
    double kyMod = 1.0;  // local y in-plane stiffness modifier
};

// Four-node plate element. Node pointers are non-owning; they point into the
// node registry of the mesh holding the element.
struct Element {
    std::string name;
    ElementType type = ElementType::Quad;
    Node* iNode = nullptr;
    Node* jNode = nullptr;
    Node* mNode = nullptr;
    Node* nNode = nullptr;
    Material material;

    std::array<Node*,4> corners() const { return {iNode, jNode, mNode, nNode}; }

    // True if a corner is missing or two corners are the same node
    bool isDegenerate() const;
};

// Construction parameters shared by every generator.
struct MeshParams {
    Material material;
    std::string firstNode = "N1";
    std::string firstElement = "Q1";
};

// Sequential names <prefix><first + k>, parsed from a first name such as "N12".
struct NameSeq {
    // Largest accepted first number
    static constexpr long kMaxFirst = std::numeric_limits<int>::max();

    char prefix = 'N';
    long first = 1;

    // Throws InvalidNameError unless name is one letter followed by an integer in [1, kMaxFirst].
    static NameSeq parse(const std::string& name);

    // k is 0-based: at(0) is the first name
    std::string at(long k) const {
        if (k < 0 || k > std::numeric_limits<long>::max() - first) {
            throw InvalidNameError("Name number overflows after " + std::string(1, prefix) + std::to_string(first));
        }
        return std::string(1, prefix) + std::to_string(first + k);
    }
};

// Insertion-ordered registry of uniquely named records.
template <class T>
class Registry {
public:
    using Storage = std::vector<std::unique_ptr<T>>;

    // Takes ownership; returns nullptr if the name is already taken.
    T* insert(std::unique_ptr<T> item) {
        if (!item || index_.count(item->name)) return nullptr;
        index_.emplace(item->name, items_.size());
        items_.push_back(std::move(item));
        return items_.back().get();
    }

    T* find(const std::string& name) {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : items_[it->second].get();
    }
    const T* find(const std::string& name) const {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : items_[it->second].get();
    }
    bool contains(const std::string& name) const { return index_.count(name) != 0; }

    // Remove every record for which pred(const T&) is true; order of the rest is kept.
    template <class Pred>
    std::size_t removeIf(Pred pred) {
        Storage kept;
        kept.reserve(items_.size());
        for (auto& p : items_) if (!pred(*p)) kept.push_back(std::move(p));
        const std::size_t removed = items_.size() - kept.size();
        items_ = std::move(kept);
        reindex();
        return removed;
    }

    // Hand all records to the caller and leave the registry empty.
    Storage releaseAll() {
        Storage out = std::move(items_);
        items_.clear(); index_.clear();
        return out;
    }

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    T& back() { return *items_.back(); }
    const T& back() const { return *items_.back(); }
    void clear() { items_.clear(); index_.clear(); }

    typename Storage::iterator begin() { return items_.begin(); }
    typename Storage::iterator end() { return items_.end(); }
    typename Storage::const_iterator begin() const { return items_.begin(); }
    typename Storage::const_iterator end() const { return items_.end(); }

private:
    void reindex() {
        index_.clear();
        for (std::size_t i = 0; i < items_.size(); ++i) index_.emplace(items_[i]->name, i);
    }

    Storage items_;
    std::unordered_map<std::string, std::size_t> index_;
};

// Plate mesh container: owns its nodes and elements plus the shared parameters.
// Move-only; element node pointers stay valid when the mesh is moved.
class Mesh {
public:
    // Coordinates closer than this are the same physical node
    static constexpr double kMergeTol = 1e-10;

    MeshParams params;
    Registry<Node> nodes;
    Registry<Element> elements;

    Mesh() = default;
    explicit Mesh(const MeshParams& p) : params(p) {}
    Mesh(Mesh&&) = default;
    Mesh& operator=(Mesh&&) = default;
    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    int numNodes() const { return static_cast<int>(nodes.size()); }
    int numElements() const { return static_cast<int>(elements.size()); }

    // Throws MeshError if the name is already taken.
    Node* addNode(const std::string& name, const Point3& p);

    // Corners are looked up by name; throws MeshError if one is missing or the
    // element name is taken. Material comes from params.
    Element* addElement(const std::string& name, ElementType type,
                        const std::string& i, const std::string& j,
                        const std::string& m, const std::string& n);

    // Last node / element in insertion order (nullptr when empty)
    const Node* lastNode() const { return nodes.empty() ? nullptr : &nodes.back(); }
    const Element* lastElement() const { return elements.empty() ? nullptr : &elements.back(); }

    // Move the nodes and elements of part into this mesh. A node whose name is
    // already present is replaced by the existing (earlier) record and the part's
    // elements are repointed to it. Throws MeshError if a shared name sits at a
    // different location or an element name collides.
    void merge(Mesh&& part);

    // Remove nodes no element references; returns how many were removed.
    std::size_t removeOrphanNodes();

    // Check the registry invariants: resident, distinct corners and no orphans.
    bool validate(std::string* reason = nullptr) const;

    static ElementType parseElementType(const std::string& token);
    static const char* toString(ElementType type);

    static inline double distance(const Node& a, const Node& b) {
        const double dx = b.X - a.X, dy = b.Y - a.Y, dz = b.Z - a.Z;
        return std::sqrt(dx*dx + dy*dy + dz*dz);
    }

    static inline bool coincident(const Node& a, const Node& b, double tol = kMergeTol) {
        return std::fabs(a.X - b.X) <= tol && std::fabs(a.Y - b.Y) <= tol && std::fabs(a.Z - b.Z) <= tol;
    }

    // Clear all data
    void clear();
};

#endif // PLATEMESH_MESH_HXX
