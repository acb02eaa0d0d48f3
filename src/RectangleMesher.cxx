#include "RectangleMesher.hxx"
#include "GridBuilder.hxx"
#include "MeshErrors.hxx"

#include <algorithm>
#include <unordered_set>

namespace {
static inline bool strictlyInside(const Point2& p, const RectOpening& o) {
    using CoordMap::roundTol;
    const double x = roundTol(p[0]), y = roundTol(p[1]);
    return x > roundTol(o.xLeft) && x < roundTol(o.xLeft + o.width)
        && y > roundTol(o.yBottom) && y < roundTol(o.yBottom + o.height);
}

static inline bool insideOrOn(const Point2& p, const RectOpening& o) {
    using CoordMap::roundTol;
    const double x = roundTol(p[0]), y = roundTol(p[1]);
    return x >= roundTol(o.xLeft) && x <= roundTol(o.xLeft + o.width)
        && y >= roundTol(o.yBottom) && y <= roundTol(o.yBottom + o.height);
}
}

RectangleMesher::RectangleMesher(double meshSize, double width, double height, const MeshParams& params,
                                 const Point3& origin, Plane plane, ElementType type)
    : meshSize_(meshSize), width_(width), height_(height), params_(params),
      origin_(origin), plane_(plane), type_(type) {}

void RectangleMesher::addRectOpening(const std::string& name, double xLeft, double yBottom,
                                     double width, double height) {
    RectOpening o{name, xLeft, yBottom, width, height};
    auto it = std::find_if(openings_.begin(), openings_.end(),
                           [&name](const RectOpening& r) { return r.name == name; });
    if (it != openings_.end()) *it = o;
    else openings_.push_back(o);
    xControl_.push_back(xLeft);
    xControl_.push_back(xLeft + width);
    yControl_.push_back(yBottom);
    yControl_.push_back(yBottom + height);
}

Mesh RectangleMesher::generate() const {
    const NameSeq nodeNames = NameSeq::parse(params_.firstNode);
    NameSeq elemNames = NameSeq::parse(params_.firstElement);
    // Rect elements are always named R<k>; only the number comes from firstElement
    if (type_ == ElementType::Rect) elemNames.prefix = 'R';

    GridBuilder grid(meshSize_);
    const auto xs = grid.coordinates(GridBuilder::normalizeControls(xControl_, width_));
    const auto ys = grid.coordinates(GridBuilder::normalizeControls(yControl_, height_));
    const long numCols = static_cast<long>(xs.size()) - 1;
    const long numRows = static_cast<long>(ys.size()) - 1;

    Mesh M(params_);

    // Nodes, row by row from the local origin
    for (std::size_t r = 0; r < ys.size(); ++r) {
        for (std::size_t c = 0; c < xs.size(); ++c) {
            const long k = static_cast<long>(r * xs.size() + c);
            M.addNode(nodeNames.at(k), CoordMap::toGlobal(xs[c], ys[r], plane_, origin_));
        }
    }

    // Elements: i at the lower-left corner, counter-clockwise in local (x, y)
    for (long r = 0; r < numRows; ++r) {
        for (long c = 0; c < numCols; ++c) {
            const long iNode = r * (numCols + 1) + c;
            const long jNode = iNode + 1;
            const long mNode = jNode + (numCols + 1);
            const long nNode = mNode - 1;
            M.addElement(elemNames.at(r * numCols + c), type_,
                         nodeNames.at(iNode), nodeNames.at(jNode),
                         nodeNames.at(mNode), nodeNames.at(nNode));
        }
    }

    if (!openings_.empty()) cutOpenings(M);
    return M;
}

void RectangleMesher::cutOpenings(Mesh& M) const {
    // Nodes strictly inside an opening. Nodes on an opening's edge stay so the
    // surrounding elements can keep them.
    std::unordered_set<const Node*> nodeDel;
    for (const auto& n : M.nodes) {
        const Point2 p = localCoords(*n);
        for (const auto& o : openings_) {
            if (strictlyInside(p, o)) { nodeDel.insert(n.get()); break; }
        }
    }

    // Elements whose four corners lie inside or on an opening
    std::unordered_set<const Element*> elemDel;
    for (const auto& e : M.elements) {
        for (const auto& o : openings_) {
            bool inside = true;
            for (const Node* c : e->corners()) {
                if (!insideOrOn(localCoords(*c), o)) { inside = false; break; }
            }
            if (inside) { elemDel.insert(e.get()); break; }
        }
    }

    M.elements.removeIf([&elemDel](const Element& e) { return elemDel.count(&e) != 0; });
    for (const auto& e : M.elements) {
        for (const Node* c : e->corners()) {
            if (nodeDel.count(c)) throw MeshError("Element " + e->name + " straddles an opening edge");
        }
    }
    M.nodes.removeIf([&nodeDel](const Node& n) { return nodeDel.count(&n) != 0; });

    // Perimeter nodes left without an element
    M.removeOrphanNodes();
}
