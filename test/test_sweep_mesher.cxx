#include <gtest/gtest.h>
#include "SweepMesher.hxx"
#include "MeshErrors.hxx"
#include <algorithm>
#include <cmath>

static int countCoincidentPairs(const Mesh& M) {
    std::vector<const Node*> all;
    for (const auto& n : M.nodes) all.push_back(n.get());
    int pairs = 0;
    for (std::size_t a = 0; a < all.size(); ++a)
        for (std::size_t b = a + 1; b < all.size(); ++b)
            if (Mesh::distance(*all[a], *all[b]) < 1e-9) ++pairs;
    return pairs;
}

static void expectSequentialNames(const Mesh& M, char nodePrefix, long nodeFirst,
                                  char elemPrefix, long elemFirst) {
    long k = nodeFirst;
    for (const auto& n : M.nodes) EXPECT_EQ(n->name, std::string(1, nodePrefix) + std::to_string(k++));
    k = elemFirst;
    for (const auto& e : M.elements) EXPECT_EQ(e->name, std::string(1, elemPrefix) + std::to_string(k++));
}

TEST(SweepMesher, AnnulusTwoRings) {
    SweepInfo info;
    Mesh M = SweepMesher::annulus(0.5, 2.0, 1.0, MeshParams(), {0, 0, 0}, Axis::Y, &info);
    EXPECT_EQ(info.rings, 2);
    EXPECT_EQ(info.transitions, 0);
    EXPECT_EQ(info.innerQuads, 12);
    EXPECT_EQ(info.outerQuads, 12);
    ASSERT_EQ(M.numNodes(), 36);
    ASSERT_EQ(M.numElements(), 24);
    expectSequentialNames(M, 'N', 1, 'Q', 1);
    EXPECT_EQ(countCoincidentPairs(M), 0);

    // The second ring reuses the first ring's outer nodes
    const Node* n13 = M.nodes.find("N13");
    EXPECT_NEAR(std::sqrt(n13->X * n13->X + n13->Z * n13->Z), 1.5, 1e-12);
    EXPECT_EQ(M.elements.find("Q13")->iNode, n13);
    EXPECT_EQ(M.elements.find("Q1")->nNode, n13);
    std::string reason;
    EXPECT_TRUE(M.validate(&reason)) << reason;
}

TEST(SweepMesher, AnnulusWithTransition) {
    SweepInfo info;
    Mesh M = SweepMesher::annulus(1.0, 5.0, 1.0, MeshParams(), {0, 0, 0}, Axis::Y, &info);
    // Rings 1-2, 2-3, 3-4 (transition 6 -> 18 sectors), 4-5
    EXPECT_EQ(info.rings, 4);
    EXPECT_EQ(info.transitions, 1);
    EXPECT_EQ(info.innerQuads, 6);
    EXPECT_EQ(info.outerQuads, 18);
    ASSERT_EQ(M.numNodes(), 66);
    ASSERT_EQ(M.numElements(), 54);
    expectSequentialNames(M, 'N', 1, 'Q', 1);
    EXPECT_EQ(countCoincidentPairs(M), 0);

    int onOuter = 0, onInner = 0;
    for (const auto& n : M.nodes) {
        const double r = std::sqrt(n->X * n->X + n->Z * n->Z);
        EXPECT_GE(r, 1.0 - 1e-9);
        EXPECT_LE(r, 5.0 + 1e-9);
        if (std::fabs(r - 5.0) < 1e-9) ++onOuter;
        if (std::fabs(r - 1.0) < 1e-9) ++onInner;
    }
    EXPECT_EQ(onInner, 6);
    EXPECT_EQ(onOuter, 18);
    std::string reason;
    EXPECT_TRUE(M.validate(&reason)) << reason;
}

TEST(SweepMesher, AnnulusOffsetNamesAndOrigin) {
    MeshParams p;
    p.firstNode = "N50";
    p.firstElement = "Q10";
    const Point3 o{2.0, 3.0, 4.0};
    Mesh M = SweepMesher::annulus(0.5, 2.0, 1.0, p, o, Axis::X);
    expectSequentialNames(M, 'N', 50, 'Q', 10);
    for (const auto& n : M.nodes) {
        EXPECT_NEAR(n->X, 2.0, 1e-12);
        const double r = CoordMap::toLocal(n->coords(), Axis::X, o)[0];
        EXPECT_GE(r, 1.0 - 1e-9);
        EXPECT_LE(r, 2.0 + 1e-9);
    }
}

TEST(SweepMesher, FrustumTapersAlongAxis) {
    Mesh M = SweepMesher::frustum(0.5, 2.0, 1.0, 5.0, MeshParams());
    ASSERT_EQ(M.numNodes(), 36);
    ASSERT_EQ(M.numElements(), 24);
    for (const auto& n : M.nodes) {
        const double r = std::sqrt(n->X * n->X + n->Z * n->Z);
        // Large edge stays in the base plane, small edge sits one height below it
        EXPECT_NEAR(n->Y, (r - 2.0) * 5.0, 1e-9);
    }
    const Node* inner = M.nodes.find("N1");
    const Node* outer = M.nodes.find("N25");
    EXPECT_NEAR(inner->Y, -5.0, 1e-9);
    EXPECT_NEAR(outer->Y, 0.0, 1e-9);
    EXPECT_TRUE(M.validate());
}

TEST(SweepMesher, FrustumAboutZWithOrigin) {
    const Point3 o{1.0, 1.0, 10.0};
    Mesh M = SweepMesher::frustum(0.5, 2.0, 1.0, 3.0, MeshParams(), o, Axis::Z);
    for (const auto& n : M.nodes) {
        auto l = CoordMap::toLocal(n->coords(), Axis::Z, o);
        EXPECT_NEAR(l[1], (l[0] - 2.0) * 3.0, 1e-9);
    }
}

TEST(SweepMesher, CylinderDefaultSectors) {
    SweepInfo info;
    Mesh M = SweepMesher::cylinder(1.0, 1.0, 3.0, MeshParams(), {0, 0, 0}, Axis::Y, 0,
                                   ElementType::Quad, &info);
    // round(2*pi) = 6 sectors, three rings of height 1
    EXPECT_EQ(info.rings, 3);
    EXPECT_EQ(info.innerQuads, 6);
    ASSERT_EQ(M.numNodes(), 24);
    ASSERT_EQ(M.numElements(), 18);
    expectSequentialNames(M, 'N', 1, 'Q', 1);
    EXPECT_EQ(countCoincidentPairs(M), 0);
    EXPECT_NEAR(M.nodes.find("N7")->Y, 1.0, 1e-12);
    EXPECT_NEAR(M.nodes.find("N24")->Y, 3.0, 1e-12);
    EXPECT_EQ(M.elements.find("Q7")->iNode, M.nodes.find("N7"));
    EXPECT_TRUE(M.validate());
}

TEST(SweepMesher, CylinderAboutCenter) {
    MeshParams p;
    p.firstNode = "N5";
    p.firstElement = "R3";
    const Point3 c{1.0, 5.0, -2.0};
    SweepInfo info;
    Mesh M = SweepMesher::cylinder(0.75, 1.0, 2.0, p, c, Axis::Z, 8, ElementType::Rect, &info);
    EXPECT_EQ(info.rings, 3);
    ASSERT_EQ(M.numNodes(), 32);
    ASSERT_EQ(M.numElements(), 24);
    expectSequentialNames(M, 'N', 5, 'R', 3);
    double zMin = 1e30, zMax = -1e30;
    for (const auto& n : M.nodes) {
        EXPECT_NEAR(std::hypot(n->X - 1.0, n->Y - 5.0), 1.0, 1e-12);
        zMin = std::min(zMin, n->Z);
        zMax = std::max(zMax, n->Z);
    }
    EXPECT_NEAR(zMin, -2.0, 1e-12);
    EXPECT_NEAR(zMax, 0.0, 1e-9);
    for (const auto& e : M.elements) EXPECT_EQ(e->type, ElementType::Rect);
    EXPECT_TRUE(M.validate());
}

TEST(SweepMesher, CylinderFarFromOrigin) {
    // Shared ring edges must land on the same coordinates even where the
    // center's axial coordinate dwarfs the ring height
    for (double s : {0.3, 0.7, 0.13}) {
        const Point3 c{0.0, 987654.321, 0.0};
        SweepInfo info;
        Mesh M = SweepMesher::cylinder(s, 1.0, 2.1, MeshParams(), c, Axis::Y, 0,
                                       ElementType::Quad, &info);
        const int sectors = info.innerQuads;
        EXPECT_EQ(M.numNodes(), sectors * (info.rings + 1)) << s;
        EXPECT_EQ(M.numElements(), sectors * info.rings) << s;
        for (const auto& n : M.nodes) {
            EXPECT_GE(n->Y, c[1] - 1e-6);
            EXPECT_LE(n->Y, c[1] + 2.1 + 1e-6);
        }
        std::string reason;
        EXPECT_TRUE(M.validate(&reason)) << reason;
    }
    SweepInfo info;
    SweepMesher::cylinder(0.3, 1.0, 2.1, MeshParams(), {0.0, 3.7e6, 0.0}, Axis::Y, 0,
                          ElementType::Quad, &info);
    EXPECT_EQ(info.rings, 7);
}

TEST(SweepMesher, FewerThanTwoSectors) {
    // 2*pi*0.1 / 1.0 gives no whole sector on the inner edge
    EXPECT_THROW(SweepMesher::annulus(1.0, 2.0, 0.1, MeshParams()), MeshError);
    EXPECT_THROW(SweepMesher::frustum(1.0, 2.0, 0.1, 1.0, MeshParams()), MeshError);
    EXPECT_THROW((SweepMesher::cylinder(1.0, 1.0, 2.0, MeshParams(), {0, 0, 0}, Axis::Y, 1)), MeshError);
    // round(2*pi*0.1) = 1
    EXPECT_THROW(SweepMesher::cylinder(1.0, 0.1, 2.0, MeshParams()), MeshError);
}

TEST(SweepMesher, InvalidInput) {
    EXPECT_THROW(SweepMesher::annulus(1.0, 1.0, 2.0, MeshParams()), MeshError);
    EXPECT_THROW(SweepMesher::annulus(0.0, 2.0, 1.0, MeshParams()), MeshError);
    EXPECT_THROW(SweepMesher::frustum(1.0, 1.0, 1.0, 2.0, MeshParams()), MeshError);
    EXPECT_THROW(SweepMesher::cylinder(1.0, 0.0, 2.0, MeshParams()), MeshError);
    EXPECT_THROW(SweepMesher::cylinder(1.0, 1.0, -2.0, MeshParams()), MeshError);
    MeshParams p;
    p.firstNode = "X";
    EXPECT_THROW(SweepMesher::annulus(1.0, 2.0, 1.0, p), InvalidNameError);
    EXPECT_THROW(SweepMesher::cylinder(1.0, 1.0, 2.0, p), InvalidNameError);
}
