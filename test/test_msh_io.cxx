#include <gtest/gtest.h>
#include "MshIO.hxx"
#include "RectangleMesher.hxx"
#include "SweepMesher.hxx"
#include <cstdio>

TEST(MshIO, WriteAndReadRectangle) {
    RectangleMesher R(1.0, 4.0, 2.0, MeshParams(), {0, 0, 1.5});
    Mesh M = R.generate();
    const char* fn = "test_rect.msh";
    std::string err;
    ASSERT_TRUE(MshIO::writeFile(fn, M, "rectangle", &err)) << err;
    FILE* f = std::fopen(fn, "r");
    ASSERT_NE(f, nullptr);
    std::fclose(f);

    Mesh back;
    ASSERT_TRUE(MshIO::readFile(fn, back, &err)) << err;
    ASSERT_EQ(back.numNodes(), 15);
    ASSERT_EQ(back.numElements(), 8);
    // Tags follow registry order, so N<k> keeps its coordinates
    for (const auto& n : M.nodes) {
        const Node* b = back.nodes.find(n->name);
        ASSERT_NE(b, nullptr) << n->name;
        EXPECT_NEAR(b->X, n->X, 1e-12);
        EXPECT_NEAR(b->Y, n->Y, 1e-12);
        EXPECT_NEAR(b->Z, n->Z, 1e-12);
    }
    const Element* q1 = back.elements.find("Q1");
    ASSERT_NE(q1, nullptr);
    EXPECT_EQ(q1->iNode->name, "N1");
    EXPECT_EQ(q1->mNode->name, "N7");
    EXPECT_TRUE(back.validate());
}

TEST(MshIO, WriteAnnulusWithOffsetNames) {
    MeshParams p;
    p.firstNode = "N100";
    Mesh M = SweepMesher::annulus(1.0, 5.0, 1.0, p);
    std::string err;
    ASSERT_TRUE(MshIO::writeFile("test_annulus.msh", M, "", &err)) << err;
    Mesh back;
    ASSERT_TRUE(MshIO::readFile("test_annulus.msh", back, &err)) << err;
    EXPECT_EQ(back.numNodes(), M.numNodes());
    EXPECT_EQ(back.numElements(), M.numElements());
    EXPECT_TRUE(back.validate());
}

TEST(MshIO, Failures) {
    Mesh empty;
    std::string err;
    EXPECT_FALSE(MshIO::writeFile("test_empty.msh", empty, "", &err));
    EXPECT_FALSE(err.empty());
    Mesh back;
    EXPECT_FALSE(MshIO::readFile("does_not_exist.msh", back, &err));
    EXPECT_EQ(back.numNodes(), 0);
}
