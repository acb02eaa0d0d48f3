#include <gtest/gtest.h>
#include "MeshResults.hxx"
#include "RectangleMesher.hxx"
#include "MeshErrors.hxx"

// Linear result fields. Combination "L" adds 10 and element Q2 adds 100 to Qx.
class LinearResults : public PlateResults {
public:
    mutable int calls = 0;

    std::vector<std::string> loadCombos(const Element&) const override { return {"D", "L"}; }

    std::array<double,2> shear(const Element& e, double x, double y, const std::string& combo) const override {
        ++calls;
        double qx = x;
        if (combo == "L") qx += 10.0;
        if (e.name == "Q2") qx += 100.0;
        return {qx, y};
    }

    std::array<double,3> moment(const Element&, double x, double y, const std::string& combo) const override {
        ++calls;
        const double f = (combo == "L") ? 2.0 : 1.0;
        return {f * x * y, 2.0 * y, -x};
    }
};

static Mesh twoElements(ElementType type) {
    MeshParams p;
    p.firstElement = type == ElementType::Rect ? "R1" : "Q1";
    return RectangleMesher(2.0, 4.0, 2.0, p, {0, 0, 0}, Plane::XY, type).generate();
}

TEST(MeshResults, SamplePoints) {
    Mesh quads = twoElements(ElementType::Quad);
    auto q = MeshResults::samplePoints(**quads.elements.begin());
    EXPECT_DOUBLE_EQ(q[0][0], -1.0); EXPECT_DOUBLE_EQ(q[0][1], -1.0);
    EXPECT_DOUBLE_EQ(q[2][0],  1.0); EXPECT_DOUBLE_EQ(q[2][1],  1.0);
    EXPECT_DOUBLE_EQ(q[4][0],  0.0); EXPECT_DOUBLE_EQ(q[4][1],  0.0);

    Mesh rects = twoElements(ElementType::Rect);
    auto r = MeshResults::samplePoints(**rects.elements.begin());
    EXPECT_DOUBLE_EQ(r[0][0], 0.0); EXPECT_DOUBLE_EQ(r[0][1], 0.0);
    EXPECT_DOUBLE_EQ(r[1][0], 2.0); EXPECT_DOUBLE_EQ(r[1][1], 0.0);
    EXPECT_DOUBLE_EQ(r[2][0], 2.0); EXPECT_DOUBLE_EQ(r[2][1], 2.0);
    EXPECT_DOUBLE_EQ(r[3][0], 0.0); EXPECT_DOUBLE_EQ(r[3][1], 2.0);
    EXPECT_DOUBLE_EQ(r[4][0], 1.0); EXPECT_DOUBLE_EQ(r[4][1], 1.0);
}

TEST(MeshResults, ShearExtremes) {
    Mesh M = twoElements(ElementType::Quad);
    LinearResults R;
    EXPECT_DOUBLE_EQ(*MeshResults::maxShear(M, R), 111.0);
    EXPECT_EQ(R.calls, 2 * 2 * 5);
    EXPECT_DOUBLE_EQ(*MeshResults::minShear(M, R), -1.0);
    EXPECT_DOUBLE_EQ(*MeshResults::maxShear(M, R, "Qx", std::string("D")), 101.0);
    EXPECT_DOUBLE_EQ(*MeshResults::minShear(M, R, "Qx", std::string("L")), 9.0);
    EXPECT_DOUBLE_EQ(*MeshResults::maxShear(M, R, "Qy"), 1.0);
    EXPECT_DOUBLE_EQ(*MeshResults::minShear(M, R, "Qy"), -1.0);
}

TEST(MeshResults, MomentExtremes) {
    Mesh M = twoElements(ElementType::Rect);
    LinearResults R;
    // Rect sample points span (0..2, 0..2)
    EXPECT_DOUBLE_EQ(*MeshResults::maxMoment(M, R), 8.0);
    EXPECT_DOUBLE_EQ(*MeshResults::maxMoment(M, R, "Mx", std::string("D")), 4.0);
    EXPECT_DOUBLE_EQ(*MeshResults::minMoment(M, R), 0.0);
    EXPECT_DOUBLE_EQ(*MeshResults::maxMoment(M, R, "My"), 4.0);
    EXPECT_DOUBLE_EQ(*MeshResults::maxMoment(M, R, "Mxy"), 0.0);
    EXPECT_DOUBLE_EQ(*MeshResults::minMoment(M, R, "Mxy"), -2.0);
}

TEST(MeshResults, NothingEvaluated) {
    Mesh M = twoElements(ElementType::Quad);
    LinearResults R;
    EXPECT_FALSE(MeshResults::maxShear(M, R, "Qx", std::string("W")).has_value());
    EXPECT_EQ(R.calls, 0);
    Mesh empty;
    EXPECT_FALSE(MeshResults::minMoment(empty, R).has_value());
}

TEST(MeshResults, InvalidDirection) {
    Mesh M = twoElements(ElementType::Quad);
    LinearResults R;
    EXPECT_THROW(MeshResults::maxShear(M, R, "Mx"), InvalidTokenError);
    EXPECT_THROW(MeshResults::minShear(M, R, "qx"), InvalidTokenError);
    EXPECT_THROW(MeshResults::maxMoment(M, R, "Qx"), InvalidTokenError);
    EXPECT_THROW(MeshResults::minMoment(M, R, "Myx"), InvalidTokenError);
}
