#include <gtest/gtest.h>

#include <math.h>
#include <numbers>

#include "constants.h"
#include "vec3.h"
#include "matrix.h"
#include "jzazbz.h"
#include "p3display.h"

static double maxrelativediff(vec3 a, vec3 b){
    double dx = fabs(a.x - b.x) / fabs(b.x);
    double dy = fabs(a.y - b.y) / fabs(b.y);
    double dz = fabs(a.z - b.z) / fabs(b.z);
    double output = dx;
    if (dy > output) output = dy;
    if (dz > output) output = dz;
    return output;
}

TEST(Jzazbz, RoundTripThroughLMS) {
    const vec3 colors[] = {
        vec3(0.3, 0.5, 0.7),
        vec3(1.0, 0.0, 0.0),
        vec3(0.001, 0.002, 0.0005),
        vec3(0.9, 0.9, 0.1),
        vec3(1.0, 1.0, 1.0)
    };
    for (const vec3 &rgb : colors){
        vec3 lms = LinearP3toLMS(rgb);
        vec3 back = JzazbzToLMS(LMStoJzazbz(lms));
        EXPECT_LT(maxrelativediff(back, lms), 1e-10) << "rgb " << rgb.x << ", " << rgb.y << ", " << rgb.z;
    }
}

TEST(Jzazbz, BlackIsZero) {
    vec3 black = LMStoJzazbz(vec3(0.0, 0.0, 0.0));
    EXPECT_NEAR(black.x, 0.0, 1e-15);
    EXPECT_NEAR(black.y, 0.0, 1e-15);
    EXPECT_NEAR(black.z, 0.0, 1e-15);
}

TEST(Jzazbz, NegativeLMSClampsToBlack) {
    vec3 clamped = LMStoJzazbz(vec3(-1.0, -2.0, -3.0));
    vec3 black = LMStoJzazbz(vec3(0.0, 0.0, 0.0));
    EXPECT_EQ(clamped.x, black.x);
    EXPECT_EQ(clamped.y, black.y);
    EXPECT_EQ(clamped.z, black.z);
}

TEST(Jzazbz, InverseClampsStayFinite) {
    const vec3 wild[] = {
        vec3(5.0, 3.0, -3.0),
        vec3(-1.0, 0.0, 0.0),
        vec3(0.5, 0.0, 0.0),
        vec3(0.0, -0.5, 0.5),
        vec3(1e-12, 0.0, 0.0)
    };
    for (const vec3 &jab : wild){
        vec3 lms = JzazbzToLMS(jab);
        EXPECT_TRUE(isfinite(lms.x) && isfinite(lms.y) && isfinite(lms.z)) << jab.x << ", " << jab.y << ", " << jab.z;
        EXPECT_GE(lms.x, 0.0);
        EXPECT_GE(lms.y, 0.0);
        EXPECT_GE(lms.z, 0.0);
    }
}

TEST(Jzazbz, PQPair) {
    EXPECT_DOUBLE_EQ(PQ(0.0), Jzazbz_LMSp_min);
    EXPECT_EQ(PQ(-5.0), PQ(0.0));
    EXPECT_NEAR(InversePQ(PQ(0.0)), 0.0, 1e-30);
    const double values[] = {0.01, 1.0, 50.0, 100.0, 1000.0};
    for (double v : values){
        EXPECT_NEAR(InversePQ(PQ(v)) / v, 1.0, 1e-10) << v;
    }
    EXPECT_TRUE(isfinite(InversePQ(100.0)));
    EXPECT_EQ(InversePQ(100.0), InversePQ(Jzazbz_LMSp_max));
}

TEST(Jzazbz, PrecomputedInversesMatch) {
    double inverse[3][3];
    ASSERT_TRUE(Invert3x3Matrix(JzazbzLMSMatrix, inverse));
    for (int i=0; i<3; i++){
        for (int j=0; j<3; j++){
            EXPECT_NEAR(inverse[i][j], InverseJzazbzLMSMatrix[i][j], 1e-12) << i << "," << j;
        }
    }
    ASSERT_TRUE(Invert3x3Matrix(JzazbzIabMatrix, inverse));
    for (int i=0; i<3; i++){
        for (int j=0; j<3; j++){
            EXPECT_NEAR(inverse[i][j], InverseJzazbzIabMatrix[i][j], 1e-12) << i << "," << j;
        }
    }
}

TEST(Jzazbz, XYZRoundTrip) {
    vec3 white = xyYtoXYZ(vec3(D65.x, D65.y, 1.0));
    vec3 colors[] = {
        white,
        white * 0.18,
        vec3(0.4, 0.2, 0.05),
        vec3(0.15, 0.06, 0.79)
    };
    for (const vec3 &xyz : colors){
        EXPECT_LT(MaxComponentDiff(LMStoXYZ(XYZtoLMS(xyz)), xyz), 1e-12);
        EXPECT_LT(MaxComponentDiff(JzazbzToXYZ(XYZtoJzazbz(xyz)), xyz), 1e-10);
    }
}

TEST(Jzazbz, WhiteIsNearlyNeutral) {
    vec3 white = LinearP3toJzazbz(vec3(1.0, 1.0, 1.0));
    EXPECT_NEAR(white.x, 0.16717243734640477, 1e-9);
    EXPECT_LT(Polarize(white).y, 1e-3);
}

TEST(Jzazbz, HueIsAtan2) {
    EXPECT_DOUBLE_EQ(JzazbzHue(vec3(0.1, 0.0, 0.02)), std::numbers::pi_v<double> / 2.0);
    EXPECT_DOUBLE_EQ(JzazbzHue(vec3(0.1, -0.02, 0.0)), std::numbers::pi_v<double>);
    EXPECT_DOUBLE_EQ(JzazbzHue(vec3(0.1, 0.02, 0.0)), 0.0);
    vec3 jab = vec3(0.1, 0.03, -0.04);
    EXPECT_DOUBLE_EQ(JzazbzHue(jab), Polarize(jab).z);
}
