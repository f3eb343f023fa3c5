#include <gtest/gtest.h>

#include <math.h>

#include "constants.h"
#include "vec3.h"
#include "matrix.h"
#include "jzazbz.h"
#include "p3display.h"
#include "gamutbounds.h"

TEST(P3Display, CornersMapToUnitCube) {
    const vec3 expected[CORNER_COUNT - 2] = {
        vec3(0.0, 1.0, 1.0), // cyan
        vec3(0.0, 0.0, 1.0), // blue
        vec3(1.0, 0.0, 1.0), // magenta
        vec3(1.0, 0.0, 0.0), // red
        vec3(1.0, 1.0, 0.0), // yellow
        vec3(0.0, 1.0, 0.0) // green
    };
    for (int i=0; i<CORNER_COUNT - 2; i++){
        vec3 rgb = LMStoLinearP3(P3Corners[i+1].lms);
        EXPECT_LT(MaxComponentDiff(rgb, expected[i]), 1e-12) << cornernames[i+1];
    }
    // wrap corner sits on the green-cyan edge
    vec3 wrap = LMStoLinearP3(P3Corners[0].lms);
    EXPECT_NEAR(wrap.x, 0.0, 1e-12);
    EXPECT_NEAR(wrap.y, 1.0, 1e-12);
    EXPECT_NEAR(wrap.z, 0.6500987523880948, 1e-9);
}

TEST(P3Display, MatricesAreInverses) {
    double product[3][3];
    mult3x3Matrices(LMStoLinearP3Matrix, LinearP3toLMSMatrix, product);
    for (int i=0; i<3; i++){
        for (int j=0; j<3; j++){
            EXPECT_NEAR(product[i][j], (i == j) ? 1.0 : 0.0, 1e-12) << i << "," << j;
        }
    }
    double inverse[3][3];
    ASSERT_TRUE(Invert3x3Matrix(LMStoLinearP3Matrix, inverse));
    EXPECT_LT(max3x3RelativeDiff(inverse, LinearP3toLMSMatrix), 1e-10);
}

TEST(P3Display, DerivedMatrixMatchesCompiled) {
    double derived[3][3];
    ASSERT_TRUE(deriveLMStoLinearP3Matrix(derived, VERBOSITY_SILENT));
    EXPECT_LT(max3x3RelativeDiff(derived, LMStoLinearP3Matrix), 5e-4);
}

TEST(P3Display, DisplayGamutRejectsDegeneratePrimaries) {
    displaygamut broken;
    vec3 red = vec3(0.680, 0.320, 0.000);
    vec3 blue = vec3(0.150, 0.060, 0.790);
    EXPECT_FALSE(broken.initialize("broken", D65, red, red, blue, VERBOSITY_SILENT));
}

TEST(P3Display, DisplayGamutRoundTrip) {
    displaygamut p3;
    vec3 red = vec3(DisplayP3Primaries[0][0], DisplayP3Primaries[0][1], DisplayP3Primaries[0][2]);
    vec3 green = vec3(DisplayP3Primaries[1][0], DisplayP3Primaries[1][1], DisplayP3Primaries[1][2]);
    vec3 blue = vec3(DisplayP3Primaries[2][0], DisplayP3Primaries[2][1], DisplayP3Primaries[2][2]);
    ASSERT_TRUE(p3.initialize("Display P3", D65, red, green, blue, VERBOSITY_SILENT));
    vec3 rgb = vec3(0.2, 0.7, 0.4);
    EXPECT_LT(MaxComponentDiff(p3.LMStoLinearRGB(p3.linearRGBtoLMS(rgb)), rgb), 1e-12);
    // white comes out white to within the rounding of the compiled constants
    vec3 white = p3.LMStoLinearRGB(LinearP3toLMS(vec3(1.0, 1.0, 1.0)));
    EXPECT_LT(MaxComponentDiff(white, vec3(1.0, 1.0, 1.0)), EPSILONDONTCARE);
}

TEST(P3Display, JzazbzToLinearP3Composes) {
    vec3 jab = vec3(0.1, 0.05, -0.02);
    vec3 viaLMS = LMStoLinearP3(JzazbzToLMS(jab));
    vec3 direct = JzazbzToLinearP3(jab);
    EXPECT_EQ(direct.x, viaLMS.x);
    EXPECT_EQ(direct.y, viaLMS.y);
    EXPECT_EQ(direct.z, viaLMS.z);
    vec3 rgb = vec3(0.25, 0.5, 0.75);
    EXPECT_LT(MaxComponentDiff(JzazbzToLinearP3(LinearP3toJzazbz(rgb)), rgb), 1e-12);
}

TEST(P3Display, LinearBounds) {
    EXPECT_TRUE(IsLinearP3InBounds(vec3(0.0, 0.5, 1.0), 0.0));
    EXPECT_FALSE(IsLinearP3InBounds(vec3(-0.001, 0.5, 1.0), 0.0));
    EXPECT_TRUE(IsLinearP3InBounds(vec3(-0.001, 0.5, 1.0), 0.01));
    EXPECT_FALSE(IsLinearP3InBounds(vec3(0.5, 1.02, 0.5), 0.01));
}

TEST(P3Display, JzazbzGamutTest) {
    vec3 rgb;
    EXPECT_TRUE(IsJzazbzInP3Gamut(LinearP3toJzazbz(vec3(1.0, 1.0, 1.0)), EPSILON, &rgb));
    EXPECT_LT(MaxComponentDiff(rgb, vec3(1.0, 1.0, 1.0)), 1e-12);

    EXPECT_TRUE(IsJzazbzInP3Gamut(LinearP3toJzazbz(vec3(0.1, 0.6, 0.3)), EPSILON, nullptr));

    // push the red corner further out in chroma
    vec3 red = Polarize(LinearP3toJzazbz(vec3(1.0, 0.0, 0.0)));
    red.y *= 1.05;
    EXPECT_FALSE(IsJzazbzInP3Gamut(Depolarize(red), EPSILON, nullptr));

    // far brighter than display white
    EXPECT_FALSE(IsJzazbzInP3Gamut(vec3(0.9, 0.0, 0.0), EPSILON, nullptr));

    EXPECT_FALSE(IsJzazbzInP3Gamut(vec3(NAN, 0.0, 0.0), EPSILON, nullptr));
}
