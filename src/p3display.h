#ifndef P3DISPLAY_H
#define P3DISPLAY_H

#include "vec3.h"

#include <string>

// Linear Display P3 <-> cone response (LMS) --------------------------------------------------------------------------------
// M_LMSToLinearP3 = M_XYZToLinearP3 * M_XYZpToXYZD65 * M_LMSToXYZD65p
// Precomposed once from the Display P3 primaries and the Jzazbz matrices; displaygamut::initialize() redoes the derivation.
// No clamping anywhere in here. Channels outside 0-1 mean the color is outside the display gamut,
// and it's up to whoever is drawing to decide what to do about that.
const double LMStoLinearP3Matrix[3][3]{
    {4.4820606379518333, -3.6184317541411817, 0.16694496856407345},
    {-1.9532025238860451, 3.5217700975984596, -0.54063532522070301},
    {-0.0027453573623004834, -0.45182653146288487, 1.4822547119502889}
};
const double LinearP3toLMSMatrix[3][3]{
    {0.41569922342211646, 0.4417746176493501, 0.11431238432553263},
    {0.24199222690861916, 0.5550591123439756, 0.17519605565166832},
    {0.07453493016949876, 0.17001346708806342, 0.7282635337867522}
};

vec3 LMStoLinearP3(vec3 input);
vec3 JzazbzToLinearP3(vec3 input);
vec3 LinearP3toLMS(vec3 input);
vec3 LinearP3toJzazbz(vec3 input);

// true if every channel is within [-tolerance, 1 + tolerance]
bool IsLinearP3InBounds(vec3 input, double tolerance);

// true if a Jzazbz color can be shown on a Display P3 screen.
// JzazbzToLMS() clamps silently, so a color that needed clamping counts as out of gamut even if its clamped RGB looks fine.
// If rgb is not nullptr, the linear P3 value is stored there.
bool IsJzazbzInP3Gamut(vec3 input, double tolerance, vec3* rgb);

// Describes an RGB display by its primaries and white point, and builds the matrices between its linear RGB and Jzazbz cone response.
// This is the derivation behind LMStoLinearP3Matrix.
class displaygamut{
public:
    int verbosemode;
    std::string gamutname;
    vec3 whitepoint;
    vec3 redpoint;
    vec3 greenpoint;
    vec3 bluepoint;
    double matrixP[3][3];
    double inverseMatrixP[3][3];
    vec3 matrixW;
    vec3 normalizationFactors;
    double matrixC[3][3];
    double matrixNPM[3][3];
    double inverseMatrixNPM[3][3];
    double matrixLMStoLinearRGB[3][3];
    double matrixLinearRGBtoLMS[3][3];

    // returns false if any of the matrices turns out singular
    bool initialize(std::string name, vec3 wp, vec3 rp, vec3 gp, vec3 bp, int verbose);
    void initializeMatrixP();
    bool initializeInverseMatrixP();
    void initializeMatrixW();
    void initializeNormalizationFactors();
    void initializeMatrixC();
    void initializeMatrixNPM();
    bool initializeInverseMatrixNPM();
    bool initializeLMSMatrices();

    vec3 LMStoLinearRGB(vec3 input);
    vec3 linearRGBtoLMS(vec3 input);
};

// Redoes the derivation of LMStoLinearP3Matrix from the Display P3 primaries and D65.
// returns false if any of the intermediate matrices is singular
bool deriveLMStoLinearP3Matrix(double output[3][3], int verbose);

#endif
