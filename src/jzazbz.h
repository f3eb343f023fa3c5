#ifndef JZAZBZ_H
#define JZAZBZ_H

#include "vec3.h"

// Jzazbz Implementation------------------------------------------------------------------------------------------------------------------------
// The academic paper:  https://opg.optica.org/oe/fulltext.cfm?uri=oe-25-13-15131&id=368272
// Some other implementations/notes
// https://im.snibgo.com/jzazbz.htm
// https://observablehq.com/@jrus/jzazbz
// https://trev16.hatenablog.com/entry/2021/06/10/010715
// Note that the XYZ values must be relative to D65 whitepoint.
// The LMS values used here are scaled so that display white (Y = 1.0) sits at 100 cd/m^2,
// so the PQ curve sees LMS / 100 rather than the paper's absolute luminance / 10000.
// Like the choice of peak luminance in any Jzazbz implementation, this scale moves the hue angles,
// so the corner table in gamutbounds.cpp is only valid for this value.

#define Jzazbz_b 1.15
#define Jzazbz_g 0.66
#define Jzazbz_c1 (3424.0/4096.0)
#define Jzazbz_c2 (2413.0/128.0)
#define Jzazbz_c3 (2392.0/128.0)
#define Jzazbz_n (2610.0/16384.0)
#define Jzazbz_p (1.7*2523/32.0)
#define Jzazbz_d (-0.56)
#define Jzazbz_d0 (1.6295499532821566e-11)
#define Jzazbz_LMS_scale 100.0

// Domain of the inverse PQ function, in compressed (LMS') units.
// The floor is c1^p, which is what PQ(0.0) returns; the ceiling is (c2/c3)^p rounded down, past which InversePQ() goes imaginary.
#define Jzazbz_LMSp_min 3.7035226210190005e-11
#define Jzazbz_LMSp_max 3.227

// PQ function & inverse, in the LMS scale above
// PQ() clamps its input to >= 0, so black maps exactly to Jz = 0 once d0 is subtracted.
// InversePQ() clamps its input into [Jzazbz_LMSp_min, Jzazbz_LMSp_max].
// Both are therefore total: the bisection in gamutbounds.cpp can feed them slightly out of range values without producing NaN.
double PQ(double input);
double InversePQ(double input);

// Constant matrices from the paper
const double JzazbzLMSMatrix[3][3]{
    {0.41478972, 0.579999, 0.0146480},
    {-0.2015100, 1.120649, 0.0531008},
    {-0.0166008, 0.264800, 0.6684799}
};
const double JzazbzIabMatrix[3][3]{
    {0.5, 0.5, 0.0},
    {3.524000, -4.066708, 0.542708},
    {0.199076, 1.096799, -1.295875}
};
// and their inverses, precomputed so nothing needs initializing at startup
const double InverseJzazbzLMSMatrix[3][3]{
    {1.9242264357876064, -1.0047923125953655, 0.03765140403061801},
    {0.35031676209499907, 0.7264811939316552, -0.06538442294808501},
    {-0.09098281098284756, -0.31272829052307394, 1.5227665613052603}
};
const double InverseJzazbzIabMatrix[3][3]{
    {1.0, 0.13860504327153927, 0.058047316156118856},
    {0.9999999999999998, -0.13860504327153927, -0.058047316156118856},
    {0.9999999999999998, -0.09601924202631894, -0.8118918960560388}
};

// conversions
// cone response to Jzazbz (forward) and back (inverse)
vec3 LMStoJzazbz(vec3 input);
vec3 JzazbzToLMS(vec3 input);

// XYZ (D65, display white at Y = 1.0) to cone response and back
vec3 XYZtoLMS(vec3 input);
vec3 LMStoXYZ(vec3 input);

vec3 XYZtoJzazbz(vec3 input);
vec3 JzazbzToXYZ(vec3 input);

// hue angle of a Jzazbz color in radians, range -pi to pi
double JzazbzHue(vec3 input);

#endif
