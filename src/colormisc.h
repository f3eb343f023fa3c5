#ifndef COLORMISC_H
#define COLORMISC_H

#include "vec3.h"

#include <png.h> // Linux should have libpng-dev installed; Windows users can figure stuff out.


// clamp a double between 0.0 and 1.0
double clampdouble(double input);

// convert a 0-1 double value to 0-255 png_byte value with Martin Roberts' quasirandom dithering
png_byte quasirandomdither(double input, int x, int y);

// return to RGB8 with just rounding
png_byte toRGB8nodither(double input);

// sRGB gamma functions
// Display P3 uses the sRGB transfer curve, so these double as the P3 encode/decode.
double togamma(double input);
double tolinear(double input);

// clamps and gamma-encodes a linear P3 color per channel
vec3 togammaRGB(vec3 input);

// Calculate angleA minus angleB in radians
// Answer will be in range -pi to +pi radians.
double AngleDiff(double angleA, double angleB);

// Same thing in degrees; answer in range -180 to +180
double DegreeDiff(double angleA, double angleB);

#endif
