#include "colormisc.h"
#include "constants.h"

#include <math.h>
#include <numbers>

// clamp a double between 0.0 and 1.0
double clampdouble(double input){
    if (input < 0.0) return 0.0;
    if (input > 1.0) return 1.0;
    return input;
}

// convert a 0-1 double value to 0-255 png_byte value with Martin Roberts' quasirandom dithering
// see: https://extremelearning.com.au/unreasonable-effectiveness-of-quasirandom-sequences/
// The chart gradients are smooth enough to band at 8 bits; this breaks the bands up without any state carried between pixels,
// so rows can be rendered on different threads in any order.
png_byte quasirandomdither(double input, int x, int y){
    x++; // avoid x=0
    y++; // avoid y=0
    double dummy;
    double dither = modf(((double)x * 0.7548776662) + ((double)y * 0.56984029), &dummy);
    if (dither < 0.5){
        dither = 2.0 * dither;
    }
    else if (dither > 0.5) {
        dither = 2.0 - (2.0 * dither);
    }
    int output = (int)((input * 255.0) + dither);
    if (output > 255) output = 255;
    if (output < 0) output = 0;
    return (png_byte)output;
}

// return to RGB8 with just rounding
png_byte toRGB8nodither(double input){
    int output = (int)((input * 255.0) + 0.5);
    if (output > 255) output = 255;
    if (output < 0) output = 0;
    return (png_byte)output;
}

// sRGB gamma functions
double togamma(double input){
    if (input <= 0.0031308){
        return clampdouble(input * 12.92);
    }
    return clampdouble((1.055 * pow(input, (1.0/2.4))) - 0.055);
}
double tolinear(double input){
    if (input <= 0.04045){
        return clampdouble(input / 12.92);
    }
    return clampdouble(pow((input + 0.055) / 1.055, 2.4));
}

vec3 togammaRGB(vec3 input){
    return vec3(togamma(clampdouble(input.x)), togamma(clampdouble(input.y)), togamma(clampdouble(input.z)));
}

double AngleDiff(double angleA, double angleB){

    // skip the easy case
    if (angleA == angleB){
        return 0.0;
    }

    double output = fmod(angleA - angleB, 2.0 * std::numbers::pi_v<double>);

    // if difference is greater than 180 degrees, go the short way around
    if (output > std::numbers::pi_v<double>){
        output -= 2.0 * std::numbers::pi_v<double>;
    }
    else if (output < -std::numbers::pi_v<double>){
        output += 2.0 * std::numbers::pi_v<double>;
    }

    return output;
}

double DegreeDiff(double angleA, double angleB){
    if (angleA == angleB){
        return 0.0;
    }
    double output = fmod(angleA - angleB, 360.0);
    if (output > 180.0){
        output -= 360.0;
    }
    else if (output < -180.0){
        output += 360.0;
    }
    return output;
}
