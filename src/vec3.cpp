#include "vec3.h"

#include <stdio.h>
#include <math.h>
#include <numbers>


vec3:: vec3(){ x = y = z = 0;}

vec3::vec3(double a, double b, double c){
    x = a;
    y = b;
    z = c;
}

// assumes a LCh style colorspace and outputs the radians hue value as degrees
double vec3::polarangle() const {
    return z * (180.0 / std::numbers::pi_v<double>);
}

bool vec3::hasnan() const {
    return isnan(x) || isnan(y) || isnan(z);
}

// screen barf
void vec3::printout() const {
    printf("{%.10f, %.10f, %.10f}\n", x, y, z);
    return;
}

vec3 Lerp(vec3 A, vec3 B, double t){
    return A + ((B - A) * t);
}

double MaxComponentDiff(vec3 A, vec3 B){
    double output = fabs(A.x - B.x);
    double dy = fabs(A.y - B.y);
    double dz = fabs(A.z - B.z);
    if (dy > output) output = dy;
    if (dz > output) output = dz;
    return output;
}

// converts LAB-style colorspaces to their polar LCh-style cousins
// h is in radians
// Unlike the usual 0 to 2pi convention, hue stays in atan2's -pi to pi range, which is what the corner table is sorted by.
vec3 Polarize(vec3 input){
    vec3 output;
    output.x = input.x;
    output.y = sqrt((input.y * input.y) + (input.z * input.z));
    output.z = atan2(input.z, input.y);
    return output;
}

// converts LCh-style colorpaces back to their LAB-style cartesian cousins
// h is in radians
vec3 Depolarize(vec3 input){
    vec3 output;
    output.x = input.x;
    output.y = input.y * cos(input.z);
    output.z = input.y * sin(input.z);
    return output;
}

// convert xyY to XYZ
vec3 xyYtoXYZ(vec3 input){
    /*
    X= xY/y
    Y=Y
    Z=((1-x-y)Y)/y
    */
    double X = (input.x * input.z)/input.y;
    double Z = ((1.0 - input.x - input.y) * input.z)/input.y;
    return vec3(X, input.z, Z);
}
