#include "jzazbz.h"

#include <math.h>
#include "matrix.h"

// PQ function & inverse
double PQ(double input){
    if (input < 0.0){
        input = 0.0;
    }
    double XX = pow(input / Jzazbz_LMS_scale, Jzazbz_n);
    return pow((Jzazbz_c1 + Jzazbz_c2*XX) / (1.0 + Jzazbz_c3*XX), Jzazbz_p);
}

double InversePQ(double input){
    if (input < Jzazbz_LMSp_min){
        input = Jzazbz_LMSp_min;
    }
    else if (input > Jzazbz_LMSp_max){
        input = Jzazbz_LMSp_max;
    }
    double XX = pow(input, 1.0 / Jzazbz_p);
    double ratio = (Jzazbz_c1 - XX) / ((Jzazbz_c3 * XX) - Jzazbz_c2);
    // rounding in pow() can leave the floor a hair below c1
    if (ratio < 0.0){
        ratio = 0.0;
    }
    return Jzazbz_LMS_scale * pow(ratio, 1.0 / Jzazbz_n);
}

vec3 LMStoJzazbz(vec3 input){

    vec3 LMSprime = {PQ(input.x), PQ(input.y), PQ(input.z)};

    vec3 Izazbz = multMatrixByColor(JzazbzIabMatrix, LMSprime);

    double Jz = (((1.0 + Jzazbz_d) * Izazbz.x) / (1.0 + (Jzazbz_d * Izazbz.x))) - Jzazbz_d0;

    vec3 output = {Jz, Izazbz.y, Izazbz.z};

    return output;
}

vec3 JzazbzToLMS(vec3 input){

    double tempIz = input.x + Jzazbz_d0;

    double Iz = (tempIz) / (1.0 + Jzazbz_d - (Jzazbz_d * tempIz));

    vec3 Izazbz = {Iz, input.y, input.z};

    vec3 LMSprime = multMatrixByColor(InverseJzazbzIabMatrix, Izazbz);

    vec3 output = {InversePQ(LMSprime.x), InversePQ(LMSprime.y), InversePQ(LMSprime.z)};

    return output;
}

vec3 XYZtoLMS(vec3 input){

    vec3 XYZprime = {(Jzazbz_b * input.x) - ((Jzazbz_b - 1.0) * input.z), (Jzazbz_g * input.y) - ((Jzazbz_g - 1.0) * input.x), input.z};

    return multMatrixByColor(JzazbzLMSMatrix, XYZprime);
}

vec3 LMStoXYZ(vec3 input){

    vec3 XYZprime = multMatrixByColor(InverseJzazbzLMSMatrix, input);

    vec3 XYZ;
    XYZ.x = (XYZprime.x + ((Jzazbz_b - 1.0) * XYZprime.z)) / Jzazbz_b;
    XYZ.y = (XYZprime.y + ((Jzazbz_g - 1.0) * XYZ.x)) / Jzazbz_g; // note that the X term is from the line above, not from XYZprime
    XYZ.z = XYZprime.z;

    return XYZ;
}

vec3 XYZtoJzazbz(vec3 input){
    return LMStoJzazbz(XYZtoLMS(input));
}

vec3 JzazbzToXYZ(vec3 input){
    return LMStoXYZ(JzazbzToLMS(input));
}

double JzazbzHue(vec3 input){
    return atan2(input.z, input.y);
}
