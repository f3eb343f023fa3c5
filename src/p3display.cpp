#include "p3display.h"

#include "constants.h"
#include "matrix.h"
#include "jzazbz.h"

#include <stdio.h>
#include <cstring> //for memcpy

const vec3 D65 = vec3(0.312713, 0.329016, 0.358271);

vec3 LMStoLinearP3(vec3 input){
    return multMatrixByColor(LMStoLinearP3Matrix, input);
}

vec3 JzazbzToLinearP3(vec3 input){
    return LMStoLinearP3(JzazbzToLMS(input));
}

vec3 LinearP3toLMS(vec3 input){
    return multMatrixByColor(LinearP3toLMSMatrix, input);
}

vec3 LinearP3toJzazbz(vec3 input){
    return LMStoJzazbz(LinearP3toLMS(input));
}

bool IsLinearP3InBounds(vec3 input, double tolerance){
    double low = -tolerance;
    double high = 1.0 + tolerance;
    if ((input.x < low) || (input.x > high)) return false;
    if ((input.y < low) || (input.y > high)) return false;
    if ((input.z < low) || (input.z > high)) return false;
    return true;
}

bool IsJzazbzInP3Gamut(vec3 input, double tolerance, vec3* rgb){
    vec3 lms = JzazbzToLMS(input);
    vec3 linear = LMStoLinearP3(lms);
    if (rgb != nullptr){
        *rgb = linear;
    }
    if (input.hasnan() || linear.hasnan()){
        return false;
    }
    // did JzazbzToLMS() have to clamp?
    if (MaxComponentDiff(LMStoJzazbz(lms), input) > EPSILON){
        return false;
    }
    return IsLinearP3InBounds(linear, tolerance);
}

bool displaygamut::initialize(std::string name, vec3 wp, vec3 rp, vec3 gp, vec3 bp, int verbose){
    verbosemode = verbose;
    gamutname = name;
    whitepoint = wp;
    redpoint = rp;
    greenpoint = gp;
    bluepoint = bp;

    if (verbose >= VERBOSITY_SLIGHT){
        printf("\n----------\nInitializing %s...\n", gamutname.c_str());
    }

    initializeMatrixP();
    if (verbose >= VERBOSITY_HIGH){
        printf("\nMatrix P is:\n");
        print3x3matrix(matrixP);
    }

    if (!initializeInverseMatrixP()){
        printf("Initialization aborted!\n");
        return false;
    }

    initializeMatrixW();
    if (verbose >= VERBOSITY_HIGH){
        printf("\nMatrix W is: ");
        matrixW.printout();
    }

    initializeNormalizationFactors();
    if (verbose >= VERBOSITY_HIGH){
        printf("\nNormalization Factors are: ");
        normalizationFactors.printout();
    }

    initializeMatrixC();

    initializeMatrixNPM();
    if (verbose >= VERBOSITY_SLIGHT){
        printf("\nMatrix NPM (linear RGB to XYZ) is:\n");
        print3x3matrix(matrixNPM);
    }

    if (!initializeInverseMatrixNPM()){
        printf("Initialization aborted!\n");
        return false;
    }

    if (!initializeLMSMatrices()){
        printf("Initialization aborted!\n");
        return false;
    }
    if (verbose >= VERBOSITY_SLIGHT){
        printf("\nMatrix LMS to linear RGB is:\n");
        print3x3matrix(matrixLMStoLinearRGB);
    }

    if (verbose >= VERBOSITY_SLIGHT) printf("\nDone initializing %s.\n----------\n", gamutname.c_str());
    return true;
}

void displaygamut::initializeMatrixP(){
    matrixP[0][0] = redpoint.x;
    matrixP[0][1] = greenpoint.x;
    matrixP[0][2] = bluepoint.x;
    matrixP[1][0] = redpoint.y;
    matrixP[1][1] = greenpoint.y;
    matrixP[1][2] = bluepoint.y;
    matrixP[2][0] = redpoint.z;
    matrixP[2][1] = greenpoint.z;
    matrixP[2][2] = bluepoint.z;
    return;
}

bool displaygamut::initializeInverseMatrixP(){
    bool output = Invert3x3Matrix(matrixP, inverseMatrixP);
    if (!output){
        printf("Matrix P for %s is not invertible! Are two primaries the same?\n", gamutname.c_str());
    }
    return output;
}

void displaygamut::initializeMatrixW(){
    matrixW.x = whitepoint.x / whitepoint.y;
    matrixW.y = 1.0;
    matrixW.z = whitepoint.z / whitepoint.y;
    return;
}

void displaygamut::initializeNormalizationFactors(){
    normalizationFactors = multMatrixByColor(inverseMatrixP, matrixW);
    return;
}

void displaygamut::initializeMatrixC(){
    memset(matrixC, 0, 9 * sizeof(double));
    matrixC[0][0] = normalizationFactors.x;
    matrixC[1][1] = normalizationFactors.y;
    matrixC[2][2] = normalizationFactors.z;
    return;
}

void displaygamut::initializeMatrixNPM(){
    mult3x3Matrices(matrixP, matrixC, matrixNPM);
    return;
}

bool displaygamut::initializeInverseMatrixNPM(){
    bool output = Invert3x3Matrix(matrixNPM, inverseMatrixNPM);
    if (!output){
        printf("Matrix NPM for %s is not invertible!\n", gamutname.c_str());
    }
    return output;
}

// LMS -> XYZ' -> XYZ -> linear RGB
bool displaygamut::initializeLMSMatrices(){
    // XYZ' = matrixBG * XYZ
    const double matrixBG[3][3] = {
        {Jzazbz_b, 0.0, -(Jzazbz_b - 1.0)},
        {-(Jzazbz_g - 1.0), Jzazbz_g, 0.0},
        {0.0, 0.0, 1.0}
    };
    double inverseMatrixBG[3][3];
    if (!Invert3x3Matrix(matrixBG, inverseMatrixBG)){
        printf("Jzazbz XYZ' matrix is not invertible!\n");
        return false;
    }

    double matrixLMStoXYZ[3][3];
    mult3x3Matrices(inverseMatrixBG, InverseJzazbzLMSMatrix, matrixLMStoXYZ);
    mult3x3Matrices(inverseMatrixNPM, matrixLMStoXYZ, matrixLMStoLinearRGB);

    if (!Invert3x3Matrix(matrixLMStoLinearRGB, matrixLinearRGBtoLMS)){
        printf("Matrix LMS to linear RGB for %s is not invertible!\n", gamutname.c_str());
        return false;
    }
    return true;
}

vec3 displaygamut::LMStoLinearRGB(vec3 input){
    return multMatrixByColor(matrixLMStoLinearRGB, input);
}

vec3 displaygamut::linearRGBtoLMS(vec3 input){
    return multMatrixByColor(matrixLinearRGBtoLMS, input);
}

bool deriveLMStoLinearP3Matrix(double output[3][3], int verbose){
    displaygamut p3;
    vec3 redpoint = vec3(DisplayP3Primaries[0][0], DisplayP3Primaries[0][1], DisplayP3Primaries[0][2]);
    vec3 greenpoint = vec3(DisplayP3Primaries[1][0], DisplayP3Primaries[1][1], DisplayP3Primaries[1][2]);
    vec3 bluepoint = vec3(DisplayP3Primaries[2][0], DisplayP3Primaries[2][1], DisplayP3Primaries[2][2]);
    if (!p3.initialize("Display P3", D65, redpoint, greenpoint, bluepoint, verbose)){
        return false;
    }
    memcpy(output, p3.matrixLMStoLinearRGB, 9 * sizeof(double));
    return true;
}
