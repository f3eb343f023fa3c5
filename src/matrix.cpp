#include "matrix.h"

#include <stdio.h>
#include <math.h>

// screen barfs a 3x3 matrix
void print3x3matrix(const double input[3][3]){
    printf("{{%.17g, %.17g, %.17g},\n{%.17g, %.17g, %.17g},\n{%.17g, %.17g, %.17g}}\n", input[0][0], input[0][1], input[0][2], input[1][0], input[1][1], input[1][2], input[2][0], input[2][1], input[2][2]);
    return;
}

// multiplies matrix * color
// remember that a c++ 2-dimensional array is [row][col]
vec3 multMatrixByColor(const double matrix[3][3], vec3 color){
    vec3 output;
    output.x = matrix[0][0] * color.x + matrix[0][1] * color.y + matrix[0][2] * color.z;
    output.y = matrix[1][0] * color.x + matrix[1][1] * color.y + matrix[1][2] * color.z;
    output.z = matrix[2][0] * color.x + matrix[2][1] * color.y + matrix[2][2] * color.z;
    return output;
}

// multiplies A*B and puts result in output
// output may not alias A or B
void mult3x3Matrices(const double A[3][3], const double B[3][3], double output[3][3]){
    for (int row=0; row<3; row++){
        for (int col=0; col<3; col++){
            output[row][col] = (A[row][0] * B[0][col]) + (A[row][1] * B[1][col]) + (A[row][2] * B[2][col]);
        }
    }
    return;
}

// inverts input and puts result in output via the adjugate
// returns false if matrix is not invertible; otherwise true
bool Invert3x3Matrix(const double input[3][3], double output[3][3]){

    // cofactors of the first row double as the determinant expansion
    double c00 = (input[1][1] * input[2][2]) - (input[1][2] * input[2][1]);
    double c01 = (input[1][2] * input[2][0]) - (input[1][0] * input[2][2]);
    double c02 = (input[1][0] * input[2][1]) - (input[1][1] * input[2][0]);

    double determinant = (input[0][0] * c00) + (input[0][1] * c01) + (input[0][2] * c02);
    if (determinant == 0.0){
        return false;
    }

    // the adjugate is the transposed cofactor matrix
    double adjugate[3][3];
    adjugate[0][0] = c00;
    adjugate[1][0] = c01;
    adjugate[2][0] = c02;
    adjugate[0][1] = (input[0][2] * input[2][1]) - (input[0][1] * input[2][2]);
    adjugate[1][1] = (input[0][0] * input[2][2]) - (input[0][2] * input[2][0]);
    adjugate[2][1] = (input[0][1] * input[2][0]) - (input[0][0] * input[2][1]);
    adjugate[0][2] = (input[0][1] * input[1][2]) - (input[0][2] * input[1][1]);
    adjugate[1][2] = (input[0][2] * input[1][0]) - (input[0][0] * input[1][2]);
    adjugate[2][2] = (input[0][0] * input[1][1]) - (input[0][1] * input[1][0]);

    for (int row=0; row<3; row++){
        for (int col=0; col<3; col++){
            output[row][col] = adjugate[row][col] / determinant;
        }
    }

    return true;
}

double max3x3RelativeDiff(const double A[3][3], const double B[3][3]){
    double output = 0.0;
    for (int row=0; row<3; row++){
        for (int col=0; col<3; col++){
            double diff = fabs(A[row][col] - B[row][col]);
            if (B[row][col] != 0.0){
                diff /= fabs(B[row][col]);
            }
            if (diff > output){
                output = diff;
            }
        }
    }
    return output;
}
