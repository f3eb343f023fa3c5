#ifndef CONSTANTS_H
#define CONSTANTS_H

#include "vec3.h"
#include <string>

#define VERBOSITY_SILENT 0
#define VERBOSITY_MINIMAL 1
#define VERBOSITY_SLIGHT 2
#define VERBOSITY_HIGH 3
#define VERBOSITY_EXTREME 4

#define EPSILON 1e-6 // this is about where rounding errors start to creep in
#define EPSILONZERO 1e-10 // for checking zero
#define EPSILONDONTCARE 2e-4 // for comparing against hand-derived constants that were rounded along the way

#define RETURN_SUCCESS 0
#define ERROR_BAD_PARAM_BOOL 1
#define ERROR_BAD_PARAM_SELECT 2
#define ERROR_BAD_PARAM_FLOAT 3
#define ERROR_BAD_PARAM_INT 4
#define ERROR_BAD_PARAM_MISSING_VALUE 5
#define ERROR_BAD_PARAM_UNKNOWN_PARAM 6
#define ERROR_BAD_PARAM_OUT_OF_RANGE 7
#define ERROR_INVERT_MATRIX_FAIL 8
#define ERROR_TABLE_INVALID 9
#define ERROR_PNG_WRITE_FAIL 10
#define ERROR_PNG_MEM_FAIL 11

#define SEARCH_MODE_SCALAR 0
#define SEARCH_MODE_WIDE 1

// scalar model: one candidate per iteration, i.e. plain bisection
#define SCALAR_SEARCH_ITERATIONS 20
#define SCALAR_SEARCH_LANES 1
// wide model: many candidates per iteration, the way a GPU threadgroup would run it
#define WIDE_SEARCH_ITERATIONS 4
#define WIDE_SEARCH_LANES 32
#define MAX_SEARCH_LANES 64
// 64 bisection steps already exhaust a double
#define MAX_SEARCH_ITERATIONS 64

// D65 in xyz chromaticity coordinates (same value Display P3 specifies)
extern const vec3 D65;

// Display P3 primaries, x, y, z
const double DisplayP3Primaries[3][3] = {
    {0.680, 0.320, 0.000}, //red
    {0.265, 0.690, 0.045}, //green
    {0.150, 0.060, 0.790} //blue
};

const std::string cornernames[8] = {
    "Green/Cyan (wrap, -pi)",
    "Cyan",
    "Blue",
    "Magenta",
    "Red",
    "Yellow",
    "Green",
    "Green/Cyan (wrap, +pi)"
};

#endif
