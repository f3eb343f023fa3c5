#include <stdio.h>
#include <math.h>
#include <string>

#include "constants.h"
#include "vec3.h"
#include "matrix.h"
#include "jzazbz.h"
#include "p3display.h"
#include "gamutbounds.h"
#include "colormisc.h"
#include "huechart.h"
#include "cliparse.h"

void printhelp(){
    printf("Usage is:\n\n`--help` or `-h`: Displays help.\n\n`--hue` or `-u`: Jzazbz hue angle in degrees. Any finite value; it is reduced to -180..180. Default 42.794290425520614 (the Display P3 red corner).\n\n`--mode` or `-m`: Search model. Possible values are:\n\t`scalar`: 20 rounds of plain bisection. Default.\n\t`wide`: 4 rounds, each testing 32 evenly spaced candidates.\n\n`--iterations`: Overrides the number of search rounds for the chosen mode. Integer 0-64; negative means the mode's default.\n\n`--lanes`: Overrides the number of candidates per round for the chosen mode. Integer 1-64; negative means the mode's default.\n\n`--table`: `true` to print the compiled and re-derived corner tables and matrices and check them. Default `false`.\n\n`--sweep`: Search this many evenly spaced hues around the circle and report the worst hue error. Default 0 (off).\n\n`--chart` or `-c`: Write a Jz/Cz slice through Display P3 at the chosen hue to this .png file.\n\n`--strip` or `-s`: Write a hue strip (white -> max chroma -> black for every hue) to this .png file.\n\n`--width` / `--height`: Image size in pixels. Default 512x512.\n\n`--dither` or `--di`: `true` or `false`. Uses Martin Roberts' quasirandom dithering. Default `true`.\n\n`--threads` or `-t`: Number of threads for rendering. Default 0 (let the thread pool decide).\n\n`--verbosity` or `-v`: Integers 0-4. Default 2.\n");
    return;
}

// screen barf for one search result
void printresult(double hue, vec3 jab, int iterations, int lanes){
    vec3 polar = Polarize(jab);
    vec3 lms = JzazbzToLMS(jab);
    vec3 rgb = LMStoLinearP3(lms);
    vec3 gammargb = togammaRGB(rgb);
    printf("Max chroma at hue %.17g degrees (%i iterations x %i lanes):\n", hue, iterations, lanes);
    printf("\tJzazbz:    %.17g, %.17g, %.17g\n", jab.x, jab.y, jab.z);
    printf("\tJzCzhz:    %.17g, %.17g, %.17g degrees\n", polar.x, polar.y, polar.polarangle());
    printf("\tLMS:       %.17g, %.17g, %.17g\n", lms.x, lms.y, lms.z);
    printf("\tlinear P3: %.17g, %.17g, %.17g\n", rgb.x, rgb.y, rgb.z);
    printf("\tDisplay P3 RGB8: 0x%02X%02X%02X\n", toRGB8nodither(gammargb.x), toRGB8nodither(gammargb.y), toRGB8nodither(gammargb.z));
    return;
}

// prints the compiled and derived tables and matrices and checks them against each other
int checktables(int verbosity){
    int result = RETURN_SUCCESS;

    printCornerTable(P3Corners, "Compiled Display P3 corner table");
    if (validateCornerTable(P3Corners, 1000, verbosity)){
        printf("Compiled corner table is valid.\n");
    }
    else {
        printf("Compiled corner table FAILED validation!\n");
        result = ERROR_TABLE_INVALID;
    }

    gamutcorner derived[CORNER_COUNT];
    if (deriveCornerTable(derived, verbosity)){
        printCornerTable(derived, "Re-derived Display P3 corner table");
        double worstlms = 0.0;
        double worsthue = 0.0;
        for (int i=0; i<CORNER_COUNT; i++){
            double lmsdiff = MaxComponentDiff(derived[i].lms, P3Corners[i].lms);
            double huediff = fabs(AngleDiff(derived[i].hue, P3Corners[i].hue));
            if (lmsdiff > worstlms) worstlms = lmsdiff;
            if (huediff > worsthue) worsthue = huediff;
        }
        printf("Largest difference between tables: %.3g in LMS, %.3g radians in hue.\n", worstlms, worsthue);
    }
    else {
        printf("Re-deriving the corner table FAILED!\n");
        result = ERROR_TABLE_INVALID;
    }

    printf("\nCompiled LMS to linear P3 matrix:\n");
    print3x3matrix(LMStoLinearP3Matrix);
    double derivedmatrix[3][3];
    if (!deriveLMStoLinearP3Matrix(derivedmatrix, verbosity)){
        printf("Re-deriving the LMS to linear P3 matrix FAILED!\n");
        return ERROR_INVERT_MATRIX_FAIL;
    }
    printf("Re-derived LMS to linear P3 matrix:\n");
    print3x3matrix(derivedmatrix);
    double matrixdiff = max3x3RelativeDiff(derivedmatrix, LMStoLinearP3Matrix);
    printf("Largest relative difference: %.3g\n", matrixdiff);
    if (matrixdiff > 5e-4){
        printf("Compiled matrix does not match the derivation!\n");
        result = ERROR_TABLE_INVALID;
    }

    return result;
}

// searches steps evenly spaced hues and reports how far the result's hue lands from the request
void sweephues(int steps, int iterations, int lanes, int verbosity){
    double worst = 0.0;
    double worsthue = 0.0;
    for (int i=0; i<steps; i++){
        double hue = -180.0 + ((360.0 * (double)i) / (double)steps);
        vec3 polar = Polarize(maxChromaAtHueSearch(hue, iterations, lanes));
        double error = fabs(DegreeDiff(hue, polar.polarangle()));
        if (verbosity >= VERBOSITY_HIGH){
            printf("hue %f: J %f, C %f, hue error %.3g degrees\n", hue, polar.x, polar.y, error);
        }
        if (error > worst){
            worst = error;
            worsthue = hue;
        }
    }
    printf("Swept %i hues with %i iterations x %i lanes. Worst hue error %.6g degrees at %f degrees.\n", steps, iterations, lanes, worst, worsthue);
    return;
}

int main(int argc, const char **argv){

    // ----------------------------------------------------------------------------------------
    // parameter processing

    maxchromaoptions options;
    int result = parseCommandLine(argc, argv, options);
    if (result != RETURN_SUCCESS){
        return result;
    }

    if (options.helpmode){
        printhelp();
        return RETURN_SUCCESS;
    }

    result = checkOptions(options);
    if (result != RETURN_SUCCESS){
        return result;
    }

    // ----------------------------------------------------------------------------------------
    // do the work

    if (options.tablemode){
        result = checktables(options.verbosity);
        if (result != RETURN_SUCCESS){
            return result;
        }
    }

    if (options.sweepsteps > 0){
        sweephues(options.sweepsteps, options.iterations, options.lanes, options.verbosity);
    }

    if (options.verbosity >= VERBOSITY_MINIMAL){
        printresult(options.hue, maxChromaAtHueSearch(options.hue, options.iterations, options.lanes), options.iterations, options.lanes);
    }

    // the renderers always use the scalar model
    if (options.chartset){
        result = writeHueChart(options.chartfilename.c_str(), options.hue, options.width, options.height, options.dither, options.threads, options.verbosity);
        if (result != RETURN_SUCCESS){
            return result;
        }
    }
    if (options.stripset){
        result = writeHueStrip(options.stripfilename.c_str(), options.width, options.height, options.dither, options.threads, options.verbosity);
        if (result != RETURN_SUCCESS){
            return result;
        }
    }

    return RETURN_SUCCESS;
}
