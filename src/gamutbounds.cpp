#include "gamutbounds.h"

#include "constants.h"
#include "jzazbz.h"
#include "p3display.h"
#include "colormisc.h"

#include <math.h>
#include <stdio.h>
#include <numbers>

// LMS of the Display P3 corners, in the order cyan, blue, magenta, red, yellow, green,
// with the green-cyan hue = pi crossing (linear P3 {0.0, 1.0, 0.6500987523880948}) at both ends.
// Hues are LMStoJzazbz() of each LMS value.
// The wrap LMS is the 64-step bisection from deriveCornerTable(); its hue is within 1e-13 of pi.
const gamutcorner P3Corners[CORNER_COUNT] = {
    {{0.5160889560818874, 0.6689538495464404, 0.6434566818125762}, -std::numbers::pi_v<double>},
    {{0.55608700197488292, 0.73025516799564405, 0.89827700087481577}, -2.7604618631505451}, // cyan
    {{0.11431238432553269, 0.17519605565166838, 0.72826353378675235}, -1.7688992503294745}, // blue
    {{0.53001160774764933, 0.41718828256028762, 0.8027984639562511}, -0.60623058828496412}, // magenta
    {{0.41569922342211668, 0.24199222690861924, 0.074534930169498803}, 0.74690126898001996}, // red
    {{0.85747384107146684, 0.79705133925259486, 0.24454839725756228}, 1.789331917784555}, // yellow
    {{0.44177461764935022, 0.55505911234397565, 0.17001346708806347}, 2.3782967581439904}, // green
    {{0.5160889560818874, 0.6689538495464404, 0.6434566818125762}, std::numbers::pi_v<double>}
};

double normalizeHueDegrees(double hue){
    double output = fmod(hue, 360.0);
    if (output < 0.0){
        output += 360.0;
    }
    // fmod() of a tiny negative number can round up to exactly 360
    if (output >= 180.0){
        output -= 360.0;
    }
    return output;
}

searchbracket bracketForHue(double hue){
    int j = 0;
    j += (P3Corners[4].hue <= hue) ? 4 : 0;
    j += (P3Corners[j+2].hue <= hue) ? 2 : 0;
    j += (P3Corners[j+1].hue <= hue) ? 1 : 0;
    // only hue >= pi gets here; there's no edge past the last corner
    if (j > CORNER_COUNT - 2){
        j = CORNER_COUNT - 2;
    }

    searchbracket output;
    output.lower = P3Corners[j].lms;
    output.upper = P3Corners[j+1].lms;
    output.lowerhue = P3Corners[j].hue;
    output.upperhue = P3Corners[j+1].hue;
    return output;
}

double unwrapHueToBracket(double hue, double lowerhue, double upperhue){
    if (hue > upperhue + std::numbers::pi_v<double>){
        hue -= 2.0 * std::numbers::pi_v<double>;
    }
    else if (hue < lowerhue - std::numbers::pi_v<double>){
        hue += 2.0 * std::numbers::pi_v<double>;
    }
    return hue;
}

searchbracket narrowBracket(searchbracket bracket, double targethue, int iterations, int lanes){
    if (lanes < 1){
        lanes = 1;
    }
    if (lanes > MAX_SEARCH_LANES){
        lanes = MAX_SEARCH_LANES;
    }
    if (iterations > MAX_SEARCH_ITERATIONS){
        iterations = MAX_SEARCH_ITERATIONS;
    }
    double step = 1.0 / (double)(lanes + 1);
    double lanehues[MAX_SEARCH_LANES];

    for (int i=0; i<iterations; i++){
        // every lane evaluates its own candidate
        for (int k=0; k<lanes; k++){
            vec3 candidate = Lerp(bracket.lower, bracket.upper, (double)(k + 1) * step);
            lanehues[k] = unwrapHueToBracket(JzazbzHue(LMStoJzazbz(candidate)), bracket.lowerhue, bracket.upperhue);
        }

        // max reduction: highest lane that's still inside (hue <= target)
        int best = -1;
        for (int k=0; k<lanes; k++){
            if (lanehues[k] <= targethue){
                best = k;
            }
        }

        // boundary lies between candidate best and candidate best + 1
        // (candidate -1 is the old lower, candidate lanes is the old upper)
        searchbracket next = bracket;
        if (best >= 0){
            next.lower = Lerp(bracket.lower, bracket.upper, (double)(best + 1) * step);
            next.lowerhue = lanehues[best];
        }
        if (best < lanes - 1){
            next.upper = Lerp(bracket.lower, bracket.upper, (double)(best + 2) * step);
            next.upperhue = lanehues[best + 1];
        }
        bracket = next;
    }

    return bracket;
}

vec3 findMaxChromaLMS(double hue, int iterations, int lanes){
    searchbracket bracket = bracketForHue(hue);
    bracket = narrowBracket(bracket, hue, iterations, lanes);
    return bracket.lower;
}

vec3 maxChromaAtHueSearch(double hue, int iterations, int lanes){
    if (!isfinite(hue)){
        return vec3(NAN, NAN, NAN);
    }
    double target = normalizeHueDegrees(hue) * (std::numbers::pi_v<double> / 180.0);
    return LMStoJzazbz(findMaxChromaLMS(target, iterations, lanes));
}

vec3 maxChromaAtHue(double hue){
    return maxChromaAtHueSearch(hue, SCALAR_SEARCH_ITERATIONS, SCALAR_SEARCH_LANES);
}

vec3 maxChromaAtHueWide(double hue){
    return maxChromaAtHueSearch(hue, WIDE_SEARCH_ITERATIONS, WIDE_SEARCH_LANES);
}

bool validateCornerTable(const gamutcorner table[CORNER_COUNT], int samples, int verbose){
    bool output = true;
    if (samples < 1){
        samples = 1;
    }

    // sorted?
    for (int i=0; i<CORNER_COUNT - 1; i++){
        if (!(table[i].hue < table[i+1].hue)){
            if (verbose >= VERBOSITY_MINIMAL){
                printf("Corner table is not sorted: %s (%f) is not below %s (%f).\n", cornernames[i].c_str(), table[i].hue, cornernames[i+1].c_str(), table[i+1].hue);
            }
            output = false;
        }
    }

    // closed?
    if ((MaxComponentDiff(table[0].lms, table[CORNER_COUNT - 1].lms) > EPSILONZERO) || (fabs(table[0].hue + std::numbers::pi_v<double>) > EPSILONZERO) || (fabs(table[CORNER_COUNT - 1].hue - std::numbers::pi_v<double>) > EPSILONZERO)){
        if (verbose >= VERBOSITY_MINIMAL){
            printf("Corner table does not wrap: first and last entries must be the same color at -pi and pi.\n");
        }
        output = false;
    }

    // stored hues match the transform?
    for (int i=0; i<CORNER_COUNT; i++){
        double hue = JzazbzHue(LMStoJzazbz(table[i].lms));
        // +pi and -pi are the same hue
        double error = fabs(AngleDiff(hue, table[i].hue));
        if (verbose >= VERBOSITY_HIGH){
            printf("%s: stored hue %.17g, computed hue %.17g, difference %g\n", cornernames[i].c_str(), table[i].hue, hue, error);
        }
        if (error > 1e-9){
            if (verbose >= VERBOSITY_MINIMAL){
                printf("Corner %s has stored hue %.17g but converts to %.17g.\n", cornernames[i].c_str(), table[i].hue, hue);
            }
            output = false;
        }
    }

    // hue monotonic along each edge?
    for (int i=0; i<CORNER_COUNT - 1; i++){
        // compared the same way narrowBracket() compares them
        double lasthue = unwrapHueToBracket(JzazbzHue(LMStoJzazbz(table[i].lms)), table[i].hue, table[i+1].hue);
        int badcount = 0;
        for (int s=1; s<=samples; s++){
            double t = (double)s / (double)samples;
            double hue = unwrapHueToBracket(JzazbzHue(LMStoJzazbz(Lerp(table[i].lms, table[i+1].lms, t))), table[i].hue, table[i+1].hue);
            if (hue < lasthue - EPSILONZERO){
                badcount++;
            }
            lasthue = hue;
        }
        if (badcount > 0){
            if (verbose >= VERBOSITY_MINIMAL){
                printf("Hue is not monotonic from %s to %s (%i of %i samples went backwards).\n", cornernames[i].c_str(), cornernames[i+1].c_str(), badcount, samples);
            }
            output = false;
        }
    }

    if (output && (verbose >= VERBOSITY_SLIGHT)){
        printf("Corner table OK (%i samples per edge).\n", samples);
    }
    return output;
}

bool deriveCornerTable(gamutcorner output[CORNER_COUNT], int verbose){
    const vec3 rgbcorners[CORNER_COUNT - 2] = {
        vec3(0.0, 1.0, 1.0), // cyan
        vec3(0.0, 0.0, 1.0), // blue
        vec3(1.0, 0.0, 1.0), // magenta
        vec3(1.0, 0.0, 0.0), // red
        vec3(1.0, 1.0, 0.0), // yellow
        vec3(0.0, 1.0, 0.0) // green
    };
    for (int i=0; i<CORNER_COUNT - 2; i++){
        output[i+1].lms = LinearP3toLMS(rgbcorners[i]);
        output[i+1].hue = JzazbzHue(LMStoJzazbz(output[i+1].lms));
    }

    // find where the green-cyan edge crosses pi
    vec3 green = output[CORNER_COUNT - 2].lms;
    vec3 cyan = output[1].lms;
    double low = 0.0;
    double high = 1.0;
    for (int i=0; i<64; i++){
        double mid = 0.5 * (low + high);
        double hue = JzazbzHue(LMStoJzazbz(Lerp(green, cyan, mid)));
        if (hue < 0.0){
            hue += 2.0 * std::numbers::pi_v<double>;
        }
        if (hue <= std::numbers::pi_v<double>){
            low = mid;
        }
        else {
            high = mid;
        }
    }
    vec3 wrap = Lerp(green, cyan, low);
    if (verbose >= VERBOSITY_HIGH){
        printf("Green-cyan edge crosses pi at t = %.17g, linear P3 ", low);
        LMStoLinearP3(wrap).printout();
    }
    output[0].lms = wrap;
    output[0].hue = -std::numbers::pi_v<double>;
    output[CORNER_COUNT - 1].lms = wrap;
    output[CORNER_COUNT - 1].hue = std::numbers::pi_v<double>;

    return validateCornerTable(output, 1000, verbose);
}

void printCornerTable(const gamutcorner table[CORNER_COUNT], std::string title){
    printf("\n%s:\n", title.c_str());
    for (int i=0; i<CORNER_COUNT; i++){
        vec3 rgb = LMStoLinearP3(table[i].lms);
        printf("%-24s LMS {%.17g, %.17g, %.17g}, hue %.17g rad (%f deg), linear P3 {%f, %f, %f}\n", cornernames[i].c_str(), table[i].lms.x, table[i].lms.y, table[i].lms.z, table[i].hue, table[i].hue * (180.0 / std::numbers::pi_v<double>), rgb.x, rgb.y, rgb.z);
    }
    return;
}
