#ifndef GAMUTBOUNDS_H
#define GAMUTBOUNDS_H

#include "vec3.h"

#include <string>

#define CORNER_COUNT 8

// A primary or secondary color of the display, in LMS, tagged with its Jzazbz hue angle in radians.
class gamutcorner{
public:
    vec3 lms;
    double hue;
};

// Segment of the gamut boundary known to contain the max-chroma color for some hue.
// Endpoints are in LMS; the boundary between adjacent corners is a straight line in LMS (and in linear RGB).
class searchbracket{
public:
    vec3 lower;
    vec3 upper;
    double lowerhue;
    double upperhue;
};

// The max-chroma edges of Display P3: cyan, blue, magenta, red, yellow, and green, sorted by hue,
// plus the point on the green-cyan edge where hue crosses +/-pi at both ends to close the loop.
extern const gamutcorner P3Corners[CORNER_COUNT];

// reduces any finite hue in degrees to [-180, 180)
double normalizeHueDegrees(double hue);

// Returns the pair of adjacent corners whose hues bracket hue (radians).
// Three comparisons, no loop, so it runs the same for every lane of a parallel evaluator.
// hue >= pi lands on the last edge and hue < -pi on the first; hue should be normalized beforehand to mean anything.
searchbracket bracketForHue(double hue);

// Moves hue (radians) by a full turn if it landed on the far side of the +/-pi seam from the bracket [lowerhue, upperhue].
// The edges touching the seam have points whose atan2() hue is just short of +pi while the bracket sits at -pi, or the reverse.
double unwrapHueToBracket(double hue, double lowerhue, double upperhue);

// Narrows bracket toward the point whose Jzazbz hue equals targethue (radians).
// Each iteration tries lanes evenly spaced candidates between lower and upper and keeps the highest one whose hue is still <= targethue.
// With lanes = 1 that's plain bisection. lanes is clamped to [1, MAX_SEARCH_LANES] and iterations to MAX_SEARCH_ITERATIONS; iterations < 1 returns bracket untouched.
// Candidate hues go through unwrapHueToBracket(), so lowerhue/upperhue can come back a hair outside [-pi, pi].
// Relies on hue increasing monotonically along each edge. validateCornerTable() checks that.
searchbracket narrowBracket(searchbracket bracket, double targethue, int iterations, int lanes);

// bracketForHue() + narrowBracket(); returns the lower end of the final bracket in LMS
// hue is in radians and must already be in [-pi, pi)
vec3 findMaxChromaLMS(double hue, int iterations, int lanes);

// The color of maximum chroma in Display P3 at hue (degrees, any finite value), as Jzazbz.
// The hue is normalized here, and only here.
// Since the lower end of the bracket is returned, the result's hue never exceeds the requested hue (except across the +/-180 seam).
// A NaN or infinite hue gets a NaN triple back.
vec3 maxChromaAtHue(double hue); // SCALAR_SEARCH_ITERATIONS bisection steps
vec3 maxChromaAtHueWide(double hue); // WIDE_SEARCH_ITERATIONS steps of WIDE_SEARCH_LANES lanes
vec3 maxChromaAtHueSearch(double hue, int iterations, int lanes);

// Checks that a corner table is usable for bracketForHue()/narrowBracket():
// sorted by hue, closed at +/-pi, stored hues match what LMStoJzazbz() says,
// and hue is non-decreasing along every edge (checked at samples + 1 points per edge).
// Screen barfs whatever is wrong at VERBOSITY_MINIMAL and up.
bool validateCornerTable(const gamutcorner table[CORNER_COUNT], int samples, int verbose);

// Rebuilds the corner table from the display's primaries and secondaries.
// The wrap corner is found by bisecting the green-cyan edge for hue = pi.
// returns false if the result fails validateCornerTable()
bool deriveCornerTable(gamutcorner output[CORNER_COUNT], int verbose);

// screen barf
void printCornerTable(const gamutcorner table[CORNER_COUNT], std::string title);

#endif
