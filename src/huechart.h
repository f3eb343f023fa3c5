#ifndef HUECHART_H
#define HUECHART_H

#include "vec3.h"

#include <png.h>

// where the max-chroma color lands horizontally in the slice, as a fraction of the width
#define SLICE_CUSP_POSITION 0.8
// background for out-of-gamut pixels (gamma space gray)
#define CHART_BACKGROUND 0.5
#define CHART_MARKER_RADIUS 4.0

// Everything a worker needs to draw one row of the Jz/Cz slice at one hue
class slicesetup{
public:
    double hue; // radians
    double jzwhite; // Jz at the top of the image
    double chromascale; // Cz at the right edge of the image
    double cuspx; // max-chroma color's position in pixels
    double cuspy;
    bool dither;
};

// Works out the scales and marker position for a width x height slice at hue (degrees).
// The slice is drawn at the hue of the max-chroma color actually found, so the marker sits on the gamut edge.
slicesetup setupSlice(double hue, int width, int height, bool dither);

// Renders row y of the Jz/Cz slice into buffer (RGBA, width * height * 4 bytes).
// x runs from Cz = 0 to chromascale, y from Jz = jzwhite at the top to Jz = 0 at the bottom.
// Pixels in the Display P3 gamut are drawn in their own color, the rest in CHART_BACKGROUND,
// with a white ring around the max-chroma color.
void renderSliceRow(int y, int width, int height, const slicesetup &setup, png_bytep buffer);

// Renders row y of the hue strip into buffer (RGBA).
// Column x shows hue (x + 0.5) / width * 360 degrees; cusps holds the linear P3 max-chroma color for each column.
// Top to bottom, each column goes white -> max-chroma color -> black, interpolated in linear P3.
void renderHueStripRow(int y, int width, int height, const vec3* cusps, bool dither, png_bytep buffer);

// Render the slice / strip on a thread pool and write them to a PNG file.
// threads <= 0 lets the pool decide.
// return RETURN_SUCCESS, ERROR_PNG_MEM_FAIL, or ERROR_PNG_WRITE_FAIL
int writeHueChart(const char* filename, double hue, int width, int height, bool dither, int threads, int verbosity);
int writeHueStrip(const char* filename, int width, int height, bool dither, int threads, int verbosity);

#endif
