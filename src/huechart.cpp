#include "huechart.h"

#include "constants.h"
#include "gamutbounds.h"
#include "p3display.h"
#include "jzazbz.h"
#include "colormisc.h"

#include "BS_thread_pool.hpp"

#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <cstring> // for memset
#include <mutex>
#include <vector>

static std::mutex progressbarmtx;
static std::mutex printfmtx;

// writes one RGBA pixel from a gamma space color
static void putpixel(png_bytep buffer, int x, int y, int width, vec3 color, bool dither){
    size_t index = (((size_t)y * (size_t)width) + (size_t)x) * 4;
    if (dither){
        buffer[index] = quasirandomdither(color.x, x, y);
        buffer[index + 1] = quasirandomdither(color.y, x, y);
        buffer[index + 2] = quasirandomdither(color.z, x, y);
    }
    else {
        buffer[index] = toRGB8nodither(color.x);
        buffer[index + 1] = toRGB8nodither(color.y);
        buffer[index + 2] = toRGB8nodither(color.z);
    }
    buffer[index + 3] = 255;
    return;
}

// announces progress in 5% steps; call once per finished row
static void announceprogress(int &progressbar, int maxprogressbar, int &lastannounce, int verbosity){
    if (verbosity < VERBOSITY_MINIMAL){
        return;
    }
    progressbarmtx.lock();
    progressbar++;
    // do an announcement if we've crossed the next 5% threshhold
    int nextannounce = lastannounce + 5;
    while (nextannounce % 5 != 0){
        nextannounce--;
    }
    int currentpercent = (progressbar * 100) / maxprogressbar;
    bool doannounce = false;
    if (currentpercent >= nextannounce){
        lastannounce = currentpercent;
        doannounce = true;
    }
    progressbarmtx.unlock();

    if (doannounce){
        printfmtx.lock();
        printf("%i%%", currentpercent);
        if (currentpercent < 100){
            printf("... ");
        }
        else {
            printf("\n");
        }
        fflush(stdout);
        printfmtx.unlock();
    }
    return;
}

slicesetup setupSlice(double hue, int width, int height, bool dither){
    slicesetup output;
    vec3 cusp = Polarize(maxChromaAtHue(hue));
    output.hue = cusp.z;
    output.jzwhite = LinearP3toJzazbz(vec3(1.0, 1.0, 1.0)).x;
    output.chromascale = cusp.y / SLICE_CUSP_POSITION;
    // pixel centers sit at x + 0.5, y + 0.5
    output.cuspx = (SLICE_CUSP_POSITION * (double)width) - 0.5;
    output.cuspy = ((1.0 - (cusp.x / output.jzwhite)) * (double)height) - 0.5;
    output.dither = dither;
    return output;
}

void renderSliceRow(int y, int width, int height, const slicesetup &setup, png_bytep buffer){
    double jz = setup.jzwhite * (1.0 - (((double)y + 0.5) / (double)height));
    double dy = (double)y - setup.cuspy;
    for (int x=0; x<width; x++){
        double cz = setup.chromascale * (((double)x + 0.5) / (double)width);
        double dx = (double)x - setup.cuspx;
        double markerdist = fabs(sqrt((dx * dx) + (dy * dy)) - CHART_MARKER_RADIUS);

        vec3 color;
        vec3 rgb;
        if (markerdist < 0.75){
            color = vec3(1.0, 1.0, 1.0);
        }
        else if (IsJzazbzInP3Gamut(Depolarize(vec3(jz, cz, setup.hue)), EPSILON, &rgb)){
            color = togammaRGB(rgb);
        }
        else {
            color = vec3(CHART_BACKGROUND, CHART_BACKGROUND, CHART_BACKGROUND);
        }
        putpixel(buffer, x, y, width, color, setup.dither);
    }
    return;
}

void renderHueStripRow(int y, int width, int height, const vec3* cusps, bool dither, png_bytep buffer){
    const vec3 white = vec3(1.0, 1.0, 1.0);
    const vec3 black = vec3(0.0, 0.0, 0.0);
    double s = ((double)y + 0.5) / (double)height;
    for (int x=0; x<width; x++){
        vec3 rgb;
        if (s < 0.5){
            rgb = Lerp(white, cusps[x], 2.0 * s);
        }
        else {
            rgb = Lerp(cusps[x], black, 2.0 * (s - 0.5));
        }
        putpixel(buffer, x, y, width, togammaRGB(rgb), dither);
    }
    return;
}

// allocates the RGBA buffer for image; returns NULL (and complains) on failure
static png_bytep allocateimage(png_image &image, int width, int height){
    memset(&image, 0, sizeof image);
    image.version = PNG_IMAGE_VERSION;
    image.width = width;
    image.height = height;
    image.format = PNG_FORMAT_RGBA;
    png_bytep buffer = (png_bytep) malloc(PNG_IMAGE_SIZE(image));  //c++ wants an explict cast
    if (buffer == NULL){
        fprintf(stderr, "maxchroma: out of memory: %lu bytes\n", (unsigned long)PNG_IMAGE_SIZE(image));
    }
    return buffer;
}

// writes and frees buffer
static int writeimage(png_image &image, png_bytep buffer, const char* filename, int verbosity){
    int result;
    if (png_image_write_to_file(&image, filename, 0/*convert_to_8bit*/, buffer, 0/*row_stride*/, NULL/*colormap*/)){
        result = RETURN_SUCCESS;
        if (verbosity >= VERBOSITY_MINIMAL){
            printf("Wrote %s.\n", filename);
        }
    }
    else {
        fprintf(stderr, "maxchroma: write %s: %s\n", filename, image.message);
        result = ERROR_PNG_WRITE_FAIL;
    }
    free(buffer);
    return result;
}

int writeHueChart(const char* filename, double hue, int width, int height, bool dither, int threads, int verbosity){
    png_image image;
    png_bytep buffer = allocateimage(image, width, height);
    if (buffer == NULL){
        return ERROR_PNG_MEM_FAIL;
    }

    slicesetup setup = setupSlice(hue, width, height, dither);
    if (verbosity >= VERBOSITY_SLIGHT){
        printf("Rendering %ix%i Jz/Cz slice at hue %f degrees (Cz 0 to %f, Jz 0 to %f)...\n", width, height, hue, setup.chromascale, setup.jzwhite);
    }

    // start up a thread pool so we can process in parallel
    BS::thread_pool pool;
    // if the user supplied a thread count, honor it
    if (threads > 0){
        pool.reset(threads);
    }
    if (verbosity >= VERBOSITY_HIGH){
        printf("Using %li threads...\n", (long)pool.get_thread_count());
    }

    int progressbar = 0;
    int lastannounce = 0;
    for (int y=0; y<height; y++){
        pool.detach_task(
            [y, width, height, &setup, buffer, &progressbar, &lastannounce, verbosity]
            {
                renderSliceRow(y, width, height, setup, buffer);
                announceprogress(progressbar, height, lastannounce, verbosity);
            }
        );
    }
    // wait for all tasks sent to the thread pool to be completed.
    pool.wait();

    return writeimage(image, buffer, filename, verbosity);
}

int writeHueStrip(const char* filename, int width, int height, bool dither, int threads, int verbosity){
    png_image image;
    png_bytep buffer = allocateimage(image, width, height);
    if (buffer == NULL){
        return ERROR_PNG_MEM_FAIL;
    }

    if (verbosity >= VERBOSITY_SLIGHT){
        printf("Rendering %ix%i hue strip...\n", width, height);
    }

    BS::thread_pool pool;
    if (threads > 0){
        pool.reset(threads);
    }
    if (verbosity >= VERBOSITY_HIGH){
        printf("Using %li threads...\n", (long)pool.get_thread_count());
    }

    // one boundary search per column, shared by every row
    std::vector<vec3> cusps(width);
    for (int x=0; x<width; x++){
        pool.detach_task(
            [x, width, &cusps]
            {
                double hue = (((double)x + 0.5) / (double)width) * 360.0;
                cusps[x] = JzazbzToLinearP3(maxChromaAtHue(hue));
            }
        );
    }
    pool.wait();

    int progressbar = 0;
    int lastannounce = 0;
    const vec3* cuspdata = cusps.data();
    for (int y=0; y<height; y++){
        pool.detach_task(
            [y, width, height, cuspdata, dither, buffer, &progressbar, &lastannounce, verbosity]
            {
                renderHueStripRow(y, width, height, cuspdata, dither, buffer);
                announceprogress(progressbar, height, lastannounce, verbosity);
            }
        );
    }
    pool.wait();

    return writeimage(image, buffer, filename, verbosity);
}
