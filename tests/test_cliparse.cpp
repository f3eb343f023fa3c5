#include <gtest/gtest.h>

#include <limits.h>
#include <math.h>
#include <initializer_list>
#include <vector>

#include "constants.h"
#include "cliparse.h"

static int parse(std::initializer_list<const char*> args, maxchromaoptions &options){
    std::vector<const char*> argv;
    argv.push_back("maxchroma");
    for (const char* arg : args){
        argv.push_back(arg);
    }
    return parseCommandLine((int)argv.size(), argv.data(), options);
}

TEST(CliParse, IntValues) {
    int value = 7;
    EXPECT_EQ(parseIntValue("12", &value), RETURN_SUCCESS);
    EXPECT_EQ(value, 12);
    EXPECT_EQ(parseIntValue("-3", &value), RETURN_SUCCESS);
    EXPECT_EQ(value, -3);
    EXPECT_EQ(parseIntValue("0x10", &value), RETURN_SUCCESS);
    EXPECT_EQ(value, 16);
    EXPECT_EQ(parseIntValue("2147483647", &value), RETURN_SUCCESS);
    EXPECT_EQ(value, INT_MAX);
    EXPECT_EQ(parseIntValue("-2147483648", &value), RETURN_SUCCESS);
    EXPECT_EQ(value, INT_MIN);

    value = 7;
    EXPECT_EQ(parseIntValue("", &value), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(parseIntValue("12abc", &value), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(parseIntValue("1.5", &value), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(value, 7);
}

TEST(CliParse, IntValuesOutsideIntAreRejected) {
    int value = 7;
    EXPECT_EQ(parseIntValue("2147483648", &value), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(parseIntValue("-2147483649", &value), ERROR_BAD_PARAM_INT);
    // would come out as 1 if narrowed to 32 bits
    EXPECT_EQ(parseIntValue("4294967297", &value), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(parseIntValue("99999999999999999999999", &value), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(value, 7);
}

TEST(CliParse, FloatAndBoolValues) {
    double hue = 0.0;
    EXPECT_EQ(parseFloatValue("-179.5", &hue), RETURN_SUCCESS);
    EXPECT_DOUBLE_EQ(hue, -179.5);
    EXPECT_EQ(parseFloatValue("", &hue), ERROR_BAD_PARAM_FLOAT);
    EXPECT_EQ(parseFloatValue("12deg", &hue), ERROR_BAD_PARAM_FLOAT);
    EXPECT_EQ(parseFloatValue("1e999", &hue), ERROR_BAD_PARAM_FLOAT);
    EXPECT_DOUBLE_EQ(hue, -179.5);

    bool flag = false;
    EXPECT_EQ(parseBoolValue("true", &flag), RETURN_SUCCESS);
    EXPECT_TRUE(flag);
    EXPECT_EQ(parseBoolValue("false", &flag), RETURN_SUCCESS);
    EXPECT_FALSE(flag);
    EXPECT_EQ(parseBoolValue("yes", &flag), ERROR_BAD_PARAM_BOOL);
}

TEST(CliParse, Defaults) {
    maxchromaoptions options;
    ASSERT_EQ(parse({}, options), RETURN_SUCCESS);
    ASSERT_EQ(checkOptions(options), RETURN_SUCCESS);
    EXPECT_EQ(options.iterations, SCALAR_SEARCH_ITERATIONS);
    EXPECT_EQ(options.lanes, SCALAR_SEARCH_LANES);
    EXPECT_DOUBLE_EQ(options.hue, 42.794290425520614);
    EXPECT_FALSE(options.chartset);
    EXPECT_FALSE(options.stripset);
    EXPECT_FALSE(options.helpmode);
}

TEST(CliParse, FullCommandLine) {
    maxchromaoptions options;
    ASSERT_EQ(parse({"-m", "wide", "--hue", "-90", "-c", "slice.png", "--strip", "strip.png", "--dither", "false", "-t", "3", "--width", "64", "-v", "0"}, options), RETURN_SUCCESS);
    ASSERT_EQ(checkOptions(options), RETURN_SUCCESS);
    EXPECT_EQ(options.searchmode, SEARCH_MODE_WIDE);
    EXPECT_EQ(options.iterations, WIDE_SEARCH_ITERATIONS);
    EXPECT_EQ(options.lanes, WIDE_SEARCH_LANES);
    EXPECT_DOUBLE_EQ(options.hue, -90.0);
    EXPECT_TRUE(options.chartset);
    EXPECT_EQ(options.chartfilename, "slice.png");
    EXPECT_TRUE(options.stripset);
    EXPECT_EQ(options.stripfilename, "strip.png");
    EXPECT_FALSE(options.dither);
    EXPECT_EQ(options.threads, 3);
    EXPECT_EQ(options.width, 64);
    EXPECT_EQ(options.height, 512);
    EXPECT_EQ(options.verbosity, VERBOSITY_SILENT);
}

TEST(CliParse, ExplicitIterationsAndLanesOverrideTheMode) {
    maxchromaoptions options;
    ASSERT_EQ(parse({"--mode", "wide", "--iterations", "6", "--lanes", "1"}, options), RETURN_SUCCESS);
    ASSERT_EQ(checkOptions(options), RETURN_SUCCESS);
    EXPECT_EQ(options.iterations, 6);
    EXPECT_EQ(options.lanes, 1);
}

TEST(CliParse, HelpTakesNoValue) {
    maxchromaoptions options;
    ASSERT_EQ(parse({"-h", "--hue", "10"}, options), RETURN_SUCCESS);
    EXPECT_TRUE(options.helpmode);
    EXPECT_DOUBLE_EQ(options.hue, 10.0);
}

TEST(CliParse, BadParameters) {
    maxchromaoptions options;
    EXPECT_EQ(parse({"--colour", "red"}, options), ERROR_BAD_PARAM_UNKNOWN_PARAM);
    EXPECT_EQ(parse({"--table", "maybe"}, options), ERROR_BAD_PARAM_BOOL);
    EXPECT_EQ(parse({"--mode", "gpu"}, options), ERROR_BAD_PARAM_SELECT);
    EXPECT_EQ(parse({"--hue", "red"}, options), ERROR_BAD_PARAM_FLOAT);
    EXPECT_EQ(parse({"--lanes", "many"}, options), ERROR_BAD_PARAM_INT);
    EXPECT_EQ(parse({"--iterations", "4294967297"}, options), ERROR_BAD_PARAM_INT);
}

TEST(CliParse, MissingValues) {
    maxchromaoptions options;
    EXPECT_EQ(parse({"--dither"}, options), ERROR_BAD_PARAM_MISSING_VALUE);
    EXPECT_EQ(parse({"--chart"}, options), ERROR_BAD_PARAM_MISSING_VALUE);
    EXPECT_EQ(parse({"-m"}, options), ERROR_BAD_PARAM_MISSING_VALUE);
    EXPECT_EQ(parse({"--width"}, options), ERROR_BAD_PARAM_MISSING_VALUE);
    EXPECT_EQ(parse({"--hue", "5", "-u"}, options), ERROR_BAD_PARAM_MISSING_VALUE);
    EXPECT_FALSE(options.chartset);
}

TEST(CliParse, IterationsAreCapped) {
    maxchromaoptions options;
    ASSERT_EQ(parse({"--iterations", "64"}, options), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(options), RETURN_SUCCESS);

    maxchromaoptions toomany;
    ASSERT_EQ(parse({"--iterations", "65"}, toomany), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(toomany), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions huge;
    ASSERT_EQ(parse({"--iterations", "2147483647"}, huge), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(huge), ERROR_BAD_PARAM_OUT_OF_RANGE);
}

TEST(CliParse, RangeChecks) {
    maxchromaoptions lanes;
    ASSERT_EQ(parse({"--lanes", "65"}, lanes), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(lanes), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions zerolanes;
    ASSERT_EQ(parse({"--lanes", "0"}, zerolanes), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(zerolanes), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions hue;
    ASSERT_EQ(parse({"--hue", "inf"}, hue), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(hue), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions size;
    ASSERT_EQ(parse({"--height", "0"}, size), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(size), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions sweep;
    ASSERT_EQ(parse({"--sweep", "-1"}, sweep), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(sweep), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions threads;
    ASSERT_EQ(parse({"--threads", "-2"}, threads), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(threads), ERROR_BAD_PARAM_OUT_OF_RANGE);

    maxchromaoptions verbosity;
    ASSERT_EQ(parse({"--verbose", "5"}, verbosity), RETURN_SUCCESS);
    EXPECT_EQ(checkOptions(verbosity), ERROR_BAD_PARAM_OUT_OF_RANGE);
}
