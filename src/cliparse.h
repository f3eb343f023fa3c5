#ifndef CLIPARSE_H
#define CLIPARSE_H

#include "constants.h"

#include <string>

// structs for holding our list of parameters
typedef struct boolparam{
    std::string paramstring; // parameter's text
    std::string prettyname; // name for pretty printing
    bool* vartobind; // pointer to variable whose value to set
} boolparam;

typedef struct stringparam{
    std::string paramstring; // parameter's text
    std::string prettyname; // name for pretty printing
    std::string* vartobind;    // pointer to variable whose value to set
    bool* flagtobind; // pointer to flag to set when this variable is set
} stringparam;

typedef struct paramvalue{
    std::string valuestring; // parameter value's text
    int value;              // the value
} paramvalue;

typedef struct selectparam{
    std::string paramstring; // parameter's text
    std::string prettyname; // name for pretty printing
    int* vartobind; // pointer to variable whose value to set
    const paramvalue* valuetable; // pointer to table of possible values
    int tablesize; // number of items in the table
} selectparam;

typedef struct floatparam{
    std::string paramstring; // parameter's text
    std::string prettyname; // name for pretty printing
    double* vartobind; // pointer to variable whose value to set
} floatparam;

typedef struct intparam{
    std::string paramstring; // parameter's text
    std::string prettyname; // name for pretty printing
    int* vartobind; // pointer to variable whose value to set
} intparam;

// Everything the command line can set, holding the defaults until parseCommandLine() overwrites them.
class maxchromaoptions{
public:
    int threads = 0;
    bool helpmode = false;
    double hue = 42.794290425520614; // red corner
    int searchmode = SEARCH_MODE_SCALAR;
    int iterations = -1; // -1 = use the mode's value
    int lanes = -1;
    bool tablemode = false;
    int sweepsteps = 0;
    std::string chartfilename;
    std::string stripfilename;
    bool chartset = false;
    bool stripset = false;
    int width = 512;
    int height = 512;
    bool dither = true;
    int verbosity = VERBOSITY_SLIGHT;
};

// Value parsers. Each returns RETURN_SUCCESS and sets *output, or returns its ERROR_BAD_PARAM_* code and leaves *output alone.
int parseBoolValue(const char* text, bool* output); // "true" or "false"
int parseIntValue(const char* text, int* output); // whole string must be an integer that fits in an int
int parseFloatValue(const char* text, double* output);
int parseSelectValue(const char* text, const paramvalue* table, int tablesize, int* output);

// Walks argv and fills in options. Complains on stdout about the first bad parameter
// and returns its ERROR_BAD_PARAM_* code.
int parseCommandLine(int argc, const char** argv, maxchromaoptions &options);

// Fills in iterations and lanes from the search mode where they weren't given, then range checks everything.
// returns RETURN_SUCCESS or ERROR_BAD_PARAM_OUT_OF_RANGE
int checkOptions(maxchromaoptions &options);

#endif
