#include "cliparse.h"

#include "constants.h"

#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <limits.h>
#include <math.h>
#include <string.h>

static const paramvalue modelist[2] = {
    {
        "scalar",
        SEARCH_MODE_SCALAR
    },
    {
        "wide",
        SEARCH_MODE_WIDE
    }
};

int parseBoolValue(const char* text, bool* output){
    if (strcmp(text, "true") == 0){
        *output = true;
        return RETURN_SUCCESS;
    }
    if (strcmp(text, "false") == 0){
        *output = false;
        return RETURN_SUCCESS;
    }
    return ERROR_BAD_PARAM_BOOL;
}

int parseIntValue(const char* text, int* output){
    char* endptr;
    errno = 0; //make sure errno is 0 before strtol()
    long int input = strtol(text, &endptr, 0);
    // empty, characters left over, or too big for a long?
    if ((endptr == text) || (*endptr != '\0') || (errno != 0)){
        return ERROR_BAD_PARAM_INT;
    }
    // long is 64 bits on Linux
    if ((input < INT_MIN) || (input > INT_MAX)){
        return ERROR_BAD_PARAM_INT;
    }
    *output = (int)input;
    return RETURN_SUCCESS;
}

int parseFloatValue(const char* text, double* output){
    char* endptr;
    errno = 0; //make sure errno is 0 before strtod()
    double input = strtod(text, &endptr);
    if ((endptr == text) || (*endptr != '\0') || (errno != 0)){
        return ERROR_BAD_PARAM_FLOAT;
    }
    *output = input;
    return RETURN_SUCCESS;
}

int parseSelectValue(const char* text, const paramvalue* table, int tablesize, int* output){
    for (int i=0; i<tablesize; i++){
        if (strcmp(text, table[i].valuestring.c_str()) == 0){
            *output = table[i].value;
            return RETURN_SUCCESS;
        }
    }
    return ERROR_BAD_PARAM_SELECT;
}

// index of the entry whose paramstring is text, or -1
template <typename T>
static int findparam(const T* table, int tablesize, const char* text){
    for (int j=0; j<tablesize; j++){
        if (strcmp(text, table[j].paramstring.c_str()) == 0){
            return j;
        }
    }
    return -1;
}

// "a", "b", or "c"
static std::string selectchoices(const paramvalue* table, int tablesize){
    std::string output;
    for (int i=0; i<tablesize; i++){
        if (i > 0){
            output += (i == tablesize - 1) ? " or " : ", ";
        }
        output += "\"" + table[i].valuestring + "\"";
    }
    return output;
}

static int complain(int errorcode, const std::string &paramstring, const std::string &prettyname, const std::string &expecting){
    const char* what = (errorcode == ERROR_BAD_PARAM_MISSING_VALUE) ? "Missing" : "Invalid";
    printf("%s value for parameter %s (%s). Expecting %s.\n", what, paramstring.c_str(), prettyname.c_str(), expecting.c_str());
    return errorcode;
}

int parseCommandLine(int argc, const char** argv, maxchromaoptions &options){

    const boolparam params_bool[3] = {
        {
            "--dither",         //std::string paramstring; // parameter's text
            "Dithering",        //std::string prettyname; // name for pretty printing
            &options.dither     //bool* vartobind; // pointer to variable whose value to set
        },
        {
            "--di",
            "Dithering",
            &options.dither
        },
        {
            "--table",
            "Table Check",
            &options.tablemode
        }
    };

    const stringparam params_string[4] = {
        {
            "--chart",                  //std::string paramstring; // parameter's text
            "Slice Chart File",         //std::string prettyname; // name for pretty printing
            &options.chartfilename,     //std::string* vartobind;    // pointer to variable whose value to set
            &options.chartset           //bool* flagtobind; // pointer to flag to set when this variable is set
        },
        {
            "-c",
            "Slice Chart File",
            &options.chartfilename,
            &options.chartset
        },
        {
            "--strip",
            "Hue Strip File",
            &options.stripfilename,
            &options.stripset
        },
        {
            "-s",
            "Hue Strip File",
            &options.stripfilename,
            &options.stripset
        }
    };

    const selectparam params_select[2] = {
        {
            "--mode",               //std::string paramstring; // parameter's text
            "Search Model",         //std::string prettyname; // name for pretty printing
            &options.searchmode,    //int* vartobind; // pointer to variable whose value to set
            modelist,               //const paramvalue* valuetable; // pointer to table of possible values
            sizeof(modelist)/sizeof(modelist[0])    //int tablesize; // number of items in the table
        },
        {
            "-m",
            "Search Model",
            &options.searchmode,
            modelist,
            sizeof(modelist)/sizeof(modelist[0])
        }
    };

    const floatparam params_float[2] = {
        {
            "--hue",        //std::string paramstring; // parameter's text
            "Hue",          //std::string prettyname; // name for pretty printing
            &options.hue    //double* vartobind; // pointer to variable whose value to set
        },
        {
            "-u",
            "Hue",
            &options.hue
        }
    };

    const intparam params_int[10] = {
        {
            "--iterations",         //std::string paramstring; // parameter's text
            "Search Iterations",    //std::string prettyname; // name for pretty printing
            &options.iterations     //int* vartobind; // pointer to variable whose value to set
        },
        {
            "--lanes",
            "Search Lanes",
            &options.lanes
        },
        {
            "--sweep",
            "Sweep Steps",
            &options.sweepsteps
        },
        {
            "--width",
            "Image Width",
            &options.width
        },
        {
            "--height",
            "Image Height",
            &options.height
        },
        {
            "--threads",
            "Threads",
            &options.threads
        },
        {
            "-t",
            "Threads",
            &options.threads
        },
        {
            "--verbosity",
            "Verbosity",
            &options.verbosity
        },
        {
            "-v",
            "Verbosity",
            &options.verbosity
        },
        {
            "--verbose",
            "Verbosity",
            &options.verbosity
        }
    };

    const int boolcount = sizeof(params_bool)/sizeof(params_bool[0]);
    const int stringcount = sizeof(params_string)/sizeof(params_string[0]);
    const int selectcount = sizeof(params_select)/sizeof(params_select[0]);
    const int floatcount = sizeof(params_float)/sizeof(params_float[0]);
    const int intcount = sizeof(params_int)/sizeof(params_int[0]);

    for (int i=1; i<argc; i++){
        // check for help flag
        if ((strcmp(argv[i], "-h") == 0) || (strcmp(argv[i], "--help") == 0)){
            options.helpmode = true;
            continue;
        }

        // everything else is a switch followed by its value
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;
        int result = RETURN_SUCCESS;
        int j = -1;
        if ((j = findparam(params_bool, boolcount, argv[i])) >= 0){
            result = (value == nullptr) ? ERROR_BAD_PARAM_MISSING_VALUE : parseBoolValue(value, params_bool[j].vartobind);
            if (result != RETURN_SUCCESS){
                return complain(result, params_bool[j].paramstring, params_bool[j].prettyname, "\"true\" or \"false\"");
            }
        }
        else if ((j = findparam(params_string, stringcount, argv[i])) >= 0){
            if (value == nullptr){
                return complain(ERROR_BAD_PARAM_MISSING_VALUE, params_string[j].paramstring, params_string[j].prettyname, "text string");
            }
            *params_string[j].vartobind = value;
            *params_string[j].flagtobind = true;
        }
        else if ((j = findparam(params_select, selectcount, argv[i])) >= 0){
            result = (value == nullptr) ? ERROR_BAD_PARAM_MISSING_VALUE : parseSelectValue(value, params_select[j].valuetable, params_select[j].tablesize, params_select[j].vartobind);
            if (result != RETURN_SUCCESS){
                return complain(result, params_select[j].paramstring, params_select[j].prettyname, selectchoices(params_select[j].valuetable, params_select[j].tablesize));
            }
        }
        else if ((j = findparam(params_int, intcount, argv[i])) >= 0){
            result = (value == nullptr) ? ERROR_BAD_PARAM_MISSING_VALUE : parseIntValue(value, params_int[j].vartobind);
            if (result != RETURN_SUCCESS){
                return complain(result, params_int[j].paramstring, params_int[j].prettyname, "integer numerical value");
            }
        }
        else if ((j = findparam(params_float, floatcount, argv[i])) >= 0){
            result = (value == nullptr) ? ERROR_BAD_PARAM_MISSING_VALUE : parseFloatValue(value, params_float[j].vartobind);
            if (result != RETURN_SUCCESS){
                return complain(result, params_float[j].paramstring, params_float[j].prettyname, "floating-point numerical value");
            }
        }
        else {
            printf("Invalid parameter: \"%s\"\n", argv[i]);
            return ERROR_BAD_PARAM_UNKNOWN_PARAM;
        }
        i++; // skip the value we just used
    }

    return RETURN_SUCCESS;
}

int checkOptions(maxchromaoptions &options){
    // fill in whatever the search mode decides
    if (options.iterations < 0){
        options.iterations = (options.searchmode == SEARCH_MODE_WIDE) ? WIDE_SEARCH_ITERATIONS : SCALAR_SEARCH_ITERATIONS;
    }
    if (options.lanes < 0){
        options.lanes = (options.searchmode == SEARCH_MODE_WIDE) ? WIDE_SEARCH_LANES : SCALAR_SEARCH_LANES;
    }

    if (!isfinite(options.hue)){
        printf("Invalid value for parameter --hue. Expecting a finite number of degrees.\n");
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    if (options.iterations > MAX_SEARCH_ITERATIONS){
        printf("Invalid value for parameter --iterations. Expecting 0 to %i.\n", MAX_SEARCH_ITERATIONS);
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    if ((options.lanes < 1) || (options.lanes > MAX_SEARCH_LANES)){
        printf("Invalid value for parameter --lanes. Expecting 1 to %i.\n", MAX_SEARCH_LANES);
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    if (options.sweepsteps < 0){
        printf("Invalid value for parameter --sweep. Expecting 0 or more.\n");
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    if ((options.width < 1) || (options.height < 1)){
        printf("Invalid image size %ix%i.\n", options.width, options.height);
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    if (options.threads < 0){
        printf("Invalid value for parameter --threads. Expecting 0 or more.\n");
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    if ((options.verbosity < VERBOSITY_SILENT) || (options.verbosity > VERBOSITY_EXTREME)){
        printf("Invalid value for parameter --verbosity. Expecting %i to %i.\n", VERBOSITY_SILENT, VERBOSITY_EXTREME);
        return ERROR_BAD_PARAM_OUT_OF_RANGE;
    }
    return RETURN_SUCCESS;
}
