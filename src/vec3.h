#ifndef VEC3_H
#define VEC3_H

// Every color triple in this program is a vec3. Which space it lives in is carried by the function names:
// Jzazbz (J, az, bz), JzCzhz (J, C, h in radians), LMS (cone response), linear P3 (r, g, b), XYZ.
class vec3 {
public:
    double x;
    double y;
    double z;

    // constructors
    vec3();
    vec3(double x, double y, double z);

    // operators
    vec3 operator+(vec3 const& other) const {
        vec3 output;
        output.x = x + other.x;
        output.y = y + other.y;
        output.z = z + other.z;
        return output;
    }
    vec3 operator-(vec3 const& other) const {
        vec3 output;
        output.x = x - other.x;
        output.y = y - other.y;
        output.z = z - other.z;
        return output;
    }
    vec3 operator*(double other) const {
        vec3 output;
        output.x = x*other;
        output.y = y*other;
        output.z = z*other;
        return output;
    }
    vec3 operator/(double other) const {
        vec3 output;
        output.x = x/other;
        output.y = y/other;
        output.z = z/other;
        return output;
    }

    // functions
    // assumes a LCh style colorspace and outputs the radians hue value as degrees
    double polarangle() const;
    // true if any component is NaN
    bool hasnan() const;
    // screen barf
    void printout() const;
};

// linear interpolation from A (t=0) to B (t=1)
vec3 Lerp(vec3 A, vec3 B, double t);

// largest absolute per-component difference
double MaxComponentDiff(vec3 A, vec3 B);

// converts LAB-style colorspaces to their polar LCh-style cousins, or vice versa
// h is in radians, range -pi to pi
vec3 Polarize(vec3 input);
vec3 Depolarize(vec3 input);

// convert xyY to XYZ
vec3 xyYtoXYZ(vec3 input);

#endif
