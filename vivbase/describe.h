// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

// Turn pattern metrics into a behavior label, a name and a short paragraph.

#ifndef DESCRIBE_H
#define DESCRIBE_H

#include "patternstats.h"
#include <string>

const int MINDESCRIBEGEN = 5;   // no description before this generation

typedef enum {
    STABLE_BEHAVIOR,
    GROWING_BEHAVIOR,
    DECLINING_BEHAVIOR,
    COMPLEX_BEHAVIOR,
    CHAOTIC_BEHAVIOR,
    TRANSITIONAL_BEHAVIOR
} behavior;

// Pick the behavior category; the first matching test wins:
// stability > 0.8, |growth| > 0.3, diversity > 0.6, entropy > 0.7.
behavior classifybehavior(const patternmetrics& metrics);

// Lower-case label such as "stable" or "growing".
const char* behaviorlabel(behavior b);

struct patterndescription {
    behavior category;
    std::string name;
    std::string text;
};

// Build a description with phrasing picked from rnd.  Returns false
// and leaves desc unchanged if generation is below MINDESCRIBEGEN.
bool describepattern(const patternmetrics& metrics, int generation,
                     liferandom& rnd, patterndescription& desc);

#endif
