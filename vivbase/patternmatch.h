// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

// Coarse matching of recent population counts against well-known patterns.

#ifndef PATTERNMATCH_H
#define PATTERNMATCH_H

#include <vector>

class patternanalyzer;

const int SIGNATURELENGTH = 3;          // populations per signature
const double MATCHTHRESHOLD = 0.7;      // similarity needed to report a match
const int MAXMATCHES = 3;               // most matches reported

struct famouspattern {
    const char* name;
    const char* description;
    int signature[SIGNATURELENGTH];     // population at 3 consecutive generations
    const char* discoverer;             // may be 0 if unknown
    int year;                           // 0 if unknown
};

extern const famouspattern famouspatterns[];
extern const int NUMFAMOUSPATTERNS;

struct patternmatch {
    const famouspattern* pattern;
    double similarity;                  // in (MATCHTHRESHOLD, 1]
};

// Similarity of two signatures in [0,1]; 1 means identical.
double signaturesimilarity(const int* sig1, const int* sig2);

// Fill matches with the catalog entries most similar to sig, best first.
// sig must hold SIGNATURELENGTH populations, oldest first.
void findmatches(const std::vector<int>& sig, std::vector<patternmatch>& matches);

// As above, using the last populations recorded by the analyzer;
// matches is left empty until enough grids have been recorded.
void findmatches(const patternanalyzer& analyzer, std::vector<patternmatch>& matches);

#endif
