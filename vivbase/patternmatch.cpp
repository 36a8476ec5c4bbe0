// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "patternmatch.h"
#include "patternstats.h"

#include <algorithm>    // for std::stable_sort

const famouspattern famouspatterns[] = {
    { "Glider",  "The first discovered spaceship that travels diagonally",
      { 5, 4, 3 }, "Richard K. Guy", 1970 },
    { "Blinker", "The simplest oscillator with period 2",
      { 3, 3, 3 }, "John Conway", 1970 },
    { "Toad",    "A period-2 oscillator shaped like a toad",
      { 6, 6, 6 }, "John Conway", 1970 },
    { "Beacon",  "A period-2 oscillator that flashes like a beacon",
      { 6, 8, 6 }, "John Conway", 1970 },
    { "Pulsar",  "A period-3 oscillator discovered early in Game of Life research",
      { 48, 56, 48 }, "John Conway", 1970 },
};
const int NUMFAMOUSPATTERNS = sizeof(famouspatterns) / sizeof(famouspatterns[0]);

// -----------------------------------------------------------------------------

double signaturesimilarity(const int* sig1, const int* sig2)
{
    int maxdiff = 0;
    double total = 0.0;
    for (int i = 0; i < SIGNATURELENGTH; i++) {
        int diff = sig1[i] > sig2[i] ? sig1[i] - sig2[i] : sig2[i] - sig1[i];
        if (diff > maxdiff) maxdiff = diff;
        total += sig1[i] + sig2[i];
    }

    // average over both signatures combined
    double avg = total / (2.0 * SIGNATURELENGTH);
    if (avg == 0.0) return maxdiff == 0 ? 1.0 : 0.0;

    double s = 1.0 - maxdiff / avg;
    return s < 0.0 ? 0.0 : s;
}

// -----------------------------------------------------------------------------

static bool bettermatch(const patternmatch& a, const patternmatch& b)
{
    return a.similarity > b.similarity;
}

// -----------------------------------------------------------------------------

void findmatches(const std::vector<int>& sig, std::vector<patternmatch>& matches)
{
    matches.clear();
    if ((int)sig.size() < SIGNATURELENGTH) return;

    // use the most recent populations if given more than needed
    const int* recent = &sig[sig.size() - SIGNATURELENGTH];
    for (int i = 0; i < NUMFAMOUSPATTERNS; i++) {
        double s = signaturesimilarity(recent, famouspatterns[i].signature);
        if (s > MATCHTHRESHOLD) {
            patternmatch m;
            m.pattern = &famouspatterns[i];
            m.similarity = s;
            matches.push_back(m);
        }
    }

    // equal similarities keep catalog order
    std::stable_sort(matches.begin(), matches.end(), bettermatch);
    if ((int)matches.size() > MAXMATCHES) matches.resize(MAXMATCHES);
}

// -----------------------------------------------------------------------------

void findmatches(const patternanalyzer& analyzer, std::vector<patternmatch>& matches)
{
    std::vector<int> sig;
    if (analyzer.getsignature(SIGNATURELENGTH, sig)) {
        findmatches(sig, matches);
    } else {
        matches.clear();
    }
}
