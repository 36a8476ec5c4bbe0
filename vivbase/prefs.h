// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#ifndef _PREFS_H_
#define _PREFS_H_

#include <string>       // for std::string
#include "liferules.h"  // for MAXRULESIZE

// Routines for loading and saving user preferences:

void GetPrefs();        // Read preferences from prefsfile.
void SavePrefs();       // Write preferences to prefsfile.
void ResetPrefs();      // Restore every preference to its default.

// Various constants:

const int MAX_DELAY = 5000;             // maximum tickdelay
const int MAX_GENERATIONS = 100000;     // maximum racegens
const int MIN_POP_HISTORY = 10;         // enough samples for stability
const int MAX_POP_HISTORY = 1000;
const int MIN_GRID_HISTORY = 3;         // enough grids for a signature
const int MAX_GRID_HISTORY = 100;

// This global path must be set before GetPrefs or SavePrefs is called:

extern std::string prefsfile;       // path of file for storing user's preferences

// Global preference data:

extern int initgridsize;            // size of a new session's grid
extern int randomfill;              // random fill percentage
extern int tickdelay;               // millisecs between ticks when running
extern int racegens;                // generations in a competition
extern int racesize;                // grid size of each competitor
extern int maxpophistory;           // population samples kept
extern int maxgridhistory;          // grids kept
extern unsigned int randomseed;     // 0 means seed from the clock
extern char initrule[];             // initial rule

#endif
