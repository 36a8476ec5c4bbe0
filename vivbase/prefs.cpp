// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "lifegrid.h"       // for MAXGRIDSIZE, DEFAULTGRIDSIZE
#include "liferules.h"
#include "patternstats.h"   // for POPHISTORYSIZE, GRIDHISTORYSIZE
#include "competition.h"    // for DEFAULTCOMPSIZE, DEFAULTCOMPGENS
#include "util.h"           // for linereader, lifewarning
#include "prefs.h"

#include <stdio.h>
#include <string.h>

// -----------------------------------------------------------------------------

// Vivarium's preferences file is a simple text file.

const int PREFS_VERSION = 1;        // increment if necessary due to changes in syntax/semantics
int currversion = PREFS_VERSION;    // might be changed by prefs_version
const int PREF_LINE_SIZE = 5000;    // must be quite long for storing file paths

std::string prefsfile;              // path of file for storing user's preferences

// initialize exported preferences:

int initgridsize = DEFAULTGRIDSIZE;         // size of a new session's grid
int randomfill = 30;                        // random fill percentage
int tickdelay = 200;                        // millisecs between ticks when running
int racegens = DEFAULTCOMPGENS;             // generations in a competition
int racesize = DEFAULTCOMPSIZE;             // grid size of each competitor
int maxpophistory = POPHISTORYSIZE;         // population samples kept
int maxgridhistory = GRIDHISTORYSIZE;       // grids kept
unsigned int randomseed = 0;                // 0 means seed from the clock
char initrule[MAXRULESIZE] = "S2..3,B3";    // initial rule

// -----------------------------------------------------------------------------

void ResetPrefs()
{
    currversion = PREFS_VERSION;
    initgridsize = DEFAULTGRIDSIZE;
    randomfill = 30;
    tickdelay = 200;
    racegens = DEFAULTCOMPGENS;
    racesize = DEFAULTCOMPSIZE;
    maxpophistory = POPHISTORYSIZE;
    maxgridhistory = GRIDHISTORYSIZE;
    randomseed = 0;
    strcpy(initrule, liferules::DefaultRule());
}

// -----------------------------------------------------------------------------

void SavePrefs()
{
    FILE* f = fopen(prefsfile.c_str(), "w");
    if (f == NULL) {
        lifewarning("Could not save preferences file!");
        return;
    }

    fprintf(f, "# NOTE: If you edit this file then do so when Vivarium isn't running\n");
    fprintf(f, "# otherwise all your changes will be clobbered when Vivarium quits.\n\n");
    fprintf(f, "prefs_version=%d\n", PREFS_VERSION);
    fprintf(f, "grid_size=%d (%d..%d)\n", initgridsize, MINGRIDSIZE, MAXGRIDSIZE);
    fprintf(f, "random_fill=%d (1..100)\n", randomfill);
    fprintf(f, "tick_delay=%d (0..%d millisecs)\n", tickdelay, MAX_DELAY);
    fprintf(f, "rule=%s\n", initrule);
    fprintf(f, "random_seed=%u\n", randomseed);

    fputs("\n", f);

    fprintf(f, "max_generations=%d (1..%d)\n", racegens, MAX_GENERATIONS);
    fprintf(f, "competition_size=%d (%d..%d)\n", racesize, MINGRIDSIZE, MAXGRIDSIZE);
    fprintf(f, "population_history=%d (%d..%d)\n", maxpophistory, MIN_POP_HISTORY, MAX_POP_HISTORY);
    fprintf(f, "grid_history=%d (%d..%d)\n", maxgridhistory, MIN_GRID_HISTORY, MAX_GRID_HISTORY);

    if (fclose(f) != 0) lifewarning("Could not finish writing preferences file!");
}

// -----------------------------------------------------------------------------

bool GetKeywordAndValue(linereader& lr, char* line, char** keyword, char** value)
{
    // the linereader class handles all line endings (CR, CR+LF, LF)
    // and terminates line buffer with \0
    while ( lr.fgets(line, PREF_LINE_SIZE) != 0 ) {
        if ( line[0] == '#' || line[0] == 0 ) {
            // skip comment line or empty line
        } else {
            // line should have format keyword=value
            *keyword = line;
            *value = line;
            while ( **value != '=' && **value != 0 ) *value += 1;
            if ( **value == 0 ) continue;   // no '=' so ignore line
            **value = 0;   // terminate keyword
            *value += 1;
            return true;
        }
    }
    return false;
}

// -----------------------------------------------------------------------------

static void ClampInt(int& n, int lo, int hi)
{
    if (n < lo) n = lo;
    if (n > hi) n = hi;
}

// -----------------------------------------------------------------------------

void GetPrefs()
{
    FILE* f = fopen(prefsfile.c_str(), "r");
    if (f == NULL) {
        // should only happen 1st time app is run
        return;
    }

    linereader reader(f);
    reader.setcloseonfree();
    char line[PREF_LINE_SIZE];
    char* keyword;
    char* value;
    while ( GetKeywordAndValue(reader, line, &keyword, &value) ) {

        if (strcmp(keyword, "prefs_version") == 0) {
            sscanf(value, "%d", &currversion);

        } else if (strcmp(keyword, "grid_size") == 0) {
            sscanf(value, "%d", &initgridsize);
            ClampInt(initgridsize, MINGRIDSIZE, MAXGRIDSIZE);

        } else if (strcmp(keyword, "random_fill") == 0) {
            sscanf(value, "%d", &randomfill);
            ClampInt(randomfill, 1, 100);

        } else if (strcmp(keyword, "tick_delay") == 0) {
            sscanf(value, "%d", &tickdelay);
            ClampInt(tickdelay, 0, MAX_DELAY);

        } else if (strcmp(keyword, "max_generations") == 0) {
            sscanf(value, "%d", &racegens);
            ClampInt(racegens, 1, MAX_GENERATIONS);

        } else if (strcmp(keyword, "competition_size") == 0) {
            sscanf(value, "%d", &racesize);
            ClampInt(racesize, MINGRIDSIZE, MAXGRIDSIZE);

        } else if (strcmp(keyword, "population_history") == 0) {
            sscanf(value, "%d", &maxpophistory);
            ClampInt(maxpophistory, MIN_POP_HISTORY, MAX_POP_HISTORY);

        } else if (strcmp(keyword, "grid_history") == 0) {
            sscanf(value, "%d", &maxgridhistory);
            ClampInt(maxgridhistory, MIN_GRID_HISTORY, MAX_GRID_HISTORY);

        } else if (strcmp(keyword, "random_seed") == 0) {
            sscanf(value, "%u", &randomseed);

        } else if (strcmp(keyword, "rule") == 0) {
            // only accept a rule we can actually run
            liferules rules;
            if (rules.setrule(value) == 0) {
                strcpy(initrule, rules.getrule());
            } else {
                lifewarning("Bad rule in preferences file was ignored.");
            }
        }
        // unknown keywords are silently skipped
    }

    reader.close();
}
