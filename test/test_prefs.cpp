// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include <cassert>
#include <cstdio>
#include <cstring>
#include <iostream>
#include "prefs.h"
#include "lifegrid.h"

static void writefile(const char *path, const char *text) {
    FILE *f = fopen(path, "wb");
    assert(f != 0);
    fputs(text, f);
    fclose(f);
}

void test_read_and_clamp() {
    ResetPrefs();
    prefsfile = "vivarium_test_prefs.txt";
    writefile(prefsfile.c_str(),
              "# comment line\r\n"
              "\r\n"
              "grid_size=5000 (1..1000)\r\n"
              "random_fill=0\r\n"
              "tick_delay=350\r\n"
              "rule=B99/S23\r\n"
              "max_generations=250\r\n"
              "population_history=2\r\n"
              "grid_history=500\r\n"
              "random_seed=42\r\n"
              "no equals sign here\r\n"
              "favourite_colour=green\r\n");
    GetPrefs();
    assert(initgridsize == MAXGRIDSIZE);
    assert(randomfill == 1);
    assert(tickdelay == 350);
    assert(strcmp(initrule, "S2..3,B3") == 0);
    assert(racegens == 250);
    assert(maxpophistory == MIN_POP_HISTORY);
    assert(maxgridhistory == MAX_GRID_HISTORY);
    assert(randomseed == 42);

    writefile(prefsfile.c_str(), "rule=3,4,3\n");
    GetPrefs();
    assert(strcmp(initrule, "S3..4,B3") == 0);
    // untouched keys keep their values
    assert(racegens == 250);
    remove(prefsfile.c_str());
    std::cout << "PASSED: test_read_and_clamp\n";
}

void test_save_and_reload() {
    ResetPrefs();
    prefsfile = "vivarium_test_prefs.txt";
    initgridsize = 64;
    randomfill = 45;
    racesize = 40;
    strcpy(initrule, "S1..5,B3");
    SavePrefs();

    ResetPrefs();
    assert(initgridsize == DEFAULTGRIDSIZE);
    assert(strcmp(initrule, "S2..3,B3") == 0);
    GetPrefs();
    assert(initgridsize == 64);
    assert(randomfill == 45);
    assert(racesize == 40);
    assert(strcmp(initrule, "S1..5,B3") == 0);
    remove(prefsfile.c_str());
    std::cout << "PASSED: test_save_and_reload\n";
}

void test_missing_file() {
    ResetPrefs();
    prefsfile = "no-such-dir/vivarium_prefs.txt";
    tickdelay = 123;
    GetPrefs();
    assert(tickdelay == 123);
    assert(initgridsize == DEFAULTGRIDSIZE);
    std::cout << "PASSED: test_missing_file\n";
}

int main() {
    test_read_and_clamp();
    test_save_and_reload();
    test_missing_file();
    std::cout << "All preference tests passed\n";
    return 0;
}
