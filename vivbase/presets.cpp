// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "presets.h"
#include <ctype.h>

static const int glider[][2] = {
   {1,2}, {2,3}, {3,1}, {3,2}, {3,3}
} ;

static const int blinker[][2] = {
   {15,14}, {15,15}, {15,16}
} ;

static const int block[][2] = {
   {14,14}, {14,15}, {15,14}, {15,15}
} ;

static const int toad[][2] = {
   {14,15}, {14,16}, {14,17}, {15,14}, {15,15}, {15,16}
} ;

static const int beacon[][2] = {
   {12,12}, {12,13}, {13,12}, {13,13}, {14,14}, {14,15}, {15,14}, {15,15}
} ;

static const int pulsar[][2] = {
   {10,12}, {10,13}, {10,14}, {10,18}, {10,19}, {10,20},
   {12,10}, {12,15}, {12,17}, {12,22},
   {13,10}, {13,15}, {13,17}, {13,22},
   {14,10}, {14,15}, {14,17}, {14,22},
   {15,12}, {15,13}, {15,14}, {15,18}, {15,19}, {15,20},
   {17,12}, {17,13}, {17,14}, {17,18}, {17,19}, {17,20},
   {18,10}, {18,15}, {18,17}, {18,22},
   {19,10}, {19,15}, {19,17}, {19,22},
   {20,10}, {20,15}, {20,17}, {20,22},
   {22,12}, {22,13}, {22,14}, {22,18}, {22,19}, {22,20}
} ;

// Gosper's gun; the right-hand block lies beyond a 30x30 board
static const int glidergun[][2] = {
   {5,1}, {5,2}, {6,1}, {6,2},
   {5,11}, {6,11}, {7,11}, {4,12}, {8,12}, {3,13}, {9,13}, {3,14}, {9,14},
   {6,15}, {4,16}, {8,16}, {5,17}, {6,17}, {7,17}, {6,18},
   {3,21}, {4,21}, {5,21}, {3,22}, {4,22}, {5,22}, {2,23}, {6,23},
   {1,25}, {2,25}, {6,25}, {7,25},
   {3,35}, {4,35}, {3,36}, {4,36}
} ;

static const int lwss[][2] = {
   {10,11}, {10,14}, {11,15}, {12,11}, {12,15}, {13,12}, {13,13}, {13,14}, {13,15}
} ;

#define CELLS(a) a, (int)(sizeof(a) / sizeof(a[0]))

const lifepreset lifepresets[] = {
   { "Glider", "A simple pattern that moves across the grid", CELLS(glider) },
   { "Blinker", "Oscillates between two states", CELLS(blinker) },
   { "Block", "A stable pattern that never changes", CELLS(block) },
   { "Toad", "A 2-period oscillator", CELLS(toad) },
   { "Beacon", "Another 2-period oscillator", CELLS(beacon) },
   { "Pulsar", "A 3-period oscillator", CELLS(pulsar) },
   { "Glider Gun", "Creates gliders infinitely", CELLS(glidergun) },
   { "Lightweight Spaceship", "Travels diagonally across the grid", CELLS(lwss) },
} ;
const int NUMPRESETS = sizeof(lifepresets) / sizeof(lifepresets[0]) ;

const lifepreset *findpreset(const char *name) {
   if (name == 0)
      return 0 ;
   for (int i = 0; i < NUMPRESETS; i++) {
      const char *p = lifepresets[i].name ;
      const char *q = name ;
      while (*p && *q && tolower(*p) == tolower(*q)) {
         p++ ;
         q++ ;
      }
      if (*p == 0 && *q == 0)
         return &lifepresets[i] ;
   }
   return 0 ;
}

int placepreset(const lifepreset &preset, lifegrid &g) {
   int clipped = 0 ;
   g.clearall() ;
   for (int i = 0; i < preset.numcells; i++)
      if (g.setcell(preset.cells[i][0], preset.cells[i][1], 1) < 0)
         clipped++ ;
   return clipped ;
}
