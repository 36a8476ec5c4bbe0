// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

/**
 *   Built-in starting patterns.  Coordinates are row,col on a 30x30
 *   board; on smaller grids the cells that don't fit are dropped.
 */
#ifndef PRESETS_H
#define PRESETS_H
#include "lifegrid.h"

const int PRESETBOARDSIZE = 30 ;

struct lifepreset {
   const char *name ;
   const char *description ;
   const int (*cells)[2] ;    // row,col pairs
   int numcells ;
} ;

extern const lifepreset lifepresets[] ;
extern const int NUMPRESETS ;

// case-insensitive lookup by name; returns 0 if not found
const lifepreset *findpreset(const char *name) ;

// clear g and set the preset's cells; returns the number of cells
// that fell outside the grid
int placepreset(const lifepreset &preset, lifegrid &g) ;
#endif
