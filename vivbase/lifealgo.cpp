// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "lifealgo.h"

lifegrid nextgeneration(const lifegrid &src, const liferules &rules) {
   int n = src.size() ;
   int wd = src.stride() ;
   lifegrid next(n) ;
   for (int row = 0; row < n; row++) {
      const unsigned char *topy = src.rowptr(row - 1) ;
      const unsigned char *midy = src.rowptr(row) ;
      for (int col = 0; col < n; col++) {
         // count the live neighbors in the Moore neighborhood;
         // the dead border means no edge checks are needed
         int ncount = 0 ;
         const unsigned char *cellptr = topy + (col - 1) ;
         if (*cellptr++) ncount++ ;
         if (*cellptr++) ncount++ ;
         if (*cellptr  ) ncount++ ;
         cellptr += wd ;
         if (*cellptr  ) ncount++ ;
         cellptr -= 2 ;
         if (*cellptr  ) ncount++ ;
         cellptr += wd ;
         if (*cellptr++) ncount++ ;
         if (*cellptr++) ncount++ ;
         if (*cellptr  ) ncount++ ;
         if (midy[col]) {
            // this cell is alive
            if (rules.survives(ncount))
               next.setcell(row, col, 1) ;
         } else {
            // this cell is dead
            if (rules.isborn(ncount))
               next.setcell(row, col, 1) ;
         }
      }
   }
   return next ;
}

lifealgo::lifealgo(int n) : grid(n), rules(), generation(0) {
}

void lifealgo::clearall() {
   grid.clearall() ;
   generation = 0 ;
}

int lifealgo::setcell(int row, int col, int newstate) {
   return grid.setcell(row, col, newstate) ;
}

void lifealgo::step() {
   grid = nextgeneration(grid, rules) ;
   generation++ ;
}
