// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "lifegrid.h"
#include "util.h"

const char *checkgridsize(int n) {
   if (n < MINGRIDSIZE) return "Grid size must be at least 1" ;
   if (n > MAXGRIDSIZE) return "Grid size is too big" ;
   return 0 ;
}

lifegrid::lifegrid(int n) {
   if (checkgridsize(n))
      lifefatal("Bad grid size!") ;
   gsize = n ;
   outerwd = n + 2 ;
   population = 0 ;
   outergrid.assign(outerwd * outerwd, 0) ;
}

int lifegrid::getcell(int row, int col) const {
   if (row < 0 || row >= gsize || col < 0 || col >= gsize)
      return 0 ;
   return rowptr(row)[col] ;
}

int lifegrid::setcell(int row, int col, int newstate) {
   if (newstate < 0 || newstate > 1) return -1 ;
   if (row < 0 || row >= gsize || col < 0 || col >= gsize)
      return -1 ;
   unsigned char *cellptr = &outergrid[(row + 1) * outerwd + col + 1] ;
   if (*cellptr != newstate) {
      *cellptr = (unsigned char)newstate ;
      if (newstate)
         population++ ;
      else
         population-- ;
   }
   return 0 ;
}

int lifegrid::nextcell(int row, int col) const {
   if (row < 0 || row >= gsize || col >= gsize)
      return -1 ;
   if (col < 0)
      col = 0 ;
   const unsigned char *p = rowptr(row) ;
   for (int c = col; c < gsize; c++)
      if (p[c])
         return c - col ;
   return -1 ;
}

int lifegrid::countneighbors(int row, int col) const {
   int count = 0 ;
   for (int i = -1; i <= 1; i++)
      for (int j = -1; j <= 1; j++) {
         if (i == 0 && j == 0)
            continue ;
         count += getcell(row + i, col + j) ;
      }
   return count ;
}

void lifegrid::clearall() {
   outergrid.assign(outerwd * outerwd, 0) ;
   population = 0 ;
}

void lifegrid::randomfill(double density, liferandom &rnd) {
   std::uniform_real_distribution<double> dist(0.0, 1.0) ;
   // a cell is born when the draw lands in the top "density" of [0,1)
   double threshold = 1.0 - density ;
   clearall() ;
   for (int row = 0; row < gsize; row++)
      for (int col = 0; col < gsize; col++)
         if (dist(rnd) > threshold)
            setcell(row, col, 1) ;
}

void lifegrid::getlivecells(vector< pair<int,int> > &cells) const {
   for (int row = 0; row < gsize; row++) {
      const unsigned char *p = rowptr(row) ;
      for (int col = 0; col < gsize; col++)
         if (p[col])
            cells.push_back(std::make_pair(row, col)) ;
   }
}

bool lifegrid::operator==(const lifegrid &other) const {
   return gsize == other.gsize && population == other.population &&
          outergrid == other.outergrid ;
}

lifegrid lifegrid::createempty(int n) {
   return lifegrid(n) ;
}

lifegrid lifegrid::createrandom(int n, liferandom &rnd, double density) {
   lifegrid g(n) ;
   g.randomfill(density, rnd) ;
   return g ;
}
