// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

/**
 *   A bounded square universe of two-state cells.  Cells are indexed
 *   by row and column, both in [0,n).  The grid is stored with a one
 *   cell border of permanently dead cells so neighborhood counts can
 *   be done without edge checks; there is no wraparound.
 */
#ifndef LIFEGRID_H
#define LIFEGRID_H
#include <vector>
#include <utility>
#include <random>
using std::vector;
using std::pair;

const int MINGRIDSIZE = 1 ;
const int MAXGRIDSIZE = 1000 ;
const int DEFAULTGRIDSIZE = 30 ;
const double DEFAULTDENSITY = 0.3 ;

// the random source used by every randomized routine
typedef std::mt19937 liferandom ;

// returns 0 if n is a usable grid dimension, else an error message
const char *checkgridsize(int n) ;

class lifegrid {
public:
   explicit lifegrid(int n = DEFAULTGRIDSIZE) ;
   int size() const { return gsize ; }
   // returns 0 or 1; cells outside the grid are dead
   int getcell(int row, int col) const ;
   // returns <0 if row,col is outside the grid
   int setcell(int row, int col, int newstate) ;
   // number of dead cells from col to the next live cell in this row,
   // or -1 if there are no more live cells in the row
   int nextcell(int row, int col) const ;
   // live cells among the 8 Moore neighbors; cells outside are skipped
   int countneighbors(int row, int col) const ;
   int getpopulation() const { return population ; }
   bool isempty() const { return population == 0 ; }
   void clearall() ;
   // each cell becomes alive independently with probability density
   void randomfill(double density, liferandom &rnd) ;
   // append the row,col of every live cell in row-major order
   void getlivecells(vector< pair<int,int> > &cells) const ;
   bool operator==(const lifegrid &other) const ;
   bool operator!=(const lifegrid &other) const { return !(*this == other) ; }

   // raw access for the generation code; row may be -1 or n to reach
   // the dead border, and the returned pointer addresses column 0
   const unsigned char *rowptr(int row) const {
      return &outergrid[(row + 1) * outerwd + 1] ;
   }
   int stride() const { return outerwd ; }

   static lifegrid createempty(int n) ;
   static lifegrid createrandom(int n, liferandom &rnd,
                                double density = DEFAULTDENSITY) ;
private:
   int gsize ;                        // width and height in cells
   int outerwd ;                      // gsize + 2 border cells
   int population ;                   // number of live cells
   vector<unsigned char> outergrid ;  // outerwd*outerwd cells, border included
} ;
#endif
