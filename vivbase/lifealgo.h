// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

/**
 *   The generation engine.  nextgeneration() is the pure transition
 *   function; lifealgo wraps it with the current grid, the rules and
 *   a generation counter so a driver can simply call step().
 */
#ifndef LIFEALGO_H
#define LIFEALGO_H
#include "lifegrid.h"
#include "liferules.h"

/**
 *   Return the generation following src under the given rules.  src
 *   is never modified and the result shares no storage with it.
 */
lifegrid nextgeneration(const lifegrid &src, const liferules &rules) ;

class lifealgo {
public:
   explicit lifealgo(int n = DEFAULTGRIDSIZE) ;
   void clearall() ;
   // returns <0 if error
   int setcell(int row, int col, int newstate) ;
   int getcell(int row, int col) const { return grid.getcell(row, col) ; }
   // new rules; returns err msg
   const char *setrule(const char *s) { return rules.setrule(s) ; }
   const char *getrule() const { return rules.getrule() ; }
   void setrules(const liferules &r) { rules = r ; }
   const liferules &getrules() const { return rules ; }
   // replace the whole universe; the grid size follows g
   void setgrid(const lifegrid &g) { grid = g ; }
   const lifegrid &getgrid() const { return grid ; }
   int gridsize() const { return grid.size() ; }
   void setGeneration(int gen) { generation = gen ; }
   int getGeneration() const { return generation ; }
   int getPopulation() const { return grid.getpopulation() ; }
   int isEmpty() const { return grid.isempty() ; }
   void step() ;                    // do one generation
private:
   lifegrid grid ;
   liferules rules ;
   int generation ;
} ;
#endif
