// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

/**
 *   A race between several rules.  Each competitor evolves its own
 *   random grid under its own rules; all of them advance in lockstep
 *   for a fixed number of generations and are then scored.
 */
#ifndef COMPETITION_H
#define COMPETITION_H
#include "lifegrid.h"
#include "liferules.h"
#include <vector>

const int DEFAULTCOMPSIZE = 20 ;     // grid size of every competitor
const int DEFAULTCOMPGENS = 100 ;    // generations in one race
const int STABLECHANGE = 5 ;         // population change still counted as stable
const int SURVIVALBONUS = 50 ;       // score bonus for not dying out

struct competitor {
   competitor(const char *n, const char *c, const liferules &r, const lifegrid &g) ;
   const char *name ;
   const char *color ;
   liferules rules ;
   lifegrid grid ;
   int population ;
   int generation ;
   int maxpopulation ;       // high-water mark of population
   int stability ;           // never negative
   int score() const ;
} ;

class competition {
public:
   competition(int gridsize = DEFAULTCOMPSIZE, int maxgens = DEFAULTCOMPGENS) ;
   // drop all competitors and start over
   void clear() ;
   // add one competitor with the given starting grid; returns err msg
   const char *addcompetitor(const char *name, const char *color,
                             const liferules &rules, const lifegrid &g) ;
   // new race: one random grid per entry
   void setup(const ruleentry *entries, int count, liferandom &rnd,
              double density = DEFAULTDENSITY) ;
   // new race between all predefined rules
   void setup(liferandom &rnd) ;
   // advance every unfinished competitor one generation;
   // returns false once the race is complete
   bool tick() ;
   // tick until the race is complete
   void run() ;
   bool iscomplete() const { return complete ; }
   bool isfinished(int i) const { return competitors[i].generation >= maxgens ; }
   int numcompetitors() const { return (int)competitors.size() ; }
   const competitor &getcompetitor(int i) const { return competitors[i] ; }
   // index of the winner, or -1 before the race is complete
   int getwinner() const { return winner ; }
   // competitor indices ordered by score, best first
   void getstandings(vector<int> &order) const ;
   int gridsize() const { return gsize ; }
   int maxgenerations() const { return maxgens ; }
   int getGeneration() const ;
private:
   vector<competitor> competitors ;
   int gsize ;
   int maxgens ;
   bool complete ;
   int winner ;
   void pickwinner() ;
} ;
#endif
