// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

/**
 *   One simulation: the universe and its rules, the rolling history
 *   and everything derived from it.  Metrics, historical matches and
 *   the description are computed once per tick and cached here.
 *
 *   The session is either paused (the default) or running.  Cells,
 *   rules and grid contents may only be changed while paused; tick()
 *   itself works in both states so a paused session can be single
 *   stepped.  Not thread safe.
 */
#ifndef LIFESESSION_H
#define LIFESESSION_H
#include "lifealgo.h"
#include "patternstats.h"
#include "patternmatch.h"
#include "describe.h"
#include <string>

/**
 *   A plain read-only copy of a session's state for exporting.
 */
struct lifesnapshot {
   lifesnapshot() : grid(1), gridsize(0), generation(0), population(0),
                    timestamp(0) {}
   std::string name ;
   std::string description ;
   lifegrid grid ;
   int gridsize ;
   int generation ;
   int population ;
   liferules rules ;
   long long timestamp ;       // milliseconds since the epoch
} ;

class lifesession {
public:
   // seed 0 means seed from the clock
   lifesession(int n = DEFAULTGRIDSIZE, unsigned int seed = 0,
               int maxpops = POPHISTORYSIZE, int maxgrids = GRIDHISTORYSIZE) ;

   // editing; each returns an error message if running or on bad input
   const char *setcell(int row, int col, int newstate) ;
   const char *setrule(const char *s) ;
   const char *setrules(const liferules &r) ;
   const char *setgridsize(int n) ;
   const char *clearall() ;
   const char *randomize(double density = DEFAULTDENSITY) ;
   const char *loadpreset(const char *name) ;
   const char *loadpattern(const char *filename) ;
   const char *loadpatternstring(const char *text) ;

   void start() { running = true ; }
   void pause() { running = false ; }
   bool isrunning() const { return running ; }

   // advance one generation and refresh the cached analysis
   void tick() ;

   const lifegrid &getgrid() const { return algo.getgrid() ; }
   const liferules &getrules() const { return algo.getrules() ; }
   const char *getrule() const { return algo.getrule() ; }
   int gridsize() const { return algo.gridsize() ; }
   int getGeneration() const { return algo.getGeneration() ; }
   int getPopulation() const { return algo.getPopulation() ; }

   const patternanalyzer &getanalyzer() const { return analyzer ; }
   const patternmetrics &getmetrics() const { return analyzer.getmetrics() ; }
   const std::vector<patternmatch> &getmatches() const { return matches ; }
   // false until the session has run long enough to be described
   bool hasdescription() const { return described ; }
   const patterndescription &getdescription() const { return description ; }

   liferandom &getrandom() { return rnd ; }

   lifesnapshot snapshot(const char *name, const char *desc) const ;

private:
   lifealgo algo ;
   patternanalyzer analyzer ;
   std::vector<patternmatch> matches ;
   patterndescription description ;
   bool described ;
   bool running ;
   liferandom rnd ;

   const char *checkpaused() const ;
   void restart() ;
   void update() ;
   void refresh() ;
} ;
#endif
