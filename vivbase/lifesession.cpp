// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "lifesession.h"
#include "presets.h"
#include "readpattern.h"
#include "util.h"
#include <stdio.h>

lifesession::lifesession(int n, unsigned int seed, int maxpops, int maxgrids) :
   algo(n), analyzer(maxpops, maxgrids), described(false), running(false) {
   if (seed == 0)
      seed = (unsigned int)(long long)(vivariumSecondCount() * 1000.0) ;
   rnd.seed(seed) ;
   restart() ;
}

const char *lifesession::checkpaused() const {
   if (running)
      return "Pause the simulation before editing." ;
   return 0 ;
}

// generation 0 of a new history
void lifesession::restart() {
   algo.setGeneration(0) ;
   analyzer.clear() ;
   matches.clear() ;
   described = false ;
   update() ;
}

void lifesession::update() {
   analyzer.record(algo.getgrid()) ;
   refresh() ;
}

// recompute everything derived from the history
void lifesession::refresh() {
   const lifegrid &g = algo.getgrid() ;
   analyzer.analyze(g) ;
   findmatches(analyzer, matches) ;
   described = describepattern(analyzer.getmetrics(), algo.getGeneration(),
                               rnd, description) ;
}

void lifesession::tick() {
   algo.step() ;
   update() ;
}

const char *lifesession::setcell(int row, int col, int newstate) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   if (algo.setcell(row, col, newstate) < 0)
      return "Cell is outside the grid." ;
   // same generation, so the newest sample is replaced
   analyzer.amend(algo.getgrid()) ;
   refresh() ;
   return 0 ;
}

const char *lifesession::setrule(const char *s) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   return algo.setrule(s) ;
}

const char *lifesession::setrules(const liferules &r) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   algo.setrules(r) ;
   return 0 ;
}

const char *lifesession::setgridsize(int n) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   err = checkgridsize(n) ;
   if (err)
      return err ;
   algo.setgrid(lifegrid(n)) ;
   restart() ;
   return 0 ;
}

const char *lifesession::clearall() {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   algo.clearall() ;
   restart() ;
   return 0 ;
}

const char *lifesession::randomize(double density) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   if (density < 0.0 || density > 1.0)
      return "Density must be from 0 to 1." ;
   algo.setgrid(lifegrid::createrandom(algo.gridsize(), rnd, density)) ;
   restart() ;
   return 0 ;
}

const char *lifesession::loadpreset(const char *name) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   const lifepreset *preset = findpreset(name) ;
   if (preset == 0)
      return "Unknown preset." ;
   lifegrid g(algo.gridsize()) ;
   int clipped = placepreset(*preset, g) ;
   if (clipped > 0) {
      char msg[128] ;
      sprintf(msg, "%d cells of %.40s don't fit in a %dx%d grid", clipped,
              preset->name, g.size(), g.size()) ;
      lifewarning(msg) ;
   }
   algo.setgrid(g) ;
   restart() ;
   return 0 ;
}

const char *lifesession::loadpattern(const char *filename) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   err = readpattern(filename, algo) ;
   if (err)
      return err ;
   restart() ;
   return 0 ;
}

const char *lifesession::loadpatternstring(const char *text) {
   const char *err = checkpaused() ;
   if (err)
      return err ;
   err = readpatternstring(text, algo) ;
   if (err)
      return err ;
   restart() ;
   return 0 ;
}

lifesnapshot lifesession::snapshot(const char *name, const char *desc) const {
   lifesnapshot snap ;
   snap.name = name ? name : "" ;
   snap.description = desc ? desc : "" ;
   snap.grid = algo.getgrid() ;
   snap.gridsize = algo.gridsize() ;
   snap.generation = algo.getGeneration() ;
   snap.population = algo.getPopulation() ;
   snap.rules = algo.getrules() ;
   snap.timestamp = (long long)(vivariumSecondCount() * 1000.0) ;
   return snap ;
}
