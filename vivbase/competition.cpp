// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "competition.h"
#include "lifealgo.h"
#include "util.h"
#include <stdio.h>
#include <algorithm>

competitor::competitor(const char *n, const char *c, const liferules &r,
                       const lifegrid &g) :
   name(n), color(c), rules(r), grid(g), generation(0), stability(0) {
   population = grid.getpopulation() ;
   maxpopulation = population ;
}

int competitor::score() const {
   return maxpopulation + stability * 2 + (population > 0 ? SURVIVALBONUS : 0) ;
}

competition::competition(int gridsize, int maxgenerations) {
   if (checkgridsize(gridsize))
      lifefatal("Bad competition grid size!") ;
   if (maxgenerations < 1)
      lifefatal("Bad competition length!") ;
   gsize = gridsize ;
   maxgens = maxgenerations ;
   complete = false ;
   winner = -1 ;
}

void competition::clear() {
   competitors.clear() ;
   complete = false ;
   winner = -1 ;
}

const char *competition::addcompetitor(const char *name, const char *color,
                                       const liferules &rules, const lifegrid &g) {
   if (g.size() != gsize)
      return "Competitor grid has the wrong size." ;
   if (complete)
      return "Race is already complete." ;
   competitors.push_back(competitor(name, color, rules, g)) ;
   return 0 ;
}

void competition::setup(const ruleentry *entries, int count, liferandom &rnd,
                        double density) {
   clear() ;
   for (int i = 0; i < count; i++)
      competitors.push_back(competitor(entries[i].name, entries[i].color,
                                       entries[i].getrules(),
                                       lifegrid::createrandom(gsize, rnd, density))) ;
}

void competition::setup(liferandom &rnd) {
   setup(predefinedrules, NUMPREDEFINEDRULES, rnd) ;
}

bool competition::tick() {
   if (complete || competitors.empty())
      return false ;
   bool allfinished = true ;
   for (size_t i = 0; i < competitors.size(); i++) {
      competitor &c = competitors[i] ;
      if (c.generation >= maxgens)
         continue ;
      c.grid = nextgeneration(c.grid, c.rules) ;
      int newpop = c.grid.getpopulation() ;
      int change = newpop - c.population ;
      if (change < 0)
         change = -change ;
      c.stability += (change < STABLECHANGE) ? 1 : -2 ;
      if (c.stability < 0)
         c.stability = 0 ;
      if (newpop > c.maxpopulation)
         c.maxpopulation = newpop ;
      c.population = newpop ;
      c.generation++ ;
      if (c.generation < maxgens)
         allfinished = false ;
   }
   if (allfinished) {
      complete = true ;
      pickwinner() ;
      return false ;
   }
   return true ;
}

void competition::run() {
   while (tick()) {
      // keep going
   }
}

void competition::pickwinner() {
   // first maximum wins ties
   winner = 0 ;
   for (int i = 1; i < (int)competitors.size(); i++)
      if (competitors[i].score() > competitors[winner].score())
         winner = i ;
   char msg[256] ;
   sprintf(msg, "%.100s wins with score %d", competitors[winner].name,
           competitors[winner].score()) ;
   lifestatus(msg) ;
}

struct byscore {
   byscore(const vector<competitor> &c) : comps(c) {}
   bool operator()(int a, int b) const {
      return comps[a].score() > comps[b].score() ;
   }
   const vector<competitor> &comps ;
} ;

void competition::getstandings(vector<int> &order) const {
   order.clear() ;
   for (int i = 0; i < (int)competitors.size(); i++)
      order.push_back(i) ;
   std::stable_sort(order.begin(), order.end(), byscore(competitors)) ;
}

int competition::getGeneration() const {
   int gen = 0 ;
   for (size_t i = 0; i < competitors.size(); i++)
      if (competitors[i].generation > gen)
         gen = competitors[i].generation ;
   return gen ;
}
