// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

/**
 *   The transition function of a two-state Moore-neighborhood rule
 *   with a contiguous survival range and a single birth count.  A live
 *   cell survives when its live neighbor count lies in
 *   [survivalmin, survivalmax]; a dead cell is born when the count
 *   equals birthcount.  Conway's Life is {2,3,3}.
 */
#ifndef LIFERULES_H
#define LIFERULES_H
const int MAXRULESIZE = 64 ;   // maximum number of characters in a rule
const int MAXNEIGHBORS = 8 ;   // neighbors in the Moore neighborhood

class liferules {
public:
   liferules() ;
   // the given values must be valid; see checkrules
   liferules(int smin, int smax, int b) ;
   // string returned by setrule is any error; rules are unchanged then
   const char *setrule(const char *s) ;
   const char *setrules(int smin, int smax, int b) ;
   const char *getrule() const { return canonrule ; }
   static const char *checkrules(int smin, int smax, int b) ;
   static const char *DefaultRule() ;

   int survivalmin() const { return minS ; }
   int survivalmax() const { return maxS ; }
   int birthcount() const { return birth ; }
   bool survives(int ncount) const { return ncount >= minS && ncount <= maxS ; }
   bool isborn(int ncount) const { return ncount == birth ; }
   bool isregularlife() const ;    // is this S2..3,B3?

   bool operator==(const liferules &r) const {
      return minS == r.minS && maxS == r.maxS && birth == r.birth ;
   }
   bool operator!=(const liferules &r) const { return !(*this == r) ; }

private:
   char canonrule[MAXRULESIZE] ;   // canonical version of the current rule
   int minS, maxS ;                // limits for survival
   int birth ;                     // neighbor count for birth

   void setcanonical() ;
   const char *parsebsrule(const char *s, int *smin, int *smax, int *b) ;
} ;

/**
 *   A named rule as raced in a competition.
 */
struct ruleentry {
   const char *name ;
   const char *color ;     // display color as #rrggbb
   int survivalmin ;
   int survivalmax ;
   int birthcount ;
   liferules getrules() const { return liferules(survivalmin, survivalmax, birthcount) ; }
} ;

extern const ruleentry predefinedrules[] ;
extern const int NUMPREDEFINEDRULES ;

// case-insensitive lookup in predefinedrules; returns 0 if not found
const ruleentry *findruleentry(const char *name) ;
#endif
