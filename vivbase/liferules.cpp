// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "liferules.h"
#include "util.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

static const char *DEFAULTRULE = "S2..3,B3" ;

const ruleentry predefinedrules[] = {
   { "Conway's Classic", "#22c55e", 2, 3, 3 },
   { "Replicator",       "#3b82f6", 1, 1, 1 },
   { "Seeds",            "#f59e0b", 2, 2, 3 },
   { "Flock",            "#ef4444", 1, 2, 3 },
   { "Maze",             "#8b5cf6", 3, 4, 3 },
   { "HighLife",         "#06b6d4", 2, 3, 6 },
} ;
const int NUMPREDEFINEDRULES = sizeof(predefinedrules) / sizeof(predefinedrules[0]) ;

liferules::liferules() {
   // start with Conway's Life
   minS = 2 ;
   maxS = 3 ;
   birth = 3 ;
   setcanonical() ;
}

const char *liferules::DefaultRule() {
   return DEFAULTRULE ;
}

liferules::liferules(int smin, int smax, int b) {
   if (checkrules(smin, smax, b))
      lifefatal("Impossible; bad rule values") ;
   minS = smin ;
   maxS = smax ;
   birth = b ;
   setcanonical() ;
}

const char *liferules::checkrules(int smin, int smax, int b) {
   if (smin < 0 || smin > MAXNEIGHBORS || smax < 0 || smax > MAXNEIGHBORS)
      return "S value must be from 0 to 8" ;
   if (b < 0 || b > MAXNEIGHBORS)
      return "B value must be from 0 to 8" ;
   if (smin > smax)
      return "S minimum must be <= S maximum" ;
   return 0 ;
}

const char *liferules::setrules(int smin, int smax, int b) {
   const char *err = checkrules(smin, smax, b) ;
   if (err)
      return err ;
   minS = smin ;
   maxS = smax ;
   birth = b ;
   setcanonical() ;
   return 0 ;
}

void liferules::setcanonical() {
   sprintf(canonrule, "S%d..%d,B%d", minS, maxS, birth) ;
}

bool liferules::isregularlife() const {
   return minS == 2 && maxS == 3 && birth == 3 ;
}

// Parse B/S notation like "B3/S23" or "S23/B3".  Survival digits must
// form one contiguous run and exactly one birth digit is allowed.
const char *liferules::parsebsrule(const char *s, int *smin, int *smax, int *b) {
   int bbits = 0, sbits = 0 ;
   int *bits = 0 ;
   bool sawb = false, saws = false, sawslash = false ;
   for (const char *p = s; *p; p++) {
      char c = (char)toupper(*p) ;
      if (c == 'B') {
         if (sawb) return "Only one B allowed." ;
         sawb = true ;
         bits = &bbits ;
      } else if (c == 'S') {
         if (saws) return "Only one S allowed." ;
         saws = true ;
         bits = &sbits ;
      } else if (c == '/') {
         if (sawslash) return "Only one slash allowed." ;
         sawslash = true ;
         bits = 0 ;
      } else if (c >= '0' && c <= '9') {
         if (bits == 0) return "B and S must be either side of slash." ;
         if (c - '0' > MAXNEIGHBORS) return "Digit greater than neighborhood allows." ;
         *bits |= 1 << (c - '0') ;
      } else {
         return "Bad character found." ;
      }
   }
   if (!sawb || !saws || !sawslash)
      return "Rule must contain B, S and a slash." ;

   // exactly one birth count
   if (bbits == 0 || (bbits & (bbits - 1)) != 0)
      return "B part must have exactly one neighbor count." ;
   if (sbits == 0)
      return "S part must have at least one neighbor count." ;

   int lo = 0 ;
   while ((sbits & (1 << lo)) == 0) lo++ ;
   int hi = lo ;
   while (sbits & (1 << (hi + 1))) hi++ ;
   if ((sbits >> (hi + 1)) != 0)
      return "S counts must form a single range." ;

   int bc = 0 ;
   while ((bbits & (1 << bc)) == 0) bc++ ;

   *smin = lo ;
   *smax = hi ;
   *b = bc ;
   return 0 ;
}

const char *liferules::setrule(const char *s) {
   int s1, s2, b1, b2, endpos ;
   if (s == 0 || *s == 0)
      return "Rule cannot be empty string." ;
   if (strlen(s) >= (size_t)MAXRULESIZE)
      return "Rule name is too long." ;

   if (sscanf(s, "S%d..%d,B%d..%d%n", &s1, &s2, &b1, &b2, &endpos) == 4) {
      // a birth range is only allowed when it names one count
      if (b1 != b2) return "B minimum must equal B maximum" ;
   } else if (sscanf(s, "S%d..%d,B%d%n", &s1, &s2, &b1, &endpos) == 3) {
      // canonical form
   } else if (sscanf(s, "%d,%d,%d%n", &s1, &s2, &b1, &endpos) == 3) {
      // terse form: survival min, survival max, birth
   } else {
      const char *err = parsebsrule(s, &s1, &s2, &b1) ;
      if (err) return err ;
      return setrules(s1, s2, b1) ;
   }
   if (s[endpos] != 0)
      return "Unexpected characters after rule." ;
   return setrules(s1, s2, b1) ;
}

const ruleentry *findruleentry(const char *name) {
   if (name == 0)
      return 0 ;
   for (int i = 0; i < NUMPREDEFINEDRULES; i++) {
      const char *p = predefinedrules[i].name ;
      const char *q = name ;
      while (*p && *q && tolower(*p) == tolower(*q)) {
         p++ ;
         q++ ;
      }
      if (*p == 0 && *q == 0)
         return &predefinedrules[i] ;
   }
   return 0 ;
}
