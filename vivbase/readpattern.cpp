// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "readpattern.h"
#include "lifealgo.h"
#include "liferules.h"     // for MAXRULESIZE
#include "util.h"          // for lifewarning
#include <cstdio>
#include <zlib.h>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <vector>

#define LINESIZE 20000
#define CR 13
#define LF 10

#define BUFFSIZE 8192

static gzFile zinstream ;          // current file, or 0 if reading a string
static const char *instring ;      // current string, or 0 if reading a file

static char filebuff[BUFFSIZE];
static int buffpos, bytesread, prevchar;

// next byte of the current source, or EOF
static int mgetchar() {
   if (instring) {
      if (*instring == 0) return EOF;
      return (unsigned char)*instring++;
   }
   if (buffpos == BUFFSIZE) {
      bytesread = gzread(zinstream, filebuff, BUFFSIZE);
      buffpos = 0;
   }
   if (buffpos >= bytesread) return EOF;
   return (unsigned char)filebuff[buffpos++];
}

// use getline instead of fgets so we can handle DOS/Mac/Unix line endings
char *getline(char *line, int maxlinelen) {
   int i = 0;
   while (i < maxlinelen) {
      int ch = mgetchar();
      switch (ch) {
         case CR:
            prevchar = CR;
            line[i] = 0;
            return line;
         case LF:
            if (prevchar != CR) {
               prevchar = LF;
               line[i] = 0;
               return line;
            }
            // if CR+LF (DOS) then ignore the LF
            prevchar = LF;
            break;
         case EOF:
            if (i == 0) return NULL;
            line[i] = 0;
            return line;
         default:
            prevchar = ch;
            line[i++] = (char) ch;
            break;
      }
   }
   line[i] = 0;      // silently truncate long line
   return line;
}

/*
 *   A pattern as read from the source, before it is placed in the grid.
 *   Cells are row,col relative to the pattern's top left corner.
 */
struct parsedpattern {
   parsedpattern() : wd(0), ht(0), sawrule(false), dropped(0) { rule[0] = 0; }
   int wd, ht ;                        // from header, or found extent
   bool sawrule ;
   char rule[MAXRULESIZE] ;
   int dropped ;                       // cells beyond any possible grid
   std::vector< std::pair<int,int> > cells ;
   void addcell(int row, int col) {
      if (row >= MAXGRIDSIZE || col >= MAXGRIDSIZE)
         dropped++ ;
      else
         cells.push_back(std::make_pair(row, col)) ;
   }
} ;

static const char *saverule(parsedpattern &pat, const char *ruleptr) {
   if (strlen(ruleptr) >= (size_t)MAXRULESIZE)
      return "Rule in pattern is too long." ;
   strcpy(pat.rule, ruleptr) ;
   pat.sawrule = true ;
   return 0 ;
}

// Read a text pattern like "...ooo$$$ooo" where '.', ',' and chars <= ' '
// represent dead cells, '$' represents 10 dead cells, and all other chars
// represent live cells.  Lines starting with '!' are comments.
static const char *readtextpattern(parsedpattern &pat, char *line) {
   int x=0, y=0;
   char *p;

   do {
      if (line[0] == '!') continue ;
      for (p = line; *p; p++) {
         if (*p == '.' || *p == ',' || *p <= ' ') {
            x++;
         } else if (*p == '$') {
            x += 10;
         } else {
            pat.addcell(y, x) ;
            if (pat.wd < x + 1 && x < MAXGRIDSIZE) pat.wd = x + 1 ;
            x++;
         }
      }
      if (y < MAXGRIDSIZE) y++ ;
      x = 0;
   } while (getline(line, LINESIZE));

   // trailing blank lines don't count towards the height
   pat.ht = 0 ;
   for (size_t i = 0; i < pat.cells.size(); i++)
      if (pat.ht < pat.cells[i].first + 1) pat.ht = pat.cells[i].first + 1 ;
   return 0 ;
}

/*
 *   Read an RLE pattern.
 */
static const char *readrle(parsedpattern &pat, char *line) {
   int n=0, x=0, y=0 ;
   char *p ;
   char *ruleptr;
   const char *errmsg;
   bool sawheader = false;
   bool finished = false;           // seen the terminating '!'
   int maxx = 0, maxy = 0;

   do {
      if (line[0] == '#') {
         if (line[1] == 'r') {
            ruleptr = line;
            ruleptr += 2;
            while (*ruleptr && *ruleptr <= ' ') ruleptr++;
            p = ruleptr;
            while (*p > ' ') p++;
            *p = 0;
            errmsg = saverule(pat, ruleptr);
            if (errmsg) return errmsg;
         }
         // #N, #C and other comment lines are ignored
      } else if (line[0] == 'x' && (line[1] <= ' ' || line[1] == '=')) {
         // extract wd and ht
         p = line;
         while (*p && *p != '=') p++;
         if (*p) p++;
         sscanf(p, "%d", &pat.wd);
         while (*p && *p != '=') p++;
         if (*p) p++;
         sscanf(p, "%d", &pat.ht);
         sawheader = true;

         while (*p && *p != 'r') p++;
         if (strncmp(p, "rule", 4) == 0) {
            p += 4;
            while (*p && (*p <= ' ' || *p == '=')) p++;
            ruleptr = p;
            while (*p > ' ') p++;
            // remove any comma at end of rule
            if (p > ruleptr && p[-1] == ',') p--;
            *p = 0;
            errmsg = saverule(pat, ruleptr);
            if (errmsg) return errmsg;
         }
      } else {
         for (p=line; *p; p++) {
            char c = *p ;
            if ('0' <= c && c <= '9') {
               n = n * 10 + c - '0' ;
               if (n > MAXGRIDSIZE)
                  return "Run count in RLE data is too big." ;
            } else {
               if (n == 0)
                  n = 1 ;
               if (c == 'b' || c == '.') {
                  x += n ;
                  if (x > MAXGRIDSIZE) x = MAXGRIDSIZE ;
               } else if (c == '$') {
                  x = 0 ;
                  y += n ;
                  if (y > MAXGRIDSIZE) y = MAXGRIDSIZE ;
               } else if (c == '!') {
                  finished = true ;
                  break ;
               } else if (c == 'o' || c == 'A') {
                  while (n-- > 0) {
                     pat.addcell(y, x) ;
                     if (x < MAXGRIDSIZE) x++;
                  }
                  if (maxx < x) maxx = x ;
                  if (maxy < y + 1 && y < MAXGRIDSIZE) maxy = y + 1 ;
               } else if (('p' <= c && c <= 'y') || ('B' <= c && c <= 'X')) {
                  return "Cell state out of range for this algorithm" ;
               } else if (c > ' ') {
                  return "Illegal character in RLE data" ;
               }
               n = 0 ;
            }
         }
      }
   } while (!finished && getline(line, LINESIZE));

   // headerless RLE has no stated size
   if (!sawheader || pat.wd <= 0 || pat.ht <= 0) {
      pat.wd = maxx ;
      pat.ht = maxy ;
   }
   return 0;
}

// This function guesses whether `line' is the start of a headerless Life RLE
// pattern.  It is used to distinguish headerless RLE from plain text patterns.
static bool isplainrle(const char *line) {

   // Find end of line, or terminating '!' character, whichever comes first:
   const char *end = line;
   while (*end && *end != '!') ++end;

   // Verify that '!' (if present) is the final printable character:
   if (*end == '!') {
      for (const char *p = end + 1; *p; ++p) {
         if ((unsigned)*p > ' ') {
            return false;
         }
      }
   }

   // Ensure line consists of valid tokens:
   bool prev_digit = false, have_digit = false;
   for (const char *p = line; p != end; ++p) {
      if ((unsigned)*p <= ' ') {
         if (prev_digit) return false;  // space inside token!
      } else if (*p >= '0' && *p <= '9') {
         prev_digit = have_digit = true;
      } else if (*p == 'b' || *p == 'o' || *p == '$') {
         prev_digit = false;
      } else {
         return false;  // unsupported printable character encountered!
      }
   }
   if (prev_digit) return false;  // end of line inside token!

   // Everything seems parseable; assume this is RLE if either we saw some
   // digits, or the pattern ends with a '!', both of which are unlikely to
   // occur in plain text patterns:
   return have_digit || *end == '!';
}

// Put the parsed pattern into imp, replacing its cells and maybe its rules.
static const char *placepattern(parsedpattern &pat, lifealgo &imp) {
   liferules rules = imp.getrules() ;
   if (pat.sawrule) {
      const char *err = rules.setrule(pat.rule) ;
      if (err) return err ;
   }

   int n = imp.gridsize() ;
   int rowoff = 0, coloff = 0 ;
   if (pat.wd <= n && pat.ht <= n) {
      // pattern fits so put it in the middle of the grid
      rowoff = (n - pat.ht) / 2 ;
      coloff = (n - pat.wd) / 2 ;
   }

   lifegrid g(n) ;
   int clipped = pat.dropped ;
   for (size_t i = 0; i < pat.cells.size(); i++) {
      if (g.setcell(pat.cells[i].first + rowoff, pat.cells[i].second + coloff, 1) < 0)
         clipped++ ;
   }
   if (clipped > 0) {
      char msg[128] ;
      sprintf(msg, "%d cells outside the %dx%d grid were dropped", clipped, n, n) ;
      lifewarning(msg) ;
   }

   imp.setrules(rules) ;
   imp.setgrid(g) ;
   imp.setGeneration(0) ;
   return 0 ;
}

static const char *loadpattern(lifealgo &imp) {
   // static since LINESIZE is large
   static char line[LINESIZE + 1] ;
   const char *errmsg = 0;
   parsedpattern pat ;

   // skip any blank lines at start
   char *first ;
   while ((first = getline(line, LINESIZE)) != 0 && line[0] == 0) ;
   if (first == 0)
      return "Pattern is empty." ;

   if (line[0] == '#' || line[0] == 'x') {
      errmsg = readrle(pat, line) ;
   } else if (isplainrle(line)) {
      errmsg = readrle(pat, line) ;
   } else {
      // read a text pattern like "...ooo$$$ooo"
      errmsg = readtextpattern(pat, line) ;
   }

   if (errmsg == 0)
      errmsg = placepattern(pat, imp) ;
   return errmsg ;
}

static const char *build_err_str(const char *filename) {
   static char file_err_str[2048];
   snprintf(file_err_str, sizeof(file_err_str), "Can't open pattern file:\n%s", filename);
   return file_err_str;
}

const char *readpattern(const char *filename, lifealgo &imp) {
   zinstream = gzopen(filename, "rb") ;      // rb needed on Windows
   if (zinstream == 0)
      return build_err_str(filename) ;
   instring = 0 ;
   buffpos = BUFFSIZE;                       // for 1st getchar call
   prevchar = 0;                             // for 1st getline call
   const char *errmsg = loadpattern(imp) ;
   gzclose(zinstream) ;
   zinstream = 0 ;
   return errmsg ;
}

const char *readpatternstring(const char *text, lifealgo &imp) {
   if (text == 0)
      return "No pattern data." ;
   zinstream = 0 ;
   instring = text ;
   prevchar = 0;                             // for 1st getline call
   const char *errmsg = loadpattern(imp) ;
   instring = 0 ;
   return errmsg ;
}
