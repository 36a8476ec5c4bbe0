// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "lifesession.h"
#include "competition.h"
#include "presets.h"
#include "readpattern.h"
#include "writepattern.h"
#include "prefs.h"
#include "util.h"
#include <stdlib.h>
#include <iostream>
#include <cstdio>
#include <string.h>
#include <ctype.h>
#include <string>
#include <chrono>
#include <thread>

using namespace std ;

double start ;
double timestamp() {
   double now = vivariumSecondCount() ;
   double r = now - start ;
   if (start == 0)
      start = now ;
   return r ;
}

lifesession *session = 0 ;

int benchmark ; // show timing?
/*
 *   This is our standard lifeerrors.
 */
class stderrors : public lifeerrors {
public:
   stderrors() {}
   virtual void fatal(const char *s) { cout << "Fatal error: " << s << endl ; exit(10) ; }
   virtual void warning(const char *s) { cout << "Warning: " << s << endl ; }
   virtual void status(const char *s) {
      if (benchmark)
         cout << timestamp() << " " << s << endl ;
      else {
         timestamp() ;
         cout << s << endl ;
      }
   }
} ;
stderrors stderrors_instance ;

char *filename ;
struct options {
  const char *shortopt ;
  const char *longopt ;
  const char *desc ;
  char opttype ;
  void *data ;
} ;
int maxgen = -1 ;
int gridsizeopt = -1, fillopt = -1, seedopt = -1, delayopt = -1 ;
int quiet, analyze, compete, watch, writeprefs ;
char *liferule = 0 ;
char *presetname = 0 ;
char *outfilename = 0 ;
char *prefsname = 0 ;
char *testscript = 0 ;
options options[] = {
  { "-m", "--generation", "How far to run", 'i', &maxgen },
  { "-r", "--rule", "Life rule or competitor name to use", 's', &liferule },
  { "-n", "--size", "Grid size", 'i', &gridsizeopt },
  { "-f", "--fill", "Random fill percentage", 'i', &fillopt },
  { "-S", "--seed", "Random seed (0 = use clock)", 'i', &seedopt },
  { "-p", "--preset", "Start from a built-in pattern", 's', &presetname },
  { "-o", "--output", "Output file (*.rle, *.rle.gz)", 's', &outfilename },
  { "-b", "--benchmark", "Show timestamps", 'b', &benchmark },
  { "-q", "--quiet", "Don't show population; twice, don't show anything", 'b', &quiet },
  { "-a", "--analyze", "Show metrics, matches and description", 'b', &analyze },
  { "-c", "--compete", "Race the predefined rules against each other", 'b', &compete },
  { "-w", "--watch", "Show the grid after every generation", 'b', &watch },
  { "-d", "--delay", "Millisecs between generations when watching", 'i', &delayopt },
  { "-P", "--prefs", "Preferences file", 's', &prefsname },
  { "",   "--writeprefs", "Save the preferences in effect to the prefs file", 'b', &writeprefs },
  { "",   "--exec", "Run testing script", 's', &testscript },
  { 0, 0, 0, 0, 0 }
} ;

int endswith(const char *s, const char *suff) {
   int off = (int)(strlen(s) - strlen(suff)) ;
   if (off <= 0)
      return 0 ;
   s += off ;
   while (*s)
      if (tolower(*s++) != tolower(*suff++))
         return 0 ;
   return 1 ;
}

void usage(const char *s) {
  fprintf(stderr, "Usage:  bvivarium [options] [patternfile]\n") ;
  for (int i=0; options[i].shortopt; i++)
    fprintf(stderr, "%3s %-15s %s\n", options[i].shortopt, options[i].longopt,
            options[i].desc) ;
  if (s)
    lifefatal(s) ;
  exit(0) ;
}

#define STRINGIFY(ARG) STR2(ARG)
#define STR2(ARG) #ARG

// accept either a rule string or the name of a predefined competitor
const char *applyrule(const char *s) {
   const ruleentry *e = findruleentry(s) ;
   if (e)
      return session->setrules(e->getrules()) ;
   return session->setrule(s) ;
}

void showgeneration() {
   cout << session->getGeneration() << ": " << session->getPopulation() << endl ;
}

void showgrid() {
   const lifegrid &g = session->getgrid() ;
   for (int row=0; row<g.size(); row++) {
      const unsigned char *p = g.rowptr(row) ;
      for (int col=0; col<g.size(); col++)
         cout << (p[col] ? 'o' : '.') ;
      cout << endl ;
   }
}

void showmetrics() {
   const patternmetrics &m = session->getmetrics() ;
   printf("entropy %.3f  diversity %.3f  stability %.3f  growth %.3f  peak influence %.2f\n",
          m.entropy, m.diversity, m.stability, m.growth, m.influence.maxvalue()) ;
   const vector<patternmatch> &matches = session->getmatches() ;
   for (size_t i=0; i<matches.size(); i++) {
      const famouspattern *fp = matches[i].pattern ;
      printf("  resembles %s (%.0f%%): %s", fp->name, matches[i].similarity * 100,
             fp->description) ;
      if (fp->discoverer)
         printf(" [%s, %d]", fp->discoverer, fp->year) ;
      printf("\n") ;
   }
   fflush(stdout) ;
}

void showdescription() {
   if (session->hasdescription()) {
      const patterndescription &d = session->getdescription() ;
      cout << d.name << " (" << behaviorlabel(d.category) << ")" << endl ;
      cout << "  " << d.text << endl ;
   } else {
      cout << "Not enough generations to describe this pattern." << endl ;
   }
}

void writepat(const char *thisfilename, const char *name) {
   cerr << "(->" << thisfilename << flush ;
   const char *desc = session->hasdescription() ?
                      session->getdescription().text.c_str() : "" ;
   lifesnapshot snap = session->snapshot(name, desc) ;
   const char *err = writepattern(thisfilename, snap,
                                  endswith(thisfilename, ".gz") ?
                                  gzip_compression : no_compression) ;
   if (err != 0)
      lifewarning(err) ;
   cerr << ")" << flush ;
}

void runcompetition() {
   competition race(racesize, racegens) ;
   liferandom rnd ;
   unsigned int seed = randomseed ;
   if (seed == 0)
      seed = (unsigned int)(long long)(vivariumSecondCount() * 1000.0) ;
   rnd.seed(seed) ;
   race.setup(predefinedrules, NUMPREDEFINEDRULES, rnd, randomfill / 100.0) ;
   while (race.tick()) {
      if (quiet < 1 && race.getGeneration() % 10 == 0)
         cout << "generation " << race.getGeneration() << endl ;
   }
   vector<int> order ;
   race.getstandings(order) ;
   printf("%-18s %-10s %5s %6s %7s %9s %6s\n", "competitor", "rule", "gen",
          "pop", "maxpop", "stability", "score") ;
   for (size_t i=0; i<order.size(); i++) {
      const competitor &c = race.getcompetitor(order[i]) ;
      printf("%-18s %-10s %5d %6d %7d %9d %6d\n", c.name, c.rules.getrule(),
             c.generation, c.population, c.maxpopulation, c.stability, c.score()) ;
   }
   const competitor &w = race.getcompetitor(race.getwinner()) ;
   printf("Winner: %s dominated with %d max population and %d stability points!\n",
          w.name, w.maxpopulation, w.stability) ;
   fflush(stdout) ;
}

const int MAXCMDLENGTH = 2048 ;
struct cmdbase {
   cmdbase(const char *cmdarg, const char *argsarg) {
      verb = cmdarg ;
      args = argsarg ;
      next = list ;
      list = this ;
   }
   const char *verb ;
   const char *args ;
   int iargs[4] ;
   string sarg ;
   virtual void doit() {}
   int parseargs(const char *cmdargs) {
      int iargn = 0 ;
      char sbuf[MAXCMDLENGTH+2] ;
      for (const char *rargs = args; *rargs; rargs++) {
         while (*cmdargs && *cmdargs <= ' ')
            cmdargs++ ;
         if (*cmdargs == 0) {
            lifewarning("Missing needed argument") ;
            return 0 ;
         }
         switch (*rargs) {
         case 'i':
           if (sscanf(cmdargs, "%d", iargs+iargn) != 1) {
             lifewarning("Missing needed integer argument") ;
             return 0 ;
           }
           iargn++ ;
           break ;
         case 's':
           if (sscanf(cmdargs, "%s", sbuf) != 1) {
             lifewarning("Missing needed string argument") ;
             return 0 ;
           }
           sarg = sbuf ;
           break ;
         case 'r':
           {
              // rest of line, for names containing spaces
              int i = 0 ;
              for (i=0; cmdargs[i] && cmdargs[i] != '\n' && cmdargs[i] != '\r'; i++)
                 sbuf[i] = cmdargs[i] ;
              while (i > 0 && sbuf[i-1] <= ' ')
                 i-- ;
              sbuf[i] = 0 ;
              sarg = sbuf ;
              cmdargs += strlen(cmdargs) ;
           }
           break ;
         default:
           lifefatal("Internal error in parseargs") ;
         }
         while (*cmdargs && *cmdargs > ' ')
           cmdargs++ ;
      }
      return 1 ;
   }
   static void docmd(const char *cmdline) {
      for (cmdbase *cmd=list; cmd; cmd = cmd->next)
         if (strncmp(cmdline, cmd->verb, strlen(cmd->verb)) == 0 &&
             cmdline[strlen(cmd->verb)] <= ' ') {
            if (cmd->parseargs(cmdline+strlen(cmd->verb))) {
               cmd->doit() ;
            }
            return ;
         }
      lifewarning("Didn't understand command") ;
   }
   cmdbase *next ;
   virtual ~cmdbase() {}
   static cmdbase *list ;
} ;

cmdbase *cmdbase::list = 0 ;

void report(const char *err) {
   if (err != 0)
      lifewarning(err) ;
}

struct loadcmd : public cmdbase {
   loadcmd() : cmdbase("load", "s") {}
   virtual void doit() {
      report(session->loadpattern(sarg.c_str())) ;
   }
} load_inst ;
struct presetcmd : public cmdbase {
   presetcmd() : cmdbase("preset", "r") {}
   virtual void doit() {
      report(session->loadpreset(sarg.c_str())) ;
   }
} preset_inst ;
struct stepcmd : public cmdbase {
   stepcmd() : cmdbase("step", "i") {}
   virtual void doit() {
      for (int i=0; i<iargs[0]; i++)
         session->tick() ;
      showgeneration() ;
   }
} step_inst ;
struct showcmd : public cmdbase {
   showcmd() : cmdbase("show", "") {}
   virtual void doit() {
      showgeneration() ;
      showgrid() ;
   }
} show_inst ;
struct quitcmd : public cmdbase {
   quitcmd() : cmdbase("quit", "") {}
   virtual void doit() {
      cout << "Buh-bye!" << endl ;
      exit(10) ;
   }
} quit_inst ;
struct setcmd : public cmdbase {
   setcmd() : cmdbase("set", "ii") {}
   virtual void doit() {
      report(session->setcell(iargs[0], iargs[1], 1)) ;
   }
} set_inst ;
struct unsetcmd : public cmdbase {
   unsetcmd() : cmdbase("unset", "ii") {}
   virtual void doit() {
      report(session->setcell(iargs[0], iargs[1], 0)) ;
   }
} unset_inst ;
struct helpcmd : public cmdbase {
   helpcmd() : cmdbase("help", "") {}
   virtual void doit() {
      for (cmdbase *cmd=list; cmd; cmd = cmd->next)
         cout << cmd->verb << " " << cmd->args << endl ;
   }
} help_inst ;
struct getcmd : public cmdbase {
   getcmd() : cmdbase("get", "ii") {}
   virtual void doit() {
     cout << "At " << iargs[0] << "," << iargs[1] << " -> " <<
        session->getgrid().getcell(iargs[0], iargs[1]) << endl ;
   }
} get_inst ;
struct rulecmd : public cmdbase {
   rulecmd() : cmdbase("rule", "r") {}
   virtual void doit() {
      const char *err = applyrule(sarg.c_str()) ;
      if (err)
         lifewarning(err) ;
      else
         cout << "Rule is " << session->getrule() << endl ;
   }
} rule_inst ;
struct randomcmd : public cmdbase {
   randomcmd() : cmdbase("random", "i") {}
   virtual void doit() {
      report(session->randomize(iargs[0] / 100.0)) ;
   }
} random_inst ;
struct metricscmd : public cmdbase {
   metricscmd() : cmdbase("metrics", "") {}
   virtual void doit() {
      showmetrics() ;
   }
} metrics_inst ;
struct describecmd : public cmdbase {
   describecmd() : cmdbase("describe", "") {}
   virtual void doit() {
      showdescription() ;
   }
} describe_inst ;
struct savecmd : public cmdbase {
   savecmd() : cmdbase("save", "s") {}
   virtual void doit() {
      writepat(sarg.c_str(), filename ? filename : "") ;
      cerr << endl ;
   }
} save_inst ;
struct competecmd : public cmdbase {
   competecmd() : cmdbase("compete", "") {}
   virtual void doit() {
      runcompetition() ;
   }
} compete_inst ;

// run script commands from a file, or interactively from stdin for "-"
void runtestscript(const char *testscript) {
   bool interactive = strcmp(testscript, "-") == 0 ;
   FILE *cmdfile = interactive ? stdin : fopen(testscript, "r") ;
   if (cmdfile == 0)
      lifefatal("Cannot open testscript") ;
   linereader reader(cmdfile) ;
   char cmdline[MAXCMDLENGTH + 10] ;
   for (;;) {
      cerr << flush ;
      if (interactive)
         cout << "bvivarium> " ;
      cout << flush ;
      if (reader.fgets(cmdline, MAXCMDLENGTH) == 0)
         break ;
      if (cmdline[0] == 0 || cmdline[0] == '#')
         continue ;
      cmdbase::docmd(cmdline) ;
   }
   if (!interactive)
      reader.close() ;
   exit(0) ;
}

// consume the leading options; argv[0] is left on the last one used
void parseoptions(int &argc, char **&argv) {
   while (argc > 1 && argv[1][0] == '-' && argv[1][1] != 0) {
      argc-- ;
      argv++ ;
      const char *opt = argv[0] ;
      int i = 0 ;
      while (options[i].shortopt && strcmp(opt, options[i].shortopt) != 0 &&
             strcmp(opt, options[i].longopt) != 0)
         i++ ;
      if (options[i].shortopt == 0)
         usage("Bad option given") ;
      if (options[i].opttype == 'b') {
         (*(int *)options[i].data) += 1 ;
         continue ;
      }
      if (argc < 2)
         lifefatal("Bad option argument") ;
      if (options[i].opttype == 'i')
         *(int *)options[i].data = atoi(argv[1]) ;
      else
         *(char **)options[i].data = argv[1] ;
      argc-- ;
      argv++ ;
   }
}

int main(int argc, char *argv[]) {
   cout << "This is bvivarium " STRINGIFY(VERSION) " Copyright 2026 The Vivarium Authors."
        << endl ;
   cout << "-" ;
   for (int i=0; i<argc; i++)
      cout << " " << argv[i] ;
   cout << endl << flush ;
   parseoptions(argc, argv) ;
   if (argc > 2)
      usage("Extra stuff after pattern argument") ;
   if (argc == 2 && presetname)
      usage("Give either a pattern file or a preset, not both") ;
   if (outfilename) {
      if (endswith(outfilename, ".rle")) {
      } else if (endswith(outfilename, ".rle.gz")) {
      } else {
         lifefatal("Output filename must end with .rle or .rle.gz.") ;
      }
   }
   lifeerrors::seterrorhandler(&stderrors_instance) ;

   // preferences first, then command line overrides
   if (prefsname) {
      prefsfile = prefsname ;
      GetPrefs() ;
   }
   if (gridsizeopt >= 0) {
      const char *err = checkgridsize(gridsizeopt) ;
      if (err) lifefatal(err) ;
      initgridsize = racesize = gridsizeopt ;
   }
   if (fillopt >= 0) {
      if (fillopt < 1 || fillopt > 100)
         lifefatal("Fill percentage must be from 1 to 100") ;
      randomfill = fillopt ;
   }
   if (seedopt >= 0)
      randomseed = (unsigned int)seedopt ;
   if (delayopt >= 0)
      tickdelay = delayopt > MAX_DELAY ? MAX_DELAY : delayopt ;
   if (compete && maxgen > 0)
      racegens = maxgen ;
   if (writeprefs) {
      if (!prefsname)
         lifefatal("No preferences file given") ;
      SavePrefs() ;
   }
   timestamp() ;

   if (compete) {
      runcompetition() ;
      exit(0) ;
   }

   session = new lifesession(initgridsize, randomseed, maxpophistory, maxgridhistory) ;
   const char *err = session->setrule(initrule) ;
   if (err) lifefatal(err) ;
   if (argc == 2) {
      filename = argv[1] ;
      err = session->loadpattern(filename) ;
      if (err) lifefatal(err) ;
   } else if (presetname) {
      filename = presetname ;
      err = session->loadpreset(presetname) ;
      if (err) lifefatal(err) ;
   } else {
      err = session->randomize(randomfill / 100.0) ;
      if (err) lifefatal(err) ;
   }
   if (liferule) {
      err = applyrule(liferule) ;
      if (err) lifefatal(err) ;
   }
   if (testscript)
      runtestscript(testscript) ;

   if (maxgen < 0)
      maxgen = racegens ;
   session->start() ;
   for (;;) {
      if (benchmark)
         cout << timestamp() << " " ;
      else
         timestamp() ;
      if (quiet < 2) {
         cout << session->getGeneration() ;
         if (!quiet) {
            int pop = session->getPopulation() ;
            if (benchmark) {
               cout << endl ;
               cout << timestamp() << " pop " << pop << endl ;
            } else {
               cout << ": " << pop << endl ;
            }
         } else
            cout << endl ;
         if (analyze)
            showmetrics() ;
      }
      if (watch) {
         showgrid() ;
         if (tickdelay > 0)
            this_thread::sleep_for(chrono::milliseconds(tickdelay)) ;
      }
      if (session->getGeneration() >= maxgen)
         break ;
      session->tick() ;
   }
   session->pause() ;
   if (analyze && quiet < 2)
      showdescription() ;
   if (outfilename != 0)
      writepat(outfilename, filename ? filename : "") ;
   delete session ;
   exit(0) ;
}
