// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "writepattern.h"
#include "lifesession.h"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cstring>
#include <zlib.h>
#include <streambuf>

const size_t OUTBUFFSIZE = 8192 ;

// RLE output is collected here and written in blocks
static char outbuff[OUTBUFFSIZE];
static size_t outpos;            // next free byte in outbuff
static bool badwrite;            // a block write failed

static void putoutchar(char ch, std::ostream &os) {
   if (badwrite) return;
   if (outpos == OUTBUFFSIZE) {
      if (!os.write(outbuff, outpos)) badwrite = true;
      outpos = 0;
   }
   outbuff[outpos] = ch;
   outpos++;
}

const int WRLE_EOP = -2 ;
const int WRLE_NEWLINE = -1 ;

// write one run, starting a new line first if it would pass column 70
static void AddRun(std::ostream &f,
                   int state,                // in: state of cell to write
                   unsigned int &run,        // in and out
                   unsigned int &linelen)    // ditto
{
   unsigned int i, numlen;
   char numstr[32];

   if ( run > 1 ) {
      sprintf(numstr, "%u", run);
      numlen = (int)strlen(numstr);
   } else {
      numlen = 0;                      // no run count shown if 1
   }
   if ( linelen + numlen + 1 > 70 ) {
      putoutchar('\n', f);
      linelen = 0;
   }
   i = 0;
   while (i < numlen) {
      putoutchar(numstr[i], f);
      i++;
   }
   putoutchar("!$bo"[state+2], f) ;
   linelen += numlen + 1;
   run = 0;                           // reset run count
}

// write each line of text as a comment line starting with prefix
static void writecomment(std::ostream &os, const char *prefix, const std::string &text)
{
   size_t start = 0;
   while (start < text.size()) {
      size_t end = text.find('\n', start);
      if (end == std::string::npos) end = text.size();
      os << prefix << ' ' << text.substr(start, end - start) << '\n';
      start = end + 1;
   }
}

const char *writerle(std::ostream &os, const lifesnapshot &snap)
{
   badwrite = false;
   const lifegrid &g = snap.grid;
   int n = g.size();

   if (!snap.name.empty()) writecomment(os, "#N", snap.name);
   if (!snap.description.empty()) writecomment(os, "#C", snap.description);
   os << "#C generation = " << snap.generation
      << ", population = " << snap.population << '\n';
   os << "#C timestamp = " << snap.timestamp << '\n';

   // do header line
   sprintf(outbuff, "x = %d, y = %d, rule = %s\n", n, n, snap.rules.getrule());
   outpos = strlen(outbuff);

   // trailing dead cells of a row are dropped; '$' runs wait for the
   // next live cell
   unsigned int linelen = 0;
   unsigned int rowsowed = 0;
   for (int row = 0; row < n; row++) {
      int col = 0;
      int skip;
      while (col < n && (skip = g.nextcell(row, col)) >= 0) {
         if (rowsowed > 0)
            AddRun(os, WRLE_NEWLINE, rowsowed, linelen);
         unsigned int deadrun = skip;
         if (deadrun > 0)
            AddRun(os, 0, deadrun, linelen);
         col += skip;
         unsigned int liverun = 0;
         while (col < n && g.getcell(row, col)) {
            liverun++;
            col++;
         }
         AddRun(os, 1, liverun, linelen);
      }
      rowsowed++;
   }

   unsigned int endrun = 1;
   AddRun(os, WRLE_EOP, endrun, linelen);
   putoutchar('\n', os);

   if (outpos > 0 && !badwrite && !os.write(outbuff, outpos))
      badwrite = true;

   if (badwrite)
      return "Failed to write output buffer!";
   else
      return 0;
}

class gzbuf : public std::streambuf
{
public:
   gzbuf() : file(NULL) { }
   ~gzbuf() { close(); }

   gzbuf *open(const char *path)
   {
      if (file) return NULL;
      file = gzopen(path, "wb");
      return file ? this : NULL;
   }

   gzbuf *close()
   {
      if (!file) return NULL;
      int res = gzclose(file);
      file = NULL;
      return res == Z_OK ? this : NULL;
   }

   int overflow(int c=EOF)
   {
      if (c == EOF)
         return c ;
      return gzputc(file, c) ;
   }

   std::streamsize xsputn(const char_type *s, std::streamsize n)
   {
      return gzwrite(file, s, (unsigned int)n);
   }

   int sync()
   {
      return gzflush(file, Z_SYNC_FLUSH) == Z_OK ? 0 : -1;
   }

private:
   gzFile file;
};

const char *writepattern(const char *filename, const lifesnapshot &snap,
                         output_compression compression)
{
   // open output stream
   std::streambuf *streambuf = NULL;
   std::filebuf filebuf;
   gzbuf gzbuf;

   switch (compression)
   {
   default:  /* no output compression */
      streambuf = filebuf.open(filename, std::ios_base::out);
      break;

   case gzip_compression:
      streambuf = gzbuf.open(filename);
      break;
   }
   if (!streambuf)
      return "Can't create pattern file!";
   std::ostream os(streambuf);

   const char *errmsg = writerle(os, snap);

   if (errmsg == NULL && !os.flush())
      errmsg = "Error occurred writing file; maybe disk is full?";
   if (errmsg == NULL && compression == gzip_compression && gzbuf.close() == NULL)
      errmsg = "Error occurred closing compressed file.";

   return errmsg;
}
