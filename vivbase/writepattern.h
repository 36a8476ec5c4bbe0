// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#ifndef WRITEPATTERN_H
#define WRITEPATTERN_H
#include <iosfwd>
struct lifesnapshot;

typedef enum {
   no_compression,      // write uncompressed data
   gzip_compression     // write gzip compressed data
} output_compression;

/*
 *   Write a snapshot as RLE.  The whole grid is written so that
 *   reading it back into a grid of the same size gives the same cells.
 */
const char *writerle(std::ostream &os, const lifesnapshot &snap);

/*
 *   Save a snapshot to a file.
 */
const char *writepattern(const char *filename,
                         const lifesnapshot &snap,
                         output_compression compression);

#endif
