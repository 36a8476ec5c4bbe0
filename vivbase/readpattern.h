// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#ifndef READPATTERN_H
#define READPATTERN_H
class lifealgo ;

/*
 *   Read an RLE or plain text pattern file (optionally gzipped) into
 *   the given algorithm.  The grid keeps its size; the pattern is
 *   centred if it fits, otherwise it is placed at the top left corner
 *   and any cells beyond the grid edges are dropped.  A rule given in
 *   the file replaces the current rules.  On error the algorithm is
 *   left unchanged.
 */
const char *readpattern(const char *filename, lifealgo &imp) ;

/*
 *   As readpattern but the pattern comes from a nul-terminated string.
 */
const char *readpatternstring(const char *text, lifealgo &imp) ;

/*
 *   Get next line from current pattern source.
 */
char *getline(char *line, int maxlinelen) ;

#endif
