// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

// Statistical and structural measures of an evolving pattern.

#ifndef PATTERNSTATS_H
#define PATTERNSTATS_H

#include "lifegrid.h"
#include <vector>

const int POPHISTORYSIZE = 20;      // population samples kept by default
const int GRIDHISTORYSIZE = 6;      // grids kept by default
const int STABILITYSAMPLES = 10;    // samples used for the stability score
const int GROWTHSAMPLES = 5;        // samples used for the growth trend
const double VARIANCESCALE = 100.0; // variance giving a stability of 0
const double GROWTHSCALE = 10.0;    // trend giving a growth of +/-1
const int MAXCLUSTERS = 10;         // cluster count giving a diversity of 1
const int INFLUENCERANGE = 2;       // radius of a live cell's influence
const double INFLUENCEFALLOFF = 3.0;// distance at which influence reaches 0

// A fixed-capacity sequence that drops its oldest entry on overflow.

template <class T> class historyring {
public:
    explicit historyring(int cap) : capacity(cap < 1 ? 1 : cap), head(0) {}

    void push(const T& item) {
        if ((int)items.size() < capacity) {
            items.push_back(item);
        } else {
            items[head] = item;
            head = (head + 1) % capacity;
        }
    }
    // overwrite the newest entry; same as push when empty
    void replaceback(const T& item) {
        if (items.empty()) push(item);
        else items[(head + items.size() - 1) % items.size()] = item;
    }
    void clear() { items.clear(); head = 0; }
    int size() const { return (int)items.size(); }
    int maxsize() const { return capacity; }
    bool empty() const { return items.empty(); }
    // i = 0 is the oldest entry still held
    const T& at(int i) const { return items[(head + i) % items.size()]; }
    const T& back() const { return at(size() - 1); }

private:
    int capacity;
    int head;               // index of the oldest entry once full
    std::vector<T> items;
};

// A square matrix of accumulated influence, one value per cell.

class heatmap {
public:
    heatmap() : hsize(0) {}
    void reset(int n) { hsize = n; values.assign(n * n, 0.0); }
    int size() const { return hsize; }
    double at(int row, int col) const { return values[row * hsize + col]; }
    void add(int row, int col, double v) { values[row * hsize + col] += v; }
    double maxvalue() const;
private:
    int hsize;
    std::vector<double> values;
};

struct patternmetrics {
    patternmetrics() : entropy(0), diversity(0), stability(0), growth(0) {}
    double entropy;         // 0..1
    double diversity;       // 0..1
    double stability;       // 0..1
    double growth;          // -1..1
    heatmap influence;      // same size as the analyzed grid
};

// Binary Shannon entropy of the live/dead proportion; 0 for empty or full grids.
double gridentropy(const lifegrid& g);

// Number of 4-connected clusters of live cells.
int countclusters(const lifegrid& g);

// countclusters normalized to 0..1.
double griddiversity(const lifegrid& g);

// Stability and growth from a population sequence (oldest first).
// Both return 0 when there are too few samples.
double stabilityscore(const std::vector<int>& pops);
double growthscore(const std::vector<int>& pops);

// Spread a decaying contribution from every live cell to the cells
// within INFLUENCERANGE; contributions add up.
void computeinfluence(const lifegrid& g, heatmap& influence);

/**
 *   Keeps a rolling history of one simulation and derives metrics
 *   from it.  Not safe for concurrent writers.
 */
class patternanalyzer {
public:
    patternanalyzer(int maxpops = POPHISTORYSIZE, int maxgrids = GRIDHISTORYSIZE);

    void clear();

    // append g and its population to the history
    void record(const lifegrid& g);

    // replace the newest recorded grid after an edit of the same generation
    void amend(const lifegrid& g);

    // recompute every metric for g against the current history
    const patternmetrics& analyze(const lifegrid& g);
    const patternmetrics& getmetrics() const { return metrics; }

    // recorded populations, oldest first
    void getpopulations(std::vector<int>& pops) const;

    // populations of the last n recorded grids, oldest first;
    // returns false if fewer than n grids have been recorded
    bool getsignature(int n, std::vector<int>& sig) const;

    int numpopulations() const { return pophistory.size(); }
    int numgrids() const { return gridhistory.size(); }
    const lifegrid& getgrid(int i) const { return gridhistory.at(i); }

private:
    historyring<int> pophistory;
    historyring<lifegrid> gridhistory;
    patternmetrics metrics;
};

#endif
