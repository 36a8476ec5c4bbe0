// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include "patternstats.h"
#include <cmath>

// -----------------------------------------------------------------------------

double heatmap::maxvalue() const
{
    double m = 0.0;
    for (size_t i = 0; i < values.size(); i++)
        if (values[i] > m) m = values[i];
    return m;
}

// -----------------------------------------------------------------------------

double gridentropy(const lifegrid& g)
{
    double total = (double)g.size() * (double)g.size();
    int alive = g.getpopulation();
    if (alive == 0 || alive == (int)total) return 0.0;

    double palive = alive / total;
    double pdead = 1.0 - palive;
    return -(palive * std::log2(palive) + pdead * std::log2(pdead));
}

// -----------------------------------------------------------------------------

int countclusters(const lifegrid& g)
{
    int n = g.size();
    std::vector<unsigned char> filled(n * n, 0);
    std::vector<int> xcoord;
    std::vector<int> ycoord;
    int clusters = 0;

    for (int row = 0; row < n; row++) {
        const unsigned char* cells = g.rowptr(row);
        for (int col = 0; col < n; col++) {
            if (!cells[col] || filled[row * n + col]) continue;

            // found a new cluster so fill all of it using fast scanline
            // algorithm with up/down/left/right adjacency
            // (based on code at http://lodev.org/cgtutor/floodfill.html)
            clusters++;
            xcoord.push_back(col);
            ycoord.push_back(row);
            while (!xcoord.empty()) {
                int x = xcoord.back();
                int y = ycoord.back();
                xcoord.pop_back();
                ycoord.pop_back();

                const unsigned char* line = g.rowptr(y);
                unsigned char* done = &filled[y * n];
                if (done[x]) continue;

                while (x >= 0 && line[x] && !done[x]) x--;
                x++;

                bool above = false;
                bool below = false;
                while (x < n && line[x] && !done[x]) {
                    done[x] = 1;

                    if (y > 0) {
                        bool open = g.rowptr(y-1)[x] && !filled[(y-1) * n + x];
                        if (!above && open) {
                            xcoord.push_back(x);
                            ycoord.push_back(y-1);
                            above = true;
                        } else if (above && !open) {
                            above = false;
                        }
                    }

                    if (y < n - 1) {
                        bool open = g.rowptr(y+1)[x] && !filled[(y+1) * n + x];
                        if (!below && open) {
                            xcoord.push_back(x);
                            ycoord.push_back(y+1);
                            below = true;
                        } else if (below && !open) {
                            below = false;
                        }
                    }

                    x++;
                }
            }
        }
    }
    return clusters;
}

// -----------------------------------------------------------------------------

double griddiversity(const lifegrid& g)
{
    double d = countclusters(g) / (double)MAXCLUSTERS;
    return d > 1.0 ? 1.0 : d;
}

// -----------------------------------------------------------------------------

double stabilityscore(const std::vector<int>& pops)
{
    int count = (int)pops.size();
    if (count < STABILITYSAMPLES) return 0.0;

    int first = count - STABILITYSAMPLES;
    double mean = 0.0;
    for (int i = first; i < count; i++) mean += pops[i];
    mean /= STABILITYSAMPLES;

    double variance = 0.0;
    for (int i = first; i < count; i++) {
        double d = pops[i] - mean;
        variance += d * d;
    }
    variance /= STABILITYSAMPLES;

    double s = 1.0 - variance / VARIANCESCALE;
    return s < 0.0 ? 0.0 : s;
}

// -----------------------------------------------------------------------------

double growthscore(const std::vector<int>& pops)
{
    int count = (int)pops.size();
    if (count < GROWTHSAMPLES) return 0.0;

    double trend = (pops[count-1] - pops[count-GROWTHSAMPLES]) / (double)GROWTHSAMPLES;
    double g = trend / GROWTHSCALE;
    if (g < -1.0) g = -1.0;
    if (g > 1.0) g = 1.0;
    return g;
}

// -----------------------------------------------------------------------------

void computeinfluence(const lifegrid& g, heatmap& influence)
{
    int n = g.size();
    influence.reset(n);
    for (int row = 0; row < n; row++) {
        const unsigned char* cells = g.rowptr(row);
        for (int col = 0; col < n; col++) {
            if (!cells[col]) continue;
            for (int dy = -INFLUENCERANGE; dy <= INFLUENCERANGE; dy++) {
                int y = row + dy;
                if (y < 0 || y >= n) continue;
                for (int dx = -INFLUENCERANGE; dx <= INFLUENCERANGE; dx++) {
                    int x = col + dx;
                    if (x < 0 || x >= n) continue;
                    double distance = std::sqrt((double)(dx * dx + dy * dy));
                    double v = 1.0 - distance / INFLUENCEFALLOFF;
                    if (v > 0.0) influence.add(y, x, v);
                }
            }
        }
    }
}

// -----------------------------------------------------------------------------

patternanalyzer::patternanalyzer(int maxpops, int maxgrids)
    : pophistory(maxpops), gridhistory(maxgrids)
{
}

// -----------------------------------------------------------------------------

void patternanalyzer::clear()
{
    pophistory.clear();
    gridhistory.clear();
    metrics = patternmetrics();
}

// -----------------------------------------------------------------------------

void patternanalyzer::record(const lifegrid& g)
{
    pophistory.push(g.getpopulation());
    gridhistory.push(g);
}

// -----------------------------------------------------------------------------

void patternanalyzer::amend(const lifegrid& g)
{
    pophistory.replaceback(g.getpopulation());
    gridhistory.replaceback(g);
}

// -----------------------------------------------------------------------------

const patternmetrics& patternanalyzer::analyze(const lifegrid& g)
{
    std::vector<int> pops;
    getpopulations(pops);

    metrics.entropy = gridentropy(g);
    metrics.diversity = griddiversity(g);
    metrics.stability = stabilityscore(pops);
    metrics.growth = growthscore(pops);
    computeinfluence(g, metrics.influence);
    return metrics;
}

// -----------------------------------------------------------------------------

void patternanalyzer::getpopulations(std::vector<int>& pops) const
{
    pops.clear();
    for (int i = 0; i < pophistory.size(); i++)
        pops.push_back(pophistory.at(i));
}

// -----------------------------------------------------------------------------

bool patternanalyzer::getsignature(int n, std::vector<int>& sig) const
{
    sig.clear();
    if (gridhistory.size() < n) return false;
    for (int i = gridhistory.size() - n; i < gridhistory.size(); i++)
        sig.push_back(gridhistory.at(i).getpopulation());
    return true;
}
