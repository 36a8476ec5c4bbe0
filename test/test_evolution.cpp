// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include <cassert>
#include <iostream>
#include "lifealgo.h"

static lifegrid makegrid(int n, const int cells[][2], int count) {
    lifegrid g(n);
    for (int i = 0; i < count; i++)
        g.setcell(cells[i][0], cells[i][1], 1);
    return g;
}

// Block
//   oo
//   oo
void test_block_still_life() {
    const int block[][2] = { {4,4}, {4,5}, {5,4}, {5,5} };
    lifegrid g = makegrid(10, block, 4);
    liferules conway;
    lifegrid next = nextgeneration(g, conway);
    assert(next == g);
    assert(nextgeneration(next, conway) == g);
    std::cout << "PASSED: test_block_still_life\n";
}

// Gen 0:  ooo     Gen 1:  .o.
//                         .o.
//                         .o.
void test_blinker_oscillation() {
    const int blinker[][2] = { {5,4}, {5,5}, {5,6} };
    const int vertical[][2] = { {4,5}, {5,5}, {6,5} };
    lifegrid g = makegrid(11, blinker, 3);
    liferules conway;
    lifegrid gen1 = nextgeneration(g, conway);
    assert(gen1 == makegrid(11, vertical, 3));
    lifegrid gen2 = nextgeneration(gen1, conway);
    assert(gen2 == g);
    std::cout << "PASSED: test_blinker_oscillation\n";
}

void test_input_untouched() {
    const int blinker[][2] = { {1,0}, {1,1}, {1,2} };
    lifegrid g = makegrid(3, blinker, 3);
    lifegrid copy = g;
    lifegrid next = nextgeneration(g, liferules());
    assert(g == copy);
    assert(next != g);
    std::cout << "PASSED: test_input_untouched\n";
}

// .o.
// ..o
// ooo   moves one cell down and one right every 4 generations
void test_glider_translation() {
    const int glider[][2] = { {1,2}, {2,3}, {3,1}, {3,2}, {3,3} };
    const int moved[][2] = { {2,3}, {3,4}, {4,2}, {4,3}, {4,4} };
    lifealgo algo(25);
    for (int i = 0; i < 5; i++)
        assert(algo.setcell(glider[i][0], glider[i][1], 1) == 0);
    for (int i = 0; i < 4; i++)
        algo.step();
    assert(algo.getGeneration() == 4);
    assert(algo.getPopulation() == 5);
    assert(algo.getgrid() == makegrid(25, moved, 5));
    std::cout << "PASSED: test_glider_translation\n";
}

void test_no_wraparound() {
    // a blinker on the edge loses the cells that would lie outside
    const int edge[][2] = { {0,3}, {0,4}, {0,5} };
    lifegrid g = makegrid(9, edge, 3);
    lifegrid next = nextgeneration(g, liferules());
    assert(next.getpopulation() == 2);
    assert(next.getcell(0, 4) == 1);
    assert(next.getcell(1, 4) == 1);
    assert(next.getcell(8, 4) == 0);
    std::cout << "PASSED: test_no_wraparound\n";
}

void test_other_rules() {
    // Replicator {1,1,1}: a lone cell dies but its 8 neighbors are born
    lifegrid g(5);
    g.setcell(2, 2, 1);
    lifegrid next = nextgeneration(g, liferules(1, 1, 1));
    assert(next.getcell(2, 2) == 0);
    assert(next.getpopulation() == 8);

    // Seeds-like {2,2,3}: a block has 3 neighbors per cell so it dies
    const int block[][2] = { {1,1}, {1,2}, {2,1}, {2,2} };
    lifegrid b = makegrid(4, block, 4);
    assert(nextgeneration(b, liferules(2, 2, 3)).isempty());
    std::cout << "PASSED: test_other_rules\n";
}

void test_lifealgo_state() {
    lifealgo algo(6);
    assert(algo.gridsize() == 6);
    assert(algo.setcell(6, 0, 1) < 0);
    assert(algo.setrule("bogus") != 0);
    assert(algo.getrules().isregularlife());
    assert(algo.setrule("S1..1,B1") == 0);
    algo.setcell(3, 3, 1);
    algo.step();
    assert(algo.getPopulation() == 8);
    algo.clearall();
    assert(algo.isEmpty());
    assert(algo.getGeneration() == 0);
    std::cout << "PASSED: test_lifealgo_state\n";
}

int main() {
    test_block_still_life();
    test_blinker_oscillation();
    test_input_untouched();
    test_glider_translation();
    test_no_wraparound();
    test_other_rules();
    test_lifealgo_state();
    std::cout << "All evolution tests passed\n";
    return 0;
}
