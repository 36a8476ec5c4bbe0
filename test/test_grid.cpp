// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include <cassert>
#include <iostream>
#include "lifegrid.h"

void test_empty_grid() {
    lifegrid g = lifegrid::createempty(10);
    assert(g.size() == 10);
    assert(g.getpopulation() == 0);
    assert(g.isempty());
    for (int row = 0; row < 10; row++)
        for (int col = 0; col < 10; col++)
            assert(g.countneighbors(row, col) == 0);
    std::cout << "PASSED: test_empty_grid\n";
}

void test_full_grid_neighbors() {
    int n = 6;
    lifegrid g(n);
    for (int row = 0; row < n; row++)
        for (int col = 0; col < n; col++)
            assert(g.setcell(row, col, 1) == 0);
    assert(g.getpopulation() == n * n);

    // corners see 3, other edge cells 5, interior cells 8
    assert(g.countneighbors(0, 0) == 3);
    assert(g.countneighbors(0, n-1) == 3);
    assert(g.countneighbors(n-1, 0) == 3);
    assert(g.countneighbors(n-1, n-1) == 3);
    assert(g.countneighbors(0, 2) == 5);
    assert(g.countneighbors(3, n-1) == 5);
    for (int row = 1; row < n-1; row++)
        for (int col = 1; col < n-1; col++)
            assert(g.countneighbors(row, col) == 8);
    std::cout << "PASSED: test_full_grid_neighbors\n";
}

void test_setcell_bounds() {
    lifegrid g(5);
    assert(g.setcell(-1, 0, 1) < 0);
    assert(g.setcell(0, 5, 1) < 0);
    assert(g.setcell(2, 2, 2) < 0);
    assert(g.getpopulation() == 0);
    assert(g.getcell(-1, -1) == 0);
    assert(g.getcell(7, 2) == 0);

    assert(g.setcell(2, 3, 1) == 0);
    assert(g.setcell(2, 3, 1) == 0);      // setting twice doesn't double count
    assert(g.getpopulation() == 1);
    assert(g.getcell(2, 3) == 1);
    assert(g.setcell(2, 3, 0) == 0);
    assert(g.getpopulation() == 0);
    std::cout << "PASSED: test_setcell_bounds\n";
}

void test_nextcell() {
    lifegrid g(8);
    g.setcell(3, 2, 1);
    g.setcell(3, 6, 1);
    assert(g.nextcell(3, 0) == 2);
    assert(g.nextcell(3, 2) == 0);
    assert(g.nextcell(3, 3) == 3);
    assert(g.nextcell(3, 7) == -1);
    assert(g.nextcell(4, 0) == -1);
    std::cout << "PASSED: test_nextcell\n";
}

void test_random_grid() {
    liferandom rnd(42);
    lifegrid g = lifegrid::createrandom(50, rnd);
    // 2500 cells at density 0.3
    assert(g.getpopulation() > 600);
    assert(g.getpopulation() < 900);

    liferandom rnd1(7), rnd2(7);
    assert(lifegrid::createrandom(20, rnd1) == lifegrid::createrandom(20, rnd2));

    lifegrid none = lifegrid::createrandom(20, rnd, 0.0);
    assert(none.isempty());
    std::cout << "PASSED: test_random_grid\n";
}

void test_livecells_and_equality() {
    lifegrid a(4), b(4);
    a.setcell(0, 1, 1);
    a.setcell(3, 0, 1);
    assert(a != b);
    b.setcell(3, 0, 1);
    b.setcell(0, 1, 1);
    assert(a == b);
    assert(a != lifegrid(5));

    vector< pair<int,int> > cells;
    a.getlivecells(cells);
    assert(cells.size() == 2);
    assert(cells[0] == std::make_pair(0, 1));
    assert(cells[1] == std::make_pair(3, 0));

    a.clearall();
    assert(a.isempty());
    assert(a == lifegrid(4));
    std::cout << "PASSED: test_livecells_and_equality\n";
}

void test_checkgridsize() {
    assert(checkgridsize(1) == 0);
    assert(checkgridsize(MAXGRIDSIZE) == 0);
    assert(checkgridsize(0) != 0);
    assert(checkgridsize(-3) != 0);
    assert(checkgridsize(MAXGRIDSIZE + 1) != 0);
    std::cout << "PASSED: test_checkgridsize\n";
}

int main() {
    test_empty_grid();
    test_full_grid_neighbors();
    test_setcell_bounds();
    test_nextcell();
    test_random_grid();
    test_livecells_and_equality();
    test_checkgridsize();
    std::cout << "All grid tests passed\n";
    return 0;
}
