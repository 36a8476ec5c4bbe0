// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include <cassert>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include "lifealgo.h"
#include "lifesession.h"
#include "readpattern.h"
#include "writepattern.h"

void test_read_rle_centred() {
    lifealgo algo(9);
    algo.setGeneration(12);
    const char *rle =
        "#N Glider\n"
        "#C A comment line\n"
        "x = 3, y = 3, rule = B3/S23\n"
        "bo$2bo$3o!\n";
    assert(readpatternstring(rle, algo) == 0);
    assert(algo.getPopulation() == 5);
    assert(algo.getGeneration() == 0);
    // 3x3 pattern in a 9x9 grid starts at row 3, col 3
    assert(algo.getcell(3, 4) == 1);
    assert(algo.getcell(4, 5) == 1);
    assert(algo.getcell(5, 3) == 1);
    assert(algo.getcell(5, 4) == 1);
    assert(algo.getcell(5, 5) == 1);
    assert(algo.getrules().isregularlife());
    std::cout << "PASSED: test_read_rle_centred\n";
}

void test_read_rule_replaces() {
    lifealgo algo(5);
    assert(readpatternstring("x = 1, y = 1, rule = B6/S23\no!\n", algo) == 0);
    assert(algo.getrules() == liferules(2, 3, 6));
    assert(algo.getcell(2, 2) == 1);

    // no rule in the file keeps the current rules
    assert(readpatternstring("x = 2, y = 1\n2o!\n", algo) == 0);
    assert(algo.getrules() == liferules(2, 3, 6));
    assert(algo.getPopulation() == 2);
    std::cout << "PASSED: test_read_rule_replaces\n";
}

void test_read_errors_leave_state() {
    lifealgo algo(6);
    algo.setcell(1, 1, 1);
    assert(readpatternstring("x = 1, y = 1, rule = B36/S23\no!\n", algo) != 0);
    assert(readpatternstring("x = 2, y = 1\noB!\n", algo) != 0);
    assert(readpatternstring(0, algo) != 0);
    assert(readpattern("no-such-dir/no-such-file.rle", algo) != 0);
    assert(algo.getPopulation() == 1);
    assert(algo.getcell(1, 1) == 1);
    assert(algo.getrules().isregularlife());
    std::cout << "PASSED: test_read_errors_leave_state\n";
}

void test_read_text() {
    lifealgo algo(7);
    assert(readpatternstring("!Name: Glider\r\n.O.\r\n..O\r\nOOO\r\n", algo) == 0);
    assert(algo.getPopulation() == 5);
    // 3x3 in 7x7 starts at 2,2
    assert(algo.getcell(2, 3) == 1);
    assert(algo.getcell(3, 4) == 1);
    assert(algo.getcell(4, 2) == 1);
    assert(algo.getcell(4, 3) == 1);
    assert(algo.getcell(4, 4) == 1);
    std::cout << "PASSED: test_read_text\n";
}

void test_read_headerless_rle() {
    lifealgo algo(6);
    assert(readpatternstring("2o$2o!", algo) == 0);
    assert(algo.getPopulation() == 4);
    assert(algo.getcell(2, 2) && algo.getcell(2, 3));
    assert(algo.getcell(3, 2) && algo.getcell(3, 3));
    std::cout << "PASSED: test_read_headerless_rle\n";
}

void test_read_clips_large_pattern() {
    lifealgo algo(10);
    assert(readpatternstring("x = 12, y = 2\n12o$o!\n", algo) == 0);
    // too big to centre so it goes in the top left corner
    assert(algo.getPopulation() == 11);
    assert(algo.getcell(0, 0) == 1);
    assert(algo.getcell(0, 9) == 1);
    assert(algo.getcell(1, 0) == 1);
    std::cout << "PASSED: test_read_clips_large_pattern\n";
}

void test_read_huge_runs() {
    lifealgo algo(10);
    algo.setcell(4, 4, 1);
    // counts too big for any grid are rejected before anything is built
    assert(readpatternstring("99999999999b3o!\n", algo) != 0);
    assert(readpatternstring("300000000o!\n", algo) != 0);
    assert(readpatternstring("x = 3, y = 3\n2000$o!\n", algo) != 0);
    assert(algo.getPopulation() == 1);
    assert(algo.getcell(4, 4) == 1);

    // cells pushed past the largest grid are dropped, the rest are kept
    assert(readpatternstring("o999b3o!\n", algo) == 0);
    assert(algo.getPopulation() == 1);
    assert(algo.getcell(0, 0) == 1);
    assert(readpatternstring("1000o$o!\n", algo) == 0);
    assert(algo.getPopulation() == 11);
    assert(algo.getcell(1, 0) == 1);
    std::cout << "PASSED: test_read_huge_runs\n";
}

void test_read_empty_source() {
    lifealgo first(5);
    assert(readpatternstring("x = 3, y = 1\n3o!\n", first) == 0);
    assert(first.getPopulation() == 3);

    // nothing left over from the previous read may come back
    lifealgo algo(5);
    algo.setcell(0, 0, 1);
    assert(readpatternstring("", algo) != 0);
    assert(readpatternstring("\n\r\n\n", algo) != 0);
    assert(algo.getPopulation() == 1);
    assert(algo.getcell(0, 0) == 1);

    const char *path = "vivarium_test_empty.rle";
    FILE *f = fopen(path, "wb");
    assert(f != 0);
    fclose(f);
    assert(readpattern(path, algo) != 0);
    assert(algo.getPopulation() == 1);
    remove(path);
    std::cout << "PASSED: test_read_empty_source\n";
}

static lifesnapshot glidersnapshot() {
    lifesnapshot snap;
    snap.name = "Glider";
    snap.description = "first line\nsecond line";
    snap.grid = lifegrid(8);
    snap.grid.setcell(1, 2, 1);
    snap.grid.setcell(2, 3, 1);
    snap.grid.setcell(3, 1, 1);
    snap.grid.setcell(3, 2, 1);
    snap.grid.setcell(3, 3, 1);
    snap.gridsize = 8;
    snap.generation = 7;
    snap.population = 5;
    snap.timestamp = 1700000000000LL;
    return snap;
}

void test_write_rle() {
    lifesnapshot snap = glidersnapshot();
    std::ostringstream os;
    assert(writerle(os, snap) == 0);
    std::string out = os.str();
    assert(out.find("#N Glider\n") != std::string::npos);
    assert(out.find("#C first line\n#C second line\n") != std::string::npos);
    assert(out.find("#C generation = 7, population = 5\n") != std::string::npos);
    assert(out.find("#C timestamp = 1700000000000\n") != std::string::npos);
    assert(out.find("x = 8, y = 8, rule = S2..3,B3\n") != std::string::npos);
    assert(out.find("$2bo$3bo$b3o!\n") != std::string::npos);

    lifealgo algo(8);
    assert(readpatternstring(out.c_str(), algo) == 0);
    assert(algo.getgrid() == snap.grid);

    lifesnapshot empty;
    empty.grid = lifegrid(4);
    empty.gridsize = 4;
    empty.rules = liferules(1, 2, 3);
    std::ostringstream eos;
    assert(writerle(eos, empty) == 0);
    assert(eos.str().find("x = 4, y = 4, rule = S1..2,B3\n!\n") != std::string::npos);
    lifealgo ealgo(4);
    ealgo.setcell(0, 0, 1);
    assert(readpatternstring(eos.str().c_str(), ealgo) == 0);
    assert(ealgo.isEmpty());
    assert(ealgo.getrules() == liferules(1, 2, 3));
    std::cout << "PASSED: test_write_rle\n";
}

void test_write_files() {
    lifesnapshot snap = glidersnapshot();
    snap.rules = liferules(2, 3, 6);

    const char *plain = "vivarium_test_pattern.rle";
    const char *packed = "vivarium_test_pattern.rle.gz";
    assert(writepattern(plain, snap, no_compression) == 0);
    assert(writepattern(packed, snap, gzip_compression) == 0);

    lifealgo a(8), b(8);
    assert(readpattern(plain, a) == 0);
    assert(readpattern(packed, b) == 0);
    assert(a.getgrid() == snap.grid);
    assert(b.getgrid() == snap.grid);
    assert(b.getrules() == liferules(2, 3, 6));

    // the compressed file really is gzip data
    FILE *f = fopen(packed, "rb");
    assert(f != 0);
    int c1 = fgetc(f);
    int c2 = fgetc(f);
    fclose(f);
    assert(c1 == 0x1f && c2 == 0x8b);

    remove(plain);
    remove(packed);
    assert(writepattern("no-such-dir/out.rle", snap, no_compression) != 0);
    std::cout << "PASSED: test_write_files\n";
}

int main() {
    test_read_rle_centred();
    test_read_rule_replaces();
    test_read_errors_leave_state();
    test_read_text();
    test_read_headerless_rle();
    test_read_clips_large_pattern();
    test_read_huge_runs();
    test_read_empty_source();
    test_write_rle();
    test_write_files();
    std::cout << "All pattern file tests passed\n";
    return 0;
}
