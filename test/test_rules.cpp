// This file is part of Vivarium.
// See docs/License.html for the copyright notice.

#include <cassert>
#include <cstring>
#include <iostream>
#include "liferules.h"

void test_default_rule() {
    liferules r;
    assert(r.isregularlife());
    assert(r.survivalmin() == 2 && r.survivalmax() == 3 && r.birthcount() == 3);
    assert(strcmp(r.getrule(), "S2..3,B3") == 0);
    assert(strcmp(r.getrule(), liferules::DefaultRule()) == 0);
    assert(r.survives(2) && r.survives(3) && !r.survives(1) && !r.survives(4));
    assert(r.isborn(3) && !r.isborn(2));
    std::cout << "PASSED: test_default_rule\n";
}

void test_rule_syntaxes() {
    liferules r;
    assert(r.setrule("S1..2,B3") == 0);
    assert(r == liferules(1, 2, 3));
    assert(r.setrule("3,4,3") == 0);
    assert(r == liferules(3, 4, 3));
    assert(r.setrule("B6/S23") == 0);
    assert(r == liferules(2, 3, 6));
    assert(r.setrule("s22/b3") == 0);
    assert(r == liferules(2, 2, 3));
    assert(r.setrule("S1..1,B1..1") == 0);
    assert(r == liferules(1, 1, 1));
    assert(strcmp(r.getrule(), "S1..1,B1") == 0);
    std::cout << "PASSED: test_rule_syntaxes\n";
}

void test_bad_rules() {
    liferules r(2, 3, 3);
    assert(r.setrule("") != 0);
    assert(r.setrule("S3..2,B3") != 0);
    assert(r.setrule("S2..9,B3") != 0);
    assert(r.setrule("S2..3,B9") != 0);
    assert(r.setrule("S2..3,B3..4") != 0);
    assert(r.setrule("2,3,3x") != 0);
    assert(r.setrule("B36/S23") != 0);
    assert(r.setrule("B3/S13") != 0);
    assert(r.setrule("Life") != 0);
    // a rejected rule leaves the old one in place
    assert(r.isregularlife());
    assert(liferules::checkrules(4, 3, 3) != 0);
    assert(liferules::checkrules(0, 8, 0) == 0);
    std::cout << "PASSED: test_bad_rules\n";
}

void test_predefined_rules() {
    assert(NUMPREDEFINEDRULES == 6);
    const ruleentry *e = findruleentry("highlife");
    assert(e != 0);
    assert(e->getrules() == liferules(2, 3, 6));
    assert(strcmp(e->color, "#06b6d4") == 0);
    e = findruleentry("CONWAY'S CLASSIC");
    assert(e != 0 && e->getrules().isregularlife());
    assert(findruleentry("Seed") == 0);
    assert(findruleentry(0) == 0);
    std::cout << "PASSED: test_predefined_rules\n";
}

int main() {
    test_default_rule();
    test_rule_syntaxes();
    test_bad_rules();
    test_predefined_rules();
    std::cout << "All rule tests passed\n";
    return 0;
}
