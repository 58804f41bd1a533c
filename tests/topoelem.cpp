
#include "doctest.h"
#include <string>
#include <vector>
#include <ffparm/rtf.hpp>
#include <ffparm/topoelem.hpp>

using namespace ffparm;

namespace {

ResidueDef read_single_residue(const char* text) {
  TopologyDefs defs = read_rtf_string(text, "test");
  return defs.residues.at(0);
}

const char* propanol = R"(
RESI PRL 0.0
ATOM C1 CT3 0.0
ATOM C2 CT2 0.0
ATOM C3 CT2 0.0
ATOM O  OH1 0.0
ATOM H1 HA  0.0
BOND C1 C2  C2 C3  C3 O  C1 H1  O C3  C3 +N
IMPR C2 C1 C3 O  C3 C2 +N O
)";

} // anonymous namespace

TEST_CASE("build_topo_elements") {
  ResidueDef rd = read_single_residue(propanol);
  TopoElementContainer c = build_topo_elements(rd);
  CHECK_EQ(c.containing_entity, "PRL");
  CHECK(c.bonds.present);
  CHECK(c.impropers.present);
  CHECK_EQ(c.count("bonds"), 4);
  CHECK_EQ(c.count("angles"), 3);
  CHECK_EQ(c.count("dihedrals"), 2);
  CHECK_EQ(c.count("impropers"), 1);
  CHECK_THROWS_AS(c.count("cmap"), std::invalid_argument);
  CHECK_EQ(c.missing_count(), 0);

  const Angle& angle = c.angles.elements.at(0);
  CHECK_EQ(angle.atom_names, (std::vector<std::string>{"C2", "C1", "H1"}));
  CHECK_EQ(angle.atom_types, (std::vector<std::string>{"CT2", "CT3", "HA"}));
  CHECK(angle.param == nullptr);
  const Dihedral& dih = c.dihedrals.elements.at(1);
  CHECK_EQ(dih.atom_names, (std::vector<std::string>{"C1", "C2", "C3", "O"}));
  CHECK_EQ(c.impropers.elements.at(0).atom_types,
           (std::vector<std::string>{"CT2", "CT3", "CT2", "OH1"}));

  TopoElementContainer c2 = build_topo_elements(rd, false);
  CHECK(!c2.impropers.present);
  CHECK_EQ(c2.count("impropers"), 0);
}

TEST_CASE("build_topo_elements with ANGLE and DIHE cards") {
  const char* water = R"(
RESI TIP3 0.0
ATOM OH2 OT -0.834
ATOM H1  HT  0.417
ATOM H2  HT  0.417
BOND OH2 H1  OH2 H2
ANGLE H1 OH2 H2
ANGLE H2 H1 OH2
DIHE H1 OH2 H2 X1
)";
  ResidueDef rd = read_single_residue(water);
  TopoElementContainer c = build_topo_elements(rd);
  // H1-OH2-H2 is generated from the bonds, H2-H1-OH2 only from the card
  REQUIRE_EQ(c.count("angles"), 2);
  CHECK_EQ(c.angles.elements[1].atom_names,
           (std::vector<std::string>{"H2", "H1", "OH2"}));
  CHECK_EQ(c.angles.elements[1].atom_types,
           (std::vector<std::string>{"HT", "HT", "OT"}));
  // a card naming an unknown atom is skipped
  CHECK_EQ(c.count("dihedrals"), 0);
}
