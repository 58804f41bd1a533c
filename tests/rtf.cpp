
#include "doctest.h"
#include <cmath>  // for isnan
#include <string>
#include <vector>
#include <ffparm/rtf.hpp>

using namespace ffparm;

namespace {

const char* rtf_text = R"(* Topology for tests
*
   36  1

MASS  1 H      1.00800 H ! polar H
MASS  20 C     12.01100 C

DECL -C
DEFA FIRS NTER LAST CTER
AUTO ANGLES DIHE

RESI ALA          0.00
GROUP
ATOM N    NH1    -0.47  !     |
ATOM HN   H       0.31  !  HN-N
ATOM CA   CT1     0.07
GROUP
ATOM C    C       0.51
ATOM O    O      -0.51
BOND N  HN  N  CA
BOND CA C   C  +N
DOUBLE O C
IMPR N -C CA HN  C CA +N O
IC -C   CA   *N   HN    1.3551 126.4900  180.0000 115.4200  0.9996
IC -C   N    CA   C     1.3551 126.4900  180.0000 114.4400  1.5390
IC N    CA   C    +N    0.0000   0.0000  180.0000   0.0000  0.0000
IC +N   CA   *C   O     0.0000   0.0000  180.0000   0.0000  0.0000

PRES NTER         1.00
ATOM N    NH3    -0.30
DELETE ATOM HN

END
)";

} // anonymous namespace

TEST_CASE("read_rtf_string") {
  TopologyDefs defs = read_rtf_string(rtf_text, "sample");
  CHECK_EQ(defs.version, "36  1");
  CHECK_EQ(defs.masses.size(), 2);
  CHECK_EQ(defs.masses.at("H"), 1.008);
  REQUIRE_EQ(defs.residues.size(), 1);
  REQUIRE_EQ(defs.patches.size(), 1);
  CHECK(defs.patches[0].is_patch);
  CHECK_EQ(defs.patches[0].total_charge, 1.0);
  CHECK(defs.find_residue("NTER") == nullptr);

  const ResidueDef* ala = defs.find_residue("ALA");
  REQUIRE(ala != nullptr);
  CHECK(!ala->is_patch);
  REQUIRE_EQ(ala->atoms.size(), 5);
  CHECK_EQ(ala->get_atom("N").type, "NH1");
  CHECK_EQ(ala->get_atom("N").charge, -0.47);
  CHECK_EQ(ala->get_atom("CA").group, 0);
  CHECK_EQ(ala->get_atom("O").group, 1);
  CHECK(!ala->has_atom("CB"));
  CHECK_THROWS_AS(ala->get_atom("CB"), std::runtime_error);
  CHECK_EQ(ala->bonds.size(), 5);
  REQUIRE_EQ(ala->impropers.size(), 2);
  CHECK_EQ(ala->impropers[1][2], "+N");

  REQUIRE_EQ(ala->ic.size(), 4);
  const IcEntry& ic0 = ala->ic[0];
  CHECK(ic0.improper);
  CHECK_EQ(ic0.atoms[2], "N");
  CHECK_EQ(ic0.str(), "-C CA *N HN");
  CHECK_EQ(ic0.values.at("R(I-K)"), 1.3551);
  CHECK_EQ(ic0.values.at("T(I-K-J)"), 126.49);
  CHECK(ic0.values.count("R(I-J)") == 0);
  const IcEntry& ic2 = ala->ic[2];
  CHECK(!ic2.improper);
  CHECK(std::isnan(ic2.values.at("R(I-J)")));
  CHECK(std::isnan(ic2.values.at("T(J-K-L)")));
  CHECK_EQ(ic2.values.at("Phi"), 180.0);
}

TEST_CASE("read_rtf_string errors") {
  std::string text = "RESI X 0\nATOM A CT1 0\nFOO A\n";
  CHECK_THROWS_AS(read_rtf_string(text, "test"), std::runtime_error);
  std::vector<std::string> messages;
  Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  TopologyDefs defs = read_rtf_string(text + "ATOM B\nBOND A\n", "test", logger);
  REQUIRE_EQ(messages.size(), 3);
  CHECK_EQ(messages[0], "Warning: test:3: unknown card: FOO");
  CHECK(messages[1].find("cannot parse") != std::string::npos);
  CHECK(messages[2].find("groups of 2 atoms") != std::string::npos);
  CHECK_EQ(defs.residues.at(0).atoms.size(), 1);
}

TEST_CASE("read_rtf_string ANGLE and DIHE cards") {
  const char* tip3 = R"(
RESI TIP3         0.000 ! tip3p water model
GROUP
ATOM OH2  OT     -0.834
ATOM H1   HT      0.417
ATOM H2   HT      0.417
BOND OH2 H1 OH2 H2 H1 H2    ! the last bond is needed for shake
ANGLE H1 OH2 H2             ! required
THETA H2 OH2 H1
DIHE H1 OH2 H2 H1
ACCEPTOR OH2
PATCHING FIRS NONE LAST NONE
)";
  TopologyDefs defs = read_rtf_string(tip3, "tip3");
  const ResidueDef& rd = defs.residues.at(0);
  REQUIRE_EQ(rd.angles.size(), 2);
  CHECK_EQ(rd.angles[0][1], "OH2");
  CHECK_EQ(rd.angles[1][0], "H2");
  REQUIRE_EQ(rd.dihedrals.size(), 1);
  CHECK_EQ(rd.dihedrals[0][3], "H1");
}

TEST_CASE("read_rtf_string stream file") {
  const char* text = R"(* ions
*
read rtf card append
* topology
*
36 1
RESI SOD       1.00
ATOM SOD  SOD  1.00
END

read para card flex append
* parameters
*
BONDS
HT   OT   450.0 0.9572
NONBONDED nbxmod  5 atom cdiel fshift vatom vdistance vfswitch -
cutnb 14.0 ctofnb 12.0 ctonnb 10.0 eps 1.0 e14fac 1.0 wmin 1.5
SOD    0.0       -0.0469    1.41075
END
RETURN
)";
  TopologyDefs defs = read_rtf_string(text, "ions.str");
  CHECK_EQ(defs.version, "36 1");
  REQUIRE_EQ(defs.residues.size(), 1);
  CHECK_EQ(defs.residues[0].atoms.size(), 1);

  // parameters first
  std::string para_first = "read param card\nBONDS\nHT OT 450.0 0.9572\nEND\n"
                           "read rtf card\nRESI SOD 1.00\nATOM SOD SOD 1.00\nEND\n";
  defs = read_rtf_string(para_first, "para_first.str");
  REQUIRE_EQ(defs.residues.size(), 1);
  CHECK_EQ(defs.residues[0].name, "SOD");
}

TEST_CASE("format_ic_card") {
  TopologyDefs defs = read_rtf_string(rtf_text, "sample");
  const ResidueDef& ala = *defs.find_residue("ALA");
  std::string improper = format_ic_card(ala.ic[0]);
  std::string proper = format_ic_card(ala.ic[1]);
  CHECK_EQ(improper,
           "IC -C    CA    *N     HN     1.3551   126.49   180.00   115.42  0.9996");
  CHECK_EQ(proper,
           "IC -C    N     CA     C      1.3551   126.49   180.00   114.44  1.5390");
  // columns line up in proper and improper rows
  CHECK_EQ(improper.size(), proper.size());
  CHECK_EQ(improper.substr(22, 5), "HN   ");
  CHECK_EQ(proper.substr(22, 5), "C    ");
  CHECK_EQ(format_ic_card(ala.ic[2]),
           "IC N     CA    C      +N        nan      nan   180.00      nan     nan");
}
