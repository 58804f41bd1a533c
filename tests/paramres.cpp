
#include "doctest.h"
#include <cmath>      // for isnan, NAN
#include <stdexcept>  // for invalid_argument
#include <string>
#include <system_error>
#include <vector>
#include <ffparm/paramres.hpp>

using namespace ffparm;

namespace {

template<typename T>
T make_element(std::vector<std::string> names, std::vector<std::string> types) {
  T element;
  element.atom_names = names;
  element.atom_types = types;
  return element;
}

// residue with atoms C1 (type C), N2 (N), C3 (CT1), O4 (O)
ResidueDef make_residue() {
  ResidueDef rd;
  rd.name = "TST";
  rd.atoms.push_back(ResidueDef::Atom{"C1", "C", 0., 0});
  rd.atoms.push_back(ResidueDef::Atom{"N2", "N", 0., 0});
  rd.atoms.push_back(ResidueDef::Atom{"C3", "CT1", 0., 0});
  rd.atoms.push_back(ResidueDef::Atom{"O4", "O", 0., 0});
  IcEntry ic;
  ic.atoms = {{"C1", "N2", "C3", "O4"}};
  ic.values["R(I-J)"] = NAN;
  ic.values["T(I-J-K)"] = 120.0;
  ic.values["Phi"] = 180.0;
  ic.values["T(J-K-L)"] = 110.0;
  ic.values["R(K-L)"] = 1.5;
  rd.ic.push_back(ic);
  return rd;
}

struct MessageCollector {
  std::vector<std::string> messages;
  Logger logger() {
    Logger logger;
    logger.callback = [this](const std::string& s) { messages.push_back(s); };
    return logger;
  }
};

} // anonymous namespace

TEST_CASE("lookup_exact") {
  std::map<TypeKey, BondParam> bonds;
  bonds[{"C", "N"}] = BondParam{300., 1.33};
  const BondParam* p1 = lookup_exact(bonds, {"C", "N"});
  const BondParam* p2 = lookup_exact(bonds, {"N", "C"});
  REQUIRE(p1 != nullptr);
  CHECK(p1 == p2);
  CHECK(lookup_exact(bonds, {"C", "C"}) == nullptr);
  CHECK(lookup_exact(bonds, {"N", "N"}) == nullptr);
}

TEST_CASE("ParameterResolver::get_dihedral") {
  ParameterResolver resolver;
  resolver.param_dict.dihedrals[{"X", "C", "NH1", "X"}].terms.push_back({2.5, 2, 180.});
  const DihedralParam* wild = resolver.get_dihedral({"CT1", "C", "NH1", "CT1"});
  REQUIRE(wild != nullptr);
  CHECK_EQ(wild->terms.at(0).kchi, 2.5);
  // the reversed wildcard key
  CHECK(resolver.get_dihedral({"H", "NH1", "C", "O"}) == wild);
  CHECK(resolver.get_dihedral({"CT1", "C", "CT1", "CT1"}) == nullptr);

  resolver.param_dict.dihedrals[{"CT1", "C", "NH1", "CT1"}].terms.push_back({1.6, 1, 0.});
  const DihedralParam* exact = resolver.get_dihedral({"CT1", "NH1", "C", "CT1"});
  REQUIRE(exact != nullptr);
  CHECK(exact != wild);
  CHECK_EQ(exact->terms.at(0).n, 1);

  CHECK_THROWS_AS(resolver.get_dihedral({"C", "NH1", "X"}), std::invalid_argument);
}

TEST_CASE("ParameterResolver::get_improper") {
  ParameterResolver resolver;
  std::map<TypeKey, ImproperParam>& impr = resolver.param_dict.improper;
  impr[{"X", "X", "C", "O"}] = ImproperParam{5., 0.};
  impr[{"X", "NH1", "C", "O"}] = ImproperParam{4., 0.};
  impr[{"NH1", "X", "X", "O"}] = ImproperParam{3., 0.};
  TypeKey key = {"NH1", "NH1", "C", "O"};
  REQUIRE(resolver.get_improper(key) != nullptr);
  CHECK_EQ(resolver.get_improper(key)->kpsi, 3.);
  impr.erase(TypeKey{"NH1", "X", "X", "O"});
  CHECK_EQ(resolver.get_improper(key)->kpsi, 4.);
  impr.erase(TypeKey{"X", "NH1", "C", "O"});
  CHECK_EQ(resolver.get_improper(key)->kpsi, 5.);
  impr[{"NH1", "NH1", "C", "O"}] = ImproperParam{1., 0.};
  CHECK_EQ(resolver.get_improper(key)->kpsi, 1.);
  impr[{"X", "NH1", "C", "X"}] = ImproperParam{2., 0.};
  CHECK_EQ(resolver.get_improper({"H", "NH1", "C", "H"})->kpsi, 2.);
  CHECK(resolver.get_improper({"H", "NH1", "CT1", "H"}) == nullptr);
}

TEST_CASE("ParameterResolver::apply") {
  MessageCollector collector;
  ParameterResolver resolver(collector.logger());
  resolver.param_dict.bonds[{"C", "N"}] = BondParam{300., 1.33};
  resolver.param_dict.bonds[{"C", "CT1"}] = BondParam{250., 1.49};
  resolver.param_dict.angles[{"C", "N", "CT1"}] = AngleParam{50., 120.};

  TopoElementContainer c;
  c.containing_entity = "TST";
  c.bonds.set({make_element<Bond>({"C1", "N2"}, {"C", "N"}),
               make_element<Bond>({"C3", "C1"}, {"CT1", "C"})});
  c.angles.set({make_element<Angle>({"C3", "N2", "C1"}, {"CT1", "N", "C"}),
                make_element<Angle>({"N2", "C1", "O4"}, {"N", "C", "O"})});
  resolver.apply(c);

  CHECK(c.bonds.elements[0].param == resolver.get_bond({"N", "C"}));
  CHECK(c.bonds.elements[1].param != nullptr);
  CHECK(c.angles.elements[0].param == resolver.get_angle({"C", "N", "CT1"}));
  CHECK(c.angles.elements[1].param == nullptr);
  REQUIRE_EQ(c.missing_param_dict.size(), 1);
  CHECK_EQ(c.missing_param_dict.at("angles"), std::vector<size_t>{1});
  CHECK_EQ(c.missing_count(), 1);

  REQUIRE_EQ(collector.messages.size(), 3);
  CHECK_EQ(collector.messages[0], "Warning: 1 angles failed to find parameters.");
  CHECK_EQ(collector.messages[1], "Warning: No dihedrals found in TST.");
  CHECK_EQ(collector.messages[2], "Warning: No impropers found in TST.");

  // the second call replaces missing_param_dict
  resolver.param_dict.angles[{"N", "C", "O"}] = AngleParam{50., 122.};
  resolver.apply(c);
  CHECK(c.missing_param_dict.empty());
  CHECK(c.angles.elements[1].param == resolver.get_angle({"O", "C", "N"}));
}

TEST_CASE("ParameterResolver::apply_to_element_list") {
  ParameterResolver resolver;
  std::vector<Bond> bonds = {make_element<Bond>({"A", "B"}, {"C", "N"})};
  std::vector<size_t> missing = resolver.apply_to_element_list("bonds", bonds);
  CHECK_EQ(missing, std::vector<size_t>{0});
  CHECK_THROWS_AS(resolver.apply_to_element_list("angles", bonds),
                  std::invalid_argument);
  CHECK_THROWS_AS(resolver.apply_to_element_list("cmap", bonds),
                  std::invalid_argument);
}

TEST_CASE("ParameterResolver::fill_internal_coordinates") {
  ParameterResolver resolver;
  resolver.param_dict.bonds[{"C", "N"}] = BondParam{300., 1.33};

  ResidueDef rd = make_residue();
  resolver.fill_internal_coordinates(rd);
  const std::map<std::string, double>& values = rd.ic[0].values;
  CHECK_EQ(values.at("R(I-J)"), 1.33);
  CHECK_EQ(values.at("T(I-J-K)"), 120.0);
  CHECK_EQ(values.at("R(K-L)"), 1.5);

  // the same result with the reversed key in the table
  ParameterResolver resolver2;
  resolver2.param_dict.bonds[{"N", "C"}] = BondParam{300., 1.33};
  ResidueDef rd2 = make_residue();
  resolver2.fill_internal_coordinates(rd2);
  CHECK_EQ(rd2.ic[0].values.at("R(I-J)"), 1.33);

  // preserve=false needs parameters for all values except Phi
  CHECK_THROWS_AS(resolver.fill_internal_coordinates(rd, false), std::runtime_error);
  resolver.param_dict.angles[{"C", "N", "CT1"}] = AngleParam{50., 121.};
  resolver.param_dict.angles[{"O", "CT1", "N"}] = AngleParam{50., 109.5};
  resolver.param_dict.bonds[{"CT1", "O"}] = BondParam{400., 1.23};
  resolver.fill_internal_coordinates(rd, false);
  CHECK_EQ(values.at("R(I-J)"), 1.33);
  CHECK_EQ(values.at("T(I-J-K)"), 121.0);
  CHECK_EQ(values.at("Phi"), 180.0);
  CHECK_EQ(values.at("T(J-K-L)"), 109.5);
  CHECK_EQ(values.at("R(K-L)"), 1.23);
}

TEST_CASE("ParameterResolver::fill_internal_coordinates improper IC") {
  ParameterResolver resolver;
  resolver.param_dict.bonds[{"C", "CT1"}] = BondParam{250., 1.49};
  resolver.param_dict.angles[{"C", "CT1", "N"}] = AngleParam{50., 111.};
  TopologyDefs defs;
  defs.residues.push_back(make_residue());
  IcEntry& ic = defs.residues[0].ic[0];
  ic.improper = true;
  ic.atoms[0] = "-C1";
  ic.values.clear();
  ic.values["R(I-K)"] = NAN;
  ic.values["T(I-K-J)"] = NAN;
  ic.values["Phi"] = -120.0;
  ic.values["T(J-K-L)"] = 108.0;
  ic.values["R(K-L)"] = 1.2;
  resolver.fill_all_internal_coordinates(defs);
  CHECK_EQ(ic.values.at("R(I-K)"), 1.49);
  CHECK_EQ(ic.values.at("T(I-K-J)"), 111.0);
  CHECK_EQ(ic.values.at("Phi"), -120.0);
}

TEST_CASE("ParameterResolver::fill_internal_coordinates missing parameter") {
  ParameterResolver resolver;
  ResidueDef rd = make_residue();
  try {
    resolver.fill_internal_coordinates(rd);
    FAIL("expected exception");
  } catch (std::runtime_error& e) {
    CHECK_EQ(std::string(e.what()),
             "Bond parameter not found: C-N (for IC C1 N2 C3 O4 in TST)");
  }
  CHECK(std::isnan(rd.ic[0].values.at("R(I-J)")));
}

TEST_CASE("ParameterResolver::load") {
  ParameterResolver resolver;
  CHECK(resolver.param_dict.empty());
  CHECK_THROWS_AS(resolver.load("/nonexistent/dir/par.prm"), std::system_error);
  CHECK_EQ(resolver.str(), "<ParameterDict Bond: 0, Angle: 0, Urey Bradley: 0, "
                           "Dihedral: 0, Improper: 0, CMAP: 0, Nonbond: 0, "
                           "Nonbond14: 0, NBfix: 0>");
  resolver.param_dict.update(read_prm_string("BONDS\nC N 300 1.33\n", "test"));
  CHECK_EQ(resolver.str().substr(0, 24), "<ParameterDict Bond: 1, ");
}
