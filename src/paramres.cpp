// Copyright 2024 Global Phasing Ltd.

#include <ffparm/paramres.hpp>
#include <cmath>               // for isnan
#include <stdexcept>           // for invalid_argument
#include <ffparm/gz.hpp>       // for MaybeGzipped
#include <ffparm/util.hpp>     // for in_vector, cat

namespace ffparm {

namespace {

const char* category_of(const Bond*) { return "bonds"; }
const char* category_of(const Angle*) { return "angles"; }
const char* category_of(const Dihedral*) { return "dihedrals"; }
const char* category_of(const Improper*) { return "impropers"; }

void check_four_types(const TypeKey& key, const char* what) {
  if (key.size() != 4)
    throw std::invalid_argument(cat(what, " needs 4 atom types, got ",
                                    key.size(), ": ", key_str(key)));
}

std::string strip_locant(const std::string& name) {
  size_t pos = name.find_first_not_of("+-");
  return pos == std::string::npos ? std::string() : name.substr(pos);
}

template<typename T>
void apply_to_category(const ParameterResolver& resolver, const std::string& entity,
                       const std::string& category, TopoCategory<T>& cat_,
                       std::map<std::string, std::vector<size_t>>& missing) {
  if (!cat_.present) {
    resolver.logger.warn("No ", category, " found in ", entity, '.');
    return;
  }
  std::vector<size_t> no_param = resolver.apply_to_element_list(category, cat_.elements);
  if (!no_param.empty()) {
    resolver.logger.warn(no_param.size(), ' ', category, " failed to find parameters.");
    missing.emplace(category, std::move(no_param));
  }
}

} // anonymous namespace

const std::map<std::string, std::vector<int>>& ParameterResolver::ic_position_index() {
  static const std::map<std::string, std::vector<int>> index = {
    {"R(I-J)",   {0, 1}},
    {"T(I-J-K)", {0, 1, 2}},
    {"T(J-K-L)", {1, 2, 3}},
    {"R(K-L)",   {2, 3}},
    {"T(I-K-J)", {0, 2, 1}},
    {"R(I-K)",   {0, 2}},
  };
  return index;
}

void ParameterResolver::load(const std::string& path) {
  param_dict.update(read_prm(MaybeGzipped(path), logger));
}

const DihedralParam* ParameterResolver::get_dihedral(const TypeKey& key) const {
  check_four_types(key, "dihedral");
  const std::string& B = key[1];
  const std::string& C = key[2];
  // the central bond determines the torsion, outer atoms can be wildcards
  return lookup_with_wildcards(param_dict.dihedrals, {
    key,
    {"X", B, C, "X"},
  });
}

const ImproperParam* ParameterResolver::get_improper(const TypeKey& key) const {
  check_four_types(key, "improper");
  const std::string& A = key[0];
  const std::string& B = key[1];
  const std::string& C = key[2];
  const std::string& D = key[3];
  return lookup_with_wildcards(param_dict.improper, {
    { A,   B,   C,   D },
    { A,  "X", "X",  D },
    {"X",  B,   C,   D },
    {"X",  B,   C,  "X"},
    {"X", "X",  C,   D },
  });
}

template<typename T>
std::vector<size_t>
ParameterResolver::apply_to_element_list(const std::string& category,
                                         std::vector<T>& elements) const {
  if (!in_vector(category, TopoElementContainer::category_names()))
    throw std::invalid_argument("Invalid topology element type: " + category);
  if (category != category_of(static_cast<T*>(nullptr)))
    throw std::invalid_argument(cat("Elements of ", category_of(static_cast<T*>(nullptr)),
                                    " given as ", category));
  std::vector<size_t> no_param;
  for (size_t i = 0; i != elements.size(); ++i) {
    T& element = elements[i];
    if (auto param = get_from_topo_element(element))
      element.param = param;
    else
      no_param.push_back(i);
  }
  return no_param;
}

template std::vector<size_t>
ParameterResolver::apply_to_element_list(const std::string&, std::vector<Bond>&) const;
template std::vector<size_t>
ParameterResolver::apply_to_element_list(const std::string&, std::vector<Angle>&) const;
template std::vector<size_t>
ParameterResolver::apply_to_element_list(const std::string&, std::vector<Dihedral>&) const;
template std::vector<size_t>
ParameterResolver::apply_to_element_list(const std::string&, std::vector<Improper>&) const;

void ParameterResolver::apply(TopoElementContainer& container) const {
  std::map<std::string, std::vector<size_t>> missing;
  const std::string& entity = container.containing_entity;
  apply_to_category(*this, entity, "bonds", container.bonds, missing);
  apply_to_category(*this, entity, "angles", container.angles, missing);
  apply_to_category(*this, entity, "dihedrals", container.dihedrals, missing);
  apply_to_category(*this, entity, "impropers", container.impropers, missing);
  container.missing_param_dict = std::move(missing);
}

void ParameterResolver::fill_internal_coordinates(ResidueDef& rd, bool preserve) const {
  const std::map<std::string, std::vector<int>>& positions = ic_position_index();
  for (IcEntry& entry : rd.ic) {
    std::vector<std::string> atom_types;
    for (const std::string& name : entry.atoms)
      atom_types.push_back(rd.get_atom(strip_locant(name)).type);
    for (auto& item : entry.values) {
      const std::string& ic_type = item.first;
      double& value = item.second;
      // dihedrals are not derived from bond and angle parameters
      if (ic_type == "Phi")
        continue;
      if (!std::isnan(value) && preserve)
        continue;
      auto pos = positions.find(ic_type);
      if (pos == positions.end())
        fail("Unknown IC value ", ic_type, " in ", rd.name, ' ', entry.str());
      TypeKey key;
      for (int i : pos->second)
        key.push_back(atom_types[i]);
      if (key.size() == 2) {
        const BondParam* bond = get_bond(key);
        if (!bond)
          fail("Bond parameter not found: ", key_str(key),
               " (for IC ", entry.str(), " in ", rd.name, ')');
        value = bond->b0;
      } else {
        const AngleParam* angle = get_angle(key);
        if (!angle)
          fail("Angle parameter not found: ", key_str(key),
               " (for IC ", entry.str(), " in ", rd.name, ')');
        value = angle->theta0;
      }
    }
  }
}

std::string ParameterResolver::str() const {
  const ParamTable& t = param_dict;
  return cat("<ParameterDict Bond: ", t.bonds.size(),
             ", Angle: ", t.angles.size(),
             ", Urey Bradley: ", t.urey_bradley.size(),
             ", Dihedral: ", t.dihedrals.size(),
             ", Improper: ", t.improper.size(),
             ", CMAP: ", t.cmap.size(),
             ", Nonbond: ", t.nonbonded.size(),
             ", Nonbond14: ", t.nonbonded14.size(),
             ", NBfix: ", t.nbfix.size(), '>');
}

} // namespace ffparm
