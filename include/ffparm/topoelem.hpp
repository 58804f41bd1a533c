// Copyright 2024 Global Phasing Ltd.
//
// Topology elements (bonds, angles, dihedrals, impropers) of a residue
// and the container that groups them by category.

#ifndef FFPARM_TOPOELEM_HPP_
#define FFPARM_TOPOELEM_HPP_

#include <map>
#include <string>
#include <utility>  // for move
#include <vector>
#include "fail.hpp"     // for FFPARM_DLL
#include "prmfile.hpp"  // for BondParam, AngleParam, ...
#include "rtf.hpp"      // for ResidueDef

namespace ffparm {

// param points to a record in ParameterResolver::param_dict
// (or is null when no parameter was found).
struct Bond {
  std::vector<std::string> atom_names;
  std::vector<std::string> atom_types;
  const BondParam* param = nullptr;
};

struct Angle {
  std::vector<std::string> atom_names;
  std::vector<std::string> atom_types;
  const AngleParam* param = nullptr;
};

struct Dihedral {
  std::vector<std::string> atom_names;
  std::vector<std::string> atom_types;
  const DihedralParam* param = nullptr;
};

struct Improper {
  std::vector<std::string> atom_names;
  std::vector<std::string> atom_types;
  const ImproperParam* param = nullptr;
};

/// A category of elements; absent if it was not generated for the entity.
template<typename T>
struct TopoCategory {
  bool present = false;
  std::vector<T> elements;

  void set(std::vector<T>&& v) {
    elements = std::move(v);
    present = true;
  }
};

struct FFPARM_DLL TopoElementContainer {
  std::string containing_entity;
  TopoCategory<Bond> bonds;
  TopoCategory<Angle> angles;
  TopoCategory<Dihedral> dihedrals;
  TopoCategory<Improper> impropers;
  // category name -> indices of elements for which no parameter was found,
  // set by ParameterResolver::apply()
  std::map<std::string, std::vector<size_t>> missing_param_dict;

  static const std::vector<std::string>& category_names() {
    static const std::vector<std::string> names = {
      "bonds", "angles", "dihedrals", "impropers"
    };
    return names;
  }

  /// Number of elements in the category (0 if absent); throws for unknown names.
  size_t count(const std::string& category) const;

  size_t missing_count() const {
    size_t n = 0;
    for (const auto& item : missing_param_dict)
      n += item.second.size();
    return n;
  }
};

/// Generates elements from bonds of a residue definition. Bonds to atoms of
/// neighbouring residues (+N, -C) are not included.
FFPARM_DLL TopoElementContainer build_topo_elements(const ResidueDef& rd,
                                                    bool with_impropers=true);

} // namespace ffparm
#endif
