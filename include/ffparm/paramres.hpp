// Copyright 2024 Global Phasing Ltd.
//
// ParameterResolver - finds force-field parameters for topology elements
// by atom types, taking into account reversed order and wildcards ("X"),
// and fills missing internal coordinates of residue definitions.

#ifndef FFPARM_PARAMRES_HPP_
#define FFPARM_PARAMRES_HPP_

#include <initializer_list>
#include <map>
#include <string>
#include <vector>
#include "fail.hpp"      // for FFPARM_DLL
#include "logger.hpp"    // for Logger
#include "prmfile.hpp"   // for ParamTable, TypeKey
#include "rtf.hpp"       // for ResidueDef, TopologyDefs
#include "topoelem.hpp"  // for Bond, Angle, Dihedral, Improper

namespace ffparm {

/// Returns table[key] or table[reversed key], or null if neither is present.
template<typename T>
const T* lookup_exact(const std::map<TypeKey, T>& table, const TypeKey& key) {
  auto it = table.find(key);
  if (it == table.end())
    it = table.find(reversed_key(key));
  return it != table.end() ? &it->second : nullptr;
}

/// Tries candidate keys in the given order (the most specific first)
/// and returns the first match.
template<typename T>
const T* lookup_with_wildcards(const std::map<TypeKey, T>& table,
                               std::initializer_list<TypeKey> candidates) {
  for (const TypeKey& key : candidates)
    if (const T* value = lookup_exact(table, key))
      return value;
  return nullptr;
}

struct FFPARM_DLL ParameterResolver {
  ParamTable param_dict;
  Logger logger;

  /// Atom positions within the IC key used by each IC value.
  static const std::map<std::string, std::vector<int>>& ic_position_index();

  ParameterResolver() = default;
  explicit ParameterResolver(Logger logger_) : logger(logger_) {}
  explicit ParameterResolver(const std::string& path, Logger logger_={})
    : logger(logger_) {
    load(path);
  }

  /// Reads a parameter file (can be gzipped) and merges it into param_dict.
  void load(const std::string& path);

  const BondParam* get_bond(const TypeKey& key) const {
    return lookup_exact(param_dict.bonds, key);
  }
  const AngleParam* get_angle(const TypeKey& key) const {
    return lookup_exact(param_dict.angles, key);
  }
  const UreyBradleyParam* get_urey_bradley(const TypeKey& key) const {
    return lookup_exact(param_dict.urey_bradley, key);
  }
  const DihedralParam* get_dihedral(const TypeKey& key) const;
  const ImproperParam* get_improper(const TypeKey& key) const;
  const CmapParam* get_cmap(const TypeKey& key) const {
    auto it = param_dict.cmap.find(key);
    return it != param_dict.cmap.end() ? &it->second : nullptr;
  }
  const NonbondedParam* get_nonbonded(const std::string& type) const {
    return lookup_exact(param_dict.nonbonded, TypeKey(1, type));
  }
  const NonbondedParam* get_nonbonded14(const std::string& type) const {
    return lookup_exact(param_dict.nonbonded14, TypeKey(1, type));
  }
  const NbfixParam* get_nbfix(const TypeKey& key) const {
    return lookup_exact(param_dict.nbfix, key);
  }

  const BondParam* get_from_topo_element(const Bond& bond) const {
    return get_bond(bond.atom_types);
  }
  const AngleParam* get_from_topo_element(const Angle& angle) const {
    return get_angle(angle.atom_types);
  }
  const DihedralParam* get_from_topo_element(const Dihedral& dihedral) const {
    return get_dihedral(dihedral.atom_types);
  }
  const ImproperParam* get_from_topo_element(const Improper& improper) const {
    return get_improper(improper.atom_types);
  }

  /// Sets param of each element of the named category; returns indices
  /// of elements without parameters. Category must match the element type.
  template<typename T>
  std::vector<size_t> apply_to_element_list(const std::string& category,
                                            std::vector<T>& elements) const;

  /// Sets param of all elements in the container and replaces
  /// container.missing_param_dict.
  void apply(TopoElementContainer& container) const;

  /// Fills unset bond lengths and angles in IC tables of the residue.
  /// If preserve is false, all values (except dihedrals) are recalculated.
  void fill_internal_coordinates(ResidueDef& rd, bool preserve=true) const;

  void fill_all_internal_coordinates(TopologyDefs& defs, bool preserve=true) const {
    for (ResidueDef& rd : defs.residues)
      fill_internal_coordinates(rd, preserve);
  }

  std::string str() const;
};

} // namespace ffparm
#endif
