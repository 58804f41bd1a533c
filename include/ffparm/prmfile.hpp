// Copyright 2024 Global Phasing Ltd.
//
// Force-field parameters from CHARMM parameter files (.prm, .str).
// Values are stored in the file units: kcal/mol, Angstrom, degrees.

#ifndef FFPARM_PRMFILE_HPP_
#define FFPARM_PRMFILE_HPP_

#include <map>
#include <string>
#include <vector>
#include "fail.hpp"    // for FFPARM_DLL
#include "input.hpp"   // for AnyStream, FileStream, MemoryStream
#include "logger.hpp"  // for Logger
#include "util.hpp"    // for join_str

namespace ffparm {

/// Ordered atom types of a parameter; "X" is a wildcard.
typedef std::vector<std::string> TypeKey;

inline TypeKey reversed_key(const TypeKey& key) {
  return TypeKey(key.rbegin(), key.rend());
}

inline std::string key_str(const TypeKey& key) {
  return join_str(key, '-');
}

// V(bond) = Kb(b - b0)**2
struct BondParam {
  double kb;
  double b0;
};

// V(angle) = Ktheta(Theta - Theta0)**2
struct AngleParam {
  double ktheta;
  double theta0;
};

// V(Urey-Bradley) = Kub(S - S0)**2
struct UreyBradleyParam {
  double kub;
  double s0;
};

// V(dihedral) = Kchi(1 + cos(n(chi) - delta)), summed over all terms
struct DihedralParam {
  struct Term {
    double kchi;
    int n;
    double delta;
  };
  std::vector<Term> terms;
};

// V(improper) = Kpsi(psi - psi0)**2
struct ImproperParam {
  double kpsi;
  double psi0;
};

struct CmapParam {
  int grid_size = 0;
  std::vector<double> values;  // grid_size x grid_size, row-major

  double at(int i, int j) const { return values.at(i * grid_size + j); }
};

// Lennard-Jones: Eps,i,j[(Rmin,i,j/ri,j)**12 - 2(Rmin,i,j/ri,j)**6]
struct NonbondedParam {
  double epsilon;
  double rmin_half;
};

struct NbfixParam {
  double emin;
  double rmin;
};

/// Parameters grouped by category, each keyed by atom types.
struct FFPARM_DLL ParamTable {
  std::map<TypeKey, BondParam> bonds;
  std::map<TypeKey, AngleParam> angles;
  std::map<TypeKey, UreyBradleyParam> urey_bradley;
  std::map<TypeKey, DihedralParam> dihedrals;
  std::map<TypeKey, ImproperParam> improper;
  std::map<TypeKey, CmapParam> cmap;
  std::map<TypeKey, NonbondedParam> nonbonded;
  std::map<TypeKey, NonbondedParam> nonbonded14;
  std::map<TypeKey, NbfixParam> nbfix;
  std::map<std::string, double> masses;

  static const std::vector<std::string>& category_names() {
    static const std::vector<std::string> names = {
      "bonds", "angles", "urey_bradley", "dihedrals", "improper",
      "cmap", "nonbonded", "nonbonded14", "nbfix"
    };
    return names;
  }

  /// Number of parameters in the category; throws for unknown names.
  size_t count(const std::string& category) const;

  bool empty() const;

  /// Records from other replace records with the same key.
  void update(const ParamTable& other);
};

FFPARM_DLL ParamTable read_prm_from_stream(AnyStream& line_reader,
                                           const std::string& source,
                                           const Logger& logger);

inline ParamTable read_prm_file(const std::string& path,
                                const Logger& logger={}) {
  FileStream stream(path.c_str(), "rb");
  return read_prm_from_stream(stream, path, logger);
}

inline ParamTable read_prm_string(const std::string& str,
                                  const std::string& name,
                                  const Logger& logger={}) {
  MemoryStream stream(str.c_str(), str.length());
  return read_prm_from_stream(stream, name, logger);
}

// for MaybeGzipped and BasicInput
template<typename T>
inline ParamTable read_prm(T&& input, const Logger& logger={}) {
  return read_prm_from_stream(*input.create_stream(), input.path(), logger);
}

} // namespace ffparm
#endif
