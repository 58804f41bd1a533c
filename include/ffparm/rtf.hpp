// Copyright 2024 Global Phasing Ltd.
//
// Residue definitions from CHARMM residue topology files (.rtf).

#ifndef FFPARM_RTF_HPP_
#define FFPARM_RTF_HPP_

#include <array>
#include <map>
#include <string>
#include <vector>
#include "fail.hpp"    // for FFPARM_DLL, fail
#include "input.hpp"   // for AnyStream, FileStream, MemoryStream
#include "logger.hpp"  // for Logger

namespace ffparm {

/// One IC card: a four-atom key and the bond, angle and dihedral values
/// that reconstruct the position of the fourth atom. Unset values are NaN.
struct IcEntry {
  // atom names as written, neighbouring-residue atoms have +/- prefix
  std::array<std::string, 4> atoms;
  // improper form "I J *K L": the first two values are R(I-K), T(I-K-J)
  bool improper = false;
  std::map<std::string, double> values;

  std::string str() const {
    return atoms[0] + " " + atoms[1] + (improper ? " *" : " ") +
           atoms[2] + " " + atoms[3];
  }
};

struct ResidueDef {
  struct Atom {
    std::string name;
    std::string type;
    double charge;
    int group;
  };

  std::string name;
  double total_charge = 0.;
  bool is_patch = false;
  std::vector<Atom> atoms;
  std::vector<std::array<std::string, 2>> bonds;
  // ANGLE and DIHE cards, angles and dihedrals are usually autogenerated
  std::vector<std::array<std::string, 3>> angles;
  std::vector<std::array<std::string, 4>> dihedrals;
  std::vector<std::array<std::string, 4>> impropers;
  std::vector<std::array<std::string, 8>> cmaps;
  std::vector<IcEntry> ic;

  std::vector<Atom>::const_iterator find_atom(const std::string& atom_name) const {
    for (auto it = atoms.begin(); it != atoms.end(); ++it)
      if (it->name == atom_name)
        return it;
    return atoms.end();
  }
  bool has_atom(const std::string& atom_name) const {
    return find_atom(atom_name) != atoms.end();
  }
  const Atom& get_atom(const std::string& atom_name) const {
    auto it = find_atom(atom_name);
    if (it == atoms.end())
      fail("Residue ", name, " has no atom ", atom_name);
    return *it;
  }
};

/// Contents of one or more topology files.
struct TopologyDefs {
  std::string version;
  std::map<std::string, double> masses;  // atom type -> mass
  std::vector<ResidueDef> residues;      // RESI
  std::vector<ResidueDef> patches;       // PRES

  ResidueDef* find_residue(const std::string& name) {
    for (ResidueDef& rd : residues)
      if (rd.name == name)
        return &rd;
    return nullptr;
  }
  const ResidueDef* find_residue(const std::string& name) const {
    return const_cast<TopologyDefs*>(this)->find_residue(name);
  }
};

// IC value names in the order of the IC card
inline const std::array<const char*, 5>& ic_value_names(bool improper) {
  static const std::array<const char*, 5> proper = {{
    "R(I-J)", "T(I-J-K)", "Phi", "T(J-K-L)", "R(K-L)"
  }};
  static const std::array<const char*, 5> impr = {{
    "R(I-K)", "T(I-K-J)", "Phi", "T(J-K-L)", "R(K-L)"
  }};
  return improper ? impr : proper;
}

/// Formats the entry as an IC card; unset values are written as nan.
FFPARM_DLL std::string format_ic_card(const IcEntry& entry);

FFPARM_DLL TopologyDefs read_rtf_from_stream(AnyStream& line_reader,
                                             const std::string& source,
                                             const Logger& logger);

inline TopologyDefs read_rtf_file(const std::string& path,
                                  const Logger& logger={}) {
  FileStream stream(path.c_str(), "rb");
  return read_rtf_from_stream(stream, path, logger);
}

inline TopologyDefs read_rtf_string(const std::string& str,
                                    const std::string& name,
                                    const Logger& logger={}) {
  MemoryStream stream(str.c_str(), str.length());
  return read_rtf_from_stream(stream, name, logger);
}

// for MaybeGzipped and BasicInput
template<typename T>
inline TopologyDefs read_rtf(T&& input, const Logger& logger={}) {
  return read_rtf_from_stream(*input.create_stream(), input.path(), logger);
}

} // namespace ffparm
#endif
