// Copyright 2024 Global Phasing Ltd.

#include <ffparm/topoelem.hpp>
#include <array>
#include <initializer_list>
#include <stdexcept>          // for invalid_argument
#include <utility>            // for pair
#include <ffparm/util.hpp>    // for in_vector

namespace ffparm {

namespace {

template<typename T>
T make_element(const ResidueDef& rd, std::initializer_list<int> indices) {
  T element;
  for (int idx : indices) {
    const ResidueDef::Atom& atom = rd.atoms[idx];
    element.atom_names.push_back(atom.name);
    element.atom_types.push_back(atom.type);
  }
  return element;
}

int atom_index(const ResidueDef& rd, const std::string& name) {
  auto it = rd.find_atom(name);
  return it != rd.atoms.end() ? int(it - rd.atoms.begin()) : -1;
}

// indices of atoms listed in a card, or empty if any atom is not in rd
template<size_t N>
std::vector<int> card_indices(const ResidueDef& rd, const std::array<std::string, N>& names) {
  std::vector<int> idx;
  for (const std::string& name : names) {
    int i = atom_index(rd, name);
    if (i < 0)
      return {};
    idx.push_back(i);
  }
  return idx;
}

// adds elements from ANGLE or DIHE cards that were not generated from bonds
template<typename T, size_t N>
void add_explicit(const ResidueDef& rd,
                  const std::vector<std::array<std::string, N>>& cards,
                  std::vector<std::vector<int>>& generated, std::vector<T>& elements) {
  for (const std::array<std::string, N>& card : cards) {
    std::vector<int> idx = card_indices(rd, card);
    if (idx.empty())
      continue;
    std::vector<int> rev(idx.rbegin(), idx.rend());
    if (in_vector(idx, generated) || in_vector(rev, generated))
      continue;
    T element;
    for (int i : idx) {
      element.atom_names.push_back(rd.atoms[i].name);
      element.atom_types.push_back(rd.atoms[i].type);
    }
    elements.push_back(element);
    generated.push_back(idx);
  }
}

} // anonymous namespace

size_t TopoElementContainer::count(const std::string& category) const {
  if (category == "bonds")
    return bonds.elements.size();
  if (category == "angles")
    return angles.elements.size();
  if (category == "dihedrals")
    return dihedrals.elements.size();
  if (category == "impropers")
    return impropers.elements.size();
  throw std::invalid_argument("unknown topology category: " + category);
}

TopoElementContainer build_topo_elements(const ResidueDef& rd, bool with_impropers) {
  TopoElementContainer container;
  container.containing_entity = rd.name;

  // atoms with +/- prefix are not found in rd, so links are skipped here
  std::vector<std::pair<int, int>> bond_pairs;
  std::vector<std::vector<int>> neighbors(rd.atoms.size());
  for (const std::array<std::string, 2>& b : rd.bonds) {
    int i = atom_index(rd, b[0]);
    int j = atom_index(rd, b[1]);
    if (i < 0 || j < 0 || i == j || in_vector(j, neighbors[i]))
      continue;
    bond_pairs.emplace_back(i, j);
    neighbors[i].push_back(j);
    neighbors[j].push_back(i);
  }

  std::vector<Bond> bonds;
  for (const std::pair<int, int>& p : bond_pairs)
    bonds.push_back(make_element<Bond>(rd, {p.first, p.second}));
  container.bonds.set(std::move(bonds));

  std::vector<Angle> angles;
  std::vector<std::vector<int>> angle_idx;
  for (size_t center = 0; center != neighbors.size(); ++center) {
    const std::vector<int>& nb = neighbors[center];
    for (size_t m = 0; m < nb.size(); ++m)
      for (size_t n = m + 1; n < nb.size(); ++n) {
        angles.push_back(make_element<Angle>(rd, {nb[m], (int) center, nb[n]}));
        angle_idx.push_back({nb[m], (int) center, nb[n]});
      }
  }
  add_explicit(rd, rd.angles, angle_idx, angles);
  container.angles.set(std::move(angles));

  std::vector<Dihedral> dihedrals;
  std::vector<std::vector<int>> dihedral_idx;
  for (const std::pair<int, int>& p : bond_pairs)
    for (int a : neighbors[p.first]) {
      if (a == p.second)
        continue;
      for (int d : neighbors[p.second])
        if (d != p.first && d != a) {
          dihedrals.push_back(make_element<Dihedral>(rd, {a, p.first, p.second, d}));
          dihedral_idx.push_back({a, p.first, p.second, d});
        }
    }
  add_explicit(rd, rd.dihedrals, dihedral_idx, dihedrals);
  container.dihedrals.set(std::move(dihedrals));

  if (with_impropers) {
    std::vector<Improper> impropers;
    for (const std::array<std::string, 4>& imp : rd.impropers) {
      std::vector<int> idx = card_indices(rd, imp);
      if (!idx.empty())
        impropers.push_back(make_element<Improper>(rd, {idx[0], idx[1], idx[2], idx[3]}));
    }
    container.impropers.set(std::move(impropers));
  }
  return container;
}

} // namespace ffparm
