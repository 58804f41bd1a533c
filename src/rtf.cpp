// Copyright 2024 Global Phasing Ltd.

#include <ffparm/rtf.hpp>
#include <algorithm>              // for min
#include <cmath>                 // for NAN
#include <cstdio>                // for snprintf
#include <cstring>               // for strlen, strncmp
#include <ffparm/atof.hpp>       // for parse_number
#include <ffparm/cardline.hpp>   // for CardLineReader

namespace ffparm {

namespace {

// Cards are recognized by the first four letters, as in CHARMM.
bool is_card(const std::string& upper_word, const char* keyword) {
  size_t kw_len = std::strlen(keyword);
  size_t n = upper_word.size();
  return n >= std::min<size_t>(kw_len, 4) && n <= kw_len &&
         std::strncmp(keyword, upper_word.c_str(), n) == 0;
}

bool is_ignored_card(const std::string& w) {
  static const char* ignored[] = {
    "DECLARE", "DEFAULT", "AUTOGENERATE", "DONOR", "ACCEPTOR", "DELETE",
    "PATCHING", "LONEPAIR", "ANISOTROPY"
  };
  for (const char* kw : ignored)
    if (is_card(w, kw))
      return true;
  return false;
}

template<size_t N>
void add_atom_tuples(const std::vector<std::string>& words,
                     std::vector<std::array<std::string, N>>& out,
                     const std::string& source, int line_num, const Logger& logger) {
  if ((words.size() - 1) % N != 0)
    logger.err(source, ':', line_num, ": expected groups of ", (int) N,
               " atoms in ", words[0], " card");
  for (size_t i = 1; i + N <= words.size(); i += N) {
    std::array<std::string, N> tuple;
    for (size_t j = 0; j != N; ++j)
      tuple[j] = words[i + j];
    out.push_back(tuple);
  }
}

} // anonymous namespace

std::string format_ic_card(const IcEntry& entry) {
  const std::array<const char*, 5>& names = ic_value_names(entry.improper);
  double v[5];
  for (int i = 0; i != 5; ++i) {
    auto it = entry.values.find(names[i]);
    v[i] = it != entry.values.end() ? it->second : NAN;
  }
  std::string third = entry.improper ? "*" + entry.atoms[2] : entry.atoms[2];
  char buf[256];
  std::snprintf(buf, sizeof(buf), "IC %-5s %-5s %-6s %-5s %7.4f %8.2f %8.2f %8.2f %7.4f",
                entry.atoms[0].c_str(), entry.atoms[1].c_str(), third.c_str(),
                entry.atoms[3].c_str(), v[0], v[1], v[2], v[3], v[4]);
  return buf;
}

TopologyDefs read_rtf_from_stream(AnyStream& line_reader,
                                  const std::string& source,
                                  const Logger& logger) {
  TopologyDefs defs;
  CardLineReader reader(line_reader, source, logger);
  ResidueDef* rd = nullptr;
  int group = -1;
  // parameter block of a stream file (read para card ... END)
  bool in_para_block = false;
  while (reader.next()) {
    const std::vector<std::string>& words = reader.words;
    std::string card = to_upper(words[0]);
    auto bad_line = [&]() {
      logger.err(source, ':', reader.line_num, ": cannot parse: ", reader.line);
    };
    auto need_residue = [&]() {
      if (rd == nullptr)
        logger.err(source, ':', reader.line_num, ": ", words[0],
                   " card before RESI or PRES");
      return rd != nullptr;
    };
    double number;

    if (in_para_block) {
      if (card == "END")
        in_para_block = false;
      continue;
    }

    if (is_card(card, "READ")) {
      if (words.size() > 1 && is_card(to_upper(words[1]), "PARAMETERS"))
        in_para_block = true;
    } else if (defs.version.empty() && rd == nullptr && parse_number(words[0], number)) {
      defs.version = reader.line;
    } else if (card == "END") {
      break;
    } else if (card == "MASS") {
      double mass;
      if (words.size() >= 4 && parse_number(words[3], mass))
        defs.masses[words[2]] = mass;
      else
        bad_line();
    } else if (card == "RESI" || card == "PRES") {
      bool patch = card == "PRES";
      std::vector<ResidueDef>& dest = patch ? defs.patches : defs.residues;
      dest.emplace_back();
      rd = &dest.back();
      rd->name = words.size() > 1 ? words[1] : std::string();
      rd->is_patch = patch;
      if (words.size() > 2 && !parse_number(words[2], rd->total_charge))
        bad_line();
      group = -1;
    } else if (is_card(card, "GROUP")) {
      ++group;
    } else if (card == "ATOM") {
      if (!need_residue())
        continue;
      double charge = 0.;
      if (words.size() < 3 || (words.size() > 3 && !parse_number(words[3], charge))) {
        bad_line();
        continue;
      }
      rd->atoms.push_back(ResidueDef::Atom{words[1], words[2], charge,
                                           group < 0 ? 0 : group});
    } else if (card == "BOND" || is_card(card, "DOUBLE") || is_card(card, "TRIPLE")) {
      if (need_residue())
        add_atom_tuples(words, rd->bonds, source, reader.line_num, logger);
    } else if (is_card(card, "ANGLE") || is_card(card, "THETA")) {
      if (need_residue())
        add_atom_tuples(words, rd->angles, source, reader.line_num, logger);
    } else if (is_card(card, "DIHEDRAL") || card == "PHI") {
      if (need_residue())
        add_atom_tuples(words, rd->dihedrals, source, reader.line_num, logger);
    } else if (card == "IMPR" || card == "IMPH" || is_card(card, "IMPROPER")) {
      if (need_residue())
        add_atom_tuples(words, rd->impropers, source, reader.line_num, logger);
    } else if (card == "CMAP") {
      if (need_residue())
        add_atom_tuples(words, rd->cmaps, source, reader.line_num, logger);
    } else if (card == "IC" || card == "BILD") {
      if (!need_residue())
        continue;
      double v[5];
      if (words.size() < 10) {
        bad_line();
        continue;
      }
      bool ok = true;
      for (int i = 0; i != 5; ++i)
        ok = ok && parse_number(words[5 + i], v[i]);
      if (!ok) {
        bad_line();
        continue;
      }
      IcEntry entry;
      for (int i = 0; i != 4; ++i)
        entry.atoms[i] = words[1 + i];
      if (entry.atoms[2][0] == '*') {
        entry.improper = true;
        entry.atoms[2].erase(0, 1);
      }
      const std::array<const char*, 5>& names = ic_value_names(entry.improper);
      for (int i = 0; i != 5; ++i) {
        // zero bond length or angle means "take it from the parameters"
        bool unset = v[i] == 0. && i != 2;
        entry.values[names[i]] = unset ? NAN : v[i];
      }
      rd->ic.push_back(entry);
    } else if (!is_ignored_card(card)) {
      logger.err(source, ':', reader.line_num, ": unknown card: ", words[0]);
    }
  }
  return defs;
}

} // namespace ffparm
