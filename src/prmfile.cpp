// Copyright 2024 Global Phasing Ltd.

#include <ffparm/prmfile.hpp>
#include <cstring>               // for strlen, strncmp
#include <stdexcept>             // for invalid_argument
#include <ffparm/atof.hpp>       // for parse_number
#include <ffparm/cardline.hpp>   // for CardLineReader

namespace ffparm {

namespace {

enum class PrmSection {
  None, Atoms, Bonds, Angles, Dihedrals, Impropers, Cmap, Nonbonded, Nbfix,
  Hbond, Read, End, Return, NotKeyword
};

// A keyword can be abbreviated to four letters, as in CHARMM.
bool is_keyword(const std::string& word, const char* keyword) {
  size_t kw_len = std::strlen(keyword);
  size_t n = word.size();
  size_t min_len = kw_len < 4 ? kw_len : 4;
  return n >= min_len && n <= kw_len && std::strncmp(keyword, word.c_str(), n) == 0;
}

PrmSection keyword_section(const std::string& first_word) {
  std::string w = to_upper(first_word);
  if (is_keyword(w, "ATOMS"))
    return PrmSection::Atoms;
  if (is_keyword(w, "BONDS"))
    return PrmSection::Bonds;
  if (is_keyword(w, "ANGLES") || is_keyword(w, "THETAS"))
    return PrmSection::Angles;
  if (is_keyword(w, "DIHEDRALS") || is_keyword(w, "PHI"))
    return PrmSection::Dihedrals;
  if (is_keyword(w, "IMPROPERS") || is_keyword(w, "IMPHI"))
    return PrmSection::Impropers;
  if (is_keyword(w, "CMAP"))
    return PrmSection::Cmap;
  if (is_keyword(w, "NONBONDED") || is_keyword(w, "NBONDED"))
    return PrmSection::Nonbonded;
  if (is_keyword(w, "NBFIX"))
    return PrmSection::Nbfix;
  if (is_keyword(w, "HBOND"))
    return PrmSection::Hbond;
  if (is_keyword(w, "READ"))
    return PrmSection::Read;
  if (is_keyword(w, "END"))
    return PrmSection::End;
  if (is_keyword(w, "RETURN"))
    return PrmSection::Return;
  return PrmSection::NotKeyword;
}

// options that may follow NONBONDED on separate lines
bool is_nonbonded_option(const std::string& word) {
  static const char* options[] = {
    "CUTNB", "CTOFNB", "CTONNB", "EPS", "E14FAC", "WMIN", "NBXMOD", "ATOM",
    "CDIEL", "FSHIFT", "VDW", "VSWITCH", "VSHIFT", "GROUP", "SWITCH", "SHIFT"
  };
  std::string w = to_upper(word);
  for (const char* opt : options)
    if (w == opt)
      return true;
  return false;
}

bool parse_numbers(const std::vector<std::string>& words, size_t pos,
                   double* out, size_t n) {
  if (words.size() < pos + n)
    return false;
  for (size_t i = 0; i != n; ++i)
    if (!parse_number(words[pos + i], out[i]))
      return false;
  return true;
}

TypeKey key_from_words(const std::vector<std::string>& words, size_t n) {
  return TypeKey(words.begin(), words.begin() + n);
}

template<typename T>
void merge_into(std::map<TypeKey, T>& dst, const std::map<TypeKey, T>& src) {
  for (const auto& item : src)
    dst[item.first] = item.second;
}

} // anonymous namespace

size_t ParamTable::count(const std::string& category) const {
  if (category == "bonds")
    return bonds.size();
  if (category == "angles")
    return angles.size();
  if (category == "urey_bradley")
    return urey_bradley.size();
  if (category == "dihedrals")
    return dihedrals.size();
  if (category == "improper")
    return improper.size();
  if (category == "cmap")
    return cmap.size();
  if (category == "nonbonded")
    return nonbonded.size();
  if (category == "nonbonded14")
    return nonbonded14.size();
  if (category == "nbfix")
    return nbfix.size();
  throw std::invalid_argument("unknown parameter category: " + category);
}

bool ParamTable::empty() const {
  for (const std::string& name : category_names())
    if (count(name) != 0)
      return false;
  return masses.empty();
}

void ParamTable::update(const ParamTable& other) {
  merge_into(bonds, other.bonds);
  merge_into(angles, other.angles);
  merge_into(urey_bradley, other.urey_bradley);
  merge_into(dihedrals, other.dihedrals);
  merge_into(improper, other.improper);
  merge_into(cmap, other.cmap);
  merge_into(nonbonded, other.nonbonded);
  merge_into(nonbonded14, other.nonbonded14);
  merge_into(nbfix, other.nbfix);
  for (const auto& item : other.masses)
    masses[item.first] = item.second;
}

ParamTable read_prm_from_stream(AnyStream& line_reader,
                                const std::string& source,
                                const Logger& logger) {
  ParamTable table;
  CardLineReader reader(line_reader, source, logger);
  PrmSection section = PrmSection::None;
  // in stream files (.str) topology blocks come before parameter blocks:
  // read rtf card ... END, read para card ... END
  bool in_rtf_block = false;
  // CMAP grid values span many lines after the header
  CmapParam* pending_cmap = nullptr;
  std::string pending_cmap_key;
  while (reader.next()) {
    const std::vector<std::string>& words = reader.words;
    auto bad_line = [&]() {
      logger.err(source, ':', reader.line_num, ": cannot parse: ", reader.line);
    };

    if (in_rtf_block) {
      if (keyword_section(words[0]) == PrmSection::End)
        in_rtf_block = false;
      continue;
    }

    if (pending_cmap) {
      for (const std::string& word : words) {
        double value;
        if (!parse_number(word, value)) {
          logger.err(source, ':', reader.line_num, ": CMAP ", pending_cmap_key,
                     " has a non-numeric value: ", word);
          value = 0.;
        }
        pending_cmap->values.push_back(value);
      }
      size_t n = (size_t) pending_cmap->grid_size;
      if (pending_cmap->values.size() >= n * n) {
        if (pending_cmap->values.size() > n * n)
          logger.err(source, ':', reader.line_num, ": too many values in CMAP ",
                     pending_cmap_key);
        pending_cmap->values.resize(n * n);
        pending_cmap = nullptr;
      }
      continue;
    }

    PrmSection keyword = keyword_section(words[0]);
    if (keyword == PrmSection::Return)
      break;
    if (keyword == PrmSection::End) {
      section = PrmSection::None;
      continue;
    }
    if (keyword == PrmSection::Read) {
      std::string what = words.size() > 1 ? to_upper(words[1]) : std::string();
      if (is_keyword(what, "RTF"))
        in_rtf_block = true;
      section = PrmSection::None;
      continue;
    }
    if (keyword != PrmSection::NotKeyword) {
      section = keyword;
      continue;
    }
    // older files have MASS cards without the ATOMS header
    if (section == PrmSection::None && to_upper(words[0]) == "MASS")
      section = PrmSection::Atoms;

    switch (section) {
      case PrmSection::None:
        logger.err(source, ':', reader.line_num, ": text outside of sections: ",
                   reader.line);
        break;
      case PrmSection::Atoms: {
        double mass;
        if (to_upper(words[0]) == "MASS" && parse_numbers(words, 3, &mass, 1))
          table.masses[words[2]] = mass;
        else
          bad_line();
        break;
      }
      case PrmSection::Bonds: {
        double v[2];
        if (parse_numbers(words, 2, v, 2))
          table.bonds[key_from_words(words, 2)] = BondParam{v[0], v[1]};
        else
          bad_line();
        break;
      }
      case PrmSection::Angles: {
        double v[4];
        if (parse_numbers(words, 3, v, 2)) {
          TypeKey key = key_from_words(words, 3);
          table.angles[key] = AngleParam{v[0], v[1]};
          if (words.size() >= 7 && parse_numbers(words, 5, v + 2, 2))
            table.urey_bradley[key] = UreyBradleyParam{v[2], v[3]};
        } else {
          bad_line();
        }
        break;
      }
      case PrmSection::Dihedrals: {
        double v[3];
        if (parse_numbers(words, 4, v, 3)) {
          TypeKey key = key_from_words(words, 4);
          // multiple terms of one dihedral are listed on consecutive lines
          auto it = table.dihedrals.find(reversed_key(key));
          if (it == table.dihedrals.end() || key == it->first)
            it = table.dihedrals.emplace(key, DihedralParam()).first;
          it->second.terms.push_back(DihedralParam::Term{v[0], (int) v[1], v[2]});
        } else {
          bad_line();
        }
        break;
      }
      case PrmSection::Impropers: {
        double v[3];
        if (parse_numbers(words, 4, v, 3))
          table.improper[key_from_words(words, 4)] = ImproperParam{v[0], v[2]};
        else
          bad_line();
        break;
      }
      case PrmSection::Cmap: {
        double grid_size;
        if (parse_numbers(words, 8, &grid_size, 1) && grid_size > 0) {
          TypeKey key = key_from_words(words, 8);
          pending_cmap_key = key_str(key);
          pending_cmap = &table.cmap[key];
          pending_cmap->grid_size = (int) grid_size;
          pending_cmap->values.clear();
        } else {
          bad_line();
        }
        break;
      }
      case PrmSection::Nonbonded: {
        if (is_nonbonded_option(words[0]))
          break;
        double v[6];
        if (parse_numbers(words, 1, v, 3)) {
          TypeKey key(1, words[0]);
          table.nonbonded[key] = NonbondedParam{v[1], v[2]};
          if (words.size() >= 7 && parse_numbers(words, 4, v + 3, 3))
            table.nonbonded14[key] = NonbondedParam{v[4], v[5]};
        } else {
          bad_line();
        }
        break;
      }
      case PrmSection::Nbfix: {
        double v[2];
        if (parse_numbers(words, 2, v, 2))
          table.nbfix[key_from_words(words, 2)] = NbfixParam{v[0], v[1]};
        else
          bad_line();
        break;
      }
      case PrmSection::Hbond:
        break;
      case PrmSection::Read:
      case PrmSection::End:
      case PrmSection::Return:
      case PrmSection::NotKeyword:
        unreachable();
    }
  }
  if (pending_cmap)
    logger.err(source, ": CMAP ", pending_cmap_key, " has only ",
               pending_cmap->values.size(), " of ",
               (size_t) pending_cmap->grid_size * pending_cmap->grid_size,
               " values");
  return table;
}

} // namespace ffparm
