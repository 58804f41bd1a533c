// Copyright 2024 Global Phasing Ltd.
//
// Generate bonds, angles, dihedrals and impropers of residues
// and assign force-field parameters to them.

#include <stdio.h>
#include <ffparm/gz.hpp>        // for MaybeGzipped
#include <ffparm/logger.hpp>    // for Logger
#include <ffparm/paramres.hpp>  // for ParameterResolver
#include <ffparm/rtf.hpp>       // for read_rtf
#include <ffparm/topoelem.hpp>  // for build_topo_elements
#define FFPARM_PROG apply
#include "options.h"

using namespace ffparm;

namespace {

enum OptionIndex { Residue=4, NoImpropers, ListAll };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n  " EXE_NAME " [options] PRM_FILE[...] RTF_FILE"
    "\nAssigns parameters to elements of residues from RTF_FILE"
    "\nand lists elements without parameters.\nOptions:"},
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Residue, 0, "r", "residue", Arg::Required,
    "  -r, --residue=NAME  \tProcess only residue NAME." },
  { NoImpropers, 0, "", "no-impropers", Arg::None,
    "  --no-impropers  \tDo not generate impropers." },
  { ListAll, 0, "a", "all", Arg::None,
    "  -a, --all  \tList all elements with their parameters." },
  { 0, 0, 0, 0, 0, 0 }
};

std::string describe(const std::vector<std::string>& names,
                     const std::vector<std::string>& types) {
  return join_str(names, '-') + " (" + join_str(types, '-') + ")";
}

void print_value(const Bond& e) { printf(" Kb=%g b0=%g", e.param->kb, e.param->b0); }
void print_value(const Angle& e) {
  printf(" Ktheta=%g Theta0=%g", e.param->ktheta, e.param->theta0);
}
void print_value(const Dihedral& e) {
  for (const DihedralParam::Term& t : e.param->terms)
    printf(" [%g %d %g]", t.kchi, t.n, t.delta);
}
void print_value(const Improper& e) {
  printf(" Kpsi=%g psi0=%g", e.param->kpsi, e.param->psi0);
}

template<typename T>
void list_category(const char* category, const TopoCategory<T>& cat_,
                   const std::map<std::string, std::vector<size_t>>& missing,
                   bool list_all) {
  if (list_all) {
    for (const T& e : cat_.elements) {
      printf("  %-10s %s", category, describe(e.atom_names, e.atom_types).c_str());
      if (e.param)
        print_value(e);
      else
        printf(" -");
      printf("\n");
    }
    return;
  }
  auto it = missing.find(category);
  if (it == missing.end())
    return;
  for (size_t idx : it->second) {
    const T& e = cat_.elements[idx];
    printf("  no param for %s %s\n", category,
           describe(e.atom_names, e.atom_types).c_str());
  }
}

void process_residue(const ParameterResolver& resolver, const ResidueDef& rd,
                     bool with_impropers, bool list_all) {
  TopoElementContainer container = build_topo_elements(rd, with_impropers);
  resolver.apply(container);
  printf("%s: %zu bonds, %zu angles, %zu dihedrals, %zu impropers, %zu missing\n",
         rd.name.c_str(), container.count("bonds"), container.count("angles"),
         container.count("dihedrals"), container.count("impropers"),
         container.missing_count());
  const auto& missing = container.missing_param_dict;
  list_category("bonds", container.bonds, missing, list_all);
  list_category("angles", container.angles, missing, list_all);
  list_category("dihedrals", container.dihedrals, missing, list_all);
  list_category("impropers", container.impropers, missing, list_all);
}

} // anonymous namespace

int FFPARM_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.require_input_files_as_args(1);
  bool verbose = p.options[Verbose];
  int n = p.nonOptionsCount();
  try {
    ParameterResolver resolver(make_logger(verbose));
    for (int i = 0; i < n - 1; ++i) {
      if (verbose)
        fprintf(stderr, "Reading %s ...\n", p.nonOption(i));
      resolver.load(p.nonOption(i));
    }
    if (verbose)
      fprintf(stderr, "Reading %s ...\n", p.nonOption(n - 1));
    TopologyDefs defs = read_rtf(MaybeGzipped(p.nonOption(n - 1)), resolver.logger);
    bool with_impropers = !p.options[NoImpropers];
    bool list_all = p.options[ListAll];
    if (p.options[Residue]) {
      const ResidueDef* rd = defs.find_residue(p.options[Residue].arg);
      if (!rd)
        fail("Residue not found: ", p.options[Residue].arg);
      process_residue(resolver, *rd, with_impropers, list_all);
    } else {
      for (const ResidueDef& rd : defs.residues)
        process_residue(resolver, rd, with_impropers, list_all);
    }
  } catch (std::runtime_error& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  } catch (std::invalid_argument& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 2;
  }
  return 0;
}
