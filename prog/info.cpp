// Copyright 2024 Global Phasing Ltd.
//
// Summary of CHARMM parameter files, or lookup of a single parameter.

#include <stdio.h>
#include <ffparm/logger.hpp>    // for Logger
#include <ffparm/paramres.hpp>  // for ParameterResolver
#include <ffparm/util.hpp>      // for split_str_multi
#define FFPARM_PROG info
#include "options.h"

using namespace ffparm;

namespace {

enum OptionIndex { Type=4, Improper, Counts };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n  " EXE_NAME " [options] PRM_FILE[...]"
    "\nReads parameter files (later files override earlier ones)"
    "\nand prints a summary.\nOptions:"},
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Type, 0, "t", "type", Arg::AtomTypes,
    "  -t, --type=A-B-...  \tPrint parameter for atom types A, B, ...;"
    " the number of types selects bond, angle or dihedral." },
  { Improper, 0, "i", "improper", Arg::None,
    "  -i, --improper  \tWith 4 types, look up improper instead of dihedral." },
  { Counts, 0, "c", "counts", Arg::None,
    "  -c, --counts  \tPrint number of parameters in each category." },
  { 0, 0, 0, 0, 0, 0 }
};

void print_dihedral(const DihedralParam& p) {
  for (const DihedralParam::Term& t : p.terms)
    printf("  Kchi=%g n=%d delta=%g\n", t.kchi, t.n, t.delta);
}

// returns false if the parameter was not found
bool print_parameter(const ParameterResolver& resolver, const TypeKey& key,
                     bool improper) {
  std::string name = key_str(key);
  switch (key.size()) {
    case 1:
      if (const NonbondedParam* p = resolver.get_nonbonded(key[0])) {
        printf("nonbonded %s: epsilon=%g Rmin/2=%g\n",
               name.c_str(), p->epsilon, p->rmin_half);
        if (const NonbondedParam* p14 = resolver.get_nonbonded14(key[0]))
          printf("  1-4: epsilon=%g Rmin/2=%g\n", p14->epsilon, p14->rmin_half);
        return true;
      }
      break;
    case 2:
      if (const BondParam* p = resolver.get_bond(key)) {
        printf("bond %s: Kb=%g b0=%g\n", name.c_str(), p->kb, p->b0);
        return true;
      }
      if (const NbfixParam* p = resolver.get_nbfix(key)) {
        printf("nbfix %s: Emin=%g Rmin=%g\n", name.c_str(), p->emin, p->rmin);
        return true;
      }
      break;
    case 3:
      if (const AngleParam* p = resolver.get_angle(key)) {
        printf("angle %s: Ktheta=%g Theta0=%g\n", name.c_str(), p->ktheta, p->theta0);
        if (const UreyBradleyParam* ub = resolver.get_urey_bradley(key))
          printf("  Urey-Bradley: Kub=%g S0=%g\n", ub->kub, ub->s0);
        return true;
      }
      break;
    case 4:
      if (improper) {
        if (const ImproperParam* p = resolver.get_improper(key)) {
          printf("improper %s: Kpsi=%g psi0=%g\n", name.c_str(), p->kpsi, p->psi0);
          return true;
        }
      } else if (const DihedralParam* p = resolver.get_dihedral(key)) {
        printf("dihedral %s: %zu term(s)\n", name.c_str(), p->terms.size());
        print_dihedral(*p);
        return true;
      }
      break;
    case 8:
      if (const CmapParam* p = resolver.get_cmap(key)) {
        printf("cmap %s: %dx%d grid\n", name.c_str(), p->grid_size, p->grid_size);
        return true;
      }
      break;
  }
  printf("%s: no parameter found\n", name.c_str());
  return false;
}

} // anonymous namespace

int FFPARM_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.require_input_files_as_args();
  bool verbose = p.options[Verbose];
  try {
    ParameterResolver resolver(make_logger(verbose));
    for (int i = 0; i < p.nonOptionsCount(); ++i) {
      if (verbose)
        fprintf(stderr, "Reading %s ...\n", p.nonOption(i));
      resolver.load(p.nonOption(i));
    }
    printf("%s\n", resolver.str().c_str());
    if (p.options[Counts])
      for (const std::string& category : ParamTable::category_names())
        printf("  %-14s %zu\n", category.c_str(), resolver.param_dict.count(category));
    if (p.options[Type]) {
      TypeKey key = split_str_multi(p.options[Type].arg, "-");
      if (!print_parameter(resolver, key, p.options[Improper]))
        return 1;
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
