// Copyright 2024 Global Phasing Ltd.
//
// Fill unset bond lengths and angles in IC tables of residues
// using bond and angle parameters.

#include <stdio.h>
#include <ffparm/gz.hpp>        // for MaybeGzipped
#include <ffparm/logger.hpp>    // for Logger
#include <ffparm/paramres.hpp>  // for ParameterResolver
#include <ffparm/rtf.hpp>       // for read_rtf, format_ic_card
#define FFPARM_PROG ic
#include "options.h"

using namespace ffparm;

namespace {

enum OptionIndex { Residue=4, Recompute };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n  " EXE_NAME " [options] PRM_FILE[...] RTF_FILE"
    "\nFills zero (unset) bond lengths and angles in IC cards"
    "\nand prints the IC tables.\nOptions:"},
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Residue, 0, "r", "residue", Arg::Required,
    "  -r, --residue=NAME  \tProcess only residue NAME." },
  { Recompute, 0, "", "recompute", Arg::None,
    "  --recompute  \tReplace also values that were set in the file." },
  { 0, 0, 0, 0, 0, 0 }
};

void print_ic_table(const ResidueDef& rd) {
  printf("RESI %s\n", rd.name.c_str());
  for (const IcEntry& entry : rd.ic)
    printf("%s\n", format_ic_card(entry).c_str());
}

} // anonymous namespace

int FFPARM_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.require_input_files_as_args(1);
  bool verbose = p.options[Verbose];
  bool preserve = !p.options[Recompute];
  int n = p.nonOptionsCount();
  try {
    ParameterResolver resolver(make_logger(verbose));
    for (int i = 0; i < n - 1; ++i) {
      if (verbose)
        fprintf(stderr, "Reading %s ...\n", p.nonOption(i));
      resolver.load(p.nonOption(i));
    }
    TopologyDefs defs = read_rtf(MaybeGzipped(p.nonOption(n - 1)), resolver.logger);
    if (p.options[Residue]) {
      ResidueDef* rd = defs.find_residue(p.options[Residue].arg);
      if (!rd)
        fail("Residue not found: ", p.options[Residue].arg);
      resolver.fill_internal_coordinates(*rd, preserve);
      print_ic_table(*rd);
    } else {
      resolver.fill_all_internal_coordinates(defs, preserve);
      for (const ResidueDef& rd : defs.residues)
        print_ic_table(rd);
    }
  } catch (std::runtime_error& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  }
  return 0;
}
