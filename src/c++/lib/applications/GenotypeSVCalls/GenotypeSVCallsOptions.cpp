//
// SVPairGenotyper - Read-pair genotyping of structural variant calls
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \author Chris Saunders
///

#include "GenotypeSVCallsOptions.hpp"

#include "blt_util/log.hpp"
#include "common/ProgramUtil.hpp"
#include "options/AlignmentFileOptionsParser.hpp"
#include "options/GenotypeCallOptionsParser.hpp"
#include "options/ReadPairClassifierOptionsParser.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>

typedef std::vector<std::string> args_t;

static void usage(
    std::ostream&                                      os,
    const svgt::Program&                               prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr)
{
  usage(
      os,
      prog,
      visible,
      "genotype SV calls from concordant and discordant read pairs in alignment files",
      " sv-calls control-regions align-file [align-file...] output",
      msg);
}

/// assign positional arguments to all file names not already given as named options
static void assignPositionalArgs(args_t args, GenotypeSVCallsOptions& opt)
{
  auto argIter(args.begin());
  if (opt.svCallsFilename.empty() && (argIter != args.end())) {
    opt.svCallsFilename = *argIter;
    ++argIter;
  }
  if (opt.controlRegionsFilename.empty() && (argIter != args.end())) {
    opt.controlRegionsFilename = *argIter;
    ++argIter;
  }
  args.erase(args.begin(), argIter);

  if (opt.outputFilename.empty() && (!args.empty())) {
    opt.outputFilename = args.back();
    args.pop_back();
  }

  // positional alignment files are placed ahead of any named ones
  opt.alignFileOpt.alignmentFilenames.insert(
      opt.alignFileOpt.alignmentFilenames.begin(), args.begin(), args.end());
}

static bool parseOptions(
    const boost::program_options::variables_map& vm, GenotypeSVCallsOptions& opt, std::string& errorMsg)
{
  if (vm.count("positional-arg")) {
    assignPositionalArgs(vm["positional-arg"].as<args_t>(), opt);
  }

  if (parseOptions(vm, opt.alignFileOpt, errorMsg)) return true;
  if (parseOptions(vm, opt.classifierOpt, errorMsg)) return true;
  if (parseOptions(vm, opt.genotypeOpt, errorMsg)) return true;

  if (checkAndStandardizeRequiredInputFilePath(opt.svCallsFilename, "SV calls", errorMsg)) return true;
  if (checkAndStandardizeRequiredInputFilePath(opt.controlRegionsFilename, "control regions", errorMsg)) {
    return true;
  }

  if (opt.outputFilename.empty()) {
    errorMsg = "Must specify an output file";
    return true;
  }
  if (opt.concordantBamFilename.empty() || opt.discordantBamFilename.empty()) {
    errorMsg = "Concordant and discordant read output file names must not be empty";
    return true;
  }
  if (opt.concordantBamFilename == opt.discordantBamFilename) {
    errorMsg = "Concordant and discordant reads can't be written to the same file";
    return true;
  }
  return false;
}

void parseGenotypeSVCallsOptions(
    const svgt::Program& prog, int argc, char* argv[], GenotypeSVCallsOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");

  // clang-format off
  req.add_options()
  ("sv-calls", po::value(&opt.svCallsFilename),
   "Tab-delimited SV calls with reference coordinates in columns 1-3, SV type in 4, length in 5 and contig coordinates in 6-8 (required)")
  ("control-regions", po::value(&opt.controlRegionsFilename),
   "BED file of control regions with the empirical copy number in column 4 (required)")
  ("output-file", po::value(&opt.outputFilename),
   "Write the genotype report to filename, use '-' for stdout (required)")
  ("concordant-bam", po::value(&opt.concordantBamFilename)->default_value(opt.concordantBamFilename),
   "Write the reads of all concordant pairs to this BAM file")
  ("discordant-bam", po::value(&opt.discordantBamFilename)->default_value(opt.discordantBamFilename),
   "Write the reads of all discordant pairs to this BAM file")
  ("debug-log-file", po::value(&opt.debugLogFilename)->default_value(opt.debugLogFilename),
   "Write read pair classification details to this file")
  ;
  // clang-format on

  po::options_description positional("positional");
  positional.add_options()("positional-arg", po::value<args_t>());

  po::positional_options_description positionalMap;
  positionalMap.add("positional-arg", -1);

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(getOptionsDescription(opt.alignFileOpt))
      .add(getOptionsDescription(opt.classifierOpt))
      .add(getOptionsDescription(opt.genotypeOpt))
      .add(req)
      .add(help);

  po::options_description allOptions("all");
  allOptions.add(visible).add(positional);

  bool              po_parse_fail(false);
  po::variables_map vm;
  try {
    po::store(
        po::command_line_parser(argc, argv)
            .options(allOptions)
            .positional(positionalMap)
            .style(po::command_line_style::unix_style ^ po::command_line_style::allow_short)
            .run(),
        vm);
    po::notify(vm);
  } catch (const po::error& e) {
    log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
    po_parse_fail = true;
  }

  if ((argc <= 1) || (vm.count("help")) || po_parse_fail) {
    usage(log_os, prog, visible);
  }

  std::string errorMsg;
  if (parseOptions(vm, opt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}
