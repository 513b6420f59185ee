#include <filesystem>
#include <iostream>

#include "errors.hh"
#include "io.hh"
#include "loft.hh"
#include "shape-check.hh"
#include "switches.hh"

static const std::vector<std::string> known_switches = {
  "output", "tolerance", "no-close", "fit", "degree", "cpts", "smoothness", "iterations",
  "ruled", "shell", "no-compatibility", "no-check", "curves", "resolution"
};

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <case_dir> [case_label] [switches]" << std::endl;
    return 1;
  }

  std::string case_dir = argv[1];
  std::string label = caseLabel(case_dir);
  int first_switch = 2;
  if (argc > 2 && std::string(argv[2]).compare(0, 2, "--") != 0) {
    label = argv[2];
    first_switch = 3;
  }

  std::vector<std::string> switches;
  try {
    switches = collectSwitches(argc, argv, first_switch, known_switches);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }

  std::string output;
  parseSwitch<std::string>(switches, "output", &output, defaultOutput(case_dir, label));

  try {
    BladeLoft loft;
    loft.readCase(case_dir);
    auto shape = loft.build(switches);

    std::string curves_filename;
    if (parseSwitch<std::string>(switches, "curves", &curves_filename)) {
      size_t resolution;
      parseSwitch<size_t>(switches, "resolution", &resolution, 100);
      writeCurves(loft.fittedCurves(), curves_filename, resolution);
      std::cout << "Section curves written to " << curves_filename << std::endl;
    }

    if (!parseFlag(switches, "no-check"))
      printShapeReport(checkShape(shape), label);

    writeSTEP(shape, output);
    std::cout << "Exported STEP: " << output << std::endl;
  } catch (const BladeLoftError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::ios_base::failure &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
