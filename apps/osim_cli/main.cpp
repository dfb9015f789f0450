#include "osim/core/version.h"

#include "commands/color_commands.h"
#include "commands/evaluate.h"
#include "commands/history.h"
#include "commands/recommend.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "outfit-simulator v" << osim::core::kBuildVersion << "\n"
            << "Usage: osim_cli <command> [args]\n\n"
            << "Commands:\n"
            << "  classify <r> <g> <b>              Classify an RGB color\n"
            << "  distance <r,g,b> <r,g,b>          RGB distance between two colors\n"
            << "  combo <r,g,b> [...]               Score a color combination\n"
            << "  extract <image> [--k N]           Dominant colors of an image\n"
            << "  evaluate --request <file.json>    Run the outfit rules on a request\n"
            << "  analyze <image> [...]             Extract, score and evaluate an image\n"
            << "  recommend [--context <type>]      Suggestions for an occasion\n"
            << "  rules [--rules-config <file>]     List rules with weights\n"
            << "  history --db <path> [--limit N]   Stored evaluations, newest first\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "classify") {
    return cmd_classify(argc, argv);
  }
  if (subcommand == "distance") {
    return cmd_distance(argc, argv);
  }
  if (subcommand == "combo") {
    return cmd_combo(argc, argv);
  }
  if (subcommand == "extract") {
    return cmd_extract(argc, argv);
  }
  if (subcommand == "evaluate") {
    return cmd_evaluate(argc, argv);
  }
  if (subcommand == "analyze") {
    return cmd_analyze(argc, argv);
  }
  if (subcommand == "recommend") {
    return cmd_recommend(argc, argv);
  }
  if (subcommand == "rules") {
    return cmd_rules(argc, argv);
  }
  if (subcommand == "history") {
    return cmd_history(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
