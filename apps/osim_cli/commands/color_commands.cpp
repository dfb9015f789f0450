#include "color_commands.h"

#include "osim/color/color_classifier.h"
#include "osim/color/color_extractor.h"
#include "osim/color/color_json.h"
#include "osim/color/color_metrics.h"
#include "osim/color/combo_scorer.h"
#include "osim/core/errors.h"
#include "osim/imageio/image_loader.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct NoOptions {};

struct ExtractCliConfig {
  int k{3};
  bool verbose{false};
};

std::optional<std::vector<osim::color::Color>> parse_colors(
    const std::vector<std::string>& tokens) {
  std::vector<osim::color::Color> colors;
  for (const auto& token : tokens) {
    auto c = parse_rgb_triplet(token);
    if (!c.has_value()) {
      std::cerr << "Invalid color '" << token << "' (expected r,g,b with channels 0-255)\n";
      return std::nullopt;
    }
    colors.push_back(*c);
  }
  return colors;
}

}  // namespace

int cmd_classify(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = osim::apps::parse_options<NoOptions>(argc, argv, {});
  if (!parsed.ok || parsed.positionals.size() != 3) {
    std::cerr << "Usage: osim_cli classify <r> <g> <b>\n";
    return 1;
  }

  const auto& p = parsed.positionals;
  const auto color = parse_rgb_triplet(p[0] + "," + p[1] + "," + p[2]);
  if (!color.has_value()) {
    std::cerr << "Error: channels must be integers in 0-255\n";
    return 1;
  }

  nlohmann::json out = osim::color::classification_to_json(osim::color::classify_color_type(*color));
  out["rgb"] = osim::color::color_to_json(*color);
  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_distance(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = osim::apps::parse_options<NoOptions>(argc, argv, {});
  if (!parsed.ok || parsed.positionals.size() != 2) {
    std::cerr << "Usage: osim_cli distance <r,g,b> <r,g,b>\n";
    return 1;
  }

  const auto colors = parse_colors(parsed.positionals);
  if (!colors.has_value()) {
    return 1;
  }

  nlohmann::json out;
  out["a"] = osim::color::color_to_json((*colors)[0]);
  out["b"] = osim::color::color_to_json((*colors)[1]);
  out["distance"] = osim::color::color_distance((*colors)[0], (*colors)[1]);
  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_combo(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto parsed = osim::apps::parse_options<NoOptions>(argc, argv, {});
  if (!parsed.ok) {
    std::cerr << "Usage: osim_cli combo <r,g,b> [<r,g,b> ...]\n";
    return 1;
  }

  // An empty list is valid input: it scores 0 with a prompt.
  const auto colors = parse_colors(parsed.positionals);
  if (!colors.has_value()) {
    return 1;
  }

  const auto eval = osim::color::evaluate_color_combo(*colors);
  std::cout << osim::color::combo_evaluation_to_json(eval).dump(2) << "\n";
  return 0;
}

int cmd_extract(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<osim::apps::Option<ExtractCliConfig>> options = {
      {"--k", true, "Number of clusters (default 3)",
       [](ExtractCliConfig& c, const std::string& v) {
         const auto k = parse_positive_int(v);
         if (!k.has_value()) {
           std::cerr << "Invalid --k: " << v << " (expected a positive integer)\n";
           return false;
         }
         c.k = *k;
         return true;
       }},
      {"--verbose", false, "Log progress to stderr",
       [](ExtractCliConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
  const auto parsed = osim::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: osim_cli extract <image> [options]\n";
    osim::apps::print_options(std::cerr, options);
    return 1;
  }
  const auto& config = parsed.config;
  const auto& path = parsed.positionals[0];

  log_verbose(config.verbose, "Decoding " + path);
  auto image = osim::imageio::load_image(path);
  if (!image.has_value()) {
    std::cerr << "Image error ("
              << osim::core::image_error_code_to_string(image.error().code)
              << "): " << image.error().detail << "\n";
    return 1;
  }

  osim::color::ExtractionOptions extraction;
  extraction.k = config.k;
  log_verbose(config.verbose, "Clustering " + std::to_string(image.value().width) + "x" +
                                  std::to_string(image.value().height) + " pixels into " +
                                  std::to_string(config.k) + " clusters");

  auto colors = osim::color::extract_dominant_colors(image.value(), extraction);
  if (!colors.has_value()) {
    std::cerr << "Extraction failed ("
              << osim::core::image_error_code_to_string(colors.error().code)
              << "): " << colors.error().detail << "\n";
    return 1;
  }

  std::cout << osim::color::dominant_colors_to_json(colors.value()).dump(2) << "\n";
  return 0;
}
