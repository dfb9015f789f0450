#pragma once

// cmd_classify: classify one RGB color.
// Usage: osim_cli classify <r> <g> <b>
int cmd_classify(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_distance: Euclidean RGB distance between two colors.
// Usage: osim_cli distance <r,g,b> <r,g,b>
int cmd_distance(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_combo: score a color combination.
// Usage: osim_cli combo <r,g,b> [<r,g,b> ...]
int cmd_combo(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_extract: dominant colors of an image file.
// Usage: osim_cli extract <image> [--k N] [--verbose]
int cmd_extract(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
