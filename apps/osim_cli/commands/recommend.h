#pragma once

// cmd_recommend: colors, pieces and tips for an occasion.
// Usage: osim_cli recommend [--context <type>]   (default: casual)
int cmd_recommend(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_rules: list the rule library with weights and enabled flags.
// Usage: osim_cli rules [--rules-config <file>]
int cmd_rules(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
