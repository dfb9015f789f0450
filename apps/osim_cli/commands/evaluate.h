#pragma once

// cmd_evaluate: run the outfit rules on a JSON request file.
// Usage: osim_cli evaluate --request <file.json> [--rules-config <file>] [--db <path>]
//                          [--verbose]
// With --db the report is appended to the evaluation history.
int cmd_evaluate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_analyze: extract colors from an image, score them and run the outfit rules.
// Usage: osim_cli analyze <image> [--k N] [--context <type>] [--top <label>]
//                         [--bottom <label>] [--shoes <label>] [--rules-config <file>]
//                         [--db <path>] [--verbose]
int cmd_analyze(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
