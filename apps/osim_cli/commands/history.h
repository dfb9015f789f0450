#pragma once

// cmd_history: list stored evaluations, newest first.
// Usage: osim_cli history --db <path> [--limit N]   (default limit: 20)
int cmd_history(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
