#pragma once

// cmd_history: list recently analyzed requirements.
// Usage: rqcd_cli history --db <path> [--limit N] [--format text|json]
int cmd_history(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
