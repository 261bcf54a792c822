#pragma once

// cmd_analyze: analyze one requirement statement.
// Usage: rqcd_cli analyze "<text>" [--config <file>] [--training <file>] [--max-tokens N]
//                         [--ml-threshold X] [--top-k K] [--format text|json]
//                         [--db <path>] [--tokenizer-fallback]
int cmd_analyze(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
