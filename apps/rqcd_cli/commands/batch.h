#pragma once

// cmd_batch: analyze a file of requirements, one per line ("-" reads stdin).
// Usage: rqcd_cli batch <file|-> [--format text|json|csv] [analysis options as for analyze]
int cmd_batch(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
