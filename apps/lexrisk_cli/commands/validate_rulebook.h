#pragma once

// cmd_validate_rulebook: load a rulebook (default search when no file is given), print its rule
// count, version and lint findings. Exit 1 on structural errors.
int cmd_validate_rulebook(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
