// ============================================================================
// main_cli.h - Command-Line Interface
// ============================================================================
// Scriptable access to listing, chain tracing, FAT verification and
// deleted-file recovery on a FAT16/FAT32 image.
// ============================================================================

#pragma once

namespace FSV {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_NOTHING_FOUND = 1;
constexpr int EXIT_BAD_ARGUMENTS = 2;
constexpr int EXIT_VOLUME_ERROR = 3;
constexpr int EXIT_RECOVERY_FAILED = 4;

// Main CLI entry point
int RunCLI(int argc, char** argv);

} // namespace FSV
