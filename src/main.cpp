// ============================================================================
// fatsalvage - Main Entry Point
// ============================================================================
// Deleted-file recovery for FAT16 and FAT32 disk images:
//   - Boot sector and MBR partition discovery
//   - Directory listing with Long File Name reassembly
//   - Contiguous-run reconstruction of deleted files and directories
// ============================================================================

#include "main_cli.h"

int main(int argc, char** argv) {
    return FSV::RunCLI(argc, argv);
}
