#pragma once

#include "Result.h"
#include <string>
#include <unistd.h>
#include <vector>

namespace QuietSync {

/// Exit status for a failed run: 1 I/O, 2 usage or configuration, 3 verification
int exitCodeFor(const qsync::Error& error);

/**
 * @brief Everything `quietsync` does after argv is split
 *
 * @param args      Arguments without the program name
 * @param stdinFd   Descriptor read when the source is "-"
 * @return Process exit status
 */
int runCli(const std::vector<std::string>& args, int stdinFd = STDIN_FILENO);

} // namespace QuietSync
