#include "CliApp.h"
#include <string>
#include <vector>

/**
 * @brief QuietSync command line interface
 *
 * Makes one destination file match a source file (or stdin) while
 * leaving already-identical bytes unwritten.
 */
int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return QuietSync::runCli(args);
}
