/**
 * @file Cli.hpp
 * @brief Command-line front end for the diffx executable
 *
 * Usage: diffx [OPTIONS] OLD NEW
 *
 * Options from a --config document are applied first; command-line flags
 * override them. Exit status:
 * - 0: no differences
 * - 1: differences found
 * - 2: usage, input, option or parse error
 */

#ifndef DIFFX_CLI_HPP
#define DIFFX_CLI_HPP

#include <iosfwd>

namespace diffx {
namespace cli {

inline constexpr const char* kVersion = "0.1.0";

inline constexpr int kExitSame = 0;
inline constexpr int kExitDifferent = 1;
inline constexpr int kExitError = 2;

/**
 * @brief Run the command line
 *
 * @param in Stream read for an input path of "-"
 * @param out Rendered diff, brief message, help and version text
 * @param err Error messages ("Error: <message>")
 * @return Process exit status
 */
int run(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace diffx

#endif // DIFFX_CLI_HPP
