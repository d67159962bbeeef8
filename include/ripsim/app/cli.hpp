/**
 * @file cli.hpp
 * @brief Command line front end
 */

#pragma once

#include <iosfwd>

namespace ripsim {

/// Usage text printed by -h and on argument errors
extern const char* const CLI_HELP;

/**
 * @brief Run the ripsim command line
 *
 * ripsim <path-to-shear-mesh> <path-to-save-output-vegmap> [config-file]
 *
 * @param out Stream for -h output
 * @param err Stream for usage errors, verbose config summary and error messages
 * @return 0 on success or -h, 1 on bad arguments or any error
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace ripsim
