#pragma once

#include <iosfwd>

namespace loghive {

// The loghive command line. argv[0] is the program name. Reports go to out,
// usage errors and warnings to log. Returns the process exit code.
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& log);

} // namespace loghive
