#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace trustgate::cli {

int run_cli(int argc, char **argv);

/// Same as above with explicit streams; `args` excludes the program name.
int run_cli(std::vector<std::string> args, std::istream &in, std::ostream &out, std::ostream &err);

} // namespace trustgate::cli
