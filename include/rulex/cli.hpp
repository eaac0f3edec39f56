#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace rulex {
namespace cli {

struct Options {
    std::vector<std::string> extra_grammars;  // -g, registered before the main grammar
    std::string grammar;
    std::string input = "-";  // "-" reads the input stream
    std::string state = "root";
    bool trace = false;
    bool auto_select = false;
};

// Runs the rulex command line. args excludes the program name. Tokens go to
// out, diagnostics and traces to err. Returns the process exit status.
int execute(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace rulex
