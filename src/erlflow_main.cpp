#include <erlflow/cli_exit_codes.h>
#include <erlflow/erlflow_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void PrintGlobalUsage() {
  std::cout
      << "Usage: erlflow <command> [options]\n\n"
      << "Commands:\n"
      << "  extract   Build a JSONL corpus from an Erlang source tree "
         "(default if\n"
      << "            no command is given).\n"
      << "  inspect   Print the records of a single Erlang file.\n\n"
      << "Run 'erlflow extract --help' for extraction options.\n";
}
}

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    if (!arguments.empty() &&
        (arguments.front() == "--help" || arguments.front() == "-h")) {
      PrintGlobalUsage();
      return erlflow::kExitClean;
    }

    std::string command = "extract";
    std::size_t first_argument_index = 0;
    if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
      command = arguments.front();
      first_argument_index = 1;
    }

    const std::vector<std::string> command_arguments(
        arguments.begin() + static_cast<std::ptrdiff_t>(first_argument_index),
        arguments.end());
    if (command == "extract") {
      return erlflow::RunExtract(command_arguments);
    }
    if (command == "inspect") {
      return erlflow::RunInspect(command_arguments);
    }

    throw std::invalid_argument("Unknown command: " + command);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    PrintGlobalUsage();
    return erlflow::kExitFatal;
  }
}
