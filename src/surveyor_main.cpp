#include <surveyor/cli_exit_codes.h>
#include <surveyor/surveyor_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return surveyor::RunSurvey(arguments, std::cout, std::clog);
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    surveyor::PrintSurveyUsage(std::cerr);
    return surveyor::kExitUsageError;
  }
}
