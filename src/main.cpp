/**
 * @file main.cpp
 * @brief Entry point for graphvault
 */

#include <iostream>

#include "app/application.h"

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code (0 = success, non-zero = error)
 */
int main(int argc, char* argv[]) {
  auto app = graphvault::app::Application::Create(argc, argv);
  if (!app) {
    std::cerr << "Error: " << app.error().message() << "\n";
    std::cerr << "Use --help for usage.\n";
    return 1;
  }

  return (*app)->Run();
}
