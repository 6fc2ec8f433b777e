/**
 * @file application.h
 * @brief Main application class
 */

#ifndef GRAPHVAULT_APP_APPLICATION_H_
#define GRAPHVAULT_APP_APPLICATION_H_

#include <memory>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "backup/backup_manager.h"
#include "graph/neo4j_http_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace graphvault::app {

/**
 * @brief Main application class
 *
 * Orchestrates one CLI invocation:
 * 1. Parse command-line arguments
 * 2. Load configuration
 * 3. Apply logging configuration
 * 4. Build the graph store and backup manager
 * 5. Take the operation lock (mutating commands only)
 * 6. Run the command
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Error: " << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with application instance or error
   *
   * Parses arguments and loads the configuration. Help and version are
   * printed here and yield an application whose Run() returns 0.
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application();

  // Non-copyable, non-movable
  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the command
   * @return Exit code (0 = success, non-zero = error)
   */
  int Run();

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  Expected<void, Error> Initialize();

  // Returns exit code, or -1 to continue normal execution
  int HandleSpecialModes() const;

  /**
   * @brief True for commands that write snapshots or the graph
   */
  static bool RequiresLock(Command command);

  CommandLineArgs args_;

  // Components (initialization order)
  std::unique_ptr<ConfigurationManager> config_manager_;
  std::unique_ptr<graph::Neo4jHttpStore> store_;
  std::unique_ptr<backup::BackupManager> backup_manager_;
};

}  // namespace graphvault::app

#endif  // GRAPHVAULT_APP_APPLICATION_H_
