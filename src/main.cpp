#include "core/application.hpp"
#include "core/config.hpp"

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Continuing with default configuration." << std::endl;

  return run_application(*config_manager.get_config(), std::cout);
}
