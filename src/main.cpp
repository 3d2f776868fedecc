#include "app/Config.h"
#include "app/GatewayApp.h"
#include "app/SignalHandler.h"
#include <iostream>

namespace {

void printUsage(const char *prog) {
  std::cout << "Usage: " << prog << " [--config <file>] [--check-config]\n"
            << "  --config <file>   gateway configuration (default "
               "../config/gateway.yaml)\n"
            << "  --check-config    validate the configuration and exit\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = "../config/gateway.yaml";
  bool checkOnly = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--check-config") {
      checkOnly = true;
    } else if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      printUsage(argv[0]);
      return 2;
    }
  }

  if (checkOnly) {
    if (!Config::instance().load(configPath)) {
      std::cerr << "Configuration " << configPath << " is invalid" << std::endl;
      return 1;
    }
    std::cout << "Configuration " << configPath << " is valid" << std::endl;
    return 0;
  }

  SignalHandler::init();

  GatewayApp app;
  if (!app.init(configPath)) {
    std::cerr << "Failed to start live gateway" << std::endl;
    return 1;
  }

  app.run();
  return 0;
}
