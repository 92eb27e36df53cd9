#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "reader_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    ReaderEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "scrollkeeper");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init(false);
      log_to(nullptr, LogChannel::PrintErr, "{}", error);
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      init(false);
      parser.usage();
      return 0;
    }

    ReaderEngine engine(settings, options);
    auto logger = engine.logger();

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(settings->get<std::string>("catalog_path").empty()) {
      logger->warn("No chapter catalog configured; pass one as the first argument or 'set catalog <path>'");
    }
    logger->print("scrollkeeper ready. Type 'help' for commands.");
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("scrollkeeper-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
