#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

#include "checksum_store.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "server.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings(REGISTRY_SETTINGS);
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "checksum_srv.json");
    settings.load();

    CommandLineParser parser("checksum_srv",
                             "expiring checksum registry",
                             REGISTRY_SETTINGS,
                             {"listen_ip", "listen_port"});
    try {
      parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("checksum-registry");
    for(const auto& key : settings.keys()){
      logger->debug("{} = {}", key, settings.value_as_string(key));
    }

    if(settings.save_requested() && !settings.save()) {
      logger->error("Unable to persist settings to {}", settings.settings_path().string());
    }

    RegistryServer::Options options;
    options.listen_ip = settings.get<std::string>("listen_ip");
    options.listen_port = port_setting(settings, "listen_port", true);
    options.io_threads = static_cast<std::size_t>(std::max(1, settings.get<int>("io_threads")));
    options.io_timeout = std::chrono::milliseconds(std::max(1, settings.get<int>("io_timeout_ms")));
    options.sweep_interval = std::chrono::seconds(std::max(0, settings.get<int>("sweep_interval")));
    options.handle_signals = true;

    RegistryServer server(std::make_shared<ChecksumStore>(), options, logger);
    server.start();
    server.run();
    server.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("checksum_srv");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
