#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_receiver.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings(RECEIVER_SETTINGS);
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "netcopy_srv.json");
    settings.load();

    CommandLineParser parser("netcopy_srv",
                             "receive files and verify them against the checksum registry",
                             RECEIVER_SETTINGS,
                             {"listen_ip", "listen_port", "registry_host", "registry_port", "file_id", "out_path"});
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
    auto logger = std::make_shared<Logger>("netcopy-receiver");
    for(const auto& key : settings.keys()){
      logger->debug("{} = {}", key, settings.value_as_string(key));
    }

    if(settings.save_requested() && !settings.save()) {
      logger->error("Unable to persist settings to {}", settings.settings_path().string());
    }

    TransferReceiver::Options options;
    options.listen_ip = settings.get<std::string>("listen_ip");
    options.listen_port = port_setting(settings, "listen_port", true);
    options.registry_host = settings.get<std::string>("registry_host");
    options.registry_port = port_setting(settings, "registry_port");
    options.expected_file_id = settings.get<std::string>("file_id");
    options.out_path = settings.get<std::string>("out_path");
    options.once = settings.get<bool>("once");
    options.io_timeout = std::chrono::milliseconds(std::max(1, settings.get<int>("io_timeout_ms")));
    options.registry_timeout = std::chrono::milliseconds(std::max(1, settings.get<int>("registry_timeout_ms")));
    options.verify_threads = static_cast<std::size_t>(std::max(1, settings.get<int>("verify_threads")));
    options.handle_signals = true;

    // A file target must live in an existing directory.
    std::error_code ec;
    auto out_dir = options.out_path.parent_path();
    if(!std::filesystem::is_directory(options.out_path, ec) &&
       !out_dir.empty() && !std::filesystem::is_directory(out_dir, ec)) {
      logger->error("Output directory does not exist: {}", out_dir.string());
      return 1;
    }

    TransferReceiver receiver(options, logger);
    receiver.start();
    receiver.run();
    receiver.stop();

    if(options.once) {
      auto report = receiver.first_report();
      if(!report) {
        logger->error("File reception failed");
        return 1;
      }
      return report->verdict == Verdict::Ok ? 0 : 1;
    }
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("netcopy_srv");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
