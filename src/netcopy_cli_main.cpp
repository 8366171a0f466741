#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_sender.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings(SENDER_SETTINGS);
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "netcopy_cli.json");
    settings.load();

    CommandLineParser parser("netcopy_cli",
                             "register a file's checksum and send it to a receiver",
                             SENDER_SETTINGS,
                             {"server_host", "server_port", "registry_host", "registry_port", "file_id", "file_path"});
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
    auto logger = std::make_shared<Logger>("netcopy-sender");
    for(const auto& key : settings.keys()){
      logger->debug("{} = {}", key, settings.value_as_string(key));
    }

    if(settings.save_requested() && !settings.save()) {
      logger->error("Unable to persist settings to {}", settings.settings_path().string());
    }

    TransferSender::Options options;
    options.server_host = settings.get<std::string>("server_host");
    options.server_port = port_setting(settings, "server_port");
    options.registry_host = settings.get<std::string>("registry_host");
    options.registry_port = port_setting(settings, "registry_port");
    options.file_id = settings.get<std::string>("file_id");
    options.file_path = settings.get<std::string>("file_path");
    options.checksum_ttl = std::chrono::seconds(std::max(0, settings.get<int>("checksum_ttl")));
    options.io_timeout = std::chrono::milliseconds(std::max(1, settings.get<int>("io_timeout_ms")));

    std::error_code ec;
    if(options.file_path.empty() || !std::filesystem::is_regular_file(options.file_path, ec)) {
      logger->error("File not found: {}", options.file_path.string());
      return 1;
    }

    TransferSender sender(options, logger);
    auto result = sender.send();
    if(result.status != SendStatus::Sent) {
      logger->error("File transfer failed ({}): {}", send_status_name(result.status), result.error);
      return 1;
    }
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("netcopy_cli");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
