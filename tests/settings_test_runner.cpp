#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <string>
#include <vector>

using namespace netcopy::test;

namespace {

const std::vector<std::string> kReceiverPositionals = {
  "listen_ip", "listen_port", "registry_host", "registry_port", "file_id", "out_path"
};

CommandLineParser receiver_parser() {
  return CommandLineParser("netcopy_srv", "test", RECEIVER_SETTINGS, kReceiverPositionals);
}

bool test_defaults() {
  SettingsManager settings(REGISTRY_SETTINGS);
  bool ok = expect_eq(settings.get<std::string>("listen_ip"), std::string("127.0.0.1"), "default ip");
  ok &= expect_eq(settings.get<int>("listen_port"), 9100, "default port");
  ok &= expect(!settings.help_requested(), "help off by default");
  ok &= expect(!settings.save_requested(), "save off by default");

  SettingsManager sender(SENDER_SETTINGS);
  ok &= expect_eq(sender.get<int>("checksum_ttl"), 60, "default checksum ttl");
  return ok;
}

bool test_positionals_fill_in_order() {
  SettingsManager settings(RECEIVER_SETTINGS);
  receiver_parser().parse({"0.0.0.0", "9300", "10.0.0.5", "9101", "report", "/tmp/out"}, settings);
  bool ok = expect_eq(settings.get<std::string>("listen_ip"), std::string("0.0.0.0"), "listen_ip");
  ok &= expect_eq(settings.get<int>("listen_port"), 9300, "listen_port");
  ok &= expect_eq(settings.get<std::string>("registry_host"), std::string("10.0.0.5"), "registry_host");
  ok &= expect_eq(settings.get<int>("registry_port"), 9101, "registry_port");
  ok &= expect_eq(settings.get<std::string>("file_id"), std::string("report"), "file_id");
  ok &= expect_eq(settings.get<std::string>("out_path"), std::string("/tmp/out"), "out_path");
  return ok;
}

bool test_options_and_aliases() {
  SettingsManager settings(RECEIVER_SETTINGS);
  receiver_parser().parse({"--listen_port", "9400", "-chsum_port", "9500", "--ONCE", "-vt", "4"}, settings);
  bool ok = expect_eq(settings.get<int>("listen_port"), 9400, "long option");
  ok &= expect_eq(settings.get<int>("registry_port"), 9500, "alias option");
  ok &= expect(settings.get<bool>("once"), "bare bool option means true");
  ok &= expect_eq(settings.get<int>("verify_threads"), 4, "short alias");
  return ok;
}

bool test_bool_values() {
  SettingsManager settings(RECEIVER_SETTINGS);
  receiver_parser().parse({"--verbose", "off", "--once", "yes", "127.0.0.1"}, settings);
  bool ok = expect(!settings.get<bool>("verbose"), "explicit false literal consumed");
  ok &= expect(settings.get<bool>("once"), "explicit true literal consumed");
  ok &= expect_eq(settings.get<std::string>("listen_ip"), std::string("127.0.0.1"),
                  "non-literal after bool stays positional");
  return ok;
}

bool expect_command_line_error(const std::vector<std::string>& args, const std::string& what) {
  SettingsManager settings(RECEIVER_SETTINGS);
  try {
    receiver_parser().parse(args, settings);
  } catch(const CommandLineError&) {
    return true;
  }
  return expect(false, what);
}

bool test_rejects_bad_input() {
  bool ok = expect_command_line_error({"--bogus", "1"}, "unknown long option");
  ok &= expect_command_line_error({"--listen_port"}, "missing value");
  ok &= expect_command_line_error({"--listen_port", "12ab"}, "non-numeric port");
  ok &= expect_command_line_error({"a", "1", "b", "2", "c", "d", "extra"}, "surplus positional");
  return ok;
}

bool test_unknown_positional_key_rejected() {
  try {
    CommandLineParser parser("x", "y", REGISTRY_SETTINGS, {"no_such_key"});
  } catch(const std::runtime_error&) {
    return true;
  }
  return expect(false, "constructor rejects unknown positional key");
}

bool test_port_setting() {
  SettingsManager settings(RECEIVER_SETTINGS);
  std::string error;
  bool ok = expect(settings.set_from_string("listen_port", "0", error), "set 0");
  ok &= expect_eq(port_setting(settings, "listen_port", true), uint16_t{0}, "zero allowed for listeners");

  bool threw = false;
  try { port_setting(settings, "listen_port"); } catch(const std::runtime_error&) { threw = true; }
  ok &= expect(threw, "zero rejected for remote ports");

  ok &= expect(settings.set_from_string("registry_port", "70000", error), "set 70000");
  threw = false;
  try { port_setting(settings, "registry_port"); } catch(const std::runtime_error&) { threw = true; }
  ok &= expect(threw, "port above 65535 rejected");
  return ok;
}

bool test_save_and_load() {
  TempDir dir("netcopy-settings");
  SettingsManager settings(SENDER_SETTINGS);
  settings.set_settings_path(dir / ".config" / "netcopy_cli.json");
  std::string error;
  settings.set_from_string("server_port", "9999", error);
  settings.set_from_string("file_id", "transient", error);
  bool ok = expect(settings.save(), "saved");

  SettingsManager reloaded(SENDER_SETTINGS);
  reloaded.set_settings_path(settings.settings_path());
  ok &= expect(reloaded.load(), "loaded");
  ok &= expect_eq(reloaded.get<int>("server_port"), 9999, "persistent setting restored");
  ok &= expect_eq(reloaded.get<std::string>("file_id"), std::string(""), "non-persistent setting not saved");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"positionals_fill_in_order", test_positionals_fill_in_order},
    {"options_and_aliases", test_options_and_aliases},
    {"bool_values", test_bool_values},
    {"rejects_bad_input", test_rejects_bad_input},
    {"unknown_positional_key_rejected", test_unknown_positional_key_rejected},
    {"port_setting", test_port_setting},
    {"save_and_load", test_save_and_load}
  };
  return run_test_cases("settings", tests, argc, argv);
}
