// Example: discover, send and learn IR/RF433 signals from the command line.
// Prints the same {"success": ..., "cmd": ...} objects the web front end returns.
#include "orvibo/orvibo.h"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct Options {
  std::string action;
  std::string labels;
  std::string ip;
  std::string mac;
  std::string type = "irda";
  std::string directory = "ir";
  bool verbose = false;
};

void PrintUsage() {
  std::cout << "Usage: orvibo_ctl <discover|send|learn> [label[,label...]] "
               "[--ip <address>] [--mac <hex> [--type irda|switch]] "
               "[--dir <signal directory>] [--verbose]\n";
}

bool ParseOptions(int argc, char** argv, Options* out) {
  if (argc < 2) {
    return false;
  }
  out->action = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--ip" && has_value) {
      out->ip = argv[++i];
    } else if (arg == "--mac" && has_value) {
      out->mac = argv[++i];
    } else if (arg == "--type" && has_value) {
      out->type = argv[++i];
    } else if (arg == "--dir" && has_value) {
      out->directory = argv[++i];
    } else if (arg == "--verbose") {
      out->verbose = true;
    } else if (out->labels.empty() && arg.rfind("--", 0) != 0) {
      out->labels = arg;
    } else {
      return false;
    }
  }
  return true;
}

std::vector<std::string> SplitLabels(const std::string& text) {
  std::vector<std::string> labels;
  std::istringstream stream(text);
  std::string label;
  while (std::getline(stream, label, ',')) {
    if (!label.empty()) {
      labels.push_back(label);
    }
  }
  return labels;
}

std::string JsonString(const std::string& value) {
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void PrintResult(bool success, const std::string& cmd) {
  std::cout << "{\"success\": " << (success ? "true" : "false")
            << ", \"cmd\": " << JsonString(cmd) << "}" << std::endl;
}

// Use the identity given on the command line, or resolve it by discovery.
orvibo::Device ResolveDevice(const Options& options, const orvibo::Config& config) {
  if (!options.mac.empty()) {
    if (options.ip.empty()) {
      throw orvibo::DeviceNotFoundError("--mac requires --ip");
    }
    orvibo::DeviceRecord record;
    record.address = options.ip;
    record.kind = orvibo::ParseKind(options.type);
    if (!orvibo::ParseIdentity(options.mac, &record.identity)) {
      throw orvibo::DeviceNotFoundError("invalid MAC address: " + options.mac);
    }
    return orvibo::Device(record, config);
  }
  if (!options.ip.empty()) {
    return orvibo::Device::FromAddress(options.ip, config);
  }
  const auto devices = orvibo::DiscoverAll(config);
  if (devices.empty()) {
    throw orvibo::DeviceNotFoundError("no device answered the discovery broadcast");
  }
  return orvibo::Device(devices.begin()->second, config);
}

int RunDiscover(const orvibo::Config& config,
                const std::shared_ptr<orvibo::FileSignalStore>& store) {
  const auto devices = orvibo::DiscoverAll(config);
  std::cout << "{\"success\": " << (devices.empty() ? "false" : "true") << ", \"ip\": "
            << (devices.empty() ? std::string("null") : JsonString(devices.begin()->first))
            << ", \"commands\": [";
  bool first = true;
  for (const std::string& label : store->List()) {
    std::cout << (first ? "" : ", ") << JsonString(label);
    first = false;
  }
  std::cout << "]}" << std::endl;
  return devices.empty() ? 1 : 0;
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseOptions(argc, argv, &options)) {
    PrintUsage();
    return 1;
  }

  orvibo::Config config;
  if (options.verbose) {
    config.min_log_level = orvibo::LogLevel::kDebug;
  }
  auto store = std::make_shared<orvibo::FileSignalStore>(options.directory);

  try {
    if (options.action == "discover") {
      return RunDiscover(config, store);
    }
    if (options.action != "send" && options.action != "learn") {
      PrintUsage();
      return 1;
    }
    if (options.labels.empty()) {
      std::cerr << "A signal label is required" << std::endl;
      PrintResult(false, options.labels);
      return 1;
    }

    orvibo::Device device = ResolveDevice(options, config);
    device.SetSignalStore(store);
    std::cerr << device.ToString() << std::endl;

    bool success = false;
    if (options.action == "send") {
      success = device.EmitSequence(SplitLabels(options.labels));
    } else {
      success = device.Learn(options.labels).ok();
    }
    PrintResult(success, options.labels);
    return success ? 0 : 1;
  } catch (const orvibo::Error& ex) {
    std::cerr << ex.what() << std::endl;
    PrintResult(false, options.labels);
    return 1;
  }
}
