// Example: list devices answering a discovery broadcast.
#include "orvibo/orvibo.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  orvibo::Config config;
  if (argc > 1) {
    config.broadcast_address = argv[1];
  }
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  try {
    const auto devices = orvibo::DiscoverAll(config);
    std::cout << "Discovered devices: " << devices.size() << std::endl;
    for (const auto& entry : devices) {
      const orvibo::DeviceRecord& record = entry.second;
      std::cout << " - " << record.address << " type=" << orvibo::KindName(record.kind)
                << " mac=" << orvibo::FormatIdentity(record.identity) << std::endl;
    }
  } catch (const orvibo::Error& ex) {
    std::cerr << "Discovery failed: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
