#include "orvibo/orvibo.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace orvibo {
namespace {

namespace fs = std::filesystem;

fs::path LabelPath(const std::string& directory, const std::string& label) {
  return fs::path(directory) / label;
}

}  // namespace

FileSignalStore::FileSignalStore(std::string directory)
    : directory_(std::move(directory)) {}

bool FileSignalStore::IsValidLabel(const std::string& label) {
  if (label.empty() || label.front() == '.') {
    return false;
  }
  return label.find('/') == std::string::npos &&
         label.find('\\') == std::string::npos &&
         label.find('\0') == std::string::npos;
}

Bytes FileSignalStore::Load(const std::string& label) {
  if (!IsValidLabel(label)) {
    throw SignalNotFoundError("invalid signal label \"" + label + "\"");
  }
  const fs::path path = LabelPath(directory_, label);
  std::ifstream in(path, std::ios::binary | std::ios::in);
  if (!in) {
    throw SignalNotFoundError("signal \"" + label + "\" not found in " + directory_);
  }
  Bytes signal((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw SignalNotFoundError("failed to read signal \"" + label + "\"");
  }
  return signal;
}

bool FileSignalStore::Save(const std::string& label, const Bytes& signal) {
  if (!IsValidLabel(label)) {
    return false;
  }
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    return false;
  }
  std::ofstream out(LabelPath(directory_, label),
                    std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(reinterpret_cast<const char*>(signal.data()),
            static_cast<std::streamsize>(signal.size()));
  return static_cast<bool>(out);
}

std::vector<std::string> FileSignalStore::List() const {
  std::vector<std::string> labels;
  std::error_code ec;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (IsValidLabel(name)) {
      labels.push_back(name);
    }
  }
  std::sort(labels.begin(), labels.end());
  return labels;
}

Bytes MemorySignalStore::Load(const std::string& label) {
  const auto it = signals_.find(label);
  if (it == signals_.end()) {
    throw SignalNotFoundError("signal \"" + label + "\" not found");
  }
  return it->second;
}

bool MemorySignalStore::Save(const std::string& label, const Bytes& signal) {
  if (label.empty()) {
    return false;
  }
  signals_[label] = signal;
  return true;
}

bool MemorySignalStore::Contains(const std::string& label) const {
  return signals_.count(label) != 0;
}

}  // namespace orvibo
