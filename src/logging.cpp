#include "logging.h"

#include <iostream>

namespace simpdiscover {
namespace internal {
namespace {

void Emit(const std::string& message, const LogCallback& callback) {
  if (callback) {
    callback(message);
    return;
  }
  std::cerr << "[simpdiscover] " << message << std::endl;
}

}  // namespace

void LogError(const std::string& message, const LogCallback& callback) {
  Emit(message, callback);
}

void LogInfo(const std::string& message, const LogCallback& callback,
             bool verbose) {
  if (!verbose) {
    return;
  }
  Emit(message, callback);
}

}  // namespace internal
}  // namespace simpdiscover
