#pragma once

#include "simpdiscover/simpdiscover.h"

#include <string>

namespace simpdiscover {
namespace internal {

// Errors always reach the callback, or stderr without one.
void LogError(const std::string& message, const LogCallback& callback);

// Informational messages are dropped unless `verbose` is set.
void LogInfo(const std::string& message, const LogCallback& callback,
             bool verbose);

}  // namespace internal
}  // namespace simpdiscover
