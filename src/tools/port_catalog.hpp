#pragma once

#include <string>
#include <vector>

namespace reconkit::tools {

// Ports checked by the server information gatherer, in scan order.
const std::vector<int>& InfoGathererPorts();

// Ports checked by the reconnaissance scanner, in scan order.
const std::vector<int>& ReconPorts();

// Display name of the service conventionally bound to `port`. Falls back to
// the system services database, then to "Unknown".
std::string ServiceName(int port);

} // namespace reconkit::tools
