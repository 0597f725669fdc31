#pragma once

#include "data/device_info.hpp"

namespace lanlink {
namespace discovery {

// Publish-only sink for discovery events.
class IBroadcaster {
public:
  virtual ~IBroadcaster() = default;
  virtual void broadcast(const data::DiscoveredDeviceMessage &message) = 0;
};

} // namespace discovery
} // namespace lanlink
