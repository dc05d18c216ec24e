// =============================================================================
// FILE: include/router/device_message.h
// =============================================================================
#ifndef DEVICE_MESSAGE_H
#define DEVICE_MESSAGE_H

#include "common/types.h"
#include <atomic>
#include <map>
#include <string>

namespace device_watch {

// A property change or event pushed by the relay for one device.
// `values` maps watched name -> raw value text ("prop.power" -> "on").
struct DeviceMessage {
    uint64_t    id = 0;
    DeviceId    device_id;
    std::map<std::string, std::string> values;
    TimePoint   received_at = Clock::now();
    bool        is_valid    = false;

    static uint64_t next_id();
private:
    static std::atomic<uint64_t> id_counter_;
};

} // namespace device_watch
#endif // DEVICE_MESSAGE_H
