#pragma once

#include <boost/uuid/uuid.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace speechly {
namespace device {

// Device identifiers are required by the SLU API for configuring the
// recognition model. A valid identifier is a UUIDv4.
using DeviceId = boost::uuids::uuid;

// Canonical lower-case 8-4-4-4-12 form.
std::string to_string(const DeviceId &id);

// Empty when `text` is not a UUID.
std::optional<DeviceId> parse_device_id(std::string_view text);

bool is_random_uuid(const DeviceId &id);

} // namespace device
} // namespace speechly
