#include "speechly/device/device_id.hpp"

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <stdexcept>

namespace speechly {
namespace device {

std::string to_string(const DeviceId &id) { return boost::uuids::to_string(id); }

std::optional<DeviceId> parse_device_id(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    return boost::uuids::string_generator()(text.begin(), text.end());
  } catch (const std::runtime_error &) {
    // string_generator throws on anything that is not a UUID
    return std::nullopt;
  }
}

bool is_random_uuid(const DeviceId &id) {
  return id.version() == boost::uuids::uuid::version_random_number_based &&
         id.variant() == boost::uuids::uuid::variant_rfc_4122;
}

} // namespace device
} // namespace speechly
