#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace market::util {

/*
  Entity ids are "<prefix>-<uuid v4>", e.g.
  channel-1b4e28ba-2fa1-41d2-883f-0016d3cca427.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId(std::string_view prefix);

} // namespace market::util
