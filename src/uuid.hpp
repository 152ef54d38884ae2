#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace canopy
{

  // 16 raw bytes, RFC 4122 text form "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
  // The all-zero value is the nil UUID and never names a node.
  struct Uuid
  {
    std::array<uint8_t, 16> bytes{};

    bool isNil() const;
    std::string toString() const;

    static std::optional<Uuid> parse(std::string_view text);
    static Uuid fromBytes(const unsigned char *p);
    static Uuid random();

    friend auto operator<=>(const Uuid &, const Uuid &) = default;
  };

  inline constexpr Uuid kNilUuid{};

} // namespace canopy
