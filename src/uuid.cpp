#include "uuid.hpp"
#include <cstring>
#include <random>

namespace canopy
{

  namespace
  {
    int hexValue(char c)
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
      return -1;
    }
  } // namespace

  bool Uuid::isNil() const
  {
    for (uint8_t b : bytes)
      if (b != 0)
        return false;
    return true;
  }

  std::string Uuid::toString() const
  {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i)
    {
      if (i == 4 || i == 6 || i == 8 || i == 10)
        s.push_back('-');
      s.push_back(digits[bytes[i] >> 4]);
      s.push_back(digits[bytes[i] & 0x0f]);
    }
    return s;
  }

  std::optional<Uuid> Uuid::parse(std::string_view text)
  {
    if (text.size() != 36)
      return std::nullopt;
    Uuid out{};
    size_t b = 0;
    for (size_t i = 0; i < text.size();)
    {
      if (i == 8 || i == 13 || i == 18 || i == 23)
      {
        if (text[i] != '-')
          return std::nullopt;
        ++i;
        continue;
      }
      int hi = hexValue(text[i]);
      int lo = hexValue(text[i + 1]);
      if (hi < 0 || lo < 0)
        return std::nullopt;
      out.bytes[b++] = static_cast<uint8_t>((hi << 4) | lo);
      i += 2;
    }
    return out;
  }

  Uuid Uuid::fromBytes(const unsigned char *p)
  {
    Uuid out{};
    std::memcpy(out.bytes.data(), p, out.bytes.size());
    return out;
  }

  Uuid Uuid::random()
  {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    Uuid out{};
    uint64_t hi = gen();
    uint64_t lo = gen();
    for (int i = 0; i < 8; ++i)
    {
      out.bytes[i] = static_cast<uint8_t>(hi >> (56 - i * 8));
      out.bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - i * 8));
    }
    out.bytes[6] = static_cast<uint8_t>((out.bytes[6] & 0x0f) | 0x40); // version 4
    out.bytes[8] = static_cast<uint8_t>((out.bytes[8] & 0x3f) | 0x80); // variant 10
    return out;
  }

} // namespace canopy
