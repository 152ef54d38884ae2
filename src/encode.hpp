#pragma once
#include "uuid.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace canopy
{

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_uuid(std::string &s, const Uuid &id)
  {
    s.append(reinterpret_cast<const char *>(id.bytes.data()), id.bytes.size());
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }

  // signed boundaries sort as unsigned bytes once the sign bit is flipped
  inline uint64_t bias_i64(int64_t x) { return static_cast<uint64_t>(x) ^ (1ull << 63); }
  inline int64_t unbias_i64(uint64_t x) { return static_cast<int64_t>(x ^ (1ull << 63)); }

  constexpr size_t kUuidSize = 16;

  // nodes: <u32 kindId>|<uuid id>
  inline std::string key_node_be(uint32_t kindId, const Uuid &id)
  {
    std::string k;
    k.reserve(4 + kUuidSize);
    put_be32(k, kindId);
    put_uuid(k, id);
    return k;
  }

  // byLeft / byRight: <u32 kindId>|<i64 boundary, biased>
  inline std::string key_boundary_be(uint32_t kindId, int64_t boundary)
  {
    std::string k;
    k.reserve(4 + 8);
    put_be32(k, kindId);
    put_be64(k, bias_i64(boundary));
    return k;
  }
  constexpr size_t kBoundaryKeySize = 4 + 8;

  // children: <u32 kindId>|<uuid parent>|<u64 ordering>|<uuid id>; roots use the nil parent
  inline std::string key_child_prefix_be(uint32_t kindId, const Uuid &parent)
  {
    std::string k;
    k.reserve(4 + kUuidSize + 8 + kUuidSize);
    put_be32(k, kindId);
    put_uuid(k, parent);
    return k;
  }
  inline std::string key_child_be(uint32_t kindId, const Uuid &parent, uint64_t ordering, const Uuid &id)
  {
    std::string k = key_child_prefix_be(kindId, parent);
    put_be64(k, ordering);
    put_uuid(k, id);
    return k;
  }
  constexpr size_t kChildKeySize = 4 + kUuidSize + 8 + kUuidSize;

  // kindIds: <u32 id>
  inline std::string key_u32_be(uint32_t id)
  {
    std::string k;
    k.reserve(4);
    put_be32(k, id);
    return k;
  }

  // kindsByName: raw string key
  inline std::string key_name(std::string_view name)
  {
    return std::string(name);
  }

  // meta bucket string keys
  inline std::string key_meta_schema_version() { return std::string("schemaVersion"); }
  inline std::string key_meta_kind_seq() { return std::string("kindSeq"); }

} // namespace canopy
