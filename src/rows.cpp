#include "store_internal.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace canopy::detail
{
  // -------------------- meta helpers (schema, sequences) --------------------

  static bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out)
  {
    MDB_val k = make_val(key);
    int rc = mdb_get(tx, dbi, &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    check_rc(rc);
    return true;
  }

  static uint32_t read_u32_or(MDB_txn *tx, DbHandle dbi, std::string_view key, uint32_t fallback)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, dbi, key, v) || v.mv_size != 4)
      return fallback;
    uint32_t x = 0;
    std::memcpy(&x, v.mv_data, 4);
    return x;
  }

  static void write_u32(MDB_txn *tx, DbHandle dbi, std::string_view key, uint32_t value)
  {
    MDB_val k = make_val(key);
    MDB_val v{4, &value};
    check_rc(mdb_put(tx, dbi, &k, &v, 0));
  }

  static void ensure_schema_version(Txn &tx, Env &env)
  {
    auto key = key_meta_schema_version();
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.meta(), key, v))
      write_u32(tx.get(), env.meta(), key, 1u);
  }

  static uint32_t next_kind_id(Txn &tx, Env &env)
  {
    ensure_schema_version(tx, env);
    auto key = key_meta_kind_seq();
    uint32_t next = read_u32_or(tx.get(), env.meta(), key, 0) + 1;
    write_u32(tx.get(), env.meta(), key, next);
    return next;
  }

  // -------------------- value/row encoding --------------------

  enum class ValueTag : uint8_t
  {
    I64 = 0,
    F64 = 1,
    Bool = 2,
    Text = 3,
    Null = 4
  };

  static void encode_value(std::string &out, const Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
    {
      out.push_back(char(ValueTag::I64));
      put_be64(out, static_cast<uint64_t>(std::get<int64_t>(v)));
      return;
    }
    if (std::holds_alternative<double>(v))
    {
      out.push_back(char(ValueTag::F64));
      double d = std::get<double>(v);
      static_assert(sizeof(double) == 8, "double not 8 bytes");
      uint64_t ux;
      std::memcpy(&ux, &d, 8);
      put_be64(out, ux);
      return;
    }
    if (std::holds_alternative<bool>(v))
    {
      out.push_back(char(ValueTag::Bool));
      out.push_back(std::get<bool>(v) ? 1 : 0);
      return;
    }
    if (std::holds_alternative<std::string>(v))
    {
      out.push_back(char(ValueTag::Text));
      const auto &s = std::get<std::string>(v);
      put_be32(out, static_cast<uint32_t>(s.size()));
      out.append(s);
      return;
    }
    out.push_back(char(ValueTag::Null));
  }

  static const unsigned char *decode_value(const unsigned char *p, const unsigned char *end, Value &out)
  {
    if (p >= end)
      throw MdbError("corrupt value: empty");
    auto tag = static_cast<ValueTag>(*p++);
    switch (tag)
    {
    case ValueTag::I64:
    {
      if (end - p < 8)
        throw MdbError("corrupt i64");
      out = static_cast<int64_t>(read_be64(p));
      return p + 8;
    }
    case ValueTag::F64:
    {
      if (end - p < 8)
        throw MdbError("corrupt f64");
      uint64_t ux = read_be64(p);
      double d;
      std::memcpy(&d, &ux, 8);
      out = d;
      return p + 8;
    }
    case ValueTag::Bool:
    {
      if (end - p < 1)
        throw MdbError("corrupt bool");
      out = bool(*p++ != 0);
      return p;
    }
    case ValueTag::Text:
    {
      if (end - p < 4)
        throw MdbError("corrupt text len");
      uint32_t len = read_be32(p);
      p += 4;
      if (end - p < static_cast<std::ptrdiff_t>(len))
        throw MdbError("corrupt text data");
      out = std::string(reinterpret_cast<const char *>(p), len);
      return p + len;
    }
    case ValueTag::Null:
      out = std::monostate{};
      return p;
    default:
      throw MdbError("unknown value tag");
    }
  }

  // <uuid id>|<uuid parent, nil for roots>|<i64 left>|<i64 right>|<u32 depth>|<u64 ordering>|<u32 n>|n x (<u32 len><key><value>)
  std::string encode_row(const Node &n)
  {
    std::string s;
    s.reserve(2 * kUuidSize + 8 + 8 + 4 + 8 + 4 + n.attributes.size() * 24);
    put_uuid(s, n.id);
    put_uuid(s, n.parentId.value_or(kNilUuid));
    put_be64(s, bias_i64(n.left));
    put_be64(s, bias_i64(n.right));
    put_be32(s, n.depth);
    put_be64(s, n.ordering);
    put_be32(s, static_cast<uint32_t>(n.attributes.size()));
    for (const auto &a : n.attributes)
    {
      put_be32(s, static_cast<uint32_t>(a.key.size()));
      s.append(a.key);
      encode_value(s, a.val);
    }
    return s;
  }

  Node decode_row(std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    if (end - p < static_cast<std::ptrdiff_t>(2 * kUuidSize + 8 + 8 + 4 + 8 + 4))
      throw MdbError("corrupt node row header");
    Node n{};
    n.id = Uuid::fromBytes(p);
    p += kUuidSize;
    Uuid parent = Uuid::fromBytes(p);
    p += kUuidSize;
    if (!parent.isNil())
      n.parentId = parent;
    n.left = unbias_i64(read_be64(p));
    p += 8;
    n.right = unbias_i64(read_be64(p));
    p += 8;
    n.depth = read_be32(p);
    p += 4;
    n.ordering = read_be64(p);
    p += 8;
    uint32_t count = read_be32(p);
    p += 4;
    n.attributes.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
      if (end - p < 4)
        throw MdbError("corrupt attribute key len");
      uint32_t len = read_be32(p);
      p += 4;
      if (end - p < static_cast<std::ptrdiff_t>(len))
        throw MdbError("corrupt attribute key");
      Attribute a{};
      a.key.assign(reinterpret_cast<const char *>(p), len);
      p += len;
      p = decode_value(p, end, a.val);
      n.attributes.push_back(std::move(a));
    }
    if (p != end)
      throw MdbError("trailing data in node row");
    return n;
  }

  // -------------------- kind dictionary --------------------

  std::optional<uint32_t> lookup_kind_id(Txn &tx, Env &env, std::string_view kind)
  {
    if (kind.empty())
      return std::nullopt;
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.kindsByName(), key_name(kind), v))
      return std::nullopt;
    if (v.mv_size != 4)
      throw MdbError("corrupt kind id value");
    return read_be32(static_cast<const unsigned char *>(v.mv_data));
  }

  uint32_t get_or_create_kind_id(Txn &tx, Env &env, std::string_view kind)
  {
    if (kind.empty())
      throw InvalidOperationError("kind name must not be empty");
    if (auto existing = lookup_kind_id(tx, env, kind))
      return *existing;

    uint32_t id = next_kind_id(tx, env);
    std::string idk = key_u32_be(id);
    MDB_val idKey = make_val(idk);
    MDB_val nameVal = make_val(kind);
    check_rc(mdb_put(tx.get(), env.kindIds(), &idKey, &nameVal, 0));

    std::string idbe = key_u32_be(id);
    MDB_val nameKey = make_val(kind);
    MDB_val idVal = make_val(idbe);
    check_rc(mdb_put(tx.get(), env.kindsByName(), &nameKey, &idVal, 0));
    return id;
  }

  uint32_t require_kind_id(Txn &tx, Env &env, std::string_view kind)
  {
    auto id = lookup_kind_id(tx, env, kind);
    if (!id)
      throw NotFoundError("kind '" + std::string(kind) + "' not found");
    return *id;
  }

  // -------------------- rows and indexes --------------------

  std::optional<Node> load_node(Txn &tx, Env &env, uint32_t kindId, const Uuid &id)
  {
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.nodes(), key_node_be(kindId, id), v))
      return std::nullopt;
    return decode_row(view_of(v));
  }

  Node require_node(Txn &tx, Env &env, uint32_t kindId, const Uuid &id)
  {
    auto n = load_node(tx, env, kindId, id);
    if (!n)
      throw NotFoundError("node " + id.toString() + " not found");
    return std::move(*n);
  }

  static void put_raw(Txn &tx, DbHandle dbi, std::string_view key, std::string_view val)
  {
    MDB_val k = make_val(key);
    MDB_val v = make_val(val);
    check_rc(mdb_put(tx.get(), dbi, &k, &v, 0));
  }

  static void del_raw(Txn &tx, DbHandle dbi, std::string_view key)
  {
    MDB_val k = make_val(key);
    int rc = mdb_del(tx.get(), dbi, &k, nullptr);
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  static std::string_view id_bytes(const Uuid &id)
  {
    return std::string_view(reinterpret_cast<const char *>(id.bytes.data()), id.bytes.size());
  }

  static void put_index_entries(Txn &tx, Env &env, uint32_t kindId, const Node &n)
  {
    put_raw(tx, env.byLeft(), key_boundary_be(kindId, n.left), id_bytes(n.id));
    put_raw(tx, env.byRight(), key_boundary_be(kindId, n.right), id_bytes(n.id));
    put_raw(tx, env.children(), key_child_be(kindId, n.parentId.value_or(kNilUuid), n.ordering, n.id), {});
  }

  static void erase_index_entries(Txn &tx, Env &env, uint32_t kindId, const Node &n)
  {
    del_raw(tx, env.byLeft(), key_boundary_be(kindId, n.left));
    del_raw(tx, env.byRight(), key_boundary_be(kindId, n.right));
    del_raw(tx, env.children(), key_child_be(kindId, n.parentId.value_or(kNilUuid), n.ordering, n.id));
  }

  void put_node(Txn &tx, Env &env, uint32_t kindId, const Node &n)
  {
    put_raw(tx, env.nodes(), key_node_be(kindId, n.id), encode_row(n));
    put_index_entries(tx, env, kindId, n);
  }

  void erase_node(Txn &tx, Env &env, uint32_t kindId, const Node &n)
  {
    erase_index_entries(tx, env, kindId, n);
    del_raw(tx, env.nodes(), key_node_be(kindId, n.id));
  }

  void rewrite_nodes(Txn &tx, Env &env, uint32_t kindId, const std::vector<std::pair<Node, Node>> &changes)
  {
    for (const auto &[before, after] : changes)
      erase_index_entries(tx, env, kindId, before);
    for (const auto &[before, after] : changes)
      put_node(tx, env, kindId, after);
  }

  static std::optional<Uuid> read_indexed_id(const MDB_val &k, const MDB_val &v, uint32_t kindId)
  {
    if (k.mv_size != kBoundaryKeySize)
      return std::nullopt;
    if (read_be32(static_cast<const unsigned char *>(k.mv_data)) != kindId)
      return std::nullopt;
    if (v.mv_size != kUuidSize)
      throw MdbError("corrupt boundary index value");
    return Uuid::fromBytes(static_cast<const unsigned char *>(v.mv_data));
  }

  std::vector<Node> collect_from(Txn &tx, Env &env, uint32_t kindId, int64_t threshold)
  {
    std::vector<Uuid> ids;
    {
      Cursor cur(tx, env.byRight());
      MDB_val k{}, v{};
      for (bool ok = cur.seek(key_boundary_be(kindId, threshold), k, v); ok; ok = cur.next(k, v))
      {
        auto id = read_indexed_id(k, v, kindId);
        if (!id)
          break;
        ids.push_back(*id);
      }
    }
    std::vector<Node> out;
    out.reserve(ids.size());
    for (const auto &id : ids)
      out.push_back(require_node(tx, env, kindId, id));
    return out;
  }

  std::vector<Node> scan_by_left(Txn &tx, Env &env, uint32_t kindId, int64_t from, int64_t to, Page page)
  {
    std::vector<Node> out;
    if (from > to)
      return out;
    Cursor cur(tx, env.byLeft());
    MDB_val k{}, v{};
    uint32_t skipped = 0;
    for (bool ok = cur.seek(key_boundary_be(kindId, from), k, v); ok; ok = cur.next(k, v))
    {
      auto id = read_indexed_id(k, v, kindId);
      if (!id)
        break;
      int64_t left = unbias_i64(read_be64(static_cast<const unsigned char *>(k.mv_data) + 4));
      if (left > to)
        break;
      if (skipped < page.offset)
      {
        ++skipped;
        continue;
      }
      out.push_back(require_node(tx, env, kindId, *id));
      if (page.limit != 0 && out.size() >= page.limit)
        break;
    }
    return out;
  }

  std::vector<Uuid> child_ids(Txn &tx, Env &env, uint32_t kindId, const Uuid &parent)
  {
    std::vector<Uuid> out;
    std::string prefix = key_child_prefix_be(kindId, parent);
    Cursor cur(tx, env.children());
    MDB_val k{}, v{};
    for (bool ok = cur.seek(prefix, k, v); ok; ok = cur.next(k, v))
    {
      auto key = view_of(k);
      if (key.size() != kChildKeySize || key.substr(0, prefix.size()) != prefix)
        break;
      out.push_back(Uuid::fromBytes(reinterpret_cast<const unsigned char *>(key.data()) + prefix.size() + 8));
    }
    return out;
  }

  int64_t max_right_below(Txn &tx, Env &env, uint32_t kindId, int64_t below)
  {
    Cursor cur(tx, env.byRight());
    MDB_val k{}, v{};
    bool ok = cur.seek(key_boundary_be(kindId, below), k, v) ? cur.prev(k, v) : cur.last(k, v);
    if (!ok || k.mv_size != kBoundaryKeySize)
      return 0;
    const auto *kb = static_cast<const unsigned char *>(k.mv_data);
    if (read_be32(kb) != kindId)
      return 0;
    return unbias_i64(read_be64(kb + 4));
  }

  int64_t max_right(Txn &tx, Env &env, uint32_t kindId)
  {
    return max_right_below(tx, env, kindId, std::numeric_limits<int64_t>::max());
  }

  void for_each_row(Txn &tx, Env &env, uint32_t kindId, const std::function<void(const Node &)> &fn)
  {
    std::string prefix = key_u32_be(kindId);
    Cursor cur(tx, env.nodes());
    MDB_val k{}, v{};
    for (bool ok = cur.seek(prefix, k, v); ok; ok = cur.next(k, v))
    {
      auto key = view_of(k);
      if (key.size() != 4 + kUuidSize || key.substr(0, 4) != prefix)
        break;
      fn(decode_row(view_of(v)));
    }
  }

  void renumber_siblings(Txn &tx, Env &env, uint32_t kindId, const Uuid &parent)
  {
    std::vector<Node> sibs;
    for (const auto &id : child_ids(tx, env, kindId, parent))
      sibs.push_back(require_node(tx, env, kindId, id));
    std::sort(sibs.begin(), sibs.end(), [](const Node &a, const Node &b)
              { return a.left < b.left; });

    std::vector<std::pair<Node, Node>> changes;
    for (uint64_t i = 0; i < sibs.size(); ++i)
    {
      if (sibs[i].ordering == i)
        continue;
      Node after = sibs[i];
      after.ordering = i;
      changes.emplace_back(std::move(sibs[i]), std::move(after));
    }
    if (!changes.empty())
      rewrite_nodes(tx, env, kindId, changes);
  }

} // namespace canopy::detail
