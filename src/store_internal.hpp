#pragma once
// Row codec and index maintenance shared by store.cpp, query.cpp and validate.cpp.
#include "store.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace canopy::detail
{

  inline MDB_val make_val(std::string_view s)
  {
    return MDB_val{s.size(), const_cast<char *>(s.data())};
  }

  inline std::string_view view_of(const MDB_val &v)
  {
    return std::string_view(static_cast<const char *>(v.mv_data), v.mv_size);
  }

  inline void check_rc(int rc)
  {
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  class Cursor
  {
  public:
    Cursor(Txn &tx, DbHandle dbi)
    {
      check_rc(mdb_cursor_open(tx.get(), dbi, &cur_));
    }
    ~Cursor() noexcept
    {
      if (cur_)
        mdb_cursor_close(cur_);
    }
    Cursor(const Cursor &) = delete;
    Cursor &operator=(const Cursor &) = delete;

    MDB_cursor *get() const { return cur_; }

    // positions at the first key >= start; false when past the end
    bool seek(std::string_view start, MDB_val &k, MDB_val &v)
    {
      k = make_val(start);
      return step(mdb_cursor_get(cur_, &k, &v, MDB_SET_RANGE));
    }
    bool next(MDB_val &k, MDB_val &v) { return step(mdb_cursor_get(cur_, &k, &v, MDB_NEXT)); }
    bool prev(MDB_val &k, MDB_val &v) { return step(mdb_cursor_get(cur_, &k, &v, MDB_PREV)); }
    bool first(MDB_val &k, MDB_val &v) { return step(mdb_cursor_get(cur_, &k, &v, MDB_FIRST)); }
    bool last(MDB_val &k, MDB_val &v) { return step(mdb_cursor_get(cur_, &k, &v, MDB_LAST)); }

  private:
    static bool step(int rc)
    {
      if (rc == MDB_NOTFOUND)
        return false;
      check_rc(rc);
      return true;
    }

    MDB_cursor *cur_{};
  };

  // -------------------- row codec --------------------

  std::string encode_row(const Node &n);
  Node decode_row(std::string_view bytes);

  // -------------------- kinds --------------------

  std::optional<uint32_t> lookup_kind_id(Txn &tx, Env &env, std::string_view kind);
  uint32_t get_or_create_kind_id(Txn &tx, Env &env, std::string_view kind);
  uint32_t require_kind_id(Txn &tx, Env &env, std::string_view kind);

  // -------------------- rows and indexes --------------------

  std::optional<Node> load_node(Txn &tx, Env &env, uint32_t kindId, const Uuid &id);
  Node require_node(Txn &tx, Env &env, uint32_t kindId, const Uuid &id);

  // row plus its byLeft, byRight and children entries
  void put_node(Txn &tx, Env &env, uint32_t kindId, const Node &n);
  void erase_node(Txn &tx, Env &env, uint32_t kindId, const Node &n);

  // Applies (before, after) pairs. Every old index entry goes first so that
  // shifted boundaries never collide with entries that are about to move.
  void rewrite_nodes(Txn &tx, Env &env, uint32_t kindId, const std::vector<std::pair<Node, Node>> &changes);

  // rows whose right >= threshold (left >= threshold implies it)
  std::vector<Node> collect_from(Txn &tx, Env &env, uint32_t kindId, int64_t threshold);

  // rows with from <= left <= to, in left order
  std::vector<Node> scan_by_left(Txn &tx, Env &env, uint32_t kindId, int64_t from, int64_t to, Page page = {});

  // ids filed under parent (nil -> roots), in ordering order
  std::vector<Uuid> child_ids(Txn &tx, Env &env, uint32_t kindId, const Uuid &parent);

  // largest right below `below`, or 0 when there is none
  int64_t max_right_below(Txn &tx, Env &env, uint32_t kindId, int64_t below);
  int64_t max_right(Txn &tx, Env &env, uint32_t kindId);

  // every row of the kind in key order of the nodes table
  void for_each_row(Txn &tx, Env &env, uint32_t kindId, const std::function<void(const Node &)> &fn);

  // dense 0..n-1 ordering in left order for one sibling set
  void renumber_siblings(Txn &tx, Env &env, uint32_t kindId, const Uuid &parent);

  template <typename T>
  std::vector<T> apply_page(std::vector<T> items, const Page &page)
  {
    if (page.offset >= items.size())
      return {};
    items.erase(items.begin(), items.begin() + page.offset);
    if (page.limit != 0 && items.size() > page.limit)
      items.resize(page.limit);
    return items;
  }

} // namespace canopy::detail
