#include "store.hpp"
#include "store_internal.hpp"
#include <algorithm>
#include <type_traits>
#include <kj/debug.h>

namespace canopy
{
  using namespace detail;

  namespace
  {
    void require_writable(const Txn &tx)
    {
      if (!tx.writable())
        throw InvalidOperationError("structural writes need a read-write transaction");
    }

    // (before, after) for every row of `rows` that `fn` actually changes
    template <typename Fn>
    std::vector<std::pair<Node, Node>> plan(std::vector<Node> rows, Fn &&fn)
    {
      std::vector<std::pair<Node, Node>> changes;
      for (auto &row : rows)
      {
        Node after = row;
        fn(after);
        if (after.left != row.left || after.right != row.right || after.depth != row.depth || after.parentId != row.parentId)
          changes.emplace_back(std::move(row), std::move(after));
      }
      return changes;
    }

    // left of the sibling currently in slot `position`, if there is one
    std::optional<int64_t> slot_left(Txn &tx, Env &env, uint32_t kindId, const std::vector<Uuid> &sibs,
                                     const std::optional<uint64_t> &position)
    {
      if (!position || *position >= sibs.size())
        return std::nullopt;
      return require_node(tx, env, kindId, sibs[*position]).left;
    }

    [[noreturn]] void fail_check(std::string_view kind, const Uuid &id, const std::string &why)
    {
      KJ_LOG(WARNING, "post-write check failed", std::string(kind).c_str(), id.toString().c_str(), why.c_str());
      throw InvariantViolationError("node " + id.toString() + ": " + why);
    }
  } // namespace

  // -------------------- insert ---------------------------

  Node HierarchyStore::insert(const InsertParams &params)
  {
    Txn tx = env_.beginWrite();
    Node out = applyInsert(tx, params);
    tx.commit();
    return out;
  }

  Node HierarchyStore::insert(Txn &tx, const InsertParams &params)
  {
    require_writable(tx);
    Txn sub = tx.nested();
    Node out = applyInsert(sub, params);
    sub.commit();
    return out;
  }

  Node HierarchyStore::applyInsert(Txn &tx, const InsertParams &params)
  {
    if (params.id.isNil())
      throw InvalidOperationError("node id must not be the nil uuid");
    uint32_t kindId = get_or_create_kind_id(tx, env_, params.kind);
    if (load_node(tx, env_, kindId, params.id))
      throw InvalidOperationError("node " + params.id.toString() + " already exists in kind '" + params.kind + "'");

    Node n{};
    n.id = params.id;
    n.parentId = params.parentId;
    n.attributes = params.attributes;

    Uuid siblingKey = params.parentId.value_or(kNilUuid);
    std::optional<Node> parent;
    if (params.parentId)
    {
      parent = load_node(tx, env_, kindId, *params.parentId);
      if (!parent)
        throw NotFoundError("parent " + params.parentId->toString() + " not found in kind '" + params.kind + "'");
    }

    auto sibs = child_ids(tx, env_, kindId, siblingKey);
    std::optional<int64_t> point = slot_left(tx, env_, kindId, sibs, params.position);
    if (!point && parent)
      point = parent->right;

    if (point)
    {
      // open a two-wide gap at the insertion point; widens every enclosing interval
      int64_t at = *point;
      auto changes = plan(collect_from(tx, env_, kindId, at), [at](Node &row)
                          {
        if (row.left >= at)
          row.left += 2;
        if (row.right >= at)
          row.right += 2; });
      rewrite_nodes(tx, env_, kindId, changes);
      n.left = at;
    }
    else
    {
      n.left = max_right(tx, env_, kindId) + 1;
    }
    n.right = n.left + 1;
    n.depth = parent ? parent->depth + 1 : 0;
    n.ordering = sibs.size();
    put_node(tx, env_, kindId, n);
    renumber_siblings(tx, env_, kindId, siblingKey);

    checkAfterWrite(tx, kindId, params.kind, n.id);
    KJ_LOG(INFO, "inserted node", params.kind.c_str(), n.id.toString().c_str(), n.left, n.depth);
    return require_node(tx, env_, kindId, n.id);
  }

  // -------------------- delete ---------------------------

  void HierarchyStore::remove(const DeleteParams &params)
  {
    Txn tx = env_.beginWrite();
    applyRemove(tx, params);
    tx.commit();
  }

  void HierarchyStore::remove(Txn &tx, const DeleteParams &params)
  {
    require_writable(tx);
    Txn sub = tx.nested();
    applyRemove(sub, params);
    sub.commit();
  }

  void HierarchyStore::applyRemove(Txn &tx, const DeleteParams &params)
  {
    uint32_t kindId = require_kind_id(tx, env_, params.kind);
    Node n = require_node(tx, env_, kindId, params.id);
    if (!params.cascade && n.right - n.left > 1)
      throw InvalidOperationError("node " + n.id.toString() + " has children; delete without cascade would orphan them");

    const int64_t left = n.left;
    const int64_t right = n.right;
    const int64_t width = right - left + 1;

    for (const auto &doomed : scan_by_left(tx, env_, kindId, left, right))
      erase_node(tx, env_, kindId, doomed);

    // close the gap
    auto changes = plan(collect_from(tx, env_, kindId, right + 1), [right, width](Node &row)
                        {
      if (row.left > right)
        row.left -= width;
      if (row.right > right)
        row.right -= width; });
    rewrite_nodes(tx, env_, kindId, changes);
    renumber_siblings(tx, env_, kindId, n.parentId.value_or(kNilUuid));

    checkAfterWrite(tx, kindId, params.kind, n.parentId);
    KJ_LOG(INFO, "deleted subtree", params.kind.c_str(), n.id.toString().c_str(), width / 2);
  }

  // -------------------- move ---------------------------

  Node HierarchyStore::move(const MoveParams &params)
  {
    Txn tx = env_.beginWrite();
    Node out = applyMove(tx, params);
    tx.commit();
    return out;
  }

  Node HierarchyStore::move(Txn &tx, const MoveParams &params)
  {
    require_writable(tx);
    Txn sub = tx.nested();
    Node out = applyMove(sub, params);
    sub.commit();
    return out;
  }

  Node HierarchyStore::applyMove(Txn &tx, const MoveParams &params)
  {
    uint32_t kindId = require_kind_id(tx, env_, params.kind);
    Node n = require_node(tx, env_, kindId, params.id);

    const int64_t L = n.left;
    const int64_t R = n.right;
    const int64_t width = R - L + 1;

    std::optional<Node> parent;
    if (params.newParentId)
    {
      if (*params.newParentId == n.id)
        throw CyclicMoveError("cannot move node " + n.id.toString() + " under itself");
      parent = load_node(tx, env_, kindId, *params.newParentId);
      if (!parent)
        throw NotFoundError("new parent " + params.newParentId->toString() + " not found in kind '" + params.kind + "'");
      if (parent->left >= L && parent->right <= R)
        throw CyclicMoveError("cannot move node " + n.id.toString() + " under its descendant " + parent->id.toString());
    }

    // Positions are computed as if the subtree were already cut out ("closed" numbering).
    auto close = [R, width](int64_t x)
    { return x > R ? x - width : x; };

    Uuid oldSiblingKey = n.parentId.value_or(kNilUuid);
    Uuid newSiblingKey = params.newParentId.value_or(kNilUuid);
    auto sibs = child_ids(tx, env_, kindId, newSiblingKey);
    sibs.erase(std::remove(sibs.begin(), sibs.end(), n.id), sibs.end());

    int64_t point = 0;
    if (auto at = slot_left(tx, env_, kindId, sibs, params.position))
      point = close(*at);
    else if (parent)
      point = close(parent->right);
    else
    {
      int64_t top = max_right(tx, env_, kindId);
      point = (top > R ? close(top) : max_right_below(tx, env_, kindId, L)) + 1;
    }

    const int64_t newDepth = parent ? int64_t(parent->depth) + 1 : 0;
    const int64_t depthDelta = newDepth - int64_t(n.depth);
    const int64_t lo = std::min(L, point);

    auto changes = plan(collect_from(tx, env_, kindId, lo), [&](Node &row)
                        {
      if (row.left >= L && row.right <= R)
      {
        row.left = row.left - L + point;
        row.right = row.right - L + point;
        row.depth = static_cast<uint32_t>(int64_t(row.depth) + depthDelta);
        if (row.id == n.id)
          row.parentId = params.newParentId;
        return;
      }
      int64_t l = close(row.left);
      int64_t r = close(row.right);
      row.left = l >= point ? l + width : l;
      row.right = r >= point ? r + width : r; });
    rewrite_nodes(tx, env_, kindId, changes);

    renumber_siblings(tx, env_, kindId, oldSiblingKey);
    if (newSiblingKey != oldSiblingKey)
      renumber_siblings(tx, env_, kindId, newSiblingKey);

    checkAfterWrite(tx, kindId, params.kind, n.id);
    KJ_LOG(INFO, "moved subtree", params.kind.c_str(), n.id.toString().c_str(), width / 2, point);
    return require_node(tx, env_, kindId, n.id);
  }

  // -------------------- attributes ---------------------------

  Node HierarchyStore::updateAttributes(const UpdateAttributesParams &params)
  {
    Txn tx = env_.beginWrite();
    Node out = applyUpdate(tx, params);
    tx.commit();
    return out;
  }

  Node HierarchyStore::updateAttributes(Txn &tx, const UpdateAttributesParams &params)
  {
    require_writable(tx);
    Txn sub = tx.nested();
    Node out = applyUpdate(sub, params);
    sub.commit();
    return out;
  }

  Node HierarchyStore::applyUpdate(Txn &tx, const UpdateAttributesParams &params)
  {
    uint32_t kindId = require_kind_id(tx, env_, params.kind);
    Node n = require_node(tx, env_, kindId, params.id);

    if (!params.unsetKeys.empty())
    {
      n.attributes.erase(
          std::remove_if(n.attributes.begin(), n.attributes.end(), [&](const Attribute &a)
                         { return std::find(params.unsetKeys.begin(), params.unsetKeys.end(), a.key) != params.unsetKeys.end(); }),
          n.attributes.end());
    }

    // set: replace or add
    for (const auto &a : params.set)
    {
      bool found = false;
      for (auto &have : n.attributes)
      {
        if (have.key == a.key)
        {
          have.val = a.val;
          found = true;
          break;
        }
      }
      if (!found)
        n.attributes.push_back(a);
    }

    // interval fields are untouched, so the index entries stay valid
    MDB_val k = make_val(key_node_be(kindId, n.id));
    std::string row = encode_row(n);
    MDB_val v = make_val(row);
    check_rc(mdb_put(tx.get(), env_.nodes(), &k, &v, 0));
    return n;
  }

  // -------------------- batch ---------------------------

  std::vector<Node> HierarchyStore::writeBatch(const std::vector<WriteOp> &ops)
  {
    Txn tx = env_.beginWrite();
    // (kind, id) of every written node, first appearance first
    std::vector<std::pair<std::string, Uuid>> written;
    auto note = [&written](const std::string &kind, const Uuid &id)
    {
      std::pair<std::string, Uuid> key{kind, id};
      if (std::find(written.begin(), written.end(), key) == written.end())
        written.push_back(std::move(key));
    };
    for (const auto &op : ops)
    {
      std::visit([&](const auto &params)
                 {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, DeleteParams>)
          applyRemove(tx, params);
        else if constexpr (std::is_same_v<T, InsertParams>)
          note(params.kind, applyInsert(tx, params).id);
        else if constexpr (std::is_same_v<T, MoveParams>)
          note(params.kind, applyMove(tx, params).id);
        else
          note(params.kind, applyUpdate(tx, params).id); },
                 op);
    }

    // later ops renumber rows written by earlier ones; report the final state
    std::vector<Node> out;
    out.reserve(written.size());
    for (const auto &[kind, id] : written)
    {
      auto kindId = lookup_kind_id(tx, env_, kind);
      if (!kindId)
        continue;
      if (auto n = load_node(tx, env_, *kindId, id))
        out.push_back(std::move(*n));
    }
    tx.commit();
    return out;
  }

  // -------------------- post-write check ---------------------------

  void HierarchyStore::checkAfterWrite(Txn &tx, uint32_t kindId, std::string_view kind, const std::optional<Uuid> &touched)
  {
    if (opts_.check == CheckMode::Off)
      return;

    if (opts_.check == CheckMode::Full)
    {
      auto violations = validate(tx, kind);
      if (violations.empty())
        return;
      const auto &first = violations.front();
      KJ_LOG(WARNING, "post-write validation failed", std::string(kind).c_str(), violations.size(),
             std::string(violationName(first.kind)).c_str(), first.detail.c_str());
      throw InvariantViolationError(std::string(violationName(first.kind)) + ": " + first.detail);
    }

    if (!touched)
      return;
    auto fail = [&](const std::string &why)
    { fail_check(kind, *touched, why); };

    auto n = load_node(tx, env_, kindId, *touched);
    if (!n)
      fail("row missing after write");
    if (n->left >= n->right)
      fail("left >= right");
    const int64_t inner = n->right - n->left - 1;
    if (inner % 2 != 0)
      fail("interval width is odd");
    auto contained = scan_by_left(tx, env_, kindId, n->left + 1, n->right - 1);
    if (int64_t(contained.size()) != inner / 2)
      fail("interval holds " + std::to_string(contained.size()) + " rows, expected " + std::to_string(inner / 2));
    for (const auto &c : contained)
    {
      if (c.right >= n->right)
        fail("partial overlap with " + c.id.toString());
    }

    if (!n->parentId)
    {
      if (n->depth != 0)
        fail("root with depth " + std::to_string(n->depth));
      return;
    }
    auto p = load_node(tx, env_, kindId, *n->parentId);
    if (!p)
      fail("parent " + n->parentId->toString() + " missing");
    if (!(p->left < n->left && n->right < p->right))
      fail("interval not inside parent " + p->id.toString());
    if (n->depth != p->depth + 1)
      fail("depth " + std::to_string(n->depth) + " under parent depth " + std::to_string(p->depth));
  }

} // namespace canopy
