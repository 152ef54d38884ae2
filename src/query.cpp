#include "store.hpp"
#include "store_internal.hpp"
#include <algorithm>
#include <map>
#include <kj/debug.h>

namespace canopy
{
  using namespace detail;

  namespace
  {
    std::vector<Node> load_all(Txn &tx, Env &env, uint32_t kindId, const std::vector<Uuid> &ids)
    {
      std::vector<Node> out;
      out.reserve(ids.size());
      for (const auto &id : ids)
        out.push_back(require_node(tx, env, kindId, id));
      return out;
    }

    // parent chain, root first; stops with a warning on a dangling parent
    std::vector<Node> walk_ancestors(Txn &tx, Env &env, uint32_t kindId, const Node &n)
    {
      std::vector<Node> out;
      std::optional<Uuid> cur = n.parentId;
      while (cur)
      {
        if (out.size() >= n.depth)
        {
          KJ_LOG(WARNING, "parent chain longer than depth, possible cycle", n.id.toString().c_str());
          break;
        }
        auto p = load_node(tx, env, kindId, *cur);
        if (!p)
        {
          KJ_LOG(WARNING, "dangling parent reference", n.id.toString().c_str(), cur->toString().c_str());
          break;
        }
        cur = p->parentId;
        out.push_back(std::move(*p));
      }
      std::reverse(out.begin(), out.end());
      return out;
    }
  } // namespace

  Node HierarchyStore::getNode(const NodeRef &ref)
  {
    Txn tx = env_.beginRead();
    return require_node(tx, env_, require_kind_id(tx, env_, ref.kind), ref.id);
  }

  std::vector<Node> HierarchyStore::children(const NodeRef &ref, Page page)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    return load_all(tx, env_, kindId, apply_page(child_ids(tx, env_, kindId, n.id), page));
  }

  std::vector<Node> HierarchyStore::descendants(const NodeRef &ref, Page page)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    return scan_by_left(tx, env_, kindId, n.left + 1, n.right - 1, page);
  }

  std::vector<Node> HierarchyStore::ancestors(const NodeRef &ref)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    return walk_ancestors(tx, env_, kindId, n);
  }

  std::vector<Node> HierarchyStore::siblings(const NodeRef &ref, Page page)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    auto ids = child_ids(tx, env_, kindId, n.parentId.value_or(kNilUuid));
    ids.erase(std::remove(ids.begin(), ids.end(), n.id), ids.end());
    return load_all(tx, env_, kindId, apply_page(std::move(ids), page));
  }

  std::vector<Node> HierarchyStore::roots(std::string_view kind, Page page)
  {
    Txn tx = env_.beginRead();
    auto kindId = lookup_kind_id(tx, env_, kind);
    if (!kindId)
      return {};
    return load_all(tx, env_, *kindId, apply_page(child_ids(tx, env_, *kindId, kNilUuid), page));
  }

  std::vector<Node> HierarchyStore::pathToRoot(const NodeRef &ref)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    auto out = walk_ancestors(tx, env_, kindId, n);
    out.push_back(std::move(n));
    return out;
  }

  std::vector<Node> HierarchyStore::subtree(const NodeRef &ref, Page page)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    return scan_by_left(tx, env_, kindId, n.left, n.right - 1, page);
  }

  bool HierarchyStore::isDescendant(std::string_view kind, const Uuid &ancestor, const Uuid &descendant)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, kind);
    Node a = require_node(tx, env_, kindId, ancestor);
    Node d = require_node(tx, env_, kindId, descendant);
    return a.left < d.left && a.right > d.right;
  }

  uint64_t HierarchyStore::countChildren(const NodeRef &ref)
  {
    Txn tx = env_.beginRead();
    uint32_t kindId = require_kind_id(tx, env_, ref.kind);
    Node n = require_node(tx, env_, kindId, ref.id);
    return child_ids(tx, env_, kindId, n.id).size();
  }

  uint64_t HierarchyStore::countDescendants(const NodeRef &ref)
  {
    Node n = getNode(ref);
    return static_cast<uint64_t>((n.right - n.left - 1) / 2);
  }

  uint64_t HierarchyStore::subtreeSize(const NodeRef &ref)
  {
    Node n = getNode(ref);
    return static_cast<uint64_t>((n.right - n.left + 1) / 2);
  }

  uint32_t HierarchyStore::treeHeight(std::string_view kind)
  {
    return stats(kind).height;
  }

  uint64_t HierarchyStore::levelWidth(std::string_view kind, uint32_t depth)
  {
    Txn tx = env_.beginRead();
    auto kindId = lookup_kind_id(tx, env_, kind);
    if (!kindId)
      return 0;
    uint64_t count = 0;
    for_each_row(tx, env_, *kindId, [&](const Node &n)
                 {
      if (n.depth == depth)
        ++count; });
    return count;
  }

  TreeStats HierarchyStore::stats(std::string_view kind)
  {
    TreeStats out{};
    Txn tx = env_.beginRead();
    auto kindId = lookup_kind_id(tx, env_, kind);
    if (!kindId)
      return out;

    std::map<uint32_t, uint64_t> widths;
    uint64_t depthSum = 0;
    for_each_row(tx, env_, *kindId, [&](const Node &n)
                 {
      ++out.totalNodes;
      if (!n.parentId)
        ++out.rootNodes;
      if (n.right == n.left + 1)
        ++out.leafNodes;
      out.height = std::max(out.height, n.depth);
      depthSum += n.depth;
      ++widths[n.depth]; });

    if (out.totalNodes != 0)
      out.averageDepth = static_cast<double>(depthSum) / static_cast<double>(out.totalNodes);
    for (const auto &[depth, width] : widths)
      out.maxWidth = std::max(out.maxWidth, width);
    return out;
  }

  std::vector<std::string> HierarchyStore::listKinds()
  {
    std::vector<std::string> out;
    Txn tx = env_.beginRead();
    Cursor cur(tx, env_.kindsByName());
    MDB_val k{}, v{};
    for (bool ok = cur.first(k, v); ok; ok = cur.next(k, v))
      out.emplace_back(view_of(k));
    return out;
  }

} // namespace canopy
