#include "store.hpp"
#include "store_internal.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>
#include <kj/debug.h>

namespace canopy
{
  using namespace detail;

  std::string_view violationName(ViolationKind kind)
  {
    switch (kind)
    {
    case ViolationKind::LeftNotBelowRight:
      return "left_not_below_right";
    case ViolationKind::PartialOverlap:
      return "partial_overlap";
    case ViolationKind::DescendantCount:
      return "descendant_count";
    case ViolationKind::DepthMismatch:
      return "depth_mismatch";
    case ViolationKind::ParentMismatch:
      return "parent_mismatch";
    case ViolationKind::DuplicateBoundary:
      return "duplicate_boundary";
    case ViolationKind::OrderingMismatch:
      return "ordering_mismatch";
    case ViolationKind::IndexMismatch:
      return "index_mismatch";
    }
    return "unknown";
  }

  namespace
  {
    struct UuidHash
    {
      size_t operator()(const Uuid &u) const noexcept
      {
        size_t h = 0;
        for (auto b : u.bytes)
          h = h * 131 + b;
        return h;
      }
    };

    bool by_left(const Node &a, const Node &b)
    {
      return a.left != b.left ? a.left < b.left : a.id < b.id;
    }

    std::string id_or_root(const std::optional<Uuid> &id)
    {
      return id ? id->toString() : std::string("<root>");
    }

    // every key of `dbi` that starts with the 4-byte kind prefix
    std::vector<std::string> keys_of_kind(Txn &tx, DbHandle dbi, uint32_t kindId)
    {
      std::vector<std::string> out;
      std::string prefix = key_u32_be(kindId);
      Cursor cur(tx, dbi);
      MDB_val k{}, v{};
      for (bool ok = cur.seek(prefix, k, v); ok; ok = cur.next(k, v))
      {
        auto key = view_of(k);
        if (key.substr(0, prefix.size()) != prefix)
          break;
        out.emplace_back(key);
      }
      return out;
    }

    class Checker
    {
    public:
      Checker(Txn &tx, Env &env, uint32_t kindId) : tx_(tx), env_(env), kindId_(kindId) {}

      std::vector<InvariantViolation> run()
      {
        for_each_row(tx_, env_, kindId_, [&](const Node &n)
                     { rows_.push_back(n); });
        std::sort(rows_.begin(), rows_.end(), by_left);
        for (const auto &n : rows_)
          byId_.emplace(n.id, &n);

        checkIndexes();
        checkDuplicates();
        checkNesting();
        checkOrdering();
        return std::move(out_);
      }

    private:
      void report(ViolationKind kind, const Uuid &node, std::optional<Uuid> other, std::string detail)
      {
        out_.push_back(InvariantViolation{kind, node, other, std::move(detail)});
      }

      const Node *find(const Uuid &id) const
      {
        auto it = byId_.find(id);
        return it == byId_.end() ? nullptr : it->second;
      }

      void checkBoundaryIndex(DbHandle dbi, bool left)
      {
        const char *side = left ? "byLeft" : "byRight";
        std::string prefix = key_u32_be(kindId_);
        Cursor cur(tx_, dbi);
        MDB_val k{}, v{};
        for (bool ok = cur.seek(prefix, k, v); ok; ok = cur.next(k, v))
        {
          auto key = view_of(k);
          if (key.substr(0, prefix.size()) != prefix)
            break;
          if (key.size() != kBoundaryKeySize || v.mv_size != kUuidSize)
          {
            report(ViolationKind::IndexMismatch, kNilUuid, std::nullopt, std::string("malformed ") + side + " entry");
            continue;
          }
          int64_t boundary = unbias_i64(read_be64(reinterpret_cast<const unsigned char *>(key.data()) + 4));
          Uuid id = Uuid::fromBytes(static_cast<const unsigned char *>(v.mv_data));
          const Node *n = find(id);
          if (!n)
            report(ViolationKind::IndexMismatch, id, std::nullopt,
                   std::string(side) + " " + std::to_string(boundary) + " names a missing row");
          else if ((left ? n->left : n->right) != boundary)
            report(ViolationKind::IndexMismatch, id, std::nullopt,
                   std::string(side) + " " + std::to_string(boundary) + " disagrees with the row");
        }
      }

      void checkIndexes()
      {
        checkBoundaryIndex(env_.byLeft(), true);
        checkBoundaryIndex(env_.byRight(), false);

        std::set<Uuid> filed;
        for (const auto &key : keys_of_kind(tx_, env_.children(), kindId_))
        {
          if (key.size() != kChildKeySize)
          {
            report(ViolationKind::IndexMismatch, kNilUuid, std::nullopt, "malformed children entry");
            continue;
          }
          const auto *p = reinterpret_cast<const unsigned char *>(key.data()) + 4;
          Uuid parent = Uuid::fromBytes(p);
          uint64_t ordering = read_be64(p + kUuidSize);
          Uuid id = Uuid::fromBytes(p + kUuidSize + 8);
          const Node *n = find(id);
          if (!n)
          {
            report(ViolationKind::IndexMismatch, id, std::nullopt, "children entry names a missing row");
            continue;
          }
          if (n->parentId.value_or(kNilUuid) != parent || n->ordering != ordering)
            report(ViolationKind::IndexMismatch, id, std::nullopt, "children entry disagrees with the row");
          filed.insert(id);
        }

        for (const auto &n : rows_)
        {
          if (!filed.count(n.id))
            report(ViolationKind::IndexMismatch, n.id, std::nullopt, "row has no children entry");
          checkBoundaryEntry(env_.byLeft(), n, n.left, "byLeft");
          checkBoundaryEntry(env_.byRight(), n, n.right, "byRight");
        }
      }

      void checkBoundaryEntry(DbHandle dbi, const Node &n, int64_t boundary, const char *side)
      {
        std::string key = key_boundary_be(kindId_, boundary);
        MDB_val k = make_val(key);
        MDB_val v{};
        int rc = mdb_get(tx_.get(), dbi, &k, &v);
        if (rc == MDB_NOTFOUND)
        {
          report(ViolationKind::IndexMismatch, n.id, std::nullopt, std::string("row has no ") + side + " entry");
          return;
        }
        check_rc(rc);
        if (v.mv_size != kUuidSize || Uuid::fromBytes(static_cast<const unsigned char *>(v.mv_data)) != n.id)
        {
          std::optional<Uuid> other;
          if (v.mv_size == kUuidSize)
            other = Uuid::fromBytes(static_cast<const unsigned char *>(v.mv_data));
          report(ViolationKind::IndexMismatch, n.id, other, std::string(side) + " entry belongs to another row");
        }
      }

      void checkDuplicates()
      {
        std::vector<std::pair<int64_t, Uuid>> bounds;
        bounds.reserve(rows_.size() * 2);
        for (const auto &n : rows_)
        {
          bounds.emplace_back(n.left, n.id);
          bounds.emplace_back(n.right, n.id);
        }
        std::sort(bounds.begin(), bounds.end());
        for (size_t i = 1; i < bounds.size(); ++i)
        {
          if (bounds[i].first == bounds[i - 1].first)
            report(ViolationKind::DuplicateBoundary, bounds[i].second, bounds[i - 1].second,
                   "boundary " + std::to_string(bounds[i].first) + " used twice");
        }
      }

      struct Frame
      {
        const Node *node;
        uint64_t seenAtPush;
      };

      void finish(const Frame &f)
      {
        const Node &n = *f.node;
        const int64_t inner = n.right - n.left - 1;
        const uint64_t actual = seen_ - f.seenAtPush;
        if (inner % 2 != 0)
          report(ViolationKind::DescendantCount, n.id, std::nullopt,
                 "odd interval width " + std::to_string(n.right - n.left + 1));
        else if (actual != static_cast<uint64_t>(inner / 2))
          report(ViolationKind::DescendantCount, n.id, std::nullopt,
                 "expected " + std::to_string(inner / 2) + " descendants, found " + std::to_string(actual));
      }

      // one pass in left order with a stack of open intervals
      void checkNesting()
      {
        std::vector<Frame> stack;
        for (const auto &n : rows_)
        {
          if (n.left >= n.right)
          {
            report(ViolationKind::LeftNotBelowRight, n.id, std::nullopt,
                   "left " + std::to_string(n.left) + " >= right " + std::to_string(n.right));
            continue;
          }
          while (!stack.empty() && stack.back().node->right < n.left)
          {
            finish(stack.back());
            stack.pop_back();
          }
          ++seen_;
          if (!stack.empty() && n.right > stack.back().node->right)
          {
            report(ViolationKind::PartialOverlap, n.id, stack.back().node->id,
                   "interval crosses the right edge of " + stack.back().node->id.toString());
            continue;
          }

          std::optional<Uuid> enclosing;
          if (!stack.empty())
            enclosing = stack.back().node->id;
          if (enclosing != n.parentId)
            report(ViolationKind::ParentMismatch, n.id, enclosing ? enclosing : n.parentId,
                   "stored parent " + id_or_root(n.parentId) + ", enclosed by " + id_or_root(enclosing));

          if (n.depth != stack.size())
            report(ViolationKind::DepthMismatch, n.id, enclosing,
                   "depth " + std::to_string(n.depth) + ", expected " + std::to_string(stack.size()));

          stack.push_back(Frame{&n, seen_});
        }
        while (!stack.empty())
        {
          finish(stack.back());
          stack.pop_back();
        }
      }

      void checkOrdering()
      {
        std::map<Uuid, std::vector<const Node *>> groups;
        for (const auto &n : rows_)
          groups[n.parentId.value_or(kNilUuid)].push_back(&n);
        for (const auto &[parent, sibs] : groups)
        {
          // sibs are already in left order
          for (size_t i = 0; i < sibs.size(); ++i)
          {
            if (sibs[i]->ordering != i)
              report(ViolationKind::OrderingMismatch, sibs[i]->id, std::nullopt,
                     "ordering " + std::to_string(sibs[i]->ordering) + " at sibling slot " + std::to_string(i));
          }
        }
      }

      Txn &tx_;
      Env &env_;
      uint32_t kindId_;
      std::vector<Node> rows_;
      std::unordered_map<Uuid, const Node *, UuidHash> byId_;
      uint64_t seen_{0};
      std::vector<InvariantViolation> out_;
    };
  } // namespace

  std::vector<InvariantViolation> HierarchyStore::validate(std::string_view kind)
  {
    Txn tx = env_.beginRead();
    return validate(tx, kind);
  }

  std::vector<InvariantViolation> HierarchyStore::validate(Txn &tx, std::string_view kind)
  {
    auto kindId = lookup_kind_id(tx, env_, kind);
    if (!kindId)
      return {};
    return Checker(tx, env_, *kindId).run();
  }

  // -------------------- rebuild ---------------------------

  TreeStats HierarchyStore::rebuild(std::string_view kind)
  {
    Txn tx = env_.beginWrite();
    uint32_t kindId = require_kind_id(tx, env_, kind);
    const std::string kindName(kind);

    std::vector<Node> rows;
    for_each_row(tx, env_, kindId, [&](const Node &n)
                 { rows.push_back(n); });
    std::sort(rows.begin(), rows.end(), by_left);

    std::unordered_map<Uuid, size_t, UuidHash> index;
    for (size_t i = 0; i < rows.size(); ++i)
      index.emplace(rows[i].id, i);

    uint64_t promoted = 0;
    for (auto &n : rows)
    {
      if (n.parentId && (*n.parentId == n.id || !index.count(*n.parentId)))
      {
        KJ_LOG(WARNING, "rebuild: parent missing, promoting to root", kindName.c_str(), n.id.toString().c_str(),
               n.parentId->toString().c_str());
        n.parentId.reset();
        ++promoted;
      }
    }

    // children lists in the current sibling order
    std::map<Uuid, std::vector<size_t>> kids;
    std::vector<size_t> roots;
    for (size_t i = 0; i < rows.size(); ++i)
    {
      if (rows[i].parentId)
        kids[*rows[i].parentId].push_back(i);
      else
        roots.push_back(i);
    }
    auto order = [&](size_t a, size_t b)
    {
      if (rows[a].ordering != rows[b].ordering)
        return rows[a].ordering < rows[b].ordering;
      return by_left(rows[a], rows[b]);
    };
    for (auto &[parent, list] : kids)
      std::sort(list.begin(), list.end(), order);
    std::sort(roots.begin(), roots.end(), order);

    std::vector<bool> reached(rows.size(), false);
    int64_t counter = 1;
    uint64_t rootOrdering = 0;

    auto number_from = [&](size_t root)
    {
      struct Step
      {
        size_t row;
        size_t next;
      };
      rows[root].depth = 0;
      rows[root].ordering = rootOrdering++;
      rows[root].left = counter++;
      reached[root] = true;
      std::vector<Step> stack{{root, 0}};
      while (!stack.empty())
      {
        Step &top = stack.back();
        auto it = kids.find(rows[top.row].id);
        if (it != kids.end() && top.next < it->second.size())
        {
          size_t child = it->second[top.next];
          uint64_t slot = top.next++;
          if (reached[child])
            continue;
          Node &c = rows[child];
          c.depth = rows[top.row].depth + 1;
          c.ordering = slot;
          c.left = counter++;
          reached[child] = true;
          stack.push_back(Step{child, 0});
          continue;
        }
        rows[top.row].right = counter++;
        stack.pop_back();
      }
    };

    for (size_t r : roots)
      number_from(r);

    // whatever is left hangs off a parent cycle
    for (size_t i = 0; i < rows.size(); ++i)
    {
      if (reached[i])
        continue;
      Node &n = rows[i];
      KJ_LOG(WARNING, "rebuild: parent cycle, promoting to root", kindName.c_str(), n.id.toString().c_str(),
             n.parentId->toString().c_str());
      auto &list = kids[*n.parentId];
      list.erase(std::remove(list.begin(), list.end(), i), list.end());
      n.parentId.reset();
      ++promoted;
      number_from(i);
    }

    // sibling slots are dense again only if promoted rows left no gaps
    for (auto &[parent, list] : kids)
    {
      uint64_t slot = 0;
      for (size_t i : list)
        if (rows[i].parentId && *rows[i].parentId == parent)
          rows[i].ordering = slot++;
    }

    for (DbHandle dbi : {env_.byLeft(), env_.byRight(), env_.children()})
    {
      for (const auto &key : keys_of_kind(tx, dbi, kindId))
      {
        MDB_val k = make_val(key);
        check_rc(mdb_del(tx.get(), dbi, &k, nullptr));
      }
    }
    for (const auto &n : rows)
      put_node(tx, env_, kindId, n);

    auto violations = validate(tx, kind);
    if (!violations.empty())
    {
      const auto &first = violations.front();
      KJ_LOG(ERROR, "rebuild left violations", kindName.c_str(), violations.size(), first.detail.c_str());
      throw InvariantViolationError("rebuild of '" + kindName + "' failed: " + std::string(violationName(first.kind)) +
                                    ": " + first.detail);
    }
    tx.commit();

    KJ_LOG(INFO, "rebuilt kind", kindName.c_str(), rows.size(), promoted);
    return stats(kind);
  }

} // namespace canopy
