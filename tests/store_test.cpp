#include "env.hpp"
#include "store.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <random>
#include <thread>

using canopy::CyclicMoveError;
using canopy::HierarchyStore;
using canopy::InvalidOperationError;
using canopy::Node;
using canopy::NodeRef;
using canopy::NotFoundError;
using canopy::Uuid;

namespace
{

  const std::string kTax = "taxonomy";

  std::vector<Uuid> idsOf(const std::vector<Node> &nodes)
  {
    std::vector<Uuid> out;
    for (const auto &n : nodes)
      out.push_back(n.id);
    return out;
  }

  void expectInterval(const Node &n, int64_t left, int64_t right, uint32_t depth)
  {
    EXPECT_EQ(n.left, left) << n.id.toString();
    EXPECT_EQ(n.right, right) << n.id.toString();
    EXPECT_EQ(n.depth, depth) << n.id.toString();
  }

} // namespace

class StoreTest : public ::testing::Test
{
protected:
  canopy::testing::TempDir dir{"canopy-store-test-"};
  canopy::Env env{dir.path, size_t(64) << 20};
  HierarchyStore store{env};

  Node add(const std::optional<Uuid> &parent, std::optional<uint64_t> position = std::nullopt,
           const std::string &kind = kTax)
  {
    return store.insert(canopy::InsertParams{.kind = kind, .id = Uuid::random(), .parentId = parent, .position = position});
  }

  Node get(const Uuid &id, const std::string &kind = kTax)
  {
    return store.getNode(NodeRef{kind, id});
  }

  Node moveTo(const Uuid &id, const std::optional<Uuid> &parent, std::optional<uint64_t> position = std::nullopt)
  {
    return store.move(canopy::MoveParams{.kind = kTax, .id = id, .newParentId = parent, .position = position});
  }

  void expectValid(const std::string &kind = kTax)
  {
    auto v = store.validate(kind);
    EXPECT_TRUE(v.empty()) << v.size() << " violation(s), first: "
                           << (v.empty() ? std::string() : v.front().detail);
  }
};

TEST_F(StoreTest, InsertRootThenChildren)
{
  Node a = add(std::nullopt);
  expectInterval(a, 1, 2, 0);
  EXPECT_FALSE(a.parentId.has_value());

  Node b = add(a.id);
  expectInterval(b, 2, 3, 1);
  expectInterval(get(a.id), 1, 4, 0);

  Node c = add(a.id);
  expectInterval(c, 4, 5, 1);
  expectInterval(get(a.id), 1, 6, 0);
  expectInterval(get(b.id), 2, 3, 1);
  EXPECT_EQ(get(b.id).ordering, 0u);
  EXPECT_EQ(c.ordering, 1u);
  expectValid();
}

TEST_F(StoreTest, DeleteClosesTheGap)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node c = add(a.id);

  store.remove(canopy::DeleteParams{.kind = kTax, .id = b.id});

  expectInterval(get(a.id), 1, 4, 0);
  Node c2 = get(c.id);
  expectInterval(c2, 2, 3, 1);
  EXPECT_EQ(c2.ordering, 0u);
  EXPECT_THROW(get(b.id), NotFoundError);
  expectValid();
}

TEST_F(StoreTest, DeleteRemovesWholeSubtree)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node d = add(b.id);
  Node e = add(d.id);
  Node c = add(a.id);

  store.remove(canopy::DeleteParams{.kind = kTax, .id = b.id});

  EXPECT_THROW(get(d.id), NotFoundError);
  EXPECT_THROW(get(e.id), NotFoundError);
  expectInterval(get(a.id), 1, 4, 0);
  expectInterval(get(c.id), 2, 3, 1);
  EXPECT_EQ(store.stats(kTax).totalNodes, 2u);
  expectValid();
}

TEST_F(StoreTest, NonCascadingDeleteRefusesParents)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);

  EXPECT_THROW(store.remove(canopy::DeleteParams{.kind = kTax, .id = a.id, .cascade = false}), InvalidOperationError);
  expectInterval(get(a.id), 1, 4, 0);

  store.remove(canopy::DeleteParams{.kind = kTax, .id = b.id, .cascade = false});
  expectInterval(get(a.id), 1, 2, 0);
  expectValid();
}

TEST_F(StoreTest, MoveRootSubtreeUnderRoot)
{
  Node b = add(std::nullopt);
  Node c = add(std::nullopt);
  Node d = add(c.id);
  Node e = add(c.id);
  expectInterval(get(c.id), 3, 8, 0);

  Node moved = moveTo(c.id, b.id);

  expectInterval(moved, 2, 7, 1);
  ASSERT_TRUE(moved.parentId.has_value());
  EXPECT_EQ(*moved.parentId, b.id);
  expectInterval(get(d.id), 3, 4, 2);
  expectInterval(get(e.id), 5, 6, 2);
  expectInterval(get(b.id), 1, 8, 0);
  expectValid();
}

TEST_F(StoreTest, MoveGrowsEveryAncestorOfTheTarget)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node x = add(std::nullopt);
  Node c = add(x.id);
  Node d = add(c.id);
  Node e = add(c.id);
  expectInterval(get(x.id), 5, 12, 0);

  moveTo(c.id, b.id);

  expectInterval(get(a.id), 1, 10, 0);
  expectInterval(get(b.id), 2, 9, 1);
  expectInterval(get(c.id), 3, 8, 2);
  expectInterval(get(d.id), 4, 5, 3);
  expectInterval(get(e.id), 6, 7, 3);
  expectInterval(get(x.id), 11, 12, 0);
  expectValid();
}

TEST_F(StoreTest, MoveToRootLevel)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node c = add(a.id);

  Node moved = moveTo(b.id, std::nullopt);
  expectInterval(moved, 5, 6, 0);
  EXPECT_FALSE(moved.parentId.has_value());
  EXPECT_EQ(moved.ordering, 1u);
  expectInterval(get(a.id), 1, 4, 0);
  expectInterval(get(c.id), 2, 3, 1);
  expectValid();

  // first root to the end of the root list
  moveTo(a.id, std::nullopt);
  expectInterval(get(b.id), 1, 2, 0);
  expectInterval(get(a.id), 3, 6, 0);
  expectInterval(get(c.id), 4, 5, 1);
  EXPECT_EQ(idsOf(store.roots(kTax)), (std::vector<Uuid>{b.id, a.id}));
  expectValid();
}

TEST_F(StoreTest, HintedMovesLandInTheRequestedSlot)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node c = add(a.id);
  Node x = add(std::nullopt);

  // child to the front of the root list
  Node moved = moveTo(c.id, std::nullopt, 0);
  expectInterval(moved, 1, 2, 0);
  EXPECT_EQ(moved.ordering, 0u);
  expectInterval(get(a.id), 3, 6, 0);
  expectInterval(get(b.id), 4, 5, 1);
  expectInterval(get(x.id), 7, 8, 0);
  EXPECT_EQ(idsOf(store.roots(kTax)), (std::vector<Uuid>{c.id, a.id, x.id}));
  expectValid();

  // a hint past the end of an empty child list appends
  moveTo(b.id, x.id, 0);
  expectInterval(get(a.id), 3, 4, 0);
  expectInterval(get(x.id), 5, 8, 0);
  expectInterval(get(b.id), 6, 7, 1);

  // to the front of another parent's children
  Node p = add(a.id);
  expectInterval(p, 4, 5, 1);
  moved = moveTo(p.id, x.id, 0);
  expectInterval(moved, 6, 7, 1);
  EXPECT_EQ(moved.ordering, 0u);
  expectInterval(get(a.id), 3, 4, 0);
  expectInterval(get(x.id), 5, 10, 0);
  expectInterval(get(b.id), 8, 9, 1);
  EXPECT_EQ(get(b.id).ordering, 1u);
  EXPECT_EQ(idsOf(store.children(NodeRef{kTax, x.id})), (std::vector<Uuid>{p.id, b.id}));
  expectValid();
}

TEST_F(StoreTest, MoveUnderSelfOrDescendantIsRejected)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node d = add(b.id);

  EXPECT_THROW(moveTo(a.id, a.id), CyclicMoveError);
  EXPECT_THROW(moveTo(a.id, b.id), CyclicMoveError);
  EXPECT_THROW(moveTo(b.id, d.id), CyclicMoveError);

  expectInterval(get(a.id), 1, 6, 0);
  expectInterval(get(b.id), 2, 5, 1);
  expectInterval(get(d.id), 3, 4, 2);
  expectValid();
}

TEST_F(StoreTest, PositionsReorderSiblings)
{
  Node a = add(std::nullopt);
  Node c0 = add(a.id);
  Node c1 = add(a.id);
  Node c2 = add(a.id);

  Node n = add(a.id, 1);
  expectInterval(n, 4, 5, 1);
  EXPECT_EQ(idsOf(store.children(NodeRef{kTax, a.id})), (std::vector<Uuid>{c0.id, n.id, c1.id, c2.id}));

  moveTo(c2.id, a.id, 0);
  auto kids = store.children(NodeRef{kTax, a.id});
  EXPECT_EQ(idsOf(kids), (std::vector<Uuid>{c2.id, c0.id, n.id, c1.id}));
  for (uint64_t i = 0; i < kids.size(); ++i)
    EXPECT_EQ(kids[i].ordering, i);
  expectInterval(get(c2.id), 2, 3, 1);

  Node last = add(a.id, 99);
  EXPECT_EQ(last.ordering, 4u);
  EXPECT_EQ(last.right + 1, get(a.id).right);
  expectValid();
}

TEST_F(StoreTest, RootPositions)
{
  Node r1 = add(std::nullopt);
  Node r2 = add(std::nullopt);
  Node r0 = add(std::nullopt, 0);

  expectInterval(r0, 1, 2, 0);
  expectInterval(get(r1.id), 3, 4, 0);
  expectInterval(get(r2.id), 5, 6, 0);
  EXPECT_EQ(idsOf(store.roots(kTax)), (std::vector<Uuid>{r0.id, r1.id, r2.id}));
  expectValid();
}

TEST_F(StoreTest, QueriesFollowTheIntervals)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node d = add(b.id);
  Node c = add(a.id);

  EXPECT_EQ(idsOf(store.descendants(NodeRef{kTax, a.id})), (std::vector<Uuid>{b.id, d.id, c.id}));
  EXPECT_EQ(idsOf(store.ancestors(NodeRef{kTax, d.id})), (std::vector<Uuid>{a.id, b.id}));
  EXPECT_EQ(idsOf(store.pathToRoot(NodeRef{kTax, d.id})), (std::vector<Uuid>{a.id, b.id, d.id}));
  EXPECT_EQ(idsOf(store.siblings(NodeRef{kTax, b.id})), (std::vector<Uuid>{c.id}));
  EXPECT_EQ(idsOf(store.subtree(NodeRef{kTax, b.id})), (std::vector<Uuid>{b.id, d.id}));
  EXPECT_EQ(idsOf(store.roots(kTax)), (std::vector<Uuid>{a.id}));
  EXPECT_TRUE(store.ancestors(NodeRef{kTax, a.id}).empty());
  EXPECT_TRUE(store.descendants(NodeRef{kTax, d.id}).empty());

  // round trip through the topmost ancestor
  auto top = store.ancestors(NodeRef{kTax, d.id}).front();
  auto all = idsOf(store.descendants(NodeRef{kTax, top.id}));
  EXPECT_NE(std::find(all.begin(), all.end(), d.id), all.end());
}

TEST_F(StoreTest, Paging)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node d = add(b.id);
  Node c = add(a.id);

  EXPECT_EQ(idsOf(store.descendants(NodeRef{kTax, a.id}, canopy::Page{2, 1})), (std::vector<Uuid>{d.id, c.id}));
  EXPECT_EQ(idsOf(store.children(NodeRef{kTax, a.id}, canopy::Page{1, 0})), (std::vector<Uuid>{b.id}));
  EXPECT_EQ(idsOf(store.subtree(NodeRef{kTax, a.id}, canopy::Page{0, 3})), (std::vector<Uuid>{c.id}));
  EXPECT_TRUE(store.roots(kTax, canopy::Page{0, 5}).empty());
}

TEST_F(StoreTest, CountsAndStats)
{
  Node a = add(std::nullopt);
  Node b = add(a.id);
  Node c = add(a.id);
  Node d = add(b.id);

  EXPECT_EQ(store.countChildren(NodeRef{kTax, a.id}), 2u);
  EXPECT_EQ(store.countDescendants(NodeRef{kTax, a.id}), 3u);
  EXPECT_EQ(store.subtreeSize(NodeRef{kTax, b.id}), 2u);
  EXPECT_EQ(store.countDescendants(NodeRef{kTax, c.id}), 0u);

  EXPECT_TRUE(store.isDescendant(kTax, a.id, d.id));
  EXPECT_FALSE(store.isDescendant(kTax, b.id, c.id));
  EXPECT_FALSE(store.isDescendant(kTax, a.id, a.id));

  EXPECT_EQ(store.treeHeight(kTax), 2u);
  EXPECT_EQ(store.levelWidth(kTax, 1), 2u);
  EXPECT_EQ(store.levelWidth(kTax, 5), 0u);

  auto s = store.stats(kTax);
  EXPECT_EQ(s.totalNodes, 4u);
  EXPECT_EQ(s.rootNodes, 1u);
  EXPECT_EQ(s.leafNodes, 2u);
  EXPECT_EQ(s.height, 2u);
  EXPECT_DOUBLE_EQ(s.averageDepth, 1.0);
  EXPECT_EQ(s.maxWidth, 2u);
}

TEST_F(StoreTest, AttributesTravelWithTheRow)
{
  std::vector<canopy::Attribute> attrs{
      {"name", std::string("Books")},
      {"rank", int64_t(-3)},
      {"weight", 0.5},
      {"active", true},
      {"note", std::monostate{}}};
  Node a = store.insert(canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .attributes = attrs});

  Node got = get(a.id);
  ASSERT_EQ(got.attributes.size(), attrs.size());
  for (size_t i = 0; i < attrs.size(); ++i)
  {
    EXPECT_EQ(got.attributes[i].key, attrs[i].key);
    EXPECT_EQ(got.attributes[i].val, attrs[i].val);
  }

  Node updated = store.updateAttributes(canopy::UpdateAttributesParams{
      .kind = kTax, .id = a.id, .set = {{"rank", int64_t(1)}, {"slug", std::string("books")}}, .unsetKeys = {"note", "weight"}});
  EXPECT_EQ(updated.left, a.left);
  EXPECT_EQ(updated.right, a.right);
  got = get(a.id);
  ASSERT_EQ(got.attributes.size(), 4u);
  EXPECT_EQ(got.attributes[1].key, "rank");
  EXPECT_EQ(std::get<int64_t>(got.attributes[1].val), 1);
  EXPECT_EQ(got.attributes[3].key, "slug");
  expectValid();
}

TEST_F(StoreTest, KindsHaveIndependentNumbering)
{
  Node t = add(std::nullopt);
  Node m = add(std::nullopt, std::nullopt, "menu");
  expectInterval(t, 1, 2, 0);
  expectInterval(m, 1, 2, 0);

  EXPECT_THROW(get(t.id, "menu"), NotFoundError);
  EXPECT_EQ(store.listKinds(), (std::vector<std::string>{"menu", "taxonomy"}));
  expectValid("menu");
}

TEST_F(StoreTest, ErrorCases)
{
  Node a = add(std::nullopt);
  Uuid ghost = Uuid::random();

  EXPECT_THROW(add(ghost), NotFoundError);
  EXPECT_THROW(store.insert(canopy::InsertParams{.kind = kTax, .id = a.id}), InvalidOperationError);
  EXPECT_THROW(store.insert(canopy::InsertParams{.kind = kTax, .id = canopy::kNilUuid}), InvalidOperationError);
  EXPECT_THROW(store.insert(canopy::InsertParams{.kind = "", .id = Uuid::random()}), InvalidOperationError);
  EXPECT_THROW(store.remove(canopy::DeleteParams{.kind = kTax, .id = ghost}), NotFoundError);
  EXPECT_THROW(moveTo(a.id, ghost), NotFoundError);
  EXPECT_THROW(moveTo(ghost, a.id), NotFoundError);
  EXPECT_THROW(store.getNode(NodeRef{"nosuchkind", a.id}), NotFoundError);
  EXPECT_TRUE(store.roots("nosuchkind").empty());
  EXPECT_TRUE(store.validate("nosuchkind").empty());

  try
  {
    moveTo(a.id, a.id);
    FAIL() << "expected CyclicMoveError";
  }
  catch (const canopy::HierarchyError &e)
  {
    EXPECT_EQ(e.code, canopy::ErrorCode::CyclicMove);
    EXPECT_EQ(canopy::reasonName(e.code), "cyclic_move");
  }
  expectInterval(get(a.id), 1, 2, 0);
}

TEST_F(StoreTest, CallerOwnedTransaction)
{
  {
    canopy::Txn tx = env.beginWrite();
    Node a = store.insert(tx, canopy::InsertParams{.kind = kTax, .id = Uuid::random()});
    store.insert(tx, canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .parentId = a.id});
    tx.abort();
  }
  EXPECT_TRUE(store.roots(kTax).empty());

  Uuid root = Uuid::random();
  {
    canopy::Txn tx = env.beginWrite();
    store.insert(tx, canopy::InsertParams{.kind = kTax, .id = root});
    store.insert(tx, canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .parentId = root});
    tx.commit();
  }
  expectInterval(get(root), 1, 4, 0);

  // a failed write inside the transaction leaves no trace when the rest commits
  Uuid second = Uuid::random();
  {
    canopy::Txn tx = env.beginWrite();
    store.insert(tx, canopy::InsertParams{.kind = kTax, .id = second});
    EXPECT_THROW(store.insert(tx, canopy::InsertParams{.kind = "menu", .id = Uuid::random(), .parentId = Uuid::random()}),
                 NotFoundError);
    EXPECT_THROW(store.insert(tx, canopy::InsertParams{.kind = kTax, .id = root}), InvalidOperationError);
    EXPECT_THROW(store.move(tx, canopy::MoveParams{.kind = kTax, .id = root, .newParentId = Uuid::random()}),
                 NotFoundError);
    tx.commit();
  }
  EXPECT_EQ(store.listKinds(), (std::vector<std::string>{kTax}));
  EXPECT_EQ(idsOf(store.roots(kTax)), (std::vector<Uuid>{root, second}));
  expectInterval(get(root), 1, 4, 0);
  expectInterval(get(second), 5, 6, 0);
  expectValid();

  canopy::Txn rtx = env.beginRead();
  EXPECT_THROW(store.insert(rtx, canopy::InsertParams{.kind = kTax, .id = Uuid::random()}), InvalidOperationError);
}

TEST_F(StoreTest, BatchAppliesAllOrNothing)
{
  Uuid x = Uuid::random();
  Uuid y = Uuid::random();
  std::vector<canopy::WriteOp> bad{
      canopy::InsertParams{.kind = kTax, .id = x},
      canopy::InsertParams{.kind = kTax, .id = y, .parentId = x},
      canopy::MoveParams{.kind = kTax, .id = x, .newParentId = y}};
  EXPECT_THROW(store.writeBatch(bad), CyclicMoveError);
  EXPECT_TRUE(store.roots(kTax).empty());
  EXPECT_TRUE(store.listKinds().empty());

  std::vector<canopy::WriteOp> good{
      canopy::InsertParams{.kind = kTax, .id = x},
      canopy::InsertParams{.kind = kTax, .id = y, .parentId = x},
      canopy::UpdateAttributesParams{.kind = kTax, .id = y, .set = {{"name", std::string("leaf")}}},
      canopy::MoveParams{.kind = kTax, .id = y, .newParentId = std::nullopt},
      canopy::DeleteParams{.kind = kTax, .id = x}};
  auto out = store.writeBatch(good);
  // x was deleted; y is reported once, as committed
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].id, y);
  expectInterval(out[0], 1, 2, 0);
  expectInterval(get(y), 1, 2, 0);
  EXPECT_EQ(get(y).attributes.size(), 1u);
  expectValid();
}

TEST_F(StoreTest, BatchReportsCommittedState)
{
  Uuid a = Uuid::random();
  Uuid b = Uuid::random();
  auto out = store.writeBatch({canopy::InsertParams{.kind = kTax, .id = a},
                               canopy::InsertParams{.kind = kTax, .id = b, .parentId = a}});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].id, a);
  expectInterval(out[0], 1, 4, 0);
  expectInterval(out[1], 2, 3, 1);

  Uuid d = Uuid::random();
  out = store.writeBatch({canopy::InsertParams{.kind = kTax, .id = d, .parentId = b},
                          canopy::MoveParams{.kind = kTax, .id = d, .newParentId = a, .position = 0}});
  ASSERT_EQ(out.size(), 1u);
  Node committed = get(d);
  EXPECT_EQ(out[0].id, d);
  expectInterval(out[0], committed.left, committed.right, committed.depth);
  expectInterval(out[0], 2, 3, 1);
  EXPECT_EQ(out[0].ordering, 0u);
  EXPECT_EQ(out[0].parentId, std::optional<Uuid>(a));
  expectValid();
}

TEST_F(StoreTest, RandomOperationsKeepInvariants)
{
  std::mt19937 rng(20241017);
  std::vector<Uuid> live;

  auto pick = [&]() -> Uuid
  { return live[std::uniform_int_distribution<size_t>(0, live.size() - 1)(rng)]; };

  for (int step = 0; step < 300; ++step)
  {
    int op = std::uniform_int_distribution<int>(0, 3)(rng);
    std::optional<uint64_t> position;
    if (rng() % 3 == 0)
      position = rng() % 4;

    if (live.empty() || op <= 1)
    {
      std::optional<Uuid> parent;
      if (!live.empty() && rng() % 4 != 0)
        parent = pick();
      live.push_back(add(parent, position).id);
    }
    else if (op == 2)
    {
      Uuid id = pick();
      std::optional<Uuid> parent;
      if (rng() % 4 != 0)
        parent = pick();
      try
      {
        moveTo(id, parent, position);
      }
      catch (const CyclicMoveError &)
      {
        ASSERT_TRUE(parent.has_value());
        EXPECT_TRUE(*parent == id || store.isDescendant(kTax, id, *parent));
      }
    }
    else
    {
      Uuid id = pick();
      auto gone = idsOf(store.subtree(NodeRef{kTax, id}));
      store.remove(canopy::DeleteParams{.kind = kTax, .id = id});
      for (const auto &g : gone)
        live.erase(std::remove(live.begin(), live.end(), g), live.end());
    }

    auto v = store.validate(kTax);
    ASSERT_TRUE(v.empty()) << "step " << step << ": " << canopy::violationName(v.front().kind) << " " << v.front().detail;
  }

  auto s = store.stats(kTax);
  EXPECT_EQ(s.totalNodes, live.size());
  for (const auto &id : live)
  {
    Node n = get(id);
    EXPECT_EQ(store.countDescendants(NodeRef{kTax, id}), store.descendants(NodeRef{kTax, id}).size());
    EXPECT_EQ(store.ancestors(NodeRef{kTax, id}).size(), n.depth);
  }
}

TEST_F(StoreTest, ConcurrentWritersAndReaders)
{
  std::vector<Uuid> roots;
  for (int i = 0; i < 3; ++i)
    roots.push_back(add(std::nullopt).id);

  constexpr int kWriters = 4;
  constexpr int kPerWriter = 25;
  std::atomic<bool> done{false};
  std::atomic<int> failures{0};

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w)
  {
    writers.emplace_back([&, w]()
                         {
      std::mt19937 rng(w + 1);
      std::vector<Uuid> mine(roots);
      for (int i = 0; i < kPerWriter; ++i)
      {
        Uuid parent = mine[rng() % mine.size()];
        try
        {
          mine.push_back(add(parent).id);
        }
        catch (const std::exception &)
        {
          ++failures;
        }
      } });
  }

  std::thread reader([&]()
                     {
    while (!done.load())
    {
      if (!store.validate(kTax).empty())
        ++failures;
      std::this_thread::yield();
    } });

  for (auto &t : writers)
    t.join();
  done = true;
  reader.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store.stats(kTax).totalNodes, 3u + kWriters * kPerWriter);
  expectValid();
}
