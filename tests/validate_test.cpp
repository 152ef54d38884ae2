#include "env.hpp"
#include "store.hpp"
#include "store_internal.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <functional>

using canopy::HierarchyStore;
using canopy::InvariantViolation;
using canopy::Node;
using canopy::NodeRef;
using canopy::Uuid;
using canopy::ViolationKind;

namespace
{

  const std::string kTax = "taxonomy";

  bool has(const std::vector<InvariantViolation> &vs, ViolationKind kind, const Uuid &node)
  {
    return std::any_of(vs.begin(), vs.end(), [&](const InvariantViolation &v)
                       { return v.kind == kind && v.node == node; });
  }

  std::string describe(const std::vector<InvariantViolation> &vs)
  {
    std::string s;
    for (const auto &v : vs)
      s += std::string(canopy::violationName(v.kind)) + " " + v.node.toString() + " " + v.detail + "\n";
    return s;
  }

} // namespace

// Corrupts rows behind the store's back through the row/index layer and
// checks that validate reports the damage and rebuild repairs it.
class ValidateTest : public ::testing::Test
{
protected:
  canopy::testing::TempDir dir{"canopy-validate-test-"};
  canopy::Env env{dir.path, size_t(64) << 20};
  HierarchyStore store{env};
  Node a, b, c;

  void SetUp() override
  {
    a = add(std::nullopt);
    b = add(a.id);
    c = add(a.id);
  }

  Node add(const std::optional<Uuid> &parent)
  {
    return store.insert(canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .parentId = parent});
  }

  Node get(const Uuid &id)
  {
    return store.getNode(NodeRef{kTax, id});
  }

  void corrupt(const Uuid &id, const std::function<void(Node &)> &fn)
  {
    canopy::Txn tx = env.beginWrite();
    uint32_t kindId = canopy::detail::require_kind_id(tx, env, kTax);
    Node before = canopy::detail::require_node(tx, env, kindId, id);
    Node after = before;
    fn(after);
    canopy::detail::erase_node(tx, env, kindId, before);
    canopy::detail::put_node(tx, env, kindId, after);
    tx.commit();
  }

  void plant(const Node &n)
  {
    canopy::Txn tx = env.beginWrite();
    uint32_t kindId = canopy::detail::require_kind_id(tx, env, kTax);
    canopy::detail::put_node(tx, env, kindId, n);
    tx.commit();
  }

  Node stray(int64_t left, const std::optional<Uuid> &parent)
  {
    Node n{};
    n.id = Uuid::random();
    n.parentId = parent;
    n.left = left;
    n.right = left + 1;
    n.depth = 1;
    return n;
  }
};

TEST_F(ValidateTest, CleanTreeHasNoViolations)
{
  EXPECT_TRUE(store.validate(kTax).empty());
  EXPECT_TRUE(store.validate(kTax).empty());
}

TEST_F(ValidateTest, DepthMismatchIsReportedAndRepaired)
{
  corrupt(c.id, [](Node &n)
          { n.depth = 3; });

  auto first = store.validate(kTax);
  EXPECT_TRUE(has(first, ViolationKind::DepthMismatch, c.id)) << describe(first);
  EXPECT_EQ(first, store.validate(kTax));

  store.rebuild(kTax);
  EXPECT_TRUE(store.validate(kTax).empty());
  EXPECT_EQ(get(c.id).depth, 1u);
}

TEST_F(ValidateTest, PartialOverlapIsReported)
{
  corrupt(b.id, [](Node &n)
          { n.right = 7; });

  auto vs = store.validate(kTax);
  EXPECT_TRUE(has(vs, ViolationKind::PartialOverlap, b.id)) << describe(vs);

  store.rebuild(kTax);
  EXPECT_TRUE(store.validate(kTax).empty());
  Node fixed = get(b.id);
  EXPECT_EQ(fixed.left, 2);
  EXPECT_EQ(fixed.right, 3);
  EXPECT_EQ(get(a.id).right, 6);
}

TEST_F(ValidateTest, DescendantCountAndDuplicateBoundary)
{
  // a's interval now claims room for a third child that does not exist
  corrupt(a.id, [](Node &n)
          { n.right = 8; });
  auto vs = store.validate(kTax);
  EXPECT_TRUE(has(vs, ViolationKind::DescendantCount, a.id)) << describe(vs);

  corrupt(a.id, [](Node &n)
          { n.right = 6; });
  corrupt(c.id, [](Node &n)
          { n.left = 3; });
  vs = store.validate(kTax);
  EXPECT_TRUE(has(vs, ViolationKind::DuplicateBoundary, c.id) || has(vs, ViolationKind::DuplicateBoundary, b.id))
      << describe(vs);
}

TEST_F(ValidateTest, OrderingMismatchIsReportedAndRepaired)
{
  corrupt(b.id, [](Node &n)
          { n.ordering = 5; });
  auto vs = store.validate(kTax);
  EXPECT_TRUE(has(vs, ViolationKind::OrderingMismatch, b.id)) << describe(vs);

  store.rebuild(kTax);
  EXPECT_TRUE(store.validate(kTax).empty());
  // rebuild keeps the existing sibling order
  auto kids = store.children(NodeRef{kTax, a.id});
  ASSERT_EQ(kids.size(), 2u);
  EXPECT_EQ(kids[0].id, c.id);
  EXPECT_EQ(kids[1].id, b.id);
  EXPECT_EQ(kids[1].ordering, 1u);
}

TEST_F(ValidateTest, MissingIndexEntryIsReported)
{
  {
    canopy::Txn tx = env.beginWrite();
    uint32_t kindId = canopy::detail::require_kind_id(tx, env, kTax);
    std::string key = canopy::key_boundary_be(kindId, b.left);
    MDB_val k = canopy::detail::make_val(key);
    canopy::detail::check_rc(mdb_del(tx.get(), env.byLeft(), &k, nullptr));
    tx.commit();
  }
  auto vs = store.validate(kTax);
  EXPECT_TRUE(has(vs, ViolationKind::IndexMismatch, b.id)) << describe(vs);

  store.rebuild(kTax);
  EXPECT_TRUE(store.validate(kTax).empty());
  ASSERT_EQ(store.descendants(NodeRef{kTax, a.id}).size(), 2u);
}

TEST_F(ValidateTest, OrphanIsPromotedToRoot)
{
  Node orphan = stray(100, Uuid::random());
  plant(orphan);

  auto vs = store.validate(kTax);
  EXPECT_TRUE(has(vs, ViolationKind::ParentMismatch, orphan.id)) << describe(vs);

  auto stats = store.rebuild(kTax);
  EXPECT_EQ(stats.rootNodes, 2u);
  EXPECT_EQ(stats.totalNodes, 4u);
  EXPECT_TRUE(store.validate(kTax).empty());

  Node fixed = get(orphan.id);
  EXPECT_FALSE(fixed.parentId.has_value());
  EXPECT_EQ(fixed.depth, 0u);
  EXPECT_EQ(fixed.left, 7);
  EXPECT_EQ(fixed.right, 8);
}

TEST_F(ValidateTest, ParentCycleIsBroken)
{
  Node p = stray(200, std::nullopt);
  Node q = stray(202, p.id);
  p.parentId = q.id;
  plant(p);
  plant(q);

  EXPECT_FALSE(store.validate(kTax).empty());

  store.rebuild(kTax);
  EXPECT_TRUE(store.validate(kTax).empty());
  Node fp = get(p.id);
  Node fq = get(q.id);
  EXPECT_FALSE(fp.parentId.has_value());
  ASSERT_TRUE(fq.parentId.has_value());
  EXPECT_EQ(*fq.parentId, p.id);
  EXPECT_EQ(fq.depth, 1u);
  EXPECT_TRUE(store.isDescendant(kTax, p.id, q.id));
}

TEST_F(ValidateTest, RebuildOfHealthyTreeChangesNothing)
{
  Node d = add(b.id);
  std::vector<Node> before = store.subtree(NodeRef{kTax, a.id});

  auto stats = store.rebuild(kTax);
  EXPECT_EQ(stats.totalNodes, 4u);
  EXPECT_EQ(stats.height, 2u);

  std::vector<Node> after = store.subtree(NodeRef{kTax, a.id});
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i)
  {
    EXPECT_EQ(before[i].id, after[i].id);
    EXPECT_EQ(before[i].left, after[i].left);
    EXPECT_EQ(before[i].right, after[i].right);
    EXPECT_EQ(before[i].depth, after[i].depth);
    EXPECT_EQ(before[i].ordering, after[i].ordering);
  }
  EXPECT_EQ(get(d.id).depth, 2u);
}

TEST_F(ValidateTest, RebuildOfUnknownKindIsNotFound)
{
  EXPECT_THROW(store.rebuild("nosuchkind"), canopy::NotFoundError);
}

TEST_F(ValidateTest, FullCheckRejectsWritesOnADamagedTree)
{
  corrupt(c.id, [](Node &n)
          { n.depth = 4; });

  HierarchyStore strict(env, canopy::StoreOptions{canopy::CheckMode::Full});
  EXPECT_THROW(strict.insert(canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .parentId = b.id}),
               canopy::InvariantViolationError);
  EXPECT_EQ(store.stats(kTax).totalNodes, 3u);

  // the local check only looks at the written node
  store.insert(canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .parentId = b.id});
  EXPECT_EQ(store.stats(kTax).totalNodes, 4u);
}

TEST_F(ValidateTest, FailedCheckInsideCallerTransactionIsUndone)
{
  corrupt(c.id, [](Node &n)
          { n.depth = 4; });

  HierarchyStore strict(env, canopy::StoreOptions{canopy::CheckMode::Full});
  {
    canopy::Txn tx = env.beginWrite();
    store.updateAttributes(tx, canopy::UpdateAttributesParams{.kind = kTax, .id = a.id, .set = {{"name", std::string("root")}}});
    EXPECT_THROW(strict.insert(tx, canopy::InsertParams{.kind = kTax, .id = Uuid::random(), .parentId = b.id}),
                 canopy::InvariantViolationError);
    tx.commit();
  }

  Node root = get(a.id);
  EXPECT_EQ(root.left, 1);
  EXPECT_EQ(root.right, 6);
  EXPECT_EQ(root.attributes.size(), 1u);
  EXPECT_EQ(get(b.id).right, 3);
  EXPECT_EQ(store.stats(kTax).totalNodes, 3u);
}

TEST_F(ValidateTest, AncestorsStopAtDepthOnAParentCycle)
{
  Node p = stray(200, std::nullopt);
  Node q = stray(202, p.id);
  p.parentId = q.id;
  plant(p);
  plant(q);

  auto up = store.ancestors(NodeRef{kTax, q.id});
  ASSERT_EQ(up.size(), 1u);
  EXPECT_EQ(up[0].id, p.id);
  EXPECT_EQ(store.pathToRoot(NodeRef{kTax, q.id}).size(), 2u);
}
