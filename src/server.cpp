#include "server.hpp"
#include <kj/debug.h>
#include <string>

namespace canopy::rpc
{

  namespace
  {

    std::string textOf(capnp::Text::Reader t)
    {
      return std::string(t.cStr(), t.size());
    }

    canopy::Uuid parseId(capnp::Text::Reader t, const char *what)
    {
      auto id = canopy::Uuid::parse(std::string_view(t.cStr(), t.size()));
      if (!id || id->isNil())
        throw canopy::InvalidOperationError(std::string(what) + " '" + textOf(t) + "' is not a valid uuid");
      return *id;
    }

    // empty text -> root level
    std::optional<canopy::Uuid> parseParent(capnp::Text::Reader t, const char *what)
    {
      if (t.size() == 0)
        return std::nullopt;
      return parseId(t, what);
    }

    std::optional<uint64_t> fromRpcHint(OrderingHint::Reader h)
    {
      if (h.which() == OrderingHint::POSITION)
        return h.getPosition();
      return std::nullopt;
    }

    canopy::Page fromRpcPage(Page::Reader p)
    {
      return canopy::Page{p.getLimit(), p.getOffset()};
    }

    canopy::NodeRef fromRpcRef(NodeRef::Reader r)
    {
      return canopy::NodeRef{textOf(r.getKind()), parseId(r.getId(), "node id")};
    }

    canopy::Value fromRpcValue(Value::Reader v)
    {
      switch (v.which())
      {
      case Value::I64:
        return static_cast<int64_t>(v.getI64());
      case Value::F64:
        return static_cast<double>(v.getF64());
      case Value::BOOLV:
        return static_cast<bool>(v.getBoolv());
      case Value::TEXT:
        return textOf(v.getText());
      case Value::NULLV:
      default:
        return std::monostate{};
      }
    }

    void toRpcValue(Value::Builder b, const canopy::Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
      {
        b.setI64(std::get<int64_t>(v));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        b.setF64(std::get<double>(v));
        return;
      }
      if (std::holds_alternative<bool>(v))
      {
        b.setBoolv(std::get<bool>(v));
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        b.setText(std::get<std::string>(v));
        return;
      }
      b.setNullv();
    }

    std::vector<canopy::Attribute> fromRpcAttributes(capnp::List<Attribute>::Reader list)
    {
      std::vector<canopy::Attribute> out;
      out.reserve(list.size());
      for (auto a : list)
        out.push_back(canopy::Attribute{textOf(a.getKey()), fromRpcValue(a.getVal())});
      return out;
    }

    void toRpcNode(Node::Builder b, const canopy::Node &n)
    {
      b.setId(n.id.toString());
      b.setParentId(n.parentId ? n.parentId->toString() : std::string());
      b.setLeft(n.left);
      b.setRight(n.right);
      b.setDepth(n.depth);
      b.setOrdering(n.ordering);
      auto attrs = b.initAttributes(n.attributes.size());
      for (uint32_t i = 0; i < n.attributes.size(); ++i)
      {
        attrs[i].setKey(n.attributes[i].key);
        toRpcValue(attrs[i].initVal(), n.attributes[i].val);
      }
    }

    void toRpcNodes(capnp::List<Node>::Builder out, const std::vector<canopy::Node> &nodes)
    {
      for (uint32_t i = 0; i < nodes.size(); ++i)
        toRpcNode(out[i], nodes[i]);
    }

    void toRpcStats(TreeStats::Builder b, const canopy::TreeStats &s)
    {
      b.setTotalNodes(s.totalNodes);
      b.setRootNodes(s.rootNodes);
      b.setLeafNodes(s.leafNodes);
      b.setHeight(s.height);
      b.setAverageDepth(s.averageDepth);
      b.setMaxWidth(s.maxWidth);
    }

    canopy::InsertParams fromRpcInsert(InsertParams::Reader r)
    {
      canopy::InsertParams in{};
      in.kind = textOf(r.getKind());
      in.id = parseId(r.getId(), "node id");
      in.parentId = parseParent(r.getParentId(), "parent id");
      in.position = fromRpcHint(r.getHint());
      in.attributes = fromRpcAttributes(r.getAttributes());
      return in;
    }

    canopy::DeleteParams fromRpcRemove(RemoveParams::Reader r)
    {
      return canopy::DeleteParams{textOf(r.getKind()), parseId(r.getId(), "node id"), r.getCascade()};
    }

    canopy::MoveParams fromRpcMove(MoveParams::Reader r)
    {
      canopy::MoveParams in{};
      in.kind = textOf(r.getKind());
      in.id = parseId(r.getId(), "node id");
      in.newParentId = parseParent(r.getNewParentId(), "new parent id");
      in.position = fromRpcHint(r.getHint());
      return in;
    }

    canopy::UpdateAttributesParams fromRpcUpdate(UpdateAttributesParams::Reader r)
    {
      canopy::UpdateAttributesParams in{};
      in.kind = textOf(r.getKind());
      in.id = parseId(r.getId(), "node id");
      in.set = fromRpcAttributes(r.getSet());
      for (auto k : r.getUnsetKeys())
        in.unsetKeys.push_back(textOf(k));
      return in;
    }

    // Engine exceptions become rejected promises; nothing partial reaches the caller.
    template <typename Fn>
    kj::Promise<void> guarded(const char *method, Fn &&fn)
    {
      try
      {
        fn();
      }
      catch (const canopy::HierarchyError &e)
      {
        KJ_LOG(INFO, "rpc call rejected", method, std::string(canopy::reasonName(e.code)).c_str(), e.what());
        return toKjException(e);
      }
      catch (const canopy::MdbError &e)
      {
        KJ_LOG(ERROR, "storage error", method, e.what());
        return KJ_EXCEPTION(FAILED, "storage error", e.what());
      }
      return kj::READY_NOW;
    }

  } // namespace

  kj::Exception toKjException(const canopy::HierarchyError &e)
  {
    std::string reason(canopy::reasonName(e.code));
    return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                         kj::str("structural operation failed [", reason.c_str(), "]: ", e.what()));
  }

  HierarchyImpl::HierarchyImpl(canopy::HierarchyStore &s) : store_(s) {}

  kj::Promise<void> HierarchyImpl::insert(InsertContext ctx)
  {
    return guarded("insert", [&]
                   {
      auto node = store_.insert(fromRpcInsert(ctx.getParams().getParams()));
      toRpcNode(ctx.getResults().initNode(), node); });
  }

  kj::Promise<void> HierarchyImpl::remove(RemoveContext ctx)
  {
    return guarded("remove", [&]
                   { store_.remove(fromRpcRemove(ctx.getParams().getParams())); });
  }

  kj::Promise<void> HierarchyImpl::move(MoveContext ctx)
  {
    return guarded("move", [&]
                   {
      auto node = store_.move(fromRpcMove(ctx.getParams().getParams()));
      toRpcNode(ctx.getResults().initNode(), node); });
  }

  kj::Promise<void> HierarchyImpl::updateAttributes(UpdateAttributesContext ctx)
  {
    return guarded("updateAttributes", [&]
                   {
      auto node = store_.updateAttributes(fromRpcUpdate(ctx.getParams().getParams()));
      toRpcNode(ctx.getResults().initNode(), node); });
  }

  kj::Promise<void> HierarchyImpl::writeBatch(WriteBatchContext ctx)
  {
    return guarded("writeBatch", [&]
                   {
      auto ops = ctx.getParams().getBatch().getOps();
      std::vector<canopy::WriteOp> in;
      in.reserve(ops.size());
      for (auto op : ops)
      {
        switch (op.which())
        {
        case WriteOp::INSERT:
          in.emplace_back(fromRpcInsert(op.getInsert()));
          break;
        case WriteOp::REMOVE:
          in.emplace_back(fromRpcRemove(op.getRemove()));
          break;
        case WriteOp::MOVE:
          in.emplace_back(fromRpcMove(op.getMove()));
          break;
        case WriteOp::UPDATE_ATTRIBUTES:
          in.emplace_back(fromRpcUpdate(op.getUpdateAttributes()));
          break;
        default:
          throw canopy::InvalidOperationError("unknown write op in batch");
        }
      }
      auto nodes = store_.writeBatch(in);
      toRpcNodes(ctx.getResults().initNodes(nodes.size()), nodes); });
  }

  kj::Promise<void> HierarchyImpl::getNode(GetNodeContext ctx)
  {
    return guarded("getNode", [&]
                   {
      auto node = store_.getNode(fromRpcRef(ctx.getParams().getRef()));
      toRpcNode(ctx.getResults().initNode(), node); });
  }

  kj::Promise<void> HierarchyImpl::query(QueryContext ctx)
  {
    return guarded("query", [&]
                   {
      auto params = ctx.getParams().getParams();
      auto ref = fromRpcRef(params.getRef());
      auto page = fromRpcPage(params.getPage());
      std::vector<canopy::Node> nodes;
      switch (params.getRelation())
      {
      case Relation::CHILDREN:
        nodes = store_.children(ref, page);
        break;
      case Relation::DESCENDANTS:
        nodes = store_.descendants(ref, page);
        break;
      case Relation::ANCESTORS:
        nodes = store_.ancestors(ref);
        break;
      case Relation::SIBLINGS:
        nodes = store_.siblings(ref, page);
        break;
      case Relation::PATH_TO_ROOT:
        nodes = store_.pathToRoot(ref);
        break;
      case Relation::SUBTREE:
        nodes = store_.subtree(ref, page);
        break;
      default:
        throw canopy::InvalidOperationError("unknown relation");
      }
      toRpcNodes(ctx.getResults().initNodes(nodes.size()), nodes); });
  }

  kj::Promise<void> HierarchyImpl::roots(RootsContext ctx)
  {
    return guarded("roots", [&]
                   {
      auto p = ctx.getParams();
      auto nodes = store_.roots(textOf(p.getKind()), fromRpcPage(p.getPage()));
      toRpcNodes(ctx.getResults().initNodes(nodes.size()), nodes); });
  }

  kj::Promise<void> HierarchyImpl::isDescendant(IsDescendantContext ctx)
  {
    return guarded("isDescendant", [&]
                   {
      auto p = ctx.getParams();
      bool r = store_.isDescendant(textOf(p.getKind()), parseId(p.getAncestor(), "ancestor id"),
                                   parseId(p.getDescendant(), "descendant id"));
      ctx.getResults().setResult(r); });
  }

  kj::Promise<void> HierarchyImpl::counts(CountsContext ctx)
  {
    return guarded("counts", [&]
                   {
      auto ref = fromRpcRef(ctx.getParams().getRef());
      auto out = ctx.getResults().initCounts();
      out.setChildren(store_.countChildren(ref));
      out.setDescendants(store_.countDescendants(ref));
      out.setSubtreeSize(store_.subtreeSize(ref)); });
  }

  kj::Promise<void> HierarchyImpl::levelWidth(LevelWidthContext ctx)
  {
    return guarded("levelWidth", [&]
                   {
      auto p = ctx.getParams();
      ctx.getResults().setCount(store_.levelWidth(textOf(p.getKind()), p.getDepth())); });
  }

  kj::Promise<void> HierarchyImpl::stats(StatsContext ctx)
  {
    return guarded("stats", [&]
                   { toRpcStats(ctx.getResults().initStats(), store_.stats(textOf(ctx.getParams().getKind()))); });
  }

  kj::Promise<void> HierarchyImpl::listKinds(ListKindsContext ctx)
  {
    return guarded("listKinds", [&]
                   {
      auto kinds = store_.listKinds();
      auto out = ctx.getResults().initKinds(kinds.size());
      for (uint32_t i = 0; i < kinds.size(); ++i)
        out.set(i, kinds[i]); });
  }

  kj::Promise<void> HierarchyImpl::validate(ValidateContext ctx)
  {
    return guarded("validate", [&]
                   {
      auto violations = store_.validate(textOf(ctx.getParams().getKind()));
      auto out = ctx.getResults().initViolations(violations.size());
      for (uint32_t i = 0; i < violations.size(); ++i)
      {
        const auto &v = violations[i];
        out[i].setKind(std::string(canopy::violationName(v.kind)));
        out[i].setNode(v.node.toString());
        out[i].setOther(v.other ? v.other->toString() : std::string());
        out[i].setDetail(v.detail);
      } });
  }

  kj::Promise<void> HierarchyImpl::rebuild(RebuildContext ctx)
  {
    return guarded("rebuild", [&]
                   { toRpcStats(ctx.getResults().initStats(), store_.rebuild(textOf(ctx.getParams().getKind()))); });
  }

} // namespace canopy::rpc
