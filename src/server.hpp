#pragma once
#include "store.hpp"
#include "schemas/hierarchy.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>

namespace canopy::rpc
{

  class HierarchyImpl final : public Hierarchy::Server
  {
  public:
    explicit HierarchyImpl(canopy::HierarchyStore &s);

    kj::Promise<void> insert(InsertContext ctx) override;
    kj::Promise<void> remove(RemoveContext ctx) override;
    kj::Promise<void> move(MoveContext ctx) override;
    kj::Promise<void> updateAttributes(UpdateAttributesContext ctx) override;
    kj::Promise<void> writeBatch(WriteBatchContext ctx) override;

    kj::Promise<void> getNode(GetNodeContext ctx) override;
    kj::Promise<void> query(QueryContext ctx) override;
    kj::Promise<void> roots(RootsContext ctx) override;
    kj::Promise<void> isDescendant(IsDescendantContext ctx) override;
    kj::Promise<void> counts(CountsContext ctx) override;
    kj::Promise<void> levelWidth(LevelWidthContext ctx) override;
    kj::Promise<void> stats(StatsContext ctx) override;
    kj::Promise<void> listKinds(ListKindsContext ctx) override;

    kj::Promise<void> validate(ValidateContext ctx) override;
    kj::Promise<void> rebuild(RebuildContext ctx) override;

  private:
    canopy::HierarchyStore &store_;
  };

  // "structural operation failed [<reason>]: <detail>"
  kj::Exception toKjException(const canopy::HierarchyError &e);

} // namespace canopy::rpc
