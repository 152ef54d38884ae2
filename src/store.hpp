#pragma once
#include "env.hpp"
#include "errors.hpp"
#include "uuid.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace canopy
{

  using Value = std::variant<int64_t, double, bool, std::string, std::monostate>;

  struct Attribute
  {
    std::string key{};
    Value val{}; // int64, double, bool, text, null(monostate)
  };

  // -------------------- node row ---------------------------

  struct Node
  {
    Uuid id{};
    std::optional<Uuid> parentId{}; // nullopt -> root
    int64_t left{0};
    int64_t right{0};
    uint32_t depth{0};
    uint64_t ordering{0};
    std::vector<Attribute> attributes{};
  };

  struct NodeRef
  {
    std::string kind{};
    Uuid id{};
  };

  // limit 0 -> no limit
  struct Page
  {
    uint32_t limit{0};
    uint32_t offset{0};
  };

  // -------------------- params ---------------------------

  struct InsertParams
  {
    std::string kind{};
    Uuid id{};
    std::optional<Uuid> parentId{};
    std::optional<uint64_t> position{}; // 0-based sibling slot; nullopt or past the end appends
    std::vector<Attribute> attributes{};
  };

  struct DeleteParams
  {
    std::string kind{};
    Uuid id{};
    bool cascade{true};
  };

  struct MoveParams
  {
    std::string kind{};
    Uuid id{};
    std::optional<Uuid> newParentId{}; // nullopt -> root level
    std::optional<uint64_t> position{};
  };

  struct UpdateAttributesParams
  {
    std::string kind{};
    Uuid id{};
    std::vector<Attribute> set{};
    std::vector<std::string> unsetKeys{};
  };

  using WriteOp = std::variant<InsertParams, DeleteParams, MoveParams, UpdateAttributesParams>;

  // -------------------- validation / stats ---------------------------

  enum class ViolationKind : uint8_t
  {
    LeftNotBelowRight = 0,
    PartialOverlap = 1,
    DescendantCount = 2,
    DepthMismatch = 3,
    ParentMismatch = 4,
    DuplicateBoundary = 5,
    OrderingMismatch = 6,
    IndexMismatch = 7
  };

  std::string_view violationName(ViolationKind kind);

  struct InvariantViolation
  {
    ViolationKind kind{ViolationKind::IndexMismatch};
    Uuid node{};
    std::optional<Uuid> other{};
    std::string detail{};

    bool operator==(const InvariantViolation &) const = default;
  };

  struct TreeStats
  {
    uint64_t totalNodes{0};
    uint64_t rootNodes{0};
    uint64_t leafNodes{0};
    uint32_t height{0};
    double averageDepth{0.0};
    uint64_t maxWidth{0};
  };

  enum class CheckMode : uint8_t
  {
    Off = 0,
    Local = 1, // mutated node against its parent and its own width
    Full = 2   // validate the whole kind before commit
  };

  struct StoreOptions
  {
    CheckMode check{CheckMode::Local};
  };

  class HierarchyStore
  {
  public:
    explicit HierarchyStore(Env &e, StoreOptions opts = {}) : env_(e), opts_(opts) {}

    Env &env() const { return env_; }
    const StoreOptions &options() const { return opts_; }

    // structural writes, one transaction each
    Node insert(const InsertParams &params);
    void remove(const DeleteParams &params);
    Node move(const MoveParams &params);
    Node updateAttributes(const UpdateAttributesParams &params);
    // all ops or none; returns the final state of every node the batch
    // wrote and did not delete, once each, in order of first appearance
    std::vector<Node> writeBatch(const std::vector<WriteOp> &ops);

    // the same writes inside a caller-owned write transaction; a write that
    // throws leaves `tx` as it was
    Node insert(Txn &tx, const InsertParams &params);
    void remove(Txn &tx, const DeleteParams &params);
    Node move(Txn &tx, const MoveParams &params);
    Node updateAttributes(Txn &tx, const UpdateAttributesParams &params);

    // reads / queries
    Node getNode(const NodeRef &ref);
    std::vector<Node> children(const NodeRef &ref, Page page = {});
    std::vector<Node> descendants(const NodeRef &ref, Page page = {});
    std::vector<Node> ancestors(const NodeRef &ref);
    std::vector<Node> siblings(const NodeRef &ref, Page page = {});
    std::vector<Node> roots(std::string_view kind, Page page = {});
    std::vector<Node> pathToRoot(const NodeRef &ref);
    std::vector<Node> subtree(const NodeRef &ref, Page page = {});

    bool isDescendant(std::string_view kind, const Uuid &ancestor, const Uuid &descendant);
    uint64_t countChildren(const NodeRef &ref);
    uint64_t countDescendants(const NodeRef &ref);
    uint64_t subtreeSize(const NodeRef &ref);
    uint32_t treeHeight(std::string_view kind);
    uint64_t levelWidth(std::string_view kind, uint32_t depth);
    TreeStats stats(std::string_view kind);
    std::vector<std::string> listKinds();

    // diagnostics / repair
    std::vector<InvariantViolation> validate(std::string_view kind);
    std::vector<InvariantViolation> validate(Txn &tx, std::string_view kind);
    TreeStats rebuild(std::string_view kind);

  private:
    Node applyInsert(Txn &tx, const InsertParams &params);
    void applyRemove(Txn &tx, const DeleteParams &params);
    Node applyMove(Txn &tx, const MoveParams &params);
    Node applyUpdate(Txn &tx, const UpdateAttributesParams &params);

    void checkAfterWrite(Txn &tx, uint32_t kindId, std::string_view kind, const std::optional<Uuid> &touched);

    Env &env_;
    StoreOptions opts_;
  };

} // namespace canopy
