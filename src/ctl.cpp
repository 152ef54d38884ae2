#include "schemas/hierarchy.capnp.h"
#include "uuid.hpp"
#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <kj/main.h>
#include <iostream>
#include <string>
#include <vector>

namespace
{

  using canopy::rpc::Hierarchy;

  std::string textOf(capnp::Text::Reader t)
  {
    return std::string(t.cStr(), t.size());
  }

  // the "name" attribute when there is one, else the id
  std::string labelOf(canopy::rpc::Node::Reader n)
  {
    for (auto a : n.getAttributes())
    {
      if (a.getKey() == "name" && a.getVal().which() == canopy::rpc::Value::TEXT)
        return textOf(a.getVal().getText());
    }
    return textOf(n.getId());
  }

  void printNode(canopy::rpc::Node::Reader n)
  {
    std::cout << std::string(n.getDepth() * 2, ' ') << labelOf(n)
              << "  [" << n.getLeft() << ", " << n.getRight() << "] depth=" << n.getDepth()
              << " ord=" << n.getOrdering() << "\n";
  }

  void printStats(canopy::rpc::TreeStats::Reader s)
  {
    std::cout << "nodes=" << s.getTotalNodes() << " roots=" << s.getRootNodes() << " leaves=" << s.getLeafNodes()
              << " height=" << s.getHeight() << " avgDepth=" << s.getAverageDepth() << " maxWidth=" << s.getMaxWidth()
              << "\n";
  }

} // namespace

class CanopyctlApp
{
public:
  explicit CanopyctlApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Operator client for canopyd",
                           "Commands: kinds | tree <kind> | validate <kind> | stats <kind> | rebuild <kind> | demo <kind>")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'a', "address"}, KJ_BIND_METHOD(*this, optAddress),
                          "addr", "server address (default: unix:/tmp/canopy.sock)")
        .expectArg("<command>", KJ_BIND_METHOD(*this, setCommand))
        .expectZeroOrMoreArgs("<kind>", KJ_BIND_METHOD(*this, addArg))
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String address_ = kj::heapString("unix:/tmp/canopy.sock");
  kj::String command_ = kj::heapString("");
  std::vector<std::string> args_;

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optAddress(kj::StringPtr value)
  {
    address_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity setCommand(kj::StringPtr value)
  {
    command_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity addArg(kj::StringPtr value)
  {
    args_.emplace_back(value.cStr());
    return true;
  }

  void printTree(Hierarchy::Client &cap, kj::WaitScope &ws, const std::string &kind)
  {
    auto roots = cap.rootsRequest();
    roots.setKind(kind);
    auto rootsResp = roots.send().wait(ws);
    for (auto root : rootsResp.getNodes())
    {
      auto req = cap.queryRequest();
      auto p = req.initParams();
      p.initRef().setKind(kind);
      p.getRef().setId(root.getId());
      p.setRelation(canopy::rpc::Relation::SUBTREE);
      auto resp = req.send().wait(ws);
      for (auto n : resp.getNodes())
        printNode(n);
    }
  }

  std::string insert(Hierarchy::Client &cap, kj::WaitScope &ws, const std::string &kind, const std::string &name,
                     const std::string &parent)
  {
    auto req = cap.insertRequest();
    auto p = req.initParams();
    std::string id = canopy::Uuid::random().toString();
    p.setKind(kind);
    p.setId(id);
    p.setParentId(parent);
    auto attrs = p.initAttributes(1);
    attrs[0].setKey("name");
    attrs[0].initVal().setText(name);
    req.send().wait(ws);
    return id;
  }

  // root A with children B and C, then delete B, then move a second root
  // with two children under a new child of A
  void demo(Hierarchy::Client &cap, kj::WaitScope &ws, const std::string &kind)
  {
    std::string a = insert(cap, ws, kind, "A", "");
    std::string b = insert(cap, ws, kind, "B", a);
    insert(cap, ws, kind, "C", a);
    std::cout << "-- insert A, B, C\n";
    printTree(cap, ws, kind);

    auto rm = cap.removeRequest();
    auto rp = rm.initParams();
    rp.setKind(kind);
    rp.setId(b);
    rm.send().wait(ws);
    std::cout << "-- delete B\n";
    printTree(cap, ws, kind);

    std::string target = insert(cap, ws, kind, "B2", a);
    std::string c2 = insert(cap, ws, kind, "C2", "");
    insert(cap, ws, kind, "D", c2);
    insert(cap, ws, kind, "E", c2);
    auto mv = cap.moveRequest();
    auto mp = mv.initParams();
    mp.setKind(kind);
    mp.setId(c2);
    mp.setNewParentId(target);
    mv.send().wait(ws);
    std::cout << "-- move C2 (with D, E) under B2\n";
    printTree(cap, ws, kind);
  }

  kj::MainBuilder::Validity run()
  {
    std::string cmd(command_.cStr());
    bool needsKind = cmd != "kinds";
    if (needsKind && args_.size() != 1)
      return "command needs exactly one <kind>";

    capnp::EzRpcClient client(address_.cStr());
    auto cap = client.getMain<Hierarchy>();
    auto &ws = client.getWaitScope();

    try
    {
      if (cmd == "kinds")
      {
        auto resp = cap.listKindsRequest().send().wait(ws);
        for (auto k : resp.getKinds())
          std::cout << k.cStr() << "\n";
      }
      else if (cmd == "tree")
        printTree(cap, ws, args_[0]);
      else if (cmd == "validate")
      {
        auto req = cap.validateRequest();
        req.setKind(args_[0]);
        auto resp = req.send().wait(ws);
        auto vs = resp.getViolations();
        for (auto v : vs)
          std::cout << v.getKind().cStr() << " " << v.getNode().cStr() << " " << v.getDetail().cStr() << "\n";
        std::cout << vs.size() << " violation(s)\n";
      }
      else if (cmd == "stats")
      {
        auto req = cap.statsRequest();
        req.setKind(args_[0]);
        printStats(req.send().wait(ws).getStats());
      }
      else if (cmd == "rebuild")
      {
        auto req = cap.rebuildRequest();
        req.setKind(args_[0]);
        printStats(req.send().wait(ws).getStats());
      }
      else if (cmd == "demo")
        demo(cap, ws, args_[0]);
      else
        return "unknown command";
    }
    catch (const kj::Exception &e)
    {
      KJ_LOG(ERROR, "command failed", cmd.c_str(), e.getDescription());
      return kj::MainBuilder::Validity("command failed");
    }
    return true;
  }
};

KJ_MAIN(CanopyctlApp);
