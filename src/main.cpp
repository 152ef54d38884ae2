#include "env.hpp"
#include "store.hpp"
#include "server.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <filesystem>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

class CanopydApp
{
public:
  explicit CanopydApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Canopy nested-set hierarchy server using capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/canopy.sock or 0.0.0.0:0)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory for LMDB (default: data)")
        .addOptionWithArg({'m', "map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "MiB", "LMDB map size in MiB (default: 16384)")
        .addOptionWithArg({'c', "check"}, KJ_BIND_METHOD(*this, optCheck),
                          "mode", "post-write check: off, local or full (default: local)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  bool verbose_ = false;
  kj::String bind_ = kj::heapString("unix:/tmp/canopy.sock");
  kj::String dataDir_ = kj::heapString("data");
  size_t mapSizeBytes_ = size_t(16ull << 30);
  canopy::StoreOptions storeOpts_{};

  kj::MainBuilder::Validity optVerbose()
  {
    verbose_ = true;
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    char *end = nullptr;
    unsigned long long mib = std::strtoull(value.cStr(), &end, 10);
    if (end == value.cStr() || *end != '\0' || mib == 0)
      return "map size must be a positive number of MiB";
    mapSizeBytes_ = size_t(mib) << 20;
    return true;
  }

  kj::MainBuilder::Validity optCheck(kj::StringPtr value)
  {
    if (value == "off")
      storeOpts_.check = canopy::CheckMode::Off;
    else if (value == "local")
      storeOpts_.check = canopy::CheckMode::Local;
    else if (value == "full")
      storeOpts_.check = canopy::CheckMode::Full;
    else
      return "check mode must be off, local or full";
    return true;
  }

  kj::MainBuilder::Validity run()
  {
    try
    {
      std::filesystem::create_directories(std::filesystem::path(dataDir_.cStr()));

      canopy::Env env(std::filesystem::path(dataDir_.cStr()), mapSizeBytes_);
      canopy::HierarchyStore store(env, storeOpts_);
      KJ_LOG(INFO, "opened data directory", dataDir_, mapSizeBytes_ >> 20);

      const char *bindC = bind_.cStr();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      capnp::EzRpcServer server(kj::heap<canopy::rpc::HierarchyImpl>(store), bindC);
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "canopyd listening on ", bindC);
      }
      else
      {
        auto addr = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "canopyd listening on ", bindC, " (port ", addr, ")");
      }
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(CanopydApp);
