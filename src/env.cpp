#include "env.hpp"
#include <lmdb.h>
#include <utility>

namespace canopy
{

  Txn::Txn(MDB_env *env, bool rw, MDB_txn *parent) : env_(env), rw_(rw)
  {
    int rc = mdb_txn_begin(env_, parent, rw_ ? 0 : MDB_RDONLY, &txn_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Txn::~Txn() noexcept
  {
    if (txn_)
      mdb_txn_abort(txn_);
  }

  Txn::Txn(Txn &&other) noexcept : env_(other.env_), txn_(other.txn_), rw_(other.rw_)
  {
    other.txn_ = nullptr;
  }

  Txn &Txn::operator=(Txn &&other) noexcept
  {
    if (this != &other)
    {
      abort();
      env_ = other.env_;
      txn_ = other.txn_;
      rw_ = other.rw_;
      other.txn_ = nullptr;
    }
    return *this;
  }

  MDB_txn *Txn::get() const { return txn_; }

  void Txn::commit()
  {
    int rc = mdb_txn_commit(txn_);
    txn_ = nullptr;
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void Txn::abort() noexcept
  {
    if (txn_)
    {
      mdb_txn_abort(txn_);
      txn_ = nullptr;
    }
  }

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes)
  {
    int rc = mdb_env_create(&env_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    rc = mdb_env_set_maxdbs(env_, 16);
    if (rc == 0)
      rc = mdb_env_set_mapsize(env_, mapSizeBytes);
    // read snapshots are not tied to a thread; writers still serialize on the env lock
    if (rc == 0)
      rc = mdb_env_open(env_, path.c_str(), MDB_NOTLS, 0664);
    if (rc)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw MdbError(mdb_strerror(rc));
    }
    try
    {
      Txn tx(env_, true);
      open(tx.get(), nodes_, "nodes");
      open(tx.get(), byLeft_, "byLeft");
      open(tx.get(), byRight_, "byRight");
      open(tx.get(), children_, "children");

      open(tx.get(), kindIds_, "kindIds");
      open(tx.get(), kindsByName_, "kindsByName");

      open(tx.get(), meta_, "meta");
      tx.commit();
    }
    catch (const MdbError &)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw;
    }
  }

  Env::~Env() noexcept
  {
    if (env_)
      mdb_env_close(env_);
  }

  Env::Env(Env &&other) noexcept
      : env_(other.env_),
        nodes_(other.nodes_),
        byLeft_(other.byLeft_),
        byRight_(other.byRight_),
        children_(other.children_),
        kindIds_(other.kindIds_),
        kindsByName_(other.kindsByName_),
        meta_(other.meta_)
  {
    other.env_ = nullptr;
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      if (env_)
        mdb_env_close(env_);
      env_ = other.env_;
      nodes_ = other.nodes_;
      byLeft_ = other.byLeft_;
      byRight_ = other.byRight_;
      children_ = other.children_;

      kindIds_ = other.kindIds_;
      kindsByName_ = other.kindsByName_;

      meta_ = other.meta_;
      other.env_ = nullptr;
    }
    return *this;
  }

  MDB_env *Env::raw() const { return env_; }
  DbHandle Env::nodes() const { return nodes_; }
  DbHandle Env::byLeft() const { return byLeft_; }
  DbHandle Env::byRight() const { return byRight_; }
  DbHandle Env::children() const { return children_; }

  DbHandle Env::kindIds() const { return kindIds_; }
  DbHandle Env::kindsByName() const { return kindsByName_; }

  DbHandle Env::meta() const { return meta_; }

  void Env::open(MDB_txn *tx, DbHandle &out, const char *name)
  {
    int rc = mdb_dbi_open(tx, name, MDB_CREATE, &out);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

} // namespace canopy
