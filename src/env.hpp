#pragma once
#include <filesystem>
#include <stdexcept>

struct MDB_env;
struct MDB_txn;
using DbHandle = unsigned int;

namespace canopy
{

  struct MdbError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw, MDB_txn *parent = nullptr);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    MDB_txn *get() const;
    bool writable() const { return rw_; }
    // child of a write txn; its changes reach the parent only on commit
    Txn nested() const { return Txn(env_, true, txn_); }
    void commit();
    void abort() noexcept;

  private:
    MDB_env *env_{};
    MDB_txn *txn_{};
    bool rw_{};
  };

  class Env
  {
  public:
    Env(const std::filesystem::path &path, size_t mapSizeBytes = size_t(16ull << 30));
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    MDB_env *raw() const;

    Txn beginRead() const { return Txn(env_, false); }
    Txn beginWrite() const { return Txn(env_, true); }

    DbHandle nodes() const;
    DbHandle byLeft() const;
    DbHandle byRight() const;
    DbHandle children() const;

    DbHandle kindIds() const;
    DbHandle kindsByName() const;

    DbHandle meta() const;

  private:
    static void open(MDB_txn *tx, DbHandle &out, const char *name);

    MDB_env *env_{};
    DbHandle nodes_{};
    DbHandle byLeft_{};
    DbHandle byRight_{};
    DbHandle children_{};

    DbHandle kindIds_{};
    DbHandle kindsByName_{};

    DbHandle meta_{};
  };

} // namespace canopy
