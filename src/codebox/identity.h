#ifndef CODEBOX_IDENTITY_H_
#define CODEBOX_IDENTITY_H_

#include <mutex>
#include <vector>

#include <sys/types.h>

// The uids workers run under when the manager is root, one per live worker, so that
// per-user accounting such as RLIMIT_NPROC never mixes two workers.
class IdentityPool {
  std::mutex mutex_;
  std::vector<int> free_;

  void Return_(int uid);
 public:
  class Lease {
    IdentityPool* pool_;
    int uid_;
    friend class IdentityPool;
   public:
    Lease() : pool_(nullptr), uid_(-1) {}
    ~Lease() { Reset(); }
    Lease(Lease&& x) noexcept : pool_(x.pool_), uid_(x.uid_) { x.pool_ = nullptr; x.uid_ = -1; }
    Lease& operator=(Lease&& x) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    void Reset();
    int uid() const { return uid_; }
    explicit operator bool() const { return uid_ >= 0; }
  };

  // uids [base, base + count)
  IdentityPool(int base, int count);
  IdentityPool(const IdentityPool&) = delete;
  IdentityPool& operator=(const IdentityPool&) = delete;

  // An empty lease when every uid is taken.
  Lease Take();
  size_t Available();
};

// SIGKILLs every process running as uid, including ones that left their process group.
// Must not be called with the manager's own uid.
void KillUser(int uid);

#endif  // CODEBOX_IDENTITY_H_
