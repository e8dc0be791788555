// Repository: MediaRelay
// Component: Delivery Failure Ledger
// Purpose: Count consecutive failed delivery passes per path so a
//          permanently undeliverable artifact can be set aside.
// Copyright (c) 2025 MediaRelay

#ifndef MEDIARELAY_DELIVERY_DELIVERY_FAILURE_LEDGER_HPP_
#define MEDIARELAY_DELIVERY_DELIVERY_FAILURE_LEDGER_HPP_

#include <map>
#include <set>
#include <string>

namespace mediarelay::delivery {

// In-memory only; counts restart with the process. Not thread-safe.
class DeliveryFailureLedger {
 public:
  // max_failures == 0 disables the bound (retry forever).
  explicit DeliveryFailureLedger(int max_failures) : max_failures_(max_failures) {}

  // Returns the new consecutive-failure count.
  int RecordFailure(const std::string& path);
  void RecordSuccess(const std::string& path);

  int Failures(const std::string& path) const;

  // True once the bound is enabled and reached.
  bool Exhausted(const std::string& path) const;

  void Forget(const std::string& path) { counts_.erase(path); }

  // Drops every path not in live (deleted, moved or renamed since it
  // failed). Returns the number dropped.
  size_t Retain(const std::set<std::string>& live);

  size_t Tracked() const { return counts_.size(); }

 private:
  int max_failures_;
  std::map<std::string, int> counts_;
};

}  // namespace mediarelay::delivery

#endif  // MEDIARELAY_DELIVERY_DELIVERY_FAILURE_LEDGER_HPP_
