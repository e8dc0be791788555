// Repository: MediaRelay
// Component: Delivery Failure Ledger
// Copyright (c) 2025 MediaRelay

#include "mediarelay/delivery/DeliveryFailureLedger.hpp"

namespace mediarelay::delivery {

int DeliveryFailureLedger::RecordFailure(const std::string& path) {
  return ++counts_[path];
}

void DeliveryFailureLedger::RecordSuccess(const std::string& path) {
  counts_.erase(path);
}

int DeliveryFailureLedger::Failures(const std::string& path) const {
  auto it = counts_.find(path);
  return it == counts_.end() ? 0 : it->second;
}

size_t DeliveryFailureLedger::Retain(const std::set<std::string>& live) {
  size_t dropped = 0;
  for (auto it = counts_.begin(); it != counts_.end();) {
    if (live.count(it->first) == 0) {
      it = counts_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

bool DeliveryFailureLedger::Exhausted(const std::string& path) const {
  return max_failures_ > 0 && Failures(path) >= max_failures_;
}

}  // namespace mediarelay::delivery
