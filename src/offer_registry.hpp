#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "protocol.hpp"

struct OfferEntry {
  std::size_t index = 0;
  OfferDescriptor offer;
  std::string origin_peer;
};

// Append-only log of discovered offers. Indices are assigned in append order
// and never reused.
class OfferStore {
public:
  virtual ~OfferStore() = default;

  virtual std::size_t append(const OfferDescriptor& offer, const std::string& origin_peer) = 0;
  // Throws IndexOutOfRange for a negative index or one past the end.
  virtual OfferEntry get(std::int64_t index) const = 0;
  virtual std::size_t length() const = 0;
  virtual std::vector<OfferEntry> snapshot() const = 0;
};

class OfferRegistry : public OfferStore {
public:
  std::size_t append(const OfferDescriptor& offer, const std::string& origin_peer) override;
  OfferEntry get(std::int64_t index) const override;
  std::size_t length() const override;
  std::vector<OfferEntry> snapshot() const override;

private:
  mutable std::mutex mutex_;
  std::vector<OfferEntry> entries_;
};
