#include "offer_registry.hpp"
#include "errors.hpp"

std::size_t OfferRegistry::append(const OfferDescriptor& offer, const std::string& origin_peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  OfferEntry entry;
  entry.index = entries_.size();
  entry.offer = offer;
  entry.origin_peer = origin_peer;
  entries_.push_back(std::move(entry));
  return entries_.back().index;
}

OfferEntry OfferRegistry::get(std::int64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if(index < 0 || static_cast<std::uint64_t>(index) >= entries_.size()) {
    throw IndexOutOfRange(index, entries_.size());
  }
  return entries_[static_cast<std::size_t>(index)];
}

std::size_t OfferRegistry::length() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<OfferEntry> OfferRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}
