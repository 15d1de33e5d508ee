#include "room_lock_table.hpp"

#include <utility>

namespace roombook::lock {

RoomGuard::RoomGuard(std::shared_ptr<RoomGate> gate, AcquireStatus status) : gate_(std::move(gate)), status_(status) {
}

RoomGuard::~RoomGuard() {
  Reset();
}

RoomGuard::RoomGuard(RoomGuard&& other) noexcept : gate_(std::move(other.gate_)), status_(other.status_) {
  other.status_ = AcquireStatus::kTimedOut;
}

RoomGuard& RoomGuard::operator=(RoomGuard&& other) noexcept {
  if (this != &other) {
    Reset();
    gate_         = std::move(other.gate_);
    status_       = other.status_;
    other.status_ = AcquireStatus::kTimedOut;
  }
  return *this;
}

void RoomGuard::Reset() {
  if (OwnsRoom()) {
    gate_->Release();
  }
  gate_.reset();
  status_ = AcquireStatus::kTimedOut;
}

std::shared_ptr<RoomGate> RoomLockTable::Gate(const std::string& room_id) {
  std::lock_guard lock(mutex_);
  auto&           gate = gates_[room_id];
  if (!gate) {
    gate = std::make_shared<RoomGate>();
  }
  return gate;
}

RoomGuard RoomLockTable::Acquire(const std::string& room_id, std::chrono::milliseconds timeout, const CancellationToken* cancel) {
  auto       gate   = Gate(room_id);
  const auto status = gate->Acquire(timeout, cancel);
  if (status != AcquireStatus::kAcquired) {
    return RoomGuard(nullptr, status);
  }
  return RoomGuard(std::move(gate), status);
}

std::size_t RoomLockTable::Size() {
  std::lock_guard lock(mutex_);
  return gates_.size();
}

} // namespace roombook::lock
