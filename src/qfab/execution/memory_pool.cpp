#include "qfab/execution/memory_pool.h"

#include <algorithm>
#include <cctype>
#include <limits>

#include "qfab/common/logger.h"

namespace qfab {
namespace execution {

core::Result<MemoryPoolKind> ParseMemoryPoolKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.empty() || lower == "greedy" || lower == "strict") {
        return core::Result<MemoryPoolKind>(MemoryPoolKind::GREEDY);
    }
    if (lower == "fair" || lower == "fair_spill") {
        return core::Result<MemoryPoolKind>(MemoryPoolKind::FAIR_SPILL);
    }
    if (lower == "none" || lower == "unbounded") {
        return core::Result<MemoryPoolKind>(MemoryPoolKind::UNBOUNDED);
    }
    return core::Result<MemoryPoolKind>::error("Unknown memory pool strategy: " + name,
                                               core::Error::Code::INVALID_CONFIGURATION);
}

std::string MemoryPoolKindToString(MemoryPoolKind kind) {
    switch (kind) {
        case MemoryPoolKind::UNBOUNDED: return "unbounded";
        case MemoryPoolKind::GREEDY: return "greedy";
        case MemoryPoolKind::FAIR_SPILL: return "fair_spill";
    }
    return "greedy";
}

// ---------------------------------------------------------------------------
// MemoryReservation
// ---------------------------------------------------------------------------

MemoryReservation::~MemoryReservation() {
    if (pool_) {
        pool_->OnUnregister(consumer_, size_);
        size_ = 0;
    }
}

MemoryReservation::MemoryReservation(MemoryReservation&& other) noexcept
    : pool_(std::move(other.pool_)), consumer_(std::move(other.consumer_)), size_(other.size_) {
    other.size_ = 0;
}

MemoryReservation& MemoryReservation::operator=(MemoryReservation&& other) noexcept {
    if (this != &other) {
        if (pool_) {
            pool_->OnUnregister(consumer_, size_);
        }
        pool_ = std::move(other.pool_);
        consumer_ = std::move(other.consumer_);
        size_ = other.size_;
        other.size_ = 0;
    }
    return *this;
}

core::Result<void> MemoryReservation::TryGrow(size_t additional) {
    if (!pool_) {
        return core::Result<void>::error("Reservation is not registered with a pool", core::Error::Code::INTERNAL);
    }
    if (additional == 0) return core::Result<void>();
    auto res = pool_->OnTryGrow(*this, additional);
    if (!res.ok()) return res;
    size_ += additional;
    return core::Result<void>();
}

void MemoryReservation::Grow(size_t additional) {
    if (!pool_ || additional == 0) return;
    pool_->OnGrow(*this, additional);
    size_ += additional;
}

void MemoryReservation::Shrink(size_t bytes) {
    if (!pool_) return;
    bytes = std::min(bytes, size_);
    if (bytes == 0) return;
    pool_->OnShrink(*this, bytes);
    size_ -= bytes;
}

void MemoryReservation::Free() {
    Shrink(size_);
}

core::Result<void> MemoryReservation::TryResize(size_t bytes) {
    if (bytes > size_) {
        return TryGrow(bytes - size_);
    }
    Shrink(size_ - bytes);
    return core::Result<void>();
}

// ---------------------------------------------------------------------------
// MemoryPool
// ---------------------------------------------------------------------------

MemoryReservation MemoryPool::Register(const MemoryConsumer& consumer) {
    OnRegister(consumer);
    return MemoryReservation(shared_from_this(), consumer);
}

namespace {
core::Result<void> Exhausted(const MemoryReservation& reservation, size_t additional, size_t available) {
    return core::Result<void>::error(
        "Resources exhausted: failed to allocate additional " + std::to_string(additional) +
            " bytes for " + reservation.consumer() + " with " + std::to_string(reservation.size()) +
            " bytes already allocated, " + std::to_string(available) + " bytes available",
        core::Error::Code::RESOURCE_EXHAUSTED);
}
} // namespace

size_t UnboundedMemoryPool::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_;
}

size_t UnboundedMemoryPool::capacity() const {
    return std::numeric_limits<size_t>::max();
}

void UnboundedMemoryPool::OnGrow(const MemoryReservation&, size_t additional) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_ += additional;
}

void UnboundedMemoryPool::OnShrink(const MemoryReservation&, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_ -= std::min(bytes, used_);
}

core::Result<void> UnboundedMemoryPool::OnTryGrow(const MemoryReservation&, size_t additional) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_ += additional;
    return core::Result<void>();
}

size_t GreedyMemoryPool::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_;
}

void GreedyMemoryPool::OnGrow(const MemoryReservation&, size_t additional) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_ += additional;
}

void GreedyMemoryPool::OnShrink(const MemoryReservation&, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_ -= std::min(bytes, used_);
}

core::Result<void> GreedyMemoryPool::OnTryGrow(const MemoryReservation& reservation, size_t additional) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (used_ + additional > pool_size_) {
        return Exhausted(reservation, additional, pool_size_ > used_ ? pool_size_ - used_ : 0);
    }
    used_ += additional;
    return core::Result<void>();
}

size_t FairSpillPool::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spillable_ + unspillable_;
}

void FairSpillPool::OnRegister(const MemoryConsumer& consumer) {
    if (consumer.can_spill()) {
        std::lock_guard<std::mutex> lock(mutex_);
        num_spill_++;
    }
}

void FairSpillPool::OnUnregister(const MemoryConsumer& consumer, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumer.can_spill()) {
        spillable_ -= std::min(size, spillable_);
        if (num_spill_ > 0) num_spill_--;
    } else {
        unspillable_ -= std::min(size, unspillable_);
    }
}

void FairSpillPool::OnGrow(const MemoryReservation& reservation, size_t additional) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reservation.can_spill()) {
        spillable_ += additional;
    } else {
        unspillable_ += additional;
    }
}

void FairSpillPool::OnShrink(const MemoryReservation& reservation, size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reservation.can_spill()) {
        spillable_ -= std::min(bytes, spillable_);
    } else {
        unspillable_ -= std::min(bytes, unspillable_);
    }
}

core::Result<void> FairSpillPool::OnTryGrow(const MemoryReservation& reservation, size_t additional) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reservation.can_spill()) {
        // The fair share of every spillable consumer
        size_t spill_available = pool_size_ > unspillable_ ? pool_size_ - unspillable_ : 0;
        size_t available = num_spill_ > 0 ? spill_available / num_spill_ : spill_available;
        if (reservation.size() + additional > available) {
            return Exhausted(reservation, additional,
                             available > reservation.size() ? available - reservation.size() : 0);
        }
        spillable_ += additional;
    } else {
        size_t used = unspillable_ + spillable_;
        size_t available = pool_size_ > used ? pool_size_ - used : 0;
        if (available < additional) {
            return Exhausted(reservation, additional, available);
        }
        unspillable_ += additional;
    }
    return core::Result<void>();
}

std::shared_ptr<MemoryPool> CreateMemoryPool(MemoryPoolKind kind, size_t pool_size) {
    switch (kind) {
        case MemoryPoolKind::UNBOUNDED:
            return std::make_shared<UnboundedMemoryPool>();
        case MemoryPoolKind::FAIR_SPILL:
            return std::make_shared<FairSpillPool>(pool_size);
        case MemoryPoolKind::GREEDY:
            break;
    }
    return std::make_shared<GreedyMemoryPool>(pool_size);
}

} // namespace execution
} // namespace qfab
