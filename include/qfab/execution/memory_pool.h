#ifndef QFAB_EXECUTION_MEMORY_POOL_H_
#define QFAB_EXECUTION_MEMORY_POOL_H_

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "qfab/core/result.h"

namespace qfab {
namespace execution {

enum class MemoryPoolKind {
    UNBOUNDED,   // "none"
    GREEDY,      // strict ceiling, first come first served
    FAIR_SPILL   // fair share for spillable consumers
};

// "" / greedy / strict, fair / fair_spill, none / unbounded. Anything else is
// INVALID_CONFIGURATION.
core::Result<MemoryPoolKind> ParseMemoryPoolKind(const std::string& name);
std::string MemoryPoolKindToString(MemoryPoolKind kind);

class MemoryPool;

/**
 * @brief Named memory user inside one query
 */
class MemoryConsumer {
public:
    explicit MemoryConsumer(std::string name, bool can_spill = false)
        : name_(std::move(name)), can_spill_(can_spill) {}

    const std::string& name() const { return name_; }
    bool can_spill() const { return can_spill_; }

private:
    std::string name_;
    bool can_spill_;
};

/**
 * @brief Bytes held by one consumer, returned to the pool on destruction
 */
class MemoryReservation {
public:
    MemoryReservation() = default;
    ~MemoryReservation();

    MemoryReservation(MemoryReservation&& other) noexcept;
    MemoryReservation& operator=(MemoryReservation&& other) noexcept;
    MemoryReservation(const MemoryReservation&) = delete;
    MemoryReservation& operator=(const MemoryReservation&) = delete;

    size_t size() const { return size_; }
    const std::string& consumer() const { return consumer_.name(); }
    bool can_spill() const { return consumer_.can_spill(); }

    // Fails with RESOURCE_EXHAUSTED when the pool rejects the growth
    core::Result<void> TryGrow(size_t additional);

    // Grows without admission control; may overcommit
    void Grow(size_t additional);
    void Shrink(size_t bytes);
    void Free();

    // Grows or shrinks to exactly `bytes`
    core::Result<void> TryResize(size_t bytes);

private:
    friend class MemoryPool;
    MemoryReservation(std::shared_ptr<MemoryPool> pool, MemoryConsumer consumer)
        : pool_(std::move(pool)), consumer_(std::move(consumer)) {}

    std::shared_ptr<MemoryPool> pool_;
    MemoryConsumer consumer_{""};
    size_t size_ = 0;
};

/**
 * @brief Admission control for the memory of one execution context
 */
class MemoryPool : public std::enable_shared_from_this<MemoryPool> {
public:
    virtual ~MemoryPool() = default;

    MemoryReservation Register(const MemoryConsumer& consumer);

    virtual MemoryPoolKind kind() const = 0;
    virtual size_t reserved() const = 0;
    // SIZE_MAX for the unbounded pool
    virtual size_t capacity() const = 0;

    // True when spillable consumers are expected to spill on rejection
    bool supports_spill() const { return kind() == MemoryPoolKind::FAIR_SPILL; }

protected:
    friend class MemoryReservation;

    virtual void OnRegister(const MemoryConsumer& consumer) = 0;
    virtual void OnUnregister(const MemoryConsumer& consumer, size_t size) = 0;
    virtual void OnGrow(const MemoryReservation& reservation, size_t additional) = 0;
    virtual void OnShrink(const MemoryReservation& reservation, size_t bytes) = 0;
    virtual core::Result<void> OnTryGrow(const MemoryReservation& reservation, size_t additional) = 0;
};

class UnboundedMemoryPool : public MemoryPool {
public:
    MemoryPoolKind kind() const override { return MemoryPoolKind::UNBOUNDED; }
    size_t reserved() const override;
    size_t capacity() const override;

protected:
    void OnRegister(const MemoryConsumer&) override {}
    void OnUnregister(const MemoryConsumer&, size_t) override {}
    void OnGrow(const MemoryReservation& reservation, size_t additional) override;
    void OnShrink(const MemoryReservation& reservation, size_t bytes) override;
    core::Result<void> OnTryGrow(const MemoryReservation& reservation, size_t additional) override;

private:
    mutable std::mutex mutex_;
    size_t used_ = 0;
};

/**
 * @brief Strict ceiling: a growth beyond the pool size is rejected
 */
class GreedyMemoryPool : public MemoryPool {
public:
    explicit GreedyMemoryPool(size_t pool_size) : pool_size_(pool_size) {}

    MemoryPoolKind kind() const override { return MemoryPoolKind::GREEDY; }
    size_t reserved() const override;
    size_t capacity() const override { return pool_size_; }

protected:
    void OnRegister(const MemoryConsumer&) override {}
    void OnUnregister(const MemoryConsumer&, size_t) override {}
    void OnGrow(const MemoryReservation& reservation, size_t additional) override;
    void OnShrink(const MemoryReservation& reservation, size_t bytes) override;
    core::Result<void> OnTryGrow(const MemoryReservation& reservation, size_t additional) override;

private:
    size_t pool_size_;
    mutable std::mutex mutex_;
    size_t used_ = 0;
};

/**
 * @brief Fair share between spillable consumers
 *
 * Unspillable consumers take what is left after everything already reserved.
 * Each spillable consumer may hold at most
 * (pool_size - unspillable) / spillable_consumer_count bytes.
 */
class FairSpillPool : public MemoryPool {
public:
    explicit FairSpillPool(size_t pool_size) : pool_size_(pool_size) {}

    MemoryPoolKind kind() const override { return MemoryPoolKind::FAIR_SPILL; }
    size_t reserved() const override;
    size_t capacity() const override { return pool_size_; }

protected:
    void OnRegister(const MemoryConsumer& consumer) override;
    void OnUnregister(const MemoryConsumer& consumer, size_t size) override;
    void OnGrow(const MemoryReservation& reservation, size_t additional) override;
    void OnShrink(const MemoryReservation& reservation, size_t bytes) override;
    core::Result<void> OnTryGrow(const MemoryReservation& reservation, size_t additional) override;

private:
    size_t pool_size_;
    mutable std::mutex mutex_;
    size_t num_spill_ = 0;
    size_t spillable_ = 0;
    size_t unspillable_ = 0;
};

std::shared_ptr<MemoryPool> CreateMemoryPool(MemoryPoolKind kind, size_t pool_size);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_MEMORY_POOL_H_
