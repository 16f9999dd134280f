#pragma once

#include <atomic>
#include <bit>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <thread>
#include <type_traits>
#include <utility>

namespace pasture {

static constexpr std::size_t cacheLineSize = 64;

// A slot is free for writing on even turns and holds a value on odd turns.
template <typename T>
struct Slot
{
    Slot() noexcept : turn(0) {}

    ~Slot() {
        if (turn.load(std::memory_order_relaxed) & 1)
            destroy();
    }

    template <typename... Args>
    void construct(Args&&... args) {
        new (&data) T(std::forward<Args>(args)...);
    }

    T* get() noexcept { return std::launder(reinterpret_cast<T*>(&data)); }

    T&& move() noexcept { return std::move(*get()); }

    void destroy() noexcept { get()->~T(); }

    alignas(cacheLineSize) std::atomic<uint64_t> turn;
    alignas(T) unsigned char data[sizeof(T)];
};


/// Bounded lock-free queue for many producers and many consumers.
///
/// Producers block (spinning with yield) while the queue is full; consumers
/// have non-blocking try_* variants. The capacity is rounded up to a power of
/// two.
template <typename T>
class MPMCQueue
{
    static_assert(std::is_nothrow_destructible_v<T>, "T must be nothrow destructible");

public:
    explicit MPMCQueue(uint64_t capacity)
        : capacity_(std::bit_ceil(capacity < 2 ? uint64_t{2} : capacity))
        , mask_(capacity_ - 1)
        , slots_(std::make_unique<Slot<T>[]>(capacity_))
        , head_(0), tail_(0)
    {}

    MPMCQueue(const MPMCQueue&) = delete;
    MPMCQueue& operator=(const MPMCQueue&) = delete;

    template <typename... Args>
    void emplace(Args&&... args) {
        uint64_t old_head = head_.fetch_add(1);
        auto& slot = get_slot(old_head);
        while (turn(old_head) * 2 != slot.turn.load(std::memory_order_acquire))
            std::this_thread::yield();

        slot.construct(std::forward<Args>(args)...);
        slot.turn.store(turn(old_head) * 2 + 1, std::memory_order_release);
    }

    /// Like emplace, but lets `f` build the element in place: f(T*, args...).
    /// T must be default constructible; the slot is value-initialized first.
    template <typename Fn, typename... Args>
    void emplace_with(Fn& f, Args&&... args) {
        uint64_t old_head = head_.fetch_add(1);
        auto& slot = get_slot(old_head);
        while (turn(old_head) * 2 != slot.turn.load(std::memory_order_acquire))
            std::this_thread::yield();

        slot.construct();
        f(slot.get(), std::forward<Args>(args)...);
        slot.turn.store(turn(old_head) * 2 + 1, std::memory_order_release);
    }

    bool try_pop(T& v) {
        uint64_t old_tail = tail_.load(std::memory_order_acquire);
        for (;;) {
            auto& slot = get_slot(old_tail);
            if (turn(old_tail) * 2 + 1 == slot.turn.load(std::memory_order_acquire)) {
                if (tail_.compare_exchange_strong(old_tail, old_tail + 1)) {
                    v = slot.move();
                    release(slot, old_tail);
                    return true;
                }
            } else {
                auto now_tail = tail_.load(std::memory_order_acquire);
                if (now_tail == old_tail)
                    return false;
                old_tail = now_tail;
            }
        }
    }

    /// Hand every element that is ready to `f` (as T*), returns how many
    /// were consumed.
    ///
    /// When the slot at the tail is not ready yet we re-read the tail: if it
    /// moved, another consumer won that slot and the queue is busy, so keep
    /// going from the new tail. If it did not move, the producer has not
    /// finished writing and waiting could take arbitrarily long, so return.
    template <typename Fn, typename... Args>
    uint64_t try_consume_all(Fn& f, Args&&... args) {
        uint64_t old_tail = tail_.load(std::memory_order_acquire);
        uint64_t consume_cnt = 0;
        for (;;) {
            auto& slot = get_slot(old_tail);
            if (turn(old_tail) * 2 + 1 == slot.turn.load(std::memory_order_acquire)) {
                if (tail_.compare_exchange_strong(old_tail, old_tail + 1)) {
                    f(slot.get(), std::forward<Args>(args)...);
                    release(slot, old_tail);
                    ++old_tail;
                    ++consume_cnt;
                }
            } else {
                auto prev_old_tail = old_tail;
                old_tail = tail_.load(std::memory_order_acquire);
                if (prev_old_tail == old_tail)
                    return consume_cnt;
            }
        }
    }

    uint64_t capacity() const noexcept { return capacity_; }

    uint64_t size() const noexcept {
        auto diff = static_cast<std::int64_t>(
            head_.load(std::memory_order_relaxed) - tail_.load(std::memory_order_relaxed));
        return diff > 0 ? static_cast<uint64_t>(diff) : 0;
    }

    bool empty() const noexcept { return size() == 0; }

private:
    Slot<T>& get_slot(uint64_t i) noexcept { return slots_[i & mask_]; }

    constexpr uint64_t turn(uint64_t i) const noexcept { return i / capacity_; }

    void release(Slot<T>& slot, uint64_t pos) noexcept {
        slot.destroy();
        auto new_turn = turn(pos) * 2 + 2;
        if (turn(pos) == turn(std::numeric_limits<uint64_t>::max()))
            new_turn = 0;
        slot.turn.store(new_turn, std::memory_order_release);
    }

    uint64_t capacity_;
    uint64_t mask_;
    std::unique_ptr<Slot<T>[]> slots_;

    alignas(cacheLineSize) std::atomic<uint64_t> head_;
    alignas(cacheLineSize) std::atomic<uint64_t> tail_;
};

} // namespace pasture
