#pragma once

#include <cassert>
#include <optional>
#include <queue>
#include <vector>

// Stable integer handles for values (the completion handlers in the IoQueue, whose index goes into
// the SQE user_data). Freed slots are reused.
template <typename T>
class SlotMap {
public:
    SlotMap() = default;

    SlotMap(size_t capacity) { slots_.reserve(capacity); }

    size_t size() const { return occupied_; }

    bool contains(size_t index) const
    {
        return index < slots_.size() && slots_[index].has_value();
    }

    template <typename... Args>
    size_t emplace(Args&&... args)
    {
        const auto idx = getNewIndex();
        slots_[idx].emplace(std::forward<Args>(args)...);
        occupied_++;
        return idx;
    }

    void remove(size_t index)
    {
        assert(contains(index));
        slots_[index].reset();
        occupied_--;
        freeList_.push(index);
    }

    T& operator[](size_t index)
    {
        assert(contains(index));
        return *slots_[index];
    }

    const T& operator[](size_t index) const
    {
        assert(contains(index));
        return *slots_[index];
    }

private:
    size_t getNewIndex()
    {
        if (!freeList_.empty()) {
            const auto idx = freeList_.front();
            freeList_.pop();
            return idx;
        }
        slots_.emplace_back();
        return slots_.size() - 1;
    }

    std::vector<std::optional<T>> slots_;
    size_t occupied_ = 0;
    std::queue<size_t> freeList_;
};
