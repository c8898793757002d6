#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>

namespace patchy {

// Array indexed from min to max inclusive; the Myers search keeps one
// furthest-reaching x per diagonal k in -D..D.
template <typename Type>
struct BipolarArray {
    int64_t min_;
    int64_t max_;
    std::size_t capacity_;
    std::unique_ptr<Type[]> arr_;

    BipolarArray(int64_t min, int64_t max)
        : min_(min), max_(max), capacity_(static_cast<std::size_t>(max - min + 1)) {
        assert(max - min + 1 >= 0);
        arr_ = std::make_unique<Type[]>(capacity_);
    }

    BipolarArray(const BipolarArray& other) : min_(other.min_), max_(other.max_), capacity_(other.capacity_) {
        // Skip value-initialization; every slot is overwritten by the copy.
        arr_ = std::unique_ptr<Type[]>{new Type[capacity_]};
        std::memcpy(arr_.get(), other.arr_.get(), capacity_ * sizeof(Type));
    }

    BipolarArray(BipolarArray&& other) = default;

    Type&
    operator[](int64_t index) {
        auto offset = index - min_;
        assert(offset >= 0 && offset < static_cast<int64_t>(capacity_));
        return arr_[static_cast<std::size_t>(offset)];
    }

    const Type&
    operator[](int64_t index) const {
        auto offset = index - min_;
        assert(offset >= 0 && offset < static_cast<int64_t>(capacity_));
        return arr_[static_cast<std::size_t>(offset)];
    }

    std::size_t
    size() const {
        return capacity_;
    }
};

}  // namespace patchy
