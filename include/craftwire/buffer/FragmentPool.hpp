#pragma once

#include <cstddef>
#include <new>
#include <optional>
#include <utility>

namespace craftwire {

/*
 Fixed-capacity LIFO stash. Holds at most min(limit, N) elements inline;
 lossy_push drops whatever does not fit.
*/
template<typename T, size_t N>
class FragmentPool {
public:
    explicit FragmentPool(size_t limit = N)
        : limit_(limit < N ? limit : N) {}

    ~FragmentPool() {
        clear();
    }

    FragmentPool(const FragmentPool&) = delete;
    FragmentPool& operator=(const FragmentPool&) = delete;

    // Stores the element if there is room. On false the element is untouched.
    bool try_push(T&& element) {
        if (end_ >= limit_) return false;
        new (slot(end_)) T(std::move(element));
        ++end_;
        return true;
    }

    void lossy_push(T element) {
        if (end_ >= limit_) return; // element dies here
        new (slot(end_)) T(std::move(element));
        ++end_;
    }

    std::optional<T> maybe_pop() {
        if (end_ == 0) return std::nullopt;
        --end_;
        T* p = slot(end_);
        std::optional<T> out(std::move(*p));
        p->~T();
        return out;
    }

    void clear() {
        while (end_ > 0) {
            --end_;
            slot(end_)->~T();
        }
    }

    size_t size() const { return end_; }
    size_t limit() const { return limit_; }
    bool empty() const { return end_ == 0; }
    bool full() const { return end_ >= limit_; }

private:
    T* slot(size_t i) {
        return std::launder(reinterpret_cast<T*>(storage_ + i * sizeof(T)));
    }

    alignas(T) unsigned char storage_[N * sizeof(T)];
    size_t end_ = 0;
    size_t limit_;
};

}
