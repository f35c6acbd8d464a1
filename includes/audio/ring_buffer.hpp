#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace wakescribe {

// Fixed-capacity circular buffer. Once full, each push overwrites the oldest element.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t n) : data_(n), n_(n) {
        if (n == 0) throw std::invalid_argument("RingBuffer capacity must be positive");
    }

    void push(T v) { data_[idx_] = v; idx_ = (idx_ + 1) % n_; filled_ = filled_ || idx_ == 0; ++total_; }

    void push(const T* v, std::size_t count) {
        if (count == 0) return;
        total_ += count;
        if (count >= n_) {
            // Only the newest n_ survive.
            std::copy(v + (count - n_), v + count, data_.begin());
            idx_ = 0;
            filled_ = true;
            return;
        }
        const std::size_t first = std::min(count, n_ - idx_);
        std::copy(v, v + first, data_.begin() + idx_);
        std::copy(v + first, v + count, data_.begin());
        const std::size_t next = (idx_ + count) % n_;
        filled_ = filled_ || next <= idx_;
        idx_ = next;
    }

    std::size_t size() const { return filled_ ? n_ : idx_; }
    std::size_t capacity() const { return n_; }

    // Number of elements ever pushed, including overwritten ones.
    std::uint64_t totalPushed() const { return total_; }

    // Appends the newest `count` elements to `out`, oldest first.
    void copyLast(std::size_t count, std::vector<T>& out) const {
        count = std::min(count, size());
        out.reserve(out.size() + count);
        std::size_t start = (idx_ + n_ - count) % n_;
        for (std::size_t i = 0; i < count; ++i) out.push_back(data_[(start + i) % n_]);
    }

    void clear() { idx_ = 0; filled_ = false; }

private:
    std::vector<T> data_;
    std::size_t n_{};
    std::size_t idx_{};
    bool filled_{};
    std::uint64_t total_{};
};

} // namespace wakescribe
