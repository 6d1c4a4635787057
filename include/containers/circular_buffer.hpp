#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

namespace statarb {

/// Bounded circular buffer (ring buffer) for price histories and rolling windows.
/// push_back() overwrites the oldest element when full.
/// Capacity is chosen at runtime so windows can come from configuration, and
/// the buffer is a value type: strategy memory entries copy it freely.
template<typename T>
class CircularBuffer {
public:
    CircularBuffer() = default;
    explicit CircularBuffer(size_t capacity) : buffer_(capacity) {}

    void push_back(const T& value) {
        if (buffer_.empty()) return;
        buffer_[write_pos_] = value;
        write_pos_ = (write_pos_ + 1) % buffer_.size();
        if (count_ < buffer_.size()) {
            ++count_;
        }
    }

    /// Access element by logical index (0 = oldest, size()-1 = newest).
    const T& operator[](size_t idx) const noexcept {
        return buffer_[(start() + idx) % buffer_.size()];
    }

    T& operator[](size_t idx) noexcept {
        return buffer_[(start() + idx) % buffer_.size()];
    }

    const T& back() const noexcept {
        return buffer_[(write_pos_ + buffer_.size() - 1) % buffer_.size()];
    }

    const T& front() const noexcept {
        return buffer_[start()];
    }

    /// Element `n` positions before the newest (0 = newest).
    const T& from_back(size_t n) const noexcept {
        return (*this)[count_ - 1 - n];
    }

    size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }
    bool full() const noexcept { return count_ == buffer_.size(); }
    size_t capacity() const noexcept { return buffer_.size(); }

    void clear() noexcept {
        write_pos_ = 0;
        count_ = 0;
    }

    /// Resize, keeping the newest min(size(), capacity) elements in order.
    void set_capacity(size_t capacity) {
        if (capacity == buffer_.size()) return;
        size_t keep = count_ < capacity ? count_ : capacity;
        std::vector<T> next(capacity);
        for (size_t i = 0; i < keep; ++i) {
            next[i] = (*this)[count_ - keep + i];
        }
        buffer_.swap(next);
        count_ = keep;
        write_pos_ = capacity == 0 ? 0 : keep % capacity;
    }

    /// Copy of the newest `n` elements (or all of them), oldest first.
    std::vector<T> tail(size_t n) const {
        size_t take = n < count_ ? n : count_;
        std::vector<T> out;
        out.reserve(take);
        for (size_t i = count_ - take; i < count_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

    // Iterator support
    class Iterator {
    public:
        using difference_type = std::ptrdiff_t;
        using value_type = T;
        using pointer = const T*;
        using reference = const T&;
        using iterator_category = std::random_access_iterator_tag;

        Iterator(const CircularBuffer* buf, size_t idx) noexcept
            : buf_(buf), idx_(idx) {}

        reference operator*() const noexcept { return (*buf_)[idx_]; }
        pointer operator->() const noexcept { return &(*buf_)[idx_]; }

        Iterator& operator++() noexcept { ++idx_; return *this; }
        Iterator operator++(int) noexcept { Iterator tmp = *this; ++idx_; return tmp; }
        Iterator& operator--() noexcept { --idx_; return *this; }
        Iterator operator--(int) noexcept { Iterator tmp = *this; --idx_; return tmp; }

        Iterator operator+(difference_type n) const noexcept { return Iterator(buf_, idx_ + n); }
        Iterator operator-(difference_type n) const noexcept { return Iterator(buf_, idx_ - n); }
        difference_type operator-(const Iterator& other) const noexcept {
            return static_cast<difference_type>(idx_) - static_cast<difference_type>(other.idx_);
        }

        Iterator& operator+=(difference_type n) noexcept { idx_ += n; return *this; }
        Iterator& operator-=(difference_type n) noexcept { idx_ -= n; return *this; }

        reference operator[](difference_type n) const noexcept { return (*buf_)[idx_ + n]; }

        bool operator==(const Iterator& other) const noexcept { return idx_ == other.idx_; }
        bool operator!=(const Iterator& other) const noexcept { return idx_ != other.idx_; }
        bool operator<(const Iterator& other) const noexcept { return idx_ < other.idx_; }

    private:
        const CircularBuffer* buf_;
        size_t idx_;
    };

    Iterator begin() const noexcept { return Iterator(this, 0); }
    Iterator end() const noexcept { return Iterator(this, count_); }

private:
    size_t start() const noexcept {
        return (count_ < buffer_.size()) ? 0 : write_pos_;
    }

    std::vector<T> buffer_;
    size_t write_pos_ = 0;
    size_t count_ = 0;
};

} // namespace statarb
