#ifndef HOTSTRING_CIRCULAR_BUFFER_H
#define HOTSTRING_CIRCULAR_BUFFER_H

#include <cstddef>
#include <optional>
#include <vector>

namespace hotstring {
namespace utils {

// Fixed-capacity ring of the most recent values. Pushing onto a full
// buffer drops the oldest value.
template <typename T>
class CircularBuffer {
public:
    explicit CircularBuffer(size_t capacity)
        : storage_(capacity > 0 ? capacity : 1), start_(0), size_(0) {}

    void push(const T& value) {
        if (size_ == storage_.size()) {
            storage_[start_] = value;
            start_ = (start_ + 1) % storage_.size();
        } else {
            storage_[index(size_)] = value;
            ++size_;
        }
    }

    // Removes and returns the newest value
    std::optional<T> pop() {
        if (size_ == 0) {
            return std::nullopt;
        }
        --size_;
        return storage_[index(size_)];
    }

    // Newest value, if any
    std::optional<T> head() const {
        if (size_ == 0) {
            return std::nullopt;
        }
        return storage_[index(size_ - 1)];
    }

    // The newest count values, oldest first
    std::vector<T> getEnding(size_t count) const {
        if (count > size_) {
            count = size_;
        }
        std::vector<T> result;
        result.reserve(count);
        for (size_t i = size_ - count; i < size_; ++i) {
            result.push_back(storage_[index(i)]);
        }
        return result;
    }

    std::vector<T> getAll() const {
        return getEnding(size_);
    }

    void clear() {
        start_ = 0;
        size_ = 0;
    }

    size_t size() const { return size_; }
    size_t capacity() const { return storage_.size(); }
    bool empty() const { return size_ == 0; }

private:
    size_t index(size_t logical) const {
        return (start_ + logical) % storage_.size();
    }

    std::vector<T> storage_;
    size_t start_;
    size_t size_;
};

} // namespace utils
} // namespace hotstring

#endif // HOTSTRING_CIRCULAR_BUFFER_H
