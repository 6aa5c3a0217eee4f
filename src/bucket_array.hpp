#pragma once
#include <cassert>
#include <cstddef>
#include <utility>

// Fixed-length array of chain heads. The length is chosen at construction
// and never changes; growing means building a new array with grown() and
// replacing the old one wholesale. Slots are value-initialized.
// Move-only: the slots hold owning pointers that only the table may copy.
template <typename T>
class BucketArray
{
public:
    BucketArray() noexcept : data_(nullptr), size_(0) {}

    explicit BucketArray(std::size_t n) : data_(n ? new T[n]() : nullptr), size_(n) {}

    ~BucketArray() { delete[] data_; }

    BucketArray(const BucketArray &) = delete;
    BucketArray &operator=(const BucketArray &) = delete;

    BucketArray(BucketArray &&o) noexcept : data_(o.data_), size_(o.size_)
    {
        o.data_ = nullptr;
        o.size_ = 0;
    }

    BucketArray &operator=(BucketArray &&o) noexcept
    {
        BucketArray tmp(std::move(o));
        swap(tmp);
        return *this;
    }

    void swap(BucketArray &o) noexcept
    {
        std::swap(data_, o.data_);
        std::swap(size_, o.size_);
    }

    // New array of length n whose first size() slots copy this one's; the
    // rest are empty.
    BucketArray grown(std::size_t n) const
    {
        assert(n >= size_);
        BucketArray out(n);
        for (std::size_t i = 0; i < size_; ++i)
            out.data_[i] = data_[i];
        return out;
    }

    void fill(const T &v)
    {
        for (std::size_t i = 0; i < size_; ++i)
            data_[i] = v;
    }

    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    T *data() noexcept { return data_; }
    const T *data() const noexcept { return data_; }

    T &operator[](std::size_t i)
    {
        assert(i < size_);
        return data_[i];
    }
    const T &operator[](std::size_t i) const
    {
        assert(i < size_);
        return data_[i];
    }

private:
    T *data_;
    std::size_t size_;
};
