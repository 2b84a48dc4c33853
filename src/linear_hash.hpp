#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "string_hash.hpp"

struct LinearHashOptions
{
    std::size_t initial_buckets = 32; // power of two, >= 2
    bool split_enabled = true;        // false: fixed bucket count
};

// String-keyed map grown by linear hashing: one bucket is split per
// overflow, in split-pointer order, so capacity grows by one bucket at a
// time instead of doubling.
//
// Invariants (checked by check_invariants()):
//   2^(bits_-1) < bucket_count() <= 2^bits_
//   split_ < 2^(bits_-1)
//   every entry lives in the bucket its key addresses
//
// Not thread-safe; callers serialize access.
template <typename V>
class LinearHashTable
{
public:
    LinearHashTable() : LinearHashTable(LinearHashOptions{}) {}

    explicit LinearHashTable(const LinearHashOptions &opts)
        : bits_(0), split_(0), size_(0), split_enabled_(opts.split_enabled)
    {
        std::size_t n = opts.initial_buckets;
        if (n < 2 || (n & (n - 1)) != 0)
            throw std::invalid_argument("LinearHashTable: initial_buckets must be a power of two >= 2");
        while ((std::size_t{1} << bits_) < n)
            ++bits_;
        buckets_.resize(n);
    }

    // Bucket count, not entry count.
    std::size_t len() const noexcept { return buckets_.size(); }
    std::size_t bucket_count() const noexcept { return buckets_.size(); }
    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    std::size_t bucket_size(std::size_t i) const
    {
        if (i >= buckets_.size())
            throw std::out_of_range("LinearHashTable::bucket_size");
        return buckets_[i].size();
    }

    const V *lookup(std::string_view key) const
    {
        const Bucket &b = buckets_[address_(key)];
        for (const Entry &e : b)
        {
            if (e.key == key)
                return &e.value;
        }
        return nullptr;
    }

    V *lookup(std::string_view key)
    {
        return const_cast<V *>(static_cast<const LinearHashTable &>(*this).lookup(key));
    }

    bool contains(std::string_view key) const { return lookup(key) != nullptr; }

    // Returns true if key was new, false if an existing value was overwritten.
    bool upsert(std::string_view key, V value)
    {
        Bucket &b = buckets_[address_(key)];
        for (Entry &e : b)
        {
            if (e.key == key)
            {
                e.value = std::move(value);
                return false;
            }
        }
        append_(b, std::string(key), std::move(value));
        ++size_;
        return true;
    }

    std::optional<V> remove(std::string_view key)
    {
        Bucket &b = buckets_[address_(key)];
        for (auto it = b.begin(); it != b.end(); ++it)
        {
            if (it->key == key)
            {
                std::optional<V> out(std::move(it->value));
                b.erase(it);
                --size_;
                return out;
            }
        }
        return std::nullopt;
    }

    // Drops every entry; the bucket count is kept.
    void clear() noexcept
    {
        for (Bucket &b : buckets_)
            b.clear();
        size_ = 0;
    }

    template <typename F>
    void for_each(F &&f) const
    {
        for (const Bucket &b : buckets_)
            for (const Entry &e : b)
                f(e.key, e.value);
    }

    bool check_invariants() const
    {
        const std::size_t n = buckets_.size();
        const std::size_t half = std::size_t{1} << (bits_ - 1);
        if (!(half < n && n <= (half << 1)))
            return false;
        if (split_ >= half)
            return false;

        std::unordered_set<std::string_view> seen;
        std::size_t count = 0;
        for (std::size_t i = 0; i < n; ++i)
        {
            for (const Entry &e : buckets_[i])
            {
                if (address_(e.key) != i)
                    return false;
                if (!seen.insert(e.key).second)
                    return false;
                ++count;
            }
        }
        return count == size_;
    }

private:
    struct Entry
    {
        std::string key;
        V value;
    };
    using Bucket = std::vector<Entry>;

    std::size_t address_(std::string_view key) const noexcept
    {
        return fold_address(string_hash(key), bits_, buckets_.size());
    }

    // Shared by upsert and split redistribution. `b` must not be used after
    // this returns: a split may reallocate buckets_.
    void append_(Bucket &b, std::string key, V value)
    {
        b.push_back(Entry{std::move(key), std::move(value)});
        if (split_enabled_ && b.size() > (std::size_t{1} << bits_))
            split_bucket_();
    }

    void split_bucket_()
    {
        // Always the bucket under the split pointer, not the one that
        // overflowed.
        Bucket moved = std::move(buckets_[split_]);
        buckets_[split_].clear();
        buckets_.emplace_back();

        if (buckets_.size() > (std::size_t{1} << bits_))
            ++bits_;
        if (++split_ == (std::size_t{1} << (bits_ - 1)))
            split_ = 0; // round complete, bucket_count() == 2^bits_

        // Keys were distinct before the split, so no duplicate check.
        for (Entry &e : moved)
        {
            std::size_t i = address_(e.key);
            append_(buckets_[i], std::move(e.key), std::move(e.value));
        }
    }

    std::vector<Bucket> buckets_;
    unsigned bits_;
    std::size_t split_;
    std::size_t size_;
    bool split_enabled_;
};
