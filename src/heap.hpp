#pragma once
#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

enum class HeapMode
{
    Max,
    Min
};

// True when `a < b` is well-formed for two const T&.
template <typename T, typename = void>
struct is_less_comparable : std::false_type
{
};
template <typename T>
struct is_less_comparable<T, std::void_t<decltype(std::declval<const T &>() < std::declval<const T &>())>>
    : std::true_type
{
};

// Thrown by peek/extract/replace_root when there is no root.
class EmptyHeapError : public std::out_of_range
{
public:
    explicit EmptyHeapError(const char *op)
        : std::out_of_range(std::string(op) + ": heap is empty") {}
};

// Binary heap stored as a complete binary tree in one contiguous array:
// position i has children 2i+1, 2i+2 and parent (i-1)/2.
// Under HeapMode::Max the root is the greatest element by Compare,
// under HeapMode::Min the least. The mode is fixed at construction.
template <typename T, typename Compare = std::less<T>>
class BinaryHeap
{
    static_assert(std::is_invocable_r_v<bool, const Compare &, const T &, const T &>,
                  "BinaryHeap requires a comparator callable on (const T&, const T&)");
    // std::less<T> accepts any T in its signature; the operator< it calls may not exist.
    static_assert(!std::is_same_v<Compare, std::less<T>> || is_less_comparable<T>::value,
                  "BinaryHeap<T> with the default comparator requires operator< on T");

public:
    using value_type = T;
    using size_type = std::size_t;
    using const_iterator = typename std::vector<T>::const_iterator;

    explicit BinaryHeap(HeapMode mode = HeapMode::Max, Compare comp = Compare{})
        : a_(), mode_(mode), comp_(std::move(comp)) {}

    // Bottom-up heapify: O(n), unlike n inserts which cost O(n log n).
    static BinaryHeap build(std::vector<T> values, HeapMode mode = HeapMode::Max,
                            Compare comp = Compare{})
    {
        BinaryHeap h(mode, std::move(comp));
        h.a_ = std::move(values);
        h.heapify_();
        return h;
    }

    template <class InputIt>
    static BinaryHeap build(InputIt first, InputIt last, HeapMode mode = HeapMode::Max,
                            Compare comp = Compare{})
    {
        return build(std::vector<T>(first, last), mode, std::move(comp));
    }

    void insert(const T &v)
    {
        a_.push_back(v);
        sift_up_(a_.size() - 1);
    }
    void insert(T &&v)
    {
        a_.push_back(std::move(v));
        sift_up_(a_.size() - 1);
    }

    template <class... Args>
    void emplace(Args &&...args)
    {
        a_.emplace_back(std::forward<Args>(args)...);
        sift_up_(a_.size() - 1);
    }

    // Appends a range to whatever is already stored and re-heapifies the lot.
    template <class InputIt>
    void extend(InputIt first, InputIt last)
    {
        // the range may alias a_ (e.g. this heap's own begin()/end())
        std::vector<T> more(first, last);
        a_.insert(a_.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
        heapify_();
    }

    const T &peek() const
    {
        if (a_.empty())
            throw EmptyHeapError("BinaryHeap::peek");
        return a_[0];
    }

    T extract()
    {
        if (a_.empty())
            throw EmptyHeapError("BinaryHeap::extract");
        T root = std::move(a_[0]);
        if (a_.size() > 1)
            a_[0] = std::move(a_.back());
        a_.pop_back();
        if (!a_.empty())
            sift_down_(0);
        return root;
    }

    // Swaps in a new root and returns the old one. An empty heap throws
    // rather than degrading to insert.
    T replace_root(T v)
    {
        if (a_.empty())
            throw EmptyHeapError("BinaryHeap::replace_root");
        T root = std::move(a_[0]);
        a_[0] = std::move(v);
        sift_down_(0);
        return root;
    }

    // Overwrites the first element equal to old_value. Returns false, and
    // leaves the heap untouched, when no element matches.
    bool update(const T &old_value, T new_value)
    {
        auto it = std::find(a_.begin(), a_.end(), old_value);
        if (it == a_.end())
            return false;
        size_type i = static_cast<size_type>(it - a_.begin());
        a_[i] = std::move(new_value);
        restore_(i);
        return true;
    }

    bool remove(const T &value)
    {
        auto it = std::find(a_.begin(), a_.end(), value);
        if (it == a_.end())
            return false;
        size_type i = static_cast<size_type>(it - a_.begin());
        if (i + 1 != a_.size())
            a_[i] = std::move(a_.back());
        a_.pop_back();
        if (i < a_.size())
            restore_(i);
        return true;
    }

    bool contains(const T &value) const
    {
        return std::find(a_.begin(), a_.end(), value) != a_.end();
    }

    std::size_t size() const { return a_.size(); }
    bool empty() const { return a_.empty(); }
    void clear() { a_.clear(); }
    void reserve(std::size_t n) { a_.reserve(n); }

    HeapMode mode() const { return mode_; }
    const Compare &comparator() const { return comp_; }

    // Copy of the backing array in heap layout (not sorted).
    std::vector<T> to_sequence() const { return a_; }

    const_iterator begin() const { return a_.begin(); }
    const_iterator end() const { return a_.end(); }

    // Navigation by position. nullptr means "no such node"; a position past
    // the end throws.
    const T *parent(size_type i) const
    {
        check_index_(i, "BinaryHeap::parent");
        return i == 0 ? nullptr : &a_[(i - 1) / 2];
    }
    const T *left_child(size_type i) const
    {
        check_index_(i, "BinaryHeap::left_child");
        return node_or_null_(2 * i + 1);
    }
    const T *right_child(size_type i) const
    {
        check_index_(i, "BinaryHeap::right_child");
        return node_or_null_(2 * i + 2);
    }
    std::pair<const T *, const T *> children(size_type i) const
    {
        check_index_(i, "BinaryHeap::children");
        return {node_or_null_(2 * i + 1), node_or_null_(2 * i + 2)};
    }

    bool is_heap() const
    {
        for (size_type i = 1; i < a_.size(); ++i)
        {
            if (better_(a_[i], a_[(i - 1) / 2]))
                return false;
        }
        return true;
    }

private:
    bool better_(const T &x, const T &y) const
    {
        return mode_ == HeapMode::Max ? comp_(y, x) : comp_(x, y);
    }

    void check_index_(size_type i, const char *op) const
    {
        if (i >= a_.size())
            throw std::out_of_range(std::string(op) + ": index out of bounds");
    }

    const T *node_or_null_(size_type i) const
    {
        return i < a_.size() ? &a_[i] : nullptr;
    }

    // Exactly one direction can apply after a single slot changes.
    void restore_(size_type i)
    {
        if (i > 0 && better_(a_[i], a_[(i - 1) / 2]))
            sift_up_(i);
        else
            sift_down_(i);
    }

    void sift_up_(size_type i)
    {
        using std::swap;
        while (i > 0)
        {
            size_type p = (i - 1) / 2;
            if (!better_(a_[i], a_[p]))
                break;
            swap(a_[p], a_[i]);
            i = p;
        }
    }

    void sift_down_(size_type i)
    {
        using std::swap;
        size_type n = a_.size();
        for (;;)
        {
            size_type l = 2 * i + 1, r = 2 * i + 2, m = i;
            if (l < n && better_(a_[l], a_[m]))
                m = l;
            if (r < n && better_(a_[r], a_[m]))
                m = r;
            if (m == i)
                break;
            swap(a_[i], a_[m]);
            i = m;
        }
    }

    void heapify_()
    {
        for (size_type i = a_.size() / 2; i > 0; --i)
            sift_down_(i - 1);
    }

    std::vector<T> a_;
    HeapMode mode_;
    Compare comp_;
};
