#pragma once
#include <cassert>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

// Binary heap over a dense std::vector<T>.
// order(a, b) == true means "a ranks above b": std::greater<T> (the default)
// gives a max-heap, std::less<T> a min-heap. order must be a strict weak
// ordering; otherwise the layout is unspecified (but nothing crashes).
template <typename T, class Compare = std::greater<T>>
class BinaryHeap
{
public:
    using value_type = T;
    using size_type = std::size_t;
    using compare_type = Compare;

    explicit BinaryHeap(Compare order = Compare{}) : nodes_(), order_(std::move(order)) {}

    // Takes the elements as given and heapifies bottom-up, O(n).
    explicit BinaryHeap(std::vector<T> elements, Compare order = Compare{})
        : nodes_(std::move(elements)), order_(std::move(order))
    {
        heapify_();
    }

    bool empty() const { return nodes_.empty(); }
    size_type size() const { return nodes_.size(); }

    // Backing layout, index 0 is the root.
    const std::vector<T> &nodes() const { return nodes_; }

    static constexpr size_type parent_index(size_type i) { return (i - 1) / 2; }
    static constexpr size_type left_child_index(size_type i) { return 2 * i + 1; }
    static constexpr size_type right_child_index(size_type i) { return 2 * i + 2; }

    std::optional<T> peek() const
    {
        if (nodes_.empty())
            return std::nullopt;
        return nodes_.front();
    }

    void insert(const T &v)
    {
        nodes_.push_back(v);
        sift_up_(nodes_.size() - 1);
    }
    void insert(T &&v)
    {
        nodes_.push_back(std::move(v));
        sift_up_(nodes_.size() - 1);
    }

    // One insert per element; heapify is only used by the vector constructor.
    template <class InputIt>
    void insert(InputIt first, InputIt last)
    {
        for (; first != last; ++first)
            insert(*first);
    }
    void insert(std::initializer_list<T> values) { insert(values.begin(), values.end()); }

    std::optional<T> remove_root()
    {
        if (nodes_.empty())
            return std::nullopt;
        if (nodes_.size() == 1)
            return pop_back_();

        T value = std::move(nodes_.front());
        nodes_.front() = pop_back_();
        sift_down_(0, nodes_.size());
        return value;
    }

    // Removes the element at index, nullopt if index is out of range.
    std::optional<T> remove_at(size_type index)
    {
        if (index >= nodes_.size())
            return std::nullopt;

        size_type last = nodes_.size() - 1;
        if (index != last)
        {
            std::swap(nodes_[index], nodes_[last]);
            sift_down_(index, last);
            sift_up_(index);
        }
        return pop_back_();
    }

    // Same result as remove_at(index) followed by insert(value).
    bool replace(size_type index, T value)
    {
        if (index >= nodes_.size())
            return false;
        remove_at(index);
        insert(std::move(value));
        return true;
    }

    // Linear scan, needs T == T.
    std::optional<size_type> index_of(const T &node) const
    {
        for (size_type i = 0; i < nodes_.size(); ++i)
            if (nodes_[i] == node)
                return i;
        return std::nullopt;
    }

    std::optional<T> remove(const T &value)
    {
        auto i = index_of(value);
        if (!i)
            return std::nullopt;
        return remove_at(*i);
    }

private:
    void heapify_()
    {
        for (size_type i = nodes_.size() / 2; i-- > 0;)
            sift_down_(i, nodes_.size());
    }

    T pop_back_()
    {
        assert(!nodes_.empty());
        T v = std::move(nodes_.back());
        nodes_.pop_back();
        return v;
    }

    void sift_up_(size_type i)
    {
        assert(i < nodes_.size());
        T held = std::move(nodes_[i]);
        while (i > 0)
        {
            size_type p = parent_index(i);
            if (!order_(held, nodes_[p]))
                break;
            nodes_[i] = std::move(nodes_[p]);
            i = p;
        }
        nodes_[i] = std::move(held);
    }

    // end is exclusive; slots at and past end are ignored.
    void sift_down_(size_type i, size_type end)
    {
        assert(end <= nodes_.size());
        for (;;)
        {
            size_type l = left_child_index(i), r = right_child_index(i), first = i;
            if (l < end && order_(nodes_[l], nodes_[first]))
                first = l;
            if (r < end && order_(nodes_[r], nodes_[first]))
                first = r;
            if (first == i)
                break;
            std::swap(nodes_[i], nodes_[first]);
            i = first;
        }
    }

    std::vector<T> nodes_;
    Compare order_;
};
