/// Otree is a single-header C++17 library providing a persistent (immutable) unbalanced binary search tree.
/// Every insertion produces a new tree value; the old one remains valid and unchanged. Only the nodes on the path
/// from the root to the insertion point are copied, the rest is shared between the old and the new tree.
/// To integrate it into your project, simply copy this file into your source tree. Read the API docs below.
///
/// Copyright (c) 2026 The otree contributors
///
/// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated
/// documentation files (the "Software"), to deal in the Software without restriction, including without limitation
/// the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software,
/// and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
///
/// The above copyright notice and this permission notice shall be included in all copies or substantial portions of
/// the Software.
///
/// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE
/// WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS
/// OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
/// OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

/// The assertion checks are only used to validate internal invariants; they are never used to report usage errors.
/// Define OTREE_NO_ASSERT to a true value to remove them, or define OTREE_ASSERT to route them elsewhere.
#ifndef OTREE_ASSERT
#    if defined(OTREE_NO_ASSERT) && OTREE_NO_ASSERT
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage) function-like macro
#        define OTREE_ASSERT(x) (void) 0
#    else
#        include <cassert>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage) function-like macro
#        define OTREE_ASSERT(x) assert(x)
#    endif
#endif

namespace otree
{
/// The result of comparing two values. Unordered is only reported by partial orders.
enum class Ordering : std::int8_t
{
    Less       = -1,
    Equivalent = 0,
    Greater    = +1,
    Unordered  = 2,
};

/// The default ordering policy relies on operator< only.
/// Floating-point values additionally report Unordered if either operand is NaN.
template <typename T>
struct DefaultOrder
{
    auto operator()(const T& a, const T& b) const -> Ordering
    {
        if (a < b)
        {
            return Ordering::Less;
        }
        if (b < a)
        {
            return Ordering::Greater;
        }
        if constexpr (std::is_floating_point_v<T>)
        {
            if (!(a == b))  // NOLINT(clang-diagnostic-float-equal)
            {
                return Ordering::Unordered;
            }
        }
        return Ordering::Equivalent;
    }
};

/// Thrown when the ordering policy cannot relate the item to a value stored in the tree.
/// The tree that the operation was invoked on is not affected.
class IncomparableValues : public std::domain_error
{
public:
    IncomparableValues() : std::domain_error("otree: the values cannot be ordered relative to each other") {}
};

/// A persistent binary search tree. Per standard convention, values that compare smaLLer are put on the Left;
/// those that are laRgeR or equivalent are on the Right, so duplicates are preserved in insertion order.
/// There is no balancing: the shape of the tree is a direct function of the insertion order, hence the worst-case
/// complexity of all operations is O(n), where n is the number of values; random insertion order gives O(log n).
///
/// Tree values are cheap to copy because the nodes are shared. The nodes are never modified after construction,
/// so the same tree value can be read from multiple threads concurrently without synchronization.
/// None of the operations recurse, so degenerate trees of arbitrary depth are fine.
template <typename T, typename Order = DefaultOrder<T>>
class Tree final
{
public:
    using ValueType = T;
    using OrderType = Order;

    Tree() = default;
    explicit Tree(Order order) : order_(std::move(order)) {}

    /// The elements are inserted in the order of appearance.
    Tree(const std::initializer_list<T> items, Order order = Order{}) : order_(std::move(order))
    {
        for (const T& x : items)
        {
            Tree next = insert(x);
            root_     = std::move(next.root_);
            size_     = next.size_;
        }
    }

    Tree(const Tree&)                    = default;
    auto operator=(const Tree&) -> Tree& = default;

    Tree(Tree&& other) noexcept(std::is_nothrow_move_constructible_v<Order>) :
        root_(std::move(other.root_)), size_(std::exchange(other.size_, 0)), order_(std::move(other.order_))
    {}
    auto operator=(Tree&& other) noexcept(std::is_nothrow_move_assignable_v<Order>) -> Tree&
    {
        if (this != &other)
        {
            root_  = std::move(other.root_);
            size_  = std::exchange(other.size_, 0);
            order_ = std::move(other.order_);
        }
        return *this;
    }

    ~Tree() = default;

    /// Returns a new tree that contains all values of this one plus the item; this tree is not modified.
    /// Only the nodes on the search path are copied, everything else is shared with this tree.
    /// Throws IncomparableValues if the ordering policy reports Unordered along the search path;
    /// in that case nothing is constructed. May also throw whatever the allocator or the copy constructor of T throws.
    [[nodiscard]] auto insert(T item) const -> Tree
    {
        // The search path is collected first so that the failure to compare the item is reported before anything
        // is allocated. Each entry holds the node and the direction taken from it.
        std::vector<std::pair<const Node*, bool>> path;
        const Node*                               n = root_.get();
        while (n != nullptr)
        {
            const Ordering cmp = order_(item, n->value);
            if (cmp == Ordering::Unordered)
            {
                throw IncomparableValues();
            }
            const bool r = cmp != Ordering::Less;  // Equivalent items go to the right.
            path.emplace_back(n, r);
            n = n->lr[r].get();
        }
        // Rebuild the path bottom-up, starting from the new leaf.
        NodePtr out = std::make_shared<Node>(std::move(item), nullptr, nullptr);
        for (auto it = path.rbegin(); it != path.rend(); ++it)
        {
            const Node& p = *it->first;
            NodePtr     lr[2]{p.lr[0], p.lr[1]};
            lr[it->second] = std::move(out);
            out            = std::make_shared<Node>(p.value, std::move(lr[0]), std::move(lr[1]));
        }
        return Tree(std::move(out), size_ + 1U, order_);
    }

    /// Invokes the visitor on every value in ascending order, or descending if reverse is set.
    /// If the visitor returns a value that is contextually convertible to bool, the traversal is stopped
    /// at the first truthy result, which is then returned; otherwise a value-initialized result is returned.
    /// If the visitor returns void, all values are visited.
    template <typename Vis>
    auto traverse(const Vis& visitor, const bool reverse = false) const
    {
        using R = std::invoke_result_t<const Vis&, const T&>;
        // The explicit stack holds the nodes whose left subtree (right if reverse) is being visited.
        std::vector<const Node*> stack;
        const Node*              n = root_.get();
        while ((n != nullptr) || !stack.empty())
        {
            while (n != nullptr)
            {
                stack.push_back(n);
                n = n->lr[reverse].get();
            }
            n = stack.back();
            stack.pop_back();
            if constexpr (std::is_void_v<R>)
            {
                visitor(n->value);
            }
            else
            {
                if (auto t = visitor(n->value))  // NOLINT(*-qualified-auto)
                {
                    return t;
                }
            }
            n = n->lr[!reverse].get();
        }
        if constexpr (!std::is_void_v<R>)
        {
            return R{};
        }
    }

    /// Materializes the values in ascending order. Invoking it again on the same tree yields the same sequence.
    [[nodiscard]] auto traverse() const -> std::vector<T>
    {
        std::vector<T> out;
        out.reserve(size_);
        traverse([&out](const T& x) { out.push_back(x); });
        OTREE_ASSERT(out.size() == size_);
        return out;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return root_ == nullptr; }

    /// Duplicates are counted. This is a constant-time query.
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

    /// The number of nodes on the longest path from the root to a leaf; zero if the tree is empty.
    /// Equals the number of values if they were inserted in sorted order.
    [[nodiscard]] auto height() const -> std::size_t
    {
        std::size_t                                      out = 0;
        std::vector<std::pair<const Node*, std::size_t>> stack;
        if (root_ != nullptr)
        {
            stack.emplace_back(root_.get(), 1U);
        }
        while (!stack.empty())
        {
            const auto [n, depth] = stack.back();
            stack.pop_back();
            out = (depth > out) ? depth : out;
            for (const NodePtr& ch : n->lr)
            {
                if (ch != nullptr)
                {
                    stack.emplace_back(ch.get(), depth + 1U);
                }
            }
        }
        return out;
    }

    /// Return the min-/max-valued element stored in the tree. Returns nullptr iff the tree is empty.
    /// Of equivalent minima, the earliest inserted one is returned; of equivalent maxima, the latest inserted one.
    [[nodiscard]] auto min() const noexcept -> const T* { return findExtremum(false); }
    [[nodiscard]] auto max() const noexcept -> const T* { return findExtremum(true); }

    /// Returns the stored value equivalent to the key that is closest to the root (among duplicates,
    /// the earliest inserted one), or nullptr if there is none.
    /// Throws IncomparableValues if the ordering policy cannot relate the key to a value on the search path.
    [[nodiscard]] auto find(const T& key) const -> const T*
    {
        const Node* n = root_.get();
        while (n != nullptr)
        {
            const Ordering cmp = compare(key, n->value);
            if (cmp == Ordering::Equivalent)
            {
                return &n->value;
            }
            n = n->lr[cmp == Ordering::Greater].get();
        }
        return nullptr;
    }

    /// The number of stored values equivalent to the key. Since equivalent values are always placed to the right,
    /// all of them lie on the same search path, so this is not slower than find().
    [[nodiscard]] auto count(const T& key) const -> std::size_t
    {
        std::size_t out = 0;
        const Node* n   = root_.get();
        while (n != nullptr)
        {
            const Ordering cmp = compare(key, n->value);
            if (cmp == Ordering::Equivalent)
            {
                out++;
            }
            n = n->lr[cmp != Ordering::Less].get();
        }
        return out;
    }

    [[nodiscard]] auto contains(const T& key) const -> bool { return find(key) != nullptr; }

    [[nodiscard]] auto getOrder() const -> const Order& { return order_; }

    /// True if both trees reference the same root node, meaning that they are the same tree value.
    /// This does not compare the contents; trees with equal contents built independently are not identical.
    [[nodiscard]] auto isIdenticalTo(const Tree& other) const noexcept -> bool { return root_ == other.root_; }

private:
    struct Node;
    using NodePtr = std::shared_ptr<Node>;

    /// The nodes are treated as immutable once published; the only exception is the teardown in the destructor,
    /// which restructures only those nodes that are exclusively owned by the node being destroyed.
    struct Node final
    {
        Node(T v, NodePtr left, NodePtr right) : value(std::move(v)), lr{std::move(left), std::move(right)} {}

        Node(const Node&)                    = delete;
        Node(Node&&)                         = delete;
        auto operator=(const Node&) -> Node& = delete;
        auto operator=(Node&&) -> Node&      = delete;

        ~Node()
        {
            release(std::move(lr[0]));
            release(std::move(lr[1]));
        }

        const T value;
        NodePtr lr[2];  ///< Left child (lesser), right child (greater or equivalent).
    };

    Tree(NodePtr root, const std::size_t size, Order order) :
        root_(std::move(root)), size_(size), order_(std::move(order))
    {}

    auto compare(const T& key, const T& value) const -> Ordering
    {
        const Ordering cmp = order_(key, value);
        if (cmp == Ordering::Unordered)
        {
            throw IncomparableValues();
        }
        return cmp;
    }

    auto findExtremum(const bool maximum) const noexcept -> const T*
    {
        const Node* result = nullptr;
        const Node* c      = root_.get();
        while (c != nullptr)
        {
            result = c;
            c      = c->lr[maximum].get();
        }
        return (result != nullptr) ? &result->value : nullptr;
    }

    /// Drops the reference to the subtree without recursion. Exclusively owned nodes are rotated right until they
    /// have no left child, after which they are destroyed one by one while descending to the right.
    /// A subtree that is still referenced from elsewhere is merely unreferenced.
    static void release(NodePtr&& subtree) noexcept
    {
        NodePtr n = std::move(subtree);
        while ((n != nullptr) && (n.use_count() == 1))
        {
            // use_count() is a relaxed load; the fence orders the modifications below after the reads made
            // by the threads that have released their references to this node.
            std::atomic_thread_fence(std::memory_order_acquire);
            if (n->lr[0] == nullptr)
            {
                NodePtr next = std::move(n->lr[1]);
                n            = std::move(next);  // The old node has no children at this point.
            }
            else if (n->lr[0].use_count() != 1)
            {
                n->lr[0].reset();  // Shared with another tree, which will take care of it.
            }
            else
            {
                std::atomic_thread_fence(std::memory_order_acquire);
                NodePtr l = std::move(n->lr[0]);
                n->lr[0]  = std::move(l->lr[1]);
                l->lr[1]  = std::move(n);
                n         = std::move(l);
            }
        }
    }

    NodePtr     root_;
    std::size_t size_ = 0;
    Order       order_{};
};

/// The empty tree; same as a default-constructed one.
template <typename T, typename Order = DefaultOrder<T>>
[[nodiscard]] auto empty(Order order = Order{}) -> Tree<T, Order>
{
    return Tree<T, Order>(std::move(order));
}

/// Returns a new tree containing the values of the input tree plus the item; the input tree is not modified.
/// Throws IncomparableValues if the item cannot be ordered against the values of the tree.
template <typename T, typename Order>
[[nodiscard]] auto insert(typename Tree<T, Order>::ValueType item, const Tree<T, Order>& tree) -> Tree<T, Order>
{
    return tree.insert(std::move(item));
}

/// The values of the tree in ascending order.
template <typename T, typename Order>
[[nodiscard]] auto traverse(const Tree<T, Order>& tree) -> std::vector<T>
{
    return tree.traverse();
}

}  // namespace otree
