#pragma once

#include <cstdint>
#include <iterator>
#include <limits>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include "plaid/common/types.hpp"
#include "plaid/exceptions.hpp"

namespace plaid::core {

/**
 * @brief Free-list arena of singly linked nodes.
 *
 * Nodes are addressed by index, so growing the arena never invalidates links
 * held by live sequences. Released nodes are handed out again before the
 * arena grows. One pool is meant to back all the sequences built by a single
 * interleaving engine.
 *
 * @tparam Doc Document identifier type.
 */
template <DocumentId Doc> class NodePool {
public:
    using NodeIndex                     = std::uint32_t;
    static constexpr NodeIndex kNullIdx = std::numeric_limits<NodeIndex>::max();

    struct Node {
        Doc value{};
        NodeIndex next{kNullIdx};
    };

    NodePool() = default;
    explicit NodePool(SizeType capacity) {
        m_nodes.reserve(capacity);
        m_free.reserve(capacity);
    }

    NodePool(const NodePool&)            = delete;
    NodePool& operator=(const NodePool&) = delete;
    NodePool(NodePool&&)                 = delete;
    NodePool& operator=(NodePool&&)      = delete;
    ~NodePool()                          = default;

    [[nodiscard]] NodeIndex acquire(const Doc& value) {
        if (!m_free.empty()) {
            const auto idx = m_free.back();
            m_free.pop_back();
            m_nodes[idx].value = value;
            m_nodes[idx].next  = kNullIdx;
            return idx;
        }
        error_check::check(m_nodes.size() < kNullIdx,
                           "NodePool: arena index space exhausted");
        const auto idx = static_cast<NodeIndex>(m_nodes.size());
        m_nodes.push_back(Node{.value = value, .next = kNullIdx});
        // Every node can be on the free list at once, so release() never
        // has to grow it.
        m_free.reserve(m_nodes.size());
        return idx;
    }

    void release(NodeIndex idx) noexcept {
        m_nodes[idx].value = Doc{};
        m_nodes[idx].next  = kNullIdx;
        m_free.push_back(idx);
    }

    [[nodiscard]] Node& node(NodeIndex idx) noexcept { return m_nodes[idx]; }
    [[nodiscard]] const Node& node(NodeIndex idx) const noexcept {
        return m_nodes[idx];
    }

    // Total nodes ever allocated by the arena
    [[nodiscard]] SizeType capacity() const noexcept { return m_nodes.size(); }
    // Nodes currently on the free list
    [[nodiscard]] SizeType available() const noexcept { return m_free.size(); }
    [[nodiscard]] SizeType in_use() const noexcept {
        return m_nodes.size() - m_free.size();
    }

private:
    std::vector<Node> m_nodes;
    std::vector<NodeIndex> m_free;
};

/**
 * @brief Ordered collection with O(1) append and O(1) removal by identity.
 *
 * Each surviving document maps to the index of its predecessor node, starting
 * from a head sentinel. Removing a document relinks the predecessor to the
 * document's successor and returns the node to the pool. Positional access
 * is O(n); the only supported access patterns are full forward scans and
 * identity-based removal.
 *
 * Duplicate documents are ignored on append, the first occurrence wins.
 */
template <DocumentId Doc> class RemovableSequence {
public:
    using Pool      = NodePool<Doc>;
    using NodeIndex = typename Pool::NodeIndex;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Doc;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Doc*;
        using reference         = const Doc&;

        const_iterator() = default;
        const_iterator(const Pool* pool, NodeIndex idx)
            : m_pool(pool),
              m_idx(idx) {}

        reference operator*() const { return m_pool->node(m_idx).value; }
        pointer operator->() const { return &m_pool->node(m_idx).value; }

        const_iterator& operator++() {
            m_idx = m_pool->node(m_idx).next;
            return *this;
        }
        const_iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const const_iterator& other) const {
            return m_idx == other.m_idx;
        }

    private:
        const Pool* m_pool{nullptr};
        NodeIndex m_idx{Pool::kNullIdx};
    };

    explicit RemovableSequence(Pool& pool)
        : m_pool(&pool),
          m_head(pool.acquire(Doc{})),
          m_tail(m_head) {}

    RemovableSequence(Pool& pool, std::span<const Doc> docs)
        : RemovableSequence(pool) {
        m_predecessor.reserve(docs.size());
        for (const auto& doc : docs) {
            append(doc);
        }
    }

    ~RemovableSequence() {
        if (m_pool == nullptr) {
            return;
        }
        drain();
        m_pool->release(m_head);
    }

    RemovableSequence(const RemovableSequence&)            = delete;
    RemovableSequence& operator=(const RemovableSequence&) = delete;
    RemovableSequence& operator=(RemovableSequence&&)      = delete;

    RemovableSequence(RemovableSequence&& other) noexcept
        : m_pool(other.m_pool),
          m_head(other.m_head),
          m_tail(other.m_tail),
          m_predecessor(std::move(other.m_predecessor)) {
        other.m_pool = nullptr;
    }

    // Returns false if the document is already present.
    bool append(const Doc& doc) {
        if (m_predecessor.contains(doc)) {
            return false;
        }
        const auto idx = m_pool->acquire(doc);
        m_predecessor.emplace(doc, m_tail);
        m_pool->node(m_tail).next = idx;
        m_tail                    = idx;
        return true;
    }

    // Returns false if the document is not (or no longer) present.
    bool remove(const Doc& doc) {
        const auto it = m_predecessor.find(doc);
        if (it == m_predecessor.end()) {
            return false;
        }
        const auto prev = it->second;
        m_predecessor.erase(it);

        const auto cur            = m_pool->node(prev).next;
        const auto next           = m_pool->node(cur).next;
        m_pool->node(prev).next = next;
        if (next == Pool::kNullIdx) {
            m_tail = prev;
        } else {
            m_predecessor.find(m_pool->node(next).value)->second = prev;
        }
        m_pool->release(cur);
        return true;
    }

    // Release every surviving node back to the pool; the sequence stays
    // usable and empty.
    void drain() noexcept {
        auto idx = m_pool->node(m_head).next;
        while (idx != Pool::kNullIdx) {
            const auto next = m_pool->node(idx).next;
            m_pool->release(idx);
            idx = next;
        }
        m_pool->node(m_head).next = Pool::kNullIdx;
        m_tail                    = m_head;
        m_predecessor.clear();
    }

    [[nodiscard]] bool contains(const Doc& doc) const {
        return m_predecessor.contains(doc);
    }
    [[nodiscard]] SizeType length() const noexcept {
        return m_predecessor.size();
    }
    [[nodiscard]] bool empty() const noexcept { return m_predecessor.empty(); }

    [[nodiscard]] const_iterator begin() const {
        return {m_pool, m_pool->node(m_head).next};
    }
    [[nodiscard]] const_iterator end() const {
        return {m_pool, Pool::kNullIdx};
    }

private:
    Pool* m_pool;
    NodeIndex m_head;
    NodeIndex m_tail;
    std::unordered_map<Doc, NodeIndex> m_predecessor;
};

} // namespace plaid::core
