#pragma once

#include <vector>

#include "plaid/common/types.hpp"
#include "plaid/exceptions.hpp"

namespace plaid::interleaving {

/**
 * @brief Interleaved ranking shown to the user.
 *
 * Holds the chosen documents in display order together with, for every
 * position, the index of the ranker it was drawn from.
 */
template <DocumentId Doc> class InterleavedResult {
public:
    InterleavedResult() = default;
    explicit InterleavedResult(SizeType nrankers) : m_nrankers(nrankers) {}

    void append(const Doc& doc, SizeType ranker_index) {
        error_check::check_range(ranker_index, m_nrankers,
                                 "InterleavedResult: ranker index");
        m_documents.push_back(doc);
        m_ranker_indices.push_back(ranker_index);
    }

    void reserve(SizeType n) {
        m_documents.reserve(n);
        m_ranker_indices.reserve(n);
    }

    [[nodiscard]] SizeType size() const noexcept { return m_documents.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_documents.empty(); }

    [[nodiscard]] SizeType get_nrankers() const noexcept { return m_nrankers; }
    void set_nrankers(SizeType nrankers) { m_nrankers = nrankers; }

    [[nodiscard]] const std::vector<Doc>& get_documents() const noexcept {
        return m_documents;
    }
    [[nodiscard]] const std::vector<SizeType>&
    get_ranker_indices() const noexcept {
        return m_ranker_indices;
    }

    [[nodiscard]] const Doc& document_at(SizeType pos) const {
        error_check::check_range(pos, m_documents.size(),
                                 "InterleavedResult: position");
        return m_documents[pos];
    }
    [[nodiscard]] SizeType ranker_at(SizeType pos) const {
        error_check::check_range(pos, m_ranker_indices.size(),
                                 "InterleavedResult: position");
        return m_ranker_indices[pos];
    }

    bool operator==(const InterleavedResult&) const = default;

private:
    SizeType m_nrankers{};
    std::vector<Doc> m_documents;
    std::vector<SizeType> m_ranker_indices;
};

} // namespace plaid::interleaving
