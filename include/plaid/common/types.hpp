#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <limits>
#include <set>
#include <utility>

namespace plaid {

using SizeType  = std::size_t;
using IndexType = std::ptrdiff_t;

// (winner ranker index, loser ranker index)
using WinPair = std::pair<SizeType, SizeType>;
using Outcome = std::set<WinPair>;

inline constexpr double kDefaultTau = 3.0;

/**
 * @brief Concept for opaque document identifiers.
 *
 * Nothing is assumed about the internal structure of a document id beyond
 * value semantics, equality and hashing.
 */
template <typename T>
concept DocumentId =
    std::default_initializable<T> && std::copy_constructible<T> &&
    std::equality_comparable<T> && requires(const T& doc) {
        { std::hash<T>{}(doc) } -> std::convertible_to<std::size_t>;
    };

} // namespace plaid
