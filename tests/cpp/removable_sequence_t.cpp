#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "plaid/core/removable_sequence.hpp"

using plaid::core::NodePool;
using plaid::core::RemovableSequence;

namespace {
template <typename Doc>
std::vector<Doc> collect(const RemovableSequence<Doc>& seq) {
    return {seq.begin(), seq.end()};
}
} // namespace

TEST_CASE("RemovableSequence construction", "[removable_sequence]") {
    NodePool<std::uint64_t> pool;
    SECTION("Keeps input order") {
        const std::vector<std::uint64_t> docs = {5, 3, 9, 1};
        RemovableSequence<std::uint64_t> seq(pool, docs);
        REQUIRE(seq.length() == 4);
        REQUIRE(collect(seq) == docs);
    }
    SECTION("Duplicates are ignored, first occurrence wins") {
        const std::vector<std::uint64_t> docs = {5, 3, 5, 1, 3};
        RemovableSequence<std::uint64_t> seq(pool, docs);
        REQUIRE(seq.length() == 3);
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{5, 3, 1});
        REQUIRE_FALSE(seq.append(1));
        REQUIRE(seq.append(7));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{5, 3, 1, 7});
    }
    SECTION("Empty sequence") {
        RemovableSequence<std::uint64_t> seq(pool);
        REQUIRE(seq.empty());
        REQUIRE(seq.length() == 0);
        REQUIRE(seq.begin() == seq.end());
    }
}

TEST_CASE("RemovableSequence removal", "[removable_sequence]") {
    NodePool<std::uint64_t> pool;
    const std::vector<std::uint64_t> docs = {1, 2, 3, 4, 5};
    RemovableSequence<std::uint64_t> seq(pool, docs);

    SECTION("Middle element") {
        REQUIRE(seq.remove(3));
        REQUIRE(seq.length() == 4);
        REQUIRE_FALSE(seq.contains(3));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{1, 2, 4, 5});
    }
    SECTION("Head and tail") {
        REQUIRE(seq.remove(1));
        REQUIRE(seq.remove(5));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{2, 3, 4});
        // Appending after removing the tail links to the new tail
        REQUIRE(seq.append(6));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{2, 3, 4, 6});
    }
    SECTION("Adjacent elements") {
        REQUIRE(seq.remove(2));
        REQUIRE(seq.remove(3));
        REQUIRE(seq.remove(4));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{1, 5});
        REQUIRE(seq.remove(1));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{5});
    }
    SECTION("Removal is idempotent") {
        REQUIRE(seq.remove(2));
        REQUIRE_FALSE(seq.remove(2));
        REQUIRE_FALSE(seq.remove(42));
        REQUIRE(seq.length() == 4);
    }
    SECTION("Removing everything leaves length 0") {
        for (const auto doc : docs) {
            REQUIRE(seq.remove(doc));
        }
        REQUIRE(seq.empty());
        REQUIRE(seq.begin() == seq.end());
        REQUIRE(seq.append(3));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{3});
    }
    SECTION("Removed document can be appended again") {
        REQUIRE(seq.remove(2));
        REQUIRE(seq.append(2));
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{1, 3, 4, 5, 2});
    }
}

TEST_CASE("RemovableSequence node pooling", "[removable_sequence]") {
    NodePool<std::uint64_t> pool;
    const std::vector<std::uint64_t> docs = {1, 2, 3, 4, 5};
    SECTION("Drain releases every element node") {
        RemovableSequence<std::uint64_t> seq(pool, docs);
        // One head sentinel plus one node per document
        REQUIRE(pool.in_use() == 6);
        seq.drain();
        REQUIRE(seq.empty());
        REQUIRE(pool.in_use() == 1);
        REQUIRE(pool.available() == 5);
    }
    SECTION("Destruction returns all nodes and they are reused") {
        {
            RemovableSequence<std::uint64_t> seq(pool, docs);
            REQUIRE(pool.capacity() == 6);
        }
        REQUIRE(pool.in_use() == 0);
        RemovableSequence<std::uint64_t> seq(pool, docs);
        REQUIRE(pool.capacity() == 6);
        REQUIRE(collect(seq) == docs);
    }
    SECTION("Removed nodes are recycled by later appends") {
        RemovableSequence<std::uint64_t> seq(pool, docs);
        seq.remove(2);
        seq.remove(4);
        REQUIRE(pool.available() == 2);
        seq.append(6);
        seq.append(7);
        REQUIRE(pool.available() == 0);
        REQUIRE(pool.capacity() == 6);
        REQUIRE(collect(seq) == std::vector<std::uint64_t>{1, 3, 5, 6, 7});
    }
    SECTION("Sequences sharing a pool are independent") {
        RemovableSequence<std::uint64_t> first(pool, docs);
        first.drain();
        const std::vector<std::uint64_t> other = {9, 8, 7};
        RemovableSequence<std::uint64_t> second(pool, other);
        RemovableSequence<std::uint64_t> third(pool, docs);
        second.remove(8);
        REQUIRE(collect(first).empty());
        REQUIRE(collect(second) == std::vector<std::uint64_t>{9, 7});
        REQUIRE(collect(third) == docs);
    }
    SECTION("Moved sequence keeps its elements") {
        RemovableSequence<std::uint64_t> seq(pool, docs);
        RemovableSequence<std::uint64_t> moved(std::move(seq));
        REQUIRE(collect(moved) == docs);
        REQUIRE(pool.in_use() == 6);
    }
}

TEST_CASE("RemovableSequence with string documents", "[removable_sequence]") {
    NodePool<std::string> pool;
    const std::vector<std::string> docs = {"doc-a", "doc-b", "doc-c"};
    RemovableSequence<std::string> seq(pool, docs);
    REQUIRE(seq.remove("doc-b"));
    REQUIRE(collect(seq) == std::vector<std::string>{"doc-a", "doc-c"});
    REQUIRE(seq.contains("doc-c"));
}
