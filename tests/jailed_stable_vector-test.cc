#include <stable-vec/jailed_stable_vector.hh>
#include <stable-vec/stable_vector.hh>

#include <nexus/test.hh>

#include "check-asserts.hh"

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace
{
struct scope_a
{
};
struct scope_b
{
};

template <class Guard, class Index>
concept can_lookup = requires(Guard& g, Index const& idx) { g[idx]; };

template <class Guard, class Index>
concept can_remove = requires(Guard& g, Index const& idx) { g.remove(idx); };

template <class Vec>
concept can_jail = requires { std::declval<Vec>().jail(); };

template <class Vec, class F>
concept can_jail_with = requires(F f) { std::declval<Vec>().jail(f); };

struct count_elements
{
    template <class Guard>
    sv::isize operator()(Guard& jailed) const
    {
        return jailed.num_elements();
    }
};

template <class Index>
concept constructible_from_slot = std::is_constructible_v<Index, sv::isize> || std::is_constructible_v<Index, sv::isize, sv::u64>;
} // namespace

// tokens are bound to their scope tag at compile time
static_assert(can_lookup<sv::jailed_stable_vector<int, scope_a>, sv::jailed_index<scope_a>>);
static_assert(!can_lookup<sv::jailed_stable_vector<int, scope_b>, sv::jailed_index<scope_a>>);
static_assert(!can_remove<sv::jailed_stable_vector<int, scope_b>, sv::jailed_index<scope_a>>);

// raw slot numbers are not tokens
static_assert(!can_lookup<sv::jailed_stable_vector<int, scope_a>, sv::isize>);
static_assert(!constructible_from_slot<sv::jailed_index<scope_a>>);
static_assert(!std::is_default_constructible_v<sv::jailed_index<scope_a>>);

// only named containers can be jailed, a guard over a temporary would dangle
static_assert(can_jail<sv::stable_vector<int>&>);
static_assert(!can_jail<sv::stable_vector<int>>);
static_assert(!can_jail<sv::stable_vector<int>&&>);
static_assert(can_jail_with<sv::stable_vector<int>&, count_elements>);
static_assert(!can_jail_with<sv::stable_vector<int>, count_elements>);

// tokens are copyable values, guards are pinned to their scope
static_assert(std::is_trivially_copyable_v<sv::jailed_index<scope_a>>);
static_assert(!std::is_copy_constructible_v<sv::jailed_stable_vector<int, scope_a>>);
static_assert(!std::is_move_constructible_v<sv::jailed_stable_vector<int, scope_a>>);

TEST("jailed_stable_vector - insert, lookup, remove, compact")
{
    auto run_scope = [](sv::stable_vector<int>& v)
    {
        v.jail(
            [](auto& jailed)
            {
                auto const a = jailed.insert(1);
                auto const b = jailed.insert(2);
                CHECK(jailed[a] + jailed[b] == 3);

                auto const removed = jailed.remove(a);
                CHECK(removed == 1);
            });

        CHECK(!v.is_jailed());
        CHECK(!v.is_compact());
    };

    SECTION("order-preserving compaction")
    {
        auto v = sv::stable_vector<int>();
        run_scope(v);
        v.make_compact();
        CHECK(sv::move(v).into_vector() == std::vector<int>{2});
    }

    SECTION("reordering compaction")
    {
        auto v = sv::stable_vector<int>();
        run_scope(v);
        v.reordering_make_compact();
        CHECK(sv::move(v).into_vector() == std::vector<int>{2});
    }
}

TEST("jailed_stable_vector - two rounds on the same container")
{
    auto v = sv::stable_vector<int>();

    for (auto round = 0; round < 2; ++round)
    {
        {
            auto jailed = v.jail();
            auto const a = jailed.insert(1);
            auto const b = jailed.insert(2);
            CHECK(jailed[a] + jailed[b] == 3);
            jailed.remove(a);
        }
        v.make_compact();
    }

    CHECK(sv::move(v).into_vector() == std::vector<int>{2, 2});
}

TEST("jailed_stable_vector - tokens resolve to their inserted values")
{
    auto v = sv::stable_vector<std::string>();
    v.push_back("before");

    auto jailed = v.jail<scope_a>();
    std::vector<sv::jailed_index<scope_a>> tokens;
    std::vector<std::string> values;

    for (auto i = 0; i < 100; ++i)
    {
        values.push_back("value " + std::to_string(i));
        tokens.push_back(jailed.insert(values.back()));

        // interleave removals
        if (i % 7 == 3)
            jailed.remove(tokens[i - 2]);
    }

    for (auto i = 0; i < 100; ++i)
    {
        auto const removed = i % 7 == 1 && i + 2 < 100;
        if (removed)
        {
            CHECK(jailed.state_of(tokens[i]) == sv::index_state::removed);
            CHECK(jailed.get(tokens[i]) == nullptr);
        }
        else
        {
            CHECK(jailed.contains_index(tokens[i]));
            CHECK(jailed[tokens[i]] == values[i]);
        }
    }

    SECTION("mutation through the guard")
    {
        jailed[tokens[0]] = "changed";
        CHECK(*jailed.get(tokens[0]) == "changed");

        auto const& const_jailed = jailed;
        CHECK(const_jailed[tokens[0]] == "changed");
    }

    SECTION("tokens compare by slot")
    {
        auto const copy = tokens[5];
        CHECK(copy == tokens[5]);
        CHECK(!(copy == tokens[6]));
    }
}

TEST("jailed_stable_vector - double remove")
{
    auto v = sv::stable_vector<int>();
    auto jailed = v.jail();

    auto const a = jailed.insert(1);
    auto const b = jailed.insert(2);

    CHECK(jailed.remove(a) == 1);
    CHECK(jailed.remove(a) == sv::nullopt);

    CHECK(jailed[b] == 2);
    CHECK(jailed.num_elements() == 1);
}

TEST("jailed_stable_vector - occupied count and compactness")
{
    auto v = sv::stable_vector<int>();
    auto jailed = v.jail();

    CHECK(jailed.empty());
    CHECK(jailed.num_elements() == 0);
    CHECK(jailed.is_compact());

    auto const a = jailed.insert(1);
    jailed.insert(2);
    auto const c = jailed.emplace(3);
    CHECK(jailed.num_elements() == 3);
    CHECK(jailed.is_compact());

    jailed.remove(a);
    CHECK(jailed.num_elements() == 2);
    CHECK(!jailed.is_compact());

    // remove_last tombstones the trailing element
    CHECK(jailed.remove_last() == 3);
    CHECK(jailed.state_of(c) == sv::index_state::removed);
    CHECK(jailed.num_elements() == 1);

    CHECK(jailed.remove_last() == 2);
    CHECK(jailed.remove_last() == sv::nullopt);
    CHECK(jailed.num_elements() == 0);

    // inserts after removals get fresh slots
    auto const d = jailed.insert(4);
    CHECK(!(d == a));
    CHECK(!(d == c));
    CHECK(jailed.state_of(a) == sv::index_state::removed);
}

TEST("jailed_stable_vector - jail(fn) returns the callback result")
{
    auto v = sv::stable_vector<int>::create_copy_of({5, 6});

    auto const sum = v.jail(
        [](auto& jailed)
        {
            auto const a = jailed.insert(7);
            return jailed[a] + jailed.num_elements();
        });

    CHECK(sum == 7 + 3);
    CHECK(!v.is_jailed());
    CHECK(v.num_elements() == 3);
}

TEST("jailed_stable_vector - each jail(fn) callback gets its own token type")
{
    auto v = sv::stable_vector<int>();

    auto const first = v.jail([](auto& jailed) { return jailed.insert(1); });
    using first_index = std::remove_const_t<decltype(first)>;

    auto const second = v.jail(
        [](auto& jailed)
        {
            using guard_t = std::remove_reference_t<decltype(jailed)>;
            static_assert(!can_lookup<guard_t, first_index>);
            static_assert(!can_remove<guard_t, first_index>);
            static_assert(can_lookup<guard_t, typename guard_t::index_t>);
            return jailed.insert(2);
        });
    using second_index = std::remove_const_t<decltype(second)>;

    static_assert(!std::is_same_v<first_index, second_index>);
    static_assert(!std::is_same_v<first_index, sv::jailed_index<sv::default_scope_tag>>);

    CHECK(v.jail(count_elements{}) == 2);
}

TEST("jailed_stable_vector - container is locked while jailed")
{
    auto v = sv::stable_vector<int>::create_copy_of({1, 2, 3});
    v.remove_at(1);

    {
        auto jailed = v.jail();
        CHECK(v.is_jailed());

        SV_CHECK_ASSERTS(v.make_compact());
        SV_CHECK_ASSERTS(v.reordering_make_compact());
        SV_CHECK_ASSERTS(v.push_back(4));
        SV_CHECK_ASSERTS(v.pop_back());
        SV_CHECK_ASSERTS(v.remove_at(0));
        SV_CHECK_ASSERTS(v.clear());

        // nested scope over the same container
        SV_CHECK_ASSERTS(v.jail<scope_b>());

        // reads stay possible
        CHECK(v[0] == 1);
        CHECK(v.num_elements() == 2);

        CHECK(jailed.num_elements() == 2);
        CHECK(v.next_index() == 3);
    }

    CHECK(!v.is_jailed());
    v.make_compact();
    CHECK(v.next_index() == 2);

    // moves are allowed again once the guard is gone
    auto moved = sv::move(v);
    CHECK(moved.num_elements() == 2);
    CHECK(moved[1] == 3);
    CHECK(!moved.is_jailed());
    CHECK(v.empty()); // NOLINT(bugprone-use-after-move)
    CHECK(!v.is_jailed());
}

TEST("jailed_stable_vector - foreign tokens are rejected at runtime")
{
    SECTION("token from a closed scope of the same container")
    {
        auto v = sv::stable_vector<int>();
        auto const stale = [&]
        {
            auto jailed = v.jail();
            return jailed.insert(1);
        }();

        v.make_compact();

        auto jailed = v.jail();
        CHECK(jailed.state_of(stale) == sv::index_state::foreign_scope);
        CHECK(!jailed.contains_index(stale));
        SV_CHECK_ASSERTS(jailed[stale]);
        SV_CHECK_ASSERTS(jailed.get(stale));
        SV_CHECK_ASSERTS(jailed.remove(stale));
        CHECK(jailed.num_elements() == 1);
    }

    SECTION("token from a concurrently open scope over another container")
    {
        auto v1 = sv::stable_vector<int>();
        auto v2 = sv::stable_vector<int>();

        auto jailed1 = v1.jail();
        auto jailed2 = v2.jail();

        auto const a = jailed1.insert(1);
        jailed2.insert(2);

        CHECK(jailed2.state_of(a) == sv::index_state::foreign_scope);
        SV_CHECK_ASSERTS(jailed2[a]);
        CHECK(jailed1[a] == 1);
    }
}

TEST("jailed_stable_vector - stale lookup fails loudly")
{
    auto v = sv::stable_vector<int>();
    auto jailed = v.jail();

    auto const a = jailed.insert(1);
    jailed.remove(a);
    jailed.insert(2);

    // slot numbers are not reused, so a stays removed
    CHECK(jailed.state_of(a) == sv::index_state::removed);
    SV_CHECK_ASSERTS(jailed[a]);
    CHECK(jailed.get(a) == nullptr);
}
