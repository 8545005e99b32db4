#include <stable-vec/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional stays trivial for trivial payloads
static_assert(std::is_constructible_v<sv::optional<int>>);
static_assert(std::is_constructible_v<sv::optional<int>, int>);
static_assert(std::is_constructible_v<sv::optional<int>, sv::nullopt_t>);
static_assert(std::is_trivially_copyable_v<sv::optional<int>>);
static_assert(std::is_trivially_destructible_v<sv::optional<int>>);

// move-only payloads stay move-only
static_assert(!std::is_copy_constructible_v<sv::optional<std::unique_ptr<int>>>);
static_assert(std::is_move_constructible_v<sv::optional<std::unique_ptr<int>>>);

// no accidental comparison against bool
template <class T>
concept comparable_with_bool = requires(T const& v) { v == true; };
static_assert(!comparable_with_bool<sv::optional<int>>);

namespace
{
// counts special member calls
struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int copy_assign_count = 0;
    static inline int move_assign_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        copy_assign_count = 0;
        move_assign_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    counting_type& operator=(counting_type const& rhs)
    {
        value = rhs.value;
        ++copy_assign_count;
        return *this;
    }

    counting_type& operator=(counting_type&& rhs) noexcept
    {
        value = rhs.value;
        ++move_assign_count;
        return *this;
    }

    ~counting_type() { ++dtor_count; }

    friend bool operator==(counting_type const&, counting_type const&) = default;
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default and nullopt construction are empty")
    {
        CHECK(!sv::optional<int>{}.has_value());
        CHECK(!sv::optional<int>{sv::nullopt}.has_value());
    }

    SECTION("value construction")
    {
        auto const opt = sv::optional<int>{42};
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);
    }

    SECTION("trivial move keeps the source engaged")
    {
        auto opt1 = sv::optional<int>{42};
        auto const opt2 = sv::move(opt1);
        CHECK(opt2.value() == 42);
        CHECK(opt1.has_value());
    }

    SECTION("value and nullopt assignment")
    {
        auto opt = sv::optional<int>{};
        opt = 42;
        CHECK(opt.value() == 42);
        opt = sv::nullopt;
        CHECK(!opt.has_value());
    }

    SECTION("value_or")
    {
        CHECK(sv::optional<int>{5}.value_or(-1) == 5);
        CHECK(sv::optional<int>{}.value_or(-1) == -1);
    }

    SECTION("comparison")
    {
        CHECK(sv::optional<int>{3} == 3);
        CHECK(!(sv::optional<int>{3} == 4));
        CHECK(!(sv::optional<int>{} == 3));
        CHECK(sv::optional<int>{} == sv::nullopt);
        CHECK(sv::optional<int>{3} == sv::optional<int>{3});
        CHECK(!(sv::optional<int>{3} == sv::optional<int>{}));
        CHECK(sv::optional<int>{} == sv::optional<int>{});
    }
}

TEST("optional - non-trivial types")
{
    SECTION("move construction leaves the source empty")
    {
        auto opt1 = sv::optional<std::string>{std::string("popped")};
        auto const opt2 = sv::move(opt1);
        CHECK(opt2.value() == "popped");
        CHECK(!opt1.has_value());
    }

    SECTION("copy keeps both engaged")
    {
        auto const opt1 = sv::optional<std::string>{std::string("a")};
        auto const opt2 = opt1; // NOLINT
        CHECK(opt1.value() == "a");
        CHECK(opt2.value() == "a");
    }

    SECTION("move-only payload")
    {
        auto opt = sv::optional<std::unique_ptr<int>>{std::make_unique<int>(7)};
        REQUIRE(opt.has_value());
        auto p = sv::move(opt).value();
        CHECK(*p == 7);
    }

    SECTION("rvalue value_or moves the value out")
    {
        auto opt = sv::optional<std::string>{std::string("kept")};
        auto const s = sv::move(opt).value_or("fallback");
        CHECK(s == "kept");
        CHECK(sv::optional<std::string>{}.value_or("fallback") == "fallback");
    }
}

TEST("optional - special member calls")
{
    SECTION("empty optional never touches T")
    {
        counting_type::reset_counters();
        {
            auto const opt = sv::optional<counting_type>{};
            CHECK(!opt.has_value());
        }
        CHECK(counting_type::value_ctor_count == 0);
        CHECK(counting_type::dtor_count == 0);
    }

    SECTION("value construction moves once")
    {
        counting_type::reset_counters();
        {
            auto const opt = sv::optional<counting_type>{counting_type{42}};
            CHECK(opt.value().value == 42);
        }
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::copy_ctor_count == 0);
        CHECK(counting_type::dtor_count == 2); // temporary + payload
    }

    SECTION("move construction destroys the source payload")
    {
        counting_type::reset_counters();
        {
            auto opt1 = sv::optional<counting_type>{counting_type{42}};
            counting_type::reset_counters();
            auto const opt2 = sv::move(opt1);
            CHECK(!opt1.has_value());
        }
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2); // moved-from source + opt2
    }

    SECTION("assignment between engaged optionals assigns")
    {
        counting_type::reset_counters();
        {
            auto opt1 = sv::optional<counting_type>{counting_type{1}};
            auto opt2 = sv::optional<counting_type>{counting_type{2}};
            counting_type::reset_counters();
            opt2 = opt1;
            CHECK(opt2.value().value == 1);
            opt2 = sv::move(opt1);
        }
        CHECK(counting_type::copy_assign_count == 1);
        CHECK(counting_type::move_assign_count == 1);
        CHECK(counting_type::copy_ctor_count == 0);
        CHECK(counting_type::move_ctor_count == 0);
    }

    SECTION("assigning empty destroys the payload")
    {
        counting_type::reset_counters();
        auto opt = sv::optional<counting_type>{counting_type{1}};
        counting_type::reset_counters();
        opt = sv::optional<counting_type>{};
        CHECK(!opt.has_value());
        CHECK(counting_type::dtor_count == 1);
    }
}
