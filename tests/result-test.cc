#include <ordered-list/list_error.hh>
#include <ordered-list/result.hh>

#include <nexus/test.hh>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// result stays trivial when T and E are trivial
static_assert(std::is_constructible_v<ol::result<int, int>>);
static_assert(std::is_constructible_v<ol::result<int, int>, int>);
static_assert(std::is_constructible_v<ol::result<int, int>, ol::as_error_t<int>>);
static_assert(std::is_trivially_copyable_v<ol::result<int, int>>);
static_assert(std::is_trivially_destructible_v<ol::result<int, int>>);

// the list results are trivial as well
static_assert(std::is_trivially_copyable_v<ol::result<ol::isize, ol::list_error>>);
static_assert(std::is_trivially_copyable_v<ol::result<void, ol::list_error>>);

// a non-trivial alternative makes the whole result non-trivial
static_assert(!std::is_trivially_copyable_v<ol::result<std::string, ol::list_error>>);
static_assert(!std::is_trivially_destructible_v<ol::result<int, std::string>>);

namespace
{
struct non_trivial
{
    int value = 0;
    bool* destroyed = nullptr;

    non_trivial() = default;
    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, bool* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            *destroyed = true;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&& rhs) noexcept : value(rhs.value), destroyed(rhs.destroyed) { rhs.destroyed = nullptr; }
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&& rhs) noexcept
    {
        value = rhs.value;
        destroyed = rhs.destroyed;
        rhs.destroyed = nullptr;
        return *this;
    }
};

struct move_only
{
    int value = 0;

    move_only() = default;
    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
};

struct counting_type
{
    int value = 0;

    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    counting_type() = default;
    explicit counting_type(int v) : value(v) {}

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }
    counting_type& operator=(counting_type const&) = default;
    counting_type& operator=(counting_type&&) noexcept = default;

    ~counting_type() { ++dtor_count; }
};

// copying throws while `fail` is set, moving never throws
struct throwing_copy
{
    int value = 0;
    bool fail = false;

    throwing_copy() = default;
    throwing_copy(int v, bool f) : value(v), fail(f) {}

    throwing_copy(throwing_copy const& rhs) : value(rhs.value), fail(rhs.fail)
    {
        if (fail)
            throw std::runtime_error("copy failed");
    }
    throwing_copy(throwing_copy&&) noexcept = default;
    throwing_copy& operator=(throwing_copy const&) = default;
    throwing_copy& operator=(throwing_copy&&) noexcept = default;
};

// every construction from an int throws, moving may throw as well
struct throwing_build
{
    std::string payload;

    explicit throwing_build(int) { throw std::runtime_error("build failed"); }
    throwing_build(throwing_build const&) = default;
    throwing_build(throwing_build&& rhs) noexcept(false) : payload(rhs.payload) {}
};

template <class F>
bool throws_runtime_error(F&& f)
{
    try
    {
        f();
    }
    catch (std::runtime_error const&)
    {
        return true;
    }
    return false;
}
} // namespace

// moves are only noexcept when both alternatives move without throwing
static_assert(std::is_nothrow_move_constructible_v<ol::result<std::string, ol::list_error>>);
static_assert(std::is_nothrow_move_assignable_v<ol::result<std::string, ol::list_error>>);
static_assert(!std::is_nothrow_move_constructible_v<ol::result<throwing_build, ol::list_error>>);
static_assert(!std::is_nothrow_move_constructible_v<ol::result<void, throwing_build>>);

TEST("result - trivial types")
{
    SECTION("default construction creates error")
    {
        auto const res = ol::result<int, int>{};
        CHECK(!res.has_value());
        CHECK(res.has_error());
        CHECK(res.error() == 0);
    }

    SECTION("value construction")
    {
        auto const res = ol::result<int, int>{42};
        CHECK(res.has_value());
        CHECK(!res.has_error());
        CHECK(res.value() == 42);
    }

    SECTION("error construction via ol::error")
    {
        auto const res = ol::result<int, int>{ol::error(99)};
        CHECK(res.has_error());
        CHECK(res.error() == 99);
    }

    SECTION("copy assignment - value to error")
    {
        auto res1 = ol::result<int, int>{42};
        auto res2 = ol::result<int, int>{ol::error(99)};
        res2 = res1;
        CHECK(res2.has_value());
        CHECK(res2.value() == 42);
    }

    SECTION("move assignment - error to value")
    {
        auto res1 = ol::result<int, int>{ol::error(99)};
        auto res2 = ol::result<int, int>{42};
        res2 = ol::move(res1);
        CHECK(res2.has_error());
        CHECK(res2.error() == 99);
    }
}

TEST("result - non-trivial types")
{
    SECTION("value and error construction")
    {
        auto const res1 = ol::result<non_trivial, int>{non_trivial{42}};
        CHECK(res1.has_value());
        CHECK(res1.value().value == 42);

        auto const res2 = ol::result<int, non_trivial>{ol::error(non_trivial{99})};
        CHECK(res2.has_error());
        CHECK(res2.error().value == 99);
    }

    SECTION("destructor destroys the active alternative")
    {
        bool destroyed = false;
        {
            auto const res = ol::result<non_trivial, int>{non_trivial{1, &destroyed}};
            CHECK(!destroyed);
        }
        CHECK(destroyed);
    }

    SECTION("copy construction copies exactly once")
    {
        counting_type::reset_counters();
        {
            auto const res1 = ol::result<counting_type, int>{counting_type{42}};
            counting_type::reset_counters();
            auto const res2 = res1; // NOLINT
            CHECK(res2.has_value());
            CHECK(res2.value().value == 42);
        }
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("move construction moves exactly once")
    {
        counting_type::reset_counters();
        {
            auto res1 = ol::result<counting_type, int>{counting_type{42}};
            counting_type::reset_counters();
            auto const res2 = ol::move(res1);
            CHECK(res2.has_value());
        }
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("copy assignment - value to error")
    {
        counting_type::reset_counters();
        {
            auto res1 = ol::result<counting_type, int>{counting_type{42}};
            auto res2 = ol::result<counting_type, int>{ol::error(99)};
            counting_type::reset_counters();
            res2 = res1;
            CHECK(res2.has_value());
            CHECK(res2.value().value == 42);
        }
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("move assignment - error to value")
    {
        counting_type::reset_counters();
        {
            auto res1 = ol::result<int, counting_type>{ol::error(counting_type{99})};
            auto res2 = ol::result<int, counting_type>{42};
            counting_type::reset_counters();
            res2 = ol::move(res1);
            CHECK(res2.has_error());
            CHECK(res2.error().value == 99);
        }
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }
}

TEST("result - move-only types")
{
    SECTION("unique_ptr value")
    {
        auto res = ol::result<std::unique_ptr<int>, int>{std::make_unique<int>(42)};
        CHECK(res.has_value());
        CHECK(*res.value() == 42);

        auto res2 = ol::move(res);
        CHECK(res2.has_value());
        CHECK(*res2.value() == 42);
    }

    SECTION("value rvalue reference")
    {
        auto res = ol::result<move_only, int>{move_only{42}};
        auto moved = ol::move(res).value();
        CHECK(moved.value == 42);
    }

    SECTION("error rvalue reference")
    {
        auto res = ol::result<int, move_only>{ol::error(move_only{99})};
        auto moved = ol::move(res).error();
        CHECK(moved.value == 99);
    }
}

TEST("result - value_or and error_or")
{
    SECTION("value_or")
    {
        CHECK(ol::result<int, int>{42}.value_or(99) == 42);
        CHECK(ol::result<int, int>{ol::error(1)}.value_or(99) == 99);
    }

    SECTION("error_or")
    {
        CHECK(ol::result<int, int>{ol::error(1)}.error_or(0) == 1);
        CHECK(ol::result<int, int>{42}.error_or(7) == 7);
    }

    SECTION("value_or with move-only type")
    {
        auto res = ol::result<move_only, int>{ol::error(0)};
        auto fallback = ol::move(res).value_or(move_only{99});
        CHECK(fallback.value == 99);
    }
}

TEST("result - emplace_value and emplace_error")
{
    SECTION("emplace_value on error result")
    {
        auto res = ol::result<int, int>{ol::error(99)};
        auto& ref = res.emplace_value(42);
        CHECK(res.has_value());
        CHECK(&ref == &res.value());
    }

    SECTION("emplace_error with multiple arguments")
    {
        auto res = ol::result<int, std::string>{42};
        auto& ref = res.emplace_error(5, 'x');
        CHECK(res.has_error());
        CHECK(res.error() == "xxxxx");
        CHECK(&ref == &res.error());
    }

    SECTION("emplace destroys previous value")
    {
        bool destroyed = false;
        auto res = ol::result<non_trivial, int>{non_trivial{99, &destroyed}};
        res.emplace_error(42);
        CHECK(destroyed);
        CHECK(res.error() == 42);
    }
}

TEST("result - failed alternative switch keeps the previous alternative")
{
    SECTION("copy assignment of a value onto an error")
    {
        auto const failing = ol::result<throwing_copy, std::string>{throwing_copy{7, true}};
        auto res = ol::result<throwing_copy, std::string>{ol::error(std::string(64, 'e'))};

        CHECK(throws_runtime_error([&] { res = failing; }));
        REQUIRE(res.has_error());
        CHECK(res.error() == std::string(64, 'e'));

        res = ol::result<throwing_copy, std::string>{throwing_copy{3, false}};
        CHECK(res.value().value == 3);
    }

    SECTION("emplace_value over a value")
    {
        auto const source = throwing_copy{1, true};
        auto res = ol::result<throwing_copy, std::string>{throwing_copy{2, false}};

        CHECK(throws_runtime_error([&] { res.emplace_value(source); }));
        REQUIRE(res.has_value());
        CHECK(res.value().value == 2);
    }

    SECTION("emplace_error over a value")
    {
        auto const source = throwing_copy{1, true};
        auto res = ol::result<std::string, throwing_copy>{std::string(64, 'v')};

        CHECK(throws_runtime_error([&] { res.emplace_error(source); }));
        REQUIRE(res.has_value());
        CHECK(res.value() == std::string(64, 'v'));
    }

    SECTION("construction that throws without a nothrow move")
    {
        auto res = ol::result<throwing_build, std::string>{ol::error(std::string(64, 'e'))};

        CHECK(throws_runtime_error([&] { res.emplace_value(1); }));
        REQUIRE(res.has_error());
        CHECK(res.error() == std::string(64, 'e'));
    }

    SECTION("void result")
    {
        auto const failing = ol::result<void, throwing_copy>{ol::error(throwing_copy{5, true})};
        auto res = ol::result<void, throwing_copy>{ol::error(throwing_copy{6, false})};

        CHECK(throws_runtime_error([&] { res = failing; }));
        REQUIRE(res.has_error());
        CHECK(res.error().value == 6);

        auto ok = ol::result<void, throwing_copy>{};
        CHECK(throws_runtime_error([&] { ok = failing; }));
        CHECK(ok.has_value());
    }
}

TEST("result - equality")
{
    using res_t = ol::result<int, ol::list_error>;

    CHECK(res_t{1} == res_t{1});
    CHECK(!(res_t{1} == res_t{2}));
    CHECK(res_t{ol::error(ol::list_error::read_only())} == res_t{ol::error(ol::list_error::read_only())});
    CHECK(!(res_t{ol::error(ol::list_error::read_only())} == res_t{1}));
    CHECK(!(res_t{ol::error(ol::list_error::index_out_of_range(3))}
            == res_t{ol::error(ol::list_error::index_out_of_range(4))}));
}

TEST("result - void specialization")
{
    using res_t = ol::result<void, ol::list_error>;

    SECTION("default construction is success")
    {
        auto const res = res_t{};
        CHECK(res.has_value());
        CHECK(!res.has_error());
    }

    SECTION("error construction")
    {
        auto const res = res_t{ol::error(ol::list_error::item_not_found())};
        CHECK(res.has_error());
        CHECK(res.error().kind == ol::list_error_kind::item_not_found);
    }

    SECTION("emplace switches between success and error")
    {
        auto res = res_t{};
        res.emplace_error(ol::list_error::invalid_operation());
        CHECK(res.has_error());
        res.emplace_value();
        CHECK(res.has_value());
    }

    SECTION("non-trivial error")
    {
        auto res = ol::result<void, std::string>{ol::error("list is locked")};
        CHECK(res.error() == "list is locked");

        auto copy = res;
        CHECK(copy.error() == "list is locked");

        copy = ol::result<void, std::string>{};
        CHECK(copy.has_value());
        CHECK(copy.error_or("none") == "none");
    }
}

TEST("result - propagating list errors")
{
    // checked lookup that forwards the error of the first failing step
    auto second_of = [](std::vector<int> const& items) -> ol::result<int, ol::list_error>
    {
        if (items.size() < 2)
            return ol::error(ol::list_error::index_out_of_range(1));
        return items[1];
    };

    auto sum_of_seconds = [&](std::vector<int> const& a, std::vector<int> const& b) -> ol::result<int, ol::list_error>
    {
        auto ra = second_of(a);
        if (ra.has_error())
            return ol::error(ra.error());

        auto rb = second_of(b);
        if (rb.has_error())
            return ol::error(rb.error());

        return ra.value() + rb.value();
    };

    CHECK(sum_of_seconds({1, 2}, {3, 4}).value() == 6);

    auto const failed = sum_of_seconds({1, 2}, {3});
    REQUIRE(failed.has_error());
    CHECK(failed.error() == ol::list_error::index_out_of_range(1));
    CHECK(failed.value_or(-1) == -1);
}
