#include <verdict/result.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <vector>

namespace
{
using res_t = vd::result<int, std::string>;
using int_res_t = vd::result<int, int>;
using str_res_t = vd::result<std::string, std::string>;

res_t half(int v)
{
    if (v % 2 != 0)
        return vd::failure("odd");
    return v / 2;
}

res_t positive(int v)
{
    if (v <= 0)
        return vd::failure("not positive");
    return v;
}
} // namespace

TEST("result - map")
{
    SECTION("applies to success")
    {
        auto const res = res_t{20}.map([](int v) { return v + 1; });
        CHECK(res == res_t{21});
    }

    SECTION("changes the value type")
    {
        auto const res = res_t{7}.map([](int v) { return std::to_string(v); });
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(res)>, str_res_t>);
        CHECK(res.value() == "7");
    }

    SECTION("failure passes through without invoking f")
    {
        bool invoked = false;
        auto const res = res_t{vd::failure("bad")}.map(
            [&](int v)
            {
                invoked = true;
                return v;
            });
        CHECK(!invoked);
        CHECK(res.is_failure());
        CHECK(res.error() == "bad");
    }

    SECTION("identity law")
    {
        for (auto const& r : {res_t{3}, res_t{vd::failure("e")}})
            CHECK(r.map([](int v) { return v; }) == r);
    }

    SECTION("composition law")
    {
        auto f = [](int v) { return v * 3; };
        auto g = [](int v) { return v - 1; };
        for (auto const& r : {res_t{5}, res_t{vd::failure("e")}})
            CHECK(r.map(f).map(g) == r.map([&](int v) { return g(f(v)); }));
    }

    SECTION("rvalue map moves the payload")
    {
        auto res = vd::result<std::unique_ptr<int>, int>{std::make_unique<int>(4)};
        auto const mapped = vd::move(res).map([](std::unique_ptr<int> p) { return *p * 2; });
        CHECK(mapped.value() == 8);
    }
}

TEST("result - map_error")
{
    SECTION("applies to failure")
    {
        auto const res = res_t{vd::failure("bad")}.map_error([](std::string const& e) { return e.size(); });
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(res)>, vd::result<int, std::size_t>>);
        CHECK(res.is_failure());
        CHECK(res.error() == 3u);
    }

    SECTION("success passes through without invoking f")
    {
        bool invoked = false;
        auto const res = res_t{1}.map_error(
            [&](std::string const& e)
            {
                invoked = true;
                return e;
            });
        CHECK(!invoked);
        CHECK(res == res_t{1});
    }

    SECTION("identity law")
    {
        for (auto const& r : {res_t{3}, res_t{vd::failure("e")}})
            CHECK(r.map_error([](std::string const& e) { return e; }) == r);
    }
}

TEST("result - map_or and map_or_else")
{
    SECTION("map_or")
    {
        CHECK(res_t{4}.map_or(0, [](int v) { return v * 10; }) == 40);
        CHECK(res_t{vd::failure("bad")}.map_or(-1, [](int v) { return v * 10; }) == -1);
    }

    SECTION("map_or_else invokes exactly one branch")
    {
        int error_calls = 0;
        int success_calls = 0;

        auto on_error = [&](std::string const& e)
        {
            ++error_calls;
            return "error: " + e;
        };
        auto on_success = [&](int v)
        {
            ++success_calls;
            return "value: " + std::to_string(v);
        };

        CHECK(res_t{1}.map_or_else(on_error, on_success) == "value: 1");
        CHECK(error_calls == 0);
        CHECK(success_calls == 1);

        CHECK(res_t{vd::failure("x")}.map_or_else(on_error, on_success) == "error: x");
        CHECK(error_calls == 1);
        CHECK(success_calls == 1);
    }
}

TEST("result - inspect")
{
    SECTION("inspect sees successes only")
    {
        std::vector<int> seen;
        auto const ok = res_t{1};
        auto const err = res_t{vd::failure("e")};

        ok.inspect([&](int v) { seen.push_back(v); });
        err.inspect([&](int v) { seen.push_back(v); });

        REQUIRE(seen.size() == 1);
        CHECK(seen[0] == 1);
    }

    SECTION("inspect_error sees failures only")
    {
        std::vector<std::string> seen;
        auto const ok = res_t{1};
        auto const err = res_t{vd::failure("e")};

        ok.inspect_error([&](std::string const& e) { seen.push_back(e); });
        err.inspect_error([&](std::string const& e) { seen.push_back(e); });

        REQUIRE(seen.size() == 1);
        CHECK(seen[0] == "e");
    }

    SECTION("lvalue inspect returns the same object")
    {
        auto const res = res_t{5};
        auto const& same = res.inspect([](int) {});
        CHECK(&same == &res);
    }

    SECTION("rvalue inspect forwards the value")
    {
        int total = 0;
        auto const res = res_t{5}
                             .inspect([&](int v) { total += v; })
                             .map([](int v) { return v + 1; })
                             .inspect([&](int v) { total += v; });
        CHECK(total == 11);
        CHECK(res == res_t{6});
    }
}

TEST("result - to_sequence")
{
    SECTION("success yields exactly one element")
    {
        auto const res = res_t{9};
        auto seq = res.to_sequence();
        CHECK(!seq.is_empty());
        CHECK(seq.count() == 1);
        CHECK(seq.to_container<std::vector<int>>() == std::vector<int>{9});
    }

    SECTION("failure yields nothing")
    {
        auto const res = res_t{vd::failure("e")};
        auto seq = res.to_sequence();
        CHECK(seq.is_empty());
        CHECK(seq.count() == 0);
        CHECK(seq.all([](int) { return false; }));
    }

    SECTION("repeated traversal yields the same element")
    {
        auto const res = res_t{3};
        auto seq = res.to_sequence();

        int sum = 0;
        for (auto const& v : seq)
            sum += v;
        for (auto const& v : seq)
            sum += v;
        CHECK(sum == 6);

        // a fresh sequence from the same result behaves identically
        CHECK(res.to_sequence().any([](int v) { return v == 3; }));
    }

    SECTION("rvalue sequence owns the payload")
    {
        auto seq = res_t{12}.to_sequence();
        CHECK(seq.count() == 1);
        CHECK(seq.index_of([](int v) { return v == 12; }) == vd::isize(0));
    }
}

TEST("result - and_ and or_")
{
    auto const ok = res_t{1};
    auto const err = res_t{vd::failure("late")};
    auto const other_ok = str_res_t{"two"};
    auto const other_err = str_res_t{vd::failure("early")};

    SECTION("and_ returns other on success")
    {
        CHECK(ok.and_(other_ok) == other_ok);
        CHECK(ok.and_(other_err) == other_err);
    }

    SECTION("and_ keeps this failure")
    {
        auto const res = err.and_(other_ok);
        CHECK(res.is_failure());
        CHECK(res.error() == "late");
    }

    SECTION("or_ keeps this success")
    {
        auto const fallback = int_res_t{vd::failure(0)};
        auto const res = ok.or_(fallback);
        CHECK(res == int_res_t{1});
    }

    SECTION("or_ returns other on failure")
    {
        CHECK(err.or_(int_res_t{7}) == int_res_t{7});
        CHECK(err.or_(int_res_t{vd::failure(8)}) == int_res_t{vd::failure(8)});
    }
}

TEST("result - and_then")
{
    SECTION("chains successes")
    {
        CHECK(res_t{8}.and_then(half).and_then(half) == res_t{2});
    }

    SECTION("stops at the first failure")
    {
        int calls = 0;
        auto counted = [&](int v) -> res_t
        {
            ++calls;
            return v;
        };

        auto const res = res_t{3}.and_then(half).and_then(counted);
        CHECK(res.is_failure());
        CHECK(res.error() == "odd");
        CHECK(calls == 0);
    }

    SECTION("left identity: success(a).and_then(f) == f(a)")
    {
        for (int a : {-2, 0, 3, 4})
            CHECK(res_t::success(a).and_then(half) == half(a));
    }

    SECTION("right identity: m.and_then(success) == m")
    {
        auto wrap = [](int v) { return res_t::success(v); };
        for (auto const& m : {res_t{3}, res_t{vd::failure("e")}})
            CHECK(m.and_then(wrap) == m);
    }

    SECTION("associativity")
    {
        for (auto const& m : {res_t{-4}, res_t{4}, res_t{6}, res_t{vd::failure("e")}})
        {
            auto const lhs = m.and_then(half).and_then(positive);
            auto const rhs = m.and_then([](int v) { return half(v).and_then(positive); });
            CHECK(lhs == rhs);
        }
    }

    SECTION("changes the value type")
    {
        auto const res = res_t{2}.and_then([](int v) { return str_res_t{std::string(v, 'x')}; });
        CHECK(res.value() == "xx");
    }
}

TEST("result - or_else")
{
    SECTION("recovers from failure")
    {
        auto const res = res_t{vd::failure("e")}.or_else([](std::string const& e)
                                                         { return int_res_t{int(e.size())}; });
        CHECK(res == int_res_t{1});
    }

    SECTION("is not invoked on success")
    {
        bool invoked = false;
        auto const res = res_t{5}.or_else(
            [&](std::string const&)
            {
                invoked = true;
                return int_res_t{0};
            });
        CHECK(!invoked);
        CHECK(res == int_res_t{5});
    }

    SECTION("can change the failure type")
    {
        auto const res
            = res_t{vd::failure("e")}.or_else([](std::string const&) { return int_res_t{vd::failure(42)}; });
        CHECK(res.is_failure());
        CHECK(res.error() == 42);
    }
}

TEST("result - flatten")
{
    using nested_t = vd::result<res_t, std::string>;

    SECTION("success(success(v)) -> success(v)")
    {
        CHECK(nested_t{res_t{4}}.flatten() == res_t{4});
    }

    SECTION("success(failure(e)) -> failure(e)")
    {
        CHECK(nested_t{res_t{vd::failure("inner")}}.flatten() == res_t{vd::failure("inner")});
    }

    SECTION("failure(e) -> failure(e)")
    {
        CHECK(nested_t{vd::failure("outer")}.flatten() == res_t{vd::failure("outer")});
    }

    SECTION("lvalue flatten copies")
    {
        auto const nested = nested_t{res_t{1}};
        auto const flat = nested.flatten();
        CHECK(flat == res_t{1});
        CHECK(nested.value() == res_t{1});
    }
}

// flatten only exists for nested results with a matching failure type
namespace
{
template <class R>
constexpr bool has_flatten = requires(R const& r) { r.flatten(); };
} // namespace
static_assert(has_flatten<vd::result<int_res_t, int>>);
static_assert(!has_flatten<int_res_t>);
static_assert(!has_flatten<vd::result<vd::result<int, long>, int>>);
