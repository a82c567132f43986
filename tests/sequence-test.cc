#include <verdict/optional.hh>
#include <verdict/sequence.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

TEST("sequence - from pointee")
{
    SECTION("non-null pointer yields one element")
    {
        int const v = 7;
        auto seq = vd::make_sequence_from_pointee(&v);

        CHECK(!seq.is_empty());
        CHECK(seq.count() == 1);
        CHECK(seq.any([](int x) { return x == 7; }));
        CHECK(seq.all([](int x) { return x > 0; }));

        // borrowed: elements refer to the pointee
        for (auto const& e : seq)
            CHECK(&e == &v);
    }

    SECTION("null pointer yields nothing")
    {
        auto seq = vd::make_sequence_from_pointee<int>(nullptr);

        CHECK(seq.is_empty());
        CHECK(seq.count() == 0);
        CHECK(!seq.any([](int) { return true; }));
        CHECK(seq.all([](int) { return false; }));
        CHECK(!seq.index_of([](int) { return true; }).has_value());
    }
}

TEST("sequence - from optional")
{
    SECTION("engaged optional")
    {
        auto seq = vd::make_sequence_from_optional(vd::optional<std::string>{"abc"});
        static_assert(decltype(seq)::has_stable_elements);

        CHECK(seq.count() == 1);
        CHECK(seq.to_container<std::vector<std::string>>() == std::vector<std::string>{"abc"});
    }

    SECTION("empty optional")
    {
        auto seq = vd::make_sequence_from_optional(vd::optional<std::string>{});
        CHECK(seq.is_empty());
        CHECK(seq.to_container<std::vector<std::string>>().empty());
    }
}

TEST("sequence - reductions")
{
    auto seq = vd::make_sequence_from_optional(vd::optional<int>{5});

    SECTION("count_if")
    {
        CHECK(seq.count_if([](int x) { return x > 3; }) == 1);
        CHECK(seq.count_if([](int x) { return x > 7; }) == 0);
    }

    SECTION("index_of")
    {
        CHECK(seq.index_of([](int x) { return x == 5; }) == vd::isize(0));
        CHECK(!seq.index_of([](int x) { return x == 6; }).has_value());
    }

    SECTION("accumulate")
    {
        auto const sum = seq.accumulate(10, [](int& acc, int x) { acc += x; });
        CHECK(sum == 15);
    }

    SECTION("each with and without index")
    {
        std::vector<int> seen;
        seq.each([&](int x) { seen.push_back(x); });
        seq.each([&](vd::isize idx, int x) { seen.push_back(int(idx) + x * 10); });

        REQUIRE(seen.size() == 2);
        CHECK(seen[0] == 5);
        CHECK(seen[1] == 50);
    }

    SECTION("push_to appends")
    {
        std::vector<int> dst = {1};
        seq.push_to(dst);
        CHECK(dst == std::vector<int>({1, 5}));
    }
}

TEST("sequence - try_fold")
{
    auto empty = vd::make_sequence_from_optional(vd::optional<int>{});
    auto single = vd::make_sequence_from_optional(vd::optional<int>{1});

    CHECK((empty.try_fold([](int) { return true; }) == vd::sequence_fold_result::empty));
    CHECK((single.try_fold([](int) { return true; }) == vd::sequence_fold_result::stopped));
    CHECK((single.try_fold([](int) { return false; }) == vd::sequence_fold_result::completed));

    // void steps never stop
    int calls = 0;
    CHECK((single.try_fold([&](int) { ++calls; }) == vd::sequence_fold_result::completed));
    CHECK(calls == 1);
}
