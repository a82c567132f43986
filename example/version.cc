#include <verdict/result.hh>
#include <verdict/to_string.hh>

#include <iostream>
#include <string>

// Parses a header version number into an enum and consumes the outcome
// through the different extraction styles of vd::result.

namespace
{
enum class version
{
    one,
    two,
};

// found via ADL by vd::to_debug_string
std::string to_string(version v)
{
    switch (v)
    {
    case version::one:
        return "version::one";
    case version::two:
        return "version::two";
    }
    return "version::<invalid>";
}

vd::result<version, std::string> parse_version(int version_num)
{
    if (version_num == 1)
        return version::one;

    if (version_num == 2)
        return version::two;

    return vd::failure("invalid version");
}
} // namespace

int main()
{
    auto const parsed = parse_version(3);

    // check and unwrap...
    if (parsed.is_success())
        std::cout << "unwrap: working with version: " << to_string(parsed.unwrap()) << '\n';
    else
        std::cout << "unwrap: error parsing header: " << parsed.unwrap_error() << '\n';

    // or map both sides...
    std::cout << parse_version(1).map_or_else(
        [](std::string const& err) { return "map_or_else: error parsing header: " + err; },
        [](auto v) { return "map_or_else: working with version: " + to_string(v); })
              << '\n';

    // or fall back...
    std::cout << "unwrap_or: " << to_string(parsed.unwrap_or(version::one)) << '\n';

    // or print the whole thing
    std::cout << "to_string: " << parsed.to_string() << '\n';

    // unwrapping via ~
    auto const a = vd::result<int, std::string>(1);
    auto const b = vd::result<int, std::string>(2);
    std::cout << "~ operator: " << vd::to_string(~a + ~b) << '\n';

    // misuse is reported as a typed error
    try
    {
        auto const v = parse_version(7).expect("header must carry a known version");
        std::cout << "unreachable: " << to_string(v) << '\n';
    }
    catch (vd::unwrap_on_failure<std::string> const& e)
    {
        std::cout << "expect: " << e.what() << '\n';
    }

    return 0;
}
