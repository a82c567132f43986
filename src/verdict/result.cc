#include <verdict/native.hh>
#include <verdict/result.hh>
#include <verdict/to_string.hh>

#include <vector>

namespace
{
void append_site(std::string& s, vd::source_location const& site)
{
    s += site.file_name();
    s += ":";
    s += vd::to_string(site.line());
    s += " - ";
    s += vd::demangle_symbol(site.function_name());
}
} // namespace

struct vd::any_error::payload
{
    struct context_entry
    {
        std::string message;
        vd::source_location site;
    };

    std::string message;
    vd::source_location site;

    // oldest first
    std::vector<context_entry> context;

    payload(std::string msg, vd::source_location s) : message(vd::move(msg)), site(s) {}
};

vd::any_error::any_error(std::string message, vd::source_location site)
  : _payload(std::make_unique<payload>(vd::move(message), site))
{
}

// must be defined here because payload is only fwd declared in any_error
vd::any_error::any_error(any_error&& rhs) noexcept = default;
vd::any_error& vd::any_error::operator=(any_error&& rhs) noexcept = default;
vd::any_error::~any_error() = default;

void vd::any_error::impl_ensure_payload()
{
    if (_payload != nullptr)
        return;

    _payload = std::make_unique<payload>("<empty vd::any_error>", vd::source_location::current());
}

vd::any_error& vd::any_error::add_context(std::string message, vd::source_location site) &
{
    this->impl_ensure_payload();
    _payload->context.push_back({vd::move(message), site});
    return *this;
}

vd::any_error vd::any_error::with_context(std::string message, vd::source_location site) &&
{
    add_context(vd::move(message), site);
    return vd::move(*this);
}

bool vd::any_error::is_empty() const
{
    return _payload == nullptr;
}

std::string const& vd::any_error::message() const
{
    static std::string const empty_message;
    return _payload != nullptr ? _payload->message : empty_message;
}

vd::source_location vd::any_error::site() const
{
    return _payload != nullptr ? _payload->site : vd::source_location();
}

vd::isize vd::any_error::context_count() const
{
    return _payload != nullptr ? isize(_payload->context.size()) : 0;
}

std::string vd::any_error::to_string() const
{
    if (_payload == nullptr)
        return "error: <empty vd::any_error>\n";

    std::string result;

    result += "error: ";
    result += _payload->message;
    result += "\n";

    result += "  at ";
    append_site(result, _payload->site);
    result += "\n";

    // newest context first
    for (auto it = _payload->context.rbegin(); it != _payload->context.rend(); ++it)
    {
        result += "  context: ";
        result += it->message;
        result += " (at ";
        append_site(result, it->site);
        result += ")\n";
    }

    return result;
}
