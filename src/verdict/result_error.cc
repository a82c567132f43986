#include "result_error.hh"

vd::result_access_error::result_access_error(std::string message, std::string payload_string)
  : _message(vd::move(message)), _payload_string(vd::move(payload_string))
{
    // multi-line reports (vd::any_error) end in a newline, what() does not
    while (!_payload_string.empty() && _payload_string.back() == '\n')
        _payload_string.pop_back();

    _what = _message;
    _what += ": ";
    _what += _payload_string;
}

char const* vd::result_access_error::what() const noexcept
{
    return _what.c_str();
}

vd::unsupported_default_type::unsupported_default_type(std::string type_name) : _type_name(vd::move(type_name))
{
    _what = "type ";
    _what += _type_name;
    _what += " has no canonical default, use unwrap_or or unwrap_or_else";
}

char const* vd::unsupported_default_type::what() const noexcept
{
    return _what.c_str();
}
