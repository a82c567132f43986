#pragma once

#include <verdict/source_location.hh>

#include <functional>
#include <string>

// =========================================================================================================
// Assertion handler stack
// =========================================================================================================
//
// A failing VD_ASSERT hands an assertion_info to the topmost handler and aborts afterwards.
// Handlers can throw to unwind instead, which is how tests observe wrong-variant access:
//
//   auto handler = vd::impl::scoped_assertion_handler([](vd::impl::assertion_info const& info) {
//       throw my_assertion_exception{info.message};
//   });
//   (void)res.value(); // throws if res is a failure
//
// The stack is global and not synchronized.

namespace vd::impl
{
struct assertion_info
{
    std::string expression;
    std::string message;
    vd::source_location location;

    /// multi-line report as printed by the default handler
    [[nodiscard]] std::string to_string() const;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// no-op if no handler is installed
void pop_assertion_handler();

/// pushes on construction, pops on destruction
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace vd::impl
