#pragma once

#include <type-map/source_location.hh>

#include <functional>
#include <utility>
#include <string>

namespace tmap::impl
{
/// Everything known about a failed TMAP_ASSERT / TMAP_ASSERT_ALWAYS.
struct assertion_info
{
    std::string expression;
    std::string message;
    tmap::source_location location;

    /// One-line report, e.g.
    ///   type-map assertion failed: `_ops->type == type_id_of<T>()` (any_box holds a different type) at any_box.hh:120 in ...
    [[nodiscard]] std::string to_report() const;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Handlers form a stack; the topmost one receives every failure until it is popped.
/// Without any handler the report goes to std::cerr.
/// A handler that returns does not prevent the abort. Throwing is the only way to recover,
/// which is what the tests do to check that misuse is detected.
/// The stack is global and not synchronized.
void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace tmap::impl
