//! # Generated Function Lookup
//!
//! Declarations of the lookup functions every generated module defines. A
//! dispatcher resolves a tag-table expression by its original text and gets
//! back the compiled function, or nullptr when the text was never compiled.

#ifndef EXPRC_RT_DISPATCH_HPP
#define EXPRC_RT_DISPATCH_HPP

#include "exprc_rt/runtime.hpp"

#include <string>
#include <string_view>

namespace exprc::generated {

using ValueTransformFn = rt::ValueResult (*)(rt::Value);
using DisplayFormatFn = std::string (*)(rt::Value);
using BooleanGateFn = bool (*)(rt::Value, const rt::EvalContext&);

[[nodiscard]] auto find_value_transform(std::string_view original_text) -> ValueTransformFn;
[[nodiscard]] auto find_display_format(std::string_view original_text) -> DisplayFormatFn;
[[nodiscard]] auto find_boolean_gate(std::string_view original_text) -> BooleanGateFn;

} // namespace exprc::generated

#endif // EXPRC_RT_DISPATCH_HPP
