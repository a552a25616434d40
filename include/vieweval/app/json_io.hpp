#pragma once

#include <vieweval/core/component.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/rendered_viewport.hpp>
#include <vieweval/core/report.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vieweval::app {

/// Whole file as text. LoadFailed when it cannot be read.
[[nodiscard]] std::expected<std::string, core::EvalError> read_text_file(const std::string& path);

/// Parse a render dump. A missing "width" is taken from the matching entry of
/// known_breakpoints. LoadFailed for malformed JSON; ExtractionError when the dump names
/// no viewport or an element has no id or box.
[[nodiscard]] std::expected<core::RenderedViewport, core::EvalError> parse_rendered_viewport(
    std::string_view json_text,
    const std::vector<core::Breakpoint>& known_breakpoints = {});

[[nodiscard]] std::expected<core::RenderedViewport, core::EvalError> load_rendered_viewport(
    const std::string& path,
    const std::vector<core::Breakpoint>& known_breakpoints = {});

/// Parse a saved layout snapshot. ExtractionError for unknown categories.
[[nodiscard]] std::expected<core::LayoutSnapshot, core::EvalError> parse_layout_snapshot(
    std::string_view json_text);

[[nodiscard]] std::expected<core::LayoutSnapshot, core::EvalError> load_layout_snapshot(
    const std::string& path);

[[nodiscard]] nlohmann::json to_json(const core::LayoutSnapshot& snapshot);
[[nodiscard]] nlohmann::json to_json(const core::RuleResult& rule);
[[nodiscard]] nlohmann::json to_json(const core::ViewportReport& report);
[[nodiscard]] nlohmann::json to_json(const core::EvaluationReport& report);

/// Pretty-printed (2-space indent). LoadFailed when the file cannot be written.
[[nodiscard]] std::expected<void, core::EvalError> save_json(const nlohmann::json& value,
                                                             const std::string& path);

}  // namespace vieweval::app
