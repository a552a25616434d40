#include <vieweval/app/config.hpp>
#include <vieweval/app/evaluator.hpp>
#include <vieweval/app/json_io.hpp>
#include <vieweval/core/frame.hpp>
#include <vieweval/core/report.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace va = vieweval::app;
namespace vc = vieweval::core;

namespace {

constexpr const char* kShopPage = R"(<!DOCTYPE html>
<html>
<head>
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <style>
    img { max-width: 100%; height: auto; }
    .card { padding: 1rem; width: 90%; }
  </style>
</head>
<body>
  <nav id="top"><a id="home" href="/">Home</a></nav>
  <img id="hero" src="hero.png">
  <p id="intro">Welcome to the shop</p>
  <button id="buy">Buy now</button>
</body>
</html>)";

vc::ComputedStyle text_style(double font_px = 16.0, double line_px = 24.0) {
  vc::ComputedStyle s;
  s.display = "block";
  s.visibility = "visible";
  s.font_size_px = font_px;
  s.line_height_px = line_px;
  return s;
}

vc::RenderedViewport render(const std::string& name, std::uint32_t width) {
  const double w = static_cast<double>(width);
  vc::RenderedViewport r;
  r.breakpoint = {name, width};
  r.page_width = w;
  r.elements["body"] = {{0, 0, w, 800}, text_style()};
  r.elements["nav#top"] = {{0, 0, w, 56}, text_style()};
  r.elements["a#home"] = {{8, 4, 80, 48}, text_style()};
  r.elements["img#hero"] = {{0, 56, w, w * 0.5}, text_style()};
  r.elements["p#intro"] = {{8, 70 + w * 0.5, w - 16, 48}, text_style()};
  r.elements["button#buy"] = {{8, 130 + w * 0.5, 120, 48}, text_style()};
  return r;
}

vc::Frame solid(std::uint32_t w, std::uint32_t h, std::uint8_t value) {
  std::vector<std::byte> buf(vc::Frame::min_bytes(w, h, vc::PixelFormat::BGR8), std::byte{value});
  return vc::Frame(w, h, vc::PixelFormat::BGR8, std::move(buf));
}

va::EvaluationRequest shop_request() {
  va::EvaluationRequest request;
  request.name = "shop.html";
  request.html = kShopPage;
  const std::vector<vc::Breakpoint> breakpoints = {{"mobile", 375}, {"desktop", 1280}};
  for (const auto& b : breakpoints) {
    vc::ViewportInput input;
    input.rendered = render(b.name, b.width);
    request.viewports.push_back(std::move(input));
  }
  return request;
}

const vc::RuleResult* find_rule(const std::vector<vc::RuleResult>& rules, std::string_view id) {
  const auto it = std::find_if(rules.begin(), rules.end(),
                               [id](const vc::RuleResult& r) { return r.rule_id == id; });
  return it == rules.end() ? nullptr : &*it;
}

}  // namespace

TEST(FullEvaluation, ResponsivePagePassesEveryCheck) {
  const va::Evaluator evaluator;
  auto report = evaluator.evaluate(shop_request());
  ASSERT_TRUE(report.has_value());

  EXPECT_EQ(report->document, "shop.html");
  ASSERT_EQ(report->rules.size(), 4u);
  for (const auto& r : report->rules) EXPECT_TRUE(r.passed) << r.rule_id;

  ASSERT_EQ(report->viewports.size(), 2u);
  const auto& mobile = report->viewports[0];
  const auto& desktop = report->viewports[1];
  EXPECT_EQ(mobile.breakpoint.name, "mobile");
  EXPECT_EQ(desktop.breakpoint.name, "desktop");

  // Tap targets are only checked at the narrowest viewport.
  EXPECT_NE(find_rule(mobile.rules, "tap_target"), nullptr);
  EXPECT_EQ(find_rule(desktop.rules, "tap_target"), nullptr);
  EXPECT_NE(find_rule(desktop.rules, "horizontal_overflow"), nullptr);

  ASSERT_TRUE(mobile.snapshot.has_value());
  EXPECT_EQ(mobile.snapshot->components.size(), 5u);
  EXPECT_EQ(mobile.snapshot->count(vc::ComponentCategory::TextBlock), 2u);
  EXPECT_FALSE(mobile.layout.has_value());
  EXPECT_FALSE(mobile.pixel_diff.has_value());
  EXPECT_TRUE(mobile.failures.empty());
  EXPECT_TRUE(report->passed());
}

TEST(FullEvaluation, ReferenceLayoutAndScreenshotsAreCompared) {
  va::EvaluationConfig config = va::default_config();
  config.min_layout_similarity = 0.9;
  config.max_pixel_difference_percent = 5.0;
  const va::Evaluator evaluator(config);

  auto request = shop_request();
  for (auto& input : request.viewports) {
    auto reference = evaluator.extract_layout(kShopPage, input.rendered);
    ASSERT_TRUE(reference.has_value());
    input.reference = std::move(*reference);
    input.screenshot = solid(64, 48, 200);
    input.ground_truth = solid(64, 48, 200);
  }

  auto report = evaluator.evaluate(request);
  ASSERT_TRUE(report.has_value());
  for (const auto& v : report->viewports) {
    ASSERT_TRUE(v.layout.has_value()) << v.breakpoint.name;
    EXPECT_NEAR(v.layout->score, 1.0, 1e-12);
    ASSERT_TRUE(v.pixel_diff.has_value());
    EXPECT_DOUBLE_EQ(v.pixel_diff->percentage_difference, 0.0);
    const auto* layout_rule = find_rule(v.rules, "layout_similarity");
    ASSERT_NE(layout_rule, nullptr);
    EXPECT_TRUE(layout_rule->passed);
    const auto* pixel_rule = find_rule(v.rules, "pixel_difference");
    ASSERT_NE(pixel_rule, nullptr);
    EXPECT_TRUE(pixel_rule->passed);
  }
  EXPECT_TRUE(report->passed());

  const auto j = va::to_json(*report);
  EXPECT_TRUE(j["passed"].get<bool>());
  EXPECT_EQ(j["viewports"].size(), 2u);
  EXPECT_TRUE(j["viewports"][0].contains("layout"));
}

TEST(FullEvaluation, LayoutDriftLowersSimilarity) {
  va::EvaluationConfig config = va::default_config();
  config.min_layout_similarity = 0.9;
  const va::Evaluator evaluator(config);

  auto request = shop_request();
  auto& mobile = request.viewports[0];
  auto reference = evaluator.extract_layout(kShopPage, mobile.rendered);
  ASSERT_TRUE(reference.has_value());
  // The hero image sits somewhere else in the reference design.
  for (auto& c : reference->components) {
    if (c.category == vc::ComponentCategory::Image) c.bbox.x += 300.0;
  }
  mobile.reference = std::move(*reference);

  auto report = evaluator.evaluate(request);
  ASSERT_TRUE(report.has_value());
  const auto& v = report->viewports[0];
  ASSERT_TRUE(v.layout.has_value());
  EXPECT_LT(v.layout->score, 0.9);
  const auto* image = v.layout->find(vc::ComponentCategory::Image);
  ASSERT_NE(image, nullptr);
  EXPECT_LT(image->score, 1.0);
  EXPECT_FALSE(find_rule(v.rules, "layout_similarity")->passed);
  EXPECT_FALSE(report->passed());
  EXPECT_TRUE(report->viewports[1].passed());
}

TEST(FullEvaluation, ViolationsAndStageFailuresAreReported) {
  const va::Evaluator evaluator;
  auto request = shop_request();
  auto& mobile = request.viewports[0];
  mobile.rendered.elements["p#intro"].style = text_style(10.0, 12.0);
  mobile.rendered.elements["button#buy"].bbox.h = 30.0;
  mobile.screenshot = solid(64, 48, 0);
  mobile.ground_truth = solid(32, 48, 0);

  auto report = evaluator.evaluate(request);
  ASSERT_TRUE(report.has_value());
  const auto& v = report->viewports[0];

  const auto* font = find_rule(v.rules, "font_size");
  ASSERT_NE(font, nullptr);
  EXPECT_FALSE(font->passed);
  EXPECT_EQ(font->affected_elements, (std::vector<std::string>{"p#intro"}));

  const auto* tap = find_rule(v.rules, "tap_target");
  ASSERT_NE(tap, nullptr);
  EXPECT_FALSE(tap->passed);
  EXPECT_EQ(tap->affected_elements, (std::vector<std::string>{"button#buy"}));

  ASSERT_EQ(v.failures.size(), 1u);
  EXPECT_EQ(v.failures[0].stage, "pixel_diff");
  EXPECT_EQ(v.failures[0].error, vc::EvalError::DimensionMismatchError);
  EXPECT_TRUE(v.snapshot.has_value());

  EXPECT_FALSE(report->passed());
  EXPECT_TRUE(report->viewports[1].passed());
}

TEST(FullEvaluation, UnstyledRenderDumpFailsRuleCheckOnly) {
  const va::Evaluator evaluator;
  auto request = shop_request();
  for (auto& [id, geometry] : request.viewports[1].rendered.elements) geometry.style.reset();

  auto report = evaluator.evaluate(request);
  ASSERT_TRUE(report.has_value());
  const auto& desktop = report->viewports[1];
  ASSERT_EQ(desktop.failures.size(), 1u);
  EXPECT_EQ(desktop.failures[0].stage, "rule_check");
  EXPECT_EQ(desktop.failures[0].error, vc::EvalError::ValidatorInputError);
  ASSERT_TRUE(desktop.snapshot.has_value());
  EXPECT_EQ(desktop.snapshot->components.size(), 5u);
  EXPECT_TRUE(report->viewports[0].passed());
}

TEST(FullEvaluation, UnstyledStrictestViewportStillChecksTapTargets) {
  const va::Evaluator evaluator;
  auto request = shop_request();
  auto& mobile_input = request.viewports[0].rendered;
  for (auto& [id, geometry] : mobile_input.elements) geometry.style.reset();
  mobile_input.elements["button#buy"].bbox = {8, 317.5, 20, 20};

  auto report = evaluator.evaluate(request);
  ASSERT_TRUE(report.has_value());
  const auto& mobile = report->viewports[0];
  ASSERT_EQ(mobile.failures.size(), 1u);
  EXPECT_EQ(mobile.failures[0].error, vc::EvalError::ValidatorInputError);
  const auto* tap = find_rule(mobile.rules, "tap_target");
  ASSERT_NE(tap, nullptr);
  EXPECT_FALSE(tap->passed);
  EXPECT_EQ(find_rule(mobile.rules, "font_size"), nullptr);
}

TEST(FullEvaluation, StrictestViewportWithoutWidths) {
  const va::Evaluator evaluator;

  // Configured breakpoint names supply the missing widths.
  auto named = shop_request();
  for (auto& input : named.viewports) input.rendered.breakpoint.width = 0;
  auto by_config = evaluator.evaluate(named);
  ASSERT_TRUE(by_config.has_value());
  EXPECT_NE(find_rule(by_config->viewports[0].rules, "tap_target"), nullptr);
  EXPECT_EQ(find_rule(by_config->viewports[1].rules, "tap_target"), nullptr);

  // Unknown names fall back to the first viewport.
  auto unnamed = shop_request();
  unnamed.viewports[0].rendered.breakpoint = {"wide", 0};
  unnamed.viewports[1].rendered.breakpoint = {"phone", 0};
  auto by_order = evaluator.evaluate(unnamed);
  ASSERT_TRUE(by_order.has_value());
  EXPECT_NE(find_rule(by_order->viewports[0].rules, "tap_target"), nullptr);
  EXPECT_EQ(find_rule(by_order->viewports[1].rules, "tap_target"), nullptr);
}

TEST(FullEvaluation, DocumentLevelErrors) {
  const va::Evaluator evaluator;
  auto request = shop_request();
  request.html.clear();
  auto empty = evaluator.evaluate(request);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), vc::EvalError::ExtractionError);

  va::EvaluationConfig config = va::default_config();
  config.thresholds.min_font_size_px = 0.0;
  auto invalid = va::Evaluator(config).evaluate(shop_request());
  ASSERT_FALSE(invalid.has_value());
  EXPECT_EQ(invalid.error(), vc::EvalError::InvalidConfig);
}

TEST(FullEvaluation, FixedWidthPageFailsDocumentRules) {
  const va::Evaluator evaluator;
  auto request = shop_request();
  request.html = R"(<html><head><meta name="viewport" content="width=1024"></head><body>
      <div id="wrap" style="width: 1024px; margin: 0 20px">
        <img id="hero" src="hero.png" width="1024" height="400">
        <p id="intro" style="font-size: 10px">Welcome</p>
      </div></body></html>)";
  for (auto& input : request.viewports) {
    input.rendered.page_width = 1064.0;
  }

  auto report = evaluator.evaluate(request);
  ASSERT_TRUE(report.has_value());
  for (const auto& r : report->rules) EXPECT_FALSE(r.passed) << r.rule_id;
  const auto* overflow = find_rule(report->viewports[0].rules, "horizontal_overflow");
  ASSERT_NE(overflow, nullptr);
  EXPECT_FALSE(overflow->passed);
  EXPECT_FALSE(report->passed());
}
