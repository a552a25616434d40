/**
 * vieweval-cli: evaluate a rendered HTML document for responsiveness; print a pass/fail summary.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/vieweval_cli --html page.html --render mobile=mobile.json [--render tablet=tablet.json ...]
 * Exit code: 0 passed, 2 evaluated but failed, 1 usage or input error.
 */

#include <vieweval/app/config.hpp>
#include <vieweval/app/evaluator.hpp>
#include <vieweval/app/json_io.hpp>
#include <vieweval/core/error.hpp>
#include <vieweval/core/logger.hpp>
#include <vieweval/core/report.hpp>
#include <vieweval/core/viewport_input.hpp>
#include <vieweval/vision/layout_annotator.hpp>
#include <vieweval/vision/load_image.hpp>

#include <expected>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitError = 1;
constexpr int kExitFailed = 2;

/// "<viewport>=<path>" argument.
struct ViewportArg {
  std::string viewport;
  std::string path;
};

std::optional<ViewportArg> parse_viewport_arg(const std::string &arg) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) return std::nullopt;
  return ViewportArg{arg.substr(0, eq), arg.substr(eq + 1)};
}

std::string measured_str(const vieweval::core::MeasuredValue &v) {
  std::ostringstream out;
  std::visit([&out](const auto &x) { out << x; }, v);
  return out.str();
}

void print_usage() {
  std::cout
      << "Usage: vieweval_cli --html <file> --render <viewport>=<dump.json> [...] [options]\n"
      << "  --config <path>                          Evaluation config (key=value file)\n"
      << "  --render <viewport>=<dump.json>          Render dump for one breakpoint (repeatable)\n"
      << "  --reference-layout <viewport>=<json>     Saved reference snapshot (repeatable)\n"
      << "  --reference-html <file>                  Reference document ...\n"
      << "  --reference-render <viewport>=<json>     ... and its render dumps (repeatable)\n"
      << "  --screenshot <viewport>=<png>            Captured screenshot (repeatable)\n"
      << "  --ground-truth <viewport>=<png>          Ground-truth screenshot (repeatable)\n"
      << "  --report <path>                          Write the JSON report\n"
      << "  --annotate-dir <dir>                     Write screenshots with component boxes\n"
      << "  --log-level <level>                      trace | debug | info | warn | error | off\n";
}

void print_rule(std::ostream &out, const vieweval::core::RuleResult &r) {
  out << "  " << (r.passed ? "PASS" : "FAIL") << " " << r.rule_id;
  if (!r.viewport.empty()) out << " [" << r.viewport << "]";
  out << " measured=" << measured_str(r.measured_value)
      << " threshold=" << measured_str(r.threshold) << "\n";
  for (std::size_t i = 0; i < r.affected_elements.size(); ++i) {
    out << "      " << r.affected_elements[i];
    if (i < r.details.size()) out << ": " << r.details[i];
    out << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string html_path;
  std::string reference_html_path;
  std::string report_path;
  std::string annotate_dir;
  std::string log_level;
  std::vector<ViewportArg> renders;
  std::map<std::string, std::string> reference_layouts;
  std::map<std::string, std::string> reference_renders;
  std::map<std::string, std::string> screenshots;
  std::map<std::string, std::string> ground_truths;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    auto viewport_value = [&](const char *flag) -> std::optional<ViewportArg> {
      auto v = parse_viewport_arg(argv[++i]);
      if (!v) std::cerr << flag << " expects <viewport>=<path>\n";
      return v;
    };

    if (arg == "--config" && has_value) {
      config_path = argv[++i];
    } else if (arg == "--html" && has_value) {
      html_path = argv[++i];
    } else if (arg == "--reference-html" && has_value) {
      reference_html_path = argv[++i];
    } else if (arg == "--report" && has_value) {
      report_path = argv[++i];
    } else if (arg == "--annotate-dir" && has_value) {
      annotate_dir = argv[++i];
    } else if (arg == "--log-level" && has_value) {
      log_level = argv[++i];
    } else if (arg == "--render" && has_value) {
      auto v = viewport_value("--render");
      if (!v) return kExitError;
      renders.push_back(std::move(*v));
    } else if (arg == "--reference-layout" && has_value) {
      auto v = viewport_value("--reference-layout");
      if (!v) return kExitError;
      reference_layouts[v->viewport] = v->path;
    } else if (arg == "--reference-render" && has_value) {
      auto v = viewport_value("--reference-render");
      if (!v) return kExitError;
      reference_renders[v->viewport] = v->path;
    } else if (arg == "--screenshot" && has_value) {
      auto v = viewport_value("--screenshot");
      if (!v) return kExitError;
      screenshots[v->viewport] = v->path;
    } else if (arg == "--ground-truth" && has_value) {
      auto v = viewport_value("--ground-truth");
      if (!v) return kExitError;
      ground_truths[v->viewport] = v->path;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return kExitPassed;
    } else {
      std::cerr << "Unknown or incomplete argument: " << arg << "\n";
      print_usage();
      return kExitError;
    }
  }

  if (html_path.empty() || renders.empty()) {
    std::cerr << "--html and at least one --render are required\n";
    print_usage();
    return kExitError;
  }

  std::expected<vieweval::app::EvaluationConfig, vieweval::core::EvalError> cfg =
      vieweval::app::default_config();
  if (!config_path.empty()) cfg = vieweval::app::load_config(config_path);
  if (!cfg) {
    std::cerr << "Config error: " << vieweval::core::to_string(cfg.error()) << "\n";
    return kExitError;
  }
  if (!log_level.empty()) cfg->log_level = log_level;
  if (!vieweval::set_log_level(cfg->log_level)) {
    std::cerr << "Unknown log level: " << cfg->log_level << "\n";
    return kExitError;
  }

  const vieweval::app::Evaluator evaluator(*cfg);

  auto html = vieweval::app::read_text_file(html_path);
  if (!html) {
    std::cerr << "Failed to read HTML: " << html_path << "\n";
    return kExitError;
  }

  std::optional<std::string> reference_html;
  if (!reference_html_path.empty()) {
    auto text = vieweval::app::read_text_file(reference_html_path);
    if (!text) {
      std::cerr << "Failed to read reference HTML: " << reference_html_path << "\n";
      return kExitError;
    }
    reference_html = std::move(*text);
  }

  vieweval::app::EvaluationRequest request;
  request.name = std::filesystem::path(html_path).filename().string();
  request.html = std::move(*html);

  for (const auto &r : renders) {
    vieweval::core::ViewportInput input;
    auto rendered = vieweval::app::load_rendered_viewport(r.path, cfg->breakpoints);
    if (!rendered) {
      std::cerr << "Failed to load render dump " << r.path << ": "
                << vieweval::core::to_string(rendered.error()) << "\n";
      return kExitError;
    }
    if (rendered->breakpoint.name != r.viewport) {
      std::cerr << r.path << " is a '" << rendered->breakpoint.name << "' dump, not '"
                << r.viewport << "'\n";
      return kExitError;
    }
    input.rendered = std::move(*rendered);

    if (auto it = reference_layouts.find(r.viewport); it != reference_layouts.end()) {
      auto snapshot = vieweval::app::load_layout_snapshot(it->second);
      if (!snapshot) {
        std::cerr << "Failed to load reference layout " << it->second << ": "
                  << vieweval::core::to_string(snapshot.error()) << "\n";
        return kExitError;
      }
      input.reference = std::move(*snapshot);
    } else if (auto rit = reference_renders.find(r.viewport);
               reference_html && rit != reference_renders.end()) {
      auto reference_rendered = vieweval::app::load_rendered_viewport(rit->second, cfg->breakpoints);
      if (!reference_rendered) {
        std::cerr << "Failed to load reference render dump " << rit->second << "\n";
        return kExitError;
      }
      auto snapshot = evaluator.extract_layout(*reference_html, *reference_rendered);
      if (!snapshot) {
        std::cerr << "Reference extraction failed: "
                  << vieweval::core::to_string(snapshot.error()) << "\n";
        return kExitError;
      }
      input.reference = std::move(*snapshot);
    }

    if (auto it = screenshots.find(r.viewport); it != screenshots.end()) {
      input.screenshot = vieweval::vision::load_frame_from_image(it->second);
      if (!input.screenshot) {
        std::cerr << "Failed to load image: " << it->second << "\n";
        return kExitError;
      }
    }
    if (auto it = ground_truths.find(r.viewport); it != ground_truths.end()) {
      input.ground_truth = vieweval::vision::load_frame_from_image(it->second);
      if (!input.ground_truth) {
        std::cerr << "Failed to load image: " << it->second << "\n";
        return kExitError;
      }
    }
    request.viewports.push_back(std::move(input));
  }

  auto report = evaluator.evaluate(request);
  if (!report) {
    std::cerr << "Evaluation error: " << vieweval::core::to_string(report.error()) << "\n";
    return kExitError;
  }

  std::ostringstream out;
  out << "document=" << report->document << " " << (report->passed() ? "PASSED" : "FAILED")
      << "\n";
  for (const auto &r : report->rules) print_rule(out, r);
  for (const auto &v : report->viewports) {
    out << "viewport=" << v.breakpoint.name << " width=" << v.breakpoint.width;
    if (v.snapshot) out << " components=" << v.snapshot->components.size();
    if (v.layout) out << " lss=" << v.layout->score;
    if (v.pixel_diff) out << " pixel_diff=" << v.pixel_diff->percentage_difference << "%";
    out << "\n";
    for (const auto &r : v.rules) print_rule(out, r);
    for (const auto &f : v.failures) {
      out << "  ERROR " << f.stage << ": " << vieweval::core::to_string(f.error) << "\n";
    }
  }
  std::cout << out.str();

  if (!report_path.empty()) {
    if (!vieweval::app::save_json(vieweval::app::to_json(*report), report_path)) {
      std::cerr << "Failed to write report: " << report_path << "\n";
      return kExitError;
    }
  }

  if (!annotate_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(annotate_dir, ec);
    if (ec) {
      std::cerr << "Cannot create " << annotate_dir << ": " << ec.message() << "\n";
      return kExitError;
    }
    const std::string stem = std::filesystem::path(html_path).stem().string();
    for (std::size_t i = 0; i < report->viewports.size(); ++i) {
      const auto &v = report->viewports[i];
      const auto &input = request.viewports[i];
      if (!v.snapshot || !input.screenshot) continue;
      auto annotated = vieweval::vision::annotate_layout(*input.screenshot, *v.snapshot);
      const auto path =
          (std::filesystem::path(annotate_dir) / (stem + "_" + v.breakpoint.name + ".png")).string();
      if (!annotated || !vieweval::vision::save_frame_to_image(*annotated, path)) {
        std::cerr << "Warning: could not write " << path << "\n";
      }
    }
  }

  return report->passed() ? kExitPassed : kExitFailed;
}
