#include <shelfcheck/app/explainer.hpp>
#include <shelfcheck/core/decision.hpp>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace shelfcheck::app {

namespace {

std::string percent(double fraction) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(0) << fraction * 100.0 << '%';
  return os.str();
}

std::string pounds(std::optional<double> value) {
  if (!value) return "None";
  std::ostringstream os;
  os << "\xC2\xA3" << std::fixed << std::setprecision(2) << *value;
  return os.str();
}

std::string trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

std::string_view store_outcome(core::OverallVerdict verdict) {
  switch (verdict) {
    case core::OverallVerdict::Ready:
      return "This product can go through automatically.";
    case core::OverallVerdict::WarningsPendingReview:
      return "This product has been submitted and head office will review it.";
    case core::OverallVerdict::RequiresCorrection:
      return "This product needs fixing before it can be submitted.";
  }
  return "";
}

void field_line(std::ostringstream& os, std::string_view label, const core::FieldDecision& d) {
  os << "- " << label << ": **" << core::to_string(d.level) << "**. " << d.message;
  if (d.predicted) {
    os << " Typical HO value: '" << *d.predicted << "'";
    if (d.confidence) os << " (confidence " << percent(*d.confidence) << ")";
    os << '.';
  }
  os << '\n';
}

}  // namespace

std::expected<std::string, core::Error> TemplateExplainer::explain(
    const core::ProductSubmission& submission,
    const core::ValidationResult& result) {
  std::ostringstream os;
  os << "### For the store\n";
  os << "- " << store_outcome(result.overall) << '\n';

  bool any_issue = false;
  const std::pair<std::string_view, const core::FieldDecision*> fields[] = {
      {"Category", &result.category},
      {"Price", &result.price},
      {"Age verification", &result.age_verification},
  };
  for (const auto& [label, d] : fields) {
    if (d->level == core::DecisionLevel::Pass) continue;
    any_issue = true;
    os << "- " << label << ": " << d->message << '\n';
  }
  if (!any_issue) os << "- No changes are needed.\n";

  os << "\n### For head office\n";
  os << "- Overall decision for '" << submission.name << "': " << core::overall_label(result.overall)
     << '\n';
  field_line(os, "Category check", result.category);
  os << "- Price check: **" << core::to_string(result.price.level) << "**. " << result.price.message;
  if (result.price_band.median) {
    os << " Typical HO price " << pounds(result.price_band.median) << " (band "
       << pounds(result.price_band.lower) << " - " << pounds(result.price_band.upper) << ").";
  }
  os << '\n';
  field_line(os, "Age verification check", result.age_verification);
  return os.str();
}

void StubExplainer::set_text(std::string text) {
  text_ = std::move(text);
  error_.reset();
}

void StubExplainer::set_error(core::Error error) {
  error_ = std::move(error);
  text_.reset();
}

std::expected<std::string, core::Error> StubExplainer::explain(
    const core::ProductSubmission& /*submission*/,
    const core::ValidationResult& /*result*/) {
  ++calls_;
  if (error_) return std::unexpected(*error_);
  return text_.value_or(std::string{});
}

std::string build_explanation_prompt(const core::ProductSubmission& submission,
                                     const core::ValidationResult& result) {
  auto predicted = [](const core::FieldDecision& d) { return d.predicted.value_or("None"); };
  auto confidence = [](const core::FieldDecision& d) { return percent(d.confidence.value_or(0.0)); };

  std::ostringstream os;
  os << "You are helping a supermarket chain explain product validation results.\n\n"
     << "The rules engine has ALREADY decided everything. Your job is ONLY to explain\n"
     << "those decisions in clear language. Do not invent new rules, and do not change\n"
     << "the outcome.\n\n"
     << "Submission:\n"
     << "- Product name: " << submission.name << '\n'
     << "- Store category: " << submission.category << '\n'
     << "- Store price: " << pounds(submission.price) << '\n'
     << "- Store age verification: " << submission.age_flag << "\n\n"
     << "Validation result (from rules engine):\n"
     << "- Overall decision: " << core::overall_label(result.overall) << "\n\n"
     << "Category check:\n"
     << "- Decision: " << core::to_string(result.category.level) << '\n'
     << "- Message: " << result.category.message << '\n'
     << "- Predicted HO category: " << predicted(result.category) << '\n'
     << "- Confidence: " << confidence(result.category) << "\n\n"
     << "Price check:\n"
     << "- Decision: " << core::to_string(result.price.level) << '\n'
     << "- Message: " << result.price.message << '\n'
     << "- Typical HO median price: " << pounds(result.price_band.median) << '\n'
     << "- Band lower: " << pounds(result.price_band.lower) << '\n'
     << "- Band upper: " << pounds(result.price_band.upper) << "\n\n"
     << "Age verification check:\n"
     << "- Decision: " << core::to_string(result.age_verification.level) << '\n'
     << "- Message: " << result.age_verification.message << '\n'
     << "- Typical HO setting: " << predicted(result.age_verification) << '\n'
     << "- Confidence: " << confidence(result.age_verification) << "\n\n"
     << "Write your answer in markdown with exactly two sections:\n\n"
     << "### For the store\n"
     << "- 2-4 short bullet points: whether the product goes through automatically, needs\n"
     << "  fixing, or will be reviewed; what (if anything) the store must change.\n\n"
     << "### For head office\n"
     << "- 2-4 short bullet points: why the engine reached this decision; which checks\n"
     << "  mattered most; anything to double-check if there are warnings.\n\n"
     << "Use UK English. Be concise. Do not include any other headings or sections.";
  return os.str();
}

std::string extract_store_section(std::string_view explanation) {
  constexpr std::string_view heading = "### For the store";
  const auto start = explanation.find(heading);
  if (start == std::string_view::npos) return trim(explanation);

  const auto body = start + heading.size();
  const auto next = explanation.find("\n#", body);
  return trim(explanation.substr(body, next == std::string_view::npos ? std::string_view::npos
                                                                        : next - body));
}

std::unique_ptr<IExplainer> make_explainer(ExplainerType type) {
  switch (type) {
    case ExplainerType::Template:
      return std::make_unique<TemplateExplainer>();
    case ExplainerType::None:
      break;
  }
  return nullptr;
}

std::optional<std::string> explain_or_log(IExplainer* explainer,
                                          const core::ProductSubmission& submission,
                                          const core::ValidationResult& result,
                                          std::ostream& log) {
  if (!explainer) return std::nullopt;
  auto text = explainer->explain(submission, result);
  if (!text) {
    log << "Warning: explanation unavailable (" << core::to_string(text.error().kind)
        << "): " << text.error().message << "\n";
    return std::nullopt;
  }
  return std::move(*text);
}

}  // namespace shelfcheck::app
