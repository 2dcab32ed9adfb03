#pragma once

#include <shelfcheck/app/config.hpp>
#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <cstddef>
#include <expected>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shelfcheck::app {

/// Turns a finished validation into prose for store staff and head office.
/// Explainers only describe: decision levels, messages and predicted values are quoted
/// as-is and never changed. Implementations may call out to external services.
class IExplainer {
 public:
  virtual ~IExplainer() = default;

  [[nodiscard]] virtual std::expected<std::string, core::Error> explain(
      const core::ProductSubmission& submission,
      const core::ValidationResult& result) = 0;
};

/// Deterministic markdown explanation with "### For the store" and
/// "### For head office" sections. No external calls.
class TemplateExplainer : public IExplainer {
 public:
  [[nodiscard]] std::expected<std::string, core::Error> explain(
      const core::ProductSubmission& submission,
      const core::ValidationResult& result) override;
};

/// Explainer returning a configured text or error (for tests/demo).
class StubExplainer : public IExplainer {
 public:
  void set_text(std::string text);
  void set_error(core::Error error);

  [[nodiscard]] std::expected<std::string, core::Error> explain(
      const core::ProductSubmission& submission,
      const core::ValidationResult& result) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_; }

 private:
  std::optional<std::string> text_;
  std::optional<core::Error> error_;
  std::size_t calls_{0};
};

/// Prompt for a language-model explainer; embeds every decision field verbatim and
/// asks for the same two markdown sections TemplateExplainer produces.
[[nodiscard]] std::string build_explanation_prompt(const core::ProductSubmission& submission,
                                                   const core::ValidationResult& result);

/// Body of the "For the store" section (trimmed); the whole text if there is no such heading.
[[nodiscard]] std::string extract_store_section(std::string_view explanation);

/// nullptr for ExplainerType::None.
[[nodiscard]] std::unique_ptr<IExplainer> make_explainer(ExplainerType type);

/// Runs explainer if non-null. Failures are written to log and yield std::nullopt;
/// the validation result is never affected.
[[nodiscard]] std::optional<std::string> explain_or_log(IExplainer* explainer,
                                                        const core::ProductSubmission& submission,
                                                        const core::ValidationResult& result,
                                                        std::ostream& log);

}  // namespace shelfcheck::app
