/**
 * shelfcheck-cli: validate store product listings against the head-office catalog.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/shelfcheck-cli/shelfcheck_cli --catalog data/ho_products.csv \
 *            --name "Premium Lager 4x440ml" --category "Beer & Cider" --price 5.50 --age-flag Yes
 * With --submit: the result is stored in the submissions file for head-office review.
 */

#include <shelfcheck/app/catalog_loader.hpp>
#include <shelfcheck/app/config.hpp>
#include <shelfcheck/app/explainer.hpp>
#include <shelfcheck/app/json_codec.hpp>
#include <shelfcheck/app/json_submission_repository.hpp>
#include <shelfcheck/app/review_queue.hpp>
#include <shelfcheck/app/validation_runner.hpp>
#ifdef SHELFCHECK_HAS_TBB
#include <shelfcheck/app/validation_runner_tbb.hpp>
#endif
#include <shelfcheck/core/decision.hpp>
#include <shelfcheck/core/error.hpp>
#include <shelfcheck/core/product_submission.hpp>
#include <shelfcheck/core/validation_result.hpp>
#include <shelfcheck/engine/product_validator.hpp>
#include <shelfcheck/similarity/catalog_index.hpp>

#include <charconv>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct Options {
  std::string config_path;
  std::string catalog_override;
  std::optional<std::size_t> workers_override;
  std::string name;
  std::string category;
  std::string price;
  std::string age_flag;
  std::string batch_path;
  std::string list_status;
  std::optional<std::uint64_t> approve_id;
  std::optional<std::uint64_t> deny_id;
  std::string deny_reason;
  bool json{false};
  bool submit{false};
  bool explain{false};
  bool categories{false};
  bool queue{false};
  bool single{false};
};

void print_usage() {
  std::cout << "Usage: shelfcheck_cli [options]\n"
            << "  --config <path>      Engine config (key=value file); default: built-in\n"
            << "  --catalog <path>     Override catalog CSV (ProductName,Category,PriceGBP,AgeVerificationRequired)\n"
            << "  --workers <n>        Batch worker threads (0 = hardware concurrency)\n"
            << "\nValidate one product:\n"
            << "  --name <text> --category <text> --price <number> --age-flag <Yes|No>\n"
            << "  --json               Print the result as JSON\n"
            << "  --explain            Add a plain-language explanation\n"
            << "  --submit             Store the result for head-office review\n"
            << "\nOther commands:\n"
            << "  --batch <csv>        Validate every row of a CSV with the catalog columns\n"
            << "  --categories         List catalog categories\n"
            << "  --list <status>      List stored submissions: pending | approved | denied | all\n"
            << "  --queue              Pending submissions ordered by risk\n"
            << "  --approve <id>       Approve a stored submission\n"
            << "  --deny <id> [--reason <text>]  Deny a stored submission\n";
}

std::optional<std::uint64_t> parse_id(const std::string& text) {
  std::uint64_t id = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
  return id;
}

void print_field(std::ostringstream& out, const char* label, const shelfcheck::core::FieldDecision& d) {
  out << label << ": " << shelfcheck::core::to_string(d.level) << "\n  " << d.message << "\n";
  if (d.predicted) {
    out << "  predicted=" << *d.predicted;
    if (d.confidence) out << " confidence=" << std::fixed << std::setprecision(2) << *d.confidence;
    out << "\n";
  }
}

std::string format_result(const shelfcheck::core::ValidationResult& r) {
  std::ostringstream out;
  out << "overall=" << shelfcheck::core::to_string(r.overall) << " ("
      << shelfcheck::core::overall_label(r.overall) << ")\n";
  print_field(out, "category", r.category);
  print_field(out, "price", r.price);
  if (r.price_band.median) {
    out << std::fixed << std::setprecision(2) << "  median=" << *r.price_band.median
        << " band=[" << *r.price_band.lower << ", " << *r.price_band.upper << "]\n";
  }
  print_field(out, "age_verification", r.age_verification);
  out << "neighbours=" << r.neighbours.size() << "\n";
  for (const auto& n : r.neighbours) {
    out << "  " << std::fixed << std::setprecision(3) << n.similarity << "  " << n.entry.name
        << " [" << n.entry.category << "]";
    if (n.entry.price) out << " " << std::setprecision(2) << *n.entry.price;
    out << "\n";
  }
  return out.str();
}

void print_error(const shelfcheck::core::Error& e) {
  std::cerr << shelfcheck::core::to_string(e.kind) << ": " << e.message << "\n";
}

int run_review_command(const Options& opts, shelfcheck::app::ISubmissionRepository& repo) {
  using namespace shelfcheck::app;

  if (opts.approve_id || opts.deny_id) {
    auto updated = opts.approve_id
                       ? repo.approve(*opts.approve_id)
                       : repo.deny(*opts.deny_id, opts.deny_reason.empty()
                                                      ? std::nullopt
                                                      : std::optional<std::string>(opts.deny_reason));
    if (!updated) {
      print_error(updated.error());
      return 1;
    }
    std::cout << "id=" << updated->id << " status=" << to_string(updated->status) << "\n";
    return 0;
  }

  if (opts.queue) {
    auto queue = prepare_review_queue(repo.list_by_status(SubmissionStatus::Pending));
    for (const auto& item : queue) {
      std::cout << item.submission.id << "  " << to_string(item.level) << " (" << item.score << ")  "
                << item.submission.timestamp << "  " << item.submission.product.name << "\n";
    }
    return 0;
  }

  std::vector<Submission> list;
  if (opts.list_status == "all") {
    list = repo.list_all();
  } else if (auto status = parse_submission_status(opts.list_status)) {
    list = repo.list_by_status(*status);
  } else {
    std::cerr << "Unknown --list status " << opts.list_status << " (use pending, approved, denied or all)\n";
    return 1;
  }
  if (opts.json) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : list) arr.append(to_json(s));
    std::cout << write_json(arr) << "\n";
    return 0;
  }
  const QueueSummary summary = summarize(list);
  std::cout << "pending=" << summary.pending << " approved=" << summary.approved
            << " denied=" << summary.denied << "\n";
  for (const auto& s : list) {
    std::cout << s.id << "  " << to_string(s.status) << (s.flagged ? " (flagged)" : "") << "  "
              << s.timestamp << "  " << s.product.name << "\n";
  }
  return 0;
}

int run_batch(const Options& opts,
              const shelfcheck::engine::ProductValidator& validator,
              std::size_t num_workers) {
  using namespace shelfcheck::app;

  auto batch = load_submission_batch_csv(opts.batch_path);
  if (!batch) {
    print_error(batch.error());
    return 1;
  }
  for (const auto& w : batch->warnings) std::cerr << "Warning: " << w << "\n";

#ifdef SHELFCHECK_HAS_TBB
  std::vector<std::optional<ValidationOutcome>> slots(batch->submissions.size());
  run_validation_batch_tbb(
      validator, batch->submissions,
      [&slots](std::size_t i, const ValidationOutcome& o) { slots[i] = o; }, num_workers);
  std::vector<ValidationOutcome> outcomes;
  outcomes.reserve(slots.size());
  for (auto& s : slots) outcomes.push_back(std::move(*s));
#else
  std::vector<ValidationOutcome> outcomes = validate_all(validator, batch->submissions, num_workers);
#endif

  int failures = 0;
  Json::Value arr(Json::arrayValue);
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const auto& product = batch->submissions[i];
    if (!outcomes[i]) {
      ++failures;
      print_error(outcomes[i].error());
      continue;
    }
    if (opts.json) {
      Json::Value item(Json::objectValue);
      item["product"] = to_json(product);
      item["validation"] = to_json(*outcomes[i], false);
      arr.append(std::move(item));
    } else {
      const auto& r = *outcomes[i];
      std::cout << shelfcheck::core::to_string(r.overall) << "  category="
                << shelfcheck::core::to_string(r.category.level)
                << " price=" << shelfcheck::core::to_string(r.price.level)
                << " age=" << shelfcheck::core::to_string(r.age_verification.level) << "  "
                << product.name << "\n";
    }
  }
  if (opts.json) std::cout << write_json(arr) << "\n";
  return failures == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char *argv[]) {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      opts.config_path = argv[++i];
    } else if (arg == "--catalog" && has_value) {
      opts.catalog_override = argv[++i];
    } else if (arg == "--workers" && has_value) {
      const auto n = parse_id(argv[++i]);
      if (!n) {
        std::cerr << "--workers expects a non-negative integer\n";
        return 1;
      }
      opts.workers_override = static_cast<std::size_t>(*n);
    } else if (arg == "--name" && has_value) {
      opts.name = argv[++i];
      opts.single = true;
    } else if (arg == "--category" && has_value) {
      opts.category = argv[++i];
    } else if (arg == "--price" && has_value) {
      opts.price = argv[++i];
    } else if (arg == "--age-flag" && has_value) {
      opts.age_flag = argv[++i];
    } else if (arg == "--batch" && has_value) {
      opts.batch_path = argv[++i];
    } else if (arg == "--list" && has_value) {
      opts.list_status = argv[++i];
    } else if ((arg == "--approve" || arg == "--deny") && has_value) {
      const auto id = parse_id(argv[++i]);
      if (!id) {
        std::cerr << arg << " expects a submission id\n";
        return 1;
      }
      (arg == "--approve" ? opts.approve_id : opts.deny_id) = *id;
    } else if (arg == "--reason" && has_value) {
      opts.deny_reason = argv[++i];
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--submit") {
      opts.submit = true;
    } else if (arg == "--explain") {
      opts.explain = true;
    } else if (arg == "--categories") {
      opts.categories = true;
    } else if (arg == "--queue") {
      opts.queue = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown or incomplete option " << arg << " (see --help)\n";
      return 1;
    }
  }

  shelfcheck::app::EngineConfig cfg = opts.config_path.empty()
                                          ? shelfcheck::app::default_config()
                                          : shelfcheck::app::load_config(opts.config_path);
  for (const auto& w : cfg.warnings) std::cerr << "Warning: " << w << "\n";
  if (!opts.catalog_override.empty()) cfg.catalog_path = opts.catalog_override;
  if (opts.workers_override) cfg.num_workers = *opts.workers_override;

  const bool review_command = !opts.list_status.empty() || opts.queue || opts.approve_id || opts.deny_id;
  std::unique_ptr<shelfcheck::app::JsonSubmissionRepository> repo;
  if (review_command || opts.submit) {
    auto opened = shelfcheck::app::JsonSubmissionRepository::open(cfg.submissions_path);
    if (!opened) {
      print_error(opened.error());
      return 1;
    }
    repo = std::move(*opened);
  }
  if (review_command) return run_review_command(opts, *repo);

  auto loaded = shelfcheck::app::load_catalog_csv(cfg.catalog_path);
  if (!loaded) {
    print_error(loaded.error());
    return 1;
  }
  for (const auto& w : loaded->warnings) std::cerr << "Warning: " << w << "\n";

  auto index = shelfcheck::similarity::CatalogIndex::build(std::move(loaded->catalog));
  if (!index) {
    print_error(index.error());
    return 1;
  }
  if (opts.categories) {
    for (const auto& c : (*index)->categories()) std::cout << c << "\n";
    return 0;
  }

  shelfcheck::engine::ProductValidator validator(*index, {cfg.top_k});

  if (!opts.batch_path.empty()) return run_batch(opts, validator, cfg.num_workers);

  if (!opts.single) {
    print_usage();
    return 1;
  }

  auto submission = shelfcheck::core::parse_submission(opts.name, opts.category, opts.price, opts.age_flag);
  if (!submission) {
    print_error(submission.error());
    return 2;
  }
  auto result = shelfcheck::app::run_validation(validator, *submission);
  if (!result) {
    print_error(result.error());
    return 1;
  }

  std::optional<std::string> explanation;
  if (opts.explain) {
    const auto explainer = shelfcheck::app::make_explainer(cfg.explainer);
    explanation = shelfcheck::app::explain_or_log(explainer.get(), *submission, *result, std::cerr);
  }

  if (opts.json) {
    Json::Value out = shelfcheck::app::to_json(*result);
    if (explanation) out["explanation"] = *explanation;
    std::cout << shelfcheck::app::write_json(out) << "\n";
  } else {
    std::cout << format_result(*result);
    if (explanation) std::cout << "\n" << *explanation;
  }

  if (opts.submit) {
    shelfcheck::app::NewSubmission pending{*submission, *result, {}, std::nullopt};
    auto stored = repo->append(std::move(pending));
    if (!stored) {
      print_error(stored.error());
      return 1;
    }
    std::cerr << "Stored submission id=" << stored->id
              << " status=" << shelfcheck::app::to_string(stored->status) << "\n";
  }
  return 0;
}
