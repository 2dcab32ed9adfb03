#include <shelfcheck/app/json_codec.hpp>
#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace shelfcheck::app {

namespace {

Json::Value optional_value(const std::optional<double>& v) {
  return v ? Json::Value(*v) : Json::Value(Json::nullValue);
}

Json::Value optional_value(const std::optional<std::string>& v) {
  return v ? Json::Value(*v) : Json::Value(Json::nullValue);
}

core::Error storage_error(std::string message) {
  return core::Error{core::ErrorKind::StorageError, std::move(message)};
}

std::optional<double> read_optional_double(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (v.isNumeric()) return v.asDouble();
  return std::nullopt;
}

std::optional<std::string> read_optional_string(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (v.isString()) return v.asString();
  return std::nullopt;
}

// Missing or null reads as empty; any other non-string is a malformed store.
std::expected<std::string, core::Error> read_string(const Json::Value& obj, const char* key,
                                                    const std::string& where) {
  const Json::Value& v = obj[key];
  if (v.isNull()) return std::string();
  if (!v.isString()) return std::unexpected(storage_error(where + key + " is not a string"));
  return v.asString();
}

std::expected<core::FieldDecision, core::Error> decision_from_json(const Json::Value& v,
                                                                   std::string_view field) {
  if (!v.isObject()) {
    return std::unexpected(storage_error("validation." + std::string(field) + " is not an object"));
  }
  const std::string where = "validation." + std::string(field) + ".";
  auto label = read_string(v, "decision", where);
  if (!label) return std::unexpected(label.error());
  const auto level = core::parse_decision_level(*label);
  if (!level) {
    return std::unexpected(
        storage_error("validation." + std::string(field) + ".decision is not a decision level"));
  }
  auto message = read_string(v, "message", where);
  if (!message) return std::unexpected(message.error());
  core::FieldDecision d;
  d.level = *level;
  d.message = std::move(*message);
  d.predicted = read_optional_string(v, "predicted");
  d.confidence = read_optional_double(v, "confidence");
  return d;
}

std::optional<core::OverallVerdict> verdict_from_label(const std::string& label) {
  for (auto verdict : {core::OverallVerdict::Ready, core::OverallVerdict::WarningsPendingReview,
                       core::OverallVerdict::RequiresCorrection}) {
    if (core::overall_label(verdict) == label) return verdict;
  }
  return std::nullopt;
}

}  // namespace

Json::Value to_json(const core::FieldDecision& decision) {
  Json::Value v(Json::objectValue);
  v["decision"] = std::string(core::to_string(decision.level));
  v["message"] = decision.message;
  v["predicted"] = optional_value(decision.predicted);
  v["confidence"] = optional_value(decision.confidence);
  return v;
}

Json::Value to_json(const core::Neighbour& neighbour) {
  Json::Value v(Json::objectValue);
  v["ProductName"] = neighbour.entry.name;
  v["Category"] = neighbour.entry.category;
  v["PriceGBP"] = optional_value(neighbour.entry.price);
  if (neighbour.entry.age_verification_required.has_value()) {
    v["AgeVerificationRequired"] = *neighbour.entry.age_verification_required ? "Yes" : "No";
  } else {
    v["AgeVerificationRequired"] = Json::Value(Json::nullValue);
  }
  v["similarity"] = neighbour.similarity;
  v["catalog_index"] = static_cast<Json::UInt64>(neighbour.catalog_index);
  return v;
}

Json::Value to_json(const core::ValidationResult& result, bool include_neighbours) {
  Json::Value v(Json::objectValue);
  v["category"] = to_json(result.category);

  Json::Value price = to_json(result.price);
  price.removeMember("predicted");
  price.removeMember("confidence");
  price["median"] = optional_value(result.price_band.median);
  price["lower"] = optional_value(result.price_band.lower);
  price["upper"] = optional_value(result.price_band.upper);
  v["price"] = std::move(price);

  v["age_verification"] = to_json(result.age_verification);
  v["overall"] = std::string(core::overall_label(result.overall));
  v["overall_status"] = std::string(core::to_string(result.overall));

  if (include_neighbours) {
    Json::Value list(Json::arrayValue);
    for (const auto& n : result.neighbours) list.append(to_json(n));
    v["neighbours"] = std::move(list);
  }
  return v;
}

Json::Value to_json(const core::ProductSubmission& product) {
  Json::Value v(Json::objectValue);
  v["product_name"] = product.name;
  v["category"] = product.category;
  v["price"] = product.price;
  v["age_flag"] = product.age_flag;
  return v;
}

Json::Value to_json(const Submission& submission) {
  Json::Value v(Json::objectValue);
  v["id"] = std::to_string(submission.id);
  v["timestamp"] = submission.timestamp;
  v["product"] = to_json(submission.product);
  v["validation"] = to_json(submission.result, false);
  Json::Value changes(Json::arrayValue);
  for (const auto& c : submission.accepted_changes) changes.append(c);
  v["accepted_changes"] = std::move(changes);
  v["notes"] = optional_value(submission.notes);
  v["status"] = std::string(to_string(submission.status));
  v["flagged"] = submission.flagged;
  if (submission.denial_reason) v["denial_reason"] = *submission.denial_reason;
  return v;
}

std::expected<core::ValidationResult, core::Error> validation_result_from_json(const Json::Value& value) {
  if (!value.isObject()) return std::unexpected(storage_error("validation is not an object"));

  core::ValidationResult r;
  auto category = decision_from_json(value["category"], "category");
  if (!category) return std::unexpected(category.error());
  auto price = decision_from_json(value["price"], "price");
  if (!price) return std::unexpected(price.error());
  auto age = decision_from_json(value["age_verification"], "age_verification");
  if (!age) return std::unexpected(age.error());
  r.category = std::move(*category);
  r.price = std::move(*price);
  r.age_verification = std::move(*age);

  const Json::Value& price_obj = value["price"];
  r.price_band.median = read_optional_double(price_obj, "median");
  r.price_band.lower = read_optional_double(price_obj, "lower");
  r.price_band.upper = read_optional_double(price_obj, "upper");

  auto status = read_string(value, "overall_status", "validation.");
  if (!status) return std::unexpected(status.error());
  auto label = read_string(value, "overall", "validation.");
  if (!label) return std::unexpected(label.error());
  std::optional<core::OverallVerdict> overall = core::parse_overall_verdict(*status);
  if (!overall) overall = verdict_from_label(*label);
  if (!overall) return std::unexpected(storage_error("validation.overall is not a known verdict"));
  r.overall = *overall;
  return r;
}

std::expected<Submission, core::Error> submission_from_json(const Json::Value& value) {
  if (!value.isObject()) return std::unexpected(storage_error("submission is not an object"));

  Submission s;
  const Json::Value& id = value["id"];
  if (id.isString()) {
    const std::string text = id.asString();
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), s.id);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
      return std::unexpected(storage_error("submission id '" + text + "' is not a number"));
    }
  } else if (id.isUInt64()) {
    s.id = id.asUInt64();
  } else {
    return std::unexpected(storage_error("submission id is missing"));
  }
  const std::string where = "submission " + std::to_string(s.id) + ": ";

  auto timestamp = read_string(value, "timestamp", where);
  if (!timestamp) return std::unexpected(timestamp.error());
  s.timestamp = std::move(*timestamp);

  const Json::Value& product = value["product"];
  if (!product.isObject() || !product["price"].isNumeric()) {
    return std::unexpected(storage_error(where + "product is missing or has no numeric price"));
  }
  const std::string product_where = where + "product.";
  auto name = read_string(product, "product_name", product_where);
  if (!name) return std::unexpected(name.error());
  auto category = read_string(product, "category", product_where);
  if (!category) return std::unexpected(category.error());
  auto age_flag = read_string(product, "age_flag", product_where);
  if (!age_flag) return std::unexpected(age_flag.error());
  s.product.name = std::move(*name);
  s.product.category = std::move(*category);
  s.product.price = product["price"].asDouble();
  s.product.age_flag = std::move(*age_flag);

  auto result = validation_result_from_json(value["validation"]);
  if (!result) return std::unexpected(storage_error(where + result.error().message));
  s.result = std::move(*result);

  const Json::Value& changes = value["accepted_changes"];
  if (changes.isArray()) {
    for (const auto& c : changes) {
      if (c.isString()) s.accepted_changes.push_back(c.asString());
    }
  } else if (!changes.isNull()) {
    return std::unexpected(storage_error(where + "accepted_changes is not an array"));
  }
  s.notes = read_optional_string(value, "notes");

  auto status_text = read_string(value, "status", where);
  if (!status_text) return std::unexpected(status_text.error());
  const auto status = parse_submission_status(*status_text);
  if (!status) return std::unexpected(storage_error(where + "unknown status"));
  s.status = *status;
  const Json::Value& flagged = value["flagged"];
  if (flagged.isBool()) {
    s.flagged = flagged.asBool();
  } else if (!flagged.isNull()) {
    return std::unexpected(storage_error(where + "flagged is not a boolean"));
  }
  s.denial_reason = read_optional_string(value, "denial_reason");
  return s;
}

std::string write_json(const Json::Value& value, bool pretty) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = pretty ? "  " : "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

std::expected<Json::Value, core::Error> parse_json(const std::string& text) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return std::unexpected(storage_error("invalid JSON: " + errors));
  }
  return root;
}

}  // namespace shelfcheck::app
