#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shelfcheck::similarity {

/// Sparse term vector: (term_id, weight) pairs sorted by term_id.
using SparseVector = std::vector<std::pair<std::uint32_t, double>>;

/// Lowercase word tokens of two or more word characters, counted in code points.
/// Input is UTF-8. Word characters are alphanumerics and '_'; Latin-1 symbols such as
/// the pound sign and the general punctuation block (dashes, non-breaking hyphen) split tokens.
/// Case folding covers ASCII, Latin-1 and Latin Extended-A only; other scripts keep
/// their case, and non-Latin punctuation outside the listed blocks counts as a word
/// character.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view text);

/// Unigrams followed by bigrams ("a b") of consecutive tokens.
[[nodiscard]] std::vector<std::string> word_ngrams(const std::vector<std::string>& tokens);

/// Dot product of two sorted sparse vectors.
[[nodiscard]] double dot(const SparseVector& a, const SparseVector& b) noexcept;

/// TF-IDF model over unigrams and bigrams with smoothed idf and L2 normalisation:
///   idf(t) = ln((1 + n) / (1 + df(t))) + 1
/// The vocabulary is fixed at fit(); unseen terms in transform() are ignored.
/// Thread-safety: read-only after fit(); transform() may be called concurrently.
class TfidfVectorizer {
 public:
  TfidfVectorizer() = default;

  /// Learn vocabulary and document frequencies from documents.
  [[nodiscard]] static TfidfVectorizer fit(const std::vector<std::string>& documents);

  /// Weighted, L2-normalised vector for text. Empty when no term is known.
  [[nodiscard]] SparseVector transform(std::string_view text) const;

  [[nodiscard]] std::size_t vocabulary_size() const noexcept { return idf_.size(); }
  [[nodiscard]] std::size_t document_count() const noexcept { return document_count_; }

  [[nodiscard]] std::optional<std::uint32_t> term_id(const std::string& term) const;
  [[nodiscard]] double idf(std::uint32_t term_id) const { return idf_.at(term_id); }

 private:
  std::unordered_map<std::string, std::uint32_t> term_to_id_;
  std::vector<double> idf_;
  std::size_t document_count_{0};
};

}  // namespace shelfcheck::similarity
