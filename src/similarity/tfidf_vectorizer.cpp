#include <shelfcheck/similarity/tfidf_vectorizer.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_set>

namespace shelfcheck::similarity {

namespace {

constexpr char32_t kInvalid = 0xFFFD;

// Decodes one UTF-8 sequence at text[i] and advances i. Malformed input yields kInvalid
// and consumes a single byte.
char32_t next_code_point(std::string_view text, std::size_t& i) noexcept {
  const auto b0 = static_cast<unsigned char>(text[i]);
  if (b0 < 0x80) {
    ++i;
    return b0;
  }
  std::size_t len = 0;
  char32_t cp = 0;
  if ((b0 & 0xE0) == 0xC0) {
    len = 2;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    len = 3;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    len = 4;
    cp = b0 & 0x07;
  } else {
    ++i;
    return kInvalid;
  }
  if (i + len > text.size()) {
    ++i;
    return kInvalid;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(text[i + k]);
    if ((b & 0xC0) != 0x80) {
      ++i;
      return kInvalid;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  i += len;
  return cp;
}

void append_utf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_word_char(char32_t c) noexcept {
  if (c < 0x80) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  }
  if (c == kInvalid) return false;
  // Latin-1 supplement: only the letters, ordinal indicators and micro sign.
  if (c < 0xC0) return c == 0xAA || c == 0xB5 || c == 0xBA;
  if (c == 0xD7 || c == 0xF7) return false;
  // Punctuation, currency, arrows, maths and other symbol blocks; ideographic punctuation;
  // fullwidth ASCII punctuation.
  if (c >= 0x2000 && c <= 0x2BFF) return false;
  if (c >= 0x3000 && c <= 0x303F) return false;
  if (c >= 0xFE10 && c <= 0xFE6F) return false;
  if (c >= 0xFF00 && c <= 0xFF0F) return false;
  return true;
}

// Lowercase fold for ASCII, Latin-1 and Latin Extended-A; other scripts pass through.
char32_t fold_case(char32_t c) noexcept {
  if (c >= 'A' && c <= 'Z') return c + 0x20;
  if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return c + 0x20;
  if ((c >= 0x100 && c <= 0x12F) || (c >= 0x132 && c <= 0x137) || (c >= 0x14A && c <= 0x177)) {
    return (c % 2 == 0) ? c + 1 : c;
  }
  if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) {
    return (c % 2 == 1) ? c + 1 : c;
  }
  if (c == 0x178) return 0xFF;
  return c;
}

}  // namespace

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  std::size_t length = 0;
  auto flush = [&]() {
    if (length >= 2) tokens.push_back(current);
    current.clear();
    length = 0;
  };
  std::size_t i = 0;
  while (i < text.size()) {
    const char32_t c = next_code_point(text, i);
    if (is_word_char(c)) {
      append_utf8(current, fold_case(c));
      ++length;
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

std::vector<std::string> word_ngrams(const std::vector<std::string>& tokens) {
  std::vector<std::string> out(tokens.begin(), tokens.end());
  if (tokens.size() < 2) return out;
  out.reserve(tokens.size() * 2 - 1);
  for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
    out.push_back(tokens[i] + ' ' + tokens[i + 1]);
  }
  return out;
}

double dot(const SparseVector& a, const SparseVector& b) noexcept {
  double sum = 0.0;
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (ia->first < ib->first) {
      ++ia;
    } else if (ib->first < ia->first) {
      ++ib;
    } else {
      sum += ia->second * ib->second;
      ++ia;
      ++ib;
    }
  }
  return sum;
}

TfidfVectorizer TfidfVectorizer::fit(const std::vector<std::string>& documents) {
  TfidfVectorizer v;
  v.document_count_ = documents.size();
  std::vector<std::size_t> df;

  for (const auto& doc : documents) {
    std::unordered_set<std::uint32_t> seen;
    for (auto& term : word_ngrams(tokenize(doc))) {
      auto [it, inserted] =
          v.term_to_id_.try_emplace(std::move(term), static_cast<std::uint32_t>(df.size()));
      if (inserted) df.push_back(0);
      if (seen.insert(it->second).second) ++df[it->second];
    }
  }

  const double n = static_cast<double>(documents.size());
  v.idf_.resize(df.size());
  for (std::size_t i = 0; i < df.size(); ++i) {
    v.idf_[i] = std::log((1.0 + n) / (1.0 + static_cast<double>(df[i]))) + 1.0;
  }
  return v;
}

std::optional<std::uint32_t> TfidfVectorizer::term_id(const std::string& term) const {
  auto it = term_to_id_.find(term);
  if (it == term_to_id_.end()) return std::nullopt;
  return it->second;
}

SparseVector TfidfVectorizer::transform(std::string_view text) const {
  std::unordered_map<std::uint32_t, double> counts;
  for (const auto& term : word_ngrams(tokenize(text))) {
    auto it = term_to_id_.find(term);
    if (it != term_to_id_.end()) counts[it->second] += 1.0;
  }

  SparseVector out;
  out.reserve(counts.size());
  for (const auto& [id, tf] : counts) {
    out.emplace_back(id, tf * idf_[id]);
  }
  std::sort(out.begin(), out.end());

  double norm_sq = 0.0;
  for (const auto& [id, w] : out) norm_sq += w * w;

  if (norm_sq > 0.0) {
    const double inv = 1.0 / std::sqrt(norm_sq);
    for (auto& [id, w] : out) w *= inv;
  }
  return out;
}

}  // namespace shelfcheck::similarity
