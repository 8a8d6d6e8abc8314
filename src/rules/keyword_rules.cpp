#include "keyword_rules.hpp"

#include "../fatal/fatal.hpp"
#include "keyword_phrases.hpp"

#include <algorithm>

namespace rules {

namespace {

bool AnyMatch(const std::vector<std::unique_ptr<RE2>> &patterns,
              const std::string &text) {
  if (text.empty()) {
    return false;
  }
  return std::any_of(patterns.begin(), patterns.end(),
                     [&text](const std::unique_ptr<RE2> &pattern) {
                       return RE2::PartialMatch(text, *pattern);
                     });
}

} // namespace

KeywordRuleTable::KeywordRuleTable() {
  for (const auto &phrase_set : KeywordPhrases()) {
    rules_.push_back({phrase_set.label, Compile(phrase_set.patterns)});
  }
  explicit_annex_patterns_ = Compile(ExplicitAnnexPhrases());
}

std::vector<std::unique_ptr<RE2>>
KeywordRuleTable::Compile(const std::vector<std::string> &patterns) {
  RE2::Options options;
  options.set_case_sensitive(false);
  options.set_log_errors(false);

  std::vector<std::unique_ptr<RE2>> compiled;
  compiled.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    auto regex = std::make_unique<RE2>(pattern, options);
    if (!regex->ok()) {
      loger::fatal("invalid keyword pattern: " + pattern, regex->error());
    }
    compiled.push_back(std::move(regex));
  }
  return compiled;
}

const KeywordRule *KeywordRuleTable::Find(models::SectionType label) const {
  for (const auto &rule : rules_) {
    if (rule.label == label) {
      return &rule;
    }
  }
  return nullptr;
}

std::optional<models::SectionType>
KeywordRuleTable::FirstMatch(const std::string &text) const {
  for (const auto &rule : rules_) {
    if (AnyMatch(rule.patterns, text)) {
      return rule.label;
    }
  }
  return std::nullopt;
}

bool KeywordRuleTable::Matches(models::SectionType label,
                               const std::string &text) const {
  const KeywordRule *rule = Find(label);
  return rule != nullptr && AnyMatch(rule->patterns, text);
}

bool KeywordRuleTable::MatchesExplicitAnnex(const std::string &text) const {
  return AnyMatch(explicit_annex_patterns_, text);
}

} // namespace rules
