#include "label_selector.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace releaselog::model {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Splits on commas that are not inside a parenthesised value list.
std::vector<std::string_view> SplitTerms(std::string_view text) {
  std::vector<std::string_view> terms;
  int                           depth = 0;
  std::size_t                   start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '(') ++depth;
    if (text[i] == ')') --depth;
    if (depth < 0) throw util::InvalidArgument("label selector: unbalanced ')' in '" + std::string(text) + "'");
    if (text[i] == ',' && depth == 0) {
      terms.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }
  if (depth != 0) throw util::InvalidArgument("label selector: unbalanced '(' in '" + std::string(text) + "'");
  terms.push_back(text.substr(start));
  return terms;
}

std::vector<std::string> ParseValueList(std::string_view list, std::string_view term) {
  list = Trim(list);
  if (list.size() < 2 || list.front() != '(' || list.back() != ')') {
    throw util::InvalidArgument("label selector: expected '(values)' in '" + std::string(term) + "'");
  }
  list = list.substr(1, list.size() - 2);

  std::vector<std::string> values;
  std::size_t              start = 0;
  while (start <= list.size()) {
    auto end = list.find(',', start);
    if (end == std::string_view::npos) end = list.size();
    auto value = Trim(list.substr(start, end - start));
    if (value.empty()) throw util::InvalidArgument("label selector: empty value in '" + std::string(term) + "'");
    values.emplace_back(value);
    start = end + 1;
  }
  return values;
}

void RequireKey(std::string_view key, std::string_view term) {
  if (key.empty() || key.find_first_of(" \t()=!") != std::string_view::npos) {
    throw util::InvalidArgument("label selector: invalid key in '" + std::string(term) + "'");
  }
}

std::string JoinValues(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i) out += ',';
    out += values[i];
  }
  return out;
}

} // namespace

LabelSelector LabelSelector::FromMatchLabels(Labels match_labels) {
  LabelSelector selector;
  selector.match_labels_ = std::move(match_labels);
  return selector;
}

LabelSelector LabelSelector::Parse(std::string_view text) {
  LabelSelector selector;
  if (Trim(text).empty()) return selector;

  for (auto raw : SplitTerms(text)) {
    const auto term = Trim(raw);
    if (term.empty()) throw util::InvalidArgument("label selector: empty term in '" + std::string(text) + "'");

    if (term.front() == '!') {
      const auto key = Trim(term.substr(1));
      RequireKey(key, term);
      selector.AddRequirement({std::string(key), SelectorOperator::kDoesNotExist, {}});
      continue;
    }

    if (auto pos = term.find(" notin "); pos != std::string_view::npos) {
      const auto key = Trim(term.substr(0, pos));
      RequireKey(key, term);
      selector.AddRequirement({std::string(key), SelectorOperator::kNotIn, ParseValueList(term.substr(pos + 7), term)});
      continue;
    }

    if (auto pos = term.find(" in "); pos != std::string_view::npos) {
      const auto key = Trim(term.substr(0, pos));
      RequireKey(key, term);
      selector.AddRequirement({std::string(key), SelectorOperator::kIn, ParseValueList(term.substr(pos + 4), term)});
      continue;
    }

    if (auto pos = term.find("!="); pos != std::string_view::npos) {
      const auto key   = Trim(term.substr(0, pos));
      const auto value = Trim(term.substr(pos + 2));
      RequireKey(key, term);
      selector.AddRequirement({std::string(key), SelectorOperator::kNotIn, {std::string(value)}});
      continue;
    }

    if (auto pos = term.find('='); pos != std::string_view::npos) {
      const auto key       = Trim(term.substr(0, pos));
      auto       value_pos = pos + 1;
      if (value_pos < term.size() && term[value_pos] == '=') ++value_pos;
      const auto value = Trim(term.substr(value_pos));
      RequireKey(key, term);
      selector.AddMatchLabel(std::string(key), std::string(value));
      continue;
    }

    RequireKey(term, term);
    selector.AddRequirement({std::string(term), SelectorOperator::kExists, {}});
  }

  return selector;
}

void LabelSelector::AddMatchLabel(const std::string& key, const std::string& value) {
  match_labels_[key] = value;
}

void LabelSelector::AddRequirement(SelectorRequirement requirement) {
  requirements_.push_back(std::move(requirement));
}

bool LabelSelector::Matches(const Labels& labels) const {
  for (const auto& [key, value] : match_labels_) {
    auto it = labels.find(key);
    if (it == labels.end() || it->second != value) return false;
  }

  for (const auto& req : requirements_) {
    auto       it      = labels.find(req.key);
    const bool present = it != labels.end();

    switch (req.op) {
      case SelectorOperator::kIn:
        if (!present || std::find(req.values.begin(), req.values.end(), it->second) == req.values.end()) return false;
        break;
      case SelectorOperator::kNotIn:
        if (present && std::find(req.values.begin(), req.values.end(), it->second) != req.values.end()) return false;
        break;
      case SelectorOperator::kExists:
        if (!present) return false;
        break;
      case SelectorOperator::kDoesNotExist:
        if (present) return false;
        break;
    }
  }

  return true;
}

bool LabelSelector::Empty() const {
  return match_labels_.empty() && requirements_.empty();
}

std::string LabelSelector::ToString() const {
  std::vector<std::string> terms;
  terms.reserve(match_labels_.size() + requirements_.size());

  for (const auto& [key, value] : match_labels_) {
    terms.push_back(key + "=" + value);
  }

  for (const auto& req : requirements_) {
    switch (req.op) {
      case SelectorOperator::kIn:
        terms.push_back(req.key + " in (" + JoinValues(req.values) + ")");
        break;
      case SelectorOperator::kNotIn:
        terms.push_back(req.key + " notin (" + JoinValues(req.values) + ")");
        break;
      case SelectorOperator::kExists:
        terms.push_back(req.key);
        break;
      case SelectorOperator::kDoesNotExist:
        terms.push_back("!" + req.key);
        break;
    }
  }

  std::string out;
  for (std::size_t i = 0; i < terms.size(); ++i) {
    if (i) out += ',';
    out += terms[i];
  }
  return out;
}

} // namespace releaselog::model
