#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace releaselog::model {

using Labels = std::map<std::string, std::string>;

enum class SelectorOperator : std::uint8_t {
  kIn           = 0,
  kNotIn        = 1,
  kExists       = 2,
  kDoesNotExist = 3,
};

struct SelectorRequirement {
  std::string              key;
  SelectorOperator         op = SelectorOperator::kExists;
  std::vector<std::string> values;

  bool operator==(const SelectorRequirement&) const = default;
};

/*
  Kubernetes label selector: equality terms plus set-based requirements.

  An empty selector matches every label set.
*/
class LabelSelector {
 public:
  LabelSelector() = default;

  static LabelSelector FromMatchLabels(Labels match_labels);

  // Accepts the labelSelector query syntax: "a=b,c!=d,e in (x,y),f notin (z),g,!h".
  // Throws util::InvalidArgument on malformed input.
  static LabelSelector Parse(std::string_view text);

  void AddMatchLabel(const std::string& key, const std::string& value);
  void AddRequirement(SelectorRequirement requirement);

  bool Matches(const Labels& labels) const;
  bool Empty() const;

  // Deterministic rendering; equality terms sorted by key first.
  std::string ToString() const;

  const Labels& match_labels() const {
    return match_labels_;
  }

  const std::vector<SelectorRequirement>& requirements() const {
    return requirements_;
  }

  bool operator==(const LabelSelector&) const = default;

 private:
  Labels                           match_labels_;
  std::vector<SelectorRequirement> requirements_;
};

} // namespace releaselog::model
