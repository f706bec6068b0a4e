#include "cron_expression.hpp"

#include <charconv>
#include <vector>

namespace sqlvault::schedule {

namespace {

std::vector<std::string_view> SplitFields(std::string_view text) {
  std::vector<std::string_view> fields;

  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
    if (pos >= text.size()) break;

    size_t end = pos;
    while (end < text.size() && text[end] != ' ' && text[end] != '\t') ++end;

    fields.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return fields;
}

} // namespace

CronExpression CronExpression::Parse(std::string_view text) {
  CronExpression expr;
  expr.text_ = std::string(text);

  const auto parts = SplitFields(text);
  expr.valid_      = parts.size() >= expr.fields_.size();

  for (size_t i = 0; i < expr.fields_.size() && i < parts.size(); ++i) {
    auto& field = expr.fields_[i];
    if (parts[i] == "*") {
      field.any   = true;
      field.valid = true;
      continue;
    }

    int  value = 0;
    auto [ptr, ec] = std::from_chars(parts[i].data(), parts[i].data() + parts[i].size(), value);
    if (ec == std::errc() && ptr == parts[i].data() + parts[i].size() && value >= 0) {
      field.valid = true;
      field.value = value;
    } else {
      expr.valid_ = false;
    }
  }
  return expr;
}

bool CronExpression::Matches(const std::tm& local) const {
  // missing and unparseable fields are neither `any` nor `valid`
  return fields_[0].Matches(local.tm_min) && fields_[1].Matches(local.tm_hour) && fields_[2].Matches(local.tm_mday) &&
         fields_[3].Matches(local.tm_mon + 1) && fields_[4].Matches(local.tm_wday);
}

} // namespace sqlvault::schedule
