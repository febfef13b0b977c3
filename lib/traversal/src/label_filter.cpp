#include "traversal/label_filter.hpp"

#include <string>
#include <string_view>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <range/v3/algorithm/any_of.hpp>

LabelFilter LabelFilter::parse(const std::string_view Filter) {
  auto Result = LabelFilter{};
  auto Entries = llvm::SmallVector<llvm::StringRef>{};
  llvm::StringRef{Filter.data(), Filter.size()}.split(Entries, '|', -1,
                                                       false);
  for (auto Entry : Entries) {
    Entry = Entry.trim();
    if (Entry.consume_front("-")) {
      if (const auto Label = Entry.trim(); !Label.empty()) {
        Result.Denied_.emplace(Label.str());
      }
      continue;
    }
    Entry.consume_front("+");
    if (const auto Label = Entry.trim(); !Label.empty()) {
      Result.Allowed_.emplace(Label.str());
    }
  }
  return Result;
}

bool LabelFilter::accepts(const Node &Val) const {
  const auto IsDenied = [this](const std::string &Label) {
    return Denied_.count(Label) != 0U;
  };
  if (ranges::any_of(Val.Labels, IsDenied)) {
    return false;
  }
  if (Allowed_.empty()) {
    return true;
  }
  return ranges::any_of(Val.Labels, [this](const std::string &Label) {
    return Allowed_.count(Label) != 0U;
  });
}
