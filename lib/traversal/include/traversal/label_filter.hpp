#ifndef traversal_lib_traversal_include_traversal_label_filter_hpp
#define traversal_lib_traversal_include_traversal_label_filter_hpp

#include <string>
#include <string_view>

#include <boost/container/flat_set.hpp>

#include "traversal/graph_types.hpp"

// Node label filter in the form "+Person|Company|-Blocked". Labels prefixed
// with '-' deny a node, all other labels form an allow list. An empty allow
// list accepts every node that is not denied.
class LabelFilter {
public:
  [[nodiscard]] static LabelFilter parse(std::string_view Filter);

  [[nodiscard]] bool accepts(const Node &Val) const;

  [[nodiscard]] bool empty() const {
    return Allowed_.empty() && Denied_.empty();
  }

private:
  boost::container::flat_set<std::string> Allowed_{};
  boost::container::flat_set<std::string> Denied_{};
};

#endif
