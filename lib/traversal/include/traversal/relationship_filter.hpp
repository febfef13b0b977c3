#ifndef traversal_lib_traversal_include_traversal_relationship_filter_hpp
#define traversal_lib_traversal_include_traversal_relationship_filter_hpp

#include <string>
#include <string_view>
#include <vector>

#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"

// Relationship filter in the form "KNOWS>|<LIKES|WORKS_AT". A trailing '>'
// restricts a type to outgoing relationships, a leading '<' to incoming
// ones. A bare '>' or '<' matches every type in that direction. The empty
// filter matches everything.
class RelationshipFilter {
public:
  struct Entry {
    // empty matches any type
    std::string Type{};
    Direction Dir{Direction::Both};
  };

  [[nodiscard]] static RelationshipFilter parse(std::string_view Filter);

  // Rel is seen from node From and has to be traversable in Dir
  [[nodiscard]] bool matches(const Relationship &Rel, NodeId From,
                             Direction Dir) const;

  [[nodiscard]] const std::vector<Entry> &getEntries() const {
    return Entries_;
  }

private:
  std::vector<Entry> Entries_{};
};

#endif
