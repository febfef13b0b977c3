#ifndef traversal_lib_traversal_include_traversal_in_memory_graph_hpp
#define traversal_lib_traversal_include_traversal_in_memory_graph_hpp

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/container/flat_map.hpp>

#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"
#include "traversal/relationship_filter.hpp"

// Adjacency list backed graph. Relationships of a node are reported in
// insertion order, which makes every traversal over it deterministic.
// Building the graph is not synchronized, reading it concurrently is safe.
class InMemoryGraph final : public GraphReadPort {
public:
  NodeId addNode(std::vector<std::string> Labels = {},
                 PropertyMap Properties = {});

  RelationshipId addRelationship(NodeId StartId, NodeId EndId,
                                 std::string Type,
                                 PropertyMap Properties = {});

  [[nodiscard]] std::size_t getNodeCount() const { return Nodes_.size(); }
  [[nodiscard]] std::size_t getRelationshipCount() const {
    return NumRelationships_;
  }

  [[nodiscard]] ReadResult<NodePtr> getNode(NodeId Id) const override;

  [[nodiscard]] ReadResult<std::vector<NodePtr>>
  getNodeNeighbors(NodeId Id, std::string_view RelFilter,
                   Direction Dir) const override;

  [[nodiscard]] ReadResult<std::vector<RelationshipPtr>>
  getNodeRelationships(NodeId Id, std::string_view RelFilter,
                       Direction Dir) const override;

  [[nodiscard]] ReadResult<Path>
  findShortestPath(NodeId StartId, NodeId EndId,
                   std::string_view RelFilter,
                   std::int64_t MaxHops) const override;

  [[nodiscard]] ReadResult<std::vector<Path>>
  findAllPaths(NodeId StartId, NodeId EndId,
               std::string_view RelFilter,
               std::int64_t MaxHops) const override;

private:
  [[nodiscard]] NodePtr findNode(NodeId Id) const;

  [[nodiscard]] std::vector<RelationshipPtr>
  getMatchingRelationships(NodeId Id, const RelationshipFilter &Filter,
                           Direction Dir) const;

  NodeId NextNodeId_ = 1;
  RelationshipId NextRelationshipId_ = 1;
  std::size_t NumRelationships_ = 0U;

  boost::container::flat_map<NodeId, NodePtr> Nodes_{};
  boost::container::flat_map<NodeId, std::vector<RelationshipPtr>>
      NodeRelationships_{};
};

#endif
