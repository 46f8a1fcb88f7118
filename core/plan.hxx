#ifndef CUMULUS_CORE_PLAN_HXX
#define CUMULUS_CORE_PLAN_HXX

#include <string>
#include <vector>
#include <map>
#include "core/util.hxx"
#include "core/cidr.hxx"
#include "core/provision.hxx"

namespace cumulus
{
  using NodeId = size_t;

  // a data reference to an attribute another node resolves to
  struct Ref
  {
    Ref(NodeId node, std::string attr = "id");

    NodeId node;
    std::string attr;

    Json json() const;
  };

  // Node ----------------------------------------------------------------------
  struct Node
  {
    enum class Kind
    {
      Vpc,
      InternetGateway,
      RouteTable,
      Subnet,
      RouteTableAssociation,
      ElasticIp,
      NatGateway
    };

    NodeId index;
    Kind kind;
    std::string name;
    Tags tags;

    // literal inputs
    Json props;

    // inputs that are outputs of other nodes
    std::map<std::string, Ref> refs;

    // ordering edges that carry no data
    std::vector<NodeId> dependsOn;

    // union of referenced nodes and explicit edges, sorted
    std::vector<NodeId> dependencies() const;

    Json json() const;
  };

  std::string to_string(Node::Kind);

  // Plan ----------------------------------------------------------------------

  /*
   * The provisioning dependency graph of one topology construction. Nodes can
   * only reference nodes declared before them so a plan is always acyclic and
   * declaration order is a valid resolution order.
   */
  class Plan
  {
    public:
      NodeId vpc(std::string name, IpV4Address cidr, DnsOptions, Tags);

      NodeId internetGateway(std::string name, NodeId vpc, Tags);

      NodeId routeTable(std::string name, NodeId vpc, IpV4Address destination,
                        Route::Target, NodeId target, Tags,
                        std::vector<NodeId> dependsOn = {});

      NodeId subnet(std::string name, NodeId vpc, std::string az,
                    IpV4Address cidr, bool assignPublicIp, Tags,
                    std::vector<NodeId> dependsOn = {});

      NodeId association(std::string name, NodeId subnet, NodeId routeTable,
                         std::vector<NodeId> dependsOn = {});

      NodeId elasticIp(std::string name, Tags,
                       std::vector<NodeId> dependsOn = {});

      NodeId natGateway(std::string name, NodeId subnet, NodeId eip, Tags,
                        std::vector<NodeId> dependsOn = {});

      const std::vector<Node> & nodes() const;
      const Node & at(NodeId) const;
      size_t size() const;

      size_t count(Node::Kind) const;
      std::vector<NodeId> ofKind(Node::Kind) const;

      // true if a (transitively) waits on b
      bool dependsOn(NodeId a, NodeId b) const;

      Json json() const;

    private:
      NodeId add(Node);
      std::vector<Node> nodes_;
  };

}

#endif
