#ifndef CUMULUS_CORE_TOPOLOGY_HXX
#define CUMULUS_CORE_TOPOLOGY_HXX

#include <memory>
#include <string>
#include <vector>
#include <experimental/optional>
#include "core/util.hxx"

namespace cumulus
{
  using IdList = std::vector<ResourceId>;

  struct Topology_;

  // Topology ------------------------------------------------------------------

  /*
   * A finished network: vpc, one data subnet per availability zone, the
   * subnets with a direct internet route and the security groups. Topologies
   * are immutable, copies share the same underlying object.
   */
  class Topology
  {
    public:
      enum class Origin { Adopted, Constructed };

      Topology(std::string name,
               Origin origin,
               ResourceId vpcId,
               IdList subnetIds,
               IdList publicSubnetIds,
               IdList securityGroupIds,
               bool usePrivateSubnets);

      static Topology fromJson(Json);

      const std::string & name() const;
      const Uuid & id() const;
      Origin origin() const;

      const ResourceId & vpcId() const;
      const IdList & subnetIds() const;
      const IdList & publicSubnetIds() const;
      const IdList & securityGroupIds() const;
      bool usePrivateSubnets() const;

      // the named outputs exposed to downstream infrastructure
      Json outputs() const;

      Json json() const;

      // true if both handles refer to the very same topology object
      bool same(const Topology &) const;

    private:
      explicit Topology(std::shared_ptr<const Topology_>);
      std::shared_ptr<const Topology_> _;
  };

  bool operator == (const Topology &, const Topology &);
  bool operator != (const Topology &, const Topology &);

  std::string to_string(Topology::Origin);

  // Requests ------------------------------------------------------------------

  // bind to an existing vpc, nothing gets created
  struct AdoptArgs
  {
    ResourceId vpcId;
    std::experimental::optional<IdList> subnetIds,
                                        securityGroupIds,
                                        publicSubnetIds;
    std::experimental::optional<bool> usePrivateSubnets;

    Json json() const;
    static AdoptArgs fromJson(Json);
  };

  // build a new vpc from scratch
  struct ConstructArgs
  {
    std::experimental::optional<long> numberOfAvailabilityZones;
    std::experimental::optional<bool> usePrivateSubnets;
    Tags tags;

    Json json() const;
    static ConstructArgs fromJson(Json);
  };

  struct TopologyRequest
  {
    enum class Kind { Adopt, Construct };

    static TopologyRequest adopt(std::string name, AdoptArgs);
    static TopologyRequest construct(std::string name, ConstructArgs);

    // a request that names a vpc_id adopts it, anything else constructs
    static TopologyRequest fromJson(Json);
    Json json() const;

    Kind kind;
    std::string name;
    AdoptArgs adoptArgs;
    ConstructArgs constructArgs;
  };

  std::string to_string(TopologyRequest::Kind);

}

#endif
