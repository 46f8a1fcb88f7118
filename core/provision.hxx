#ifndef CUMULUS_CORE_PROVISION_HXX
#define CUMULUS_CORE_PROVISION_HXX

/*
 * the interface boundary to the cloud provider. the engine never talks to a
 * provider directly, it declares a plan and the executor resolves each node
 * through these collaborators
 */

#include <string>
#include <vector>
#include "core/util.hxx"
#include "core/cidr.hxx"

namespace cumulus
{
  // handles ------------------------------------------------------------------

  struct VpcHandle
  {
    ResourceId id, defaultSecurityGroupId;
  };

  struct GatewayHandle { ResourceId id; };
  struct RouteTableHandle { ResourceId id; };
  struct SubnetHandle { ResourceId id; };
  struct AssociationHandle { ResourceId id; };
  struct EipHandle { ResourceId id; };
  struct NatHandle { ResourceId id; };

  // arguments ----------------------------------------------------------------

  struct DnsOptions
  {
    bool support{true},
         hostnames{true};
  };

  struct Route
  {
    enum class Target { InternetGateway, NatGateway };

    IpV4Address destination;
    Target target;
    ResourceId targetId;

    Json json() const;
  };

  std::string to_string(Route::Target);

  // collaborators ------------------------------------------------------------

  class Provisioner
  {
    public:
      virtual ~Provisioner() = default;

      virtual VpcHandle
      createVpc(const IpV4Address & cidr, DnsOptions, const Tags &) = 0;

      virtual GatewayHandle
      createInternetGateway(const ResourceId & vpc, const Tags &) = 0;

      virtual RouteTableHandle
      createRouteTable(const ResourceId & vpc, const std::vector<Route> &,
                       const Tags &) = 0;

      virtual SubnetHandle
      createSubnet(const ResourceId & vpc, const std::string & az,
                   const IpV4Address & cidr, bool assignPublicIp,
                   const Tags &) = 0;

      virtual AssociationHandle
      associateRouteTable(const ResourceId & subnet,
                          const ResourceId & routeTable) = 0;

      virtual EipHandle createElasticIp(const Tags &) = 0;

      // dependsOn lists the ids of resources that had to be in place before
      // this request was issued
      virtual NatHandle
      createNatGateway(const ResourceId & subnet,
                       const ResourceId & allocation,
                       const Tags &,
                       const std::vector<ResourceId> & dependsOn) = 0;
  };

  class Lookup
  {
    public:
      virtual ~Lookup() = default;

      virtual VpcHandle lookupDefaultVpc() = 0;
      virtual std::vector<ResourceId> lookupSubnetsOf(const ResourceId & vpc) = 0;
      virtual ResourceId lookupSecurityGroup(const std::string & name,
                                             const ResourceId & vpc) = 0;
  };

  class ZoneResolver
  {
    public:
      virtual ~ZoneResolver() = default;

      // deterministic index -> provider zone name mapping
      virtual std::string resolveAvailabilityZone(long index) = 0;
  };

}

#endif
