#ifndef CUMULUS_CORE_SUBNETS_HXX
#define CUMULUS_CORE_SUBNETS_HXX

#include <string>
#include <experimental/optional>
#include "core/plan.hxx"
#include "core/cidr.hxx"
#include "core/validate.hxx"
#include "core/provision.hxx"

namespace cumulus
{
  // the nodes every zone of a topology shares
  struct SharedNetwork
  {
    NodeId vpc, internetGateway, publicRouteTable;
  };

  // what got declared for a single availability zone
  struct ZoneLayout
  {
    long zone;
    std::string availabilityZone;
    ZoneBlocks blocks;

    // the data subnet, the subnet counted as public for this zone (the data 
    // subnet itself or the nat facing one) and where the data subnet routes
    NodeId subnet, publicSubnet, routeTable, association;

    // only set for private zones
    std::experimental::optional<NodeId> natAssociation, elasticIp, natGateway;
  };

  // the default route every egress route table carries
  IpV4Address anywhere();

  /*
   * Declares the subnets of one zone and its egress path. Public zones route
   * through the shared public route table. Private zones get a nat facing 
   * subnet, an elastic ip, a nat gateway that explicitly waits for the nat 
   * facing subnet to be routable, and a private route table through it.
   */
  ZoneLayout buildZone(Plan &,
                       const std::string & name,
                       long zone,
                       const SharedNetwork &,
                       const ConstructSettings &,
                       ZoneResolver &);
}

#endif
