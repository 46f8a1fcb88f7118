#include <fmt/format.h>
#include "core/subnets.hxx"

using std::string;
using std::experimental::make_optional;

using namespace cumulus;

IpV4Address cumulus::anywhere()
{
  return IpV4Address{"0.0.0.0", 0};
}

static Tags named(const ConstructSettings & s, const string & name)
{
  return merge(s.tags, {{"Name", name}});
}

ZoneLayout cumulus::buildZone(Plan & plan,
                              const string & name,
                              long zone,
                              const SharedNetwork & net,
                              const ConstructSettings & s,
                              ZoneResolver & zones)
{
  ZoneLayout z;
  z.zone = zone;
  z.availabilityZone = zones.resolveAvailabilityZone(zone);
  z.blocks = allocateZone(zone, s.usePrivateSubnets);

  // zones only start once the shared public route exists
  const NodeId after = net.publicRouteTable;

  string subnet_name = fmt::format("{}-{}", name, zone);
  z.subnet = plan.subnet(
      subnet_name,
      net.vpc,
      z.availabilityZone,
      z.blocks.primary,
      !s.usePrivateSubnets,
      named(s, subnet_name),
      {after}
  );

  if(!s.usePrivateSubnets)
  {
    z.publicSubnet = z.subnet;
    z.routeTable = net.publicRouteTable;
  }
  else
  {
    string nat_name = fmt::format("{}-nat-{}", name, zone);

    z.publicSubnet = plan.subnet(
        nat_name,
        net.vpc,
        z.availabilityZone,
        *z.blocks.nat,
        true,
        named(s, nat_name),
        {after}
    );

    NodeId routes = plan.association(nat_name, z.publicSubnet, 
                                     net.publicRouteTable);
    z.natAssociation = make_optional(routes);

    NodeId eip = plan.elasticIp(nat_name, named(s, nat_name), {after});
    z.elasticIp = make_optional(eip);

    // the association is what makes the nat facing subnet routable, the
    // gateway must not start before it
    NodeId nat = plan.natGateway(nat_name, z.publicSubnet, eip, 
                                 named(s, nat_name), {routes});
    z.natGateway = make_optional(nat);

    z.routeTable = plan.routeTable(
        nat_name,
        net.vpc,
        anywhere(),
        Route::Target::NatGateway,
        nat,
        named(s, name)
    );
  }

  z.association = plan.association(subnet_name, z.subnet, z.routeTable);

  LOG(INFO) << fmt::format("zone {} ({}) {}: subnet {}{}",
      zone, 
      z.availabilityZone,
      s.usePrivateSubnets ? "private" : "public",
      z.blocks.primary.cidr(),
      z.blocks.nat ? ", nat subnet " + z.blocks.nat->cidr() : string{}
  );

  return z;
}
