#include <fmt/format.h>
#include "core/assembler.hxx"
#include "core/errors.hxx"

using std::string;
using std::vector;

using namespace cumulus;

NetworkPlan cumulus::planNetwork(const string & name, 
                                 const ConstructSettings & s,
                                 ZoneResolver & zones)
{
  NetworkPlan np;
  np.name = name;
  np.settings = s;
  Plan & p = np.plan;

  Tags tags = merge(s.tags, {{"Name", name}});

  DnsOptions dns;
  dns.support = true;
  dns.hostnames = true;

  np.shared.vpc = p.vpc(name, networkPrefix(), dns, tags);
  np.shared.internetGateway = p.internetGateway(name, np.shared.vpc, tags);
  np.shared.publicRouteTable = p.routeTable(
      name,
      np.shared.vpc,
      anywhere(),
      Route::Target::InternetGateway,
      np.shared.internetGateway,
      tags
  );

  for(long i=0; i<s.zones; ++i)
  {
    np.zones.push_back(buildZone(p, name, i, np.shared, s, zones));
  }

  LOG(INFO) << fmt::format("planned network {}: {} zones, {} subnets, {} nodes",
      name, s.zones, p.count(Node::Kind::Subnet), p.size());

  return np;
}

Topology cumulus::assemble(const NetworkPlan & np, const Results & r)
{
  IdList subnets, public_subnets;
  for(const ZoneLayout & z : np.zones)
  {
    subnets.push_back(r.id(z.subnet));
    public_subnets.push_back(r.id(z.publicSubnet));
  }

  return Topology{
    np.name,
    Topology::Origin::Constructed,
    r.id(np.shared.vpc),
    subnets,
    public_subnets,
    { r.attr(np.shared.vpc, "defaultSecurityGroupId") },
    np.settings.usePrivateSubnets
  };
}

Topology cumulus::construct(const string & name, const ConstructArgs & args,
                            Provisioner & p, ZoneResolver & zones,
                            AssembleOptions opts)
{
  ConstructSettings s = validate(args);
  NetworkPlan np = planNetwork(name, s, zones);

  Results r;
  try { r = execute(np.plan, p, opts.concurrent); }
  catch(ProvisioningFailure & e)
  {
    LOG(ERROR) << "constructing network " << name << " failed: " << e.what();
    throw;
  }

  Topology t = assemble(np, r);
  LOG(INFO) << "constructed network " << name << " in " << t.vpcId();
  return t;
}

Topology cumulus::adopt(const string & name, const AdoptArgs & args)
{
  validate(args);

  LOG(INFO) << "adopting " << args.vpcId << " as network " << name;

  return Topology{
    name,
    Topology::Origin::Adopted,
    args.vpcId,
    *args.subnetIds,
    *args.publicSubnetIds,
    *args.securityGroupIds,
    args.usePrivateSubnets.value_or(false)
  };
}

Topology cumulus::materialize(const TopologyRequest & rq, Provisioner & p,
                              ZoneResolver & zones, AssembleOptions opts)
{
  switch(rq.kind)
  {
    case TopologyRequest::Kind::Adopt: 
      return adopt(rq.name, rq.adoptArgs);

    case TopologyRequest::Kind::Construct: 
      return construct(rq.name, rq.constructArgs, p, zones, opts);
  }
  throw std::runtime_error{"unknown topology request kind"};
}
