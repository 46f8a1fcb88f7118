#include <fmt/format.h>
#include "requests.hxx"

using std::experimental::make_optional;
using namespace cumulus;

TopologyRequest cumulus::publicNetwork(long zones)
{
  ConstructArgs c;
  c.numberOfAvailabilityZones = make_optional(zones);
  c.usePrivateSubnets = make_optional(false);
  c.tags = {{"team", "infra"}};

  return TopologyRequest::construct(fmt::format("pub{}", zones), c);
}

TopologyRequest cumulus::privateNetwork(long zones)
{
  ConstructArgs c;
  c.numberOfAvailabilityZones = make_optional(zones);
  c.usePrivateSubnets = make_optional(true);
  c.tags = {{"team", "infra"}};

  return TopologyRequest::construct(fmt::format("priv{}", zones), c);
}

TopologyRequest cumulus::adoptedNetwork()
{
  AdoptArgs a;
  a.vpcId = "vpc-0a1b2c3d4e5f60718";
  a.subnetIds = make_optional(IdList{
      "subnet-0aaaaaaaaaaaaaaaa",
      "subnet-0bbbbbbbbbbbbbbbb"
  });
  a.publicSubnetIds = make_optional(IdList{
      "subnet-0cccccccccccccccc",
      "subnet-0dddddddddddddddd"
  });
  a.securityGroupIds = make_optional(IdList{"sg-0eeeeeeeeeeeeeeee"});
  a.usePrivateSubnets = make_optional(true);

  return TopologyRequest::adopt("existing", a);
}
