#include "core/validate.hxx"
#include "core/errors.hxx"

using namespace cumulus;

void cumulus::validate(const AdoptArgs & a)
{
  if(!a.subnetIds) throw MissingField{"subnet_ids"};
  if(!a.securityGroupIds) throw MissingField{"security_group_ids"};
  if(!a.publicSubnetIds) throw MissingField{"public_subnet_ids"};
}

ConstructSettings cumulus::validate(const ConstructArgs & c)
{
  ConstructSettings s;
  s.zones = c.numberOfAvailabilityZones.value_or(DefaultZoneCount);
  if(s.zones < 1 || s.zones > MaxZoneCount) throw InvalidZoneCount{s.zones};

  s.usePrivateSubnets = c.usePrivateSubnets.value_or(false);
  s.tags = c.tags;
  return s;
}
