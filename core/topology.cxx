#include <stdexcept>
#include "core/topology.hxx"

using std::string;
using std::vector;
using std::runtime_error;
using std::out_of_range;
using std::make_shared;
using std::shared_ptr;
using std::move;
using std::experimental::optional;
using std::experimental::make_optional;

using namespace cumulus;

// internal data structures ----------------------------------------------------
namespace cumulus
{
  struct Topology_
  {
    string name;
    Uuid id;
    Topology::Origin origin;

    ResourceId vpcId;
    IdList subnetIds,
           publicSubnetIds,
           securityGroupIds;
    bool usePrivateSubnets{false};
  };
}

// Topology --------------------------------------------------------------------
Topology::Topology(string name,
                   Origin origin,
                   ResourceId vpcId,
                   IdList subnetIds,
                   IdList publicSubnetIds,
                   IdList securityGroupIds,
                   bool usePrivateSubnets)
{
  auto t = make_shared<Topology_>();
  t->name = name;
  t->origin = origin;
  t->vpcId = vpcId;
  t->subnetIds = move(subnetIds);
  t->publicSubnetIds = move(publicSubnetIds);
  t->securityGroupIds = move(securityGroupIds);
  t->usePrivateSubnets = usePrivateSubnets;
  _ = t;
}

Topology::Topology(shared_ptr<const Topology_> t)
  : _{t}
{}

const string & Topology::name() const { return _->name; }
const Uuid & Topology::id() const { return _->id; }
Topology::Origin Topology::origin() const { return _->origin; }
const ResourceId & Topology::vpcId() const { return _->vpcId; }
const IdList & Topology::subnetIds() const { return _->subnetIds; }
const IdList & Topology::publicSubnetIds() const { return _->publicSubnetIds; }
const IdList & Topology::securityGroupIds() const { return _->securityGroupIds; }
bool Topology::usePrivateSubnets() const { return _->usePrivateSubnets; }

bool Topology::same(const Topology & x) const { return _ == x._; }

Json Topology::outputs() const
{
  Json j;
  j["vpc_id"] = vpcId();
  j["subnet_ids"] = subnetIds();
  j["use_private_subnets"] = usePrivateSubnets();
  j["security_group_ids"] = securityGroupIds();
  j["public_subnet_ids"] = publicSubnetIds();
  return j;
}

Json Topology::json() const
{
  Json j = outputs();
  j["name"] = name();
  j["id"] = id().json();
  j["origin"] = to_string(origin());
  return j;
}

static Topology::Origin parseOrigin(const string & s)
{
  if(s == "adopted") return Topology::Origin::Adopted;
  if(s == "constructed") return Topology::Origin::Constructed;

  throw runtime_error{s + " is not a valid topology origin"};
}

Topology Topology::fromJson(Json j)
{
  auto t = make_shared<Topology_>();
  t->name = extract(j, "name", "topology").get<string>();
  t->id = Uuid::fromJson( extract(j, "id", "topology") );
  t->origin = parseOrigin( extract(j, "origin", "topology").get<string>() );
  t->vpcId = extract(j, "vpc_id", "topology").get<string>();
  t->subnetIds = extract(j, "subnet_ids", "topology").get<IdList>();
  t->publicSubnetIds = extract(j, "public_subnet_ids", "topology").get<IdList>();
  t->securityGroupIds =
    extract(j, "security_group_ids", "topology").get<IdList>();
  t->usePrivateSubnets =
    extract(j, "use_private_subnets", "topology").get<bool>();

  return Topology{shared_ptr<const Topology_>{t}};
}

bool cumulus::operator== (const Topology & a, const Topology & b)
{
  if(a.name() != b.name()) return false;
  if(a.origin() != b.origin()) return false;
  if(a.vpcId() != b.vpcId()) return false;
  if(a.subnetIds() != b.subnetIds()) return false;
  if(a.publicSubnetIds() != b.publicSubnetIds()) return false;
  if(a.securityGroupIds() != b.securityGroupIds()) return false;
  if(a.usePrivateSubnets() != b.usePrivateSubnets()) return false;

  return true;
}

bool cumulus::operator!= (const Topology & a, const Topology & b)
{
  return !(a == b);
}

string cumulus::to_string(Topology::Origin x)
{
  switch(x)
  {
    case Topology::Origin::Adopted: return "adopted";
    case Topology::Origin::Constructed: return "constructed";
  }
  return "unknown";
}

// AdoptArgs -------------------------------------------------------------------

template <class T>
static optional<T> maybe(const Json & j, const string & tag)
{
  auto i = j.find(tag);
  if(i == j.end() || i->is_null()) return optional<T>{};
  return make_optional(i->get<T>());
}

Json AdoptArgs::json() const
{
  Json j;
  j["vpc_id"] = vpcId;
  if(subnetIds) j["subnet_ids"] = *subnetIds;
  if(securityGroupIds) j["security_group_ids"] = *securityGroupIds;
  if(publicSubnetIds) j["public_subnet_ids"] = *publicSubnetIds;
  if(usePrivateSubnets) j["use_private_subnets"] = *usePrivateSubnets;
  return j;
}

AdoptArgs AdoptArgs::fromJson(Json j)
{
  AdoptArgs a;
  a.vpcId = extract(j, "vpc_id", "adopt").get<string>();
  a.subnetIds = maybe<IdList>(j, "subnet_ids");
  a.securityGroupIds = maybe<IdList>(j, "security_group_ids");
  a.publicSubnetIds = maybe<IdList>(j, "public_subnet_ids");
  a.usePrivateSubnets = maybe<bool>(j, "use_private_subnets");
  return a;
}

// ConstructArgs ---------------------------------------------------------------

Json ConstructArgs::json() const
{
  Json j;
  if(numberOfAvailabilityZones)
    j["number_of_availability_zones"] = *numberOfAvailabilityZones;
  if(usePrivateSubnets) j["use_private_subnets"] = *usePrivateSubnets;
  j["tags"] = tags;
  return j;
}

ConstructArgs ConstructArgs::fromJson(Json j)
{
  ConstructArgs c;
  c.numberOfAvailabilityZones = maybe<long>(j, "number_of_availability_zones");
  c.usePrivateSubnets = maybe<bool>(j, "use_private_subnets");
  auto tags = maybe<Tags>(j, "tags");
  if(tags) c.tags = *tags;
  return c;
}

// TopologyRequest -------------------------------------------------------------

TopologyRequest TopologyRequest::adopt(string name, AdoptArgs args)
{
  TopologyRequest r;
  r.kind = Kind::Adopt;
  r.name = name;
  r.adoptArgs = move(args);
  return r;
}

TopologyRequest TopologyRequest::construct(string name, ConstructArgs args)
{
  TopologyRequest r;
  r.kind = Kind::Construct;
  r.name = name;
  r.constructArgs = move(args);
  return r;
}

TopologyRequest TopologyRequest::fromJson(Json j)
{
  string name = extract(j, "name", "request").get<string>();

  auto vpc = j.find("vpc_id");
  if(vpc != j.end() && !vpc->is_null()) 
    return adopt(name, AdoptArgs::fromJson(j));

  return construct(name, ConstructArgs::fromJson(j));
}

Json TopologyRequest::json() const
{
  Json j = kind == Kind::Adopt ? adoptArgs.json() : constructArgs.json();
  j["name"] = name;
  return j;
}

string cumulus::to_string(TopologyRequest::Kind x)
{
  switch(x)
  {
    case TopologyRequest::Kind::Adopt: return "adopt";
    case TopologyRequest::Kind::Construct: return "construct";
  }
  return "unknown";
}
