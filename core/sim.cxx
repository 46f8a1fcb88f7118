#include <thread>
#include <stdexcept>
#include <algorithm>
#include <fmt/format.h>
#include "core/sim.hxx"

using std::string;
using std::vector;
using std::runtime_error;
using std::out_of_range;
using std::invalid_argument;
using std::mutex;
using std::lock_guard;
using std::remove;
using std::move;
using std::chrono::milliseconds;
using std::this_thread::sleep_for;

using namespace cumulus;

static const vector<string> provisioning_ops{
  "createVpc",
  "createInternetGateway",
  "createRouteTable",
  "createSubnet",
  "associateRouteTable",
  "createElasticIp",
  "createNatGateway"
};

static const vector<string> lookup_ops{
  "lookupDefaultVpc",
  "lookupSubnetsOf",
  "lookupSecurityGroup"
};

Json SimResource::json() const
{
  Json j;
  j["id"] = id;
  j["kind"] = kind;
  j["vpc"] = vpc;
  j["tags"] = tags;
  j["props"] = props.is_null() ? Json::object() : props;
  return j;
}

// setup -----------------------------------------------------------------------

SimCloud::SimCloud(string region, long defaultSubnets)
  : region_{region}
{
  if(defaultSubnets < 0 || defaultSubnets > MaxDefaultSubnets)
  {
    throw invalid_argument{
      fmt::format("the default vpc can hold 0 to {} subnets, not {}",
        MaxDefaultSubnets, defaultSubnets)
    };
  }

  // the default vpc every account comes with, all of its subnets are public
  IpV4Address space{"172.31.0.0", 16};

  SimResource vpc{newId("vpc"), "vpc", "", {{"Name", "default"}}, Json{}};
  vpc.vpc = vpc.id;
  vpc.props["cidr"] = space.cidr();
  vpc.props["default"] = true;

  SimResource sg{newId("sg"), "security-group", vpc.id, {}, Json{}};
  sg.props["name"] = "default";
  vpc.props["default_security_group"] = sg.id;

  SimResource igw{newId("igw"), "internet-gateway", vpc.id, {}, Json{}};
  vpc.props["internet_gateway"] = igw.id;

  Route r{IpV4Address{"0.0.0.0", 0}, Route::Target::InternetGateway, igw.id};
  SimResource rt{newId("rtb"), "route-table", vpc.id, {}, Json{}};
  rt.props["routes"] = Json::array({r.json()});
  rt.props["main"] = true;

  default_vpc_ = vpc.id;
  put(vpc);
  put(sg);
  put(igw);
  put(rt);

  for(long i=0; i<defaultSubnets; ++i)
  {
    IpV4Address block{"172.31.0.0", 20};
    block = block + static_cast<uint32_t>(i << 12);

    SimResource s{newId("subnet"), "subnet", vpc.id, {}, Json{}};
    s.props["cidr"] = block.cidr();
    s.props["availability_zone"] = resolveAvailabilityZone(i);
    s.props["assign_public_ip"] = true;
    s.props["route_table"] = rt.id;
    put(s);
  }
}

const string & SimCloud::region() const { return region_; }

SimCloud & SimCloud::failOn(string op, size_t nth)
{
  lock_guard<mutex> lk{mtx_};
  failures_[op] = calls_[op] + nth;
  return *this;
}

SimCloud & SimCloud::provisionDelay(milliseconds d)
{
  provision_delay_ = d;
  return *this;
}

SimCloud & SimCloud::lookupDelay(milliseconds d)
{
  lookup_delay_ = d;
  return *this;
}

// bookkeeping -----------------------------------------------------------------

void SimCloud::hit(const string & op, milliseconds delay)
{
  bool fail{false};
  {
    lock_guard<mutex> lk{mtx_};
    size_t n = ++calls_[op];
    auto i = failures_.find(op);
    if(i != failures_.end() && i->second == n)
    {
      failures_.erase(i);
      fail = true;
    }
  }

  if(delay.count() > 0) sleep_for(delay);
  if(fail) throw runtime_error{"injected failure in " + op};
}

ResourceId SimCloud::newId(const string & prefix) const
{
  string u = Uuid{}.str();
  u.erase(remove(u.begin(), u.end(), '-'), u.end());
  return prefix + "-" + u.substr(0, 17);
}

const SimResource & SimCloud::get(const ResourceId & id, const string & kind) const
{
  auto i = resources_.find(id);
  if(i == resources_.end() || i->second.kind != kind)
  {
    throw invalid_argument{fmt::format("{} {} does not exist", kind, id)};
  }
  return i->second;
}

SimResource & SimCloud::put(SimResource r)
{
  order_.push_back(r.id);
  auto & x = resources_[r.id];
  x = move(r);
  return x;
}

bool SimCloud::routesToInternet(const ResourceId & subnet) const
{
  const SimResource & s = get(subnet, "subnet");
  if(s.props.find("route_table") == s.props.end()) return false;

  const SimResource & rt = get(s.props.at("route_table").get<string>(),
                               "route-table");
  for(const Json & r : rt.props.at("routes"))
  {
    if(r.at("target").get<string>() != to_string(Route::Target::InternetGateway))
      continue;

    auto i = resources_.find(r.at("target_id").get<string>());
    if(i != resources_.end() && i->second.kind == "internet-gateway")
      return true;
  }
  return false;
}

size_t SimCloud::calls(const string & op) const
{
  lock_guard<mutex> lk{mtx_};
  auto i = calls_.find(op);
  return i == calls_.end() ? 0 : i->second;
}

size_t SimCloud::provisioningCalls() const
{
  size_t n{0};
  for(const string & op : provisioning_ops) n += calls(op);
  return n;
}

size_t SimCloud::lookupCalls() const
{
  size_t n{0};
  for(const string & op : lookup_ops) n += calls(op);
  return n;
}

SimResource SimCloud::resource(const ResourceId & id) const
{
  lock_guard<mutex> lk{mtx_};
  auto i = resources_.find(id);
  if(i == resources_.end()) throw out_of_range{"no such resource " + id};
  return i->second;
}

vector<SimResource> SimCloud::resources(const string & kind) const
{
  lock_guard<mutex> lk{mtx_};
  vector<SimResource> xs;
  for(const ResourceId & id : order_)
  {
    const SimResource & r = resources_.at(id);
    if(r.kind == kind) xs.push_back(r);
  }
  return xs;
}

size_t SimCloud::count(const string & kind) const
{
  return resources(kind).size();
}

Json SimCloud::json() const
{
  lock_guard<mutex> lk{mtx_};
  Json j;
  j["region"] = region_;
  j["resources"] = Json::array();
  for(const ResourceId & id : order_)
    j["resources"].push_back(resources_.at(id).json());
  return j;
}

// Provisioner -----------------------------------------------------------------

VpcHandle SimCloud::createVpc(const IpV4Address & cidr, DnsOptions dns,
                              const Tags & tags)
{
  hit("createVpc", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  if(cidr.mask() < 16 || cidr.mask() > 28)
  {
    throw invalid_argument{"vpc block size must be between /16 and /28"};
  }

  SimResource vpc{newId("vpc"), "vpc", "", tags, Json{}};
  vpc.vpc = vpc.id;
  vpc.props["cidr"] = cidr.cidr();
  vpc.props["dns_support"] = dns.support;
  vpc.props["dns_hostnames"] = dns.hostnames;

  SimResource sg{newId("sg"), "security-group", vpc.id, {}, Json{}};
  sg.props["name"] = "default";
  vpc.props["default_security_group"] = sg.id;

  put(sg);
  put(vpc);
  return VpcHandle{vpc.id, sg.id};
}

GatewayHandle SimCloud::createInternetGateway(const ResourceId & vpc_id,
                                              const Tags & tags)
{
  hit("createInternetGateway", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  SimResource & vpc = resources_.at(get(vpc_id, "vpc").id);
  if(vpc.props.find("internet_gateway") != vpc.props.end())
  {
    throw invalid_argument{"vpc " + vpc_id + " already has an internet gateway"};
  }

  SimResource igw{newId("igw"), "internet-gateway", vpc_id, tags, Json{}};
  vpc.props["internet_gateway"] = igw.id;
  put(igw);
  return GatewayHandle{igw.id};
}

RouteTableHandle SimCloud::createRouteTable(const ResourceId & vpc_id,
                                            const vector<Route> & routes,
                                            const Tags & tags)
{
  hit("createRouteTable", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  get(vpc_id, "vpc");

  SimResource rt{newId("rtb"), "route-table", vpc_id, tags, Json{}};
  rt.props["routes"] = Json::array();
  for(const Route & r : routes)
  {
    string kind = r.target == Route::Target::InternetGateway
                ? "internet-gateway" : "nat-gateway";

    const SimResource & target = get(r.targetId, kind);
    if(target.vpc != vpc_id)
    {
      throw invalid_argument{
        fmt::format("route target {} is not in vpc {}", r.targetId, vpc_id)
      };
    }
    rt.props["routes"].push_back(r.json());
  }

  put(rt);
  return RouteTableHandle{rt.id};
}

SubnetHandle SimCloud::createSubnet(const ResourceId & vpc_id,
                                    const string & az,
                                    const IpV4Address & cidr,
                                    bool assignPublicIp,
                                    const Tags & tags)
{
  hit("createSubnet", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  const SimResource & vpc = get(vpc_id, "vpc");
  auto space = IpV4Address::parse(vpc.props.at("cidr").get<string>());
  if(!space.contains(cidr))
  {
    throw invalid_argument{
      fmt::format("subnet {} is not inside vpc block {}", cidr.cidr(),
        space.cidr())
    };
  }

  if(az.compare(0, region_.size(), region_) != 0)
  {
    throw invalid_argument{az + " is not an availability zone of " + region_};
  }

  for(const ResourceId & id : order_)
  {
    const SimResource & r = resources_.at(id);
    if(r.kind != "subnet" || r.vpc != vpc_id) continue;

    auto other = IpV4Address::parse(r.props.at("cidr").get<string>());
    if(other.overlaps(cidr))
    {
      throw invalid_argument{
        fmt::format("subnet {} overlaps {} ({})", cidr.cidr(), r.id,
          other.cidr())
      };
    }
  }

  SimResource s{newId("subnet"), "subnet", vpc_id, tags, Json{}};
  s.props["cidr"] = cidr.cidr();
  s.props["availability_zone"] = az;
  s.props["assign_public_ip"] = assignPublicIp;
  put(s);
  return SubnetHandle{s.id};
}

AssociationHandle SimCloud::associateRouteTable(const ResourceId & subnet_id,
                                                const ResourceId & rt_id)
{
  hit("associateRouteTable", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  const SimResource & rt = get(rt_id, "route-table");
  SimResource & s = resources_.at(get(subnet_id, "subnet").id);

  if(s.vpc != rt.vpc)
  {
    throw invalid_argument{
      fmt::format("subnet {} and route table {} are in different vpcs",
        subnet_id, rt_id)
    };
  }
  if(s.props.find("route_table") != s.props.end())
  {
    throw invalid_argument{"subnet " + subnet_id + " is already associated"};
  }

  s.props["route_table"] = rt_id;

  SimResource a{newId("rtbassoc"), "route-table-association", s.vpc, {}, Json{}};
  a.props["subnet"] = subnet_id;
  a.props["route_table"] = rt_id;
  put(a);
  return AssociationHandle{a.id};
}

EipHandle SimCloud::createElasticIp(const Tags & tags)
{
  hit("createElasticIp", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  SimResource e{newId("eipalloc"), "elastic-ip", "", tags, Json{}};
  put(e);
  return EipHandle{e.id};
}

NatHandle SimCloud::createNatGateway(const ResourceId & subnet_id,
                                     const ResourceId & allocation,
                                     const Tags & tags,
                                     const vector<ResourceId> & dependsOn)
{
  hit("createNatGateway", provision_delay_);
  lock_guard<mutex> lk{mtx_};

  const SimResource & s = get(subnet_id, "subnet");
  SimResource & eip = resources_.at(get(allocation, "elastic-ip").id);

  if(eip.props.find("nat_gateway") != eip.props.end())
  {
    throw invalid_argument{"elastic ip " + allocation + " is already in use"};
  }
  for(const ResourceId & d : dependsOn)
  {
    if(resources_.find(d) == resources_.end())
    {
      throw invalid_argument{"nat gateway dependency " + d + " does not exist"};
    }
  }
  if(!routesToInternet(subnet_id))
  {
    throw invalid_argument{
      "subnet " + subnet_id + " has no route to an internet gateway"
    };
  }

  SimResource nat{newId("nat"), "nat-gateway", s.vpc, tags, Json{}};
  nat.props["subnet"] = subnet_id;
  nat.props["allocation"] = allocation;
  nat.props["depends_on"] = dependsOn;
  eip.props["nat_gateway"] = nat.id;
  put(nat);
  return NatHandle{nat.id};
}

// Lookup ----------------------------------------------------------------------

VpcHandle SimCloud::lookupDefaultVpc()
{
  hit("lookupDefaultVpc", lookup_delay_);
  lock_guard<mutex> lk{mtx_};

  const SimResource & vpc = get(default_vpc_, "vpc");
  return VpcHandle{
    vpc.id,
    vpc.props.at("default_security_group").get<string>()
  };
}

vector<ResourceId> SimCloud::lookupSubnetsOf(const ResourceId & vpc_id)
{
  hit("lookupSubnetsOf", lookup_delay_);
  lock_guard<mutex> lk{mtx_};

  get(vpc_id, "vpc");
  vector<ResourceId> xs;
  for(const ResourceId & id : order_)
  {
    const SimResource & r = resources_.at(id);
    if(r.kind == "subnet" && r.vpc == vpc_id) xs.push_back(id);
  }
  return xs;
}

ResourceId SimCloud::lookupSecurityGroup(const string & name,
                                         const ResourceId & vpc_id)
{
  hit("lookupSecurityGroup", lookup_delay_);
  lock_guard<mutex> lk{mtx_};

  get(vpc_id, "vpc");
  for(const ResourceId & id : order_)
  {
    const SimResource & r = resources_.at(id);
    if(r.kind == "security-group" && r.vpc == vpc_id &&
       r.props.at("name").get<string>() == name)
    {
      return id;
    }
  }
  throw out_of_range{
    fmt::format("vpc {} has no security group named {}", vpc_id, name)
  };
}

// ZoneResolver ----------------------------------------------------------------

string SimCloud::resolveAvailabilityZone(long index)
{
  if(index < 0 || index >= 26)
  {
    throw out_of_range{fmt::format("no availability zone with index {}", index)};
  }
  return region_ + static_cast<char>('a' + index);
}
