#include <future>
#include <functional>
#include <stdexcept>
#include <fmt/format.h>
#include "core/executor.hxx"
#include "core/errors.hxx"

using std::string;
using std::vector;
using std::function;
using std::shared_future;
using std::async;
using std::launch;
using std::exception_ptr;
using std::current_exception;
using std::rethrow_exception;
using std::out_of_range;
using std::move;

using namespace cumulus;

// Results ---------------------------------------------------------------------
Results::Results(vector<Attrs> attrs)
  : attrs_{move(attrs)}
{}

const Attrs & Results::at(NodeId i) const
{
  if(i >= attrs_.size())
  {
    throw out_of_range{fmt::format("no results for node {}", i)};
  }
  return attrs_[i];
}

const ResourceId & Results::attr(NodeId i, const string & a) const
{
  const Attrs & xs = at(i);
  auto it = xs.find(a);
  if(it == xs.end())
  {
    throw out_of_range{fmt::format("node {} has no attribute {}", i, a)};
  }
  return it->second;
}

const ResourceId & Results::id(NodeId i) const { return attr(i, "id"); }

size_t Results::size() const { return attrs_.size(); }

// resolution ------------------------------------------------------------------

using Resolved = function<const Attrs & (NodeId)>;

static Route::Target parseTarget(const string & s)
{
  if(s == to_string(Route::Target::InternetGateway))
    return Route::Target::InternetGateway;
  if(s == to_string(Route::Target::NatGateway))
    return Route::Target::NatGateway;

  throw out_of_range{s + " is not a valid route target"};
}

static Attrs provision(const Node & n, const Resolved & resolved,
                       Provisioner & p)
{
  auto in = [&n, &resolved](const string & name) -> const ResourceId &
  {
    const Ref & r = n.refs.at(name);
    const Attrs & a = resolved(r.node);
    auto i = a.find(r.attr);
    if(i == a.end())
    {
      throw out_of_range{
        fmt::format("{} '{}' references missing attribute {} of node {}",
          to_string(n.kind), n.name, r.attr, r.node)
      };
    }
    return i->second;
  };

  Attrs out;
  switch(n.kind)
  {
    case Node::Kind::Vpc:
    {
      DnsOptions dns;
      dns.support = n.props.at("dns_support").get<bool>();
      dns.hostnames = n.props.at("dns_hostnames").get<bool>();
      auto cidr = IpV4Address::parse(n.props.at("cidr").get<string>());
      VpcHandle h = p.createVpc(cidr, dns, n.tags);
      out["id"] = h.id;
      out["defaultSecurityGroupId"] = h.defaultSecurityGroupId;
      break;
    }
    case Node::Kind::InternetGateway:
      out["id"] = p.createInternetGateway(in("vpc"), n.tags).id;
      break;

    case Node::Kind::RouteTable:
    {
      Route r;
      r.destination = IpV4Address::parse(n.props.at("destination").get<string>());
      r.target = parseTarget(n.props.at("target").get<string>());
      r.targetId = in("target");
      out["id"] = p.createRouteTable(in("vpc"), {r}, n.tags).id;
      break;
    }
    case Node::Kind::Subnet:
      out["id"] = p.createSubnet(
          in("vpc"),
          n.props.at("availability_zone").get<string>(),
          IpV4Address::parse(n.props.at("cidr").get<string>()),
          n.props.at("assign_public_ip").get<bool>(),
          n.tags
      ).id;
      break;

    case Node::Kind::RouteTableAssociation:
      out["id"] = p.associateRouteTable(in("subnet"), in("route_table")).id;
      break;

    case Node::Kind::ElasticIp:
      out["id"] = p.createElasticIp(n.tags).id;
      break;

    case Node::Kind::NatGateway:
    {
      vector<ResourceId> after;
      for(NodeId d : n.dependsOn) after.push_back(resolved(d).at("id"));
      out["id"] = p.createNatGateway(
          in("subnet"), in("allocation"), n.tags, after).id;
      break;
    }
  }

  VLOG(1) << to_string(n.kind) << " '" << n.name << "' -> " << out["id"];
  return out;
}

// runs a single node once its dependencies are resolved. failures of
// dependencies surface as they are, failures of this node get wrapped
static Attrs settle(const Node & n, const Resolved & resolved, Provisioner & p)
{
  for(NodeId d : n.dependencies()) resolved(d);

  try { return provision(n, resolved, p); }
  catch(ProvisioningFailure &) { throw; }
  catch(...)
  {
    ProvisioningFailure f{to_string(n.kind), n.name, current_exception()};
    LOG(ERROR) << f.what();
    throw f;
  }
}

static Results executeSequential(const Plan & plan, Provisioner & p)
{
  vector<Attrs> attrs;
  attrs.reserve(plan.size());
  Resolved resolved = [&attrs](NodeId i) -> const Attrs & { return attrs.at(i); };

  for(const Node & n : plan.nodes())
  {
    attrs.push_back(settle(n, resolved, p));
  }
  return Results{attrs};
}

static Results executeConcurrent(const Plan & plan, Provisioner & p)
{
  // sized up front, tasks only ever read slots of earlier nodes which are
  // assigned before the reading task is launched
  vector<shared_future<Attrs>> fs(plan.size());
  Resolved resolved = [&fs](NodeId i) -> const Attrs & { return fs[i].get(); };

  // running tasks use fs and resolved, neither may go away before they finish
  auto drain = [&fs]()
  {
    for(auto & f : fs) if(f.valid()) f.wait();
  };

  try
  {
    for(const Node & n : plan.nodes())
    {
      fs[n.index] = async(launch::async, [&n, &resolved, &p]()
      {
        return settle(n, resolved, p);
      })
      .share();
    }
  }
  catch(std::exception & e)
  {
    LOG(ERROR) << "could not start plan tasks: " << e.what();
    drain();
    throw;
  }

  vector<Attrs> attrs;
  attrs.reserve(plan.size());
  exception_ptr failure;
  for(auto & f : fs)
  {
    try { attrs.push_back(f.get()); }
    catch(...)
    {
      if(!failure) failure = current_exception();
    }
  }

  if(failure) rethrow_exception(failure);
  return Results{attrs};
}

Results cumulus::execute(const Plan & plan, Provisioner & p, bool concurrent)
{
  LOG(INFO) << "executing plan with " << plan.size() << " nodes"
            << (concurrent ? "" : " sequentially");

  Results r = concurrent ? executeConcurrent(plan, p)
                         : executeSequential(plan, p);

  LOG(INFO) << "plan executed";
  return r;
}
