#include <stdexcept>
#include <algorithm>
#include <fmt/format.h>
#include "core/plan.hxx"

using std::string;
using std::vector;
using std::out_of_range;
using std::sort;
using std::unique;
using std::move;

using namespace cumulus;

// Ref -------------------------------------------------------------------------
Ref::Ref(NodeId node, string attr)
  : node{node}, attr{attr}
{}

Json Ref::json() const
{
  Json j;
  j["node"] = node;
  j["attr"] = attr;
  return j;
}

// Node ------------------------------------------------------------------------
vector<NodeId> Node::dependencies() const
{
  vector<NodeId> ds = dependsOn;
  for(const auto & p : refs) ds.push_back(p.second.node);

  sort(ds.begin(), ds.end());
  ds.erase(unique(ds.begin(), ds.end()), ds.end());
  return ds;
}

Json Node::json() const
{
  Json j;
  j["index"] = index;
  j["kind"] = to_string(kind);
  j["name"] = name;
  j["tags"] = tags;
  j["props"] = props.is_null() ? Json::object() : props;

  Json rs = Json::object();
  for(const auto & p : refs) rs[p.first] = p.second.json();
  j["refs"] = rs;
  j["depends_on"] = dependsOn;
  return j;
}

string cumulus::to_string(Node::Kind x)
{
  switch(x)
  {
    case Node::Kind::Vpc: return "vpc";
    case Node::Kind::InternetGateway: return "internet-gateway";
    case Node::Kind::RouteTable: return "route-table";
    case Node::Kind::Subnet: return "subnet";
    case Node::Kind::RouteTableAssociation: return "route-table-association";
    case Node::Kind::ElasticIp: return "elastic-ip";
    case Node::Kind::NatGateway: return "nat-gateway";
  }
  return "unknown";
}

// Plan ------------------------------------------------------------------------
NodeId Plan::add(Node n)
{
  n.index = nodes_.size();
  for(NodeId d : n.dependencies())
  {
    if(d >= n.index)
    {
      throw out_of_range{
        fmt::format("{} '{}' depends on undeclared node {}",
          to_string(n.kind), n.name, d)
      };
    }
  }
  nodes_.push_back(move(n));
  return nodes_.back().index;
}

NodeId Plan::vpc(string name, IpV4Address cidr, DnsOptions dns, Tags tags)
{
  Node n;
  n.kind = Node::Kind::Vpc;
  n.name = name;
  n.tags = tags;
  n.props["cidr"] = cidr.cidr();
  n.props["dns_support"] = dns.support;
  n.props["dns_hostnames"] = dns.hostnames;
  return add(n);
}

NodeId Plan::internetGateway(string name, NodeId vpc, Tags tags)
{
  Node n;
  n.kind = Node::Kind::InternetGateway;
  n.name = name;
  n.tags = tags;
  n.refs.emplace("vpc", Ref{vpc});
  return add(n);
}

NodeId Plan::routeTable(string name, NodeId vpc, IpV4Address destination,
                        Route::Target target, NodeId via, Tags tags,
                        vector<NodeId> dependsOn)
{
  Node n;
  n.kind = Node::Kind::RouteTable;
  n.name = name;
  n.tags = tags;
  n.props["destination"] = destination.cidr();
  n.props["target"] = to_string(target);
  n.refs.emplace("vpc", Ref{vpc});
  n.refs.emplace("target", Ref{via});
  n.dependsOn = dependsOn;
  return add(n);
}

NodeId Plan::subnet(string name, NodeId vpc, string az, IpV4Address cidr,
                    bool assignPublicIp, Tags tags, vector<NodeId> dependsOn)
{
  Node n;
  n.kind = Node::Kind::Subnet;
  n.name = name;
  n.tags = tags;
  n.props["availability_zone"] = az;
  n.props["cidr"] = cidr.cidr();
  n.props["assign_public_ip"] = assignPublicIp;
  n.refs.emplace("vpc", Ref{vpc});
  n.dependsOn = dependsOn;
  return add(n);
}

NodeId Plan::association(string name, NodeId subnet, NodeId routeTable,
                         vector<NodeId> dependsOn)
{
  Node n;
  n.kind = Node::Kind::RouteTableAssociation;
  n.name = name;
  n.refs.emplace("subnet", Ref{subnet});
  n.refs.emplace("route_table", Ref{routeTable});
  n.dependsOn = dependsOn;
  return add(n);
}

NodeId Plan::elasticIp(string name, Tags tags, vector<NodeId> dependsOn)
{
  Node n;
  n.kind = Node::Kind::ElasticIp;
  n.name = name;
  n.tags = tags;
  n.dependsOn = dependsOn;
  return add(n);
}

NodeId Plan::natGateway(string name, NodeId subnet, NodeId eip, Tags tags,
                        vector<NodeId> dependsOn)
{
  Node n;
  n.kind = Node::Kind::NatGateway;
  n.name = name;
  n.tags = tags;
  n.refs.emplace("subnet", Ref{subnet});
  n.refs.emplace("allocation", Ref{eip});
  n.dependsOn = dependsOn;
  return add(n);
}

const vector<Node> & Plan::nodes() const { return nodes_; }

const Node & Plan::at(NodeId i) const
{
  if(i >= nodes_.size())
  {
    throw out_of_range{fmt::format("plan does not contain node {}", i)};
  }
  return nodes_[i];
}

size_t Plan::size() const { return nodes_.size(); }

size_t Plan::count(Node::Kind k) const
{
  return ofKind(k).size();
}

vector<NodeId> Plan::ofKind(Node::Kind k) const
{
  vector<NodeId> xs;
  for(const Node & n : nodes_)
  {
    if(n.kind == k) xs.push_back(n.index);
  }
  return xs;
}

bool Plan::dependsOn(NodeId a, NodeId b) const
{
  // dependencies always point backwards so a plain walk terminates
  vector<NodeId> todo = at(a).dependencies();
  vector<bool> seen(nodes_.size(), false);
  while(!todo.empty())
  {
    NodeId x = todo.back();
    todo.pop_back();
    if(x == b) return true;
    if(seen[x]) continue;
    seen[x] = true;
    for(NodeId d : nodes_[x].dependencies()) todo.push_back(d);
  }
  return false;
}

Json Plan::json() const
{
  Json j;
  j["nodes"] = jtransform(nodes_);
  return j;
}
