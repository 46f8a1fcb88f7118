#include <string>
#include <catch2/catch.hpp>
#include "core/assembler.hxx"
#include "core/sim.hxx"
#include "test/models/requests.hxx"

using std::string;
using namespace cumulus;

/*
 *    provisioning plan structure tests, nothing gets executed here
 */

static NetworkPlan planFor(const TopologyRequest & rq, ZoneResolver & zones)
{
  return planNetwork(rq.name, validate(rq.constructArgs), zones);
}

static string prop(const Plan & p, NodeId n, const string & key)
{
  return p.at(n).props.at(key).dump();
}

TEST_CASE("public-plan-shape", "[plan]")
{
  SimCloud cloud;
  NetworkPlan np = planFor(publicNetwork(2), cloud);
  const Plan & p = np.plan;

  REQUIRE( p.count(Node::Kind::Vpc) == 1 );
  REQUIRE( p.count(Node::Kind::InternetGateway) == 1 );
  REQUIRE( p.count(Node::Kind::RouteTable) == 1 );
  REQUIRE( p.count(Node::Kind::Subnet) == 2 );
  REQUIRE( p.count(Node::Kind::RouteTableAssociation) == 2 );
  REQUIRE( p.count(Node::Kind::NatGateway) == 0 );
  REQUIRE( p.count(Node::Kind::ElasticIp) == 0 );

  REQUIRE( np.zones.size() == 2 );
  for(const ZoneLayout & z : np.zones)
  {
    REQUIRE( z.subnet == z.publicSubnet );
    REQUIRE( z.routeTable == np.shared.publicRouteTable );
    REQUIRE( p.at(z.association).refs.at("route_table").node == 
             np.shared.publicRouteTable );
    REQUIRE( prop(p, z.subnet, "assign_public_ip") == "true" );
    REQUIRE_FALSE( z.natGateway );
  }

  REQUIRE( p.at(np.zones[0].subnet).props.at("cidr") == "10.10.0.0/24" );
  REQUIRE( p.at(np.zones[1].subnet).props.at("cidr") == "10.10.1.0/24" );
  REQUIRE( p.at(np.zones[0].subnet).props.at("availability_zone") == "us-west-2a" );
  REQUIRE( p.at(np.zones[1].subnet).props.at("availability_zone") == "us-west-2b" );

  const Node & vpc = p.at(np.shared.vpc);
  REQUIRE( vpc.props.at("cidr") == "10.10.0.0/16" );
  REQUIRE( vpc.props.at("dns_support") == true );
  REQUIRE( vpc.props.at("dns_hostnames") == true );

  const Node & rt = p.at(np.shared.publicRouteTable);
  REQUIRE( rt.props.at("destination") == "0.0.0.0/0" );
  REQUIRE( rt.props.at("target") == "internet-gateway" );
  REQUIRE( rt.refs.at("target").node == np.shared.internetGateway );
}

TEST_CASE("private-plan-shape", "[plan]")
{
  SimCloud cloud;
  NetworkPlan np = planFor(privateNetwork(1), cloud);
  const Plan & p = np.plan;

  REQUIRE( p.count(Node::Kind::Subnet) == 2 );
  REQUIRE( p.count(Node::Kind::NatGateway) == 1 );
  REQUIRE( p.count(Node::Kind::ElasticIp) == 1 );
  REQUIRE( p.count(Node::Kind::RouteTable) == 2 );
  REQUIRE( p.count(Node::Kind::RouteTableAssociation) == 2 );

  const ZoneLayout & z = np.zones.at(0);
  REQUIRE( z.subnet != z.publicSubnet );
  REQUIRE( p.at(z.subnet).name == "priv1-0" );
  REQUIRE( p.at(z.subnet).props.at("cidr") == "10.10.0.0/24" );
  REQUIRE( prop(p, z.subnet, "assign_public_ip") == "false" );
  REQUIRE( p.at(z.publicSubnet).name == "priv1-nat-0" );
  REQUIRE( p.at(z.publicSubnet).props.at("cidr") == "10.10.64.0/24" );
  REQUIRE( prop(p, z.publicSubnet, "assign_public_ip") == "true" );

  REQUIRE( z.natGateway );
  REQUIRE( z.natAssociation );
  REQUIRE( z.elasticIp );

  const Node & nat = p.at(*z.natGateway);
  REQUIRE( nat.refs.at("subnet").node == z.publicSubnet );
  REQUIRE( nat.refs.at("allocation").node == *z.elasticIp );

  // the gateway waits on the association explicitly, not through data
  REQUIRE( nat.dependsOn.size() == 1 );
  REQUIRE( nat.dependsOn[0] == *z.natAssociation );

  const Node & routes = p.at(*z.natAssociation);
  REQUIRE( routes.refs.at("subnet").node == z.publicSubnet );
  REQUIRE( routes.refs.at("route_table").node == np.shared.publicRouteTable );

  const Node & rt = p.at(z.routeTable);
  REQUIRE( rt.kind == Node::Kind::RouteTable );
  REQUIRE( rt.props.at("target") == "nat-gateway" );
  REQUIRE( rt.props.at("destination") == "0.0.0.0/0" );
  REQUIRE( rt.refs.at("target").node == *z.natGateway );

  REQUIRE( p.at(z.association).refs.at("route_table").node == z.routeTable );
  REQUIRE( p.at(z.association).refs.at("subnet").node == z.subnet );
}

TEST_CASE("plan-ordering", "[plan]")
{
  SimCloud cloud;
  NetworkPlan np = planFor(privateNetwork(3), cloud);
  const Plan & p = np.plan;
  const SharedNetwork & s = np.shared;

  REQUIRE( p.dependsOn(s.internetGateway, s.vpc) );
  REQUIRE( p.dependsOn(s.publicRouteTable, s.internetGateway) );

  for(const ZoneLayout & z : np.zones)
  {
    // zones start after the shared public route
    REQUIRE( p.dependsOn(z.subnet, s.publicRouteTable) );
    REQUIRE( p.dependsOn(z.publicSubnet, s.publicRouteTable) );
    REQUIRE( p.dependsOn(*z.elasticIp, s.publicRouteTable) );

    // nat subnet -> association -> nat gateway -> route table -> association
    REQUIRE( p.dependsOn(*z.natAssociation, z.publicSubnet) );
    REQUIRE( p.dependsOn(*z.natGateway, *z.natAssociation) );
    REQUIRE( p.dependsOn(z.routeTable, *z.natGateway) );
    REQUIRE( p.dependsOn(z.association, z.routeTable) );

    REQUIRE_FALSE( p.dependsOn(s.publicRouteTable, z.subnet) );
  }

  // zones do not wait on each other
  for(const ZoneLayout & a : np.zones)
  {
    for(const ZoneLayout & b : np.zones)
    {
      if(a.zone == b.zone) continue;
      REQUIRE_FALSE( p.dependsOn(a.association, b.subnet) );
      REQUIRE_FALSE( p.dependsOn(a.association, *b.natGateway) );
      REQUIRE_FALSE( p.dependsOn(*a.natGateway, *b.natAssociation) );
    }
  }
}

TEST_CASE("plan-tags", "[plan]")
{
  SimCloud cloud;
  TopologyRequest rq = privateNetwork(1);
  rq.constructArgs.tags["Name"] = "overridden";
  NetworkPlan np = planFor(rq, cloud);
  const Plan & p = np.plan;

  for(const Node & n : p.nodes())
  {
    if(n.kind == Node::Kind::RouteTableAssociation) continue;
    REQUIRE( n.tags.at("team") == "infra" );
    REQUIRE( n.tags.at("Name") != "overridden" );
  }

  REQUIRE( p.at(np.shared.vpc).tags.at("Name") == "priv1" );
  REQUIRE( p.at(np.zones[0].subnet).tags.at("Name") == "priv1-0" );
  REQUIRE( p.at(*np.zones[0].natGateway).tags.at("Name") == "priv1-nat-0" );
}

TEST_CASE("plan-rejects-forward-references", "[plan]")
{
  Plan p;
  NodeId vpc = p.vpc("x", networkPrefix(), DnsOptions{}, {});

  REQUIRE_THROWS_AS( p.internetGateway("x", vpc+1, {}), std::out_of_range );
  REQUIRE_THROWS_AS( p.association("x", vpc, 7), std::out_of_range );
  REQUIRE( p.size() == 1 );
  REQUIRE_THROWS_AS( p.at(3), std::out_of_range );
}

TEST_CASE("plan-json", "[plan]")
{
  SimCloud cloud;
  NetworkPlan np = planFor(privateNetwork(2), cloud);
  Json j = np.plan.json();

  REQUIRE( j.at("nodes").size() == np.plan.size() );

  const Json & nat = j.at("nodes").at(*np.zones[1].natGateway);
  REQUIRE( nat.at("kind") == "nat-gateway" );
  REQUIRE( nat.at("name") == "priv2-nat-1" );
  REQUIRE( nat.at("depends_on").at(0) == *np.zones[1].natAssociation );
  REQUIRE( nat.at("refs").at("allocation").at("node") == *np.zones[1].elasticIp );
}
