#include <chrono>
#include <string>
#include <catch2/catch.hpp>
#include "core/assembler.hxx"
#include "core/errors.hxx"
#include "core/sim.hxx"
#include "test/models/requests.hxx"

using std::string;
using std::vector;
using std::chrono::milliseconds;
using namespace cumulus;

/*
 *    plan execution against providers that misbehave
 */

// a provider whose nat gateway call throws something that is not a
// std::exception, everything else goes to the simulated cloud
struct ForeignThrowingCloud : public Provisioner
{
  SimCloud & cloud;

  explicit ForeignThrowingCloud(SimCloud & c) : cloud{c} {}

  VpcHandle 
  createVpc(const IpV4Address & cidr, DnsOptions dns, const Tags & t) override
  { return cloud.createVpc(cidr, dns, t); }

  GatewayHandle 
  createInternetGateway(const ResourceId & vpc, const Tags & t) override
  { return cloud.createInternetGateway(vpc, t); }

  RouteTableHandle
  createRouteTable(const ResourceId & vpc, const vector<Route> & routes,
                   const Tags & t) override
  { return cloud.createRouteTable(vpc, routes, t); }

  SubnetHandle
  createSubnet(const ResourceId & vpc, const string & az,
               const IpV4Address & cidr, bool pub, const Tags & t) override
  { return cloud.createSubnet(vpc, az, cidr, pub, t); }

  AssociationHandle
  associateRouteTable(const ResourceId & s, const ResourceId & rt) override
  { return cloud.associateRouteTable(s, rt); }

  EipHandle createElasticIp(const Tags & t) override
  { return cloud.createElasticIp(t); }

  NatHandle
  createNatGateway(const ResourceId &, const ResourceId &, const Tags &,
                   const vector<ResourceId> &) override
  { throw 47; }
};

TEST_CASE("foreign-exceptions-become-provisioning-failures", "[execute]")
{
  for(bool concurrent : {true, false})
  {
    SimCloud cloud;
    cloud.provisionDelay(milliseconds(5));
    ForeignThrowingCloud provider{cloud};

    ConstructSettings s = validate(privateNetwork(3).constructArgs);
    NetworkPlan np = planNetwork("foreign", s, cloud);

    try
    {
      execute(np.plan, provider, concurrent);
      FAIL("execution should have failed");
    }
    catch(ProvisioningFailure & e)
    {
      REQUIRE( e.kind() == "nat-gateway" );
      REQUIRE( e.node() == "foreign-nat-0" );
      REQUIRE( string{e.what()}.find("non-standard exception") != 
               string::npos );
      REQUIRE_THROWS_AS( e.rethrowCause(), int );
    }

    // nothing depending on a nat gateway got created
    REQUIRE( cloud.count("nat-gateway") == 0 );
    REQUIRE( cloud.calls("createRouteTable") == 1 );
  }
}

TEST_CASE("execution-results", "[execute]")
{
  SimCloud cloud;
  ConstructSettings s = validate(publicNetwork(1).constructArgs);
  NetworkPlan np = planNetwork("results", s, cloud);

  Results r = execute(np.plan, cloud);

  REQUIRE( r.size() == np.plan.size() );
  REQUIRE( cloud.resource(r.id(np.shared.vpc)).kind == "vpc" );
  REQUIRE( r.attr(np.shared.vpc, "defaultSecurityGroupId") == 
           cloud.resource(r.id(np.shared.vpc))
             .props.at("default_security_group").get<string>() );
  REQUIRE_THROWS_AS( r.attr(np.shared.vpc, "arn"), std::out_of_range );
  REQUIRE_THROWS_AS( r.at(np.plan.size()), std::out_of_range );
}
