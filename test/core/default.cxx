#include <thread>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <catch2/catch.hpp>
#include "core/default.hxx"
#include "core/sim.hxx"

using std::thread;
using std::vector;
using std::string;
using std::runtime_error;
using std::chrono::milliseconds;
using std::experimental::optional;
using namespace cumulus;

/*
 *    the account's default network
 */

TEST_CASE("default-network-shape", "[default]")
{
  SimCloud cloud{"eu-central-1", 3};
  DefaultTopologyCache cache;

  Topology t = cache.get(cloud);

  REQUIRE( t.name() == "default-vpc" );
  REQUIRE( t.origin() == Topology::Origin::Adopted );
  REQUIRE( t.usePrivateSubnets() == false );
  REQUIRE( t.subnetIds().size() == 3 );
  REQUIRE( t.publicSubnetIds() == t.subnetIds() );
  REQUIRE( t.securityGroupIds().size() == 1 );

  REQUIRE( cloud.resource(t.vpcId()).props.at("cidr") == "172.31.0.0/16" );
  REQUIRE( cloud.resource(t.securityGroupIds()[0]).kind == "security-group" );
  REQUIRE( cloud.resource(t.subnetIds()[2]).props.at("availability_zone") ==
           "eu-central-1c" );
}

TEST_CASE("default-network-is-looked-up-once", "[default]")
{
  SimCloud cloud;
  DefaultTopologyCache cache;
  REQUIRE( cache.populated() == false );

  Topology a = cache.get(cloud);
  Topology b = cache.get(cloud);
  DefaultOptions other;
  other.name = "something-else";
  Topology c = cache.get(cloud, other);

  REQUIRE( cache.populated() == true );
  REQUIRE( a.same(b) );
  REQUIRE( a.same(c) );
  REQUIRE( c.name() == "default-vpc" );

  REQUIRE( cloud.lookupCalls() == 3 );
  REQUIRE( cloud.calls("lookupDefaultVpc") == 1 );
  REQUIRE( cloud.provisioningCalls() == 0 );
}

TEST_CASE("concurrent-first-callers", "[default]")
{
  SimCloud cloud;
  cloud.lookupDelay(milliseconds(20));
  DefaultTopologyCache cache;

  const size_t n{8};
  vector<optional<Topology>> results(n);
  vector<thread> ts;
  for(size_t i=0; i<n; ++i)
  {
    ts.emplace_back([&cache, &cloud, &results, i]()
    {
      results[i] = cache.get(cloud);
    });
  }
  for(thread & t : ts) t.join();

  REQUIRE( cloud.calls("lookupDefaultVpc") == 1 );
  for(const optional<Topology> & r : results)
  {
    REQUIRE( r );
    REQUIRE( r->same(*results[0]) );
  }
}

TEST_CASE("failed-lookup-is-retried", "[default]")
{
  SimCloud cloud;
  cloud.failOn("lookupSubnetsOf");
  DefaultTopologyCache cache;

  REQUIRE_THROWS_AS( cache.get(cloud), runtime_error );
  REQUIRE( cache.populated() == false );

  Topology t = cache.get(cloud);
  REQUIRE( cache.populated() == true );
  REQUIRE( t.subnetIds().size() == 3 );
  REQUIRE( cloud.calls("lookupDefaultVpc") == 2 );
}

TEST_CASE("process-wide-default", "[default]")
{
  DefaultTopologyCache::global().reset();

  SimCloud cloud, other;
  Topology a = getDefault(cloud);
  Topology b = getDefault(other);

  REQUIRE( a.same(b) );
  REQUIRE( other.lookupCalls() == 0 );
  REQUIRE( DefaultTopologyCache::global().populated() );

  DefaultTopologyCache::global().reset();
  Topology c = getDefault(other);
  REQUIRE( !c.same(a) );
  REQUIRE( c.vpcId() != a.vpcId() );
  REQUIRE( other.lookupCalls() == 3 );

  DefaultTopologyCache::global().reset();
}
