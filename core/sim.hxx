#ifndef CUMULUS_CORE_SIM_HXX
#define CUMULUS_CORE_SIM_HXX

#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <unordered_map>
#include "core/util.hxx"
#include "core/provision.hxx"

namespace cumulus
{
  // a resource living in the simulated cloud
  struct SimResource
  {
    ResourceId id;
    std::string kind;
    ResourceId vpc;
    Tags tags;
    Json props;

    Json json() const;
  };

  /*
   * An in-memory cloud implementing every provider collaborator. It applies
   * the provider rules the engine relies on:
   *
   *   - subnets must lie inside their vpc and must not overlap
   *   - a subnet carries at most one route table association
   *   - route targets must exist in the route table's vpc
   *   - a nat gateway's subnet must already route to an internet gateway
   *
   * and counts every call. Calls can be made to fail to exercise error paths.
   * The account comes with a default vpc (172.31.0.0/16) holding a
   * configurable number of public subnets.
   */
  class SimCloud : public Provisioner,
                   public Lookup,
                   public ZoneResolver
  {
    public:
      // the default vpc holds at most MaxDefaultSubnets /20 subnets
      static constexpr long MaxDefaultSubnets{16};

      explicit SimCloud(std::string region = "us-west-2",
                        long defaultSubnets = 3);

      // Provisioner
      VpcHandle
      createVpc(const IpV4Address &, DnsOptions, const Tags &) override;

      GatewayHandle
      createInternetGateway(const ResourceId &, const Tags &) override;

      RouteTableHandle
      createRouteTable(const ResourceId &, const std::vector<Route> &,
                       const Tags &) override;

      SubnetHandle
      createSubnet(const ResourceId &, const std::string &,
                   const IpV4Address &, bool, const Tags &) override;

      AssociationHandle
      associateRouteTable(const ResourceId &, const ResourceId &) override;

      EipHandle createElasticIp(const Tags &) override;

      NatHandle
      createNatGateway(const ResourceId &, const ResourceId &, const Tags &,
                       const std::vector<ResourceId> &) override;

      // Lookup
      VpcHandle lookupDefaultVpc() override;
      std::vector<ResourceId> lookupSubnetsOf(const ResourceId &) override;
      ResourceId lookupSecurityGroup(const std::string &,
                                     const ResourceId &) override;

      // ZoneResolver
      std::string resolveAvailabilityZone(long) override;

      // the nth (1 based) call of op throws
      SimCloud & failOn(std::string op, size_t nth = 1);

      SimCloud & provisionDelay(std::chrono::milliseconds);
      SimCloud & lookupDelay(std::chrono::milliseconds);

      size_t calls(const std::string & op) const;
      size_t provisioningCalls() const;
      size_t lookupCalls() const;

      const std::string & region() const;
      SimResource resource(const ResourceId &) const;
      std::vector<SimResource> resources(const std::string & kind) const;
      size_t count(const std::string & kind) const;

      Json json() const;

    private:
      void hit(const std::string & op, std::chrono::milliseconds delay);
      ResourceId newId(const std::string & prefix) const;
      const SimResource & get(const ResourceId &, const std::string & kind) const;
      SimResource & put(SimResource);
      bool routesToInternet(const ResourceId & subnet) const;

      std::string region_;
      std::chrono::milliseconds provision_delay_{0}, lookup_delay_{0};

      mutable std::mutex mtx_;
      std::unordered_map<std::string, size_t> calls_, failures_;
      std::unordered_map<ResourceId, SimResource> resources_;
      std::vector<ResourceId> order_;
      ResourceId default_vpc_;
  };

}

#endif
