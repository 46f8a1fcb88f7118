#ifndef CUMULUS_CORE_ASSEMBLER_HXX
#define CUMULUS_CORE_ASSEMBLER_HXX

#include <string>
#include <vector>
#include "core/topology.hxx"
#include "core/validate.hxx"
#include "core/subnets.hxx"
#include "core/plan.hxx"
#include "core/executor.hxx"
#include "core/provision.hxx"

namespace cumulus
{
  struct AssembleOptions
  {
    // resolve independent nodes in parallel
    bool concurrent{true};
  };

  // everything declared for one topology construction
  struct NetworkPlan
  {
    std::string name;
    ConstructSettings settings;
    Plan plan;
    SharedNetwork shared;
    std::vector<ZoneLayout> zones;
  };

  // declares the vpc, internet gateway, public route table and every zone
  NetworkPlan planNetwork(const std::string & name, const ConstructSettings &,
                          ZoneResolver &);

  // reads the finished topology out of an executed plan
  Topology assemble(const NetworkPlan &, const Results &);

  Topology construct(const std::string & name, const ConstructArgs &,
                     Provisioner &, ZoneResolver &, AssembleOptions = {});

  // validation only, nothing is provisioned
  Topology adopt(const std::string & name, const AdoptArgs &);

  Topology materialize(const TopologyRequest &, Provisioner &, ZoneResolver &,
                       AssembleOptions = {});
}

#endif
