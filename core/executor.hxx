#ifndef CUMULUS_CORE_EXECUTOR_HXX
#define CUMULUS_CORE_EXECUTOR_HXX

#include <map>
#include <vector>
#include <string>
#include "core/plan.hxx"
#include "core/provision.hxx"

namespace cumulus
{
  // the attributes a node resolved to, always contains "id"
  using Attrs = std::map<std::string, ResourceId>;

  class Results
  {
    public:
      Results() = default;
      explicit Results(std::vector<Attrs>);

      const ResourceId & id(NodeId) const;
      const ResourceId & attr(NodeId, const std::string &) const;
      const Attrs & at(NodeId) const;
      size_t size() const;

    private:
      std::vector<Attrs> attrs_;
  };

  /*
   * Resolves every node of a plan through the provisioner. In concurrent mode
   * each node runs on its own task as soon as its dependencies resolved. Any
   * node failure fails the whole plan with the ProvisioningFailure of the
   * first failing node in declaration order, after all tasks have settled.
   */
  Results execute(const Plan &, Provisioner &, bool concurrent = true);

}

#endif
