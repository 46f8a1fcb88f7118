#ifndef CUMULUS_CORE_DEFAULT_HXX
#define CUMULUS_CORE_DEFAULT_HXX

#include <mutex>
#include <string>
#include <experimental/optional>
#include "core/topology.hxx"
#include "core/provision.hxx"

namespace cumulus
{
  struct DefaultOptions
  {
    std::string name{"default-vpc"};
  };

  /*
   * Holds the account's default network as a topology. The first successful
   * get() looks up the default vpc, its subnets and its default security 
   * group and adopts them, every later get() returns that same topology no
   * matter what options it is handed. Concurrent first callers are serialized
   * so the lookup happens once.
   */
  class DefaultTopologyCache
  {
    public:
      Topology get(Lookup &, DefaultOptions = {});

      bool populated() const;

      // empties the slot, for tests working on their own cache
      void reset();

      // the process wide instance
      static DefaultTopologyCache & global();

    private:
      mutable std::mutex mtx_;
      std::experimental::optional<Topology> slot_;
  };

  // DefaultTopologyCache::global().get(...)
  Topology getDefault(Lookup &, DefaultOptions = {});
}

#endif
