#ifndef CUMULUS_CORE_VALIDATE_HXX
#define CUMULUS_CORE_VALIDATE_HXX

#include "core/topology.hxx"

namespace cumulus
{
  constexpr long DefaultZoneCount{2},
                 MaxZoneCount{3};

  // construct arguments with every default filled in
  struct ConstructSettings
  {
    long zones{DefaultZoneCount};
    bool usePrivateSubnets{false};
    Tags tags;
  };

  /*
   * Adopt mode needs all of the id lists. Checks run in the order
   * subnet_ids, security_group_ids, public_subnet_ids and the first one
   * missing raises MissingField.
   */
  void validate(const AdoptArgs &);

  // raises InvalidZoneCount unless 1 <= zones <= 3
  ConstructSettings validate(const ConstructArgs &);
}

#endif
