#ifndef CUMULUS_CORE_CIDR_HXX
#define CUMULUS_CORE_CIDR_HXX

#include <string>
#include <ostream>
#include <cstdint>
#include <experimental/optional>
#include "core/util.hxx"

namespace cumulus
{
  // IpV4Address ----------------------------------------------------------------

  /*
   * an ipv4 address together with a prefix length. the address is held in 
   * network byte order
   */
  class IpV4Address
  {
    public:
      IpV4Address() = default;
      IpV4Address(const std::string & addr, uint32_t mask);
      static IpV4Address parse(const std::string & cidr);

      static IpV4Address fromJson(Json);
      Json json() const;

      std::string cidr() const,
                  addrStr() const;

      uint32_t addr() const;
      uint32_t mask() const;

      // first and last address covered by the prefix, host byte order
      uint32_t first() const,
               last() const;

      bool contains(const IpV4Address &) const;
      bool overlaps(const IpV4Address &) const;

    private:
      uint32_t addr_{0}, mask_{0};
      friend IpV4Address operator +(IpV4Address, uint32_t);
  };

  IpV4Address operator +(IpV4Address, uint32_t);

  bool operator == (const IpV4Address &, const IpV4Address &);
  bool operator != (const IpV4Address &, const IpV4Address &);

  std::ostream & operator<<(std::ostream &o, const IpV4Address &);

  // zone address allocation ----------------------------------------------------

  // every topology lives in this address space
  IpV4Address networkPrefix();

  // the nat facing block of zone i sits this many /24s above its primary block
  constexpr long NatBlockOffset{64};

  struct ZoneBlocks
  {
    IpV4Address primary;
    std::experimental::optional<IpV4Address> nat;
  };

  /*
   * zone i gets 10.10.i.0/24 and, when a nat facing subnet is needed,
   * 10.10.(i+64).0/24. throws AllocationExhausted for zones outside of [0,64)
   */
  ZoneBlocks allocateZone(long zone, bool natFacing);

}

#endif
