#include <stdexcept>
#include <arpa/inet.h>
#include <fmt/format.h>
#include "core/cidr.hxx"
#include "core/errors.hxx"

using std::string;
using std::runtime_error;
using std::ostream;
using std::experimental::make_optional;

using namespace cumulus;

// IpV4Address -----------------------------------------------------------------

IpV4Address::IpV4Address(const string & addr, uint32_t mask)
  : mask_{mask}
{
  if(mask > 32) throw runtime_error{fmt::format("bad ipv4 mask {}", mask)};
  int err = inet_pton(AF_INET, addr.c_str(), &addr_);
  if(err != 1) throw runtime_error{"bad ipv4 address " + addr};
}

IpV4Address IpV4Address::parse(const string & cidr)
{
  auto slash = cidr.find('/');
  if(slash == string::npos) return IpV4Address{cidr, 32};

  uint32_t mask;
  try { mask = std::stoul(cidr.substr(slash+1)); }
  catch(std::exception &) { throw runtime_error{"bad ipv4 cidr " + cidr}; }

  return IpV4Address{cidr.substr(0, slash), mask};
}

string IpV4Address::addrStr() const
{
  char buf[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &addr_, buf, INET_ADDRSTRLEN);
  return string{buf};
}

string IpV4Address::cidr() const
{
  return fmt::format("{}/{}", addrStr(), mask_);
}

uint32_t IpV4Address::addr() const { return addr_; }
uint32_t IpV4Address::mask() const { return mask_; }

uint32_t IpV4Address::first() const
{
  if(mask_ == 0) return 0;
  uint32_t m = ~uint32_t{0} << (32 - mask_);
  return ntohl(addr_) & m;
}

uint32_t IpV4Address::last() const
{
  if(mask_ == 0) return ~uint32_t{0};
  uint32_t m = ~uint32_t{0} << (32 - mask_);
  return first() | ~m;
}

bool IpV4Address::contains(const IpV4Address & x) const
{
  return first() <= x.first() && x.last() <= last();
}

bool IpV4Address::overlaps(const IpV4Address & x) const
{
  return first() <= x.last() && x.first() <= last();
}

ostream & cumulus::operator<<(ostream & o, const IpV4Address & a)
{
  o << a.cidr(); 
  return o;
}

IpV4Address cumulus::operator+(IpV4Address a, uint32_t x)
{
  IpV4Address b = a;
  b.addr_ = htonl(ntohl(a.addr_) + x);
  return b;
}

bool cumulus::operator==(const IpV4Address & a, const IpV4Address & b)
{
  return a.addr() == b.addr() && a.mask() == b.mask();
}

bool cumulus::operator!=(const IpV4Address & a, const IpV4Address & b)
{
  return !(a == b);
}

IpV4Address IpV4Address::fromJson(Json j)
{
  string cidr = extract(j, "cidr", "ipv4address");
  return IpV4Address::parse(cidr);
}

Json IpV4Address::json() const
{
  Json j;
  j["cidr"] = cidr();
  return j;
}

// zone address allocation -----------------------------------------------------

IpV4Address cumulus::networkPrefix()
{
  return IpV4Address{"10.10.0.0", 16};
}

static IpV4Address block(long third_octet)
{
  IpV4Address b{networkPrefix().addrStr(), 24};
  return b + static_cast<uint32_t>(third_octet << 8);
}

ZoneBlocks cumulus::allocateZone(long zone, bool natFacing)
{
  if(zone < 0 || zone >= NatBlockOffset) throw AllocationExhausted{zone};

  ZoneBlocks zb;
  zb.primary = block(zone);
  if(natFacing) zb.nat = make_optional(block(zone + NatBlockOffset));
  return zb;
}
