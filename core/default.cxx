#include "core/default.hxx"
#include "core/assembler.hxx"

using std::string;
using std::mutex;
using std::lock_guard;
using std::experimental::optional;
using std::experimental::make_optional;

using namespace cumulus;

static Topology lookupDefault(Lookup & lookup, const DefaultOptions & opts)
{
  VpcHandle vpc = lookup.lookupDefaultVpc();
  IdList subnets = lookup.lookupSubnetsOf(vpc.id);
  ResourceId sg = lookup.lookupSecurityGroup("default", vpc.id);

  LOG(INFO) << "default vpc " << vpc.id << " has " << subnets.size() 
            << " subnets";

  // every subnet of the default vpc is public
  AdoptArgs a;
  a.vpcId = vpc.id;
  a.subnetIds = make_optional(subnets);
  a.publicSubnetIds = make_optional(subnets);
  a.securityGroupIds = make_optional(IdList{sg});
  a.usePrivateSubnets = make_optional(false);

  return adopt(opts.name, a);
}

Topology DefaultTopologyCache::get(Lookup & lookup, DefaultOptions opts)
{
  lock_guard<mutex> lk{mtx_};
  if(!slot_)
  {
    slot_ = make_optional(lookupDefault(lookup, opts));
  }
  else if(opts.name != slot_->name())
  {
    VLOG(1) << "default network already populated as " << slot_->name()
            << ", ignoring options for " << opts.name;
  }
  return *slot_;
}

bool DefaultTopologyCache::populated() const
{
  lock_guard<mutex> lk{mtx_};
  return static_cast<bool>(slot_);
}

void DefaultTopologyCache::reset()
{
  lock_guard<mutex> lk{mtx_};
  slot_ = optional<Topology>{};
}

DefaultTopologyCache & DefaultTopologyCache::global()
{
  static DefaultTopologyCache cache;
  return cache;
}

Topology cumulus::getDefault(Lookup & lookup, DefaultOptions opts)
{
  return DefaultTopologyCache::global().get(lookup, opts);
}
