#include <fmt/format.h>
#include "errors.hxx"

using std::string;
using std::to_string;
using std::exception;
using std::exception_ptr;
using std::rethrow_exception;
using namespace cumulus;

// MissingField ----------------------------------------------------------------
MissingField::MissingField(string field)
  : runtime_error{field + " argument must not be empty"},
    field_{field}
{}

const string & MissingField::field() const { return field_; }

// InvalidZoneCount ------------------------------------------------------------
InvalidZoneCount::InvalidZoneCount(long count)
  : runtime_error{
      "unsupported number of availability zones for network: " + 
      to_string(count)},
    count_{count}
{}

long InvalidZoneCount::count() const { return count_; }

// AllocationExhausted ---------------------------------------------------------
AllocationExhausted::AllocationExhausted(long zone)
  : runtime_error{
      "no address block available for availability zone " + to_string(zone)},
    zone_{zone}
{}

long AllocationExhausted::zone() const { return zone_; }

// ProvisioningFailure ---------------------------------------------------------
ProvisioningFailure::ProvisioningFailure(string kind, string node, 
                                         exception_ptr cause)
  : runtime_error{
      fmt::format("provisioning {} '{}' failed: {}", kind, node, describe(cause))
    },
    kind_{kind},
    node_{node},
    cause_{cause}
{}

const string & ProvisioningFailure::kind() const { return kind_; }
const string & ProvisioningFailure::node() const { return node_; }
exception_ptr ProvisioningFailure::cause() const { return cause_; }

void ProvisioningFailure::rethrowCause() const
{
  rethrow_exception(cause_);
}

string cumulus::describe(exception_ptr p)
{
  if(!p) return "unknown error";
  try { rethrow_exception(p); }
  catch(exception & e) { return e.what(); }
  catch(...) { return "non-standard exception"; }
}
