#include "core/provision.hxx"

using std::string;
using namespace cumulus;

Json Route::json() const
{
  Json j;
  j["destination"] = destination.cidr();
  j["target"] = cumulus::to_string(target);
  j["target_id"] = targetId;
  return j;
}

string cumulus::to_string(Route::Target x)
{
  switch(x)
  {
    case Route::Target::InternetGateway: return "internet-gateway";
    case Route::Target::NatGateway: return "nat-gateway";
  }
  return "unknown";
}
