#include "glog.hxx"

using namespace cumulus;
using std::string;

bool Glog::initialized{false};

void Glog::init(string service_name)
{
  if(Glog::initialized) return;

  google::InitGoogleLogging(service_name.c_str());
  google::InstallFailureSignalHandler();
  Glog::initialized = true;
}
