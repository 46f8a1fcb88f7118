#ifndef CUMULUS_COMMON_GLOG
#define CUMULUS_COMMON_GLOG

#include <string>
#include <glog/logging.h>

namespace cumulus
{
  struct Glog
  {
    static bool initialized;
    static void init(std::string service_name);
  };
}

#endif
