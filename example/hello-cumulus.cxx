#include <iostream>
#include "cumulus.hxx"

using namespace std;
using namespace cumulus;

int main()
{
  Glog::init("hello-cumulus");

  SimCloud cloud{"us-west-2"};

  //a private network across three zones ..........

  ConstructArgs args;
  args.numberOfAvailabilityZones = experimental::make_optional(3L);
  args.usePrivateSubnets = experimental::make_optional(true);
  args.tags = {{"team", "infra"}, {"env", "dev"}};

  Topology web = construct("hello-cumulus", args, cloud, cloud);

  //the account default ...........................

  Topology dflt = getDefault(cloud);

  cout << web.json().dump(2) << endl;
  cout << dflt.outputs().dump(2) << endl;
  cout << cloud.provisioningCalls() << " provisioning calls, "
       << cloud.lookupCalls() << " lookups" << endl;
}
