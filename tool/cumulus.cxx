/*
 * cumulus command line tool
 *
 * builds a topology request from flags (or a json request document), then
 * either prints the provisioning plan or materializes the request against the
 * simulated cloud and prints the topology outputs
 */

#include <string>
#include <fstream>
#include <iostream>
#include <gflags/gflags.h>
#include "cumulus.hxx"

using std::string;
using std::ifstream;
using std::cout;
using std::cerr;
using std::endl;
using std::exception;
using std::experimental::make_optional;
using namespace cumulus;

/*
 *    command line flags
 */
DEFINE_string(name, "cumulus", "name of the network, all resources derive theirs from it");
DEFINE_int64(zones, 2, "number of availability zones to build subnets in");
DEFINE_bool(private_subnets, false, "put workloads in private subnets behind per zone nat gateways");

DEFINE_string(vpc_id, "", "adopt this existing vpc instead of building one");
DEFINE_string(subnet_ids, "", "comma separated subnet ids of the adopted vpc");
DEFINE_string(security_group_ids, "", "comma separated security group ids of the adopted vpc");
DEFINE_string(public_subnet_ids, "", "comma separated public subnet ids of the adopted vpc");

DEFINE_string(request, "", "json request document, replaces the per field flags");
DEFINE_bool(show_default, false, "print the default network of the account");
DEFINE_bool(plan, false, "print the provisioning plan instead of executing it");
DEFINE_bool(sequential, false, "resolve plan nodes one at a time");
DEFINE_bool(inventory, false, "also print everything the simulated cloud holds");

DEFINE_string(region, "us-west-2", "region of the simulated cloud");
DEFINE_int64(default_subnets, 3, "number of subnets in the simulated default vpc");

static TopologyRequest requestFromFlags()
{
  if(!FLAGS_vpc_id.empty())
  {
    AdoptArgs a;
    a.vpcId = FLAGS_vpc_id;
    if(!FLAGS_subnet_ids.empty())
      a.subnetIds = make_optional(split(FLAGS_subnet_ids));
    if(!FLAGS_security_group_ids.empty())
      a.securityGroupIds = make_optional(split(FLAGS_security_group_ids));
    if(!FLAGS_public_subnet_ids.empty())
      a.publicSubnetIds = make_optional(split(FLAGS_public_subnet_ids));
    a.usePrivateSubnets = make_optional(FLAGS_private_subnets);

    return TopologyRequest::adopt(FLAGS_name, a);
  }

  ConstructArgs c;
  c.numberOfAvailabilityZones = make_optional(static_cast<long>(FLAGS_zones));
  c.usePrivateSubnets = make_optional(FLAGS_private_subnets);
  return TopologyRequest::construct(FLAGS_name, c);
}

static TopologyRequest requestFromFile(const string & path)
{
  ifstream in{path};
  if(!in.good()) throw std::runtime_error{"could not open " + path};

  Json j;
  in >> j;
  return TopologyRequest::fromJson(j);
}

int main(int argc, char **argv)
{
  Glog::init("cumulus");

  gflags::SetUsageMessage(
      "usage: cumulus [-name n] [-zones n] [-private_subnets] [-plan]\n"
      "       cumulus -vpc_id id -subnet_ids a,b -security_group_ids sg "
      "-public_subnet_ids a,b\n"
      "       cumulus -request file.json\n"
      "       cumulus -show_default");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  try
  {
    SimCloud cloud{FLAGS_region, static_cast<long>(FLAGS_default_subnets)};

    if(FLAGS_show_default)
    {
      cout << getDefault(cloud).json().dump(2) << endl;
      return 0;
    }

    TopologyRequest rq = FLAGS_request.empty() ? requestFromFlags()
                                               : requestFromFile(FLAGS_request);
    LOG(INFO) << to_string(rq.kind) << " request for " << rq.name;

    if(FLAGS_plan)
    {
      if(rq.kind != TopologyRequest::Kind::Construct)
      {
        cerr << "adopted networks have no plan, nothing gets created" << endl;
        return 1;
      }
      ConstructSettings s = validate(rq.constructArgs);
      cout << planNetwork(rq.name, s, cloud).plan.json().dump(2) << endl;
      return 0;
    }

    AssembleOptions opts;
    opts.concurrent = !FLAGS_sequential;
    Topology t = materialize(rq, cloud, cloud, opts);

    cout << t.outputs().dump(2) << endl;
    if(FLAGS_inventory) cout << cloud.json().dump(2) << endl;
  }
  catch(exception & e)
  {
    LOG(ERROR) << e.what();
    cerr << e.what() << endl;
    return 1;
  }

  return 0;
}
