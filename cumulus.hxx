#ifndef CUMULUS_CUMULUS_HXX
#define CUMULUS_CUMULUS_HXX

/*
 * a top level include file for cumulus
 */

#include "core/util.hxx"
#include "core/errors.hxx"
#include "core/cidr.hxx"
#include "core/topology.hxx"
#include "core/validate.hxx"
#include "core/provision.hxx"
#include "core/plan.hxx"
#include "core/executor.hxx"
#include "core/subnets.hxx"
#include "core/assembler.hxx"
#include "core/default.hxx"
#include "core/sim.hxx"

#endif
