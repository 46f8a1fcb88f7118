#ifndef CUMULUS_CORE_UTIL
#define CUMULUS_CORE_UTIL

#include <map>
#include <vector>
#include <string>
#include <functional>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <uuid/uuid.h>
#include <nlohmann/json.hpp>
#include "common/glog.hxx"

namespace cumulus {

using Json = nlohmann::json;

// identifiers handed out by the cloud provider (vpc-..., subnet-..., etc)
using ResourceId = std::string;

// resource tags, ordered so that json output is stable
using Tags = std::map<std::string, std::string>;

struct Uuid
{
  Uuid();

  std::string str() const;
  Json json() const;
  static Uuid fromJson(const Json &j);

  uuid_t id;
};

bool operator==(const Uuid &, const Uuid &);
bool operator!=(const Uuid &, const Uuid &);

template <class T, class F>
inline
std::vector<Json> jtransform(T && xs, F && f)
{
  std::vector<Json> js;
  js.reserve(xs.size());
  std::transform( xs.begin(), xs.end(), std::back_inserter(js), f);
  return js;
}

template <class C>
inline
std::vector<Json> jtransform(const C & xs)
{
  return jtransform(xs,
    [](const typename C::value_type & x){ return x.json(); }
  );
}

// merge b into a, entries of b win
Tags merge(Tags a, const Tags & b);

// split a comma separated list, dropping empty elements
std::vector<std::string> split(const std::string & s, char sep = ',');

inline Json extract(const Json & j, std::string tag, std::string context)
{
  auto i = j.find(tag);
  if(i == j.end())
  {
    LOG(ERROR) << j;
    throw std::out_of_range{"error extracting " + context+":"+tag};
  }
  return *i;
}

}

#endif
