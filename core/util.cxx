#include <sstream>
#include <uuid/uuid.h>
#include "util.hxx"

using std::string;
using std::vector;
using std::stringstream;
using std::getline;

using namespace cumulus;

// Uuid -----------------------------------------------------------------------

Uuid::Uuid()
{
  uuid_generate(id);
}

string Uuid::str() const
{
  char buf[37];
  uuid_unparse(id, buf);
  return string{buf};
}

Json Uuid::json() const
{
  Json j;
  j["id"] = str();
  return j;
}

Uuid Uuid::fromJson(const Json &j)
{
  Uuid u;
  string s = extract(j, "id", "uuid");
  if(uuid_parse(s.c_str(), u.id) != 0)
  {
    throw std::out_of_range{"error extracting uuid: malformed id " + s};
  }
  return u;
}

bool cumulus::operator==(const Uuid & a, const Uuid & b)
{
  return uuid_compare(a.id, b.id) == 0;
}

bool cumulus::operator!=(const Uuid & a, const Uuid & b)
{
  return !(a == b);
}

// misc ------------------------------------------------------------------------

Tags cumulus::merge(Tags a, const Tags & b)
{
  for(const auto & p : b) a[p.first] = p.second;
  return a;
}

vector<string> cumulus::split(const string & s, char sep)
{
  vector<string> xs;
  stringstream ss{s};
  string x;
  while(getline(ss, x, sep))
  {
    if(!x.empty()) xs.push_back(x);
  }
  return xs;
}
