#include "poolkit/poolkit.hpp"

#include <cstdio>
#include <deque>
#include <forward_list>
#include <iostream>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

// Records the order in which it is sanitized; discards when told to.
struct Probe {
  int id = 0;
  bool discard = false;
  std::vector<int>* trail = NULL;
};

struct Session {
  std::string user;
  int requests = 0;
};

}  // namespace

namespace poolkit {
namespace memory {

template <>
struct Sanitizer<Probe> {
  static bool Apply(Probe* probe) {
    if (probe->trail != NULL) probe->trail->push_back(probe->id);
    return !probe->discard;
  }
};

template <>
struct Sanitizer<Session> {
  static bool Apply(Session* session) {
    if (session->requests > 100) return false;
    session->user.clear();
    session->requests = 0;
    return true;
  }
};

}  // namespace memory
}  // namespace poolkit

namespace {

using poolkit::memory::ObjectPool;
using poolkit::memory::Sanitizer;

template <typename C>
bool ClearsAndKeeps(C container) {
  return Sanitizer<C>::Apply(&container) && container.empty();
}

bool TestDefaultRuleIsIdentity() {
  int n = 17;
  if (!Sanitizer<int>::Apply(&n) || n != 17) return false;
  std::pair<int, double> p(1, 2.5);
  if (!Sanitizer<std::pair<int, double> >::Apply(&p)) return false;
  return p.first == 1 && p.second == 2.5;
}

bool TestContainersAreCleared() {
  std::map<int, std::string> m;
  m[1] = "a";
  std::multimap<int, int> mm;
  mm.insert(std::make_pair(1, 1));
  std::unordered_map<std::string, int> um;
  um["k"] = 1;
  std::unordered_multimap<int, int> umm;
  umm.insert(std::make_pair(2, 2));

  return ClearsAndKeeps(std::vector<int>(3, 1)) && ClearsAndKeeps(std::deque<int>(2, 1)) &&
         ClearsAndKeeps(std::list<int>(4, 1)) && ClearsAndKeeps(std::forward_list<int>(1, 1)) &&
         ClearsAndKeeps(m) && ClearsAndKeeps(mm) && ClearsAndKeeps(std::set<int>{1, 2}) &&
         ClearsAndKeeps(std::multiset<int>{3, 3}) && ClearsAndKeeps(um) && ClearsAndKeeps(umm) &&
         ClearsAndKeeps(std::unordered_set<int>{4}) &&
         ClearsAndKeeps(std::unordered_multiset<int>{5, 5}) &&
         ClearsAndKeeps(std::string("text")) && ClearsAndKeeps(std::wstring(L"wide"));
}

bool TestOptionalRule() {
  std::optional<std::string> empty;
  if (!Sanitizer<std::optional<std::string> >::Apply(&empty) || empty.has_value()) return false;

  std::optional<std::string> filled(std::string("payload"));
  if (!Sanitizer<std::optional<std::string> >::Apply(&filled)) return false;
  if (!filled.has_value() || !filled->empty()) return false;

  std::vector<int> trail;
  Probe bad;
  bad.discard = true;
  bad.trail = &trail;
  std::optional<Probe> wrapped(bad);
  if (Sanitizer<std::optional<Probe> >::Apply(&wrapped)) return false;
  return trail.size() == 1;
}

bool TestTupleShortCircuits() {
  std::vector<int> trail;
  Probe a;
  a.id = 1;
  a.trail = &trail;
  Probe b = a;
  b.id = 2;
  b.discard = true;
  Probe c = a;
  c.id = 3;

  std::tuple<Probe, Probe, Probe> t(a, b, c);
  if (Sanitizer<std::tuple<Probe, Probe, Probe> >::Apply(&t)) return false;
  if (trail.size() != 2 || trail[0] != 1 || trail[1] != 2) return false;

  trail.clear();
  std::get<1>(t).discard = false;
  if (!Sanitizer<std::tuple<Probe, Probe, Probe> >::Apply(&t)) return false;
  if (trail.size() != 3 || trail[2] != 3) return false;

  std::tuple<> none;
  return Sanitizer<std::tuple<> >::Apply(&none);
}

bool TestPairShortCircuits() {
  std::vector<int> trail;
  Probe a;
  a.id = 1;
  a.discard = true;
  a.trail = &trail;
  Probe b = a;
  b.id = 2;
  std::pair<Probe, Probe> p(a, b);
  if (Sanitizer<std::pair<Probe, Probe> >::Apply(&p)) return false;
  return trail.size() == 1 && trail[0] == 1;
}

bool TestSixComponentAggregateThroughPool() {
  typedef std::tuple<std::vector<int>, std::string, std::map<int, int>, std::set<int>,
                     std::deque<int>, std::optional<std::string> >
      Scratch;
  ObjectPool<Scratch> pool;
  {
    ObjectPool<Scratch>::Handle s = pool.AcquireOrDefault();
    std::get<0>(*s).push_back(1);
    std::get<1>(*s) = "dirty";
    std::get<2>(*s)[1] = 1;
    std::get<3>(*s).insert(9);
    std::get<4>(*s).push_back(4);
    std::get<5>(*s) = std::string("inner");
  }
  if (pool.Size() != 1) return false;
  ObjectPool<Scratch>::Handle s = pool.AcquireOrDefault();
  return std::get<0>(*s).empty() && std::get<1>(*s).empty() && std::get<2>(*s).empty() &&
         std::get<3>(*s).empty() && std::get<4>(*s).empty() && std::get<5>(*s).has_value() &&
         std::get<5>(*s)->empty();
}

bool TestUserSpecializationDrivesPool() {
  ObjectPool<Session> pool;
  {
    ObjectPool<Session>::Handle s = pool.AcquireOrDefault();
    s->user = "alice";
    s->requests = 3;
  }
  {
    ObjectPool<Session>::Handle s = pool.AcquireOrDefault();
    if (!s->user.empty() || s->requests != 0) return false;
    s->requests = 101;
  }
  return pool.Size() == 0 && pool.Stats().discarded == 1;
}

// Per-pool policy: keep only small buffers so storage does not pin big blocks.
struct KeepSmallBuffers {
  static bool Apply(std::vector<char>* buf) {
    if (buf->capacity() > 1024) return false;
    buf->clear();
    return true;
  }
};

bool TestCustomPolicyOverridesDefault() {
  ObjectPool<std::vector<char>, KeepSmallBuffers> pool;
  {
    ObjectPool<std::vector<char>, KeepSmallBuffers>::Handle small = pool.AcquireOrDefault();
    small->resize(16);
    ObjectPool<std::vector<char>, KeepSmallBuffers>::Handle big = pool.AcquireOrDefault();
    big->resize(4096);
  }
  if (pool.Size() != 1) return false;
  ObjectPool<std::vector<char>, KeepSmallBuffers>::Handle again = pool.AcquireOrDefault();
  return again->empty() && again->capacity() >= 16 && again->capacity() <= 1024;
}

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"default_rule_is_identity", TestDefaultRuleIsIdentity},
      {"containers_are_cleared", TestContainersAreCleared},
      {"optional_rule", TestOptionalRule},
      {"tuple_short_circuits", TestTupleShortCircuits},
      {"pair_short_circuits", TestPairShortCircuits},
      {"six_component_aggregate_through_pool", TestSixComponentAggregateThroughPool},
      {"user_specialization_drives_pool", TestUserSpecializationDrivesPool},
      {"custom_policy_overrides_default", TestCustomPolicyOverridesDefault},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
