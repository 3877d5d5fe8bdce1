#pragma once

#include <cstddef>
#include <deque>
#include <forward_list>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace poolkit {
namespace memory {

// Decides what returning a value to an ObjectPool means for type T.
//
// Apply(value) runs on a released value before it goes back to storage:
// - return true: *value has been reset (or left as is) and may be reused.
// - return false: the value is destroyed instead of being recycled.
//
// The primary template keeps every value unchanged. Specialize it for your own
// types, or pass a policy with the same static Apply as the second template
// argument of ObjectPool. Apply runs from a destructor and must not throw.
template <typename T, typename Enable = void>
struct Sanitizer {
  static bool Apply(T*) { return true; }
};

// Shared rule for standard containers: drop all contents, keep the object
// (and, for most containers, its allocated capacity).
template <typename Container>
struct ClearingSanitizer {
  static bool Apply(Container* value) {
    value->clear();
    return true;
  }
};

template <typename T, typename A>
struct Sanitizer<std::vector<T, A> > : ClearingSanitizer<std::vector<T, A> > {};

template <typename T, typename A>
struct Sanitizer<std::deque<T, A> > : ClearingSanitizer<std::deque<T, A> > {};

template <typename T, typename A>
struct Sanitizer<std::list<T, A> > : ClearingSanitizer<std::list<T, A> > {};

template <typename T, typename A>
struct Sanitizer<std::forward_list<T, A> > : ClearingSanitizer<std::forward_list<T, A> > {};

template <typename K, typename V, typename C, typename A>
struct Sanitizer<std::map<K, V, C, A> > : ClearingSanitizer<std::map<K, V, C, A> > {};

template <typename K, typename V, typename C, typename A>
struct Sanitizer<std::multimap<K, V, C, A> > : ClearingSanitizer<std::multimap<K, V, C, A> > {};

template <typename K, typename C, typename A>
struct Sanitizer<std::set<K, C, A> > : ClearingSanitizer<std::set<K, C, A> > {};

template <typename K, typename C, typename A>
struct Sanitizer<std::multiset<K, C, A> > : ClearingSanitizer<std::multiset<K, C, A> > {};

template <typename K, typename V, typename H, typename E, typename A>
struct Sanitizer<std::unordered_map<K, V, H, E, A> >
    : ClearingSanitizer<std::unordered_map<K, V, H, E, A> > {};

template <typename K, typename V, typename H, typename E, typename A>
struct Sanitizer<std::unordered_multimap<K, V, H, E, A> >
    : ClearingSanitizer<std::unordered_multimap<K, V, H, E, A> > {};

template <typename K, typename H, typename E, typename A>
struct Sanitizer<std::unordered_set<K, H, E, A> >
    : ClearingSanitizer<std::unordered_set<K, H, E, A> > {};

template <typename K, typename H, typename E, typename A>
struct Sanitizer<std::unordered_multiset<K, H, E, A> >
    : ClearingSanitizer<std::unordered_multiset<K, H, E, A> > {};

template <typename C, typename Tr, typename A>
struct Sanitizer<std::basic_string<C, Tr, A> > : ClearingSanitizer<std::basic_string<C, Tr, A> > {};

// An empty optional is kept as is; an engaged one follows its inner rule.
template <typename T>
struct Sanitizer<std::optional<T> > {
  static bool Apply(std::optional<T>* value) {
    if (!value->has_value()) return true;
    return Sanitizer<T>::Apply(&value->value());
  }
};

template <typename A, typename B>
struct Sanitizer<std::pair<A, B> > {
  static bool Apply(std::pair<A, B>* value) {
    return Sanitizer<A>::Apply(&value->first) && Sanitizer<B>::Apply(&value->second);
  }
};

// Components are sanitized left to right. The first discard stops the walk
// and discards the whole tuple; later components are not touched.
template <typename... Ts>
struct Sanitizer<std::tuple<Ts...> > {
  static bool Apply(std::tuple<Ts...>* value) { return ApplyFrom<0>(value); }

 private:
  template <std::size_t I>
  static typename std::enable_if<(I == sizeof...(Ts)), bool>::type ApplyFrom(
      std::tuple<Ts...>*) {
    return true;
  }

  template <std::size_t I>
  static typename std::enable_if<(I < sizeof...(Ts)), bool>::type ApplyFrom(
      std::tuple<Ts...>* value) {
    typedef typename std::tuple_element<I, std::tuple<Ts...> >::type Element;
    if (!Sanitizer<Element>::Apply(&std::get<I>(*value))) return false;
    return ApplyFrom<I + 1>(value);
  }
};

}  // namespace memory
}  // namespace poolkit
