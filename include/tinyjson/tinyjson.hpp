#pragma once

// tinyjson: a small, header-only C++17 JSON decoder.
// Decodes into registered records, standard containers, or a dynamic value tree.
// Malformed input degrades to default values; decode() reports the first problem.

#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <functional>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Config: floating-point parsing backend.
// from_chars is locale-independent; the strtod fallback follows the C locale of the process.
// Override by defining TINYJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef TINYJSON_USE_FROM_CHARS_DOUBLE
  #if defined(__cpp_lib_to_chars)
    #define TINYJSON_USE_FROM_CHARS_DOUBLE 1
  #else
    #define TINYJSON_USE_FROM_CHARS_DOUBLE 0
  #endif
#endif

namespace tinyjson {

namespace detail {

// TINYJSON_DEBUG=1 in the environment turns on debug logging. Read once.
inline bool debug_enabled() {
  static const bool enabled = [] {
    const char* env = std::getenv("TINYJSON_DEBUG");
    return env != nullptr && std::strcmp(env, "1") == 0;
  }();
  return enabled;
}

} // namespace detail

} // namespace tinyjson

#define TINYJSON_DEBUG_LOG(msg)                             \
  do {                                                      \
    if (::tinyjson::detail::debug_enabled()) {              \
      std::cerr << "tinyjson debug: " << msg << std::endl;  \
    }                                                       \
  } while (0)

namespace tinyjson {

enum class error_code {
  ok = 0,
  shape_mismatch,
  invalid_number,
  invalid_literal,
  non_string_key,
  odd_element_count,
  unterminated_string,
  nesting_too_deep
};

inline const char* error_code_name(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::shape_mismatch: return "shape_mismatch";
    case error_code::invalid_number: return "invalid_number";
    case error_code::invalid_literal: return "invalid_literal";
    case error_code::non_string_key: return "non_string_key";
    case error_code::odd_element_count: return "odd_element_count";
    case error_code::unterminated_string: return "unterminated_string";
    case error_code::nesting_too_deep: return "nesting_too_deep";
  }
  return "unknown";
}

// First problem seen during a decode call. `offset` indexes the whitespace-stripped text.
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

// Raised when a record instance of an abstract type is requested.
class unsupported_type_error : public std::runtime_error {
public:
  explicit unsupported_type_error(const std::string& what) : std::runtime_error(what) {}
};

struct decode_options {
  std::size_t max_depth{256};
};

namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\v' || c == '\f';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool is_delimited(std::string_view s, char open, char close) noexcept {
  return s.size() >= 2 && s.front() == open && s.back() == close;
}

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

// Reads exactly four hex digits at p.
inline bool parse_u4(const char* p, std::uint32_t& out_cp) noexcept {
  const int h0 = hex_val(p[0]);
  const int h1 = hex_val(p[1]);
  const int h2 = hex_val(p[2]);
  const int h3 = hex_val(p[3]);
  if ((h0 | h1 | h2 | h3) < 0) return false;
  out_cp = (static_cast<std::uint32_t>(h0) << 12) |
           (static_cast<std::uint32_t>(h1) << 8) |
           (static_cast<std::uint32_t>(h2) << 4) |
           static_cast<std::uint32_t>(h3);
  return true;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

inline bool iequals(std::string_view s, std::string_view lower_lit) noexcept {
  if (s.size() != lower_lit.size()) return false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const unsigned char uc = static_cast<unsigned char>(s[i]);
    const char lc = (uc >= 'A' && uc <= 'Z') ? static_cast<char>(uc | 0x20u) : s[i];
    if (lc != lower_lit[i]) return false;
  }
  return true;
}

// Scans the string literal whose opening quote is at s[i]. On return `i` is the index of the
// closing quote, or s.size() - 1 when the literal is unterminated (returns false then).
// Traversed characters are appended to `out` when it is non-null; a backslash escapes exactly
// the next character and is itself kept only if `keep_escape` is set.
inline bool scan_string(std::string_view s, std::size_t& i, std::string* out, bool keep_escape) {
  const std::size_t n = s.size();
  if (out) out->push_back(s[i]);
  for (++i; i < n; ++i) {
    const char c = s[i];
    if (c == '\\') {
      if (i + 1 >= n) {
        if (out && keep_escape) out->push_back(c);
        break;
      }
      if (out) {
        if (keep_escape) out->push_back(c);
        out->push_back(s[i + 1]);
      }
      ++i;
      continue;
    }
    if (out) out->push_back(c);
    if (c == '"') return true;
  }
  i = n - 1;
  return false;
}

// Removes whitespace outside string literals. Returns false if a literal ran off the end.
inline bool normalize(std::string_view json, std::string& out) {
  out.clear();
  out.reserve(json.size());
  bool terminated = true;
  for (std::size_t i = 0; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '"') {
      if (!scan_string(json, i, &out, /*keep_escape=*/true)) terminated = false;
      continue;
    }
    if (is_ws(c)) continue;
    out.push_back(c);
  }
  return terminated;
}

// Whole-token decimal integer parse; a leading '+' is accepted.
template <class Int>
inline bool parse_integer(std::string_view s, Int& out) noexcept {
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s.front() == '-') return false;
  }
  if (s.empty()) return false;
  Int v{};
  const char* first = s.data();
  const char* last = s.data() + s.size();
  const auto r = std::from_chars(first, last, v, 10);
  if (r.ec != std::errc{} || r.ptr != last) return false;
  out = v;
  return true;
}

template <class Float>
inline void strto_float(const char* buf, Float& out, char** end) {
  if constexpr (std::is_same_v<Float, float>) {
    out = std::strtof(buf, end);
  } else if constexpr (std::is_same_v<Float, double>) {
    out = std::strtod(buf, end);
  } else {
    out = std::strtold(buf, end);
  }
}

// Whole-token decimal floating-point parse with optional fraction and exponent.
template <class Float>
inline bool parse_floating(std::string_view s, Float& out) {
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s.front() == '-') return false;
  }
  if (s.empty()) return false;
#if TINYJSON_USE_FROM_CHARS_DOUBLE
  {
    Float v{};
    const char* first = s.data();
    const char* last = s.data() + s.size();
    const auto r = std::from_chars(first, last, v, std::chars_format::general);
    if (r.ec != std::errc{} || r.ptr != last) return false;
    out = v;
    return true;
  }
#else
  // Fallback: token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  std::string heap;
  char stack_buf[kStackCap];
  const char* buf = nullptr;
  if (s.size() < kStackCap) {
    std::memcpy(stack_buf, s.data(), s.size());
    stack_buf[s.size()] = '\0';
    buf = stack_buf;
  } else {
    heap.assign(s.data(), s.size());
    buf = heap.c_str();
  }
  // strtod skips leading whitespace and accepts hex; neither is a decimal token.
  if (is_ws(buf[0]) || s.find_first_of("xX") != std::string_view::npos) return false;
  char* end = nullptr;
  errno = 0;
  Float v{};
  strto_float(buf, v, &end);
  if (end != buf + s.size() || errno == ERANGE) return false;
  out = v;
  return true;
#endif
}

} // namespace detail

// Untyped result of dynamic decoding.
class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, integer, floating, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_ = i;
    return v;
  }

  static value number(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::integer;
      case 3: return kind::floating;
      case 4: return kind::string;
      case 5: return kind::array;
      case 6: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_number() const noexcept { return is_int() || is_double(); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(data_); }

  double as_double() const {
    if (is_int()) return static_cast<double>(std::get<std::int64_t>(data_));
    return std::get<double>(data_);
  }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }
  std::string& as_string() { return std::get<std::string>(data_); }

  // Element count of arrays and objects; 0 for everything else.
  std::size_t size() const noexcept {
    if (const auto* a = std::get_if<array>(&data_)) return a->size();
    if (const auto* o = std::get_if<object>(&data_)) return o->size();
    return 0;
  }

  // First member with this key (objects keep duplicate keys in input order).
  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    const auto& o = std::get<object>(data_);
    for (const auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_object()) return nullptr;
    auto& o = std::get<object>(data_);
    for (auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 null, 1 bool, 2 integer, 3 floating, 4 string, 5 array, 6 object
  std::variant<std::monostate, bool, std::int64_t, double, std::string, array, object> data_;
};

template <class T>
struct decode_result {
  T val{};
  error err;
};

// What a C++ type decodes as.
enum class shape {
  integer,
  byte,
  floating,
  double_precision,
  boolean,
  text,
  sequence,
  map,
  record,
  dynamic,
  nullable,
  unsupported
};

template <class T>
class record_schema;

// Specialize for each record type:
//
//   namespace tinyjson {
//   template <> struct record_traits<user> {
//     static void describe(record_schema<user>& s) {
//       s.field("id", &user::id);
//       s.field("display_name", &user::name).name("name");
//     }
//   };
//   }
template <class T>
struct record_traits {};

namespace detail {

template <class T>
struct is_sequence : std::false_type {};
template <class E, class A>
struct is_sequence<std::vector<E, A>> : std::true_type {};
template <class E, class A>
struct is_sequence<std::list<E, A>> : std::true_type {};
template <class E, class A>
struct is_sequence<std::deque<E, A>> : std::true_type {};

template <class T>
struct is_map : std::false_type {};
template <class K, class V, class C, class A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <class K, class V, class H, class E, class A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <class T>
struct is_optional : std::false_type {};
template <class E>
struct is_optional<std::optional<E>> : std::true_type {};

template <class T>
struct is_owning_ptr : std::false_type {};
template <class E>
struct is_owning_ptr<std::unique_ptr<E>> : std::true_type {};
template <class E>
struct is_owning_ptr<std::shared_ptr<E>> : std::true_type {};

template <class T, class = void>
struct is_record : std::false_type {};
template <class T>
struct is_record<T, std::void_t<decltype(record_traits<T>::describe(std::declval<record_schema<T>&>()))>>
    : std::true_type {};

template <class E>
std::unique_ptr<E> make_owned(std::unique_ptr<E>*) {
  return std::make_unique<E>();
}

template <class E>
std::shared_ptr<E> make_owned(std::shared_ptr<E>*) {
  return std::make_shared<E>();
}

} // namespace detail

template <class T>
constexpr shape shape_of() noexcept {
  using U = std::remove_cv_t<T>;
  if constexpr (std::is_same_v<U, bool>) {
    return shape::boolean;
  } else if constexpr (std::is_same_v<U, unsigned char> || std::is_same_v<U, std::uint8_t>) {
    return shape::byte;
  } else if constexpr (std::is_integral_v<U>) {
    return shape::integer;
  } else if constexpr (std::is_same_v<U, float>) {
    return shape::floating;
  } else if constexpr (std::is_floating_point_v<U>) {
    return shape::double_precision;
  } else if constexpr (std::is_same_v<U, std::string>) {
    return shape::text;
  } else if constexpr (std::is_same_v<U, value>) {
    return shape::dynamic;
  } else if constexpr (detail::is_sequence<U>::value) {
    return shape::sequence;
  } else if constexpr (detail::is_map<U>::value) {
    return shape::map;
  } else if constexpr (detail::is_optional<U>::value || detail::is_owning_ptr<U>::value) {
    return shape::nullable;
  } else if constexpr (detail::is_record<U>::value) {
    return shape::record;
  } else {
    return shape::unsupported;
  }
}

template <class T>
class member_cache;

// Holds the scratch state of a decoding context: the whitespace-stripped text and a pool of
// split lists. Not thread-safe; use one decoder per thread.
class decoder {
public:
  using split_list = std::vector<std::string_view>;

  decoder() = default;
  explicit decoder(decode_options opt) : opt_(opt) {}

  template <class T>
  decode_result<T> decode(std::string_view json) {
    decode_result<T> r;
    err_ = error{};
    if (!detail::normalize(json, text_)) set_error(error_code::unterminated_string, text_.size());
    r.val = decode_value<T>(text_, 0);
    r.err = err_;
    return r;
  }

  template <class T>
  T from_json(std::string_view json) {
    return decode<T>(json).val;
  }

  // Decodes a fragment of the current normalized text. Used recursively by member descriptors.
  template <class T>
  T decode_value(std::string_view json, std::size_t depth);

  value decode_dynamic(std::string_view json, std::size_t depth);

  // Splits "{k:v,k:v}" or "[v,v]" into top-level fragments (views into `json`).
  // Give the list back with recycle() to reuse its storage.
  split_list split(std::string_view json);

  void recycle(split_list&& items) {
    items.clear();
    pool_.push_back(std::move(items));
  }

  const decode_options& options() const noexcept { return opt_; }
  std::size_t pooled_lists() const noexcept { return pool_.size(); }

private:
  class pooled_split {
  public:
    pooled_split(decoder& d, std::string_view json) : d_(d), items_(d.split(json)) {}
    ~pooled_split() { d_.recycle(std::move(items_)); }
    pooled_split(const pooled_split&) = delete;
    pooled_split& operator=(const pooled_split&) = delete;

    const split_list& items() const noexcept { return items_; }

  private:
    decoder& d_;
    split_list items_;
  };

  void set_error(error_code code, std::size_t offset) {
    if (err_) return;
    err_.code = code;
    err_.offset = offset;
  }

  void set_error(error_code code, std::string_view at) {
    const char* base = text_.data();
    const bool inside = at.data() >= base && at.data() <= base + text_.size();
    set_error(code, inside ? static_cast<std::size_t>(at.data() - base) : 0u);
  }

  std::string decode_text(std::string_view json);
  bool decode_bool(std::string_view json);

  template <class T>
  T decode_sequence(std::string_view json, std::size_t depth);

  template <class T>
  T decode_map(std::string_view json, std::size_t depth);

  template <class T>
  T decode_nullable(std::string_view json, std::size_t depth);

  template <class T>
  void decode_record(std::string_view json, T& instance, std::size_t depth);

  decode_options opt_;
  std::string text_;
  std::vector<split_list> pool_;
  error err_;
};

template <class T>
struct member_descriptor {
  std::string name;
  shape kind{shape::unsupported};
  std::function<void(decoder&, T&, std::string_view, std::size_t)> assign;
};

// Wire name -> descriptor. std::less<> allows lookup by string_view.
template <class T>
using member_table = std::map<std::string, member_descriptor<T>, std::less<>>;

template <class T>
class record_schema {
public:
  struct entry {
    member_descriptor<T> desc;
    bool ignored{false};
  };

  class member_builder {
  public:
    member_builder(std::vector<entry>& entries, std::size_t index) : entries_(&entries), index_(index) {}

    // Wire name override.
    member_builder& name(std::string_view wire) {
      (*entries_)[index_].desc.name = std::string(wire);
      return *this;
    }

    member_builder& ignore() {
      (*entries_)[index_].ignored = true;
      return *this;
    }

  private:
    std::vector<entry>* entries_;
    std::size_t index_;
  };

  template <class M>
  member_builder field(std::string_view identifier, M T::*member) {
    static_assert(shape_of<M>() != shape::unsupported, "tinyjson: member type has no decoding rule");
    entry e;
    e.desc.name = std::string(identifier);
    e.desc.kind = shape_of<M>();
    e.desc.assign = [member](decoder& d, T& obj, std::string_view json, std::size_t depth) {
      obj.*member = d.decode_value<M>(json, depth);
    };
    return add(std::move(e));
  }

  template <class V, class R>
  member_builder property(std::string_view identifier, R (T::*setter)(V)) {
    using M = std::remove_cv_t<std::remove_reference_t<V>>;
    static_assert(shape_of<M>() != shape::unsupported, "tinyjson: setter argument has no decoding rule");
    entry e;
    e.desc.name = std::string(identifier);
    e.desc.kind = shape_of<M>();
    e.desc.assign = [setter](decoder& d, T& obj, std::string_view json, std::size_t depth) {
      (obj.*setter)(d.decode_value<M>(json, depth));
    };
    return add(std::move(e));
  }

  // Registers every non-ignored member of Base.
  template <class Base>
  void inherit() {
    static_assert(std::is_base_of_v<Base, T>, "tinyjson: inherit<Base>() needs a base class of T");
    record_schema<Base> base;
    record_traits<Base>::describe(base);
    for (const auto& b : base.entries()) {
      if (b.ignored) continue;
      entry e;
      e.desc.name = b.desc.name;
      e.desc.kind = b.desc.kind;
      e.desc.assign = [fn = b.desc.assign](decoder& d, T& obj, std::string_view json, std::size_t depth) {
        fn(d, static_cast<Base&>(obj), json, depth);
      };
      add(std::move(e));
    }
  }

  const std::vector<entry>& entries() const noexcept { return entries_; }

private:
  member_builder add(entry e) {
    entries_.push_back(std::move(e));
    return member_builder(entries_, entries_.size() - 1);
  }

  std::vector<entry> entries_;
};

// Registers `Type::member` under its own identifier.
#define TINYJSON_FIELD(schema, Type, member) (schema).field(#member, &Type::member)

// Built once per type on first use (thread-safe static init), read-only afterwards.
template <class T>
class member_cache {
public:
  static const member_table<T>& get() {
    static const member_table<T> table = build();
    return table;
  }

private:
  static member_table<T> build() {
    record_schema<T> schema;
    record_traits<T>::describe(schema);

    member_table<T> table;
    for (const auto& e : schema.entries()) {
      if (e.ignored) continue;
      if (!table.emplace(e.desc.name, e.desc).second) {
        TINYJSON_DEBUG_LOG("duplicate member name '" << e.desc.name << "' in " << typeid(T).name()
                                                     << ", keeping the first registration");
      }
    }
    TINYJSON_DEBUG_LOG("member table for " << typeid(T).name() << ": " << table.size() << " members");
    return table;
  }
};

template <class T>
const member_table<T>& describe() {
  return member_cache<T>::get();
}

inline decoder::split_list decoder::split(std::string_view json) {
  split_list out;
  if (!pool_.empty()) {
    out = std::move(pool_.back());
    pool_.pop_back();
  }
  out.clear();
  if (json.size() <= 2) return out;

  const std::size_t end = json.size() - 1;
  std::size_t stop = end;
  std::size_t start = 1;
  long depth = 0;
  for (std::size_t i = 1; i < end; ++i) {
    const char c = json[i];
    if (c == '"') {
      detail::scan_string(json, i, nullptr, /*keep_escape=*/true);
      // An unterminated literal swallows the closing bracket too.
      if (i >= end) stop = i + 1;
      continue;
    }
    if (c == '[' || c == '{') {
      ++depth;
    } else if (c == ']' || c == '}') {
      --depth;
    } else if ((c == ',' || c == ':') && depth == 0) {
      out.push_back(json.substr(start, i - start));
      start = i + 1;
    }
  }
  out.push_back(json.substr(start, stop - start));
  return out;
}

inline std::string decoder::decode_text(std::string_view json) {
  if (!detail::is_delimited(json, '"', '"')) set_error(error_code::shape_mismatch, json);
  if (json.size() <= 2) return std::string();

  std::string out;
  out.reserve(json.size() - 2);
  const std::size_t end = json.size() - 1;
  for (std::size_t i = 1; i < end; ++i) {
    const char c = json[i];
    if (c == '\\' && i + 1 < end) {
      switch (json[i + 1]) {
        case '"': out.push_back('"'); ++i; continue;
        case '\\': out.push_back('\\'); ++i; continue;
        case 'n': out.push_back('\n'); ++i; continue;
        case 'r': out.push_back('\r'); ++i; continue;
        case 't': out.push_back('\t'); ++i; continue;
        case 'b': out.push_back('\b'); ++i; continue;
        case 'f': out.push_back('\f'); ++i; continue;
        case '/': out.push_back('/'); ++i; continue;
        default: break;
      }
      std::uint32_t cp = 0;
      if (json[i + 1] == 'u' && i + 5 < end && detail::parse_u4(json.data() + i + 2, cp)) {
        i += 5;
        if (cp >= 0xD800u && cp <= 0xDBFFu) {
          std::uint32_t low = 0;
          if (i + 6 < end && json[i + 1] == '\\' && json[i + 2] == 'u' && detail::parse_u4(json.data() + i + 3, low) &&
              low >= 0xDC00u && low <= 0xDFFFu) {
            cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
            i += 6;
          } else {
            cp = 0xFFFDu;
          }
        } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
          cp = 0xFFFDu;
        }
        detail::append_utf8(out, cp);
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

inline bool decoder::decode_bool(std::string_view json) {
  if (detail::iequals(json, "true")) return true;
  if (!detail::iequals(json, "false")) set_error(error_code::invalid_literal, json);
  return false;
}

template <class T>
T decoder::decode_value(std::string_view json, std::size_t depth) {
  constexpr shape k = shape_of<T>();
  static_assert(k != shape::unsupported,
                "tinyjson: no decoding rule for this type; specialize tinyjson::record_traits for records");

  if (depth > opt_.max_depth) {
    TINYJSON_DEBUG_LOG("nesting deeper than " << opt_.max_depth);
    set_error(error_code::nesting_too_deep, json);
    return T{};
  }
  if (json == "null") return T{};

  if constexpr (k == shape::text) {
    return decode_text(json);
  } else if constexpr (k == shape::boolean) {
    return decode_bool(json);
  } else if constexpr (k == shape::integer || k == shape::byte) {
    T out{};
    if (!detail::parse_integer(json, out)) {
      set_error(error_code::invalid_number, json);
      return T{};
    }
    return out;
  } else if constexpr (k == shape::floating || k == shape::double_precision) {
    T out{};
    if (!detail::parse_floating(json, out)) {
      set_error(error_code::invalid_number, json);
      return T{};
    }
    return out;
  } else if constexpr (k == shape::sequence) {
    return decode_sequence<T>(json, depth);
  } else if constexpr (k == shape::map) {
    return decode_map<T>(json, depth);
  } else if constexpr (k == shape::dynamic) {
    return decode_dynamic(json, depth);
  } else if constexpr (k == shape::nullable) {
    return decode_nullable<T>(json, depth);
  } else {
    static_assert(!std::is_abstract_v<T>, "tinyjson: decode abstract records through std::unique_ptr/std::shared_ptr");
    static_assert(std::is_default_constructible_v<T>, "tinyjson: record types must be default-constructible");
    T instance{};
    if (!detail::is_delimited(json, '{', '}')) {
      set_error(error_code::shape_mismatch, json);
      return instance;
    }
    decode_record(json, instance, depth);
    return instance;
  }
}

template <class T>
T decoder::decode_sequence(std::string_view json, std::size_t depth) {
  using E = typename T::value_type;
  T out{};
  if (!detail::is_delimited(json, '[', ']')) {
    set_error(error_code::shape_mismatch, json);
    return out;
  }
  pooled_split elems(*this, json);
  if constexpr (std::is_same_v<T, std::vector<E, typename T::allocator_type>>) {
    out.reserve(elems.items().size());
  }
  for (const std::string_view item : elems.items()) {
    out.push_back(decode_value<E>(item, depth + 1));
  }
  return out;
}

template <class T>
T decoder::decode_map(std::string_view json, std::size_t depth) {
  using K = typename T::key_type;
  using V = typename T::mapped_type;
  T out{};
  if constexpr (!std::is_same_v<K, std::string>) {
    set_error(error_code::non_string_key, json);
    return out;
  } else {
    if (!detail::is_delimited(json, '{', '}')) {
      set_error(error_code::shape_mismatch, json);
      return out;
    }
    pooled_split elems(*this, json);
    const split_list& items = elems.items();
    // Split yields key/value pairs only, so a well-formed object has an even count.
    if (items.size() % 2 != 0) {
      set_error(error_code::odd_element_count, json);
      return out;
    }
    for (std::size_t i = 0; i < items.size(); i += 2) {
      if (items[i].size() <= 2) continue;
      std::string key(items[i].substr(1, items[i].size() - 2));
      if (out.find(key) != out.end()) continue;
      V v = decode_value<V>(items[i + 1], depth + 1);
      out.emplace(std::move(key), std::move(v));
    }
    return out;
  }
}

template <class T>
T decoder::decode_nullable(std::string_view json, std::size_t depth) {
  if constexpr (detail::is_optional<T>::value) {
    using E = typename T::value_type;
    return T(decode_value<E>(json, depth));
  } else {
    using E = typename T::element_type;
    if constexpr (std::is_abstract_v<E>) {
      if (!detail::is_delimited(json, '{', '}')) {
        set_error(error_code::shape_mismatch, json);
        return T{};
      }
      TINYJSON_DEBUG_LOG("cannot construct abstract type " << typeid(E).name());
      throw unsupported_type_error(std::string("tinyjson: cannot decode into abstract type ") + typeid(E).name());
    } else if constexpr (shape_of<E>() == shape::record) {
      if (!detail::is_delimited(json, '{', '}')) {
        set_error(error_code::shape_mismatch, json);
        return T{};
      }
      T ptr = detail::make_owned<E>(static_cast<T*>(nullptr));
      decode_record(json, *ptr, depth);
      return ptr;
    } else {
      T ptr = detail::make_owned<E>(static_cast<T*>(nullptr));
      *ptr = decode_value<E>(json, depth);
      return ptr;
    }
  }
}

template <class T>
void decoder::decode_record(std::string_view json, T& instance, std::size_t depth) {
  pooled_split elems(*this, json);
  const split_list& items = elems.items();
  if (items.size() % 2 != 0) {
    set_error(error_code::odd_element_count, json);
    return;
  }
  const member_table<T>& members = member_cache<T>::get();
  for (std::size_t i = 0; i < items.size(); i += 2) {
    if (items[i].size() <= 2) continue;
    const auto it = members.find(items[i].substr(1, items[i].size() - 2));
    if (it == members.end()) continue;
    it->second.assign(*this, instance, items[i + 1], depth + 1);
  }
}

inline value decoder::decode_dynamic(std::string_view json, std::size_t depth) {
  if (json.empty()) return nullptr;
  if (depth > opt_.max_depth) {
    TINYJSON_DEBUG_LOG("nesting deeper than " << opt_.max_depth);
    set_error(error_code::nesting_too_deep, json);
    return nullptr;
  }

  if (detail::is_delimited(json, '{', '}')) {
    pooled_split elems(*this, json);
    const split_list& items = elems.items();
    if (items.size() % 2 != 0) {
      set_error(error_code::odd_element_count, json);
      return nullptr;
    }
    value::object o;
    o.reserve(items.size() / 2);
    for (std::size_t i = 0; i < items.size(); i += 2) {
      if (items[i].size() < 2) continue;
      o.emplace_back(std::string(items[i].substr(1, items[i].size() - 2)), decode_dynamic(items[i + 1], depth + 1));
    }
    return value(std::move(o));
  }

  if (detail::is_delimited(json, '[', ']')) {
    pooled_split elems(*this, json);
    value::array a;
    a.reserve(elems.items().size());
    for (const std::string_view item : elems.items()) a.push_back(decode_dynamic(item, depth + 1));
    return value(std::move(a));
  }

  if (detail::is_delimited(json, '"', '"')) {
    std::string s;
    s.reserve(json.size() - 2);
    for (const char c : json.substr(1, json.size() - 2)) {
      if (c != '\\') s.push_back(c);
    }
    return value(std::move(s));
  }

  if (detail::is_digit(json.front()) || json.front() == '-') {
    if (json.find('.') != std::string_view::npos) {
      double d = 0.0;
      if (!detail::parse_floating(json, d)) {
        set_error(error_code::invalid_number, json);
        d = 0.0;
      }
      return value::number(d);
    }
    std::int64_t i = 0;
    if (!detail::parse_integer(json, i)) {
      set_error(error_code::invalid_number, json);
      i = 0;
    }
    return value::integer(i);
  }

  if (json == "true") return value(true);
  if (json == "false") return value(false);
  if (json != "null") set_error(error_code::invalid_literal, json);
  return nullptr;
}

// Decodes `json` into T with a fresh decoder. Only unsupported_type_error escapes.
template <class T>
decode_result<T> decode(std::string_view json, decode_options opt = {}) {
  decoder d(opt);
  return d.decode<T>(json);
}

// Like decode() but keeps only the value; failures give the default/absent value.
template <class T>
T from_json(std::string_view json, decode_options opt = {}) {
  return decode<T>(json, opt).val;
}

inline decode_result<value> decode_dynamic(std::string_view json, decode_options opt = {}) {
  return decode<value>(json, opt);
}

} // namespace tinyjson
