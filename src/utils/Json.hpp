#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yyjson.h>

namespace ur::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  // On failure the returned document is invalid and error (if given)
  // receives yyjson's message and byte position.
  static Document parse(std::string_view payload, std::string *error = nullptr) {
    yyjson_read_err err{};
    auto *doc = yyjson_read_opts(const_cast<char *>(payload.data()), payload.size(),
                                 static_cast<yyjson_read_flag>(0), nullptr, &err);
    if (doc == nullptr && error != nullptr) {
      *error = std::string(err.msg ? err.msg : "unknown error") + " at byte " +
               std::to_string(err.pos);
    }
    return Document(doc);
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

// Member accessors distinguish "absent" (nullopt) from "present with the
// wrong type" (ok == false), which configuration loading reports separately.
template <typename T> struct Member {
  std::optional<T> value;
  bool ok = true;
};

inline Member<std::string> get_string(yyjson_val *object, char const *key) {
  Member<std::string> out;
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || yyjson_is_null(value)) {
    return out;
  }
  if (!yyjson_is_str(value)) {
    out.ok = false;
    return out;
  }
  out.value = std::string(yyjson_get_str(value), yyjson_get_len(value));
  return out;
}

inline Member<std::vector<std::string>> get_string_array(yyjson_val *object,
                                                         char const *key) {
  Member<std::vector<std::string>> out;
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || yyjson_is_null(value)) {
    return out;
  }
  if (!yyjson_is_arr(value)) {
    out.ok = false;
    return out;
  }
  std::vector<std::string> items;
  items.reserve(yyjson_arr_size(value));
  std::size_t idx = 0;
  std::size_t max = 0;
  yyjson_val *item = nullptr;
  yyjson_arr_foreach(value, idx, max, item) {
    if (!yyjson_is_str(item)) {
      out.ok = false;
      return out;
    }
    items.emplace_back(yyjson_get_str(item), yyjson_get_len(item));
  }
  out.value = std::move(items);
  return out;
}

inline Member<std::int64_t> get_integer(yyjson_val *object, char const *key) {
  Member<std::int64_t> out;
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || yyjson_is_null(value)) {
    return out;
  }
  if (!yyjson_is_int(value)) {
    out.ok = false;
    return out;
  }
  if (yyjson_is_uint(value)) {
    auto raw = yyjson_get_uint(value);
    if (raw > static_cast<std::uint64_t>(INT64_MAX)) {
      out.ok = false;
      return out;
    }
    out.value = static_cast<std::int64_t>(raw);
    return out;
  }
  out.value = yyjson_get_sint(value);
  return out;
}

} // namespace ur::json
