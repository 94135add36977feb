#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace kc::json {

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

  static Document parse(std::string_view payload) {
    return Document(yyjson_read(payload.data(), payload.size(),
                                static_cast<yyjson_read_flag>(0)));
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

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }

  // Creates an empty object and installs it as the document root.
  yyjson_mut_val *make_root_object() {
    if (!doc_) {
      return nullptr;
    }
    auto *obj = yyjson_mut_obj(doc_);
    yyjson_mut_doc_set_root(doc_, obj);
    return obj;
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

// Member accessors that tolerate missing keys and mismatched types, since
// media server payloads omit fields freely.
inline std::optional<std::string> string_member(yyjson_val *obj,
                                                char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> int_member(yyjson_val *obj,
                                              char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_uint(value)) {
    return static_cast<std::int64_t>(yyjson_get_uint(value));
  }
  if (yyjson_is_sint(value)) {
    return yyjson_get_sint(value);
  }
  if (yyjson_is_real(value)) {
    return static_cast<std::int64_t>(yyjson_get_real(value));
  }
  return std::nullopt;
}

inline std::optional<bool> bool_member(yyjson_val *obj, char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

inline yyjson_val *object_member(yyjson_val *obj, char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  return value && yyjson_is_obj(value) ? value : nullptr;
}

} // namespace kc::json
