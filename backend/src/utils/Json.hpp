#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yyjson.h>

namespace tf::json {

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

  // Comments and trailing commas are accepted so hand-edited config files
  // parse.
  static Document parse(std::string_view payload,
                        yyjson_read_flag extra_flags = 0) {
    auto flags = static_cast<yyjson_read_flag>(
        YYJSON_READ_ALLOW_COMMENTS | YYJSON_READ_ALLOW_TRAILING_COMMAS |
        extra_flags);
    return Document(yyjson_read(payload.data(), payload.size(), flags));
  }

  static Document parse_file(std::filesystem::path const &path,
                             std::string *error = nullptr) {
    yyjson_read_err err{};
    auto flags = static_cast<yyjson_read_flag>(YYJSON_READ_ALLOW_COMMENTS |
                                               YYJSON_READ_ALLOW_TRAILING_COMMAS);
    auto *doc = yyjson_read_file(path.string().c_str(), flags, nullptr, &err);
    if (doc == nullptr && error != nullptr) {
      *error = err.msg ? err.msg : "unknown read error";
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

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    // Filenames are bytes, not necessarily UTF-8; they are written through
    // as-is rather than failing the whole document.
    char *json =
        yyjson_mut_write(doc_, YYJSON_WRITE_ALLOW_INVALID_UNICODE, nullptr);
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

// Typed lookups on an object. A present key with the wrong type yields
// std::nullopt and sets *type_error so callers can tell "absent" from "bad".
inline std::optional<std::string> get_string(yyjson_val *obj, char const *key,
                                             bool *type_error = nullptr) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!yyjson_is_str(value)) {
    if (type_error) {
      *type_error = true;
    }
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> get_int(yyjson_val *obj, char const *key,
                                           bool *type_error = nullptr) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!yyjson_is_int(value)) {
    if (type_error) {
      *type_error = true;
    }
    return std::nullopt;
  }
  if (yyjson_is_uint(value)) {
    auto raw = yyjson_get_uint(value);
    if (raw > static_cast<std::uint64_t>(INT64_MAX)) {
      if (type_error) {
        *type_error = true;
      }
      return std::nullopt;
    }
    return static_cast<std::int64_t>(raw);
  }
  return yyjson_get_sint(value);
}

inline std::string write_string_array(std::vector<std::string> const &items) {
  MutableDocument doc;
  if (!doc.is_valid()) {
    return "[]";
  }
  auto *native = doc.doc();
  auto *root = yyjson_mut_arr(native);
  doc.set_root(root);
  for (auto const &item : items) {
    yyjson_mut_arr_add_strncpy(native, root, item.data(), item.size());
  }
  return doc.write("[]");
}

inline std::vector<std::string> read_string_array(std::string_view payload) {
  std::vector<std::string> result;
  if (payload.empty()) {
    return result;
  }
  auto doc = Document::parse(payload, YYJSON_READ_ALLOW_INVALID_UNICODE);
  auto *root = doc.root();
  if (root == nullptr || !yyjson_is_arr(root)) {
    return result;
  }
  size_t idx, limit;
  yyjson_val *entry = nullptr;
  yyjson_arr_foreach(root, idx, limit, entry) {
    if (yyjson_is_str(entry)) {
      result.emplace_back(yyjson_get_str(entry), yyjson_get_len(entry));
    }
  }
  return result;
}

} // namespace tf::json
