#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace tp::json {

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
    return Document(
        yyjson_read(payload.data(), payload.size(), static_cast<yyjson_read_flag>(0)));
  }

  // Reads and parses a whole file. On failure the returned document is
  // invalid and `error` (when given) describes why.
  static Document read_file(std::filesystem::path const &path,
                            std::string *error = nullptr);

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

  // Deep copies an immutable value into a fresh document.
  static MutableDocument copy_of(yyjson_val *value);
  // Deep copies a mutable value (possibly owned by another document).
  static MutableDocument copy_of(yyjson_mut_val *value);
  // Document whose root is an empty object.
  static MutableDocument empty_object();

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  MutableDocument clone() const { return copy_of(root()); }

  std::string write(char const *fallback = "{}") const {
    return write_with_flags(0, fallback);
  }

  // Four space indentation, newline at end of file.
  std::string write_pretty(char const *fallback = "{}") const {
    return write_with_flags(YYJSON_WRITE_PRETTY | YYJSON_WRITE_NEWLINE_AT_END,
                            fallback);
  }

private:
  std::string write_with_flags(yyjson_write_flag flags,
                               char const *fallback) const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, flags, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

// JSON kind used for structural comparison and validation. Integers and
// reals share the `number` kind.
enum class Kind { null, boolean, number, string, array, object, unknown };

Kind kind_of(yyjson_val *value) noexcept;
Kind kind_of(yyjson_mut_val *value) noexcept;

// Structural equality between an in-memory value and a parsed one. Object
// member order does not matter; numbers compare by value.
bool equals(yyjson_mut_val *lhs, yyjson_val *rhs);

// Parses `text` as a JSON scalar/value; anything that is not valid JSON is
// taken as a plain string.
yyjson_mut_val *parse_value(yyjson_mut_doc *doc, std::string_view text);

} // namespace tp::json
