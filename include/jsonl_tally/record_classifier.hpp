#pragma once
#include <string>
#include <string_view>

namespace jt {

enum class JsonKind { Object, Array, String, Number, Boolean, Null, Invalid };

const char* kind_name(JsonKind k) noexcept;

struct Classification {
  bool typed = false;
  // Valid until the next classify() call on the same classifier.
  std::string_view type_name;
  JsonKind root = JsonKind::Invalid;
  std::string_view reason;  // set when !typed
};

// Parses one line with simdjson and pulls out the string "type" field.
// One instance per thread; the parser buffers are reused across lines.
class RecordClassifier {
public:
  RecordClassifier();
  RecordClassifier(const RecordClassifier&) = delete;
  RecordClassifier& operator=(const RecordClassifier&) = delete;
  ~RecordClassifier();

  Classification classify(std::string_view line);

private:
  struct Impl; Impl* p_;
};

}
