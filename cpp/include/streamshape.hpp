#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace streamshape {

struct ValidationError : public std::runtime_error {
  std::string path;
  std::string message;
  std::string kind;  // schema | type | limit | parse
  explicit ValidationError(std::string message, std::string path_ = "$", std::string kind_ = "schema")
      : std::runtime_error(message), path(std::move(path_)), message(std::move(message)), kind(std::move(kind_)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

// Fatal stream failure. Ends the stream; never attached to a single element.
struct StreamError : public std::runtime_error {
  std::string message;
  std::string kind;  // structure | source | limit
  size_t offset{0};  // absolute offset in the accumulated text
  explicit StreamError(std::string message, std::string kind_ = "structure", size_t offset_ = 0)
      : std::runtime_error(message), message(std::move(message)), kind(std::move(kind_)), offset(offset_) {}

  const char* what() const noexcept override { return message.c_str(); }
};

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();
};

// ---------------- JSON ----------------

// Strict JSON parse of the whole text. Throws ValidationError (kind "parse").
Json loads_json(const std::string& text);

std::string dumps_json(const Json& value);

// ---------------- Schema validation ----------------

// Validate a Json value against the supported JSON-schema subset.
void validate(const Json& value, const Json& schema, const std::string& path = "$");

// Collect-all variant: returns a list of validation failures (empty means valid).
std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path = "$");

struct CoercionConfig {
  bool coerce_types{true};              // "12" -> 12 for integer/number, "true"/1 -> true for boolean
  bool use_defaults{true};              // fill missing properties from schema "default"
  bool drop_unknown_properties{false};  // remove properties not listed in "properties"
};

// Applies the coercion rules to value in place, following schema.
void coerce(Json& value, const Json& schema, const CoercionConfig& config = CoercionConfig{});

enum class FieldType { String, Integer, Number, Boolean, Object, Array, Any };

class RecordShape;

struct FieldSpec {
  std::string name;
  FieldType type{FieldType::Any};
  bool required{true};
  bool nullable{false};
  std::optional<Json> default_value;
  std::shared_ptr<const RecordShape> shape;  // FieldType::Object, or array items when item_type is Object
  FieldType item_type{FieldType::Any};       // FieldType::Array
};

// Describes a target record: field name -> expected type, required/optional.
class RecordShape {
 public:
  enum class Extra {
    Ignore,  // unknown fields are dropped
    Allow,   // unknown fields are kept
    Forbid,  // unknown fields fail validation
  };

  RecordShape() = default;
  explicit RecordShape(Extra extra) : extra_(extra) {}

  RecordShape& field(std::string name, FieldType type, bool required = true);
  RecordShape& optional(std::string name, FieldType type, Json default_value = Json());
  RecordShape& nullable(std::string name, FieldType type);
  RecordShape& object(std::string name, RecordShape shape, bool required = true);
  RecordShape& array(std::string name, FieldType item_type, bool required = true);
  RecordShape& array(std::string name, RecordShape item_shape, bool required = true);
  RecordShape& add(FieldSpec spec);

  const std::vector<FieldSpec>& fields() const { return fields_; }
  Extra extra() const { return extra_; }

  Json to_schema() const;

 private:
  std::vector<FieldSpec> fields_;
  Extra extra_{Extra::Ignore};
};

// Decodes and validates the raw text of one array element.
class ElementValidator {
 public:
  virtual ~ElementValidator() = default;

  // Returns the validated (possibly coerced) value. Throws ValidationError.
  virtual Json validate(const std::string& raw) const = 0;
};

class SchemaValidator : public ElementValidator {
 public:
  explicit SchemaValidator(Json schema, CoercionConfig config = CoercionConfig{});
  explicit SchemaValidator(const RecordShape& shape);

  Json validate(const std::string& raw) const override;

  const Json& schema() const { return schema_; }

 private:
  Json schema_;
  CoercionConfig config_;
};

// ---------------- Fragment sources ----------------

struct SourceChunk {
  bool finished{false};
  std::string text;
  std::optional<Json> usage;  // only meaningful when finished
  JsonArray raw;              // opaque source events behind this chunk, kept for diagnostics
};

// Supplies text fragments. next() may block and may throw on transport failure.
class FragmentSource {
 public:
  virtual ~FragmentSource() = default;
  virtual SourceChunk next() = 0;
  // Releases the underlying handle. Called at most once; must not throw.
  virtual void close() {}
};

// Replays a fixed list of fragments, then finishes with the given usage.
class VectorSource : public FragmentSource {
 public:
  explicit VectorSource(std::vector<std::string> fragments, std::optional<Json> usage = std::nullopt);

  SourceChunk next() override;
  void close() override { closed_ = true; }

  size_t pulls() const { return pulls_; }
  bool closed() const { return closed_; }

 private:
  std::vector<std::string> fragments_;
  std::optional<Json> usage_;
  size_t pos_{0};
  size_t pulls_{0};
  bool closed_{false};
};

class LineSource {
 public:
  virtual ~LineSource() = default;
  // Returns std::nullopt once the underlying stream is exhausted.
  virtual std::optional<std::string> next_line() = 0;
  virtual void close() {}
};

class VectorLineSource : public LineSource {
 public:
  explicit VectorLineSource(std::vector<std::string> lines) : lines_(std::move(lines)) {}
  std::optional<std::string> next_line() override;
  void close() override { closed_ = true; }
  bool closed() const { return closed_; }

 private:
  std::vector<std::string> lines_;
  size_t pos_{0};
  bool closed_{false};
};

class IstreamLineSource : public LineSource {
 public:
  explicit IstreamLineSource(std::istream& in) : in_(in) {}
  std::optional<std::string> next_line() override;

 private:
  std::istream& in_;
};

// Adapts an OpenAI-compatible server-sent-events stream ("data: {...}" lines,
// "data: [DONE]", optional usage chunk after [DONE]) into text fragments taken
// from choices[0].delta.content.
class SseDeltaSource : public FragmentSource {
 public:
  explicit SseDeltaSource(std::unique_ptr<LineSource> lines);

  SourceChunk next() override;
  void close() override;

 private:
  std::unique_ptr<LineSource> lines_;
  std::optional<Json> usage_;
  bool done_seen_{false};
  bool exhausted_{false};
};

// Parses one SSE line. Returns std::nullopt for non-data lines and undecodable payloads;
// sets done when the payload is the [DONE] terminator.
std::optional<Json> parse_sse_data_line(const std::string& line, bool& done);

// choices[0].delta.content, or an empty string.
std::string delta_content(const Json& event);

// ---------------- Streaming array parsing ----------------

struct StreamLocation {
  size_t offset{0};  // absolute byte offset of the scan position
  int line{1};       // 1-based
  int col{1};        // 1-based
};

enum class ScanEvent {
  None,
  ArrayOpened,    // outer '[' seen
  ElementClosed,  // '}' brought depth from 2 to 1
  ArrayClosed,    // outer ']' seen
  Separator,      // ',' between top-level elements
  Unbalanced,     // closer with no matching opener
};

// Depth 0 means the outer array has not opened yet.
struct ScanState {
  int depth{0};
  bool in_string{false};
  bool escape{false};
};

ScanEvent scan_char(ScanState& state, char c);

struct BoundaryEvent {
  ScanEvent kind{ScanEvent::None};
  size_t offset{0};  // absolute offset of the character that caused the event
};

class StreamAccumulator {
 public:
  StreamAccumulator() = default;
  explicit StreamAccumulator(size_t max_buffer_bytes) : max_buffer_bytes_(max_buffer_bytes) {}

  // Appends a fragment and scans only the newly appended span.
  // Stops at the first Unbalanced event, which is returned last.
  std::vector<BoundaryEvent> append(const std::string& fragment);

  // Drops text before offset. Offsets stay absolute.
  void release(size_t offset);

  // Text in [start, end), absolute offsets, both within the retained buffer.
  std::string slice(size_t start, size_t end) const;
  char at(size_t offset) const { return buf_[offset - base_]; }

  const ScanState& state() const { return state_; }
  size_t base() const { return base_; }
  size_t size() const { return base_ + buf_.size(); }
  size_t retained() const { return buf_.size(); }
  StreamLocation location() const { return loc_; }

  // True when the source ending now would cut an element in half.
  bool inside_element() const { return state_.depth > 1 || state_.in_string; }
  bool over_limit() const { return max_buffer_bytes_ > 0 && buf_.size() > max_buffer_bytes_; }

 private:
  std::string buf_;
  size_t base_{0};
  size_t scanned_{0};
  size_t max_buffer_bytes_{0};
  ScanState state_{};
  StreamLocation loc_{};
};

struct ElementSlice {
  size_t start{0};  // inclusive
  size_t end{0};    // exclusive
  std::string text;
};

class ElementExtractor {
 public:
  void on_array_opened(size_t bracket_offset) { watermark_ = bracket_offset + 1; }
  void skip_to(size_t offset) {
    if (offset > watermark_) watermark_ = offset;
  }

  // Slice for a '}' boundary at end_offset; advances the watermark past it.
  ElementSlice extract(const StreamAccumulator& acc, size_t end_offset);

  // Non-separator text in [watermark, end), if any; advances the watermark to end.
  std::optional<ElementSlice> extract_tail(const StreamAccumulator& acc, size_t end);

  size_t watermark() const { return watermark_; }

 private:
  size_t watermark_{0};
};

struct UsageSnapshot {
  JsonObject counters;
  JsonArray raw_fragments;

  bool has_usage() const { return !counters.empty(); }
  int64_t prompt_tokens() const;
  int64_t completion_tokens() const;
  int64_t total_tokens() const;
  int64_t cached_tokens() const;
  int64_t reasoning_tokens() const;
  int64_t accepted_prediction_tokens() const;
  int64_t rejected_prediction_tokens() const;
};

class UsageAggregator {
 public:
  explicit UsageAggregator(bool retain_raw = true) : retain_raw_(retain_raw) {}

  void observe(const SourceChunk& chunk);
  UsageSnapshot finish(const std::optional<Json>& usage);

 private:
  bool retain_raw_{true};
  JsonArray raw_;
};

struct StreamConfig {
  bool retain_raw_fragments{true};
  size_t max_buffer_bytes{0};  // unconsumed text; 0 = unbounded
  size_t max_items{0};         // 0 = unbounded
  const std::atomic<bool>* cancel_flag{nullptr};
};

struct StreamResult {
  size_t index{0};  // element ordinal; on the summary, the number of element slots
  std::optional<Json> element;
  std::optional<ValidationError> error;
  std::string raw;  // element source text
  JsonObject usage;
  bool finished{false};
  std::optional<JsonArray> raw_fragments;
};

Json result_to_json(const StreamResult& result);

// Lazy, single-pass sequence of element results followed by one summary.
class ArrayStream {
 public:
  ArrayStream(std::unique_ptr<FragmentSource> source,
              std::shared_ptr<const ElementValidator> validator,
              StreamConfig config = StreamConfig{});
  ~ArrayStream();

  ArrayStream(ArrayStream&&) = default;
  ArrayStream& operator=(ArrayStream&&) = delete;
  ArrayStream(const ArrayStream&) = delete;
  ArrayStream& operator=(const ArrayStream&) = delete;

  // Blocks on the source. Returns std::nullopt after the summary, after cancel(),
  // and after a StreamError has been thrown.
  std::optional<StreamResult> next();

  void cancel();

  bool finished() const { return done_ && pending_.empty(); }
  size_t emitted() const { return emitted_; }
  StreamLocation location() const { return acc_.location(); }

  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = StreamResult;
    using difference_type = std::ptrdiff_t;
    using pointer = const StreamResult*;
    using reference = const StreamResult&;

    iterator() = default;
    explicit iterator(ArrayStream* stream) : stream_(stream) { advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator& operator++() {
      advance();
      return *this;
    }
    bool operator==(const iterator& other) const { return stream_ == other.stream_; }
    bool operator!=(const iterator& other) const { return !(*this == other); }

   private:
    void advance();

    ArrayStream* stream_{nullptr};
    std::optional<StreamResult> current_;
  };

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

 private:
  void process(const SourceChunk& chunk);
  void complete(const std::optional<Json>& usage);
  void emit_element(const ElementSlice& slice);
  void fail(StreamError error);
  void close_source();

  std::unique_ptr<FragmentSource> source_;
  std::shared_ptr<const ElementValidator> validator_;
  StreamConfig config_;
  StreamAccumulator acc_;
  ElementExtractor extractor_;
  UsageAggregator usage_;
  std::deque<StreamResult> pending_;
  std::optional<StreamError> failure_;
  size_t emitted_{0};
  bool source_open_{true};
  bool done_{false};
};

ArrayStream open_array_stream(std::unique_ptr<FragmentSource> source,
                              std::shared_ptr<const ElementValidator> validator,
                              StreamConfig config = StreamConfig{});

// One-shot decode of a complete array through the streaming pipeline.
// Throws ValidationError (path "$[i]...") on the first failing element, StreamError on structure.
JsonArray parse_and_validate_array(const std::string& text, const ElementValidator& validator);

}  // namespace streamshape
