#include "streamshape.hpp"

#include <cctype>
#include <cmath>
#include <limits>

namespace streamshape {

// ---------------- Depth tracking ----------------

ScanEvent scan_char(ScanState& state, char c) {
  if (state.depth == 0) {
    // Nothing counts until the outer array opens.
    if (c == '[') {
      state.depth = 1;
      return ScanEvent::ArrayOpened;
    }
    return ScanEvent::None;
  }

  if (state.escape) {
    state.escape = false;
    return ScanEvent::None;
  }

  if (state.in_string) {
    if (c == '\\') {
      state.escape = true;
    } else if (c == '"') {
      state.in_string = false;
    }
    return ScanEvent::None;
  }

  switch (c) {
    case '"':
      state.in_string = true;
      return ScanEvent::None;
    case ',':
      return state.depth == 1 ? ScanEvent::Separator : ScanEvent::None;
    case '{':
    case '[':
      ++state.depth;
      return ScanEvent::None;
    case '}':
    case ']':
      if (state.depth == 1) {
        if (c == ']') {
          state.depth = 0;
          return ScanEvent::ArrayClosed;
        }
        return ScanEvent::Unbalanced;
      }
      --state.depth;
      if (state.depth == 1 && c == '}') return ScanEvent::ElementClosed;
      return ScanEvent::None;
    default:
      return ScanEvent::None;
  }
}

// ---------------- Accumulator ----------------

std::vector<BoundaryEvent> StreamAccumulator::append(const std::string& fragment) {
  std::vector<BoundaryEvent> events;
  buf_ += fragment;

  const size_t end = size();
  while (scanned_ < end) {
    const char c = buf_[scanned_ - base_];
    const ScanEvent ev = scan_char(state_, c);
    if (ev != ScanEvent::None) events.push_back(BoundaryEvent{ev, scanned_});

    ++scanned_;
    loc_.offset = scanned_;
    if (c == '\n') {
      ++loc_.line;
      loc_.col = 1;
    } else {
      ++loc_.col;
    }

    if (ev == ScanEvent::Unbalanced) break;
  }
  return events;
}

void StreamAccumulator::release(size_t offset) {
  if (offset <= base_) return;
  size_t n = offset - base_;
  if (n > buf_.size()) n = buf_.size();
  buf_.erase(0, n);
  base_ += n;
}

std::string StreamAccumulator::slice(size_t start, size_t end) const {
  if (end <= start) return std::string();
  return buf_.substr(start - base_, end - start);
}

// ---------------- Element extraction ----------------

static bool is_separator(char c) { return c == ',' || std::isspace(static_cast<unsigned char>(c)); }

ElementSlice ElementExtractor::extract(const StreamAccumulator& acc, size_t end_offset) {
  size_t start = watermark_;
  while (start < end_offset && is_separator(acc.at(start))) ++start;

  ElementSlice slice;
  slice.start = start;
  slice.end = end_offset + 1;
  slice.text = acc.slice(slice.start, slice.end);
  watermark_ = end_offset + 1;
  return slice;
}

std::optional<ElementSlice> ElementExtractor::extract_tail(const StreamAccumulator& acc, size_t end) {
  size_t start = watermark_;
  size_t stop = end;
  while (start < stop && is_separator(acc.at(start))) ++start;
  while (stop > start && is_separator(acc.at(stop - 1))) --stop;
  if (end > watermark_) watermark_ = end;
  if (start == stop) return std::nullopt;

  ElementSlice slice;
  slice.start = start;
  slice.end = stop;
  slice.text = acc.slice(start, stop);
  return slice;
}

// ---------------- Usage ----------------

static int64_t counter_at(const JsonObject& counters, const char* key, const char* sub = nullptr) {
  auto it = counters.find(key);
  if (it == counters.end()) return 0;
  const Json* v = &it->second;
  if (sub) {
    if (!v->is_object()) return 0;
    auto it2 = v->as_object().find(sub);
    if (it2 == v->as_object().end()) return 0;
    v = &it2->second;
  }
  if (!v->is_number()) return 0;
  const double n = v->as_number();
  if (!std::isfinite(n)) return 0;
  if (n <= static_cast<double>(std::numeric_limits<int64_t>::min())) return std::numeric_limits<int64_t>::min();
  if (n >= static_cast<double>(std::numeric_limits<int64_t>::max())) return std::numeric_limits<int64_t>::max();
  return static_cast<int64_t>(n);
}

int64_t UsageSnapshot::prompt_tokens() const { return counter_at(counters, "prompt_tokens"); }
int64_t UsageSnapshot::completion_tokens() const { return counter_at(counters, "completion_tokens"); }
int64_t UsageSnapshot::total_tokens() const { return counter_at(counters, "total_tokens"); }
int64_t UsageSnapshot::cached_tokens() const { return counter_at(counters, "prompt_tokens_details", "cached_tokens"); }
int64_t UsageSnapshot::reasoning_tokens() const {
  return counter_at(counters, "completion_tokens_details", "reasoning_tokens");
}
int64_t UsageSnapshot::accepted_prediction_tokens() const {
  return counter_at(counters, "completion_tokens_details", "accepted_prediction_tokens");
}
int64_t UsageSnapshot::rejected_prediction_tokens() const {
  return counter_at(counters, "completion_tokens_details", "rejected_prediction_tokens");
}

void UsageAggregator::observe(const SourceChunk& chunk) {
  if (!retain_raw_) return;
  if (!chunk.raw.empty()) {
    raw_.insert(raw_.end(), chunk.raw.begin(), chunk.raw.end());
  } else if (!chunk.text.empty()) {
    raw_.push_back(Json(chunk.text));
  }
}

UsageSnapshot UsageAggregator::finish(const std::optional<Json>& usage) {
  UsageSnapshot snap;
  if (usage && usage->is_object()) snap.counters = usage->as_object();
  snap.raw_fragments = std::move(raw_);
  raw_.clear();
  return snap;
}

// ---------------- Output sequencing ----------------

Json result_to_json(const StreamResult& result) {
  JsonObject o;
  o["index"] = Json(static_cast<int64_t>(result.index));
  o["element"] = result.element ? *result.element : Json();
  o["usage"] = Json(result.usage);
  o["finished"] = Json(result.finished);
  if (result.error) {
    o["error"] = Json(JsonObject{
        {"message", result.error->message},
        {"path", result.error->path},
        {"kind", result.error->kind},
    });
  }
  if (result.raw_fragments) o["raw_fragments"] = Json(*result.raw_fragments);
  return Json(std::move(o));
}

ArrayStream::ArrayStream(std::unique_ptr<FragmentSource> source,
                         std::shared_ptr<const ElementValidator> validator,
                         StreamConfig config)
    : source_(std::move(source)),
      validator_(std::move(validator)),
      config_(config),
      acc_(config.max_buffer_bytes),
      usage_(config.retain_raw_fragments) {
  if (!source_) throw std::invalid_argument("ArrayStream: source is required");
  if (!validator_) throw std::invalid_argument("ArrayStream: validator is required");
}

ArrayStream::~ArrayStream() { close_source(); }

void ArrayStream::close_source() {
  if (source_ && source_open_) {
    source_open_ = false;
    source_->close();
  }
}

void ArrayStream::fail(StreamError error) {
  failure_ = std::move(error);
  done_ = true;
  close_source();
}

void ArrayStream::cancel() {
  pending_.clear();
  failure_.reset();
  done_ = true;
  close_source();
}

void ArrayStream::emit_element(const ElementSlice& slice) {
  StreamResult r;
  r.index = emitted_;
  r.raw = slice.text;
  try {
    r.element = validator_->validate(slice.text);
  } catch (const ValidationError& e) {
    r.error = e;
  } catch (const std::exception& e) {
    r.error = ValidationError(e.what(), "$", "parse");
  }

  ++emitted_;
  if (config_.max_items > 0 && emitted_ > config_.max_items) {
    fail(StreamError("stream items exceeded maxItems (items=" + std::to_string(emitted_) +
                         ", max=" + std::to_string(config_.max_items) + ")",
                     "limit", slice.end));
    return;
  }
  pending_.push_back(std::move(r));
}

void ArrayStream::process(const SourceChunk& chunk) {
  usage_.observe(chunk);
  if (chunk.text.empty()) return;

  for (const auto& ev : acc_.append(chunk.text)) {
    switch (ev.kind) {
      case ScanEvent::ArrayOpened:
        extractor_.on_array_opened(ev.offset);
        break;
      case ScanEvent::ElementClosed:
        emit_element(extractor_.extract(acc_, ev.offset));
        break;
      case ScanEvent::Separator:
      case ScanEvent::ArrayClosed:
        // Anything left before the comma or ']' is a non-object element.
        if (auto tail = extractor_.extract_tail(acc_, ev.offset)) emit_element(*tail);
        extractor_.skip_to(ev.offset + 1);
        break;
      case ScanEvent::Unbalanced: {
        const StreamLocation loc = acc_.location();
        fail(StreamError(std::string("unbalanced '") + acc_.at(ev.offset) + "' at line " + std::to_string(loc.line) +
                             " col " + std::to_string(loc.col - 1),
                         "structure", ev.offset));
        return;
      }
      case ScanEvent::None:
        break;
    }
    if (failure_) return;
  }

  // Text outside any array is never part of an element.
  if (acc_.state().depth == 0) extractor_.skip_to(acc_.size());
  acc_.release(extractor_.watermark());

  if (acc_.over_limit()) {
    fail(StreamError("stream buffer exceeded maxBufferBytes (size=" + std::to_string(acc_.retained()) +
                         ", max=" + std::to_string(config_.max_buffer_bytes) + ")",
                     "limit", acc_.size()));
  }
}

void ArrayStream::complete(const std::optional<Json>& usage) {
  close_source();

  if (acc_.inside_element()) {
    const StreamLocation loc = acc_.location();
    fail(StreamError("stream ended inside an unterminated element (line " + std::to_string(loc.line) + " col " +
                         std::to_string(loc.col) + ")",
                     "structure", acc_.size()));
    return;
  }

  // Outer array left open: whatever follows the last element is still a slot.
  if (acc_.state().depth == 1) {
    if (auto tail = extractor_.extract_tail(acc_, acc_.size())) emit_element(*tail);
    if (failure_) return;
  }

  UsageSnapshot snap = usage_.finish(usage);
  StreamResult r;
  r.index = emitted_;
  r.finished = true;
  r.usage = std::move(snap.counters);
  r.raw_fragments = std::move(snap.raw_fragments);
  pending_.push_back(std::move(r));
  done_ = true;
}

std::optional<StreamResult> ArrayStream::next() {
  while (pending_.empty()) {
    if (failure_) {
      StreamError e = std::move(*failure_);
      failure_.reset();
      throw e;
    }
    if (done_) return std::nullopt;
    if (config_.cancel_flag && config_.cancel_flag->load()) {
      cancel();
      return std::nullopt;
    }

    SourceChunk chunk;
    try {
      chunk = source_->next();
    } catch (const StreamError&) {
      done_ = true;
      close_source();
      throw;
    } catch (const std::exception& e) {
      done_ = true;
      close_source();
      throw StreamError(std::string("source failed: ") + e.what(), "source", acc_.size());
    }

    process(chunk);
    if (chunk.finished && !failure_) complete(chunk.usage);
  }

  StreamResult r = std::move(pending_.front());
  pending_.pop_front();
  return r;
}

void ArrayStream::iterator::advance() {
  current_ = stream_->next();
  if (!current_) stream_ = nullptr;
}

ArrayStream open_array_stream(std::unique_ptr<FragmentSource> source,
                              std::shared_ptr<const ElementValidator> validator,
                              StreamConfig config) {
  return ArrayStream(std::move(source), std::move(validator), config);
}

JsonArray parse_and_validate_array(const std::string& text, const ElementValidator& validator) {
  size_t first = 0;
  while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
  if (first >= text.size() || text[first] != '[') throw ValidationError("expected a JSON array", "$", "type");

  // Borrowed: the stream does not outlive this call.
  std::shared_ptr<const ElementValidator> borrowed(&validator, [](const ElementValidator*) {});
  StreamConfig config;
  config.retain_raw_fragments = false;
  ArrayStream stream(std::make_unique<VectorSource>(std::vector<std::string>{text}), borrowed, config);

  JsonArray out;
  while (auto r = stream.next()) {
    if (r->finished) break;
    if (r->error) {
      const std::string& p = r->error->path;
      throw ValidationError(r->error->message, "$[" + std::to_string(r->index) + "]" + p.substr(p.empty() ? 0 : 1),
                            r->error->kind);
    }
    out.push_back(std::move(*r->element));
  }
  return out;
}

}  // namespace streamshape
