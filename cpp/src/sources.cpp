#include "streamshape.hpp"

#include <istream>

namespace streamshape {

// ---------------- In-memory sources ----------------

VectorSource::VectorSource(std::vector<std::string> fragments, std::optional<Json> usage)
    : fragments_(std::move(fragments)), usage_(std::move(usage)) {}

SourceChunk VectorSource::next() {
  ++pulls_;
  SourceChunk chunk;
  if (pos_ < fragments_.size()) {
    chunk.text = fragments_[pos_++];
    return chunk;
  }
  chunk.finished = true;
  chunk.usage = usage_;
  return chunk;
}

std::optional<std::string> VectorLineSource::next_line() {
  if (closed_ || pos_ >= lines_.size()) return std::nullopt;
  return lines_[pos_++];
}

std::optional<std::string> IstreamLineSource::next_line() {
  std::string line;
  if (!std::getline(in_, line)) return std::nullopt;
  return line;
}

// ---------------- Server-sent events ----------------

std::optional<Json> parse_sse_data_line(const std::string& line, bool& done) {
  done = false;
  std::string s = line;
  if (!s.empty() && s.back() == '\r') s.pop_back();
  if (s.rfind("data:", 0) != 0) return std::nullopt;

  std::string payload = s.substr(5);
  if (!payload.empty() && payload[0] == ' ') payload.erase(0, 1);
  if (payload == "[DONE]") {
    done = true;
    return std::nullopt;
  }

  try {
    return loads_json(payload);
  } catch (const ValidationError&) {
    // Keep-alives and partial payloads are not events.
    return std::nullopt;
  }
}

std::string delta_content(const Json& event) {
  if (!event.is_object()) return std::string();
  const auto& obj = event.as_object();
  auto it = obj.find("choices");
  if (it == obj.end() || !it->second.is_array() || it->second.as_array().empty()) return std::string();

  const Json& first = it->second.as_array().front();
  if (!first.is_object()) return std::string();
  auto it_delta = first.as_object().find("delta");
  if (it_delta == first.as_object().end() || !it_delta->second.is_object()) return std::string();

  auto it_content = it_delta->second.as_object().find("content");
  if (it_content == it_delta->second.as_object().end() || !it_content->second.is_string()) return std::string();
  return it_content->second.as_string();
}

SseDeltaSource::SseDeltaSource(std::unique_ptr<LineSource> lines) : lines_(std::move(lines)) {
  if (!lines_) throw std::invalid_argument("SseDeltaSource: line source is required");
}

void SseDeltaSource::close() { lines_->close(); }

SourceChunk SseDeltaSource::next() {
  SourceChunk chunk;
  while (!exhausted_) {
    std::optional<std::string> line = lines_->next_line();
    if (!line) {
      exhausted_ = true;
      break;
    }

    bool done = false;
    std::optional<Json> event = parse_sse_data_line(*line, done);
    if (done) {
      // The usage chunk, when requested, arrives after [DONE].
      done_seen_ = true;
      continue;
    }
    if (!event) continue;
    chunk.raw.push_back(*event);

    if (event->is_object()) {
      const auto& obj = event->as_object();
      auto it = obj.find("usage");
      if (it != obj.end() && it->second.is_object() && !it->second.as_object().empty()) {
        usage_ = it->second;
        // A usage chunk after [DONE] ends the stream once its content is delivered.
        if (done_seen_) exhausted_ = true;
      }
    }

    std::string content = delta_content(*event);
    if (!content.empty()) {
      chunk.text = std::move(content);
      return chunk;
    }
  }

  chunk.finished = true;
  chunk.usage = usage_;
  return chunk;
}

}  // namespace streamshape
