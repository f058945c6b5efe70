#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "streamshape.hpp"

namespace py = pybind11;

using streamshape::ArrayStream;
using streamshape::Json;
using streamshape::JsonArray;
using streamshape::JsonObject;
using streamshape::SourceChunk;
using streamshape::StreamConfig;
using streamshape::StreamError;
using streamshape::StreamResult;
using streamshape::ValidationError;

static py::object ToPy(const Json& v);

static bool FromPy(py::handle v, Json& out);

static py::object ToPyObject(const JsonObject& o) {
  py::dict d;
  for (const auto& kv : o) {
    d[py::str(kv.first)] = ToPy(kv.second);
  }
  return std::move(d);
}

static py::object ToPyArray(const JsonArray& a) {
  py::list out;
  for (const auto& el : a) {
    out.append(ToPy(el));
  }
  return std::move(out);
}

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) return ToPyArray(v.as_array());
  return ToPyObject(v.as_object());
}

static bool FromPyObject(py::handle v, Json& out) {
  py::dict d = py::reinterpret_borrow<py::dict>(v);
  JsonObject obj;
  for (auto item : d) {
    if (!py::isinstance<py::str>(item.first)) return false;
    std::string key = py::cast<std::string>(item.first);
    Json child;
    if (!FromPy(item.second, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromPyArray(py::handle v, Json& out) {
  py::sequence seq = py::reinterpret_borrow<py::sequence>(v);
  JsonArray arr;
  arr.reserve(seq.size());
  for (auto item : seq) {
    Json child;
    if (!FromPy(item, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromPy(py::handle v, Json& out) {
  if (v.is_none()) {
    out = Json(nullptr);
    return true;
  }
  if (py::isinstance<py::bool_>(v)) {
    out = Json(py::cast<bool>(v));
    return true;
  }
  if (py::isinstance<py::int_>(v)) {
    // Json stores numbers as double; keep integer range loss-minimal.
    const int64_t i = py::cast<int64_t>(v);
    out = Json(i);
    return true;
  }
  if (py::isinstance<py::float_>(v)) {
    out = Json(py::cast<double>(v));
    return true;
  }
  if (py::isinstance<py::str>(v)) {
    out = Json(py::cast<std::string>(v));
    return true;
  }
  if (py::isinstance<py::dict>(v)) {
    return FromPyObject(v, out);
  }
  if (py::isinstance<py::list>(v) || py::isinstance<py::tuple>(v)) {
    return FromPyArray(v, out);
  }
  return false;
}

static Json SchemaFromPy(py::handle schema) {
  if (py::isinstance<py::str>(schema)) {
    return streamshape::loads_json(py::cast<std::string>(schema));
  }
  Json s;
  if (!FromPy(schema, s)) {
    throw std::runtime_error("schema must be a JSON-serializable dict/list/primitive or a JSON string");
  }
  return s;
}

static py::dict MakeErrorObject(const ValidationError& e) {
  py::dict d;
  d["name"] = "ValidationError";
  d["message"] = std::string(e.what());
  d["path"] = e.path;
  d["kind"] = e.kind;
  return d;
}

static py::dict ResultToDict(const StreamResult& r) {
  py::dict d;
  d["index"] = py::int_(r.index);
  d["element"] = r.element ? ToPy(*r.element) : py::none();
  d["error"] = r.error ? py::object(MakeErrorObject(*r.error)) : py::none();
  d["raw"] = py::str(r.raw);
  d["usage"] = ToPyObject(r.usage);
  d["finished"] = py::bool_(r.finished);
  d["raw_fragments"] = r.raw_fragments ? ToPyArray(*r.raw_fragments) : py::none();
  return d;
}

static py::object ValidationErrorType;
static py::object StreamErrorType;

static void TranslateValidationError(const ValidationError& e) {
  const std::string msg = std::string(e.what());
  const std::string full = e.path.empty() ? msg : (e.path + ": " + msg);
  py::object exc = ValidationErrorType(py::str(full));
  exc.attr("message") = py::str(msg);
  exc.attr("path") = py::str(e.path);
  exc.attr("kind") = py::str(e.kind);
  PyErr_SetObject(ValidationErrorType.ptr(), exc.ptr());
}

static void TranslateStreamError(const StreamError& e) {
  py::object exc = StreamErrorType(py::str(e.what()));
  exc.attr("message") = py::str(e.what());
  exc.attr("kind") = py::str(e.kind);
  exc.attr("offset") = py::int_(e.offset);
  PyErr_SetObject(StreamErrorType.ptr(), exc.ptr());
}

// ---------------- Python-backed sources ----------------

// Closes generators and other closeable iterables when the stream ends early.
static void CloseIterable(py::object& iterable, const char* where) {
  if (!iterable || !py::hasattr(iterable, "close")) return;
  try {
    iterable.attr("close")();
  } catch (py::error_already_set& e) {
    e.discard_as_unraisable(where);
  }
}

// str items are text fragments. A dict item may carry "text" and/or "usage";
// the dict itself is kept as a raw fragment.
class PyIterSource : public streamshape::FragmentSource {
 public:
  explicit PyIterSource(py::object iterable) : iterable_(std::move(iterable)), it_(py::iter(iterable_)) {}

  SourceChunk next() override {
    SourceChunk chunk;
    while (true) {
      if (exhausted_) break;
      if (it_ == py::iterator::sentinel()) {
        exhausted_ = true;
        break;
      }
      py::handle item = *it_;
      ++it_;

      if (py::isinstance<py::str>(item)) {
        chunk.text = py::cast<std::string>(item);
        return chunk;
      }
      if (!py::isinstance<py::dict>(item)) throw std::runtime_error("fragments must be str or dict items");

      Json event;
      if (!FromPy(item, event)) throw std::runtime_error("fragment dict is not JSON-serializable");
      chunk.raw.push_back(event);
      const auto& obj = event.as_object();
      auto it_usage = obj.find("usage");
      if (it_usage != obj.end() && it_usage->second.is_object()) usage_ = it_usage->second;
      auto it_text = obj.find("text");
      if (it_text != obj.end() && it_text->second.is_string() && !it_text->second.as_string().empty()) {
        chunk.text = it_text->second.as_string();
        return chunk;
      }
    }
    chunk.finished = true;
    chunk.usage = usage_;
    return chunk;
  }

  void close() override { CloseIterable(iterable_, "streamshape fragment source close"); }

 private:
  py::object iterable_;
  py::iterator it_;
  std::optional<Json> usage_;
  bool exhausted_{false};
};

// Each str item is one SSE line.
class PyLineSource : public streamshape::LineSource {
 public:
  explicit PyLineSource(py::object iterable) : iterable_(std::move(iterable)), it_(py::iter(iterable_)) {}

  std::optional<std::string> next_line() override {
    if (it_ == py::iterator::sentinel()) return std::nullopt;
    py::handle item = *it_;
    ++it_;
    if (py::isinstance<py::bytes>(item)) return py::cast<std::string>(py::reinterpret_borrow<py::bytes>(item));
    return py::cast<std::string>(item);
  }

  void close() override { CloseIterable(iterable_, "streamshape line source close"); }

 private:
  py::object iterable_;
  py::iterator it_;
};

class PyStream {
 public:
  explicit PyStream(std::unique_ptr<ArrayStream> stream) : stream_(std::move(stream)) {}

  py::dict next() {
    std::optional<StreamResult> r = stream_->next();
    if (!r) throw py::stop_iteration();
    return ResultToDict(*r);
  }

  void cancel() { stream_->cancel(); }
  bool finished() const { return stream_->finished(); }

 private:
  std::unique_ptr<ArrayStream> stream_;
};

static StreamConfig StreamConfigFromPy(bool retain_raw, py::object limits) {
  StreamConfig cfg;
  cfg.retain_raw_fragments = retain_raw;
  if (limits.is_none()) return cfg;
  py::dict d = limits.cast<py::dict>();
  if (d.contains("maxBufferBytes")) cfg.max_buffer_bytes = d["maxBufferBytes"].cast<size_t>();
  if (d.contains("maxItems")) cfg.max_items = d["maxItems"].cast<size_t>();
  return cfg;
}

PYBIND11_MODULE(_streamshape, m) {
  m.doc() = "C++17-backed streaming JSON array parsing/validation (pybind11)";

  ValidationErrorType = py::reinterpret_steal<py::object>(PyErr_NewException("streamshape.ValidationError", PyExc_Exception, nullptr));
  StreamErrorType = py::reinterpret_steal<py::object>(PyErr_NewException("streamshape.StreamError", PyExc_Exception, nullptr));
  m.attr("ValidationError") = ValidationErrorType;
  m.attr("StreamError") = StreamErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const ValidationError& e) {
      TranslateValidationError(e);
    } catch (const StreamError& e) {
      TranslateStreamError(e);
    }
  });

  m.def("loads_json", [](const std::string& text) { return ToPy(streamshape::loads_json(text)); });

  m.def("dumps_json", [](py::handle v) {
    Json j;
    if (!FromPy(v, j)) throw std::runtime_error("value is not JSON-serializable");
    return streamshape::dumps_json(j);
  });

  m.def("validate_json_value", [](py::handle value, py::handle schema, const std::string& path) {
    Json v;
    if (!FromPy(value, v)) throw std::runtime_error("value is not JSON-serializable");
    streamshape::validate(v, SchemaFromPy(schema), path);
  }, py::arg("value"), py::arg("schema"), py::arg("path") = "$");

  m.def("validate_all_json_value", [](py::handle value, py::handle schema, const std::string& path) {
    Json v;
    if (!FromPy(value, v)) throw std::runtime_error("value is not JSON-serializable");
    py::list out;
    for (const auto& e : streamshape::validate_all(v, SchemaFromPy(schema), path)) out.append(MakeErrorObject(e));
    return out;
  }, py::arg("value"), py::arg("schema"), py::arg("path") = "$");

  m.def("parse_and_validate_array", [](const std::string& text, py::handle schema) {
    streamshape::SchemaValidator validator(SchemaFromPy(schema));
    return ToPyArray(streamshape::parse_and_validate_array(text, validator));
  }, py::arg("text"), py::arg("item_schema"));

  py::class_<PyStream>(m, "ArrayStream")
      .def("__iter__", [](PyStream& self) -> PyStream& { return self; })
      .def("__next__", &PyStream::next)
      .def("cancel", &PyStream::cancel)
      .def("finished", &PyStream::finished);

  m.def("read_tokens", [](py::object fragments, py::handle schema, const std::string& mode, bool retain_raw, py::object limits) {
    std::unique_ptr<streamshape::FragmentSource> source;
    if (mode == "sse") {
      source = std::make_unique<streamshape::SseDeltaSource>(std::make_unique<PyLineSource>(std::move(fragments)));
    } else if (mode == "text") {
      source = std::make_unique<PyIterSource>(std::move(fragments));
    } else {
      throw std::invalid_argument("mode must be 'text' or 'sse'");
    }
    auto validator = std::make_shared<streamshape::SchemaValidator>(SchemaFromPy(schema));
    auto stream = std::make_unique<ArrayStream>(std::move(source), validator, StreamConfigFromPy(retain_raw, limits));
    return PyStream(std::move(stream));
  }, py::arg("fragments"), py::arg("item_schema"), py::arg("mode") = "text", py::arg("retain_raw") = true,
     py::arg("limits") = py::none());
}
