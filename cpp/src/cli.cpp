#include "streamshape.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace streamshape;

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

// Every input line is one fragment, newline included.
class LineFragmentSource : public FragmentSource {
 public:
  explicit LineFragmentSource(std::unique_ptr<LineSource> lines) : lines_(std::move(lines)) {}

  SourceChunk next() override {
    SourceChunk chunk;
    if (auto line = lines_->next_line()) {
      chunk.text = *line + "\n";
    } else {
      chunk.finished = true;
    }
    return chunk;
  }

  void close() override { lines_->close(); }

 private:
  std::unique_ptr<LineSource> lines_;
};

static void usage() {
  std::cerr
      << "streamshape_cli <text|sse> --schema <schema.json> [--input <file>] [--no-raw]\n"
      << "                [--max-items <n>] [--max-buffer <bytes>] [--verbose]\n"
      << "  Streams a JSON array (text) or OpenAI-style SSE deltas (sse) from --input or stdin\n"
      << "  and prints one JSON result per element, then a summary line.\n";
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage();
      return 2;
    }

    std::string mode = argv[1];
    std::string schema_path;
    std::string input_path;
    StreamConfig config;
    bool verbose = false;

    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--schema" && i + 1 < argc) {
        schema_path = argv[++i];
      } else if (a == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (a == "--max-items" && i + 1 < argc) {
        config.max_items = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
      } else if (a == "--max-buffer" && i + 1 < argc) {
        config.max_buffer_bytes = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
      } else if (a == "--no-raw") {
        config.retain_raw_fragments = false;
      } else if (a == "--verbose") {
        verbose = true;
      } else {
        usage();
        return 2;
      }
    }

    if (schema_path.empty() || (mode != "text" && mode != "sse")) {
      usage();
      return 2;
    }

    auto validator = std::make_shared<SchemaValidator>(loads_json(read_file(schema_path)));

    std::ifstream file;
    if (!input_path.empty()) {
      file.open(input_path, std::ios::binary);
      if (!file) throw std::runtime_error("cannot open file: " + input_path);
    }
    std::istream& in = input_path.empty() ? std::cin : file;

    std::unique_ptr<FragmentSource> source;
    if (mode == "sse") {
      source = std::make_unique<SseDeltaSource>(std::make_unique<IstreamLineSource>(in));
    } else {
      source = std::make_unique<LineFragmentSource>(std::make_unique<IstreamLineSource>(in));
    }

    ArrayStream stream = open_array_stream(std::move(source), validator, config);
    size_t failures = 0;
    for (const auto& r : stream) {
      if (r.error) {
        ++failures;
        if (verbose) std::cerr << "element " << r.index << " rejected at " << r.error->path << ": " << r.error->what() << "\n";
      }
      if (r.finished && verbose) std::cerr << "stream completed: " << r.index << " elements\n";
      std::cout << dumps_json(result_to_json(r)) << "\n";
    }
    return failures == 0 ? 0 : 3;
  } catch (const StreamError& e) {
    JsonObject o;
    o["error"] = std::string(e.what());
    o["kind"] = e.kind;
    o["offset"] = static_cast<int64_t>(e.offset);
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const ValidationError& e) {
    JsonObject o;
    o["error"] = std::string(e.what());
    o["path"] = e.path;
    std::cout << dumps_json(Json(o)) << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
