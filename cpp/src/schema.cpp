#include "streamshape.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace streamshape {

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// ---------------- JSON schema validation (subset) ----------------

static std::optional<std::string> get_string_field(const JsonObject& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (!it->second.is_string()) return std::nullopt;
  return it->second.as_string();
}

static std::optional<double> get_number_field(const JsonObject& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (!it->second.is_number()) return std::nullopt;
  return it->second.as_number();
}

static const JsonObject& require_object_schema(const Json& schema, const std::string& path) {
  if (!schema.is_object()) throw ValidationError("schema must be object", path);
  return schema.as_object();
}

static bool json_equals(const Json& a, const Json& b) {
  // For our use (enum/const), compare dumps.
  return dumps_json(a) == dumps_json(b);
}

static bool is_whole_number(double n) {
  if (!std::isfinite(n)) return false;
  double ip;
  return std::fabs(std::modf(n, &ip)) <= 1e-12;
}

// "type" may be a string or a list of strings.
static std::vector<std::string> schema_types(const JsonObject& sch) {
  std::vector<std::string> out;
  auto it = sch.find("type");
  if (it == sch.end()) return out;
  if (it->second.is_string()) {
    out.push_back(to_lower(it->second.as_string()));
  } else if (it->second.is_array()) {
    for (const auto& t : it->second.as_array()) {
      if (t.is_string()) out.push_back(to_lower(t.as_string()));
    }
  }
  return out;
}

static bool type_matches(const Json& value, const std::string& ty) {
  if (ty == "null") return value.is_null();
  if (ty == "boolean") return value.is_bool();
  if (ty == "number") return value.is_number();
  if (ty == "integer") return value.is_number() && is_whole_number(value.as_number());
  if (ty == "string") return value.is_string();
  if (ty == "array") return value.is_array();
  if (ty == "object") return value.is_object();
  return true;
}

static bool has_type(const std::vector<std::string>& types, const std::string& ty) {
  return std::find(types.begin(), types.end(), ty) != types.end();
}

struct ValidateOptions {
  bool collect_all{false};
  std::vector<ValidationError>* errors{nullptr};
};

static void validate_impl(const Json& value, const Json& schema, const std::string& path, const ValidateOptions& opt);

static bool report_or_throw(
    const ValidateOptions& opt, const std::string& message, const std::string& path, const std::string& kind = "schema") {
  if (opt.collect_all && opt.errors) {
    opt.errors->emplace_back(message, path, kind);
    return false;
  }
  throw ValidationError(message, path, kind);
}

static bool schema_passes(const Json& value, const Json& schema, const std::string& path) {
  try {
    ValidateOptions opt;
    validate_impl(value, schema, path, opt);
    return true;
  } catch (const ValidationError&) {
    return false;
  }
}

static void validate_impl(const Json& value, const Json& schema, const std::string& path, const ValidateOptions& opt) {
  const auto& sch = require_object_schema(schema, path);

  // allOf / anyOf / oneOf
  {
    auto it_all = sch.find("allOf");
    if (it_all != sch.end() && it_all->second.is_array()) {
      for (const auto& sub : it_all->second.as_array()) {
        if (!sub.is_object()) continue;
        validate_impl(value, sub, path, opt);
      }
    }

    auto it_any = sch.find("anyOf");
    if (it_any != sch.end() && it_any->second.is_array()) {
      bool ok = false;
      for (const auto& sub : it_any->second.as_array()) {
        if (!sub.is_object()) continue;
        if (schema_passes(value, sub, path)) {
          ok = true;
          break;
        }
      }
      if (!ok) {
        if (!report_or_throw(opt, "does not match anyOf", path)) return;
      }
    }

    auto it_one = sch.find("oneOf");
    if (it_one != sch.end() && it_one->second.is_array()) {
      int ok_count = 0;
      for (const auto& sub : it_one->second.as_array()) {
        if (!sub.is_object()) continue;
        if (schema_passes(value, sub, path)) ok_count++;
      }
      if (ok_count != 1) {
        if (!report_or_throw(opt, "does not match oneOf", path)) return;
      }
    }
  }

  {
    auto it = sch.find("const");
    if (it != sch.end()) {
      if (!json_equals(value, it->second)) {
        if (!report_or_throw(opt, "value does not match const", path)) return;
      }
    }
  }

  {
    auto it = sch.find("enum");
    if (it != sch.end() && it->second.is_array()) {
      const auto& arr = it->second.as_array();
      bool ok = false;
      for (const auto& v : arr) {
        if (json_equals(value, v)) {
          ok = true;
          break;
        }
      }
      if (!ok) {
        if (!report_or_throw(opt, "value not in enum", path)) return;
      }
    }
  }

  // type: a mismatch stops further checks at this path
  const auto types = schema_types(sch);
  if (!types.empty()) {
    bool ok = false;
    for (const auto& ty : types) {
      if (type_matches(value, ty)) {
        ok = true;
        break;
      }
    }
    if (!ok) {
      std::string expected;
      for (const auto& ty : types) {
        if (!expected.empty()) expected += " or ";
        expected += ty;
      }
      report_or_throw(opt, "expected " + expected, path, "type");
      return;
    }
  }

  if (value.is_number()) {
    if (auto mn = get_number_field(sch, "minimum")) {
      if (value.as_number() < *mn) {
        if (!report_or_throw(opt, "number < minimum", path)) return;
      }
    }
    if (auto mx = get_number_field(sch, "maximum")) {
      if (value.as_number() > *mx) {
        if (!report_or_throw(opt, "number > maximum", path)) return;
      }
    }
    if (auto mn = get_number_field(sch, "exclusiveMinimum")) {
      if (value.as_number() <= *mn) {
        if (!report_or_throw(opt, "number <= exclusiveMinimum", path)) return;
      }
    }
    if (auto mx = get_number_field(sch, "exclusiveMaximum")) {
      if (value.as_number() >= *mx) {
        if (!report_or_throw(opt, "number >= exclusiveMaximum", path)) return;
      }
    }

    if (auto mul = get_number_field(sch, "multipleOf")) {
      double m = *mul;
      if (m > 0.0) {
        double n = value.as_number();
        double q = n / m;
        double rq = std::round(q);
        if (!std::isfinite(q) || std::fabs(q - rq) > 1e-9) {
          if (!report_or_throw(opt, "number is not a multipleOf", path)) return;
        }
      }
    }
  }

  if (value.is_string()) {
    const auto& s = value.as_string();
    if (auto mn = get_number_field(sch, "minLength")) {
      if (static_cast<double>(s.size()) < *mn) {
        if (!report_or_throw(opt, "string shorter than minLength", path)) return;
      }
    }
    if (auto mx = get_number_field(sch, "maxLength")) {
      if (static_cast<double>(s.size()) > *mx) {
        if (!report_or_throw(opt, "string longer than maxLength", path)) return;
      }
    }

    auto it_pat = sch.find("pattern");
    if (it_pat != sch.end() && it_pat->second.is_string()) {
      try {
        std::regex r(it_pat->second.as_string(), std::regex::ECMAScript);
        if (!std::regex_search(s, r)) {
          if (!report_or_throw(opt, "string does not match pattern", path)) return;
        }
      } catch (const std::regex_error&) {
        if (!report_or_throw(opt, "invalid pattern regex", path)) return;
      }
    }

    // format (email | uuid | date-time | date)
    auto it_fmt = sch.find("format");
    if (it_fmt != sch.end() && it_fmt->second.is_string()) {
      const std::string fmt = to_lower(it_fmt->second.as_string());
      const char* re = nullptr;
      if (fmt == "email") {
        re = R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)";
      } else if (fmt == "uuid") {
        re = R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)";
      } else if (fmt == "date-time") {
        re = R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})$)";
      } else if (fmt == "date") {
        re = R"(^\d{4}-\d{2}-\d{2}$)";
      }
      if (re && !std::regex_match(s, std::regex(re, std::regex::ECMAScript))) {
        if (!report_or_throw(opt, "string does not match " + fmt + " format", path)) return;
      }
    }
  }

  if (value.is_array()) {
    const auto& arr = value.as_array();
    if (auto mn = get_number_field(sch, "minItems")) {
      if (static_cast<double>(arr.size()) < *mn) {
        if (!report_or_throw(opt, "array shorter than minItems", path)) return;
      }
    }
    if (auto mx = get_number_field(sch, "maxItems")) {
      if (static_cast<double>(arr.size()) > *mx) {
        if (!report_or_throw(opt, "array longer than maxItems", path)) return;
      }
    }

    auto it_items = sch.find("items");
    if (it_items != sch.end() && it_items->second.is_object()) {
      for (size_t idx = 0; idx < arr.size(); ++idx) {
        validate_impl(arr[idx], it_items->second, path + "[" + std::to_string(idx) + "]", opt);
      }
    }
  }

  if (value.is_object()) {
    const auto& obj = value.as_object();

    auto it_req = sch.find("required");
    if (it_req != sch.end() && it_req->second.is_array()) {
      for (const auto& k : it_req->second.as_array()) {
        if (!k.is_string()) continue;
        if (obj.find(k.as_string()) == obj.end()) {
          report_or_throw(opt, "missing required property: " + k.as_string(), path + "." + k.as_string());
        }
      }
    }

    const JsonObject* props = nullptr;
    auto it_props = sch.find("properties");
    if (it_props != sch.end() && it_props->second.is_object()) props = &it_props->second.as_object();

    enum class APMode { Allow, Forbid, Schema };
    APMode ap = APMode::Allow;
    const Json* ap_schema = nullptr;
    auto it_ap = sch.find("additionalProperties");
    if (it_ap != sch.end()) {
      if (it_ap->second.is_bool()) {
        ap = it_ap->second.as_bool() ? APMode::Allow : APMode::Forbid;
      } else if (it_ap->second.is_object()) {
        ap = APMode::Schema;
        ap_schema = &it_ap->second;
      }
    }

    for (const auto& kv : obj) {
      const std::string& key = kv.first;
      const Json& val = kv.second;
      if (props && props->find(key) != props->end()) {
        validate_impl(val, props->at(key), path + "." + key, opt);
      } else {
        if (ap == APMode::Forbid) {
          report_or_throw(opt, "additionalProperties forbidden: " + key, path + "." + key);
        }
        if (ap == APMode::Schema && ap_schema) {
          validate_impl(val, *ap_schema, path + "." + key, opt);
        }
      }
    }
  }
}

void validate(const Json& value, const Json& schema, const std::string& path) {
  ValidateOptions opt;
  validate_impl(value, schema, path, opt);
}

std::vector<ValidationError> validate_all(const Json& value, const Json& schema, const std::string& path) {
  std::vector<ValidationError> errors;
  ValidateOptions opt;
  opt.collect_all = true;
  opt.errors = &errors;
  validate_impl(value, schema, path, opt);
  return errors;
}

// ---------------- Coercion ----------------

static std::optional<double> number_from_string(const std::string& s, bool integer_only) {
  static const std::regex int_re(R"(^\s*[-+]?\d+\s*$)");
  static const std::regex num_re(R"(^\s*[-+]?(\d+\.?\d*|\.\d+)([eE][-+]?\d+)?\s*$)");
  if (!std::regex_match(s, integer_only ? int_re : num_re)) return std::nullopt;
  return std::strtod(s.c_str(), nullptr);
}

static std::optional<bool> bool_from_json(const Json& v) {
  if (v.is_number()) {
    if (v.as_number() == 0.0) return false;
    if (v.as_number() == 1.0) return true;
    return std::nullopt;
  }
  if (!v.is_string()) return std::nullopt;
  const std::string s = to_lower(v.as_string());
  if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
  if (s == "false" || s == "0" || s == "no" || s == "off") return false;
  return std::nullopt;
}

void coerce(Json& value, const Json& schema, const CoercionConfig& config) {
  if (!schema.is_object()) return;
  const auto& sch = schema.as_object();
  const auto types = schema_types(sch);

  if (config.coerce_types && !types.empty()) {
    bool matches = false;
    for (const auto& ty : types) {
      if (type_matches(value, ty)) {
        matches = true;
        break;
      }
    }
    if (!matches) {
      if (value.is_string() && (has_type(types, "integer") || has_type(types, "number"))) {
        if (auto n = number_from_string(value.as_string(), !has_type(types, "number"))) value = Json(*n);
      } else if (has_type(types, "boolean")) {
        if (auto b = bool_from_json(value)) value = Json(*b);
      }
    }
  }

  if (value.is_object()) {
    auto it_props = sch.find("properties");
    if (it_props != sch.end() && it_props->second.is_object()) {
      const auto& props = it_props->second.as_object();
      auto& obj = value.as_object();
      for (const auto& kv : props) {
        const std::string& key = kv.first;
        const Json& prop_schema = kv.second;
        if (!prop_schema.is_object()) continue;

        if (config.use_defaults && obj.find(key) == obj.end()) {
          auto it_def = prop_schema.as_object().find("default");
          if (it_def != prop_schema.as_object().end()) {
            obj[key] = it_def->second;
          }
        }

        auto it2 = obj.find(key);
        if (it2 != obj.end()) {
          coerce(it2->second, prop_schema, config);
        }
      }

      if (config.drop_unknown_properties && sch.find("additionalProperties") == sch.end()) {
        for (auto it = obj.begin(); it != obj.end();) {
          if (props.find(it->first) == props.end()) {
            it = obj.erase(it);
          } else {
            ++it;
          }
        }
      }
    }
  }

  if (value.is_array()) {
    auto it_items = sch.find("items");
    if (it_items != sch.end() && it_items->second.is_object()) {
      for (auto& elem : value.as_array()) {
        coerce(elem, it_items->second, config);
      }
    }
  }
}

// ---------------- Record shapes ----------------

static const char* field_type_name(FieldType t) {
  switch (t) {
    case FieldType::String: return "string";
    case FieldType::Integer: return "integer";
    case FieldType::Number: return "number";
    case FieldType::Boolean: return "boolean";
    case FieldType::Object: return "object";
    case FieldType::Array: return "array";
    case FieldType::Any: return nullptr;
  }
  return nullptr;
}

RecordShape& RecordShape::add(FieldSpec spec) {
  auto it = std::find_if(fields_.begin(), fields_.end(), [&](const FieldSpec& f) { return f.name == spec.name; });
  if (it != fields_.end()) {
    *it = std::move(spec);
  } else {
    fields_.push_back(std::move(spec));
  }
  return *this;
}

RecordShape& RecordShape::field(std::string name, FieldType type, bool required) {
  FieldSpec f;
  f.name = std::move(name);
  f.type = type;
  f.required = required;
  return add(std::move(f));
}

RecordShape& RecordShape::optional(std::string name, FieldType type, Json default_value) {
  FieldSpec f;
  f.name = std::move(name);
  f.type = type;
  f.required = false;
  // A null default makes the field nullable, like Optional[T] = None.
  f.nullable = default_value.is_null();
  f.default_value = std::move(default_value);
  return add(std::move(f));
}

RecordShape& RecordShape::nullable(std::string name, FieldType type) {
  FieldSpec f;
  f.name = std::move(name);
  f.type = type;
  f.nullable = true;
  return add(std::move(f));
}

RecordShape& RecordShape::object(std::string name, RecordShape shape, bool required) {
  FieldSpec f;
  f.name = std::move(name);
  f.type = FieldType::Object;
  f.required = required;
  f.shape = std::make_shared<const RecordShape>(std::move(shape));
  return add(std::move(f));
}

RecordShape& RecordShape::array(std::string name, FieldType item_type, bool required) {
  FieldSpec f;
  f.name = std::move(name);
  f.type = FieldType::Array;
  f.item_type = item_type;
  f.required = required;
  return add(std::move(f));
}

RecordShape& RecordShape::array(std::string name, RecordShape item_shape, bool required) {
  FieldSpec f;
  f.name = std::move(name);
  f.type = FieldType::Array;
  f.item_type = FieldType::Object;
  f.required = required;
  f.shape = std::make_shared<const RecordShape>(std::move(item_shape));
  return add(std::move(f));
}

static Json type_schema(FieldType type, const std::shared_ptr<const RecordShape>& shape, bool nullable) {
  if (type == FieldType::Object && shape) {
    Json s = shape->to_schema();
    if (nullable) s.as_object()["type"] = Json(JsonArray{Json("object"), Json("null")});
    return s;
  }
  JsonObject s;
  if (const char* name = field_type_name(type)) {
    if (nullable) {
      s["type"] = Json(JsonArray{Json(name), Json("null")});
    } else {
      s["type"] = Json(name);
    }
  }
  return Json(s);
}

Json RecordShape::to_schema() const {
  JsonObject props;
  JsonArray required;
  for (const auto& f : fields_) {
    Json s;
    if (f.type == FieldType::Array) {
      s = type_schema(FieldType::Array, nullptr, f.nullable);
      s.as_object()["items"] = type_schema(f.item_type, f.shape, false);
    } else {
      s = type_schema(f.type, f.shape, f.nullable);
    }
    if (f.default_value) s.as_object()["default"] = *f.default_value;
    props[f.name] = std::move(s);
    if (f.required) required.push_back(Json(f.name));
  }

  JsonObject out;
  out["type"] = Json("object");
  out["properties"] = Json(std::move(props));
  if (!required.empty()) out["required"] = Json(std::move(required));
  if (extra_ == Extra::Forbid) out["additionalProperties"] = Json(false);
  return Json(std::move(out));
}

// ---------------- Schema validator ----------------

SchemaValidator::SchemaValidator(Json schema, CoercionConfig config)
    : schema_(std::move(schema)), config_(config) {
  if (!schema_.is_object()) throw ValidationError("schema must be object", "$");
}

SchemaValidator::SchemaValidator(const RecordShape& shape) : schema_(shape.to_schema()) {
  config_.drop_unknown_properties = shape.extra() == RecordShape::Extra::Ignore;
}

Json SchemaValidator::validate(const std::string& raw) const {
  Json v = loads_json(raw);
  coerce(v, schema_, config_);
  streamshape::validate(v, schema_, "$");
  return v;
}

}  // namespace streamshape
