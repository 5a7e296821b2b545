/**
 * @file config.hpp
 * @brief Pipeline configuration files flattened to section/key/value entries.
 *
 * A file is parsed by the backend selected from its extension (or an
 * explicit ConfigFormat) into a ConfigStore. Nested JSON objects and YAML
 * mappings become dotted sections, so
 *   { "stage": { "source": { "role": "producer" } } }
 * and the INI section [stage.source] both yield section "stage.source",
 * key "role".
 *
 * Backends are opt-in at build time:
 *   - IniBackend  : inih           (DFLOW_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (DFLOW_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (DFLOW_CONFIG_YAML_ENABLED)
 * A backend that is not compiled in reports kFormatNotSupported.
 *
 * Usage:
 * @code
 *   dflow::IniConfig ini;
 *   if (ini.LoadFile("pipeline.ini")) {
 *     dflow::StageConfig<int> cfg;
 *     dflow::LoadStageConfig(ini, "stage.source", cfg);
 *   }
 * @endcode
 */

#ifndef DFLOW_CONFIG_HPP_
#define DFLOW_CONFIG_HPP_

#include "dflow/log.hpp"
#include "dflow/platform.hpp"
#include "dflow/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef DFLOW_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef DFLOW_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef DFLOW_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef DFLOW_CONFIG_MAX_FILE_SIZE
#define DFLOW_CONFIG_MAX_FILE_SIZE 16384U
#endif

#ifndef DFLOW_CONFIG_MAX_ENTRIES
#define DFLOW_CONFIG_MAX_ENTRIES 256U
#endif

namespace dflow {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
  }
  return *a == *b;
}

/// Extension after the last '.' of the final path component, or "".
inline const char* FileExtension(const char* path) noexcept {
  const char* ext = "";
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') {
      ext = "";
    } else if (*p == '.') {
      ext = p + 1;
    }
  }
  return ext;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") || detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") || detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Fixed-capacity table of (section, key, value) strings.
 *
 * Section and key lookups ignore ASCII case. Over-long strings are
 * truncated to kMaxKeyLen - 1 / kMaxValueLen - 1 characters.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = DFLOW_CONFIG_MAX_ENTRIES;
  static constexpr uint32_t kMaxKeyLen = 64U;
  static constexpr uint32_t kMaxValueLen = 256U;

  /// Insert or overwrite. Returns false when a new entry does not fit.
  bool Set(const char* section, const char* key, const char* value) {
    DFLOW_ASSERT(section != nullptr && key != nullptr);
    Entry* e = Lookup(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      e->section.assign(TruncateToCapacity, section);
      e->key.assign(TruncateToCapacity, key);
    }
    e->value.assign(TruncateToCapacity, value != nullptr ? value : "");
    return true;
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  optional<const char*> FindString(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return optional<const char*>();
    return optional<const char*>(e->value.c_str());
  }

  /// Whole-string decimal in [0, UINT32_MAX]; anything else is absent.
  optional<uint32_t> FindUint(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr || e->value.empty() || e->value.c_str()[0] == '-') {
      return optional<uint32_t>();
    }
    char* end = nullptr;
    unsigned long long v = std::strtoull(e->value.c_str(), &end, 10);
    if (*end != '\0' || v > UINT32_MAX) return optional<uint32_t>();
    return optional<uint32_t>(static_cast<uint32_t>(v));
  }

  bool HasSection(const char* section) const {
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 private:
  struct Entry {
    FixedString<kMaxKeyLen - 1U> section;
    FixedString<kMaxKeyLen - 1U> key;
    FixedString<kMaxValueLen - 1U> value;
  };

  const Entry* Lookup(const char* section, const char* key) const {
    for (uint32_t i = 0U; i < count_; ++i) {
      const Entry& e = entries_[i];
      if (detail::StrCaseEqual(e.key.c_str(), key) &&
          detail::StrCaseEqual(e.section.c_str(), section)) {
        return &e;
      }
    }
    return nullptr;
  }

  Entry* Lookup(const char* section, const char* key) {
    return const_cast<Entry*>(
        static_cast<const ConfigStore*>(this)->Lookup(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0U;
};

namespace detail {

/// Read a whole text file of at most DFLOW_CONFIG_MAX_FILE_SIZE bytes.
inline expected<void, ConfigError> SlurpFile(const char* path, std::string& out) {
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) {
    return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
  }
  out.clear();
  char chunk[1024];
  size_t got = 0U;
  while ((got = std::fread(chunk, 1U, sizeof(chunk), f)) > 0U) {
    out.append(chunk, got);
    if (out.size() > DFLOW_CONFIG_MAX_FILE_SIZE) break;
  }
  (void)std::fclose(f);
  if (out.size() > DFLOW_CONFIG_MAX_FILE_SIZE) {
    DFLOW_LOG_ERROR("Config", "%s is larger than %u bytes", path,
                    static_cast<unsigned>(DFLOW_CONFIG_MAX_FILE_SIZE));
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }
  return expected<void, ConfigError>::success();
}

/// "parent.child", or child alone at the top level.
inline std::string ChildSection(const std::string& parent, const std::string& child) {
  return parent.empty() ? child : parent + "." + child;
}

inline expected<void, ConfigError> Store(ConfigStore& store,
                                         const std::string& section,
                                         const std::string& key,
                                         const std::string& value) {
  if (store.Set(section.c_str(), key.c_str(), value.c_str())) {
    return expected<void, ConfigError>::success();
  }
  DFLOW_LOG_ERROR("Config", "more than %u entries, [%s] %s dropped",
                  ConfigStore::kMaxEntries, section.c_str(), key.c_str());
  return expected<void, ConfigError>::error(ConfigError::kBufferFull);
}

}  // namespace detail

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char* path) {
    DFLOW_LOG_ERROR("Config", "%s: format support not built", path);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef DFLOW_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int line = ini_parse(path, &ConfigParser::OnEntry, &store);
    if (line == 0) return expected<void, ConfigError>::success();
    if (line == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    DFLOW_LOG_ERROR("Config", "%s: syntax error or overflow at line %d", path, line);
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section, name, value) ? 1 : 0;
  }
};
#endif

#ifdef DFLOW_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    std::string text;
    auto r = detail::SlurpFile(path, text);
    if (!r) return r;
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      DFLOW_LOG_ERROR("Config", "%s: not a JSON object", path);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return Walk(store, std::string(), doc);
  }

 private:
  static expected<void, ConfigError> Walk(ConfigStore& store,
                                          const std::string& section,
                                          const nlohmann::json& obj) {
    for (const auto& item : obj.items()) {
      const nlohmann::json& v = item.value();
      auto r = v.is_object()
                   ? Walk(store, detail::ChildSection(section, item.key()), v)
                   : detail::Store(store, section, item.key(), Scalar(v));
      if (!r) return r;
    }
    return expected<void, ConfigError>::success();
  }

  static std::string Scalar(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
  }
};
#endif

#ifdef DFLOW_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    std::string text;
    auto r = detail::SlurpFile(path, text);
    if (!r) return r;
    fkyaml::node doc = fkyaml::node::deserialize(text);
    if (!doc.is_mapping()) {
      DFLOW_LOG_ERROR("Config", "%s: not a YAML mapping", path);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return Walk(store, std::string(), doc);
  }

 private:
  static expected<void, ConfigError> Walk(ConfigStore& store,
                                          const std::string& section,
                                          fkyaml::node& map) {
    for (auto it = map.begin(); it != map.end(); ++it) {
      std::string key = it.key().get_value<std::string>();
      fkyaml::node& v = *it;
      auto r = v.is_mapping()
                   ? Walk(store, detail::ChildSection(section, key), v)
                   : detail::Store(store, section, key, Scalar(v));
      if (!r) return r;
    }
    return expected<void, ConfigError>::success();
  }

  static std::string Scalar(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) return std::to_string(v.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore loadable through any of Backends.
 *
 * kAuto picks the first backend whose extension matches, or the first
 * backend when none does.
 */
template <typename First, typename... Rest>
class Config final : public ConfigStore {
 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    DFLOW_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      format = Detect(detail::FileExtension(path));
    }
    expected<void, ConfigError> r =
        expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    bool matched = TryParse<First>(path, format, r) ||
                   (TryParse<Rest>(path, format, r) || ...);
    if (!matched) {
      DFLOW_LOG_ERROR("Config", "%s: no backend for the requested format", path);
    } else if (r) {
      DFLOW_LOG_INFO("Config", "loaded %s (%u entries)", path, EntryCount());
    }
    return r;
  }

 private:
  template <typename Backend>
  bool TryParse(const char* path, ConfigFormat format,
                expected<void, ConfigError>& r) {
    if (Backend::kFormat != format) return false;
    r = ConfigParser<Backend>::ParseFile(*this, path);
    return true;
  }

  static ConfigFormat Detect(const char* ext) noexcept {
    ConfigFormat found = ConfigFormat::kAuto;
    (void)(Pick<First>(ext, found) || (Pick<Rest>(ext, found) || ...));
    return (found == ConfigFormat::kAuto) ? First::kFormat : found;
  }

  template <typename Backend>
  static bool Pick(const char* ext, ConfigFormat& found) noexcept {
    if (!Backend::MatchesExtension(ext)) return false;
    found = Backend::kFormat;
    return true;
  }
};

#ifdef DFLOW_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef DFLOW_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef DFLOW_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace dflow

#endif  // DFLOW_CONFIG_HPP_
