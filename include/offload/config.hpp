/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Runtime configuration: flat key-value store with pluggable parsers.
 *
 * Every supported format is flattened to "section + key = value". Parsers
 * are selected at compile time with backend tag types, each enabled by a
 * CMake option:
 *   - IniBackend  : inih           (OFFLOAD_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (OFFLOAD_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (OFFLOAD_CONFIG_YAML_ENABLED)
 *
 * ApplyConfig() turns a loaded store into the typed settings of this
 * library:
 *
 *   [worker_pool]  name, workers, priority
 *   [parallel]     workers
 *   [log]          level = debug | info | warn | error | off
 *
 * Usage:
 * @code
 *   offload::Config<offload::IniBackend> cfg;
 *   if (cfg.LoadFile("offload.ini").has_value()) {
 *     offload::RuntimeConfig rc = offload::ApplyConfig(cfg);
 *     offload::WorkerPool pool(rc.pool);
 *   }
 * @endcode
 */

#ifndef OFFLOAD_CONFIG_HPP_
#define OFFLOAD_CONFIG_HPP_

#include "offload/log.hpp"
#include "offload/parallel_processing.hpp"
#include "offload/platform.hpp"
#include "offload/vocabulary.hpp"
#include "offload/worker_pool.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef OFFLOAD_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef OFFLOAD_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef OFFLOAD_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef OFFLOAD_CONFIG_MAX_FILE_SIZE
#define OFFLOAD_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace offload {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kStoreFull,
};

inline const char* ErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:
      return "file not found";
    case ConfigError::kParseError:
      return "parse error";
    case ConfigError::kFormatNotSupported:
      return "format not supported";
    case ConfigError::kStoreFull:
      return "store full";
  }
  return "unknown";
}

enum class ConfigFormat : uint8_t { kAuto = 0, kIni, kJson, kYaml };

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) {
      return false;
    }
  }
  return *a == *b;
}

inline void CopyTruncated(char* dst, const char* src, uint32_t dst_size) noexcept {
  uint32_t i = 0U;
  if (src != nullptr) {
    for (; i + 1U < dst_size && src[i] != '\0'; ++i) {
      dst[i] = src[i];
    }
  }
  dst[i] = '\0';
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  return (dot != nullptr) ? dot + 1 : nullptr;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key, const char* fallback = "") const noexcept {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value : fallback;
  }

  int32_t GetInt(const char* section, const char* key, int32_t fallback = 0) const noexcept {
    const Entry* e = Find(section, key);
    if (e == nullptr) {
      return fallback;
    }
    char* end = nullptr;
    const long v = std::strtol(e->value, &end, 10);
    return (end == e->value) ? fallback : static_cast<int32_t>(v);
  }

  bool GetBool(const char* section, const char* key, bool fallback = false) const noexcept {
    const Entry* e = Find(section, key);
    if (e == nullptr) {
      return fallback;
    }
    return detail::CaseEqual(e->value, "true") || detail::CaseEqual(e->value, "yes") ||
           detail::CaseEqual(e->value, "on") || detail::CaseEqual(e->value, "1");
  }

  bool HasKey(const char* section, const char* key) const noexcept { return Find(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return count_; }

  /**
   * @brief Insert or overwrite one entry.
   * @return false when the store is full.
   */
  bool Set(const char* section, const char* key, const char* value) noexcept {
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) && detail::CaseEqual(entries_[i].key, key)) {
        detail::CopyTruncated(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) {
      return false;
    }
    Entry& e = entries_[count_++];
    detail::CopyTruncated(e.section, section, kMaxKeyLen);
    detail::CopyTruncated(e.key, key, kMaxKeyLen);
    detail::CopyTruncated(e.value, value, kMaxValueLen);
    return true;
  }

  static constexpr uint32_t kMaxEntries = 64U;
  static constexpr uint32_t kMaxKeyLen = 48U;
  static constexpr uint32_t kMaxValueLen = 128U;

 protected:
  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf, uint32_t size) noexcept {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t n = std::fread(buf, 1U, size - 1U, f);
    (void)std::fclose(f);
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

 private:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  const Entry* Find(const char* section, const char* key) const noexcept {
    OFFLOAD_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) && detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry entries_[kMaxEntries];
  uint32_t count_{0U};

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backends compiled out report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef OFFLOAD_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return Check(rc);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t /*size*/) {
    return Check(ini_parse_string(data, &OnEntry, &store));
  }

 private:
  static expected<void, ConfigError> Check(int rc) {
    if (rc != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section, name, value) ? 1 : 0;
  }
};
#endif

#ifdef OFFLOAD_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[OFFLOAD_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    const nlohmann::json root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!store.Set("", sec.key().c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kStoreFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!store.Set(sec.key().c_str(), kv.key().c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kStoreFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) {
      return n.get<std::string>();
    }
    return n.dump();
  }
};
#endif

#ifdef OFFLOAD_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[OFFLOAD_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    fkyaml::node root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const std::string section = sec.key().get_value<std::string>();
      if (!sec->is_mapping()) {
        if (!store.Set("", section.c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kStoreFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        const std::string key = kv.key().get_value<std::string>();
        if (!store.Set(section.c_str(), key.c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kStoreFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& n) {
    if (n.is_string()) {
      return n.get_value<std::string>();
    }
    if (n.is_boolean()) {
      return n.get_value<bool>() ? "true" : "false";
    }
    if (n.is_integer()) {
      return std::to_string(n.get_value<int64_t>());
    }
    if (n.is_float_number()) {
      return std::to_string(n.get_value<double>());
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    OFFLOAD_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      format = Detect(path);
    }
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    OFFLOAD_ASSERT(data != nullptr);
    return ParseBufferAs<Backends...>(data, size, format);
  }

 private:
  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseFileAs<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseBufferAs(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseBufferAs<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  static ConfigFormat Detect(const char* path) noexcept {
    const char* ext = detail::FileExtension(path);
    return (ext == nullptr) ? Primary::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  static ConfigFormat DetectExt(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) {
      return First::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Primary::kFormat;
  }
};

// ============================================================================
// RuntimeConfig
// ============================================================================

struct RuntimeConfig {
  WorkerPoolConfig pool{};
  ParallelConfig parallel{};
  log::Level log_level{log::GetLevel()};
};

inline log::Level ParseLogLevel(const char* text, log::Level fallback) noexcept {
  if (detail::CaseEqual(text, "debug")) return log::Level::kDebug;
  if (detail::CaseEqual(text, "info")) return log::Level::kInfo;
  if (detail::CaseEqual(text, "warn")) return log::Level::kWarn;
  if (detail::CaseEqual(text, "error")) return log::Level::kError;
  if (detail::CaseEqual(text, "off")) return log::Level::kOff;
  return fallback;
}

/**
 * @brief Map a loaded store onto typed settings. Missing keys keep their
 *        defaults; negative worker counts are treated as 0 (auto).
 */
inline RuntimeConfig ApplyConfig(const ConfigStore& store) noexcept {
  RuntimeConfig rc;
  if (store.HasKey("worker_pool", "name")) {
    rc.pool.name.Assign(store.GetString("worker_pool", "name"));
  }
  const int32_t workers = store.GetInt("worker_pool", "workers", 0);
  rc.pool.worker_num = (workers > 0) ? static_cast<uint32_t>(workers) : 0U;
  rc.pool.priority = store.GetInt("worker_pool", "priority", 0);

  const int32_t par_workers = store.GetInt("parallel", "workers", 0);
  rc.parallel.worker_num = (par_workers > 0) ? static_cast<uint32_t>(par_workers) : 0U;

  rc.log_level = ParseLogLevel(store.GetString("log", "level", ""), rc.log_level);
  return rc;
}

}  // namespace offload

#endif  // OFFLOAD_CONFIG_HPP_
