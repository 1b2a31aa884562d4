/**
 * @file test_config.cpp
 * @brief Tests for config.hpp: key-value store, format backends, ApplyConfig.
 */

#include "offload/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>

// ============================================================================
// ConfigStore (no backend needed)
// ============================================================================

TEST_CASE("config - store typed getters", "[config]") {
  offload::ConfigStore store;
  REQUIRE(store.Set("worker_pool", "workers", "4"));
  REQUIRE(store.Set("worker_pool", "enabled", "Yes"));
  REQUIRE(store.Set("worker_pool", "name", "decode"));

  REQUIRE(store.GetInt("worker_pool", "workers", 0) == 4);
  REQUIRE(store.GetBool("worker_pool", "enabled", false));
  REQUIRE(std::strcmp(store.GetString("worker_pool", "name"), "decode") == 0);
  REQUIRE(store.EntryCount() == 3U);
}

TEST_CASE("config - lookups are case insensitive", "[config]") {
  offload::ConfigStore store;
  REQUIRE(store.Set("Log", "Level", "warn"));
  REQUIRE(store.HasKey("log", "level"));
  REQUIRE(std::strcmp(store.GetString("LOG", "LEVEL"), "warn") == 0);
}

TEST_CASE("config - missing and malformed keys fall back", "[config]") {
  offload::ConfigStore store;
  REQUIRE(store.Set("worker_pool", "workers", "many"));
  REQUIRE(store.GetInt("worker_pool", "workers", 7) == 7);
  REQUIRE(store.GetInt("worker_pool", "absent", 3) == 3);
  REQUIRE(std::strcmp(store.GetString("nope", "nope", "dflt"), "dflt") == 0);
  REQUIRE_FALSE(store.HasKey("nope", "nope"));
}

TEST_CASE("config - Set overwrites an existing key", "[config]") {
  offload::ConfigStore store;
  REQUIRE(store.Set("parallel", "workers", "2"));
  REQUIRE(store.Set("parallel", "workers", "5"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("parallel", "workers") == 5);
}

TEST_CASE("config - store capacity is bounded", "[config]") {
  offload::ConfigStore store;
  char key[16];
  for (uint32_t i = 0U; i < offload::ConfigStore::kMaxEntries; ++i) {
    (void)std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v"));
  }
  REQUIRE_FALSE(store.Set("s", "overflow", "v"));
}

// ============================================================================
// ApplyConfig
// ============================================================================

TEST_CASE("config - ApplyConfig maps sections to settings", "[config]") {
  offload::ConfigStore store;
  REQUIRE(store.Set("worker_pool", "name", "io"));
  REQUIRE(store.Set("worker_pool", "workers", "3"));
  REQUIRE(store.Set("worker_pool", "priority", "-1"));
  REQUIRE(store.Set("parallel", "workers", "6"));
  REQUIRE(store.Set("log", "level", "ERROR"));

  offload::RuntimeConfig rc = offload::ApplyConfig(store);
  REQUIRE(rc.pool.name == "io");
  REQUIRE(rc.pool.worker_num == 3U);
  REQUIRE(rc.pool.priority == -1);
  REQUIRE(rc.parallel.worker_num == 6U);
  REQUIRE(rc.log_level == offload::log::Level::kError);
}

TEST_CASE("config - ApplyConfig keeps defaults for missing keys", "[config]") {
  offload::ConfigStore store;
  REQUIRE(store.Set("worker_pool", "workers", "-4"));
  REQUIRE(store.Set("log", "level", "verbose"));

  offload::RuntimeConfig rc = offload::ApplyConfig(store);
  REQUIRE(rc.pool.name == "pool");
  REQUIRE(rc.pool.worker_num == 0U);
  REQUIRE(rc.parallel.worker_num == 0U);
  REQUIRE(rc.log_level == offload::log::GetLevel());
}

TEST_CASE("config - ParseLogLevel", "[config]") {
  using offload::log::Level;
  REQUIRE(offload::ParseLogLevel("debug", Level::kOff) == Level::kDebug);
  REQUIRE(offload::ParseLogLevel("Info", Level::kOff) == Level::kInfo);
  REQUIRE(offload::ParseLogLevel("WARN", Level::kOff) == Level::kWarn);
  REQUIRE(offload::ParseLogLevel("off", Level::kDebug) == Level::kOff);
  REQUIRE(offload::ParseLogLevel("", Level::kWarn) == Level::kWarn);
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef OFFLOAD_CONFIG_INI_ENABLED

using IniCfg = offload::Config<offload::IniBackend>;

TEST_CASE("config - INI LoadBuffer", "[config][ini]") {
  const char* ini_data =
      "[worker_pool]\n"
      "name = render\n"
      "workers = 2\n"
      "[log]\n"
      "level = warn\n";

  IniCfg cfg;
  auto r = cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)), offload::ConfigFormat::kIni);
  REQUIRE(r.has_value());

  offload::RuntimeConfig rc = offload::ApplyConfig(cfg);
  REQUIRE(rc.pool.name == "render");
  REQUIRE(rc.pool.worker_num == 2U);
  REQUIRE(rc.log_level == offload::log::Level::kWarn);
}

TEST_CASE("config - INI LoadFile detects the extension", "[config][ini]") {
  const char* path = "/tmp/offload_test_config.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("[parallel]\nworkers = 3\n", f);
  std::fclose(f);

  IniCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetInt("parallel", "workers") == 3);
  std::remove(path);
}

TEST_CASE("config - INI missing file", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadFile("/tmp/offload_no_such_file.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == offload::ConfigError::kFileNotFound);
}

#endif  // OFFLOAD_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef OFFLOAD_CONFIG_JSON_ENABLED

using JsonCfg = offload::Config<offload::JsonBackend>;

TEST_CASE("config - JSON LoadBuffer", "[config][json]") {
  const char* json_data = R"({
    "worker_pool": { "name": "net", "workers": 4, "priority": 10 },
    "parallel": { "workers": 2 },
    "log": { "level": "debug" }
  })";

  JsonCfg cfg;
  auto r = cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)), offload::ConfigFormat::kJson);
  REQUIRE(r.has_value());

  offload::RuntimeConfig rc = offload::ApplyConfig(cfg);
  REQUIRE(rc.pool.name == "net");
  REQUIRE(rc.pool.worker_num == 4U);
  REQUIRE(rc.pool.priority == 10);
  REQUIRE(rc.parallel.worker_num == 2U);
  REQUIRE(rc.log_level == offload::log::Level::kDebug);
}

TEST_CASE("config - JSON malformed input", "[config][json]") {
  const char* bad = "{ \"worker_pool\": ";
  JsonCfg cfg;
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)), offload::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == offload::ConfigError::kParseError);
}

#endif  // OFFLOAD_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef OFFLOAD_CONFIG_YAML_ENABLED

using YamlCfg = offload::Config<offload::YamlBackend>;

TEST_CASE("config - YAML LoadBuffer", "[config][yaml]") {
  const char* yaml_data =
      "worker_pool:\n"
      "  name: audio\n"
      "  workers: 5\n"
      "log:\n"
      "  level: info\n";

  YamlCfg cfg;
  auto r = cfg.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)), offload::ConfigFormat::kYaml);
  REQUIRE(r.has_value());

  offload::RuntimeConfig rc = offload::ApplyConfig(cfg);
  REQUIRE(rc.pool.name == "audio");
  REQUIRE(rc.pool.worker_num == 5U);
  REQUIRE(rc.log_level == offload::log::Level::kInfo);
}

#endif  // OFFLOAD_CONFIG_YAML_ENABLED

// ============================================================================
// Disabled backends
// ============================================================================

#ifndef OFFLOAD_CONFIG_JSON_ENABLED
TEST_CASE("config - disabled backend reports kFormatNotSupported", "[config]") {
  offload::Config<offload::JsonBackend> cfg;
  auto r = cfg.LoadBuffer("{}", 2U, offload::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == offload::ConfigError::kFormatNotSupported);
}
#endif

TEST_CASE("config - format not in the backend list", "[config]") {
  offload::Config<offload::YamlBackend> cfg;
  auto r = cfg.LoadBuffer("x", 1U, offload::ConfigFormat::kIni);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == offload::ConfigError::kFormatNotSupported);
}
