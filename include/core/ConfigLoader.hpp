#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ivseq::core {

  struct EngineConfig;

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * `loadEngineConfig()` maps + validates; protocol files are mapped by
 *    protocols::ProtocolJson.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `load()` + from_json + validate(); throws `std::runtime_error` on any problem.
    EngineConfig loadEngineConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace ivseq::core
