#pragma once

/**
 * @file config_loader.hpp
 * @brief Configuration loader for poolhub
 *
 * Loads the application configuration from YAML (default) or JSON files.
 */

#include <poolhub/common/error.hpp>
#include <poolhub/core/config/config_types.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace poolhub::core::config {

/**
 * @brief Configuration loader interface
 */
class ConfigLoader {
public:
    virtual ~ConfigLoader() = default;

    // ========================================================================
    // FORMAT DETECTION
    // ========================================================================

    /**
     * @brief Detect format from file extension
     * @return JSON for .json, YAML otherwise
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief Detect format from content
     * @return JSON when the first non-blank character opens an object or array
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    // ========================================================================
    // LOADING AND PARSING
    // ========================================================================

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @param format Format override (AUTO to detect from extension)
     * @return Configuration, CONFIG_FILE_NOT_FOUND or CONFIG_PARSE_ERROR
     */
    virtual common::Result<ApplicationConfig> load(const std::filesystem::path& path,
                                                   ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Parse configuration from string
     * @param content Configuration content
     * @param format Format of content (AUTO to detect)
     */
    virtual common::Result<ApplicationConfig> parse(std::string_view content,
                                                    ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // SERIALIZATION
    // ========================================================================

    virtual common::Result<std::string> serialize(const ApplicationConfig& config,
                                                  ConfigFormat format = ConfigFormat::YAML) = 0;

    virtual common::Result<void> save(const ApplicationConfig& config,
                                      const std::filesystem::path& path,
                                      ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // VALIDATION
    // ========================================================================

    /**
     * @brief Check cross-field rules
     * @return CONFIG_INVALID_VALUE naming the offending key
     */
    virtual common::Result<void> validate(const ApplicationConfig& config) = 0;
};

/**
 * @brief Create default ConfigLoader instance
 *
 * Creates a ConfigLoader that supports both YAML and JSON formats.
 */
std::unique_ptr<ConfigLoader> create_config_loader();

/**
 * @brief ConfigLoader implementation using yaml-cpp and jsoncpp
 */
class ConfigLoaderImpl : public ConfigLoader {
public:
    ConfigLoaderImpl()           = default;
    ~ConfigLoaderImpl() override = default;

    common::Result<ApplicationConfig> load(const std::filesystem::path& path,
                                           ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<ApplicationConfig> parse(std::string_view content,
                                            ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<std::string> serialize(const ApplicationConfig& config,
                                          ConfigFormat format = ConfigFormat::YAML) override;

    common::Result<void> save(const ApplicationConfig& config, const std::filesystem::path& path,
                              ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<void> validate(const ApplicationConfig& config) override;

private:
    common::Result<std::string> read_file(const std::filesystem::path& path);
    common::Result<void> write_file(const std::filesystem::path& path, std::string_view content);
    ConfigFormat resolve_format(const std::filesystem::path& path, ConfigFormat format);
};

}  // namespace poolhub::core::config
