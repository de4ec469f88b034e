#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace urlscope {

/**
 * @brief Loads ServiceConfig from TOML
 *
 * String values support ${ENV_VAR} expansion. Missing sections and keys fall
 * back to the defaults in config_types.hpp. Integer keys must hold integers
 * that fit their field; anything else fails the load before validation.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ServiceConfig config;

        static LoadResult ok(ServiceConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to urlscope.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Collect every violated constraint (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ServiceConfig& config);

private:
    static ServiceConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ServiceConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static RequestConfig extract_request(const toml::table& root);
    static CodecSettings extract_codec(const toml::table& root);
    static AnonymizerSettings extract_anonymizer(const toml::table& root);
    static CrawlerSettings extract_crawler(const toml::table& root);
    static PoolSettings extract_pool(const toml::table& root);
    static BrowserSettings extract_browser(const toml::table& root);
    static InspectionSettings extract_inspection(const toml::table& root);
};

} // namespace urlscope
