#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load options from a YAML file.
 *
 * Top-level scalars map to long flags (`branch: main` becomes
 * `--branch` = `main`). A top-level map is treated as a category and its
 * scalar entries are flattened the same way, so
 *
 * @code
 * Logging:
 *   log-file: deploy.log
 * @endcode
 *
 * yields `--log-file`. Booleans are rendered as `true`/`false`.
 *
 * @param path  YAML file path.
 * @param opts  Receives option values keyed by long flag.
 * @param error Receives a human-readable message on failure.
 * @return `true` on success.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load options from a JSON file.
 *
 * Same key mapping and category flattening as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
