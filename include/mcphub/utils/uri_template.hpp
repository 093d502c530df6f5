#ifndef MCPHUB_UTILS_URI_TEMPLATE_HPP_
#define MCPHUB_UTILS_URI_TEMPLATE_HPP_

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {
namespace uri_template {

/**
 * @brief Check whether a string contains at least one template expression
 */
bool isTemplate(const std::string &uri);

/**
 * @brief Names of the variables a template references, in order of
 * appearance and without duplicates
 *
 * @throws ProtocolException for an unterminated expression
 */
std::vector<std::string> variableNames(const std::string &uri_template);

/**
 * @brief Expand an RFC 6570 template (levels 1 to 4)
 *
 * @param uri_template The template, e.g. "file:///{path}{?rev}"
 * @param variables Object of strings, arrays of strings or objects of
 * strings; missing and null values are undefined
 * @return std::string The expanded URI
 * @throws ProtocolException for an unterminated expression
 */
std::string expand(const std::string &uri_template,
                   const nlohmann::json &variables);

/**
 * @brief Extract variable values from a URI produced by the template
 *
 * Exploded variables yield arrays, everything else strings.
 *
 * @return std::optional<nlohmann::json> The variables, or nothing if the URI
 * does not match
 */
std::optional<nlohmann::json> match(const std::string &uri_template,
                                    const std::string &uri);

} // namespace uri_template
} // namespace mcphub

#endif // MCPHUB_UTILS_URI_TEMPLATE_HPP_
