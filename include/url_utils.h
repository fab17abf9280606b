#ifndef URL_UTILS_H
#define URL_UTILS_H

#include <string>

namespace url
{

constexpr const char* DEFAULT_SEARCH_PREFIX = "https://www.google.com/search?q=";

/**
 * @brief True for terms that look like an address rather than a search
 *        (dotted host with optional http(s) scheme, a known TLD, or browser://)
 */
bool isUrl(const std::string& term);

/**
 * @brief Prefix https:// unless the address already names http, https or browser
 */
std::string ensureScheme(const std::string& address);

/**
 * @brief Percent-encode everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
 */
std::string encodeUriComponent(const std::string& text);

/**
 * @brief Resolve a typed term to the URL to open; empty when the term is blank
 */
std::string resolveNavigationTarget(const std::string& term, const std::string& searchPrefix);

} // namespace url

#endif // URL_UTILS_H
