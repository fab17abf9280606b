#include "url_utils.h"

#include <cstdio>
#include <regex>

namespace url
{

namespace
{
bool startsWith(const std::string& text, const char* prefix)
{
    return text.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& text)
{
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos)
    {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}
} // namespace

bool isUrl(const std::string& term)
{
    static const std::regex hostPattern(R"(^(https?://)?[\w-]+(\.[\w-]+)+)");

    if (std::regex_search(term, hostPattern))
    {
        return true;
    }

    for (const char* tld : {".com", ".org", ".net", ".io"})
    {
        if (term.find(tld) != std::string::npos)
        {
            return true;
        }
    }

    return startsWith(term, "browser://");
}

std::string ensureScheme(const std::string& address)
{
    if (startsWith(address, "http://") || startsWith(address, "https://") || startsWith(address, "browser://"))
    {
        return address;
    }
    return "https://" + address;
}

std::string encodeUriComponent(const std::string& text)
{
    static const std::string unreserved = "-_.!~*'()";

    std::string out;
    out.reserve(text.size() * 3);
    for (char ch : text)
    {
        unsigned char byte = static_cast<unsigned char>(ch);
        bool alnum = (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') || (byte >= '0' && byte <= '9');
        if (alnum || unreserved.find(ch) != std::string::npos)
        {
            out += ch;
        }
        else
        {
            char escaped[4];
            std::snprintf(escaped, sizeof(escaped), "%%%02X", byte);
            out += escaped;
        }
    }
    return out;
}

std::string resolveNavigationTarget(const std::string& term, const std::string& searchPrefix)
{
    std::string value = trim(term);
    if (value.empty())
    {
        return "";
    }

    if (isUrl(value))
    {
        return ensureScheme(value);
    }

    return searchPrefix + encodeUriComponent(value);
}

} // namespace url
