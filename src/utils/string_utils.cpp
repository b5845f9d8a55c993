#include "../../include/modelbase/utils/utils.h"

#include <algorithm>
#include <cctype>

namespace mdb
{
    bool strToBool(const std::string& value)
    {
        std::string s = value;
        toLowerCase(s);
        return (s == "1" || s == "true" || s == "yes" || s == "on");
    }

    void toLowerCase(std::string& str)
    {
        std::ranges::transform(str, str.begin(),
                               [](const unsigned char c) { return std::tolower(c); });
    }

    std::string toLower(std::string str)
    {
        toLowerCase(str);
        return str;
    }

    std::string trim(const std::string& s)
    {
        auto start = std::ranges::find_if_not(s, ::isspace);
        auto end = std::find_if_not(s.rbegin(), s.rend(), ::isspace).base();
        return (start < end) ? std::string(start, end) : "";
    }

    std::string generateShortId(const size_t length)
    {
        static const std::string chars =
            "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<std::size_t> dist(0, chars.size() - 1);

        std::string id;
        id.reserve(length);
        for (std::size_t i = 0; i < length; ++i)
        {
            id.push_back(chars[dist(rng)]);
        }
        return id;
    }

    std::vector<std::string> splitString(const std::string& input, const std::string& delimiter)
    {
        std::vector<std::string> tokens;
        size_t start = 0;
        size_t end = 0;

        while ((end = input.find(delimiter, start)) != std::string::npos)
        {
            tokens.push_back(input.substr(start, end - start));
            start = end + delimiter.length();
        }

        tokens.push_back(input.substr(start)); // last token
        return tokens;
    }

    std::string getEnvOrDefault(const std::string& key, const std::string& defaultValue)
    {
        const char* value = std::getenv(key.c_str());
        return value ? std::string(value) : defaultValue;
    }

    bool hasSuffix(const std::string& str, const std::string& suffix)
    {
        return str.size() > suffix.size() && str.ends_with(suffix);
    }

    std::string camelCaseToWords(const std::string& identifier)
    {
        std::string out;
        for (size_t i = 0; i < identifier.size(); ++i)
        {
            const auto c = static_cast<unsigned char>(identifier[i]);
            if (std::isupper(c) && i > 0)
            {
                const auto prev = static_cast<unsigned char>(identifier[i - 1]);
                const bool nextIsLower = i + 1 < identifier.size()
                                         && std::islower(static_cast<unsigned char>(identifier[i + 1]));
                // Break before a new word, keeping acronyms like `ID` or `URL` together
                if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && nextIsLower))
                    out.push_back(' ');
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        return out;
    }
}
