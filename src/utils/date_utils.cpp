#include "../../include/modelbase/utils/utils.h"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace mdb
{
    std::string currentDateTime()
    {
        const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        std::tm tm{};
        localtime_r(&tt, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    bool isValidDateTime(const std::string& value, const bool requireTime)
    {
        static const std::regex pattern(
            R"(^(\d{4})-(\d{2})-(\d{2})(?:[ T](\d{2}):(\d{2})(?::(\d{2}))?(?:\.\d+)?(?:Z|[+-]\d{2}:?\d{2})?)?$)");

        std::smatch m;
        if (!std::regex_match(value, m, pattern))
            return false;

        if (requireTime && !m[4].matched)
            return false;

        const int month = std::stoi(m[2].str());
        const int day = std::stoi(m[3].str());
        if (month < 1 || month > 12 || day < 1 || day > 31)
            return false;

        if (m[4].matched)
        {
            const int hour = std::stoi(m[4].str());
            const int minute = std::stoi(m[5].str());
            const int second = m[6].matched ? std::stoi(m[6].str()) : 0;
            if (hour > 23 || minute > 59 || second > 59)
                return false;
        }

        return true;
    }
}
