/**
 * @file calendar.cpp
 * @brief Implementation of the ISO date helpers.
 *
 * Day numbers use Howard Hinnant's days_from_civil / civil_from_days
 * algorithms, which avoid std::mktime and therefore any dependence on TZ.
 */

#include "allocsim/data/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace allocsim
{
    namespace data
    {

        namespace
        {

            bool is_leap_year(int y)
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            int days_in_month(int y, int m)
            {
                static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && is_leap_year(y))
                {
                    return 29;
                }
                return days[m - 1];
            }

            long long days_from_civil(long long y, unsigned m, unsigned d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<long long>(doe) - 719468;
            }

            void require_valid(const std::string &date)
            {
                if (!is_valid_date(date))
                {
                    throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + date + "'");
                }
            }

        } // anonymous namespace

        bool is_valid_date(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            int month = std::stoi(date.substr(5, 2));
            int day = std::stoi(date.substr(8, 2));
            if (month < 1 || month > 12)
                return false;
            return day >= 1 && day <= days_in_month(std::stoi(date.substr(0, 4)), month);
        }

        int extract_year(const std::string &date)
        {
            require_valid(date);
            return std::stoi(date.substr(0, 4));
        }

        int extract_month(const std::string &date)
        {
            require_valid(date);
            return std::stoi(date.substr(5, 2));
        }

        int extract_day(const std::string &date)
        {
            require_valid(date);
            return std::stoi(date.substr(8, 2));
        }

        long long day_number(const std::string &date)
        {
            return days_from_civil(extract_year(date),
                                   static_cast<unsigned>(extract_month(date)),
                                   static_cast<unsigned>(extract_day(date)));
        }

        std::string date_from_day_number(long long days)
        {
            days += 719468;
            const long long era = (days >= 0 ? days : days - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(days - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            long long y = static_cast<long long>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            const unsigned d = doy - (153 * mp + 2) / 5 + 1;
            const unsigned m = mp < 10 ? mp + 3 : mp - 9;
            if (m <= 2)
                ++y;

            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", y, m, d);
            return std::string(buffer);
        }

        int day_of_week(const std::string &date)
        {
            // 1970-01-01 was a Thursday (index 3 with Monday = 0)
            long long n = day_number(date);
            long long w = (n + 3) % 7;
            if (w < 0)
                w += 7;
            return static_cast<int>(w);
        }

        long long days_between(const std::string &date1, const std::string &date2)
        {
            return day_number(date2) - day_number(date1);
        }

        std::string add_days(const std::string &date, long long days)
        {
            return date_from_day_number(day_number(date) + days);
        }

    } // namespace data
} // namespace allocsim
