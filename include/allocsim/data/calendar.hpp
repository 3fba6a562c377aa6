/**
 * @file calendar.hpp
 * @brief ISO date string helpers (YYYY-MM-DD).
 *
 * Dates are carried as ISO strings throughout allocsim so that they sort
 * lexicographically. These helpers validate and decompose them and convert
 * to a proleptic Gregorian day number, independent of the local time zone.
 */

#ifndef ALLOCSIM_DATA_CALENDAR_HPP
#define ALLOCSIM_DATA_CALENDAR_HPP

#include <string>

namespace allocsim
{
    namespace data
    {

        /**
         * @brief Check for a well-formed YYYY-MM-DD date with a valid month/day.
         */
        bool is_valid_date(const std::string &date);

        int extract_year(const std::string &date);
        int extract_month(const std::string &date);
        int extract_day(const std::string &date);

        /**
         * @brief Days since 1970-01-01 for a civil date.
         * @throws std::invalid_argument If the date is malformed.
         */
        long long day_number(const std::string &date);

        /**
         * @brief Inverse of day_number().
         */
        std::string date_from_day_number(long long days);

        /**
         * @brief Day of week, 0 = Monday ... 6 = Sunday.
         */
        int day_of_week(const std::string &date);

        /**
         * @brief Calendar days from date1 to date2 (negative if date2 is earlier).
         */
        long long days_between(const std::string &date1, const std::string &date2);

        std::string add_days(const std::string &date, long long days);

    } // namespace data
} // namespace allocsim

#endif // ALLOCSIM_DATA_CALENDAR_HPP
