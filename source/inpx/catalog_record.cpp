#include "inpx/catalog_record.hpp"

#include <cctype>
#include "util/util.hpp"

namespace flib::inpx
{
    namespace {
        bool IsLeapYear(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        int DaysInMonth(int year, int month)
        {
            static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2 && IsLeapYear(year))
                return 29;
            return kDays[month - 1];
        }

        bool ParseDigits(const std::string& text, std::size_t pos, std::size_t count, int& out)
        {
            int value = 0;
            for (std::size_t i = pos; i < pos + count; i++) {
                if (!std::isdigit(static_cast<unsigned char>(text[i])))
                    return false;
                value = value * 10 + (text[i] - '0');
            }
            out = value;
            return true;
        }
    }

    AuthorName SplitAuthorName(const std::string& raw)
    {
        const std::vector<std::string> parts = util::splitString(raw, ',', false);
        AuthorName name;
        if (parts.size() > 0)
            name.last = util::trim(parts[0]);
        if (parts.size() > 1)
            name.first = util::trim(parts[1]);
        if (parts.size() > 2)
            name.middle = util::trim(parts[2]);

        if (name.last.empty() && !name.first.empty()) {
            name.last = name.first;
            name.first.clear();
        }
        return name;
    }

    bool TryParseIsoDate(const std::string& text, Date& out)
    {
        const std::string value = util::trim(text);
        if (value.size() != 10 || value[4] != '-' || value[7] != '-')
            return false;

        Date date;
        if (!ParseDigits(value, 0, 4, date.year) || !ParseDigits(value, 5, 2, date.month) || !ParseDigits(value, 8, 2, date.day))
            return false;
        if (date.year == 0 || date.month < 1 || date.month > 12)
            return false;
        if (date.day < 1 || date.day > DaysInMonth(date.year, date.month))
            return false;

        out = date;
        return true;
    }
}
