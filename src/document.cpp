#include <cctype>
#include <charconv>
#include <format>

#include "document.hpp"



std::optional<mdsite::Date> mdsite::parse_iso_date(std::string_view str) {
    // YYYY-MM-DD
    if(str.size() != 10 || str[4] != '-' || str[7] != '-') {
        return std::nullopt;
    }

    for (size_t i = 0; i < str.size(); i++) {
        if(i == 4 || i == 7) {
            continue;
        }
        if(!std::isdigit(static_cast<unsigned char>(str[i]))) {
            return std::nullopt;
        }
    }

    int y = 0;
    unsigned m = 0, d = 0;
    std::from_chars(str.data(), str.data() + 4, y);
    std::from_chars(str.data() + 5, str.data() + 7, m);
    std::from_chars(str.data() + 8, str.data() + 10, d);

    Date date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if(!date.ok()) {
        return std::nullopt;
    }

    return date;
}


std::string mdsite::to_iso_string(Date date) {
    return std::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}


std::string mdsite::to_rfc3339(Date date) {
    return to_iso_string(date) + "T00:00:00+00:00";
}


std::string mdsite::to_rfc2822(Date date) {
    static const char* weekday_names[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* month_names[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::chrono::weekday weekday{std::chrono::sys_days{date}};

    return std::format("{}, {:02} {} {:04} 00:00:00 +0000",
        weekday_names[weekday.c_encoding()],
        static_cast<unsigned>(date.day()),
        month_names[static_cast<unsigned>(date.month()) - 1],
        static_cast<int>(date.year()));
}
