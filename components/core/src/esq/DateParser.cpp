#include "DateParser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace esq {
namespace {
using std::chrono::days;
using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::minutes;
using std::chrono::seconds;

constexpr std::array<std::string_view, 12> cMonthNames{
        "january",
        "february",
        "march",
        "april",
        "may",
        "june",
        "july",
        "august",
        "september",
        "october",
        "november",
        "december"
};

constexpr size_t cNumFractionDigits = 6;

struct TimeOfDay {
    microseconds since_midnight{0};
    minutes utc_offset{0};
};

/**
 * Cursor over a lower-cased input string with the handful of primitives the date grammar needs.
 * Every failed read leaves the position unchanged.
 */
class Scanner {
public:
    explicit Scanner(std::string_view input) : m_input{input} {}

    [[nodiscard]] auto at_end() const -> bool { return m_pos >= m_input.size(); }

    [[nodiscard]] auto peek() const -> char { return at_end() ? '\0' : m_input[m_pos]; }

    [[nodiscard]] auto get_position() const -> size_t { return m_pos; }

    void set_position(size_t pos) { m_pos = pos; }

    /**
     * @return Whether at least one space was skipped
     */
    auto skip_spaces() -> bool {
        auto const start = m_pos;
        while (false == at_end() && 0 != std::isspace(static_cast<unsigned char>(peek()))) {
            ++m_pos;
        }
        return m_pos != start;
    }

    auto consume(char c) -> bool {
        if (at_end() || m_input[m_pos] != c) {
            return false;
        }
        ++m_pos;
        return true;
    }

    auto consume(std::string_view word) -> bool {
        if (m_input.substr(m_pos).starts_with(word)) {
            m_pos += word.size();
            return true;
        }
        return false;
    }

    auto read_digits(size_t min_digits, size_t max_digits) -> std::optional<std::string_view> {
        auto const start = m_pos;
        while (false == at_end() && m_pos - start < max_digits
               && 0 != std::isdigit(static_cast<unsigned char>(peek())))
        {
            ++m_pos;
        }
        if (m_pos - start < min_digits) {
            m_pos = start;
            return std::nullopt;
        }
        return m_input.substr(start, m_pos - start);
    }

    auto read_number(size_t min_digits, size_t max_digits) -> std::optional<int64_t> {
        auto const digits = read_digits(min_digits, max_digits);
        if (false == digits.has_value()) {
            return std::nullopt;
        }
        int64_t value{0};
        std::from_chars(digits->data(), digits->data() + digits->size(), value);
        return value;
    }

    auto read_word() -> std::string_view {
        auto const start = m_pos;
        while (false == at_end() && 0 != std::isalpha(static_cast<unsigned char>(peek()))) {
            ++m_pos;
        }
        return m_input.substr(start, m_pos - start);
    }

private:
    std::string_view m_input;
    size_t m_pos{0};
};

auto is_all_digits(std::string_view str) -> bool {
    return false == str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
               return 0 != std::isdigit(static_cast<unsigned char>(c));
           });
}

auto trim_and_lower(std::string_view input) -> std::string {
    auto const begin = input.find_first_not_of(" \t\r\n");
    if (std::string_view::npos == begin) {
        return {};
    }
    auto const end = input.find_last_not_of(" \t\r\n");
    std::string out{input.substr(begin, end - begin + 1)};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

auto parse_epoch(std::string_view digits) -> std::optional<Timestamp> {
    int64_t value{0};
    auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (std::errc{} != ec) {
        return std::nullopt;
    }
    switch (digits.size()) {
        case 10:
            return Timestamp{seconds{value}};
        case 13:
            return Timestamp{std::chrono::milliseconds{value}};
        case 19:
            return Timestamp{std::chrono::duration_cast<microseconds>(
                    std::chrono::nanoseconds{value}
            )};
        default:
            return std::nullopt;
    }
}

auto parse_month_name(std::string_view word) -> std::optional<unsigned> {
    if (word.size() < 3) {
        return std::nullopt;
    }
    for (size_t i = 0; i < cMonthNames.size(); ++i) {
        if (cMonthNames[i].starts_with(word)) {
            return static_cast<unsigned>(i + 1);
        }
    }
    return std::nullopt;
}

auto make_date(int64_t year, int64_t month, int64_t day)
        -> std::optional<std::chrono::year_month_day> {
    std::chrono::year_month_day const date{
            std::chrono::year{static_cast<int>(year)},
            std::chrono::month{static_cast<unsigned>(month)},
            std::chrono::day{static_cast<unsigned>(day)}
    };
    if (false == date.ok()) {
        return std::nullopt;
    }
    return date;
}

/**
 * Parses "YYYY-MM-DD" or "YYYY/MM/DD".
 */
auto parse_numeric_date(Scanner& scanner) -> std::optional<std::chrono::year_month_day> {
    auto const start = scanner.get_position();
    auto const fail = [&]() -> std::optional<std::chrono::year_month_day> {
        scanner.set_position(start);
        return std::nullopt;
    };

    auto const year = scanner.read_number(4, 4);
    if (false == year.has_value()) {
        return fail();
    }
    auto const separator = scanner.peek();
    if ('-' != separator && '/' != separator) {
        return fail();
    }
    scanner.consume(separator);
    auto const month = scanner.read_number(1, 2);
    if (false == month.has_value() || false == scanner.consume(separator)) {
        return fail();
    }
    auto const day = scanner.read_number(1, 2);
    if (false == day.has_value()) {
        return fail();
    }
    auto date = make_date(*year, *month, *day);
    if (false == date.has_value()) {
        return fail();
    }
    return date;
}

/**
 * Parses "Mon DD[,] YYYY" or "DD Mon[,] YYYY".
 */
auto parse_named_date(Scanner& scanner) -> std::optional<std::chrono::year_month_day> {
    auto const start = scanner.get_position();
    auto const fail = [&]() -> std::optional<std::chrono::year_month_day> {
        scanner.set_position(start);
        return std::nullopt;
    };

    std::optional<unsigned> month;
    std::optional<int64_t> day;
    if (auto const word = scanner.read_word(); false == word.empty()) {
        month = parse_month_name(word);
        scanner.skip_spaces();
        day = scanner.read_number(1, 2);
    } else {
        day = scanner.read_number(1, 2);
        scanner.skip_spaces();
        month = parse_month_name(scanner.read_word());
    }
    if (false == month.has_value() || false == day.has_value()) {
        return fail();
    }
    scanner.consume(',');
    if (false == scanner.skip_spaces()) {
        return fail();
    }
    auto const year = scanner.read_number(4, 4);
    if (false == year.has_value()) {
        return fail();
    }
    auto date = make_date(*year, *month, *day);
    if (false == date.has_value()) {
        return fail();
    }
    return date;
}

auto parse_zone(Scanner& scanner) -> std::optional<minutes> {
    if (scanner.consume('z') || scanner.consume("utc") || scanner.consume("gmt")) {
        return minutes{0};
    }

    auto const start = scanner.get_position();
    auto const sign = scanner.peek();
    if ('+' != sign && '-' != sign) {
        return std::nullopt;
    }
    scanner.consume(sign);
    auto const offset_hours = scanner.read_number(2, 2);
    if (false == offset_hours.has_value()) {
        scanner.set_position(start);
        return std::nullopt;
    }
    int64_t offset_minutes{0};
    if (scanner.consume(':')) {
        auto const value = scanner.read_number(2, 2);
        if (false == value.has_value()) {
            scanner.set_position(start);
            return std::nullopt;
        }
        offset_minutes = *value;
    } else if (auto const value = scanner.read_number(2, 2); value.has_value()) {
        offset_minutes = *value;
    }
    if (*offset_hours > 23 || offset_minutes > 59) {
        scanner.set_position(start);
        return std::nullopt;
    }
    minutes const offset{*offset_hours * 60 + offset_minutes};
    return '-' == sign ? -offset : offset;
}

auto parse_time_of_day(Scanner& scanner) -> std::optional<TimeOfDay> {
    auto const start = scanner.get_position();
    auto const fail = [&]() -> std::optional<TimeOfDay> {
        scanner.set_position(start);
        return std::nullopt;
    };

    auto hour = scanner.read_number(1, 2);
    if (false == hour.has_value() || false == scanner.consume(':')) {
        return fail();
    }
    auto const minute = scanner.read_number(2, 2);
    if (false == minute.has_value()) {
        return fail();
    }

    int64_t second{0};
    microseconds fraction{0};
    if (scanner.consume(':')) {
        auto const value = scanner.read_number(2, 2);
        if (false == value.has_value()) {
            return fail();
        }
        second = *value;
        if (scanner.consume('.') || scanner.consume(',')) {
            auto const digits = scanner.read_digits(1, SIZE_MAX);
            if (false == digits.has_value()) {
                return fail();
            }
            std::string padded{digits->substr(0, cNumFractionDigits)};
            padded.resize(cNumFractionDigits, '0');
            int64_t micros{0};
            std::from_chars(padded.data(), padded.data() + padded.size(), micros);
            fraction = microseconds{micros};
        }
    }

    auto const before_meridiem = scanner.get_position();
    scanner.skip_spaces();
    if (scanner.consume("am") || scanner.consume("a.m.")) {
        if (*hour < 1 || *hour > 12) {
            return fail();
        }
        hour = (12 == *hour) ? 0 : *hour;
    } else if (scanner.consume("pm") || scanner.consume("p.m.")) {
        if (*hour < 1 || *hour > 12) {
            return fail();
        }
        hour = (12 == *hour) ? 12 : *hour + 12;
    } else {
        scanner.set_position(before_meridiem);
    }

    if (*hour > 23 || *minute > 59 || second > 59) {
        return fail();
    }

    TimeOfDay time_of_day;
    time_of_day.since_midnight = hours{*hour} + minutes{*minute} + seconds{second} + fraction;

    auto const before_zone = scanner.get_position();
    scanner.skip_spaces();
    if (auto const offset = parse_zone(scanner); offset.has_value()) {
        time_of_day.utc_offset = *offset;
    } else {
        scanner.set_position(before_zone);
    }
    return time_of_day;
}

/**
 * @tparam Duration Unit of the amount
 * @param now
 * @param amount
 * @return `now` minus the given amount of `Duration`, or std::nullopt if that lies before the Unix
 * epoch
 */
template <typename Duration>
auto subtract_after_epoch(Timestamp now, int64_t amount) -> std::optional<Timestamp> {
    if (amount > now.time_since_epoch() / Duration{1}) {
        return std::nullopt;
    }
    return now - Duration{static_cast<typename Duration::rep>(amount)};
}

auto parse_relative(std::string_view input, Timestamp now) -> std::optional<Timestamp> {
    Scanner scanner{input};
    auto const amount = scanner.read_number(1, 9);
    if (false == amount.has_value()) {
        return std::nullopt;
    }
    scanner.skip_spaces();
    auto const unit = scanner.read_word();
    if (false == scanner.skip_spaces() || false == scanner.consume("ago")) {
        return std::nullopt;
    }
    scanner.skip_spaces();
    if (false == scanner.at_end()) {
        return std::nullopt;
    }

    auto const matches = [&](std::vector<std::string_view> const& names) {
        return std::find(names.begin(), names.end(), unit) != names.end();
    };
    if (matches({"s", "sec", "secs", "second", "seconds"})) {
        return subtract_after_epoch<seconds>(now, *amount);
    }
    if (matches({"m", "min", "mins", "minute", "minutes"})) {
        return subtract_after_epoch<minutes>(now, *amount);
    }
    if (matches({"h", "hr", "hrs", "hour", "hours"})) {
        return subtract_after_epoch<hours>(now, *amount);
    }
    if (matches({"d", "day", "days"})) {
        return subtract_after_epoch<days>(now, *amount);
    }
    if (matches({"w", "week", "weeks"})) {
        return subtract_after_epoch<std::chrono::weeks>(now, *amount);
    }
    return std::nullopt;
}

auto compose(std::chrono::sys_days date, TimeOfDay const& time_of_day) -> Timestamp {
    return Timestamp{date} + time_of_day.since_midnight - time_of_day.utc_offset;
}
}  // namespace

auto parse_datetime(std::string_view input, Timestamp now) -> std::optional<Timestamp> {
    auto const text = trim_and_lower(input);
    if (text.empty()) {
        return std::nullopt;
    }
    if ("now" == text) {
        return now;
    }
    if (is_all_digits(text)) {
        return parse_epoch(text);
    }
    if (auto const relative = parse_relative(text, now); relative.has_value()) {
        return relative;
    }

    Scanner scanner{text};
    auto date = parse_numeric_date(scanner);
    if (false == date.has_value()) {
        date = parse_named_date(scanner);
    }
    if (date.has_value()) {
        TimeOfDay time_of_day;
        if (false == scanner.at_end()) {
            if (false == scanner.consume('t') && false == scanner.skip_spaces()) {
                return std::nullopt;
            }
            auto const parsed_time = parse_time_of_day(scanner);
            if (false == parsed_time.has_value()) {
                return std::nullopt;
            }
            time_of_day = *parsed_time;
        }
        scanner.skip_spaces();
        if (false == scanner.at_end()) {
            return std::nullopt;
        }
        return compose(std::chrono::sys_days{*date}, time_of_day);
    }

    auto const time_of_day = parse_time_of_day(scanner);
    scanner.skip_spaces();
    if (false == time_of_day.has_value() || false == scanner.at_end()) {
        return std::nullopt;
    }
    return compose(std::chrono::floor<days>(now), *time_of_day);
}

auto parse_datetime(std::string_view input) -> std::optional<Timestamp> {
    return parse_datetime(
            input,
            std::chrono::time_point_cast<microseconds>(std::chrono::system_clock::now())
    );
}

auto format_rfc3339(Timestamp timestamp) -> std::string {
    auto const day_point = std::chrono::floor<days>(timestamp);
    std::chrono::year_month_day const date{day_point};
    std::chrono::hh_mm_ss<microseconds> const time_of_day{timestamp - day_point};

    auto formatted = fmt::format(
            "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
            static_cast<int>(date.year()),
            static_cast<unsigned>(date.month()),
            static_cast<unsigned>(date.day()),
            time_of_day.hours().count(),
            time_of_day.minutes().count(),
            time_of_day.seconds().count()
    );
    auto const micros = time_of_day.subseconds().count();
    if (0 != micros) {
        if (0 == micros % 1000) {
            formatted += fmt::format(".{:03}", micros / 1000);
        } else {
            formatted += fmt::format(".{:06}", micros);
        }
    }
    formatted += "+00:00";
    return formatted;
}
}  // namespace esq
