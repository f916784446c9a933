#include "worldvault/backup/naming.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace worldvault::backup {

namespace {

bool parse_digits(std::string_view s, unsigned& out) {
  const char* beg = s.data(); const char* end = beg + s.size();
  auto [ptr, ec] = std::from_chars(beg, end, out, 10);
  return ec == std::errc() && ptr == end;
}

bool ends_with(std::string_view s, std::string_view suffix) noexcept {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

std::string format_timestamp(TimePoint t) {
  using namespace std::chrono;
  const auto day = floor<days>(t);
  const year_month_day ymd{day};
  const hh_mm_ss hms{t - day};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u-%02d%02d%02d",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()));
  return buf;
}

std::optional<TimePoint> parse_timestamp(std::string_view text) {
  using namespace std::chrono;
  if (text.size() != kTimestampWidth || text[8] != '-') return std::nullopt;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 8) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
  }
  unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
  if (!parse_digits(text.substr(0, 4), y) || !parse_digits(text.substr(4, 2), mo) ||
      !parse_digits(text.substr(6, 2), d) || !parse_digits(text.substr(9, 2), h) ||
      !parse_digits(text.substr(11, 2), mi) || !parse_digits(text.substr(13, 2), s)) {
    return std::nullopt;
  }
  const year_month_day ymd{year{static_cast<int>(y)}, month{mo}, day{d}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59) return std::nullopt;
  return TimePoint{sys_days{ymd} + hours{h} + minutes{mi} + seconds{s}};
}

std::string encode_world_id(std::string_view world_id) {
  std::string out;
  out.reserve(world_id.size());
  for (char c : world_id) {
    switch (c) {
      case '%': out += "%25"; break;
      case '/': out += "%2F"; break;
      case '\\': out += "%5C"; break;
      default: out += c;
    }
  }
  return out;
}

std::optional<std::string> decode_world_id(std::string_view encoded) {
  std::string out;
  out.reserve(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] != '%') { out += encoded[i]; continue; }
    const auto code = encoded.substr(i + 1, 2);
    if (code == "25") out += '%';
    else if (code == "2F") out += '/';
    else if (code == "5C") out += '\\';
    else return std::nullopt;
    i += 2;
  }
  return out;
}

std::string archive_name(std::string_view world_id, TimePoint created) {
  std::string name = encode_world_id(world_id);
  name += '_';
  name += format_timestamp(created);
  name += kArchiveExtension;
  return name;
}

std::optional<ParsedArchiveName> parse_archive_name(std::string_view file_name) {
  if (!has_archive_extension(file_name)) return std::nullopt;
  const auto stem = file_name.substr(0, file_name.size() - kArchiveExtension.size());
  // <id>_<timestamp>: at least one id character plus the separator
  if (stem.size() < kTimestampWidth + 2) return std::nullopt;
  const auto sep = stem.size() - kTimestampWidth - 1;
  if (stem[sep] != '_') return std::nullopt;
  auto created = parse_timestamp(stem.substr(sep + 1));
  if (!created) return std::nullopt;
  auto id = decode_world_id(stem.substr(0, sep));
  if (!id) return std::nullopt;
  return ParsedArchiveName{std::move(*id), *created};
}

TimePoint to_time_point(std::filesystem::file_time_type ft) {
  return std::chrono::floor<std::chrono::seconds>(std::chrono::file_clock::to_sys(ft));
}

bool has_archive_extension(std::string_view file_name) noexcept {
  return file_name.size() > kArchiveExtension.size() && ends_with(file_name, kArchiveExtension);
}

bool is_partial_name(std::string_view file_name) noexcept {
  return ends_with(file_name, kPartialSuffix) &&
         has_archive_extension(file_name.substr(0, file_name.size() - kPartialSuffix.size()));
}

} // namespace worldvault::backup
