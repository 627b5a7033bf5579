// ==============================================================================
// locator.cpp - Поиск последнего контейнера целевой версии
// ==============================================================================

#include "fulcrum/locator.hpp"

#include <charconv>
#include <optional>

namespace fulcrum::locator {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

/// Подверсия, если field == "<target>-mc-<digits>"
std::optional<std::uint64_t> match_name(std::string_view field, std::string_view target) {
    const std::string_view infix(NAME_INFIX);
    if (field.size() <= target.size() + infix.size()) {
        return std::nullopt;
    }
    if (field.substr(0, target.size()) != target ||
        field.substr(target.size(), infix.size()) != infix) {
        return std::nullopt;
    }

    std::string_view digits = field.substr(target.size() + infix.size());
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        // Переполнение - такое имя не наше
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::vector<ContainerRecord> parse_listing(std::string_view listing,
                                           std::string_view target_version) {
    std::vector<ContainerRecord> records;
    if (target_version.empty()) {
        return records;
    }

    std::size_t line_start = 0;
    while (line_start <= listing.size()) {
        std::size_t line_end = listing.find('\n', line_start);
        if (line_end == std::string_view::npos) {
            line_end = listing.size();
        }
        std::string_view line = listing.substr(line_start, line_end - line_start);

        // Имя может быть единственным полем (--format) или колонкой таблицы
        std::size_t i = 0;
        while (i < line.size()) {
            while (i < line.size() && is_space(line[i])) {
                ++i;
            }
            std::size_t start = i;
            while (i < line.size() && !is_space(line[i])) {
                ++i;
            }
            if (i == start) {
                continue;
            }
            std::string_view field = line.substr(start, i - start);
            if (auto sub = match_name(field, target_version)) {
                records.push_back(ContainerRecord{std::string(field), *sub});
                break;
            }
        }

        if (line_end == listing.size()) {
            break;
        }
        line_start = line_end + 1;
    }
    return records;
}

LocateResult find_latest(std::string_view listing, std::string_view target_version) {
    LocateResult result;
    auto records = parse_listing(listing, target_version);
    result.candidates = records.size();

    for (auto& record : records) {
        // Строго больше: при равенстве остаётся первая запись
        if (!result.ok || record.subversion > result.record.subversion) {
            result.record = std::move(record);
            result.ok = true;
        }
    }
    return result;
}

std::string container_name(std::string_view target_version, std::uint64_t subversion) {
    return std::string(target_version) + NAME_INFIX + std::to_string(subversion);
}

}  // namespace fulcrum::locator
