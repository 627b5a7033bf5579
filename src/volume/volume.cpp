// ==============================================================================
// volume.cpp - Эфемерные тома данных
// ==============================================================================

#include "fulcrum/volume.hpp"

#include "fulcrum/platform.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fulcrum::volume {

std::string VolumeSlot::name() const {
    return std::string(SLOT_PREFIX) + std::to_string(version);
}

std::optional<std::uint64_t> parse_slot_name(std::string_view name) {
    const std::string_view prefix(SLOT_PREFIX);
    if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    std::string_view digits = name.substr(prefix.size());
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    // Следующий номер после максимального не представим
    if (value == std::numeric_limits<std::uint64_t>::max()) {
        return std::nullopt;
    }
    return value;
}

VolumeSlot next_slot(const std::set<std::string>& existing, const std::filesystem::path& root) {
    std::uint64_t max_version = 0;
    for (const auto& name : existing) {
        if (auto v = parse_slot_name(name)) {
            max_version = std::max(max_version, *v);
        }
    }

    VolumeSlot slot;
    slot.version = max_version + 1;
    slot.path = root / slot.name();
    return slot;
}

std::set<std::string> scan_slots(const std::filesystem::path& root) {
    std::set<std::string> names;

    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        if (ec) {
            throw std::filesystem::filesystem_error("failed to check volume root", root, ec);
        }
        return names;
    }

    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        names.insert(platform::path_to_utf8(entry.path().filename()));
    }
    return names;
}

VolumeSlot provision(const std::filesystem::path& root, int max_attempts) {
    std::filesystem::create_directories(root);

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        VolumeSlot slot = next_slot(scan_slots(root), root);

        // create_directory возвращает false, если каталог уже существует
        if (std::filesystem::create_directory(slot.path)) {
            return slot;
        }
    }

    throw std::runtime_error("failed to claim a volume slot in '" + platform::path_to_utf8(root) +
                             "' after " + std::to_string(max_attempts) + " attempts");
}

}  // namespace fulcrum::volume
