#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcping {

/// One entry of the player sample.
struct Player {
    std::string name;
    std::string id;
};

/**
 * A chat component as used by the server description.
 *
 * Plain-string descriptions become a component with only `text` set.
 */
struct ChatComponent {
    std::string text;
    bool bold = false;
    bool italic = false;
    bool underlined = false;
    bool strikethrough = false;
    bool obfuscated = false;
    std::optional<std::string> color;
    std::vector<ChatComponent> extra;

    /// Own text followed by the flattened text of every child, in order.
    [[nodiscard]] std::string flatten() const;
};

/// FML (1.7 - 1.12) mod list entry.
struct ModInfoItem {
    std::string mod_id;
    std::string version;
};

struct ModInfo {
    std::string type;
    std::vector<ModInfoItem> mod_list;
};

/// FML2 (1.13+) channel and mod entries.
struct ForgeChannel {
    std::string res;
    std::string version;
    bool required = false;
};

struct ForgeMod {
    std::string mod_id;
    std::string mod_marker;
};

struct ForgeData {
    std::vector<ForgeChannel> channels;
    std::vector<ForgeMod> mods;
    std::int32_t fml_network_version = 0;
};

/**
 * Decoded answer to a status ping.
 */
struct Pong {
    std::string version_name;
    std::int32_t protocol = 0;
    std::size_t online_players = 0;
    std::size_t max_players = 0;
    /// Absent when the server did not send a sample at all.
    std::optional<std::vector<Player>> sample;

    std::string description;
    ChatComponent description_component;

    /// PNG bytes of the server icon, unvalidated.
    std::optional<std::vector<std::uint8_t>> favicon;

    std::optional<bool> enforces_secure_chat;
    std::optional<bool> previews_chat;
    std::optional<ModInfo> mod_info;
    std::optional<ForgeData> forge_data;

    /// The status string exactly as the server sent it.
    std::vector<std::uint8_t> raw;

    std::chrono::microseconds latency{0};
};

void to_json(nlohmann::json& j, const ChatComponent& chat);
void to_json(nlohmann::json& j, const Pong& pong);

} // namespace mcping
