/**
 * Pong helpers: description flattening and JSON output.
 */

#include "mcping/status/pong.h"

#include "mcping/crypto/base64.h"
#include "mcping/status/status_parser.h"

namespace mcping {

namespace {

void append_flattened(const ChatComponent& chat, std::string& out) {
    out += chat.text;
    for (const auto& child : chat.extra) {
        append_flattened(child, out);
    }
}

} // namespace

std::string ChatComponent::flatten() const {
    std::string out;
    append_flattened(*this, out);
    return out;
}

void to_json(nlohmann::json& j, const ChatComponent& chat) {
    j = nlohmann::json{{"text", chat.text}};
    if (chat.bold)          j["bold"] = true;
    if (chat.italic)        j["italic"] = true;
    if (chat.underlined)    j["underlined"] = true;
    if (chat.strikethrough) j["strikethrough"] = true;
    if (chat.obfuscated)    j["obfuscated"] = true;
    if (chat.color)         j["color"] = *chat.color;
    if (!chat.extra.empty()) j["extra"] = chat.extra;
}

void to_json(nlohmann::json& j, const Pong& pong) {
    j = nlohmann::json{
        {"version", {{"name", pong.version_name}, {"protocol", pong.protocol}}},
        {"players", {{"online", pong.online_players}, {"max", pong.max_players}}},
        {"description", pong.description_component},
        {"latency_ms", std::chrono::duration<double, std::milli>(pong.latency).count()},
    };

    if (pong.sample) {
        auto sample = nlohmann::json::array();
        for (const auto& player : *pong.sample) {
            sample.push_back({{"name", player.name}, {"id", player.id}});
        }
        j["players"]["sample"] = std::move(sample);
    }
    if (pong.favicon) {
        j["favicon"] = std::string(kFaviconPrefix) + base64_encode(*pong.favicon);
    }
    if (pong.enforces_secure_chat) j["enforcesSecureChat"] = *pong.enforces_secure_chat;
    if (pong.previews_chat)        j["previewsChat"] = *pong.previews_chat;

    if (pong.mod_info) {
        auto mods = nlohmann::json::array();
        for (const auto& mod : pong.mod_info->mod_list) {
            mods.push_back({{"modid", mod.mod_id}, {"version", mod.version}});
        }
        j["modinfo"] = {{"type", pong.mod_info->type}, {"modList", std::move(mods)}};
    }
    if (pong.forge_data) {
        auto channels = nlohmann::json::array();
        for (const auto& channel : pong.forge_data->channels) {
            channels.push_back({{"res", channel.res},
                                {"version", channel.version},
                                {"required", channel.required}});
        }
        auto mods = nlohmann::json::array();
        for (const auto& mod : pong.forge_data->mods) {
            mods.push_back({{"modId", mod.mod_id}, {"modmarker", mod.mod_marker}});
        }
        j["forgeData"] = {{"channels", std::move(channels)},
                          {"mods", std::move(mods)},
                          {"fmlNetworkVersion", pong.forge_data->fml_network_version}};
    }
}

} // namespace mcping
