/**
 * Status response decoding.
 *
 * Field access goes through small lookup helpers that return nothing for
 * absent or mistyped members, so older and non-conforming servers still
 * produce a result.
 */

#include "mcping/status/status_parser.h"

#include <limits>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "mcping/crypto/base64.h"
#include "mcping/protocol/error.h"
#include "mcping/protocol/varint.h"

namespace mcping {

namespace {

using nlohmann::json;

const json* member(const json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

std::optional<std::string> string_field(const json& object, const char* key) {
    const json* value = member(object, key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::optional<bool> bool_field(const json& object, const char* key) {
    const json* value = member(object, key);
    if (value == nullptr || !value->is_boolean()) {
        return std::nullopt;
    }
    return value->get<bool>();
}

std::optional<std::int64_t> integer_field(const json& object, const char* key) {
    const json* value = member(object, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        const auto v = value->get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(v);
    }
    if (value->is_number_integer()) {
        return value->get<std::int64_t>();
    }
    return std::nullopt;
}

// Values outside the int32 range count as absent.
std::optional<std::int32_t> int32_field(const json& object, const char* key) {
    const auto value = integer_field(object, key);
    if (!value || *value < std::numeric_limits<std::int32_t>::min() ||
        *value > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(*value);
}

std::size_t count_field(const json& object, const char* key) {
    const auto value = integer_field(object, key);
    return value && *value > 0 ? static_cast<std::size_t>(*value) : 0;
}

const json* array_field(const json& object, const char* key) {
    const json* value = member(object, key);
    return value != nullptr && value->is_array() ? value : nullptr;
}

std::optional<std::vector<Player>> parse_sample(const json& players) {
    const json* sample = array_field(players, "sample");
    if (sample == nullptr) {
        return std::nullopt;
    }
    std::vector<Player> out;
    out.reserve(sample->size());
    for (const auto& entry : *sample) {
        if (!entry.is_object()) {
            continue;
        }
        out.push_back(Player{string_field(entry, "name").value_or(""),
                             string_field(entry, "id").value_or("")});
    }
    return out;
}

std::optional<ModInfo> parse_mod_info(const json& doc) {
    const json* modinfo = member(doc, "modinfo");
    if (modinfo == nullptr || !modinfo->is_object()) {
        return std::nullopt;
    }
    ModInfo info;
    info.type = string_field(*modinfo, "type").value_or("");
    if (const json* list = array_field(*modinfo, "modList")) {
        for (const auto& mod : *list) {
            info.mod_list.push_back(ModInfoItem{string_field(mod, "modid").value_or(""),
                                                string_field(mod, "version").value_or("")});
        }
    }
    return info;
}

std::optional<ForgeData> parse_forge_data(const json& doc) {
    const json* forge = member(doc, "forgeData");
    if (forge == nullptr || !forge->is_object()) {
        return std::nullopt;
    }
    ForgeData data;
    if (const json* channels = array_field(*forge, "channels")) {
        for (const auto& channel : *channels) {
            data.channels.push_back(ForgeChannel{string_field(channel, "res").value_or(""),
                                                 string_field(channel, "version").value_or(""),
                                                 bool_field(channel, "required").value_or(false)});
        }
    }
    if (const json* mods = array_field(*forge, "mods")) {
        for (const auto& mod : *mods) {
            data.mods.push_back(ForgeMod{string_field(mod, "modId").value_or(""),
                                         string_field(mod, "modmarker").value_or("")});
        }
    }
    data.fml_network_version = int32_field(*forge, "fmlNetworkVersion").value_or(0);
    return data;
}

std::error_code parse_favicon(const json& doc, Pong& pong) {
    const json* favicon = member(doc, "favicon");
    if (favicon == nullptr || favicon->is_null()) {
        return {};
    }
    if (!favicon->is_string()) {
        return Errc::InvalidFavicon;
    }
    const auto& uri = favicon->get_ref<const std::string&>();
    if (uri.compare(0, kFaviconPrefix.size(), kFaviconPrefix) != 0) {
        spdlog::debug("favicon does not start with '{}'", kFaviconPrefix);
        return Errc::InvalidFavicon;
    }
    auto bytes = base64_decode(std::string_view(uri).substr(kFaviconPrefix.size()));
    if (!bytes) {
        spdlog::debug("favicon payload is not valid base64");
        return Errc::InvalidEncoding;
    }
    pong.favicon = std::move(*bytes);
    return {};
}

ChatComponent parse_chat_at(const json& value, std::size_t depth, std::error_code& ec) {
    ChatComponent chat;
    if (depth > kMaxChatDepth) {
        spdlog::debug("description nests deeper than {} components", kMaxChatDepth);
        ec = Errc::InvalidJson;
        return chat;
    }

    const auto parse_children = [&](const json& children) {
        chat.extra.reserve(children.size());
        for (const auto& child : children) {
            chat.extra.push_back(parse_chat_at(child, depth + 1, ec));
            if (ec) {
                return;
            }
        }
    };

    switch (value.type()) {
    case json::value_t::string:
        chat.text = value.get<std::string>();
        break;
    case json::value_t::array:
        parse_children(value);
        break;
    case json::value_t::object:
        chat.text = string_field(value, "text").value_or("");
        chat.bold = bool_field(value, "bold").value_or(false);
        chat.italic = bool_field(value, "italic").value_or(false);
        chat.underlined = bool_field(value, "underlined").value_or(false);
        chat.strikethrough = bool_field(value, "strikethrough").value_or(false);
        chat.obfuscated = bool_field(value, "obfuscated").value_or(false);
        chat.color = string_field(value, "color");
        if (const json* extra = array_field(value, "extra")) {
            parse_children(*extra);
        }
        break;
    case json::value_t::boolean:
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        chat.text = value.dump();
        break;
    default:
        break;
    }
    return chat;
}

} // namespace

bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (text.size() - i <= extra) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        static constexpr std::uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

ChatComponent parse_chat(const nlohmann::json& value, std::error_code& ec) {
    ec.clear();
    return parse_chat_at(value, 1, ec);
}

Pong parse_status(std::span<const std::uint8_t> body, std::error_code& ec) {
    std::size_t offset = 0;
    const std::uint32_t length = decode_varint(body, offset, ec);
    if (ec) {
        return {};
    }
    if (body.size() - offset < length) {
        spdlog::debug("status string declares {} bytes, only {} present", length, body.size() - offset);
        ec = Errc::TruncatedStream;
        return {};
    }
    if (body.size() - offset > length) {
        spdlog::trace("ignoring {} trailing bytes after the status string", body.size() - offset - length);
    }

    const auto* first = reinterpret_cast<const char*>(body.data() + offset);
    const std::string_view text(first, length);
    if (!is_valid_utf8(text)) {
        ec = Errc::InvalidEncoding;
        return {};
    }

    const json doc = json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::debug("status document is not a JSON object");
        ec = Errc::InvalidJson;
        return {};
    }

    Pong pong;
    if (const json* version = member(doc, "version")) {
        pong.version_name = string_field(*version, "name").value_or("");
        pong.protocol = int32_field(*version, "protocol").value_or(0);
    }
    if (const json* players = member(doc, "players")) {
        pong.online_players = count_field(*players, "online");
        pong.max_players = count_field(*players, "max");
        pong.sample = parse_sample(*players);
    }
    if (const json* description = member(doc, "description")) {
        pong.description_component = parse_chat(*description, ec);
        if (ec) {
            return {};
        }
        pong.description = pong.description_component.flatten();
    }
    if ((ec = parse_favicon(doc, pong))) {
        return {};
    }
    pong.enforces_secure_chat = bool_field(doc, "enforcesSecureChat");
    pong.previews_chat = bool_field(doc, "previewsChat");
    pong.mod_info = parse_mod_info(doc);
    pong.forge_data = parse_forge_data(doc);
    pong.raw.assign(body.begin() + static_cast<std::ptrdiff_t>(offset),
                    body.begin() + static_cast<std::ptrdiff_t>(offset + length));

    ec.clear();
    return pong;
}

Pong parse_status(std::span<const std::uint8_t> body) {
    std::error_code ec;
    Pong pong = parse_status(body, ec);
    if (ec) {
        throw std::system_error(ec, "parse_status");
    }
    return pong;
}

} // namespace mcping
