#include "lightbench/coap/CoapMessage.hpp"
#include "lightbench/core/Errors.hpp"

#include <algorithm>
#include <cstdio>

namespace lightbench::coap {

static constexpr uint8_t VERSION        = 1;
static constexpr uint8_t PAYLOAD_MARKER = 0xFF;
static constexpr size_t  MAX_TOKEN      = 8;

void Message::addOption(uint16_t number, std::vector<uint8_t> value) {
    options.push_back(Option{number, std::move(value)});
}

void Message::addStringOption(uint16_t number, const std::string& value) {
    addOption(number, std::vector<uint8_t>(value.begin(), value.end()));
}

void Message::addUintOption(uint16_t number, uint32_t value) {
    // Minimal big-endian encoding; zero is the empty value.
    std::vector<uint8_t> v;
    for (int shift = 24; shift >= 0; shift -= 8) {
        uint8_t b = static_cast<uint8_t>(value >> shift);
        if (!v.empty() || b != 0) v.push_back(b);
    }
    addOption(number, std::move(v));
}

std::optional<uint32_t> Message::uintOption(uint16_t number) const {
    for (const auto& opt : options) {
        if (opt.number != number) continue;
        uint32_t v = 0;
        for (uint8_t b : opt.value) v = (v << 8) | b;
        return v;
    }
    return std::nullopt;
}

std::vector<std::string> Message::stringOptions(uint16_t number) const {
    std::vector<std::string> out;
    for (const auto& opt : options) {
        if (opt.number == number)
            out.emplace_back(opt.value.begin(), opt.value.end());
    }
    return out;
}

std::string codeString(uint8_t c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%u.%02u",
                  static_cast<unsigned>(c >> 5),
                  static_cast<unsigned>(c & 0x1F));
    return buf;
}

// Option delta/length nibble with 13/14 extension bytes.
static void splitNibble(uint32_t v, uint8_t& nibble, std::vector<uint8_t>& ext) {
    if (v < 13) {
        nibble = static_cast<uint8_t>(v);
    } else if (v < 269) {
        nibble = 13;
        ext.push_back(static_cast<uint8_t>(v - 13));
    } else {
        nibble = 14;
        const uint32_t x = v - 269;
        ext.push_back(static_cast<uint8_t>(x >> 8));
        ext.push_back(static_cast<uint8_t>(x));
    }
}

std::vector<uint8_t> encode(const Message& msg) {
    if (msg.token.size() > MAX_TOKEN)
        throw std::invalid_argument("coap: token longer than 8 bytes");

    std::vector<uint8_t> out;
    out.reserve(4 + msg.token.size() + msg.payload.size() + 16);

    out.push_back(static_cast<uint8_t>(
        (VERSION << 6) |
        (static_cast<uint8_t>(msg.type) << 4) |
        msg.token.size()));
    out.push_back(msg.code);
    out.push_back(static_cast<uint8_t>(msg.message_id >> 8));
    out.push_back(static_cast<uint8_t>(msg.message_id));
    out.insert(out.end(), msg.token.begin(), msg.token.end());

    std::vector<Option> sorted = msg.options;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Option& a, const Option& b) {
                         return a.number < b.number;
                     });

    uint16_t last = 0;
    for (const auto& opt : sorted) {
        uint8_t dn = 0, ln = 0;
        std::vector<uint8_t> dext, lext;
        splitNibble(opt.number - last, dn, dext);
        splitNibble(static_cast<uint32_t>(opt.value.size()), ln, lext);

        out.push_back(static_cast<uint8_t>((dn << 4) | ln));
        out.insert(out.end(), dext.begin(), dext.end());
        out.insert(out.end(), lext.begin(), lext.end());
        out.insert(out.end(), opt.value.begin(), opt.value.end());
        last = opt.number;
    }

    if (!msg.payload.empty()) {
        out.push_back(PAYLOAD_MARKER);
        out.insert(out.end(), msg.payload.begin(), msg.payload.end());
    }
    return out;
}

Message decode(const uint8_t* data, size_t size) {
    if (size < 4)
        throw DecodeError("coap: datagram shorter than header");
    if ((data[0] >> 6) != VERSION)
        throw DecodeError("coap: unsupported version");

    Message msg;
    msg.type = static_cast<MessageType>((data[0] >> 4) & 0x03);
    const size_t tkl = data[0] & 0x0F;
    if (tkl > MAX_TOKEN)
        throw DecodeError("coap: token length " + std::to_string(tkl));
    msg.code = data[1];
    msg.message_id = static_cast<uint16_t>((data[2] << 8) | data[3]);

    size_t pos = 4;
    if (pos + tkl > size)
        throw DecodeError("coap: truncated token");
    msg.token.assign(data + pos, data + pos + tkl);
    pos += tkl;

    auto extended = [&](uint8_t nibble) -> uint32_t {
        if (nibble < 13) return nibble;
        if (nibble == 13) {
            if (pos + 1 > size) throw DecodeError("coap: truncated option");
            return 13u + data[pos++];
        }
        if (nibble == 14) {
            if (pos + 2 > size) throw DecodeError("coap: truncated option");
            const uint32_t v = (static_cast<uint32_t>(data[pos]) << 8) | data[pos + 1];
            pos += 2;
            return 269u + v;
        }
        throw DecodeError("coap: reserved option nibble 15");
    };

    uint32_t number = 0;
    while (pos < size) {
        const uint8_t b = data[pos++];
        if (b == PAYLOAD_MARKER) {
            if (pos == size)
                throw DecodeError("coap: payload marker without payload");
            msg.payload.assign(data + pos, data + size);
            break;
        }
        number += extended(static_cast<uint8_t>(b >> 4));
        const uint32_t len = extended(static_cast<uint8_t>(b & 0x0F));
        if (number > 0xFFFF)
            throw DecodeError("coap: option number overflow");
        if (pos + len > size)
            throw DecodeError("coap: truncated option value");
        msg.options.push_back(Option{
            static_cast<uint16_t>(number),
            std::vector<uint8_t>(data + pos, data + pos + len)});
        pos += len;
    }
    return msg;
}

void setUriPath(Message& msg, const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start)
            msg.addStringOption(option::UriPath, path.substr(start, slash - start));
        start = slash + 1;
    }
}

} // namespace lightbench::coap
