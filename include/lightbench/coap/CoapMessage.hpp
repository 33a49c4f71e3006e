#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lightbench::coap {

// RFC 7252 section 3
enum class MessageType : uint8_t {
    Confirmable     = 0,
    NonConfirmable  = 1,
    Acknowledgement = 2,
    Reset           = 3
};

// Code byte is class << 5 | detail.
constexpr uint8_t makeCode(uint8_t cls, uint8_t detail) {
    return static_cast<uint8_t>((cls << 5) | detail);
}

namespace code {
constexpr uint8_t Empty            = makeCode(0, 0);
constexpr uint8_t Get              = makeCode(0, 1);
constexpr uint8_t Post             = makeCode(0, 2);
constexpr uint8_t Fetch            = makeCode(0, 5);   // RFC 8132
constexpr uint8_t Content          = makeCode(2, 5);
constexpr uint8_t BadRequest       = makeCode(4, 0);
constexpr uint8_t NotFound         = makeCode(4, 4);
constexpr uint8_t MethodNotAllowed = makeCode(4, 5);
constexpr uint8_t InternalError    = makeCode(5, 0);
}

namespace option {
constexpr uint16_t UriHost       = 3;
constexpr uint16_t UriPort       = 7;
constexpr uint16_t UriPath       = 11;
constexpr uint16_t ContentFormat = 12;
constexpr uint16_t Accept        = 17;
}

namespace format {
constexpr uint16_t TextPlain = 0;
constexpr uint16_t Cbor      = 60;
constexpr uint16_t Json      = 50;
}

// Content-format tag the status server puts on its binary records.
constexpr uint16_t kStatusRecordFormat = 42;

struct Option {
    uint16_t number = 0;
    std::vector<uint8_t> value;
};

struct Message {
    MessageType type = MessageType::Confirmable;
    uint8_t code = code::Empty;
    uint16_t message_id = 0;
    std::vector<uint8_t> token;      // 0-8 bytes
    std::vector<Option> options;     // any order; sorted on encode
    std::vector<uint8_t> payload;

    void addOption(uint16_t number, std::vector<uint8_t> value);
    void addStringOption(uint16_t number, const std::string& value);
    void addUintOption(uint16_t number, uint32_t value);

    std::optional<uint32_t> uintOption(uint16_t number) const;
    std::vector<std::string> stringOptions(uint16_t number) const;

    bool isEmpty() const { return code == code::Empty; }
};

// "2.05", "4.04"
std::string codeString(uint8_t c);
inline uint8_t codeClass(uint8_t c) { return c >> 5; }

std::vector<uint8_t> encode(const Message& msg);

// Throws DecodeError on a malformed datagram.
Message decode(const uint8_t* data, size_t size);

// Splits "a/b/c" into Uri-Path options.
void setUriPath(Message& msg, const std::string& path);

} // namespace lightbench::coap
