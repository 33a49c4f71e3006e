#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cbor.h>

namespace lightbench {

struct CborRelease {
    void operator()(cbor_item_t* item) const { cbor_decref(&item); }
};

// One owned reference to a libcbor item.
using CborItem = std::unique_ptr<cbor_item_t, CborRelease>;

constexpr int CBOR_MAX_DEPTH = 32;

// Parses exactly one data item spanning all of [data, data + size).
// Throws DecodeError on empty, truncated or malformed input, trailing
// bytes, floats, integers outside int64, text that is not UTF-8 and
// nesting deeper than CBOR_MAX_DEPTH.
CborItem loadCbor(const uint8_t* data, size_t size);
CborItem loadCbor(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> dumpCbor(const cbor_item_t* item);

// Builders. Integers get their shortest head.
CborItem cborInteger(int64_t v);
CborItem cborText(const std::string& s);
CborItem cborMap(size_t pairs);

// Adds key -> value to a map built by cborMap. Throws LightbenchError
// once the map is full.
void cborMapPut(cbor_item_t* map, int64_t key, CborItem value);

// Value stored under an integer key, or nullptr when map is not a map or
// has no such key. The map keeps ownership.
cbor_item_t* cborMapFind(const cbor_item_t* map, int64_t key);

// Swaps the value of an existing key; false if the key is absent.
bool cborMapReplace(cbor_item_t* map, int64_t key, CborItem value);

std::optional<int64_t> cborAsInteger(const cbor_item_t* item);
std::optional<std::string> cborAsText(const cbor_item_t* item);

// Strict UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool validUtf8(const uint8_t* data, size_t size);

} // namespace lightbench
