#include "lightbench/codec/CborItem.hpp"
#include "lightbench/core/Errors.hpp"

#include <cstdlib>
#include <limits>
#include <new>

namespace lightbench {

static constexpr uint64_t INT64_LIMIT =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

bool validUtf8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        const uint8_t b = data[i];
        if (b < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((b & 0xE0) == 0xC0) {
            len = 2;
            cp = b & 0x1F;
        } else if ((b & 0xF0) == 0xE0) {
            len = 3;
            cp = b & 0x0F;
        } else if ((b & 0xF8) == 0xF0) {
            len = 4;
            cp = b & 0x07;
        } else {
            return false;
        }
        if (size - i < len) return false;

        for (size_t k = 1; k < len; ++k) {
            const uint8_t c = data[i + k];
            if ((c & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (c & 0x3F);
        }

        static constexpr uint32_t MIN_FOR_LEN[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < MIN_FOR_LEN[len]) return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += len;
    }
    return true;
}

static void checkText(const cbor_item_t* item) {
    auto check = [](const cbor_item_t* s) {
        const size_t n = cbor_string_length(s);
        if (n > 0 && !validUtf8(cbor_string_handle(s), n)) {
            throw DecodeError("cbor: text string is not valid UTF-8");
        }
    };

    if (cbor_string_is_definite(item)) {
        check(item);
        return;
    }
    // Every chunk of an indefinite string must be valid on its own.
    cbor_item_t** chunks = cbor_string_chunks_handle(item);
    for (size_t i = 0; i < cbor_string_chunk_count(item); ++i) {
        check(chunks[i]);
    }
}

static void checkItem(const cbor_item_t* item, int depth) {
    if (depth > CBOR_MAX_DEPTH) {
        throw DecodeError("cbor: nesting deeper than " + std::to_string(CBOR_MAX_DEPTH));
    }

    switch (cbor_typeof(item)) {
    case CBOR_TYPE_UINT:
    case CBOR_TYPE_NEGINT:
        if (cbor_get_int(item) > INT64_LIMIT) {
            throw DecodeError("cbor: integer outside the signed 64-bit range");
        }
        return;
    case CBOR_TYPE_BYTESTRING:
        return;
    case CBOR_TYPE_STRING:
        checkText(item);
        return;
    case CBOR_TYPE_ARRAY: {
        cbor_item_t** items = cbor_array_handle(item);
        for (size_t i = 0; i < cbor_array_size(item); ++i) {
            checkItem(items[i], depth + 1);
        }
        return;
    }
    case CBOR_TYPE_MAP: {
        struct cbor_pair* pairs = cbor_map_handle(item);
        for (size_t i = 0; i < cbor_map_size(item); ++i) {
            checkItem(pairs[i].key, depth + 1);
            checkItem(pairs[i].value, depth + 1);
        }
        return;
    }
    case CBOR_TYPE_TAG: {
        CborItem inner(cbor_tag_item(item));
        checkItem(inner.get(), depth + 1);
        return;
    }
    case CBOR_TYPE_FLOAT_CTRL:
        if (cbor_is_float(item)) {
            throw DecodeError("cbor: floating point values are not supported");
        }
        return;
    }
    throw DecodeError("cbor: unknown item type");
}

static const char* loadErrorName(cbor_error_code code) {
    switch (code) {
    case CBOR_ERR_NONE:           return "no error";
    case CBOR_ERR_NOTENOUGHDATA:  return "truncated input";
    case CBOR_ERR_NODATA:         return "empty input";
    case CBOR_ERR_MALFORMATED:    return "malformed item";
    case CBOR_ERR_MEMERROR:       return "out of memory";
    case CBOR_ERR_SYNTAXERROR:    return "syntax error";
    }
    return "unknown error";
}

CborItem loadCbor(const uint8_t* data, size_t size) {
    if (size == 0) throw DecodeError("cbor: empty input");

    struct cbor_load_result res;
    CborItem item(cbor_load(data, size, &res));

    if (res.error.code == CBOR_ERR_MEMERROR) throw std::bad_alloc();
    if (!item || res.error.code != CBOR_ERR_NONE) {
        throw DecodeError(std::string("cbor: ") + loadErrorName(res.error.code) +
                          " at byte " + std::to_string(res.error.position));
    }
    if (res.read != size) {
        throw DecodeError("cbor: " + std::to_string(size - res.read) +
                          " trailing bytes after the data item");
    }

    checkItem(item.get(), 0);
    return item;
}

CborItem loadCbor(const std::vector<uint8_t>& bytes) {
    return loadCbor(bytes.data(), bytes.size());
}

std::vector<uint8_t> dumpCbor(const cbor_item_t* item) {
    unsigned char* buffer = nullptr;
    size_t capacity = 0;
    const size_t written = cbor_serialize_alloc(item, &buffer, &capacity);
    if (written == 0) {
        std::free(buffer);
        throw LightbenchError("cbor: serialization failed");
    }
    std::vector<uint8_t> out(buffer, buffer + written);
    std::free(buffer);
    return out;
}

static CborItem checked(cbor_item_t* item) {
    if (!item) throw std::bad_alloc();
    return CborItem(item);
}

static CborItem cborUnsigned(uint64_t v) {
    if (v <= 0xFF) return checked(cbor_build_uint8(static_cast<uint8_t>(v)));
    if (v <= 0xFFFF) return checked(cbor_build_uint16(static_cast<uint16_t>(v)));
    if (v <= 0xFFFFFFFF) return checked(cbor_build_uint32(static_cast<uint32_t>(v)));
    return checked(cbor_build_uint64(v));
}

CborItem cborInteger(int64_t v) {
    if (v >= 0) return cborUnsigned(static_cast<uint64_t>(v));

    // Major type 1 stores -1 - v.
    const uint64_t n = static_cast<uint64_t>(-(v + 1));
    CborItem item = cborUnsigned(n);
    cbor_mark_negint(item.get());
    return item;
}

CborItem cborText(const std::string& s) {
    return checked(cbor_build_stringn(s.data(), s.size()));
}

CborItem cborMap(size_t pairs) {
    return checked(cbor_new_definite_map(pairs));
}

void cborMapPut(cbor_item_t* map, int64_t key, CborItem value) {
    CborItem k = cborInteger(key);
    // cbor_map_add takes its own references to key and value.
    if (!cbor_map_add(map, cbor_pair{k.get(), value.get()})) {
        throw LightbenchError("cbor: map is full, cannot add key " + std::to_string(key));
    }
}

cbor_item_t* cborMapFind(const cbor_item_t* map, int64_t key) {
    if (!cbor_isa_map(map)) return nullptr;
    struct cbor_pair* pairs = cbor_map_handle(map);
    for (size_t i = 0; i < cbor_map_size(map); ++i) {
        std::optional<int64_t> k = cborAsInteger(pairs[i].key);
        if (k && *k == key) return pairs[i].value;
    }
    return nullptr;
}

bool cborMapReplace(cbor_item_t* map, int64_t key, CborItem value) {
    if (!cbor_isa_map(map)) return false;
    struct cbor_pair* pairs = cbor_map_handle(map);
    for (size_t i = 0; i < cbor_map_size(map); ++i) {
        std::optional<int64_t> k = cborAsInteger(pairs[i].key);
        if (k && *k == key) {
            cbor_decref(&pairs[i].value);
            pairs[i].value = value.release();
            return true;
        }
    }
    return false;
}

std::optional<int64_t> cborAsInteger(const cbor_item_t* item) {
    if (!cbor_isa_uint(item) && !cbor_isa_negint(item)) return std::nullopt;
    const uint64_t raw = cbor_get_int(item);
    if (raw > INT64_LIMIT) return std::nullopt;
    const int64_t v = static_cast<int64_t>(raw);
    return cbor_isa_uint(item) ? v : -1 - v;
}

std::optional<std::string> cborAsText(const cbor_item_t* item) {
    if (!cbor_isa_string(item)) return std::nullopt;

    auto chunkText = [](const cbor_item_t* s) {
        const size_t n = cbor_string_length(s);
        if (n == 0) return std::string();
        return std::string(reinterpret_cast<const char*>(cbor_string_handle(s)), n);
    };

    if (cbor_string_is_definite(item)) return chunkText(item);

    std::string out;
    cbor_item_t** chunks = cbor_string_chunks_handle(item);
    for (size_t i = 0; i < cbor_string_chunk_count(item); ++i) {
        out += chunkText(chunks[i]);
    }
    return out;
}

} // namespace lightbench
