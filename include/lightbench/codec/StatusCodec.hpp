#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "lightbench/codec/LightStatus.hpp"

namespace lightbench {

// Binary wire structure of the datagram protocol, held as its CBOR
// encoding. Never changed after construction, so one record can be read
// by any number of threads.
class CompactRecord {
public:
    CompactRecord() = default;
    explicit CompactRecord(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    bool operator==(const CompactRecord& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const CompactRecord& o) const { return bytes_ != o.bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

// ---------------------------------------------------------------------------
// SID path of the compiled status template:
//   { root_sid: { container[0]: { container[1]: { code_leaf: <code>,
//                                                 name_leaf: <name> } } } }
// Defaults reproduce the output of the car-model schema compiler
// (fetch rpc SID 60001, output/carStatus deltas 4 and 1).
// ---------------------------------------------------------------------------
struct SchemaPath {
    int64_t root_sid = 60001;
    std::vector<int64_t> container = {4, 1};
    int64_t code_leaf = 1;
    int64_t name_leaf = 2;
};

class StatusCodec {
public:
    explicit StatusCodec(SchemaPath path = SchemaPath());

    const SchemaPath& path() const { return path_; }

    // Template with placeholder leaves (code -1, empty name). Built once at
    // startup and shared read-only between encoders.
    CompactRecord compileTemplate() const;

    // Returns a private copy of tmpl with both leaves rewritten. tmpl is
    // never modified, so concurrent callers may share it.
    // Throws SchemaError if tmpl is not CBOR, does not follow the schema
    // path or lacks one of the two leaves.
    CompactRecord encode(const CompactRecord& tmpl,
                         const std::string& name,
                         LightStatus status) const;

    std::vector<uint8_t> encodeBytes(const CompactRecord& tmpl,
                                     const std::string& name,
                                     LightStatus status) const;

    // Throws DecodeError when the bytes are not CBOR (see loadCbor), the
    // nesting does not match the schema path, a leaf is absent or the code
    // is outside 0-7.
    StatusEnvelope decode(const uint8_t* data, size_t size) const;
    StatusEnvelope decode(const std::vector<uint8_t>& bytes) const;
    StatusEnvelope decodeRecord(const CompactRecord& record) const;

private:
    SchemaPath path_;
};

} // namespace lightbench
