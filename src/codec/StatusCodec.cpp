#include "lightbench/codec/StatusCodec.hpp"
#include "lightbench/codec/CborItem.hpp"
#include "lightbench/core/Errors.hpp"

namespace lightbench {

StatusCodec::StatusCodec(SchemaPath path)
    : path_(std::move(path)) {}

CompactRecord StatusCodec::compileTemplate() const {
    CborItem node = cborMap(2);
    cborMapPut(node.get(), path_.code_leaf, cborInteger(-1));
    cborMapPut(node.get(), path_.name_leaf, cborText(""));

    // Wrap from the innermost container outwards.
    for (auto it = path_.container.rbegin(); it != path_.container.rend(); ++it) {
        CborItem parent = cborMap(1);
        cborMapPut(parent.get(), *it, std::move(node));
        node = std::move(parent);
    }

    CborItem root = cborMap(1);
    cborMapPut(root.get(), path_.root_sid, std::move(node));
    return CompactRecord(dumpCbor(root.get()));
}

CompactRecord StatusCodec::encode(const CompactRecord& tmpl,
                                  const std::string& name,
                                  LightStatus status) const {
    const std::string where = "status template (root SID " +
                              std::to_string(path_.root_sid) + ")";

    // The parsed tree belongs to this call alone.
    CborItem root;
    try {
        root = loadCbor(tmpl.bytes());
    } catch (const DecodeError& e) {
        throw SchemaError(where + ": " + e.what());
    }

    cbor_item_t* node = cborMapFind(root.get(), path_.root_sid);
    for (int64_t sid : path_.container) {
        if (!node) break;
        node = cborMapFind(node, sid);
    }
    if (!node || !cbor_isa_map(node)) {
        throw SchemaError(where + " does not follow the schema path");
    }

    // Both leaves are rewritten, never one without the other.
    if (!cborMapFind(node, path_.code_leaf) || !cborMapFind(node, path_.name_leaf)) {
        throw SchemaError(where + " lacks the code or name leaf");
    }
    cborMapReplace(node, path_.code_leaf, cborInteger(statusCode(status)));
    cborMapReplace(node, path_.name_leaf, cborText(name));

    return CompactRecord(dumpCbor(root.get()));
}

std::vector<uint8_t> StatusCodec::encodeBytes(const CompactRecord& tmpl,
                                              const std::string& name,
                                              LightStatus status) const {
    return encode(tmpl, name, status).bytes();
}

StatusEnvelope StatusCodec::decode(const uint8_t* data, size_t size) const {
    CborItem record = loadCbor(data, size);

    if (!cbor_isa_map(record.get()))
        throw DecodeError("status record: top level is not a map");

    const cbor_item_t* node = cborMapFind(record.get(), path_.root_sid);
    if (!node)
        throw DecodeError("status record: root SID " +
                          std::to_string(path_.root_sid) + " absent");

    for (int64_t sid : path_.container) {
        if (!cbor_isa_map(node))
            throw DecodeError("status record: expected map above SID " +
                              std::to_string(sid));
        node = cborMapFind(node, sid);
        if (!node)
            throw DecodeError("status record: SID " + std::to_string(sid) +
                              " absent");
    }
    if (!cbor_isa_map(node))
        throw DecodeError("status record: leaf container is not a map");

    const cbor_item_t* code_item = cborMapFind(node, path_.code_leaf);
    const cbor_item_t* name_item = cborMapFind(node, path_.name_leaf);
    std::optional<int64_t> code = code_item ? cborAsInteger(code_item) : std::nullopt;
    std::optional<std::string> name = name_item ? cborAsText(name_item) : std::nullopt;
    if (!code)
        throw DecodeError("status record: status code leaf absent");
    if (!name)
        throw DecodeError("status record: name leaf absent");

    StatusEnvelope env;
    env.name = std::move(*name);
    env.status = statusFromCode(*code);
    return env;
}

StatusEnvelope StatusCodec::decode(const std::vector<uint8_t>& bytes) const {
    return decode(bytes.data(), bytes.size());
}

StatusEnvelope StatusCodec::decodeRecord(const CompactRecord& record) const {
    return decode(record.bytes());
}

} // namespace lightbench
