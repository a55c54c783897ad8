#include <vectorcluster/storage/point_operation.hpp>
#include <vectorcluster/common/codec.hpp>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace VectorCluster {

const char* toString(PointOperation::Kind kind) {
    switch (kind) {
        case PointOperation::Kind::UPSERT:         return "Upsert";
        case PointOperation::Kind::DELETE_POINTS:  return "DeletePoints";
        case PointOperation::Kind::SET_PAYLOAD:    return "SetPayload";
        case PointOperation::Kind::DELETE_PAYLOAD: return "DeletePayload";
        case PointOperation::Kind::CLEAR_PAYLOAD:  return "ClearPayload";
    }
    return "Unknown";
}

// ============================================================================
// FACTORIES
// ============================================================================

PointOperation PointOperation::upsert(std::vector<Point> points) {
    PointOperation op;
    op.kind = Kind::UPSERT;
    op.points = std::move(points);
    return op;
}

PointOperation PointOperation::deletePoints(std::vector<PointId> ids) {
    PointOperation op;
    op.kind = Kind::DELETE_POINTS;
    op.ids = std::move(ids);
    return op;
}

PointOperation PointOperation::setPayload(std::vector<PointId> ids, Payload payload) {
    PointOperation op;
    op.kind = Kind::SET_PAYLOAD;
    op.ids = std::move(ids);
    op.payload = std::move(payload);
    return op;
}

PointOperation PointOperation::deletePayload(std::vector<PointId> ids, std::vector<std::string> keys) {
    PointOperation op;
    op.kind = Kind::DELETE_PAYLOAD;
    op.ids = std::move(ids);
    op.keys = std::move(keys);
    return op;
}

PointOperation PointOperation::clearPayload(std::vector<PointId> ids) {
    PointOperation op;
    op.kind = Kind::CLEAR_PAYLOAD;
    op.ids = std::move(ids);
    return op;
}

std::vector<PointId> PointOperation::pointIds() const {
    if (kind != Kind::UPSERT) {
        return ids;
    }
    std::vector<PointId> result;
    result.reserve(points.size());
    for (const auto& point : points) {
        result.push_back(point.id);
    }
    return result;
}

PointOperation PointOperation::restrictedTo(const std::vector<PointId>& selected) const {
    std::set<PointId> keep(selected.begin(), selected.end());
    PointOperation op;
    op.kind = kind;
    op.payload = payload;
    op.keys = keys;
    for (const auto& point : points) {
        if (keep.count(point.id)) {
            op.points.push_back(point);
        }
    }
    for (PointId id : ids) {
        if (keep.count(id)) {
            op.ids.push_back(id);
        }
    }
    return op;
}

// ============================================================================
// ENCODING
// ============================================================================

std::vector<uint8_t> PointOperation::encode() const {
    ByteWriter w;
    w.putU8(static_cast<uint8_t>(kind));

    w.putU32(static_cast<uint32_t>(points.size()));
    for (const auto& point : points) {
        w.putU64(point.id);
        w.putU32(static_cast<uint32_t>(point.vector.size()));
        for (float v : point.vector) {
            w.putFloat(v);
        }
        w.putU32(static_cast<uint32_t>(point.payload.size()));
        for (const auto& [key, value] : point.payload) {
            w.putString(key);
            w.putString(value);
        }
    }

    w.putU32(static_cast<uint32_t>(ids.size()));
    for (PointId id : ids) {
        w.putU64(id);
    }

    w.putU32(static_cast<uint32_t>(payload.size()));
    for (const auto& [key, value] : payload) {
        w.putString(key);
        w.putString(value);
    }

    w.putU32(static_cast<uint32_t>(keys.size()));
    for (const auto& key : keys) {
        w.putString(key);
    }
    return w.take();
}

PointOperation PointOperation::decode(const std::vector<uint8_t>& data) {
    ByteReader r(data);
    PointOperation op;

    uint8_t kind = r.getU8();
    if (kind < static_cast<uint8_t>(Kind::UPSERT) || kind > static_cast<uint8_t>(Kind::CLEAR_PAYLOAD)) {
        throw std::runtime_error("Unknown point operation kind " + std::to_string(kind));
    }
    op.kind = static_cast<Kind>(kind);

    uint32_t point_count = r.getU32();
    for (uint32_t i = 0; i < point_count; ++i) {
        Point point;
        point.id = r.getU64();
        uint32_t dim = r.getU32();
        point.vector.reserve(dim);
        for (uint32_t d = 0; d < dim; ++d) {
            point.vector.push_back(r.getFloat());
        }
        uint32_t fields = r.getU32();
        for (uint32_t f = 0; f < fields; ++f) {
            std::string key = r.getString();
            point.payload[key] = r.getString();
        }
        op.points.push_back(std::move(point));
    }

    uint32_t id_count = r.getU32();
    for (uint32_t i = 0; i < id_count; ++i) {
        op.ids.push_back(r.getU64());
    }

    uint32_t fields = r.getU32();
    for (uint32_t i = 0; i < fields; ++i) {
        std::string key = r.getString();
        op.payload[key] = r.getString();
    }

    uint32_t key_count = r.getU32();
    for (uint32_t i = 0; i < key_count; ++i) {
        op.keys.push_back(r.getString());
    }

    if (!r.atEnd()) {
        throw std::runtime_error("Trailing bytes after point operation");
    }
    return op;
}

}  // namespace VectorCluster
