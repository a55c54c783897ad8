#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace VectorCluster {

using PointId = uint64_t;
using Payload = std::map<std::string, std::string>;

struct Point {
    PointId id = 0;
    std::vector<float> vector;
    Payload payload;

    bool operator==(const Point& other) const = default;
};

/**
 * @brief Point-level write carried as the opaque payload of a shard operation.
 *
 * The replication core never looks inside; only ShardStorage implementations
 * and the routing layer (which splits a request by point id) decode it.
 */
struct PointOperation {
    enum class Kind : uint8_t {
        UPSERT = 1,
        DELETE_POINTS = 2,
        SET_PAYLOAD = 3,
        DELETE_PAYLOAD = 4,
        CLEAR_PAYLOAD = 5
    };

    Kind kind = Kind::UPSERT;
    std::vector<Point> points;          // UPSERT
    std::vector<PointId> ids;           // every other kind
    Payload payload;                    // SET_PAYLOAD
    std::vector<std::string> keys;      // DELETE_PAYLOAD

    static PointOperation upsert(std::vector<Point> points);
    static PointOperation deletePoints(std::vector<PointId> ids);
    static PointOperation setPayload(std::vector<PointId> ids, Payload payload);
    static PointOperation deletePayload(std::vector<PointId> ids, std::vector<std::string> keys);
    static PointOperation clearPayload(std::vector<PointId> ids);

    // Point ids touched by this operation, in request order
    std::vector<PointId> pointIds() const;

    // Same operation restricted to the given ids (used to split by shard)
    PointOperation restrictedTo(const std::vector<PointId>& ids) const;

    bool empty() const { return points.empty() && ids.empty(); }

    std::vector<uint8_t> encode() const;

    /**
     * @throws std::runtime_error on malformed input
     */
    static PointOperation decode(const std::vector<uint8_t>& data);
};

const char* toString(PointOperation::Kind kind);

}  // namespace VectorCluster
