#include "postgres_pool_store.hpp"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace ridematch::pool {

namespace {

constexpr const char* kPoolColumns = R"(
    id, driver_id, vehicle_id, status, max_passengers, current_passengers,
    COALESCE(optimized_route::text, '[]') AS optimized_route,
    total_distance_km, total_duration_minutes,
    center_lat, center_lng, radius_km, cell_id,
    base_fare, per_km_rate, per_minute_rate,
    CAST(EXTRACT(EPOCH FROM match_deadline) * 1000 AS BIGINT) AS match_deadline_ms,
    CAST(EXTRACT(EPOCH FROM started_at) * 1000 AS BIGINT) AS started_at_ms,
    CAST(EXTRACT(EPOCH FROM completed_at) * 1000 AS BIGINT) AS completed_at_ms,
    CAST(EXTRACT(EPOCH FROM created_at) * 1000 AS BIGINT) AS created_at_ms,
    CAST(EXTRACT(EPOCH FROM updated_at) * 1000 AS BIGINT) AS updated_at_ms
)";

constexpr const char* kPassengerColumns = R"(
    id, pool_ride_id, rider_id, status,
    pickup_lat, pickup_lng, dropoff_lat, dropoff_lng,
    COALESCE(pickup_address, '') AS pickup_address,
    COALESCE(dropoff_address, '') AS dropoff_address,
    direct_distance_km, direct_duration_minutes,
    original_fare, pool_fare, savings_percent, seat_count,
    CAST(EXTRACT(EPOCH FROM picked_up_at) * 1000 AS BIGINT) AS picked_up_at_ms,
    CAST(EXTRACT(EPOCH FROM dropped_off_at) * 1000 AS BIGINT) AS dropped_off_at_ms,
    CAST(EXTRACT(EPOCH FROM estimated_pickup) * 1000 AS BIGINT) AS estimated_pickup_ms,
    CAST(EXTRACT(EPOCH FROM estimated_dropoff) * 1000 AS BIGINT) AS estimated_dropoff_ms,
    CAST(EXTRACT(EPOCH FROM created_at) * 1000 AS BIGINT) AS created_at_ms,
    CAST(EXTRACT(EPOCH FROM updated_at) * 1000 AS BIGINT) AS updated_at_ms
)";

std::string format_double(double value) {
    std::ostringstream ss;
    ss << std::setprecision(12) << value;
    return ss.str();
}

std::optional<int64_t> optional_ms(const platform::PostgresRow& row, const std::string& col) {
    if (row.is_null(col)) {
        return std::nullopt;
    }
    return row.get_int64(col);
}

/// Postgres text[] literal with every element quoted
std::string to_text_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += "\"";
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += "\"";
    }
    out += "}";
    return out;
}

bool parse_pool(const platform::PostgresRow& row, PoolRide& pool) {
    pool.id = row.get_string("id");
    if (!row.is_null("driver_id")) pool.driver_id = row.get_string("driver_id");
    if (!row.is_null("vehicle_id")) pool.vehicle_id = row.get_string("vehicle_id");

    auto status = pool_status_from_string(row.get_string("status"));
    if (!status) {
        LOG(WARNING) << "Pool " << pool.id << " has unknown status '"
                     << row.get_string("status") << "'";
        return false;
    }
    pool.status = *status;

    pool.max_passengers = row.get_int("max_passengers");
    pool.current_passengers = row.get_int("current_passengers");

    auto route = route_from_json(row.get_string("optimized_route"));
    if (!route) {
        LOG(WARNING) << "Pool " << pool.id << " has an unreadable route";
        return false;
    }
    pool.optimized_route = std::move(*route);
    pool.total_distance_km = row.get_double("total_distance_km");
    pool.total_duration_minutes = row.get_int("total_duration_minutes");

    pool.center.latitude = row.get_double("center_lat");
    pool.center.longitude = row.get_double("center_lng");
    pool.radius_km = row.get_double("radius_km");
    pool.cell_id = row.get_string("cell_id");

    pool.base_fare = row.get_double("base_fare");
    pool.per_km_rate = row.get_double("per_km_rate");
    pool.per_minute_rate = row.get_double("per_minute_rate");

    pool.match_deadline_ms = row.get_int64("match_deadline_ms");
    pool.started_at_ms = optional_ms(row, "started_at_ms");
    pool.completed_at_ms = optional_ms(row, "completed_at_ms");
    pool.created_at_ms = row.get_int64("created_at_ms");
    pool.updated_at_ms = row.get_int64("updated_at_ms");
    return true;
}

bool parse_passenger(const platform::PostgresRow& row, PoolPassenger& passenger) {
    passenger.id = row.get_string("id");
    passenger.pool_ride_id = row.get_string("pool_ride_id");
    passenger.rider_id = row.get_string("rider_id");

    auto status = passenger_status_from_string(row.get_string("status"));
    if (!status) {
        LOG(WARNING) << "Pool passenger " << passenger.id << " has unknown status '"
                     << row.get_string("status") << "'";
        return false;
    }
    passenger.status = *status;

    passenger.pickup.latitude = row.get_double("pickup_lat");
    passenger.pickup.longitude = row.get_double("pickup_lng");
    passenger.dropoff.latitude = row.get_double("dropoff_lat");
    passenger.dropoff.longitude = row.get_double("dropoff_lng");
    passenger.pickup_address = row.get_string("pickup_address");
    passenger.dropoff_address = row.get_string("dropoff_address");

    passenger.direct_distance_km = row.get_double("direct_distance_km");
    passenger.direct_duration_minutes = row.get_int("direct_duration_minutes");
    passenger.original_fare = row.get_double("original_fare");
    passenger.pool_fare = row.get_double("pool_fare");
    passenger.savings_percent = row.get_double("savings_percent");
    passenger.seat_count = row.get_int("seat_count");

    passenger.picked_up_at_ms = optional_ms(row, "picked_up_at_ms");
    passenger.dropped_off_at_ms = optional_ms(row, "dropped_off_at_ms");
    passenger.estimated_pickup_ms = row.get_int64("estimated_pickup_ms");
    passenger.estimated_dropoff_ms = row.get_int64("estimated_dropoff_ms");
    passenger.created_at_ms = row.get_int64("created_at_ms");
    passenger.updated_at_ms = row.get_int64("updated_at_ms");
    return true;
}

WriteResult write_result(const platform::PostgresResult& result, const char* what) {
    if (!result.ok()) {
        LOG(ERROR) << "Failed to " << what << ": " << result.error();
        return WriteResult::kFailed;
    }
    return result.affected_rows() > 0 ? WriteResult::kApplied : WriteResult::kNotApplied;
}

}  // namespace

PostgresPoolStore::PostgresPoolStore(std::shared_ptr<platform::PostgresClient> db)
    : db_(std::move(db)) {}

// ============================================================================
// Pools
// ============================================================================

bool PostgresPoolStore::create_pool_ride(const PoolRide& pool) {
    const char* sql = R"(
        INSERT INTO pool_rides (
            id, status, max_passengers, current_passengers,
            optimized_route, total_distance_km, total_duration_minutes,
            center_lat, center_lng, radius_km, cell_id,
            base_fare, per_km_rate, per_minute_rate, match_deadline,
            created_at, updated_at)
        VALUES ($1, $2, $3::int, $4::int, $5::jsonb, $6::double precision, $7::int,
                $8::double precision, $9::double precision, $10::double precision, $11,
                $12::double precision, $13::double precision, $14::double precision,
                to_timestamp($15::double precision / 1000.0), NOW(), NOW())
    )";

    auto result = db_->execute(sql, {
        pool.id,
        to_string(pool.status),
        std::to_string(pool.max_passengers),
        std::to_string(pool.current_passengers),
        route_to_json(pool.optimized_route),
        format_double(pool.total_distance_km),
        std::to_string(pool.total_duration_minutes),
        format_double(pool.center.latitude),
        format_double(pool.center.longitude),
        format_double(pool.radius_km),
        pool.cell_id,
        format_double(pool.base_fare),
        format_double(pool.per_km_rate),
        format_double(pool.per_minute_rate),
        std::to_string(pool.match_deadline_ms),
    });

    if (!result.ok()) {
        LOG(ERROR) << "Failed to create pool ride " << pool.id << ": " << result.error();
        return false;
    }
    return true;
}

bool PostgresPoolStore::query_pools(const std::string& where_clause,
                                    const std::vector<std::string>& params,
                                    std::vector<PoolRide>& out) {
    std::string sql = std::string("SELECT ") + kPoolColumns + " FROM pool_rides " + where_clause;

    auto result = db_->execute(sql, params);
    if (!result.ok()) {
        LOG(ERROR) << "Pool ride query failed: " << result.error();
        return false;
    }

    for (const auto& row : result) {
        PoolRide pool;
        if (parse_pool(row, pool)) {
            out.push_back(std::move(pool));
        }
    }
    return true;
}

bool PostgresPoolStore::get_pool_ride(const std::string& pool_ride_id,
                                      std::optional<PoolRide>& out) {
    std::vector<PoolRide> pools;
    if (!query_pools("WHERE id = $1", {pool_ride_id}, pools)) {
        return false;
    }
    out = pools.empty() ? std::nullopt : std::optional<PoolRide>(std::move(pools.front()));
    return true;
}

bool PostgresPoolStore::find_nearby_pools(const std::vector<std::string>& cell_ids,
                                          int seats,
                                          int limit,
                                          std::vector<PoolRide>& out) {
    if (cell_ids.empty()) {
        return true;
    }

    return query_pools(R"(
        WHERE status = 'matching'
          AND cell_id = ANY($1::text[])
          AND match_deadline > NOW()
          AND current_passengers + $2::int <= max_passengers
        ORDER BY created_at ASC
        LIMIT $3::int
    )", {to_text_array(cell_ids), std::to_string(seats), std::to_string(limit)}, out);
}

bool PostgresPoolStore::get_driver_active_pool(const std::string& driver_id,
                                               std::optional<PoolRide>& out) {
    std::vector<PoolRide> pools;
    if (!query_pools(R"(
            WHERE driver_id = $1 AND status IN ('confirmed', 'in_progress')
            ORDER BY created_at DESC
            LIMIT 1
        )", {driver_id}, pools)) {
        return false;
    }
    out = pools.empty() ? std::nullopt : std::optional<PoolRide>(std::move(pools.front()));
    return true;
}

WriteResult PostgresPoolStore::adjust_passenger_count(const std::string& pool_ride_id,
                                                      int delta) {
    const char* sql = R"(
        UPDATE pool_rides
        SET current_passengers = current_passengers + $2::int, updated_at = NOW()
        WHERE id = $1
          AND current_passengers + $2::int <= max_passengers
          AND current_passengers + $2::int >= 0
    )";
    return write_result(db_->execute(sql, {pool_ride_id, std::to_string(delta)}),
                        "adjust pool passenger count");
}

WriteResult PostgresPoolStore::update_pool_route(const std::string& pool_ride_id,
                                                 const std::vector<RouteStop>& route,
                                                 double total_distance_km,
                                                 int total_duration_minutes) {
    const char* sql = R"(
        UPDATE pool_rides
        SET optimized_route = $2::jsonb,
            total_distance_km = $3::double precision,
            total_duration_minutes = $4::int,
            updated_at = NOW()
        WHERE id = $1
    )";
    return write_result(db_->execute(sql, {
                            pool_ride_id,
                            route_to_json(route),
                            format_double(total_distance_km),
                            std::to_string(total_duration_minutes),
                        }),
                        "update pool route");
}

WriteResult PostgresPoolStore::assign_driver(const std::string& pool_ride_id,
                                             const std::string& driver_id,
                                             const std::string& vehicle_id) {
    const char* sql = R"(
        UPDATE pool_rides
        SET driver_id = $2, vehicle_id = NULLIF($3, ''), status = 'confirmed',
            updated_at = NOW()
        WHERE id = $1 AND status = 'matching' AND driver_id IS NULL
    )";
    return write_result(db_->execute(sql, {pool_ride_id, driver_id, vehicle_id}),
                        "assign pool driver");
}

WriteResult PostgresPoolStore::transition_pool(const std::string& pool_ride_id,
                                               PoolStatus from,
                                               PoolStatus to) {
    std::string sql = "UPDATE pool_rides SET status = $3, updated_at = NOW()";
    if (to == PoolStatus::kInProgress) {
        sql += ", started_at = NOW()";
    } else if (to == PoolStatus::kCompleted) {
        sql += ", completed_at = NOW()";
    }
    sql += " WHERE id = $1 AND status = $2";

    return write_result(db_->execute(sql, {pool_ride_id, to_string(from), to_string(to)}),
                        "update pool status");
}

bool PostgresPoolStore::cancel_expired_pools(std::vector<std::string>& cancelled_pool_ids,
                                             std::vector<PoolPassenger>& cancelled_passengers) {
    platform::PostgresTransaction txn(*db_);
    if (!txn.active()) {
        LOG(ERROR) << "Failed to begin expiry transaction";
        return false;
    }

    auto pools = db_->execute(R"(
        UPDATE pool_rides
        SET status = 'cancelled', updated_at = NOW()
        WHERE status = 'matching' AND match_deadline < NOW()
        RETURNING id
    )");
    if (!pools.ok()) {
        LOG(ERROR) << "Failed to cancel expired pools: " << pools.error();
        return false;
    }

    std::vector<std::string> ids;
    for (const auto& row : pools) {
        ids.push_back(row.get_string("id"));
    }

    std::vector<PoolPassenger> passengers;
    if (!ids.empty()) {
        std::string sql = std::string(R"(
            UPDATE pool_passengers
            SET status = 'cancelled', updated_at = NOW()
            WHERE pool_ride_id = ANY($1::text[])
              AND status NOT IN ('dropped_off', 'cancelled', 'no_show')
            RETURNING )") + kPassengerColumns;

        auto result = db_->execute(sql, {to_text_array(ids)});
        if (!result.ok()) {
            LOG(ERROR) << "Failed to cancel passengers of expired pools: " << result.error();
            return false;
        }
        for (const auto& row : result) {
            PoolPassenger passenger;
            if (parse_passenger(row, passenger)) {
                passengers.push_back(std::move(passenger));
            }
        }
    }

    if (!txn.commit()) {
        LOG(ERROR) << "Failed to commit expiry transaction";
        return false;
    }

    cancelled_pool_ids = std::move(ids);
    cancelled_passengers = std::move(passengers);
    return true;
}

// ============================================================================
// Passengers
// ============================================================================

bool PostgresPoolStore::create_passenger(const PoolPassenger& passenger) {
    const char* sql = R"(
        INSERT INTO pool_passengers (
            id, pool_ride_id, rider_id, status,
            pickup_lat, pickup_lng, dropoff_lat, dropoff_lng,
            pickup_address, dropoff_address,
            direct_distance_km, direct_duration_minutes,
            original_fare, pool_fare, savings_percent, seat_count,
            estimated_pickup, estimated_dropoff, created_at, updated_at)
        VALUES ($1, $2, $3, $4,
                $5::double precision, $6::double precision,
                $7::double precision, $8::double precision,
                $9, $10, $11::double precision, $12::int,
                $13::double precision, $14::double precision, $15::double precision, $16::int,
                to_timestamp($17::double precision / 1000.0),
                to_timestamp($18::double precision / 1000.0),
                NOW(), NOW())
    )";

    auto result = db_->execute(sql, {
        passenger.id,
        passenger.pool_ride_id,
        passenger.rider_id,
        to_string(passenger.status),
        format_double(passenger.pickup.latitude),
        format_double(passenger.pickup.longitude),
        format_double(passenger.dropoff.latitude),
        format_double(passenger.dropoff.longitude),
        passenger.pickup_address,
        passenger.dropoff_address,
        format_double(passenger.direct_distance_km),
        std::to_string(passenger.direct_duration_minutes),
        format_double(passenger.original_fare),
        format_double(passenger.pool_fare),
        format_double(passenger.savings_percent),
        std::to_string(passenger.seat_count),
        std::to_string(passenger.estimated_pickup_ms),
        std::to_string(passenger.estimated_dropoff_ms),
    });

    if (!result.ok()) {
        LOG(ERROR) << "Failed to create pool passenger " << passenger.id << ": "
                   << result.error();
        return false;
    }
    return true;
}

bool PostgresPoolStore::query_passengers(const std::string& where_clause,
                                         const std::vector<std::string>& params,
                                         std::vector<PoolPassenger>& out) {
    std::string sql = std::string("SELECT ") + kPassengerColumns +
                      " FROM pool_passengers " + where_clause;

    auto result = db_->execute(sql, params);
    if (!result.ok()) {
        LOG(ERROR) << "Pool passenger query failed: " << result.error();
        return false;
    }

    for (const auto& row : result) {
        PoolPassenger passenger;
        if (parse_passenger(row, passenger)) {
            out.push_back(std::move(passenger));
        }
    }
    return true;
}

bool PostgresPoolStore::get_passenger(const std::string& pool_passenger_id,
                                      std::optional<PoolPassenger>& out) {
    std::vector<PoolPassenger> passengers;
    if (!query_passengers("WHERE id = $1", {pool_passenger_id}, passengers)) {
        return false;
    }
    out = passengers.empty() ? std::nullopt
                             : std::optional<PoolPassenger>(std::move(passengers.front()));
    return true;
}

bool PostgresPoolStore::list_passengers(const std::string& pool_ride_id,
                                        std::vector<PoolPassenger>& out) {
    return query_passengers("WHERE pool_ride_id = $1 ORDER BY created_at ASC",
                            {pool_ride_id}, out);
}

bool PostgresPoolStore::get_active_passenger_for_rider(const std::string& rider_id,
                                                       std::optional<PoolPassenger>& out) {
    std::vector<PoolPassenger> passengers;
    if (!query_passengers(R"(
            WHERE rider_id = $1
              AND status NOT IN ('dropped_off', 'cancelled', 'no_show')
            ORDER BY created_at DESC
            LIMIT 1
        )", {rider_id}, passengers)) {
        return false;
    }
    out = passengers.empty() ? std::nullopt
                             : std::optional<PoolPassenger>(std::move(passengers.front()));
    return true;
}

WriteResult PostgresPoolStore::transition_passenger(const std::string& pool_passenger_id,
                                                    PassengerStatus from,
                                                    PassengerStatus to) {
    std::string sql = "UPDATE pool_passengers SET status = $3, updated_at = NOW()";
    if (to == PassengerStatus::kPickedUp) {
        sql += ", picked_up_at = NOW()";
    } else if (to == PassengerStatus::kDroppedOff) {
        sql += ", dropped_off_at = NOW()";
    }
    sql += " WHERE id = $1 AND status = $2";

    return write_result(
        db_->execute(sql, {pool_passenger_id, to_string(from), to_string(to)}),
        "update pool passenger status");
}

// ============================================================================
// Configuration and reporting
// ============================================================================

bool PostgresPoolStore::get_pool_config(const std::string& city_id,
                                        std::optional<PoolConfig>& out) {
    std::string sql = R"(
        SELECT max_detour_percent, max_detour_minutes, max_wait_minutes,
               max_passengers_per_ride, min_match_score, match_radius_km,
               cell_resolution, discount_percent, min_savings_percent
        FROM pool_configs
    )";
    std::vector<std::string> params;
    if (city_id.empty()) {
        sql += " WHERE city_id IS NULL AND is_active LIMIT 1";
    } else {
        sql += R"( WHERE (city_id = $1 OR city_id IS NULL) AND is_active
                   ORDER BY city_id NULLS LAST LIMIT 1)";
        params.push_back(city_id);
    }

    auto result = db_->execute(sql, params);
    if (!result.ok()) {
        LOG(ERROR) << "Pool config query failed: " << result.error();
        return false;
    }
    if (result.num_rows() == 0) {
        out = std::nullopt;
        return true;
    }

    auto row = result.row(0);
    PoolConfig config;
    config.max_detour_percent = row.get_double("max_detour_percent");
    config.max_detour_minutes = row.get_int("max_detour_minutes");
    config.max_wait_minutes = row.get_int("max_wait_minutes");
    config.max_passengers_per_ride = row.get_int("max_passengers_per_ride");
    config.min_match_score = row.get_double("min_match_score");
    config.match_radius_km = row.get_double("match_radius_km");
    config.cell_resolution = row.get_int("cell_resolution");
    config.discount_percent = row.get_double("discount_percent");
    config.min_savings_percent = row.get_double("min_savings_percent");
    out = config;
    return true;
}

bool PostgresPoolStore::get_pool_stats(PoolStats& out) {
    const char* sql = R"(
        SELECT
            (SELECT COUNT(*) FROM pool_rides) AS total_pools,
            (SELECT COUNT(*) FROM pool_rides
              WHERE status IN ('matching', 'confirmed', 'in_progress')) AS active_pools,
            (SELECT COALESCE(AVG(current_passengers), 0) FROM pool_rides
              WHERE status = 'completed') AS avg_passengers,
            (SELECT COALESCE(AVG(savings_percent), 0) FROM pool_passengers
              WHERE status = 'dropped_off') AS avg_savings,
            (SELECT COUNT(*) FROM pool_passengers) AS total_passengers,
            (SELECT COUNT(*) FROM pool_passengers
              WHERE status <> 'cancelled') AS matched_passengers,
            (SELECT COALESCE(SUM(direct_distance_km * savings_percent / 100.0), 0)
               FROM pool_passengers WHERE status = 'dropped_off') AS shared_km
    )";

    auto result = db_->execute(sql);
    if (!result.ok() || result.num_rows() == 0) {
        LOG(ERROR) << "Pool stats query failed: " << result.error();
        return false;
    }

    auto row = result.row(0);
    PoolStats stats;
    stats.total_pools = row.get_int64("total_pools");
    stats.active_pools = row.get_int64("active_pools");
    stats.avg_passengers_per_pool = row.get_double("avg_passengers");
    stats.avg_savings_percent = row.get_double("avg_savings");

    int64_t total_passengers = row.get_int64("total_passengers");
    if (total_passengers > 0) {
        stats.match_success_rate =
            static_cast<double>(row.get_int64("matched_passengers")) / total_passengers * 100.0;
    }
    stats.total_co2_saved_kg = row.get_double("shared_km") * kCo2KgPerKm;

    out = stats;
    return true;
}

}  // namespace ridematch::pool
