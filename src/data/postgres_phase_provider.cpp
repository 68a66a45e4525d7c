// src/data/postgres_phase_provider.cpp

#include "lifecycle_ngin/data/postgres_phase_provider.hpp"
#include "lifecycle_ngin/core/time_utils.hpp"

namespace lifecycle_ngin {

PostgresPhaseProvider::PostgresPhaseProvider(std::shared_ptr<PostgresConnection> connection,
                                             std::string phase_table,
                                             std::string positions_table)
    : connection_(std::move(connection)),
      phase_table_(std::move(phase_table)),
      positions_table_(std::move(positions_table)) {}

Result<PhaseContext> PostgresPhaseProvider::get_phase_context() {
    for (const auto* table : {&phase_table_, &positions_table_}) {
        auto table_check = PostgresConnection::validate_table_name(*table);
        if (table_check.is_error()) {
            return forward_error<PhaseContext>(table_check, "PostgresPhaseProvider");
        }
    }

    return connection_->with_transaction<PhaseContext>(
        "PostgresPhaseProvider", [&](pqxx::work& txn) -> Result<PhaseContext> {
            auto phase_rows = txn.exec("SELECT macro_phase, meso_phase, cut_pressure, "
                                       "EXTRACT(EPOCH FROM as_of)::bigint AS as_of_epoch FROM " +
                                       phase_table_ + " ORDER BY as_of DESC LIMIT 1");
            if (phase_rows.empty()) {
                return make_error<PhaseContext>(ErrorCode::DATA_NOT_FOUND, "No phase rows",
                                                "PostgresPhaseProvider");
            }

            const auto& row = phase_rows[0];
            auto macro = phase_from_string(row["macro_phase"].as<std::string>());
            auto meso = phase_from_string(row["meso_phase"].as<std::string>());
            if (!macro || !meso) {
                return make_error<PhaseContext>(ErrorCode::INVALID_DATA,
                                                "Unknown phase label in " + phase_table_,
                                                "PostgresPhaseProvider");
            }

            PhaseContext context;
            context.macro = *macro;
            context.meso = *meso;
            context.cut_pressure =
                row["cut_pressure"].is_null() ? 0.0 : row["cut_pressure"].as<double>();
            context.as_of = core::from_epoch_seconds(row["as_of_epoch"].as<int64_t>());

            auto count_row = txn.exec1("SELECT COUNT(*) FROM " + positions_table_ +
                                       " WHERE status = 'active'");
            context.active_positions = count_row[0].as<int>();
            return context;
        });
}

}  // namespace lifecycle_ngin
