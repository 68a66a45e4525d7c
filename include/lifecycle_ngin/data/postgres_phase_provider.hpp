// include/lifecycle_ngin/data/postgres_phase_provider.hpp
#pragma once

#include <memory>
#include <string>
#include "lifecycle_ngin/data/phase_provider.hpp"
#include "lifecycle_ngin/data/postgres_connection.hpp"

namespace lifecycle_ngin {

/**
 * @brief Reads the latest phase row and counts active positions
 */
class PostgresPhaseProvider : public PhaseProvider {
public:
    PostgresPhaseProvider(std::shared_ptr<PostgresConnection> connection,
                          std::string phase_table = "portfolio_phase",
                          std::string positions_table = "positions");

    Result<PhaseContext> get_phase_context() override;

private:
    std::shared_ptr<PostgresConnection> connection_;
    std::string phase_table_;
    std::string positions_table_;
};

}  // namespace lifecycle_ngin
