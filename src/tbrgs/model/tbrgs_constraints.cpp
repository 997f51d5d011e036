#include "tbrgs_constraints.hpp"
#include "../commons/tbrgs_log.hpp"
#include <cmath>

namespace tbrgs {
namespace model {


void SearchConstraints::check_consistency() const
{
    if (!std::isfinite(cus2_weight) || cus2_weight < 0)
    {
        throw ConstraintConsistencyError(strfmt("cus2_weight must be a finite value >= 0 (got %1%)", cus2_weight));
    }
}


void ReweightConstraints::check_consistency() const
{
    if (lookback == 0)
    {
        throw ConstraintConsistencyError("lookback must be >= 1");
    }
}


} // namespace model
} // namespace tbrgs
