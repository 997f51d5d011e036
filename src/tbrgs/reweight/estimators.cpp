#include "estimators.hpp"

namespace tbrgs {
namespace reweight {


FunctionEstimator::FunctionEstimator(predictor_t predictor)
    : m_predictor(std::move(predictor))
{
    if (!m_predictor)
    {
        throw std::invalid_argument("FunctionEstimator needs a predictor");
    }
}


cost_t FunctionEstimator::predict(const StaticEdge &, const VolumeWindow &window) const
{
    return m_predictor(window);
}


} // namespace reweight
} // namespace tbrgs
