#pragma once

#include "procchain/features/feature_types.hpp"

namespace procchain::features {

void RegisterBuiltinFeatureCalculators(FeatureRegistry &registry);

} // namespace procchain::features
