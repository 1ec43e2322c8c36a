#pragma once

#include "porephase/Mixture.hpp"
#include "porephase/context/Diagnostics.hpp"
#include "porephase/context/MixtureSettings.hpp"
#include "porephase/context/Phase.hpp"
#include "porephase/context/Project.hpp"
#include "porephase/context/PropertyStore.hpp"
#include "porephase/mixture/HealthChecker.hpp"
#include "porephase/util/Constants.hpp"
#include "porephase/util/ErrorCodes.hpp"
#include "porephase/util/Exceptions.hpp"
#include "porephase/util/PropertyKey.hpp"
#include "porephase/util/Tolerances.hpp"
