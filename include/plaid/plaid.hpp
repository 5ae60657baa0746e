#pragma once

#include "plaid/common/types.hpp" // IWYU pragma: export

#include "plaid/core/distribution.hpp"          // IWYU pragma: export
#include "plaid/core/random.hpp"                // IWYU pragma: export
#include "plaid/core/removable_sequence.hpp"    // IWYU pragma: export
#include "plaid/evaluation/outcome.hpp"         // IWYU pragma: export
#include "plaid/exceptions.hpp"                 // IWYU pragma: export
#include "plaid/interleaving/method.hpp"        // IWYU pragma: export
#include "plaid/interleaving/probabilistic.hpp" // IWYU pragma: export
#include "plaid/interleaving/result.hpp"        // IWYU pragma: export
#include "plaid/search/configs.hpp"             // IWYU pragma: export
