/*
The OpenTRV project licenses this file to you
under the Apache Licence, Version 2.0 (the "Licence");
you may not use this file except in compliance
with the Licence. You may obtain a copy of the Licence at

http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the Licence is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied. See the Licence for the
specific language governing permissions and limitations
under the Licence.

Author(s) / Copyright (s): Damon Hart-Davis 2015--2018
*/

#ifndef LIB_OTAREAOCC_H
#define LIB_OTAREAOCC_H

#define LIB_OTAREAOCC_VERSION_MAJOR 1
#define LIB_OTAREAOCC_VERSION_MINOR 0

// Bayesian area occupancy: fuses heterogeneous sensor evidence per area
// into an occupancy probability and a binary occupied state,
// with time decay of evidence and priors learned from history.

// Some basic utility functions and definitions.
#include "utility/OTAREAOCC_Util.h"

// Portable concurrency/atomicity support.
#include "utility/OTAREAOCC_Concurrency.h"

// Serial (console) IO and debug support.
#include "utility/OTAREAOCC_Serial_IO.h"

// Base/common sensor and actuator types.
#include "utility/OTAREAOCC_Sensor.h"

// Error/warning catalogue and reporting.
#include "utility/OTAREAOCC_ErrorReport.h"

// Compile-time defaults.
#include "utility/OTAREAOCC_Parameters.h"

// Sensor categories and evidence extraction.
#include "utility/OTAREAOCC_SensorType.h"
#include "utility/OTAREAOCC_SensorEvidence.h"

// Time decay of evidence.
#include "utility/OTAREAOCC_Decay.h"

// Per-area likelihoods and priors.
#include "utility/OTAREAOCC_PriorStore.h"

// Evidence fusion and the occupied decision.
#include "utility/OTAREAOCC_BayesianAggregator.h"
#include "utility/OTAREAOCC_ThresholdDecision.h"

// Runtime area configuration.
#include "utility/OTAREAOCC_AreaConfig.h"

// Host state interfaces and the historical learner.
#include "utility/OTAREAOCC_StateSource.h"
#include "utility/OTAREAOCC_HistoricalLearner.h"

// Areas, their serialised workers, stats and JSON output.
#include "utility/OTAREAOCC_Area.h"
#include "utility/OTAREAOCC_AreaStatsTracker.h"
#include "utility/OTAREAOCC_AreaStateJSON.h"
#include "utility/OTAREAOCC_AreaWorker.h"

// Save and restore of learned priors and stats.
#include "utility/OTAREAOCC_AreaPersistence.h"

// Registry of areas.
#include "utility/OTAREAOCC_OccupancyEngine.h"

#endif
