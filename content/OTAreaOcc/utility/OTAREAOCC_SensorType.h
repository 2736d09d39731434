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

Author(s) / Copyright (s): Damon Hart-Davis 2016--2018
*/

/*
 Sensor type categories and their per-type defaults.
 */

#ifndef OTAREAOCC_SENSORTYPE_H
#define OTAREAOCC_SENSORTYPE_H

#include <stdint.h>


namespace OTAREAOCC
{


// Sensor category tag.
// Behaviour that differs by category (default weights, likelihoods,
// activation predicate) is selected from tables indexed by this tag.
enum SensorType : uint8_t
    {
    SENSOR_MOTION = 0,
    SENSOR_MEDIA,
    SENSOR_APPLIANCE,
    SENSOR_DOOR,
    SENSOR_WINDOW,
    SENSOR_LIGHT,
    SENSOR_ILLUMINANCE,
    SENSOR_HUMIDITY,
    SENSOR_TEMPERATURE,
    SENSOR_TYPE_COUNT // Number of categories; not a valid category.
    };

// Per-category defaults.
// Reliability weights are in [0,1]; probabilities are in (0,1).
struct SensorTypeDefaults
    {
    // Short lower-case name, eg "motion"; never NULL.
    const char *name;
    // Type-level reliability weight.
    double weight;
    // P(active | occupied).
    double pTruePositive;
    // P(active | unoccupied).
    double pFalsePositive;
    // Baseline P(occupied) as seen via this category.
    double priorOccupied;
    // True for sensors with numeric (eg environmental) readings.
    bool numeric;
    // Scale of the deviation from baseline that gives ~63% evidence strength;
    // only used for numeric categories.
    double continuousScale;
    };

// Defaults for the given category; t must be < SENSOR_TYPE_COUNT.
const SensorTypeDefaults &getSensorTypeDefaults(SensorType t);

// Short name for category, eg "media"; "?" if out of range.
inline const char *sensorTypeName(const SensorType t)
    { return((t < SENSOR_TYPE_COUNT) ? getSensorTypeDefaults(t).name : "?"); }

// True for categories with numeric readings (illuminance, humidity, temperature).
inline bool isNumericSensorType(const SensorType t)
    { return((t < SENSOR_TYPE_COUNT) && getSensorTypeDefaults(t).numeric); }

// Parse category from its short name; returns false if not recognised.
bool parseSensorType(const char *name, SensorType &out);


}

#endif
