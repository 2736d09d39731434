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

#include <string.h>

#include "OTAREAOCC_SensorType.h"


namespace OTAREAOCC
{


// Conservative defaults, used until history is available.
// Motion is the most direct indicator and is given the largest weight;
// environmental readings are weak, slow and noisy.
static const SensorTypeDefaults typeDefaults[SENSOR_TYPE_COUNT] =
    {
    //  name           weight  tp     fp     prior   numeric  scale
        { "motion",      0.85, 0.25,  0.05,  0.35,   false,   0 },
        { "media",       0.70, 0.25,  0.02,  0.30,   false,   0 },
        { "appliance",   0.30, 0.20,  0.02,  0.2356, false,   0 },
        { "door",        0.30, 0.20,  0.02,  0.1356, false,   0 },
        { "window",      0.20, 0.20,  0.02,  0.1569, false,   0 },
        { "light",       0.20, 0.20,  0.02,  0.3846, false,   0 },
        { "illuminance", 0.10, 0.09,  0.01,  0.0769, true,    50 }, // lux
        { "humidity",    0.10, 0.09,  0.01,  0.0769, true,    5 },  // %RH
        { "temperature", 0.10, 0.09,  0.01,  0.0769, true,    1 },  // C
    };

const SensorTypeDefaults &getSensorTypeDefaults(const SensorType t)
    { return(typeDefaults[(t < SENSOR_TYPE_COUNT) ? t : SENSOR_MOTION]); }

bool parseSensorType(const char * const name, SensorType &out)
    {
    if(NULL == name) { return(false); }
    for(uint8_t i = 0; i < SENSOR_TYPE_COUNT; ++i)
        {
        if(0 == strcmp(name, typeDefaults[i].name)) { out = SensorType(i); return(true); }
        }
    return(false);
    }


}
