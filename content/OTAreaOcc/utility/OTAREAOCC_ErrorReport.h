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

Author(s) / Copyright (s): Damon Hart-Davis 2017--2018
*/

/*
 Simple low-frequency error reporting.
 */

#ifndef OTAREAOCC_ERRORREPORT_H
#define OTAREAOCC_ERRORREPORT_H

#include <stdint.h>
#include <mutex>

#include "OTAREAOCC_Concurrency.h"
#include "OTAREAOCC_Sensor.h"


namespace OTAREAOCC
{

/*
 Simple low-frequency error reporting.

 This accepts simple reports of numbered errors (and warnings)
 from the error catalogue.

 Errors are strictly positive and the latest is retained,
 no error is marked with zero,
 and warnings are negative.

 Warnings (and zero) do not overwrite extant errors
 until the last error has aged sufficiently.

 The error reporter is a pseudo-'Actuator'
 with the error/warning being set()
 and the last value being retrieved with get().

 Error values are aged with read(),
 eg once per tick() of the owning area.

 When an error has aged the 'Actuator' marks itself as unavailable
 to automatically disappear from stats reports for example.

 The same catalogue codes are also returned directly
 by configuration validation and learner runs.
 */
class ErrorReport final : public Actuator<int8_t>
    {
    public:
        // Error (and warning) catalogue.
        // Errors are positive.
        // Warnings are negative.
        // Zero is not an error nor a warning.
        // Values in the range [-99,99] will save space in textual
        // (eg JSON) representations.
        enum errorCatalogue : int8_t
            {
            // A sensor reported unavailable/unknown/unparseable.
            // Not an error: the sensor is simply left out of aggregation.
            WARN_EVIDENCE_UNAVAILABLE = -30,

            // Not enough history to learn some sensor types' priors;
            // previous values were retained.
            WARN_INSUFFICIENT_HISTORY = -20,

            // Potential internal error and/or design fault.
            // If not recoverable should be ERR_INTERNAL.
            WARN_INTERNAL = -3,

            // Unspecified warning.
            WARN_UNSPECIFIED = -1,

            // Not an error.
            ERR_NONE = 0,

            // Unspecified error.
            ERR_UNSPECIFIED = 1,

            // Internal error and/or design fault.
            // Can be used to report a 'should not happen'
            // internal logic error, eg a non-finite probability.
            ERR_INTERNAL = 3,

            // Configuration errors: the area is not created.
            // No motion sensor configured.
            ERR_CONFIG_NO_MOTION = 10,
            // A sensor weight is outside [0,1].
            ERR_CONFIG_WEIGHT_RANGE = 11,
            // Threshold is outside [1,99] percent.
            ERR_CONFIG_THRESHOLD_RANGE = 12,
            // Two sensors in one area share an ID, or an ID is empty.
            ERR_CONFIG_DUPLICATE_SENSOR = 13,
            // Negative decay window or minimum delay.
            ERR_CONFIG_DECAY_RANGE = 14,
            // History period outside the supported number of days.
            ERR_CONFIG_HISTORY_PERIOD = 15,
            // Ground truth is not from motion but the named sensor is not configured.
            ERR_CONFIG_NO_GROUND_TRUTH = 16,
            // An area ID is empty or already in use.
            ERR_CONFIG_AREA_ID = 17,

            // No such area.
            ERR_UNKNOWN_AREA = 20,

            // Learner could not get history for any sensor.
            ERR_LEARNER_HISTORY = 30,
            // Learner exceeded its deadline; nothing was committed.
            ERR_LEARNER_TIMEOUT = 31,
            // Learner was cancelled; nothing was committed.
            ERR_LEARNER_CANCELLED = 32,

            // Saved area state is malformed; nothing was restored.
            ERR_RESTORE_FORMAT = 40,
            };

        // Ticks to freshly-set error/warning expiry.
        static constexpr uint8_t DEFAULT_TIMEOUT = 10;

    private:
        // The current error value; 0 means none, +ve error, -ve warning.
        OTAtomic_t<int8_t> value;

        // If non-zero then error/warning recently set; counts to zero.
        Atomic_UInt8T timeoutTicks;

        // Makes the compound check-then-set in set() atomic.
        std::mutex setLock;

    public:
        // Create instance already aged and with no error/warning set.
        ErrorReport() : value(0), timeoutTicks(0) { }

        // Set new error (+ve) / warning (-ve), or zero to clear.
        // Errors cannot be overwritten by anything
        // other than another error
        // unless the extant error/warning is aged.
        // Thread-safe.
        virtual bool set(const int8_t &newValue) override
          {
          std::lock_guard<std::mutex> lock(setLock);
          if((newValue > 0) || isAged())
              {
              value.store(newValue);
              timeoutTicks.store(DEFAULT_TIMEOUT);
              return(true);
              }
          // Cannot override current value.
          return(false);
          }
        // Convenience method to set directly with the enum value.
        bool set(const errorCatalogue err)
            { return(set(int8_t(err))); }

        // As set() but also logs a one-line '!' (error) or '?' (warning) report.
        // The context (eg area ID) and detail may be NULL.
        bool report(errorCatalogue err, const char *context, const char *detail = NULL);

        // Returns (JSON) tag/field/key name, no units, never NULL.
        virtual Sensor_tag_t tag() const override
            { return("err"); }

        // Return last error/warning, or 0 if none.
        // Thread-safe.
        virtual int8_t get() const override
            { return(value.load()); }

        // Age any live error/warning and return it; 0 if nothing set.
        virtual int8_t read() override
            { safeDecIfNZWeak(timeoutTicks); return(get()); }

        // True if any extant warning/error has aged out.
        bool isAged() const
            { return(0 == timeoutTicks.load()); }

        // Returns true if there is a non-aged error or warning set.
        virtual bool isAvailable() const override
            { return(!isAged()); }
    };

// Short symbolic name for a catalogue value, eg "ERR_LEARNER_TIMEOUT"; never NULL.
const char *errorCatalogueName(int8_t err);

// Global instance, for errors not attributable to any one area.
extern ErrorReport ErrorReporter;

}

#endif
