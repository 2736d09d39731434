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

Author(s) / Copyright (s): Damon Hart-Davis 2013--2018
*/

/*
 Base sensor type for simple (pseudo-)sensors returning scalar values,
 such as the occupancy percentage synthesised for an area,
 and the matching actuator type.
 */

#ifndef OTAREAOCC_SENSOR_H
#define OTAREAOCC_SENSOR_H

#include <stdint.h>
#include <stddef.h>


namespace OTAREAOCC
{


// Type used for Sensor tags items.
typedef const char *Sensor_tag_t;

// Minimal lightweight sensor subset.
// Contains just enough to check availability and to name and get the latest value.
template <class T>
class SensorCore
  {
  public:
    // Type of sensed data.
    typedef T data_t;

    virtual ~SensorCore() { }

    // Return last value fetched by read(); undefined before first read().
    // Usually fast.
    // READ IMPLEMENTATION DOCUMENTATION BEFORE TREATING AS thread-safe.
    virtual T get() const = 0;

    // Returns true if this sensor is currently available.
    // True by default unless implementation overrides.
    virtual bool isAvailable() const { return(true); }

    // Returns a suggested (JSON) tag/field/key name including units of get(); NULL means no recommended tag.
    // The lifetime of the pointed-to text must be at least that of the Sensor instance.
    virtual Sensor_tag_t tag() const { return(NULL); }
  };

// Base sensor type.
template <class T>
class Sensor : public SensorCore<T>
  {
  public:
    // Force a read/poll of this sensor and return the value sensed.
    // May be expensive/slow.
    virtual T read() = 0;
  };

// Base actuator type: a sensor whose value can also be set.
template <class T>
class Actuator : public Sensor<T>
  {
  public:
    // Set new target value; returns true if accepted.
    virtual bool set(const T &newValue) = 0;
  };


}

#endif
