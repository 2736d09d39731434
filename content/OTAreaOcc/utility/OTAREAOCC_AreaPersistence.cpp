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
 Save and restore of an area's learned priors and recent stats.
 */

#include <ctype.h>
#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <cmath>
#include <vector>

#include "OTAREAOCC_AreaPersistence.h"
#include "OTAREAOCC_SensorType.h"
#include "OTAREAOCC_Util.h"


namespace OTAREAOCC
{


namespace {

// Everything read so far; applied only once the whole text has parsed.
struct Parsed
    {
    PriorTable table;
    AreaStatsTracker::ProbabilityHistory probabilities;
    AreaStatsTracker::OccupancyHistory occupancy;
    double minProbability;
    double maxProbability;
    timestamp_ms_t lastOccupiedMs;
    timestamp_ms_t stateSinceMs;
    bool occupied;

    Parsed() : minProbability(NAN), maxProbability(NAN),
               lastOccupiedMs(NO_TIME), stateSinceMs(NO_TIME), occupied(false) { }
    };

// IDs are written as a single field.
bool isWritableId(const std::string &id)
    {
    if(id.empty()) { return(false); }
    for(std::string::const_iterator i = id.begin(); i != id.end(); ++i)
        { if(isspace((unsigned char)*i)) { return(false); } }
    return(true);
    }

void appendReal(std::string &out, const double v)
    {
    char b[32];
    snprintf(b, sizeof(b), " %.17g", v);
    out += b;
    }

void appendTime(std::string &out, const timestamp_ms_t t)
    {
    char b[32];
    snprintf(b, sizeof(b), " %lld", (long long)t);
    out += b;
    }

void appendModel(std::string &out, const PriorModel &m)
    {
    appendReal(out, m.getTruePositive());
    appendReal(out, m.getFalsePositive());
    appendReal(out, m.getPriorOccupied());
    out += '\n';
    }

// Split on whitespace; out is replaced.
void splitFields(const std::string &line, std::vector<std::string> &out)
    {
    out.clear();
    std::string::size_type i = 0;
    while(i < line.size())
        {
        while((i < line.size()) && isspace((unsigned char)line[i])) { ++i; }
        const std::string::size_type start = i;
        while((i < line.size()) && !isspace((unsigned char)line[i])) { ++i; }
        if(i > start) { out.push_back(line.substr(start, i - start)); }
        }
    }

// Whole field as a signed decimal integer.
bool parseInteger(const std::string &field, long long &out)
    {
    const char *const s = field.c_str();
    char *end = NULL;
    errno = 0;
    const long long v = strtoll(s, &end, 10);
    if((end == s) || ('\0' != *end) || (ERANGE == errno)) { return(false); }
    out = v;
    return(true);
    }

bool parseTime(const std::string &field, timestamp_ms_t &out)
    {
    long long v;
    if(!parseInteger(field, v)) { return(false); }
    out = timestamp_ms_t(v);
    return(true);
    }

// A finite real in [0,1].
bool parseProbability(const std::string &field, double &out)
    {
    double v;
    if(!parseFiniteDouble(field, v) || (v < 0) || (v > 1)) { return(false); }
    out = v;
    return(true);
    }

// Fields 2..4 as true-positive, false-positive and prior.
bool parseModel(const std::vector<std::string> &f, PriorModel &out)
    {
    double tp, fp, prior;
    if(!parseProbability(f[2], tp) || !parseProbability(f[3], fp) || !parseProbability(f[4], prior)) { return(false); }
    out = PriorModel(tp, fp, prior);
    return(true);
    }

bool parseByHour(const std::vector<std::string> &f, ByHourPriors &out)
    {
    if((1 + ByHourPriors::HOURS) != f.size()) { return(false); }
    ByHourPriors h;
    for(uint8_t hh = 0; hh < ByHourPriors::HOURS; ++hh)
        {
        long long v;
        if(!parseInteger(f[1 + hh], v)) { return(false); }
        if((ByHourPriors::UNSET_BYTE != v) && ((v < 0) || (v > 100))) { return(false); }
        h.set(hh, uint8_t(v));
        }
    out = h;
    return(true);
    }

// Apply one non-header record; false if malformed.
bool applyRecord(const std::vector<std::string> &f, Parsed &p)
    {
    if(1 != f[0].size()) { return(false); }
    switch(f[0][0])
        {
        case 'L':
            {
            timestamp_ms_t t;
            if((2 != f.size()) || !parseTime(f[1], t)) { return(false); }
            p.table.setLearnedAtMs(t);
            return(true);
            }
        case 'T':
            {
            SensorType st;
            PriorModel m;
            if((5 != f.size()) || !parseSensorType(f[1].c_str(), st) || !parseModel(f, m)) { return(false); }
            p.table.setForType(st, m);
            return(true);
            }
        case 'S':
            {
            PriorModel m;
            if((5 != f.size()) || !parseModel(f, m)) { return(false); }
            p.table.setForSensor(f[1], m);
            return(true);
            }
        case 'B':
            {
            double b;
            if((3 != f.size()) || !parseFiniteDouble(f[2], b)) { return(false); }
            p.table.setBaseline(f[1], b);
            return(true);
            }
        case 'H': return(parseByHour(f, p.table.getByHour()));
        case 'Q':
            {
            timestamp_ms_t t;
            double v;
            if((3 != f.size()) || !parseTime(f[1], t) || !parseProbability(f[2], v)) { return(false); }
            p.probabilities.push_back(std::make_pair(t, v));
            return(true);
            }
        case 'O':
            {
            if(2 != f.size()) { return(false); }
            p.occupancy.clear();
            for(std::string::const_iterator i = f[1].begin(); i != f[1].end(); ++i)
                {
                if(('0' != *i) && ('1' != *i)) { return(false); }
                p.occupancy.push_back('1' == *i);
                }
            return(true);
            }
        case 'M':
            return((3 == f.size()) && parseProbability(f[1], p.minProbability) && parseProbability(f[2], p.maxProbability));
        case 'X':
            {
            if((4 != f.size()) || !parseTime(f[1], p.lastOccupiedMs) || !parseTime(f[2], p.stateSinceMs)) { return(false); }
            if(("0" != f[3]) && ("1" != f[3])) { return(false); }
            p.occupied = ("1" == f[3]);
            return(true);
            }
        default: return(false);
        }
    }

}


bool saveAreaState(const PriorTable &table, const AreaStatsTracker &stats, std::string &out)
    {
    out = AREA_STATE_HEADER;
    out += '\n';
    out += 'L';
    appendTime(out, table.getLearnedAtMs());
    out += '\n';
    for(uint8_t i = 0; i < SENSOR_TYPE_COUNT; ++i)
        {
        out += "T ";
        out += sensorTypeName(SensorType(i));
        appendModel(out, table.forType(SensorType(i)));
        }
    const std::map<std::string, PriorModel> &entries = table.getSensorEntries();
    for(std::map<std::string, PriorModel>::const_iterator i = entries.begin(); i != entries.end(); ++i)
        {
        if(!isWritableId(i->first)) { return(false); }
        out += "S ";
        out += i->first;
        appendModel(out, i->second);
        }
    const std::map<std::string, double> &baselines = table.getBaselines();
    for(std::map<std::string, double>::const_iterator i = baselines.begin(); i != baselines.end(); ++i)
        {
        if(!isWritableId(i->first) || !std::isfinite(i->second)) { return(false); }
        out += "B ";
        out += i->first;
        appendReal(out, i->second);
        out += '\n';
        }
    out += 'H';
    for(uint8_t hh = 0; hh < ByHourPriors::HOURS; ++hh)
        {
        char b[8];
        snprintf(b, sizeof(b), " %u", unsigned(table.getByHour().get(hh)));
        out += b;
        }
    out += '\n';

    const AreaStatsTracker::ProbabilityHistory &p = stats.getProbabilityHistory();
    for(AreaStatsTracker::ProbabilityHistory::const_iterator i = p.begin(); i != p.end(); ++i)
        {
        out += 'Q';
        appendTime(out, i->first);
        appendReal(out, i->second);
        out += '\n';
        }
    const AreaStatsTracker::OccupancyHistory &o = stats.getOccupancyHistory();
    if(!o.empty())
        {
        out += "O ";
        for(AreaStatsTracker::OccupancyHistory::const_iterator i = o.begin(); i != o.end(); ++i)
            { out += (*i ? '1' : '0'); }
        out += '\n';
        }
    if(!isnan(stats.getMinProbability()))
        {
        out += 'M';
        appendReal(out, stats.getMinProbability());
        appendReal(out, stats.getMaxProbability());
        out += '\n';
        }
    out += 'X';
    appendTime(out, stats.getLastOccupiedMs());
    appendTime(out, stats.getStateSinceMs());
    out += (stats.isOccupied() ? " 1\n" : " 0\n");
    return(true);
    }

ErrorReport::errorCatalogue loadAreaState(const std::string &text, PriorTable &table, AreaStatsTracker &stats)
    {
    Parsed p;
    bool headerSeen = false;
    std::vector<std::string> f;
    std::string::size_type pos = 0;
    while(pos < text.size())
        {
        std::string::size_type eol = text.find('\n', pos);
        if(std::string::npos == eol) { eol = text.size(); }
        splitFields(text.substr(pos, eol - pos), f);
        pos = eol + 1;
        if(f.empty()) { continue; }
        if(!headerSeen)
            {
            if((2 != f.size()) || ((f[0] + " " + f[1]) != AREA_STATE_HEADER)) { return(ErrorReport::ERR_RESTORE_FORMAT); }
            headerSeen = true;
            continue;
            }
        if(!applyRecord(f, p)) { return(ErrorReport::ERR_RESTORE_FORMAT); }
        }
    if(!headerSeen) { return(ErrorReport::ERR_RESTORE_FORMAT); }

    AreaStatsTracker s;
    if(!s.restore(p.probabilities, p.occupancy, p.minProbability, p.maxProbability,
                  p.lastOccupiedMs, p.stateSinceMs, p.occupied))
        { return(ErrorReport::ERR_RESTORE_FORMAT); }
    table = p.table;
    stats = s;
    return(ErrorReport::ERR_NONE);
    }


}
